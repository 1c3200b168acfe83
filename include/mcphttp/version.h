//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Version API for the MCP HTTP adapter (semantic version helpers).
//==========================================================================================================
#pragma once

#include <string>

namespace mcphttp {

//==========================================================================================================
// VersionInfo
// Purpose: Semantic version components.
//==========================================================================================================
struct VersionInfo {
    int major;
    int minor;
    int patch;
};

VersionInfo getVersion();

//==========================================================================================================
// getVersionString
// Purpose: Returns the semantic version string formatted as "MAJOR.MINOR.PATCH".
//==========================================================================================================
std::string getVersionString();

//==========================================================================================================
// getUserAgent
// Purpose: Returns the Server header value sent with every HTTP response ("mcp-http-adapter/X.Y.Z").
//==========================================================================================================
std::string getUserAgent();

} // namespace mcphttp
