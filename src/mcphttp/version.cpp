//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.cpp
// Purpose: Implements version helpers returning the adapter's semantic version.
//==========================================================================================================
#include "mcphttp/version.h"

#include <sstream>

namespace mcphttp {

VersionInfo getVersion() {
    return VersionInfo{1, 0, 0};
}

std::string getVersionString() {
    const auto v = getVersion();
    std::ostringstream oss;
    oss << v.major << "." << v.minor << "." << v.patch;
    return oss.str();
}

std::string getUserAgent() {
    return std::string("mcp-http-adapter/") + getVersionString();
}

} // namespace mcphttp
