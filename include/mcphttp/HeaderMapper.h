//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HeaderMapper.h
// Purpose: Pure mapping of HTTP request headers to child environment overrides and CLI arguments.
//==========================================================================================================
#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace mcphttp {

//==========================================================================================================
// CaseInsensitiveLess
// Purpose: ASCII case-insensitive ordering for HTTP header names.
//==========================================================================================================
struct CaseInsensitiveLess {
    bool operator()(const std::string& a, const std::string& b) const;
};

// Request headers as seen by the mapper: one value per (case-insensitive) name.
using HeaderMap = std::map<std::string, std::string, CaseInsensitiveLess>;

// Environment variables (name -> value).
using EnvMap = std::map<std::string, std::string>;

//==========================================================================================================
// HeaderMapping
// Purpose: Startup-time table of (HTTP header name, target name) pairs kept in declaration order.
// Notes:
//   - Set() on an already declared header (case-insensitive) replaces its target in place, keeping
//     the original position.
//==========================================================================================================
class HeaderMapping {
public:
    using Entry = std::pair<std::string, std::string>;

    void Set(const std::string& headerName, const std::string& targetName);

    const std::vector<Entry>& Entries() const { return entries; }
    bool Empty() const { return entries.empty(); }
    std::size_t Size() const { return entries.size(); }

private:
    std::vector<Entry> entries;
};

//==========================================================================================================
// MappedHeaders
// Purpose: Result of MapHeaders.
// Fields:
//   env: Environment overrides derived from headers.
//   args: Argument list of "--name", "value" pairs in mapping declaration order.
//==========================================================================================================
struct MappedHeaders {
    EnvMap env;
    std::vector<std::string> args;
};

//==========================================================================================================
// MapHeaders
// Purpose: Applies the env and arg mapping tables to one request's headers.
// Args:
//   headers: Request headers (case-insensitive names).
//   envMapping: Header name -> environment variable name.
//   argMapping: Header name -> argument name without leading dashes.
// Returns:
//   MappedHeaders. Headers missing from the request or carrying an empty value are skipped.
// Notes:
//   - No I/O, cannot fail.
//==========================================================================================================
MappedHeaders MapHeaders(const HeaderMap& headers,
                         const HeaderMapping& envMapping,
                         const HeaderMapping& argMapping);

} // namespace mcphttp
