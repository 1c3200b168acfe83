//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcphttp/HeaderMapper.cpp
// Purpose: Header -> environment/argument mapping
//==========================================================================================================

#include <algorithm>
#include <cctype>

#include "mcphttp/HeaderMapper.h"

namespace mcphttp {

namespace {

bool iequals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace

bool CaseInsensitiveLess::operator()(const std::string& a, const std::string& b) const {
    return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(),
        [](unsigned char x, unsigned char y){ return std::tolower(x) < std::tolower(y); });
}

void HeaderMapping::Set(const std::string& headerName, const std::string& targetName) {
    auto it = std::find_if(entries.begin(), entries.end(),
        [&](const Entry& e){ return iequals(e.first, headerName); });
    if (it != entries.end()) {
        it->second = targetName;
        return;
    }
    entries.emplace_back(headerName, targetName);
}

MappedHeaders MapHeaders(const HeaderMap& headers,
                         const HeaderMapping& envMapping,
                         const HeaderMapping& argMapping) {
    MappedHeaders out;

    for (const auto& [headerName, envName] : envMapping.Entries()) {
        auto it = headers.find(headerName);
        if (it != headers.end() && !it->second.empty()) {
            out.env[envName] = it->second;
        }
    }

    for (const auto& [headerName, argName] : argMapping.Entries()) {
        auto it = headers.find(headerName);
        if (it != headers.end() && !it->second.empty()) {
            // "team-id" -> "--team-id", "<value>"
            out.args.push_back("--" + argName);
            out.args.push_back(it->second);
        }
    }
    return out;
}

} // namespace mcphttp
