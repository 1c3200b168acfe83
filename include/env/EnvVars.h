//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read the adapter's own environment and to build child environment blocks.
//==========================================================================================================
#pragma once
#include <cstdlib>
#include <cstring>
#include <map>
#include <string>
#include <vector>

extern char** environ;

//==========================================================================================================
// GetEnvOrDefault
// Purpose: Returns the value of the environment variable or a provided default when unset/empty.
// Args:
//   name: C-string name of the environment variable. When null or empty, returns defaultValue.
//   defaultValue: Value to return when the variable is not set or set to an empty string.
// Returns:
//   std::string with the environment value (when set) or defaultValue otherwise.
//==========================================================================================================
inline std::string GetEnvOrDefault(const char* name, const std::string& defaultValue) {
    if (name == nullptr || *name == '\0') {
        return defaultValue;
    }
    const char* v = std::getenv(name);
    if (v == nullptr || *v == '\0') {
        return defaultValue;
    }
    return std::string(v);
}

//==========================================================================================================
// SnapshotEnvironment
// Purpose: Copies the current process environment into an ordered map.
// Notes:
//   - Entries without '=' are skipped. For duplicated names the first entry wins, matching getenv().
//==========================================================================================================
inline std::map<std::string, std::string> SnapshotEnvironment() {
    std::map<std::string, std::string> env;
    if (environ == nullptr) {
        return env;
    }
    for (char** p = environ; *p != nullptr; ++p) {
        const char* entry = *p;
        const char* eq = std::strchr(entry, '=');
        if (eq == nullptr || eq == entry) {
            continue;
        }
        env.emplace(std::string(entry, static_cast<std::size_t>(eq - entry)), std::string(eq + 1));
    }
    return env;
}

//==========================================================================================================
// BuildEnvironmentBlock
// Purpose: Overlays 'overrides' on 'base' and flattens the result to KEY=VALUE strings.
// Args:
//   base: Inherited environment (typically SnapshotEnvironment()).
//   overrides: Entries that replace identically named base entries.
// Returns:
//   Vector of "KEY=VALUE" strings suitable for an envp array.
//==========================================================================================================
inline std::vector<std::string> BuildEnvironmentBlock(std::map<std::string, std::string> base,
                                                      const std::map<std::string, std::string>& overrides) {
    for (const auto& [key, value] : overrides) {
        base[key] = value;
    }
    std::vector<std::string> block;
    block.reserve(base.size());
    for (const auto& [key, value] : base) {
        block.push_back(key + "=" + value);
    }
    return block;
}
