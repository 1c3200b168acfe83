//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.h
// Purpose: Immutable adapter configuration and its construction from command-line options.
//==========================================================================================================
#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "mcphttp/HeaderMapper.h"

namespace mcphttp {

//==========================================================================================================
// Timeouts
// Purpose: Fixed upper bounds applied per request and at shutdown.
// Fields:
//   read: Time allowed to read one HTTP request (headers + body).
//   write: Time allowed to write one HTTP response.
//   process: Time allowed for one subprocess execution.
//   shutdown: Grace period for in-flight requests when the server stops.
//==========================================================================================================
struct Timeouts {
    std::chrono::milliseconds read{30000};
    std::chrono::milliseconds write{30000};
    std::chrono::milliseconds process{30000};
    std::chrono::milliseconds shutdown{5000};
};

//==========================================================================================================
// AdapterConfig
// Purpose: Process-wide settings. Built once at startup and shared read-only by every request.
//==========================================================================================================
struct AdapterConfig {
    std::string command;
    std::vector<std::string> baseArgs;
    EnvMap defaultEnv;
    HeaderMapping headerEnvMapping;
    HeaderMapping headerArgMapping;

    std::string host{"0.0.0.0"};
    unsigned short port{8080};
    std::string logLevel{"info"};
    std::string logFile;

    Timeouts timeouts;
    std::size_t maxBodyBytes{10 * 1024 * 1024};      // 10 MiB request body cap
    std::size_t maxOutputLineBytes{4 * 1024 * 1024}; // 4 MiB response line cap
    std::size_t maxStderrBytes{64 * 1024};           // retained stderr for diagnostics
};

//==========================================================================================================
// CommandLine
// Purpose: Result of ParseCommandLine. When showHelp/showVersion is set the config is incomplete.
//==========================================================================================================
struct CommandLine {
    AdapterConfig config;
    bool showHelp{false};
    bool showVersion{false};
};

//==========================================================================================================
// TokenizeCommand
// Purpose: Splits a launch command string shell-style.
// Rules:
//   - Unquoted spaces and tabs separate tokens; empty tokens are dropped.
//   - ' or " opens a quoted section closed by the same character; the other quote is literal inside.
//   - Quote characters are removed. No escapes, no expansion.
//==========================================================================================================
std::vector<std::string> TokenizeCommand(const std::string& commandLine);

//==========================================================================================================
// ParseKeyValue
// Purpose: Splits a "KEY=VALUE" option value on the first '='.
// Args:
//   entry: Raw option value.
//   optionName: Option name used in error messages (e.g. "--env").
// Returns:
//   {key, value}
// Throws:
//   errors::ConfigError when '=' is missing, the key is empty, or the value contains '='.
//==========================================================================================================
std::pair<std::string, std::string> ParseKeyValue(const std::string& entry, const std::string& optionName);

//==========================================================================================================
// ParseCommandLine
// Purpose: Builds the adapter configuration from command-line arguments (argv without program name).
// Args:
//   args: Options in "--name value" or "--name=value" form.
//   host: Bind address (from the HOST environment variable, defaulting to 0.0.0.0).
// Throws:
//   errors::ConfigError on any invalid, unknown or missing option.
//==========================================================================================================
CommandLine ParseCommandLine(const std::vector<std::string>& args, const std::string& host);

//==========================================================================================================
// UsageText
// Purpose: Help text printed for --help and after configuration errors.
//==========================================================================================================
std::string UsageText(const std::string& program);

} // namespace mcphttp
