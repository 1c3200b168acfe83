//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcphttp/Config.cpp
// Purpose: Command-line parsing and launch command tokenization
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <limits>
#include <optional>
#include <sstream>

#include "logging/Logger.h"
#include "mcphttp/Config.h"
#include "mcphttp/errors/Errors.h"

namespace mcphttp {

using errors::ConfigError;

namespace {

bool isDigits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char ch){ return std::isdigit(ch) != 0; });
}

unsigned short parsePort(const std::string& value) {
    if (!isDigits(value)) {
        throw ConfigError("invalid port (non-numeric): " + value);
    }
    unsigned long portNum = 0;
    try {
        portNum = std::stoul(value);
    } catch (const std::exception&) {
        throw ConfigError("invalid port (parse failure): " + value);
    }
    if (portNum > 65535ul) {
        throw ConfigError("invalid port (out of range): " + value);
    }
    return static_cast<unsigned short>(portNum);
}

std::chrono::milliseconds parsePositiveMs(const std::string& value, const std::string& optionName) {
    if (!isDigits(value)) {
        throw ConfigError(optionName + " expects a positive number of milliseconds: " + value);
    }
    unsigned long long ms = 0;
    try {
        ms = std::stoull(value);
    } catch (const std::exception&) {
        throw ConfigError(optionName + " value out of range: " + value);
    }
    if (ms == 0 || ms > static_cast<unsigned long long>(std::numeric_limits<std::chrono::milliseconds::rep>::max())) {
        throw ConfigError(optionName + " value out of range: " + value);
    }
    return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(ms));
}

bool hasWhitespace(const std::string& s) {
    return std::any_of(s.begin(), s.end(), [](unsigned char ch){ return std::isspace(ch) != 0; });
}

} // namespace

std::vector<std::string> TokenizeCommand(const std::string& commandLine) {
    std::vector<std::string> parts;
    std::string current;
    bool inQuote = false;
    char quoteChar = '\0';

    for (char c : commandLine) {
        if (c == '"' || c == '\'') {
            if (!inQuote) {
                inQuote = true;
                quoteChar = c;
            } else if (c == quoteChar) {
                inQuote = false;
                quoteChar = '\0';
            } else {
                current.push_back(c);
            }
        } else if ((c == ' ' || c == '\t') && !inQuote) {
            if (!current.empty()) {
                parts.push_back(current);
                current.clear();
            }
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) {
        parts.push_back(current);
    }
    return parts;
}

std::pair<std::string, std::string> ParseKeyValue(const std::string& entry, const std::string& optionName) {
    auto eq = entry.find('=');
    if (eq == std::string::npos) {
        throw ConfigError(optionName + " expects KEY=VALUE: " + entry);
    }
    std::string key = entry.substr(0, eq);
    std::string value = entry.substr(eq + 1);
    if (key.empty()) {
        throw ConfigError(optionName + " has an empty key: " + entry);
    }
    if (value.find('=') != std::string::npos) {
        throw ConfigError(optionName + " value cannot contain '=' character: " + entry + " (value: " + value + ")");
    }
    return {key, value};
}

CommandLine ParseCommandLine(const std::vector<std::string>& args, const std::string& host) {
    CommandLine out;
    AdapterConfig& cfg = out.config;
    cfg.host = host.empty() ? std::string("0.0.0.0") : host;

    std::optional<std::string> stdioCmd;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--help" || arg == "-h") {
            out.showHelp = true;
            continue;
        }
        if (arg == "--version") {
            out.showVersion = true;
            continue;
        }
        if (arg.rfind("--", 0) != 0 || arg.size() == 2) {
            throw ConfigError("unexpected argument: " + arg);
        }

        std::string name;
        std::string value;
        auto eq = arg.find('=');
        if (eq != std::string::npos) {
            name = arg.substr(0, eq);
            value = arg.substr(eq + 1);
        } else {
            name = arg;
            if (i + 1 >= args.size()) {
                throw ConfigError("missing value for " + name);
            }
            value = args[++i];
        }

        if (name == "--stdio") {
            stdioCmd = value;
        } else if (name == "--env") {
            auto [key, val] = ParseKeyValue(value, name);
            if (hasWhitespace(key)) {
                throw ConfigError("--env key cannot contain whitespace: " + key);
            }
            cfg.defaultEnv[key] = val;
        } else if (name == "--header-env" || name == "--header-arg") {
            auto [header, target] = ParseKeyValue(value, name);
            if (target.empty()) {
                throw ConfigError(name + " has an empty target: " + value);
            }
            if (hasWhitespace(header) || hasWhitespace(target)) {
                throw ConfigError(name + " names cannot contain whitespace: " + value);
            }
            if (name == "--header-env") {
                cfg.headerEnvMapping.Set(header, target);
            } else {
                cfg.headerArgMapping.Set(header, target);
            }
        } else if (name == "--port") {
            cfg.port = parsePort(value);
        } else if (name == "--log-level") {
            LogLevel level = LogLevel::LOG_INFO_LEVEL;
            if (!Logger::parseLevel(value, level)) {
                throw ConfigError("unknown log level: " + value);
            }
            cfg.logLevel = value;
        } else if (name == "--log-file") {
            if (value.empty()) {
                throw ConfigError("--log-file requires a path");
            }
            cfg.logFile = value;
        } else if (name == "--process-timeout-ms") {
            cfg.timeouts.process = parsePositiveMs(value, name);
        } else {
            throw ConfigError("unknown option: " + name);
        }
    }

    if (out.showHelp || out.showVersion) {
        return out;
    }

    if (!stdioCmd.has_value() || stdioCmd->empty()) {
        throw ConfigError("--stdio flag is required");
    }
    auto parts = TokenizeCommand(stdioCmd.value());
    if (parts.empty()) {
        throw ConfigError("no command specified in --stdio: " + stdioCmd.value());
    }
    cfg.command = parts.front();
    cfg.baseArgs.assign(parts.begin() + 1, parts.end());
    return out;
}

std::string UsageText(const std::string& program) {
    std::ostringstream oss;
    oss << "Usage: " << program << " --stdio \"<command>\" [options]\n"
        << "\n"
        << "Options:\n"
        << "  --stdio <cmd>                 stdio MCP server command (required)\n"
        << "  --env KEY=VALUE               default environment variable (repeatable)\n"
        << "  --header-env HEADER=ENV_VAR   map a request header to an environment variable (repeatable)\n"
        << "  --header-arg HEADER=arg-name  map a request header to --arg-name <value> (repeatable)\n"
        << "  --port <n>                    listen port (default 8080)\n"
        << "  --log-level <level>           debug|info|warn|error (default info)\n"
        << "  --log-file <path>             also append logs to a file\n"
        << "  --process-timeout-ms <n>      per-request process timeout (default 30000)\n"
        << "  --version                     print version and exit\n"
        << "\n"
        << "Examples:\n"
        << "  " << program << " --stdio \"npx -y @modelcontextprotocol/server-filesystem /data\"\n"
        << "  " << program << " --stdio \"npx -y server-github\" --env \"GITHUB_TOKEN=ghp_xxx\"\n"
        << "  " << program << " --stdio \"npx -y server-slack\" \\\n"
        << "      --header-env \"X-Slack-Token=SLACK_TOKEN\" --header-arg \"X-Team-Id=team-id\"\n"
        << "  HOST=127.0.0.1 " << program << " --stdio \"npx -y server-filesystem /data\"\n";
    return oss.str();
}

} // namespace mcphttp
