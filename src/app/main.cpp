//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: mcp-http-adapter entry point: parse options, serve POST /mcp until SIGINT/SIGTERM
//==========================================================================================================

#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcphttp/Config.h"
#include "mcphttp/HTTPServer.hpp"
#include "mcphttp/ProcessExecutor.hpp"
#include "mcphttp/RequestHandler.hpp"
#include "mcphttp/errors/Errors.h"
#include "mcphttp/version.h"

using namespace mcphttp;

int main(int argc, char** argv) {
    FUNC_SCOPE();
    const std::string program = (argc > 0 && argv[0] != nullptr) ? argv[0] : "mcp-http-adapter";
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i] != nullptr ? argv[i] : "");
    }

    CommandLine cli;
    try {
        cli = ParseCommandLine(args, GetEnvOrDefault("HOST", "0.0.0.0"));
    } catch (const errors::ConfigError& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << UsageText(program);
        return EXIT_FAILURE;
    }
    if (cli.showHelp) {
        std::cout << UsageText(program);
        return EXIT_SUCCESS;
    }
    if (cli.showVersion) {
        std::cout << getUserAgent() << "\n";
        return EXIT_SUCCESS;
    }
    const AdapterConfig& config = cli.config;

    (void)Logger::setLogLevelFromString(config.logLevel);
    if (!config.logFile.empty() && !Logger::setLogFile(config.logFile)) {
        std::cerr << "Error: cannot open log file: " << config.logFile << "\n";
        return EXIT_FAILURE;
    }

    LOG_INFO("event=startup version={} {} base_args={} default_env={} header_env={} header_arg={} process_timeout_ms={}",
             getVersionString(), Logger::kv("command", config.command), config.baseArgs.size(),
             config.defaultEnv.size(), config.headerEnvMapping.Size(), config.headerArgMapping.Size(),
             config.timeouts.process.count());

    ProcessExecutor::Options execOpts;
    execOpts.maxOutputLineBytes = config.maxOutputLineBytes;
    execOpts.maxStderrBytes = config.maxStderrBytes;
    ProcessExecutor executor(execOpts);
    RequestHandler handler(config, executor);

    HTTPServer::Options serverOpts;
    serverOpts.address = config.host;
    serverOpts.port = config.port;
    serverOpts.maxBodyBytes = config.maxBodyBytes;
    serverOpts.timeouts = config.timeouts;
    HTTPServer server(serverOpts);
    server.SetRequestHandler([&handler](const HttpRequest& req, std::stop_token st) {
        return handler.Handle(req, std::move(st));
    });

    // Serve until SIGINT/SIGTERM
    boost::asio::io_context signals;
    boost::asio::signal_set waitSet(signals, SIGINT, SIGTERM);
    int received = 0;
    waitSet.async_wait([&received](const boost::system::error_code& ec, int signo) {
        if (!ec) {
            received = signo;
        }
    });

    try {
        server.Start().get();
    } catch (const std::exception& e) {
        LOG_ERROR("event=startup_failed {}", Logger::kv("error", e.what()));
        return EXIT_FAILURE;
    }
    LOG_INFO("event=serving {} port={} path=/mcp", Logger::kv("host", config.host), server.BoundPort());

    signals.run();
    LOG_INFO("event=shutdown signal={}", received);
    server.Stop().get();
    LOG_INFO("event=stopped");
    return EXIT_SUCCESS;
}
