//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RequestHandler.hpp
// Purpose: Translates one POST /mcp request into one subprocess execution and back into an HTTP response.
//==========================================================================================================
#pragma once

#include <stop_token>
#include <string>

#include <boost/beast/http.hpp>

#include "mcphttp/Config.h"
#include "mcphttp/ProcessExecutor.hpp"

namespace mcphttp {

namespace http = boost::beast::http;

using HttpRequest = http::request<http::string_body>;
using HttpResponse = http::response<http::string_body>;

class RequestHandler {
public:
    //==========================================================================================================
    // Args:
    //   config: Adapter configuration; must outlive the handler. Never modified.
    //   executor: Process executor; must outlive the handler.
    //==========================================================================================================
    RequestHandler(const AdapterConfig& config, IProcessExecutor& executor);

    //==========================================================================================================
    // Handle
    // Purpose: Runs the configured command with the request body as its input.
    // Args:
    //   req: Fully read request (body in memory).
    //   stopToken: Stop requested on client disconnect or server shutdown.
    // Returns:
    //   200 application/json with the child's first output line, or 500 text/plain
    //   "Process execution failed". Diagnostics are only logged.
    //==========================================================================================================
    HttpResponse Handle(const HttpRequest& req, std::stop_token stopToken) const;

    // Builds the request description handed to the executor (merged env and args).
    ExecutionRequest BuildExecutionRequest(const HttpRequest& req) const;

    // 400 response used when the request body could not be read.
    static HttpResponse BadBody(unsigned version);

private:
    const AdapterConfig& config;
    IProcessExecutor& executor;
};

// Collects request headers into a case-insensitive map; the first occurrence of a repeated header wins.
HeaderMap CollectHeaders(const HttpRequest& req);

} // namespace mcphttp
