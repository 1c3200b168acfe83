//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcphttp/RequestHandler.cpp
// Purpose: POST /mcp handling: header mapping, execution context, response translation
//==========================================================================================================

#include <utility>

#include "logging/Logger.h"
#include "mcphttp/HeaderMapper.h"
#include "mcphttp/RequestHandler.hpp"
#include "mcphttp/version.h"

namespace mcphttp {

namespace {

HttpResponse textResponse(http::status status, unsigned version, std::string body) {
    HttpResponse res{status, version};
    res.set(http::field::server, getUserAgent());
    res.set(http::field::content_type, "text/plain; charset=utf-8");
    res.keep_alive(false);
    res.body() = std::move(body);
    res.body() += '\n';
    res.prepare_payload();
    return res;
}

} // namespace

HeaderMap CollectHeaders(const HttpRequest& req) {
    HeaderMap headers;
    for (const auto& field : req) {
        headers.emplace(std::string(field.name_string()), std::string(field.value()));
    }
    return headers;
}

RequestHandler::RequestHandler(const AdapterConfig& cfg, IProcessExecutor& exec)
    : config(cfg), executor(exec) {}

ExecutionRequest RequestHandler::BuildExecutionRequest(const HttpRequest& req) const {
    MappedHeaders mapped = MapHeaders(CollectHeaders(req), config.headerEnvMapping, config.headerArgMapping);

    ExecutionRequest out;
    out.command = config.command;

    out.env = config.defaultEnv;
    for (auto& [key, value] : mapped.env) {
        out.env[key] = std::move(value);
    }

    out.args.reserve(config.baseArgs.size() + mapped.args.size());
    out.args.insert(out.args.end(), config.baseArgs.begin(), config.baseArgs.end());
    out.args.insert(out.args.end(),
                    std::make_move_iterator(mapped.args.begin()),
                    std::make_move_iterator(mapped.args.end()));

    out.input = req.body();
    return out;
}

HttpResponse RequestHandler::Handle(const HttpRequest& req, std::stop_token stopToken) const {
    ExecutionRequest execReq = BuildExecutionRequest(req);
    ExecutionContext ctx = ExecutionContext::WithTimeout(std::move(stopToken), config.timeouts.process);

    ExecutionResult result = executor.Execute(ctx, execReq);
    if (!result.Ok()) {
        const errors::ExecutionError& err = result.error.value();
        LOG_ERROR("event=execution_failed category={} {} {} {}",
                  errors::errorCategoryName(err.category),
                  Logger::kv("message", err.message),
                  Logger::kv("exit_status", err.exitStatus.value_or("")),
                  Logger::kv("stderr", err.diagnostics));
        return textResponse(http::status::internal_server_error, req.version(), "Process execution failed");
    }

    HttpResponse res{http::status::ok, req.version()};
    res.set(http::field::server, getUserAgent());
    res.set(http::field::content_type, "application/json");
    res.keep_alive(false);
    res.body() = std::move(result.output);
    res.prepare_payload();
    return res;
}

HttpResponse RequestHandler::BadBody(unsigned version) {
    return textResponse(http::status::bad_request, version, "Failed to read body");
}

} // namespace mcphttp
