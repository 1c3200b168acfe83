//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HTTPServer.hpp
// Purpose: Coroutine-based HTTP server (Boost.Beast) with one worker thread per in-flight request
//==========================================================================================================

#pragma once

#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <stop_token>
#include <string>

#include "mcphttp/Config.h"
#include "mcphttp/RequestHandler.hpp"

namespace mcphttp {

class HTTPServer {
public:
    //==========================================================================================================
    // Options
    // Purpose: Listener and limits.
    // Fields:
    //   address: Bind address (default: 0.0.0.0)
    //   port: Listen port; 0 picks an ephemeral port (see BoundPort())
    //   mcpPath: Path that accepts POST requests for the stdio command
    //   healthPath: Path answering GET with {"status":"ok"}
    //   maxBodyBytes: Request bodies larger than this are rejected with 400
    //   timeouts: read/write bound each connection; shutdown is the in-flight grace period in Stop()
    //==========================================================================================================
    struct Options {
        std::string address{"0.0.0.0"};
        unsigned short port{8080};
        std::string mcpPath{"/mcp"};
        std::string healthPath{"/health"};
        std::size_t maxBodyBytes{10 * 1024 * 1024};
        Timeouts timeouts;
    };

    enum class State { Starting, Serving, ShuttingDown, Stopped };

    // Runs on a worker thread; the stop token fires on client disconnect or forced shutdown.
    using RequestHandlerFn = std::function<HttpResponse(const HttpRequest&, std::stop_token)>;
    using ErrorHandler = std::function<void(const std::string&)>;

    explicit HTTPServer(const Options& opts);
    ~HTTPServer();

    //==========================================================================================================
    // Binds the listener and starts the accept loop on a background I/O thread.
    // Returns:
    //   Future that becomes ready once the I/O context is running.
    // Throws:
    //   boost::system::system_error when the address cannot be resolved or bound.
    //==========================================================================================================
    std::future<void> Start();

    //==========================================================================================================
    // Graceful stop: closes the acceptor, waits up to timeouts.shutdown for in-flight requests, then
    // requests stop on the remainder (killing their subprocesses) and waits for them before stopping the
    // I/O thread.
    // Returns:
    //   Future that completes when shutdown has finished.
    //==========================================================================================================
    std::future<void> Stop();

    //==========================================================================================================
    // Sets the handler for POST requests on mcpPath. Must be called before Start().
    //==========================================================================================================
    void SetRequestHandler(RequestHandlerFn handler);

    //==========================================================================================================
    // Sets the error handler for accept/session errors while serving.
    //==========================================================================================================
    void SetErrorHandler(ErrorHandler handler);

    // Port the listener is bound to (valid after Start()).
    unsigned short BoundPort() const;

    State GetState() const;

    // Requests currently executing a handler.
    std::size_t InFlight() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcphttp
