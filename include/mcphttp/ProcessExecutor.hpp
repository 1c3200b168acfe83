//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProcessExecutor.hpp
// Purpose: One-shot stdio subprocess execution: one input line in, first output line out.
//==========================================================================================================
#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include "mcphttp/HeaderMapper.h"
#include "mcphttp/errors/Errors.h"

namespace mcphttp {

//==========================================================================================================
// ExecutionRequest
// Purpose: Everything needed to run one subprocess. Built fresh for every HTTP request.
// Fields:
//   command: Program name (looked up on PATH) or path. Must be non-empty.
//   args: Arguments after argv[0].
//   env: Overrides applied on top of the adapter's inherited environment.
//   input: Bytes written to the child's stdin, followed by a single '\n'.
//==========================================================================================================
struct ExecutionRequest {
    std::string command;
    std::vector<std::string> args;
    EnvMap env;
    std::string input;
};

//==========================================================================================================
// ExecutionContext
// Purpose: Cancellation scope for one execution.
// Fields:
//   stopToken: Caller cancellation (client disconnect, server shutdown).
//   deadline: Absolute steady-clock deadline; time_point::max() means none.
//==========================================================================================================
struct ExecutionContext {
    std::stop_token stopToken;
    std::chrono::steady_clock::time_point deadline{std::chrono::steady_clock::time_point::max()};

    // Context whose deadline is now + timeout.
    static ExecutionContext WithTimeout(std::stop_token token, std::chrono::milliseconds timeout) {
        ExecutionContext ctx;
        ctx.stopToken = std::move(token);
        ctx.deadline = std::chrono::steady_clock::now() + timeout;
        return ctx;
    }

    bool Cancelled() const { return stopToken.stop_requested(); }
    bool Expired() const {
        return deadline != std::chrono::steady_clock::time_point::max() &&
               std::chrono::steady_clock::now() >= deadline;
    }
};

//==========================================================================================================
// ExecutionResult
// Purpose: First output line on success, or a categorized error.
//==========================================================================================================
struct ExecutionResult {
    std::string output;
    std::optional<errors::ExecutionError> error;

    bool Ok() const { return !error.has_value(); }
};

//==========================================================================================================
// IProcessExecutor
// Purpose: Seam between the request handler and subprocess execution.
//==========================================================================================================
class IProcessExecutor {
public:
    virtual ~IProcessExecutor() = default;

    //==========================================================================================================
    // Runs one subprocess to completion or cancellation.
    // Args:
    //   ctx: Stop token and deadline bounding the whole call.
    //   request: Command, arguments, environment overrides and input.
    // Returns:
    //   ExecutionResult; never throws for subprocess failures.
    //==========================================================================================================
    virtual ExecutionResult Execute(const ExecutionContext& ctx, const ExecutionRequest& request) = 0;
};

//==========================================================================================================
// ProcessExecutor
// Purpose: POSIX implementation (posix_spawnp, pipes, poll).
// Notes:
//   - Every call owns its process, pipes and stderr drain thread; calls are independent and may run
//     concurrently from any number of threads.
//   - The child runs in its own process group; cancellation SIGKILLs the group and still reaps the child.
//   - Constructing the first executor sets SIGPIPE to SIG_IGN for the adapter process so a child that
//     closes its stdin early cannot kill the adapter. Children get the default SIGPIPE disposition.
//==========================================================================================================
class ProcessExecutor : public IProcessExecutor {
public:
    struct Options {
        std::size_t maxOutputLineBytes{4 * 1024 * 1024};
        std::size_t maxStderrBytes{64 * 1024};
    };

    ProcessExecutor();
    explicit ProcessExecutor(const Options& opts);
    ~ProcessExecutor() override;

    ExecutionResult Execute(const ExecutionContext& ctx, const ExecutionRequest& request) override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcphttp
