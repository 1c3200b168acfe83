//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_process_executor.cpp
// Purpose: ProcessExecutor end-to-end tests against real child processes
//==========================================================================================================

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <future>
#include <string>
#include <thread>
#include <vector>

#include <signal.h>
#include <unistd.h>
#include <errno.h>

#include "mcphttp/ProcessExecutor.hpp"

using namespace std::chrono_literals;
using mcphttp::ExecutionContext;
using mcphttp::ExecutionRequest;
using mcphttp::ExecutionResult;
using mcphttp::ProcessExecutor;
using mcphttp::errors::ErrorCategory;

#ifndef STDIO_CHILD_PATH
#error "STDIO_CHILD_PATH must point at the stdio_child helper binary"
#endif

namespace {

ExecutionRequest childRequest(std::vector<std::string> args, const std::string& input) {
    ExecutionRequest req;
    req.command = STDIO_CHILD_PATH;
    req.args = std::move(args);
    req.input = input;
    return req;
}

ExecutionContext withTimeout(std::chrono::milliseconds t) {
    return ExecutionContext::WithTimeout(std::stop_token{}, t);
}

std::string tempPath(const std::string& tag) {
    return std::string("/tmp/mcphttp_") + tag + "_" + std::to_string(::getpid()) + ".pid";
}

} // namespace

TEST(ProcessExecutor, EchoRoundTrip) {
    ProcessExecutor exec;
    const std::string input = "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"tools/list\"}";
    auto res = exec.Execute(withTimeout(5s), childRequest({"echo"}, input));
    ASSERT_TRUE(res.Ok()) << res.error->message;
    EXPECT_EQ(res.output, input);
}

TEST(ProcessExecutor, CatRoundTripFromPath) {
    ProcessExecutor exec;
    ExecutionRequest req;
    req.command = "cat";
    req.input = "hello";
    auto res = exec.Execute(withTimeout(5s), req);
    ASSERT_TRUE(res.Ok()) << res.error->message;
    EXPECT_EQ(res.output, "hello");
}

TEST(ProcessExecutor, EmptyInputStillSendsNewline) {
    ProcessExecutor exec;
    auto res = exec.Execute(withTimeout(5s), childRequest({"echo"}, ""));
    ASSERT_TRUE(res.Ok());
    EXPECT_EQ(res.output, "");
}

TEST(ProcessExecutor, EnvOverridesInheritedEnvironment) {
    ::setenv("MCPHTTP_TEST_VAR", "inherited", 1);
    ProcessExecutor exec;

    auto inherited = exec.Execute(withTimeout(5s), childRequest({"env", "MCPHTTP_TEST_VAR"}, "x"));
    ASSERT_TRUE(inherited.Ok());
    EXPECT_EQ(inherited.output, "inherited");

    auto req = childRequest({"env", "MCPHTTP_TEST_VAR"}, "x");
    req.env["MCPHTTP_TEST_VAR"] = "override";
    auto overridden = exec.Execute(withTimeout(5s), req);
    ASSERT_TRUE(overridden.Ok());
    EXPECT_EQ(overridden.output, "override");
    ::unsetenv("MCPHTTP_TEST_VAR");
}

TEST(ProcessExecutor, ArgumentsPassedVerbatim) {
    ProcessExecutor exec;
    auto res = exec.Execute(withTimeout(5s), childRequest({"args", "--team-id", "T 1; rm -rf /", "$HOME"}, "x"));
    ASSERT_TRUE(res.Ok());
    EXPECT_EQ(res.output, "--team-id|T 1; rm -rf /|$HOME");
}

TEST(ProcessExecutor, OnlyFirstLineReturned) {
    ProcessExecutor exec;
    auto res = exec.Execute(withTimeout(5s), childRequest({"multiline"}, "x"));
    ASSERT_TRUE(res.Ok());
    EXPECT_EQ(res.output, "first");
}

TEST(ProcessExecutor, CarriageReturnStripped) {
    ProcessExecutor exec;
    auto res = exec.Execute(withTimeout(5s), childRequest({"crlf"}, "line"));
    ASSERT_TRUE(res.Ok());
    EXPECT_EQ(res.output, "line");
}

TEST(ProcessExecutor, EofWithoutNewlineReturnsPartialLine) {
    ProcessExecutor exec;
    auto res = exec.Execute(withTimeout(5s), childRequest({"partial"}, "x"));
    ASSERT_TRUE(res.Ok());
    EXPECT_EQ(res.output, "partial");
}

TEST(ProcessExecutor, EmptyCommandIsSetupError) {
    ProcessExecutor exec;
    ExecutionRequest req;
    auto res = exec.Execute(withTimeout(5s), req);
    ASSERT_FALSE(res.Ok());
    EXPECT_EQ(res.error->category, ErrorCategory::SetupError);
}

TEST(ProcessExecutor, InvalidEnvironmentKeyIsSetupError) {
    ProcessExecutor exec;
    auto req = childRequest({"echo"}, "x");
    req.env["BAD=KEY"] = "v";
    auto res = exec.Execute(withTimeout(5s), req);
    ASSERT_FALSE(res.Ok());
    EXPECT_EQ(res.error->category, ErrorCategory::SetupError);
}

TEST(ProcessExecutor, MissingCommandIsStartError) {
    ProcessExecutor exec;
    ExecutionRequest req;
    req.command = "mcphttp-definitely-not-a-real-command";
    req.input = "x";
    auto res = exec.Execute(withTimeout(5s), req);
    ASSERT_FALSE(res.Ok());
    EXPECT_EQ(res.error->category, ErrorCategory::StartError);
}

TEST(ProcessExecutor, NonZeroExitIsProcessErrorWithStderr) {
    ProcessExecutor exec;
    auto res = exec.Execute(withTimeout(5s), childRequest({"exit", "3"}, "x"));
    ASSERT_FALSE(res.Ok());
    EXPECT_EQ(res.error->category, ErrorCategory::ProcessError);
    EXPECT_NE(res.error->diagnostics.find("child failing on purpose"), std::string::npos);
    ASSERT_TRUE(res.error->exitStatus.has_value());
    EXPECT_EQ(res.error->exitStatus.value(), "exit status 3");
}

TEST(ProcessExecutor, ChildIgnoringStdinAndFailingIsProcessError) {
    ProcessExecutor exec;
    // Large input so the write may hit a closed pipe; the failing exit status decides the outcome
    auto res = exec.Execute(withTimeout(5s), childRequest({"no-read", "4"}, std::string(1 << 20, 'i')));
    ASSERT_FALSE(res.Ok());
    EXPECT_EQ(res.error->category, ErrorCategory::ProcessError);
}

TEST(ProcessExecutor, LargeStderrBeforeReadingStdinCompletes) {
    ProcessExecutor exec;
    auto res = exec.Execute(withTimeout(10s), childRequest({"stderr-flood", "1048576"}, "after-flood"));
    ASSERT_TRUE(res.Ok()) << res.error->message;
    EXPECT_EQ(res.output, "after-flood");
}

TEST(ProcessExecutor, StderrRetentionIsCapped) {
    ProcessExecutor::Options opts;
    opts.maxStderrBytes = 1024;
    ProcessExecutor exec(opts);
    auto res = exec.Execute(withTimeout(10s), childRequest({"flood-exit", "200000"}, "x"));
    ASSERT_FALSE(res.Ok());
    EXPECT_EQ(res.error->category, ErrorCategory::ProcessError);
    EXPECT_EQ(res.error->diagnostics.compare(0, 1024, std::string(1024, 'e')), 0);
    EXPECT_LE(res.error->diagnostics.size(), 1024u + 64u);
    EXPECT_NE(res.error->diagnostics.find("198976 more bytes of stderr discarded"), std::string::npos);
}

TEST(ProcessExecutor, OversizedLineIsIOError) {
    ProcessExecutor::Options opts;
    opts.maxOutputLineBytes = 1000;
    ProcessExecutor exec(opts);
    auto res = exec.Execute(withTimeout(5s), childRequest({"long-line", "5000"}, "x"));
    ASSERT_FALSE(res.Ok());
    EXPECT_EQ(res.error->category, ErrorCategory::IOError);
}

TEST(ProcessExecutor, DeadlineKillsSleepingChild) {
    const std::string pidFile = tempPath("deadline");
    std::remove(pidFile.c_str());

    ProcessExecutor exec;
    auto start = std::chrono::steady_clock::now();
    auto res = exec.Execute(withTimeout(300ms), childRequest({"pidfile", pidFile}, "x"));
    auto elapsed = std::chrono::steady_clock::now() - start;
    ASSERT_FALSE(res.Ok());
    EXPECT_EQ(res.error->category, ErrorCategory::CancellationError);
    EXPECT_EQ(res.error->message.rfind("deadline exceeded", 0), 0u);
    EXPECT_LT(elapsed, 2s);

    pid_t childPid = 0;
    {
        std::ifstream in(pidFile);
        ASSERT_TRUE(in && (in >> childPid));
    }
    ASSERT_GT(childPid, 0);
    errno = 0;
    EXPECT_EQ(::kill(childPid, 0), -1);
    EXPECT_EQ(errno, ESRCH);
    std::remove(pidFile.c_str());
}

TEST(ProcessExecutor, StopTokenKillsChildAndReapsIt) {
    const std::string pidFile = tempPath("stop");
    std::remove(pidFile.c_str());

    ProcessExecutor exec;
    std::stop_source source;
    ExecutionContext ctx;
    ctx.stopToken = source.get_token();
    ctx.deadline = std::chrono::steady_clock::now() + 20s;

    auto fut = std::async(std::launch::async, [&]() {
        return exec.Execute(ctx, childRequest({"pidfile", pidFile}, "x"));
    });

    pid_t childPid = 0;
    for (int i = 0; i < 500 && childPid == 0; ++i) {
        std::ifstream in(pidFile);
        if (in && (in >> childPid) && childPid > 0) {
            break;
        }
        childPid = 0;
        std::this_thread::sleep_for(10ms);
    }
    ASSERT_GT(childPid, 0);

    auto start = std::chrono::steady_clock::now();
    source.request_stop();
    ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
    auto res = fut.get();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
    ASSERT_FALSE(res.Ok());
    EXPECT_EQ(res.error->category, ErrorCategory::CancellationError);
    EXPECT_EQ(res.error->message.rfind("request cancelled", 0), 0u);

    // Reaped: the pid no longer names a process (not even a zombie)
    errno = 0;
    EXPECT_EQ(::kill(childPid, 0), -1);
    EXPECT_EQ(errno, ESRCH);
    std::remove(pidFile.c_str());
}

namespace {

pid_t readOrphanPid(const std::string& pidFile) {
    pid_t pid = 0;
    std::ifstream in(pidFile);
    if (!(in >> pid)) {
        return 0;
    }
    return pid;
}

} // namespace

TEST(ProcessExecutor, DescendantHoldingStderrDoesNotDelayResult) {
    const std::string pidFile = tempPath("orphan_ok");
    std::remove(pidFile.c_str());

    ProcessExecutor exec;
    auto start = std::chrono::steady_clock::now();
    auto res = exec.Execute(withTimeout(5000ms), childRequest({"orphan-stderr", pidFile, "0"}, "x"));
    auto elapsed = std::chrono::steady_clock::now() - start;
    ASSERT_TRUE(res.Ok()) << res.error->message;
    EXPECT_EQ(res.output, "x");
    EXPECT_LT(elapsed, 2s);

    // The descendant is left alone: the process group is not killed on the success path
    pid_t orphan = readOrphanPid(pidFile);
    ASSERT_GT(orphan, 0);
    EXPECT_EQ(::kill(orphan, 0), 0);
    ::kill(orphan, SIGKILL);
    std::remove(pidFile.c_str());
}

TEST(ProcessExecutor, DescendantHoldingStderrStillReportsBufferedStderr) {
    const std::string pidFile = tempPath("orphan_fail");
    std::remove(pidFile.c_str());

    ProcessExecutor exec;
    auto start = std::chrono::steady_clock::now();
    auto res = exec.Execute(withTimeout(5000ms), childRequest({"orphan-stderr", pidFile, "4"}, "x"));
    auto elapsed = std::chrono::steady_clock::now() - start;
    ASSERT_FALSE(res.Ok());
    EXPECT_EQ(res.error->category, ErrorCategory::ProcessError);
    EXPECT_NE(res.error->diagnostics.find("left a process behind"), std::string::npos);
    ASSERT_TRUE(res.error->exitStatus.has_value());
    EXPECT_EQ(*res.error->exitStatus, "exit status 4");
    EXPECT_LT(elapsed, 2s);

    pid_t orphan = readOrphanPid(pidFile);
    ASSERT_GT(orphan, 0);
    ::kill(orphan, SIGKILL);
    std::remove(pidFile.c_str());
}

TEST(ProcessExecutor, ShellBackgroundSleeperDoesNotDelayResult) {
    ExecutionRequest req;
    req.command = "/bin/sh";
    req.args = {"-c", "read l; (sleep 3 >/dev/null </dev/null &) ; echo \"$l\""};
    req.input = "x";

    ProcessExecutor exec;
    auto start = std::chrono::steady_clock::now();
    auto res = exec.Execute(withTimeout(5000ms), req);
    auto elapsed = std::chrono::steady_clock::now() - start;
    ASSERT_TRUE(res.Ok()) << res.error->message;
    EXPECT_EQ(res.output, "x");
    EXPECT_LT(elapsed, 2s);
}

TEST(ProcessExecutor, AlreadyCancelledContextDoesNotStart) {
    ProcessExecutor exec;
    std::stop_source source;
    source.request_stop();
    ExecutionContext ctx;
    ctx.stopToken = source.get_token();
    auto res = exec.Execute(ctx, childRequest({"echo"}, "x"));
    ASSERT_FALSE(res.Ok());
    EXPECT_EQ(res.error->category, ErrorCategory::CancellationError);
}

TEST(ProcessExecutor, ConcurrentExecutionsAreIsolated) {
    ProcessExecutor exec;
    constexpr int N = 16;
    std::vector<std::future<ExecutionResult>> futures;
    for (int i = 0; i < N; ++i) {
        futures.push_back(std::async(std::launch::async, [&exec, i]() {
            auto req = childRequest({"env", "MCPHTTP_SLOT"}, "x");
            req.env["MCPHTTP_SLOT"] = "slot-" + std::to_string(i);
            return exec.Execute(withTimeout(10s), req);
        }));
    }
    for (int i = 0; i < N; ++i) {
        auto res = futures[static_cast<std::size_t>(i)].get();
        ASSERT_TRUE(res.Ok());
        EXPECT_EQ(res.output, "slot-" + std::to_string(i));
    }
}
