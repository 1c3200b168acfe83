//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcphttp/ProcessExecutor.cpp
// Purpose: POSIX one-shot subprocess execution (posix_spawnp + pipes + poll)
//==========================================================================================================

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <errno.h>
#include <cstring>
#ifdef __linux__
#  include <sys/eventfd.h>
#  include <sys/syscall.h>
#endif

#include <algorithm>
#include <array>
#include <chrono>
#include <cstdint>
#include <future>
#include <limits>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcphttp/ProcessExecutor.hpp"

namespace mcphttp {

using errors::ErrorCategory;
using errors::makeExecutionError;
using Clock = std::chrono::steady_clock;

namespace {

constexpr std::size_t ReadChunkBytes = 4096;
constexpr std::chrono::milliseconds ExitPollInterval{10};
// Upper bound on what a stopped drain still reads; a descendant that keeps writing cannot hold it forever.
constexpr std::size_t DrainFinalSweepBytes = 1024 * 1024;

std::string errnoText(int err) {
    return std::string(::strerror(err));
}

//==========================================================================================================
// FileDescriptor
// Purpose: Owning wrapper around a POSIX descriptor; closes on destruction.
//==========================================================================================================
class FileDescriptor {
public:
    FileDescriptor() = default;
    explicit FileDescriptor(int f) : fd(f) {}
    ~FileDescriptor() { (void)reset(); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;
    FileDescriptor(FileDescriptor&& other) noexcept : fd(other.release()) {}
    FileDescriptor& operator=(FileDescriptor&& other) noexcept {
        if (this != &other) {
            (void)reset(other.release());
        }
        return *this;
    }

    int get() const { return fd; }
    bool valid() const { return fd >= 0; }

    int release() {
        int f = fd;
        fd = -1;
        return f;
    }

    // Closes the current descriptor (if any) and takes 'f'. Returns the close() errno, 0 on success.
    int reset(int f = -1) {
        int err = 0;
        if (fd >= 0 && ::close(fd) != 0) {
            err = errno;
        }
        fd = f;
        return err;
    }

private:
    int fd{-1};
};

bool setNonBlocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0) {
        return false;
    }
    return ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

// Creates a close-on-exec pipe. Returns 0 or the errno of the failure.
int makePipe(FileDescriptor& readEnd, FileDescriptor& writeEnd) {
    int fds[2]{-1, -1};
#ifdef __linux__
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return errno;
    }
#else
    if (::pipe(fds) != 0) {
        return errno;
    }
    (void)::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    (void)::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
#endif
    (void)readEnd.reset(fds[0]);
    (void)writeEnd.reset(fds[1]);
    return 0;
}

//==========================================================================================================
// WakeSignal
// Purpose: Level-triggered wakeup that can sit in a poll() set: eventfd on Linux, self-pipe elsewhere.
//          Once notified it stays readable.
//==========================================================================================================
class WakeSignal {
public:
    WakeSignal() {
#ifdef __linux__
        int efd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (efd < 0) {
            initErr = errno;
            return;
        }
        (void)readFd.reset(efd);
#else
        initErr = makePipe(readFd, writeFd);
        if (initErr == 0) {
            (void)setNonBlocking(readFd.get());
            (void)setNonBlocking(writeFd.get());
        }
#endif
    }

    WakeSignal(const WakeSignal&) = delete;
    WakeSignal& operator=(const WakeSignal&) = delete;

    bool valid() const { return readFd.valid(); }
    int error() const { return initErr; }
    int fd() const { return readFd.get(); }

    void notify() {
#ifdef __linux__
        uint64_t one = 1;
        ssize_t wr;
        do {
            wr = ::write(readFd.get(), &one, sizeof(one));
        } while (wr < 0 && errno == EINTR);
#else
        char b = 'x';
        ssize_t wr;
        do {
            wr = ::write(writeFd.get(), &b, 1);
        } while (wr < 0 && errno == EINTR);
#endif
        // EAGAIN means the signal is already pending; nothing else can fail on a valid descriptor
    }

private:
    FileDescriptor readFd;
#ifndef __linux__
    FileDescriptor writeFd;
#endif
    int initErr{0};
};

enum class WaitOutcome { Ready, Cancelled, TimedOut, Failed };

int pollTimeoutMs(Clock::time_point deadline) {
    if (deadline == Clock::time_point::max()) {
        return -1;
    }
    auto now = Clock::now();
    if (now >= deadline) {
        return 0;
    }
    auto ms = std::chrono::ceil<std::chrono::milliseconds>(deadline - now).count();
    return static_cast<int>(std::min<long long>(ms, std::numeric_limits<int>::max()));
}

bool deadlinePassed(Clock::time_point deadline) {
    return deadline != Clock::time_point::max() && Clock::now() >= deadline;
}

//==========================================================================================================
// waitReady
// Purpose: Blocks until 'fd' reports any of 'events' (or an error/hangup), the cancel signal fires, or the
//          deadline passes. Cancellation wins over readiness when both are reported.
//==========================================================================================================
WaitOutcome waitReady(int fd, short events, int cancelFd, Clock::time_point deadline, int& err) {
    for (;;) {
        struct pollfd pfds[2];
        pfds[0].fd = fd; pfds[0].events = events; pfds[0].revents = 0;
        pfds[1].fd = cancelFd; pfds[1].events = POLLIN; pfds[1].revents = 0;
        int rc = ::poll(pfds, 2, pollTimeoutMs(deadline));
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            err = errno;
            return WaitOutcome::Failed;
        }
        if (pfds[1].revents & POLLIN) {
            return WaitOutcome::Cancelled;
        }
        if (rc > 0 && pfds[0].revents != 0) {
            return WaitOutcome::Ready;
        }
        if (deadlinePassed(deadline)) {
            return WaitOutcome::TimedOut;
        }
    }
}

std::string describeStatus(int status) {
    if (WIFEXITED(status)) {
        return "exit status " + std::to_string(WEXITSTATUS(status));
    }
    if (WIFSIGNALED(status)) {
        const char* name = ::strsignal(WTERMSIG(status));
        return "signal " + std::to_string(WTERMSIG(status)) + (name ? std::string(" (") + name + ")" : std::string());
    }
    return "status " + std::to_string(status);
}

//==========================================================================================================
// ChildProcess
// Purpose: Owns a spawned pid until it is reaped. The child leads its own process group, so killGroup()
//          also reaches anything it forked. The destructor kills and reaps as a last resort.
//==========================================================================================================
class ChildProcess {
public:
    explicit ChildProcess(pid_t p) : pid(p) {}
    ~ChildProcess() {
        if (!reaped) {
            killGroup();
            reapBlocking();
        }
    }

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    pid_t id() const { return pid; }
    bool isReaped() const { return reaped; }
    int status() const { return waitStatus; }

    void killGroup() {
        if (::kill(-pid, SIGKILL) != 0 && !reaped) {
            (void)::kill(pid, SIGKILL);
        }
    }

    // Non-blocking reap. Returns true once the child has been collected.
    bool tryReap() {
        if (reaped) {
            return true;
        }
        int st = 0;
        pid_t r;
        do {
            r = ::waitpid(pid, &st, WNOHANG);
        } while (r < 0 && errno == EINTR);
        if (r == pid) {
            reaped = true;
            waitStatus = st;
        } else if (r < 0 && errno == ECHILD) {
            LOG_WARN("waitpid: child {} already collected elsewhere", pid);
            reaped = true;
        }
        return reaped;
    }

    void reapBlocking() {
        if (reaped) {
            return;
        }
        int st = 0;
        pid_t r;
        do {
            r = ::waitpid(pid, &st, 0);
        } while (r < 0 && errno == EINTR);
        if (r == pid) {
            waitStatus = st;
        } else {
            LOG_WARN("waitpid({}) failed (errno={} msg={})", pid, errno, ::strerror(errno));
        }
        reaped = true;
    }

private:
    pid_t pid;
    bool reaped{false};
    int waitStatus{0};
};

//==========================================================================================================
// waitForExit
// Purpose: Waits for the child to exit while watching the cancel signal and deadline. Uses a pidfd on
//          Linux; elsewhere (or when pidfd_open is unavailable) polls waitpid(WNOHANG).
// Returns:
//   Ready once the child is reaped; Cancelled/TimedOut with the child still running.
//==========================================================================================================
WaitOutcome waitForExit(ChildProcess& child, int cancelFd, Clock::time_point deadline, int& err) {
#if defined(__linux__) && defined(SYS_pidfd_open)
    int pfd = static_cast<int>(::syscall(SYS_pidfd_open, child.id(), 0));
    if (pfd >= 0) {
        FileDescriptor pidFd(pfd);
        auto outcome = waitReady(pidFd.get(), POLLIN, cancelFd, deadline, err);
        if (outcome == WaitOutcome::Ready) {
            child.reapBlocking();
            return outcome;
        }
        if (outcome != WaitOutcome::Failed && child.tryReap()) {
            return WaitOutcome::Ready;
        }
        return outcome;
    }
#endif
    for (;;) {
        if (child.tryReap()) {
            return WaitOutcome::Ready;
        }
        auto slice = std::min(deadline, Clock::now() + ExitPollInterval);
        struct pollfd pfd;
        pfd.fd = cancelFd; pfd.events = POLLIN; pfd.revents = 0;
        int rc = ::poll(&pfd, 1, pollTimeoutMs(slice));
        if (rc < 0 && errno != EINTR) {
            err = errno;
            return WaitOutcome::Failed;
        }
        if (rc > 0 && (pfd.revents & POLLIN)) {
            return child.tryReap() ? WaitOutcome::Ready : WaitOutcome::Cancelled;
        }
        if (deadlinePassed(deadline)) {
            return child.tryReap() ? WaitOutcome::Ready : WaitOutcome::TimedOut;
        }
    }
}

//==========================================================================================================
// StderrDrain
// Purpose: Reads the child's stderr on its own thread so the child never blocks on a full pipe.
// Notes:
//   - The accumulated text is owned by the drain thread until it finishes; it is handed over through a
//     promise/future pair, so join() is the only reader and may be called exactly once.
//   - At most 'limit' bytes are retained; the rest is read and counted but discarded.
//   - stop() makes the thread sweep what is already buffered and finish even if the pipe stays open.
//==========================================================================================================
class StderrDrain {
public:
    StderrDrain(FileDescriptor fd, std::size_t maxBytes)
        : stream(std::move(fd)), limit(maxBytes), result(done.get_future()) {}

    ~StderrDrain() {
        if (worker.joinable()) {
            stop();
            worker.join();
        }
    }

    StderrDrain(const StderrDrain&) = delete;
    StderrDrain& operator=(const StderrDrain&) = delete;

    bool valid() const { return stream.valid() && wake.valid(); }
    int error() const { return wake.error(); }

    bool start() {
        (void)setNonBlocking(stream.get());
        try {
            worker = std::thread([this]() { run(); });
        } catch (const std::system_error& e) {
            LOG_ERROR("StderrDrain: failed to start thread: {}", e.what());
            return false;
        }
        return true;
    }

    void stop() { wake.notify(); }

    std::string join() {
        std::string text = result.get();
        worker.join();
        return text;
    }

private:
    void run() {
        std::string buf;
        std::size_t dropped = 0;
        try {
            std::array<char, ReadChunkBytes> tmp{};
            bool stopping = false;
            std::size_t swept = 0;
            for (;;) {
                if (!stopping) {
                    struct pollfd pfds[2];
                    pfds[0].fd = stream.get(); pfds[0].events = POLLIN; pfds[0].revents = 0;
                    pfds[1].fd = wake.fd(); pfds[1].events = POLLIN; pfds[1].revents = 0;
                    int rc = ::poll(pfds, 2, -1);
                    if (rc < 0) {
                        if (errno == EINTR) {
                            continue;
                        }
                        LOG_DEBUG("StderrDrain: poll failed (errno={} msg={})", errno, ::strerror(errno));
                        break;
                    }
                    if (pfds[1].revents & POLLIN) {
                        stopping = true;
                    } else if (pfds[0].revents == 0) {
                        continue;
                    }
                } else if (swept >= DrainFinalSweepBytes) {
                    break;
                }
                ssize_t n = ::read(stream.get(), tmp.data(), tmp.size());
                if (n > 0) {
                    const std::size_t got = static_cast<std::size_t>(n);
                    if (stopping) {
                        swept += got;
                    }
                    const std::size_t room = (limit > buf.size()) ? (limit - buf.size()) : 0;
                    const std::size_t keep = std::min(room, got);
                    buf.append(tmp.data(), keep);
                    dropped += got - keep;
                    continue;
                }
                if (n == 0) {
                    break;
                }
                if (errno == EINTR) {
                    continue;
                }
                if (errno == EAGAIN || errno == EWOULDBLOCK) {
                    if (stopping) {
                        break;
                    }
                    continue;
                }
                LOG_DEBUG("StderrDrain: read failed (errno={} msg={})", errno, ::strerror(errno));
                break;
            }
            if (dropped > 0) {
                buf += "\n[" + std::to_string(dropped) + " more bytes of stderr discarded]";
            }
        } catch (const std::exception& e) {
            LOG_WARN("StderrDrain: stopped early: {}", e.what());
        }
        (void)stream.reset();
        done.set_value(std::move(buf));
    }

    FileDescriptor stream;
    WakeSignal wake;
    std::size_t limit;
    std::promise<std::string> done;
    std::future<std::string> result;
    std::thread worker;
};

//==========================================================================================================
// SpawnFileActions / SpawnAttributes
// Purpose: RAII for the posix_spawn descriptor tables.
//==========================================================================================================
struct SpawnFileActions {
    posix_spawn_file_actions_t native;
    int initErr;
    SpawnFileActions() : initErr(::posix_spawn_file_actions_init(&native)) {}
    ~SpawnFileActions() {
        if (initErr == 0) {
            ::posix_spawn_file_actions_destroy(&native);
        }
    }
    SpawnFileActions(const SpawnFileActions&) = delete;
    SpawnFileActions& operator=(const SpawnFileActions&) = delete;
};

struct SpawnAttributes {
    posix_spawnattr_t native;
    int initErr;
    SpawnAttributes() : initErr(::posix_spawnattr_init(&native)) {}
    ~SpawnAttributes() {
        if (initErr == 0) {
            ::posix_spawnattr_destroy(&native);
        }
    }
    SpawnAttributes(const SpawnAttributes&) = delete;
    SpawnAttributes& operator=(const SpawnAttributes&) = delete;
};

ExecutionResult failure(ErrorCategory category, std::string message,
                        std::string diagnostics = std::string(),
                        std::optional<std::string> exitStatus = std::nullopt) {
    ExecutionResult r;
    r.error = makeExecutionError(category, std::move(message), std::move(diagnostics), std::move(exitStatus));
    return r;
}

bool hasNul(const std::string& s) {
    return s.find('\0') != std::string::npos;
}

std::once_flag sigpipeOnce;

} // namespace

class ProcessExecutor::Impl {
public:
    explicit Impl(const ProcessExecutor::Options& o) : opts(o) {}

    ExecutionResult execute(const ExecutionContext& ctx, const ExecutionRequest& request);

private:
    ProcessExecutor::Options opts;
};

ExecutionResult ProcessExecutor::Impl::execute(const ExecutionContext& ctx, const ExecutionRequest& request) {
    if (request.command.empty()) {
        return failure(ErrorCategory::SetupError, "empty command");
    }
    if (hasNul(request.command) || std::any_of(request.args.begin(), request.args.end(), hasNul)) {
        return failure(ErrorCategory::SetupError, "command or argument contains a NUL byte");
    }
    for (const auto& [key, value] : request.env) {
        if (key.empty() || key.find('=') != std::string::npos || hasNul(key) || hasNul(value)) {
            return failure(ErrorCategory::SetupError, "invalid environment entry: " + key);
        }
    }
    if (ctx.Cancelled()) {
        return failure(ErrorCategory::CancellationError, "request cancelled before start");
    }
    if (ctx.Expired()) {
        return failure(ErrorCategory::CancellationError, "deadline exceeded before start");
    }

    // 1. Child description: argv plus inherited environment overlaid with the request's entries
    const std::vector<std::string> envBlock = BuildEnvironmentBlock(SnapshotEnvironment(), request.env);
    std::vector<char*> argv;
    argv.reserve(request.args.size() + 2);
    argv.push_back(const_cast<char*>(request.command.c_str()));
    for (const auto& a : request.args) {
        argv.push_back(const_cast<char*>(a.c_str()));
    }
    argv.push_back(nullptr);
    std::vector<char*> envp;
    envp.reserve(envBlock.size() + 1);
    for (const auto& e : envBlock) {
        envp.push_back(const_cast<char*>(e.c_str()));
    }
    envp.push_back(nullptr);

    WakeSignal cancelSignal;
    if (!cancelSignal.valid()) {
        return failure(ErrorCategory::SetupError, "cancel signal: " + errnoText(cancelSignal.error()));
    }
    std::stop_callback onStop(ctx.stopToken, [&cancelSignal]() { cancelSignal.notify(); });

    // 2. Three pipes; the child's ends are dup'ed onto 0/1/2, everything else is close-on-exec
    FileDescriptor stdinRead, stdinWrite, stdoutRead, stdoutWrite, stderrRead, stderrWrite;
    if (int err = makePipe(stdinRead, stdinWrite); err != 0) {
        return failure(ErrorCategory::SetupError, "stdin pipe: " + errnoText(err));
    }
    if (int err = makePipe(stdoutRead, stdoutWrite); err != 0) {
        return failure(ErrorCategory::SetupError, "stdout pipe: " + errnoText(err));
    }
    if (int err = makePipe(stderrRead, stderrWrite); err != 0) {
        return failure(ErrorCategory::SetupError, "stderr pipe: " + errnoText(err));
    }
    StderrDrain drain(std::move(stderrRead), opts.maxStderrBytes);
    if (!drain.valid()) {
        return failure(ErrorCategory::SetupError, "stderr drain: " + errnoText(drain.error()));
    }

    SpawnFileActions actions;
    if (actions.initErr != 0) {
        return failure(ErrorCategory::SetupError, "posix_spawn_file_actions_init: " + errnoText(actions.initErr));
    }
    int faErr = ::posix_spawn_file_actions_adddup2(&actions.native, stdinRead.get(), STDIN_FILENO);
    if (faErr == 0) {
        faErr = ::posix_spawn_file_actions_adddup2(&actions.native, stdoutWrite.get(), STDOUT_FILENO);
    }
    if (faErr == 0) {
        faErr = ::posix_spawn_file_actions_adddup2(&actions.native, stderrWrite.get(), STDERR_FILENO);
    }
    if (faErr != 0) {
        return failure(ErrorCategory::SetupError, "posix_spawn_file_actions_adddup2: " + errnoText(faErr));
    }

    SpawnAttributes attrs;
    if (attrs.initErr != 0) {
        return failure(ErrorCategory::SetupError, "posix_spawnattr_init: " + errnoText(attrs.initErr));
    }
    sigset_t defaults;
    sigset_t mask;
    ::sigemptyset(&defaults);
    ::sigaddset(&defaults, SIGPIPE);
    ::sigemptyset(&mask);
    int attrErr = ::posix_spawnattr_setflags(&attrs.native,
        static_cast<short>(POSIX_SPAWN_SETPGROUP | POSIX_SPAWN_SETSIGDEF | POSIX_SPAWN_SETSIGMASK));
    if (attrErr == 0) {
        attrErr = ::posix_spawnattr_setpgroup(&attrs.native, 0);
    }
    if (attrErr == 0) {
        attrErr = ::posix_spawnattr_setsigdefault(&attrs.native, &defaults);
    }
    if (attrErr == 0) {
        attrErr = ::posix_spawnattr_setsigmask(&attrs.native, &mask);
    }
    if (attrErr != 0) {
        return failure(ErrorCategory::SetupError, "posix_spawnattr: " + errnoText(attrErr));
    }

    // 3. Start
    pid_t pid = -1;
    int spawnErr = ::posix_spawnp(&pid, request.command.c_str(), &actions.native, &attrs.native,
                                  argv.data(), envp.data());
    if (spawnErr != 0) {
        LOG_DEBUG("event=process_start_failed {} {}", Logger::kv("command", request.command), Logger::kv("error", errnoText(spawnErr)));
        return failure(ErrorCategory::StartError, "process start: " + request.command + ": " + errnoText(spawnErr));
    }
    ChildProcess child(pid);
    (void)stdinRead.reset();
    (void)stdoutWrite.reset();
    (void)stderrWrite.reset();
    LOG_DEBUG("event=process_started pid={} {} args={}", pid, Logger::kv("command", request.command), request.args.size());

    // 4. Drain stderr before anything is written to stdin
    if (!drain.start()) {
        child.killGroup();
        child.reapBlocking();
        return failure(ErrorCategory::SetupError, "stderr drain thread could not be started");
    }

    const Clock::time_point deadline = ctx.deadline;
    auto cancellationReason = [&ctx]() {
        return std::string(ctx.Cancelled() ? "request cancelled" : "deadline exceeded");
    };
    auto abortWith = [&](ErrorCategory category, const std::string& message) -> ExecutionResult {
        child.killGroup();
        child.reapBlocking();
        drain.stop();
        std::string stderrText = drain.join();
        LOG_DEBUG("event=process_aborted pid={} category={} {}", pid, errors::errorCategoryName(category), Logger::kv("reason", message));
        return failure(category, message, std::move(stderrText), describeStatus(child.status()));
    };

    // 5. Input + '\n', then EOF
    std::string payload;
    payload.reserve(request.input.size() + 1);
    payload.append(request.input);
    payload.push_back('\n');
    if (!setNonBlocking(stdinWrite.get())) {
        return abortWith(ErrorCategory::IOError, "stdin: fcntl: " + errnoText(errno));
    }
    std::optional<std::string> stdinBroken;
    std::size_t written = 0;
    while (written < payload.size()) {
        ssize_t w = ::write(stdinWrite.get(), payload.data() + written, payload.size() - written);
        if (w > 0) {
            written += static_cast<std::size_t>(w);
            continue;
        }
        const int e = (w < 0) ? errno : EIO;
        if (e == EINTR) {
            continue;
        }
        if (e == EAGAIN || e == EWOULDBLOCK) {
            int err = 0;
            auto outcome = waitReady(stdinWrite.get(), POLLOUT, cancelSignal.fd(), deadline, err);
            if (outcome == WaitOutcome::Cancelled || outcome == WaitOutcome::TimedOut) {
                return abortWith(ErrorCategory::CancellationError, cancellationReason() + " while writing stdin");
            }
            if (outcome == WaitOutcome::Failed) {
                return abortWith(ErrorCategory::IOError, "write to stdin: poll: " + errnoText(err));
            }
            continue;
        }
        if (e == EPIPE) {
            // The child closed its input; its exit status and output decide the outcome
            stdinBroken = "write to stdin: " + errnoText(e);
            break;
        }
        return abortWith(ErrorCategory::IOError, "write to stdin: " + errnoText(e));
    }
    if (int err = stdinWrite.reset(); err != 0) {
        LOG_DEBUG("Failed to close stdin (errno={} msg={})", err, ::strerror(err));
    }

    // 6. First line of stdout
    std::string line;
    bool completeLine = false;
    if (!setNonBlocking(stdoutRead.get())) {
        return abortWith(ErrorCategory::IOError, "stdout: fcntl: " + errnoText(errno));
    }
    std::array<char, ReadChunkBytes> tmp{};
    for (;;) {
        ssize_t n = ::read(stdoutRead.get(), tmp.data(), tmp.size());
        if (n > 0) {
            const char* begin = tmp.data();
            const char* end = begin + n;
            const char* nl = std::find(begin, end, '\n');
            line.append(begin, nl);
            if (line.size() > opts.maxOutputLineBytes) {
                return abortWith(ErrorCategory::IOError,
                    "read from stdout: line exceeds " + std::to_string(opts.maxOutputLineBytes) + " bytes");
            }
            if (nl != end) {
                completeLine = true;
                break;
            }
            continue;
        }
        if (n == 0) {
            break;
        }
        const int e = errno;
        if (e == EINTR) {
            continue;
        }
        if (e == EAGAIN || e == EWOULDBLOCK) {
            int err = 0;
            auto outcome = waitReady(stdoutRead.get(), POLLIN, cancelSignal.fd(), deadline, err);
            if (outcome == WaitOutcome::Cancelled || outcome == WaitOutcome::TimedOut) {
                return abortWith(ErrorCategory::CancellationError, cancellationReason() + " while reading stdout");
            }
            if (outcome == WaitOutcome::Failed) {
                return abortWith(ErrorCategory::IOError, "read from stdout: poll: " + errnoText(err));
            }
            continue;
        }
        return abortWith(ErrorCategory::IOError, "read from stdout: " + errnoText(e));
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }

    // 7. Exit, raced against cancellation and the deadline
    {
        int err = 0;
        auto outcome = waitForExit(child, cancelSignal.fd(), deadline, err);
        if (outcome == WaitOutcome::Cancelled || outcome == WaitOutcome::TimedOut) {
            return abortWith(ErrorCategory::CancellationError, cancellationReason() + " while waiting for exit");
        }
        if (outcome == WaitOutcome::Failed) {
            return abortWith(ErrorCategory::IOError, "wait for exit: " + errnoText(err));
        }
    }

    // 8. The child is reaped; sweep what it left in the stderr pipe and finish. A descendant that inherited
    //    stderr may keep the pipe open, so end-of-stream is not awaited.
    drain.stop();
    std::string stderrText = drain.join();

    // 9. Outcome
    const int status = child.status();
    const std::string statusText = describeStatus(status);
    LOG_DEBUG("event=process_exited pid={} {} stderr_bytes={}", pid, Logger::kv("status", statusText), stderrText.size());
    if (!(WIFEXITED(status) && WEXITSTATUS(status) == 0)) {
        return failure(ErrorCategory::ProcessError, "process exited with " + statusText, std::move(stderrText), statusText);
    }
    if (stdinBroken.has_value() && !completeLine) {
        return failure(ErrorCategory::IOError, stdinBroken.value(), std::move(stderrText), statusText);
    }

    ExecutionResult result;
    result.output = std::move(line);
    return result;
}

ProcessExecutor::ProcessExecutor() : ProcessExecutor(Options{}) {}

ProcessExecutor::ProcessExecutor(const Options& opts)
    : pImpl(std::make_unique<Impl>(opts)) {
    std::call_once(sigpipeOnce, []() { (void)::signal(SIGPIPE, SIG_IGN); });
}

ProcessExecutor::~ProcessExecutor() = default;

ExecutionResult ProcessExecutor::Execute(const ExecutionContext& ctx, const ExecutionRequest& request) {
    return pImpl->execute(ctx, request);
}

} // namespace mcphttp
