//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcphttp/HTTPServer.cpp
// Purpose: HTTP server using Boost.Beast coroutines; handlers run on per-request worker threads
//==========================================================================================================

#include <fcntl.h>
#include <poll.h>
#include <sys/socket.h>
#include <errno.h>

#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "logging/Logger.h"
#include "mcphttp/HTTPServer.hpp"
#include "mcphttp/version.h"

namespace mcphttp {
namespace net = boost::asio;
namespace beast = boost::beast;
using tcp = net::ip::tcp;
using Clock = std::chrono::steady_clock;

namespace {

// Upper bound for discarding unread request bytes before closing after an early error response
constexpr std::chrono::milliseconds LingerTimeout{1000};
// How often a connection with a running handler is checked for a peer that went away
constexpr std::chrono::milliseconds DisconnectCheckInterval{50};

HttpResponse makeText(http::status status, unsigned version, std::string body) {
    HttpResponse res{status, version};
    res.set(http::field::content_type, "text/plain; charset=utf-8");
    res.body() = std::move(body);
    res.body() += '\n';
    res.prepare_payload();
    return res;
}

std::string pathOf(beast::string_view target) {
    auto q = target.find('?');
    return std::string(target.substr(0, q));
}

// Asio does not open descriptors close-on-exec; without this every spawned child would inherit them.
void setCloseOnExec(int fd) {
    int flags = ::fcntl(fd, F_GETFD, 0);
    if (flags >= 0) {
        (void)::fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
    }
}

// True once the peer has closed or reset the connection. Bytes it sent after the request are left unread.
bool peerClosed(int fd) {
    struct pollfd pfd;
    pfd.fd = fd;
    pfd.events = POLLIN | POLLRDHUP;
    pfd.revents = 0;
    if (::poll(&pfd, 1, 0) <= 0) {
        return false;
    }
    if (pfd.revents & (POLLRDHUP | POLLHUP | POLLERR)) {
        return true;
    }
    if (pfd.revents & POLLIN) {
        char peekByte;
        ssize_t n = ::recv(fd, &peekByte, 1, MSG_PEEK | MSG_DONTWAIT);
        return n == 0 || (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR);
    }
    return false;
}

} // namespace

class HTTPServer::Impl {
public:
    //==========================================================================================================
    // Job
    // Purpose: One handler invocation. 'done' and 'response' are touched on the I/O thread only; the worker
    //          hands its result over by posting to the I/O context.
    //==========================================================================================================
    struct Job {
        Job(net::io_context& ioc, HttpRequest req) : request(std::move(req)), timer(ioc) {}

        HttpRequest request;
        HttpResponse response;
        bool done{false};
        net::steady_timer timer;
        std::stop_source stop;
        std::jthread worker;
    };

    HTTPServer::Options opts;
    std::atomic<State> state{State::Starting};
    std::atomic<bool> running{false};

    RequestHandlerFn requestHandler;
    ErrorHandler errorHandler;

    std::stop_source shutdownSource;
    std::mutex inflightMutex;
    std::condition_variable inflightCv;
    std::size_t inflight{0};

    unsigned short boundPort{0};
    net::io_context ioc;
    std::unique_ptr<tcp::acceptor> acceptor;
    std::thread ioThread;

    explicit Impl(const HTTPServer::Options& o) : opts(o) {}

    ~Impl() {
        if (ioThread.joinable()) {
            shutdown(std::chrono::milliseconds(0));
        }
    }

    void setError(const std::string& msg) {
        LOG_ERROR("{}", msg);
        if (errorHandler) { errorHandler(msg); }
    }

    void bind() {
        tcp::resolver resolver(ioc);
        auto results = resolver.resolve(opts.address, std::to_string(opts.port));
        tcp::endpoint ep = *results.begin();

        acceptor = std::make_unique<tcp::acceptor>(ioc);
        acceptor->open(ep.protocol());
        setCloseOnExec(acceptor->native_handle());
        acceptor->set_option(tcp::acceptor::reuse_address(true));
        acceptor->bind(ep);
        acceptor->listen();
        boundPort = acceptor->local_endpoint().port();
    }

    //==========================================================================================================
    // shutdown
    // Purpose: Stops accepting, gives in-flight handlers 'grace' to finish, cancels the rest and waits for
    //          them, then stops and joins the I/O thread.
    //==========================================================================================================
    void shutdown(std::chrono::milliseconds grace) {
        state.store(State::ShuttingDown);
        running.store(false);
        net::post(ioc, [this]() {
            if (acceptor) {
                boost::system::error_code ec;
                acceptor->close(ec);
            }
        });
        {
            std::unique_lock<std::mutex> lk(inflightMutex);
            if (!inflightCv.wait_for(lk, grace, [this]() { return inflight == 0; })) {
                LOG_WARN("HTTPServer: cancelling {} in-flight request(s) after {} ms grace", inflight, grace.count());
            }
        }
        shutdownSource.request_stop();
        {
            std::unique_lock<std::mutex> lk(inflightMutex);
            inflightCv.wait(lk, [this]() { return inflight == 0; });
        }
        ioc.stop();
        if (ioThread.joinable()) {
            ioThread.join();
        }
        state.store(State::Stopped);
    }

    void finishInflight() {
        {
            std::lock_guard<std::mutex> lk(inflightMutex);
            --inflight;
        }
        inflightCv.notify_all();
    }

    // Worker thread body. The job reference is moved into the completion so the worker never holds the
    // last reference (the Job owns this thread).
    void runJob(std::shared_ptr<Job> job) {
        HttpResponse res;
        try {
            res = requestHandler(job->request, job->stop.get_token());
        } catch (const std::exception& e) {
            LOG_ERROR("HTTPServer: request handler threw: {}", e.what());
            res = makeText(http::status::internal_server_error, job->request.version(), "Internal server error");
        }
        net::post(ioc, [job = std::move(job), res = std::move(res)]() mutable {
            job->response = std::move(res);
            job->done = true;
            job->timer.cancel();
        });
    }

    net::awaitable<HttpResponse> runHandler(beast::tcp_stream& stream, HttpRequest req) {
        const unsigned version = req.version();
        auto job = std::make_shared<Job>(ioc, std::move(req));
        {
            std::lock_guard<std::mutex> lk(inflightMutex);
            ++inflight;
        }
        std::stop_callback onShutdown(shutdownSource.get_token(), [job]() { job->stop.request_stop(); });

        try {
            job->worker = std::jthread([this, job]() mutable { runJob(std::move(job)); });
        } catch (const std::system_error& e) {
            finishInflight();
            LOG_ERROR("HTTPServer: failed to start worker thread: {}", e.what());
            co_return makeText(http::status::internal_server_error, version, "Internal server error");
        }

        // Wakes on completion (runJob cancels the timer) or every DisconnectCheckInterval to look at the peer
        const int nativeFd = stream.socket().native_handle();
        bool disconnected = false;
        while (!job->done) {
            boost::system::error_code ec;
            job->timer.expires_after(DisconnectCheckInterval);
            co_await job->timer.async_wait(net::redirect_error(net::use_awaitable, ec));
            if (!job->done && !disconnected && peerClosed(nativeFd)) {
                disconnected = true;
                LOG_INFO("event=client_disconnected {}", Logger::kv("target", std::string(job->request.target())));
                job->stop.request_stop();
            }
        }
        job->worker.join();
        finishInflight();
        co_return std::move(job->response);
    }

    net::awaitable<HttpResponse> route(beast::tcp_stream& stream, HttpRequest req) {
        const std::string path = pathOf(req.target());
        const unsigned version = req.version();

        if (path == opts.healthPath) {
            if (req.method() != http::verb::get) {
                auto res = makeText(http::status::method_not_allowed, version, "Method not allowed");
                res.set(http::field::allow, "GET");
                co_return res;
            }
            HttpResponse res{http::status::ok, version};
            res.set(http::field::content_type, "application/json");
            res.body() = "{\"status\":\"ok\"}";
            res.prepare_payload();
            co_return res;
        }
        if (path != opts.mcpPath) {
            co_return makeText(http::status::not_found, version, "Not found");
        }
        if (req.method() != http::verb::post) {
            auto res = makeText(http::status::method_not_allowed, version, "Method not allowed");
            res.set(http::field::allow, "POST");
            co_return res;
        }
        if (!running.load() || !requestHandler) {
            co_return makeText(http::status::service_unavailable, version, "Server shutting down");
        }
        co_return co_await runHandler(stream, std::move(req));
    }

    // Half-closes and discards whatever the client is still sending so the response is not lost to a reset.
    net::awaitable<void> lingeringClose(beast::tcp_stream& stream) {
        boost::system::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_send, ec);
        stream.expires_after(LingerTimeout);
        std::array<char, 4096> sink{};
        while (!ec) {
            co_await stream.async_read_some(net::buffer(sink), net::redirect_error(net::use_awaitable, ec));
        }
        co_return;
    }

    net::awaitable<void> session(tcp::socket socket) {
        const auto started = Clock::now();
        std::string method = "-";
        std::string target = "-";
        unsigned status = 0;
        try {
            setCloseOnExec(socket.native_handle());
            beast::tcp_stream stream(std::move(socket));
            beast::flat_buffer buffer;
            http::request_parser<http::string_body> parser;
            parser.body_limit(opts.maxBodyBytes);

            boost::system::error_code ec;
            stream.expires_after(opts.timeouts.read);
            co_await http::async_read_header(stream, buffer, parser, net::redirect_error(net::use_awaitable, ec));
            if (!ec && !parser.is_done()) {
                if (beast::iequals(parser.get()[http::field::expect], "100-continue")) {
                    http::response<http::empty_body> cont{http::status::continue_, parser.get().version()};
                    co_await http::async_write(stream, cont, net::redirect_error(net::use_awaitable, ec));
                }
                if (!ec) {
                    co_await http::async_read(stream, buffer, parser, net::redirect_error(net::use_awaitable, ec));
                }
            }

            HttpResponse res;
            bool consumed = true;
            if (ec) {
                if (ec == http::error::end_of_stream || (ec == beast::error::timeout && !parser.got_some())) {
                    LOG_DEBUG("HTTPServer: connection closed without a request ({})", ec.message());
                    co_return;
                }
                if (parser.is_header_done()) {
                    method = std::string(parser.get().method_string());
                    target = std::string(parser.get().target());
                }
                LOG_WARN("event=body_read_failed {} {}", Logger::kv("target", target), Logger::kv("error", ec.message()));
                res = RequestHandler::BadBody(parser.get().version());
                consumed = false;
            } else {
                HttpRequest req = parser.release();
                method = std::string(req.method_string());
                target = std::string(req.target());
                stream.expires_never();
                res = co_await route(stream, std::move(req));
            }

            status = res.result_int();
            res.set(http::field::server, getUserAgent());
            res.keep_alive(false);
            stream.expires_after(opts.timeouts.write);
            co_await http::async_write(stream, res, net::use_awaitable);
            if (consumed) {
                stream.socket().shutdown(tcp::socket::shutdown_send, ec);
            } else {
                co_await lingeringClose(stream);
            }
        } catch (const boost::system::system_error& e) {
            if (!running.load()) {
                LOG_DEBUG("HTTPServer session suppressed during shutdown: {}", e.what());
            } else {
                setError(std::string("HTTPServer session error: ") + e.what());
            }
        } catch (const std::exception& e) {
            if (!running.load()) {
                LOG_DEBUG("HTTPServer session suppressed during shutdown: {}", e.what());
            } else {
                setError(std::string("HTTPServer session error: ") + e.what());
            }
        }
        if (status != 0) {
            const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started).count();
            LOG_INFO("event=request {} {} status={} elapsed_ms={}",
                     Logger::kv("method", method), Logger::kv("target", target), status, elapsed);
        }
        co_return;
    }

    net::awaitable<void> acceptLoop() {
        try {
            while (running.load()) {
                tcp::socket socket = co_await acceptor->async_accept(net::use_awaitable);
                net::co_spawn(ioc, session(std::move(socket)), net::detached);
            }
        } catch (const boost::system::system_error& e) {
            if (!running.load()) {
                // operation_aborted once the acceptor is closed
                LOG_DEBUG("HTTPServer accept suppressed during shutdown: {}", e.what());
            } else {
                setError(std::string("HTTPServer accept error: ") + e.what());
            }
        }
        co_return;
    }
};

HTTPServer::HTTPServer(const Options& opts)
    : pImpl(std::make_unique<Impl>(opts)) {}

HTTPServer::~HTTPServer() = default;

std::future<void> HTTPServer::Start() {
    if (pImpl->ioThread.joinable()) {
        throw std::logic_error("HTTPServer already started");
    }
    pImpl->state.store(State::Starting);
    try {
        pImpl->bind();
    } catch (const std::exception& e) {
        LOG_ERROR("HTTPServer: failed to listen on {}:{}: {}", pImpl->opts.address, pImpl->opts.port, e.what());
        pImpl->state.store(State::Stopped);
        throw;
    }
    LOG_INFO("event=listening {} port={}", Logger::kv("address", pImpl->opts.address), pImpl->boundPort);

    std::promise<void> ready; auto fut = ready.get_future();
    pImpl->running.store(true);
    pImpl->ioThread = std::thread([this, pr = std::move(ready)]() mutable {
        bool signalled = false;
        try {
            net::co_spawn(pImpl->ioc, pImpl->acceptLoop(), net::detached);
            pImpl->state.store(State::Serving);
            pr.set_value();
            signalled = true;
            pImpl->ioc.run();
        } catch (const std::exception& e) {
            pImpl->setError(std::string("HTTPServer I/O thread error: ") + e.what());
            if (!signalled) {
                pr.set_value();
            }
        }
    });
    return fut;
}

std::future<void> HTTPServer::Stop() {
    std::promise<void> done; auto fut = done.get_future();
    if (pImpl->ioThread.joinable()) {
        pImpl->shutdown(pImpl->opts.timeouts.shutdown);
    } else {
        pImpl->state.store(State::Stopped);
    }
    done.set_value();
    return fut;
}

void HTTPServer::SetRequestHandler(RequestHandlerFn handler) {
    pImpl->requestHandler = std::move(handler);
}

void HTTPServer::SetErrorHandler(ErrorHandler handler) {
    pImpl->errorHandler = std::move(handler);
}

unsigned short HTTPServer::BoundPort() const {
    return pImpl->boundPort;
}

HTTPServer::State HTTPServer::GetState() const {
    return pImpl->state.load();
}

std::size_t HTTPServer::InFlight() const {
    std::lock_guard<std::mutex> lk(pImpl->inflightMutex);
    return pImpl->inflight;
}

} // namespace mcphttp
