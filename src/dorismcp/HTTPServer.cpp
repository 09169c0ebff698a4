//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HTTPServer.cpp
// Purpose: HTTP/HTTPS listener using Boost.Beast (TLS 1.3 only for HTTPS)
//==========================================================================================================

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <string_view>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "logging/Logger.h"
#include "dorismcp/HTTPServer.h"
#include "dorismcp/errors/Errors.h"

#include <openssl/ssl.h>

namespace dorismcp {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = net::ip::tcp;

namespace {
constexpr std::string_view KeepaliveComment = ": ping\n\n";
constexpr auto EventStreamTick = std::chrono::milliseconds(200);
}

class HTTPServer::Impl {
public:
    HTTPServer::Options opts;
    HTTPServer::Handler handler;
    HTTPServer::ListeningCallback onListening;

    std::atomic<bool> running{false};
    std::atomic<bool> served{false};
    std::atomic<bool> stopRequested{false};
    std::atomic<unsigned short> boundPort{0};

    std::unique_ptr<ssl::context> sslCtx; // present when scheme==https
    net::io_context ioc;
    std::unique_ptr<tcp::acceptor> acceptor;
    net::thread_pool workers;

    std::mutex failuresMutex;
    errors::FailureCollector failures;

    Impl(const HTTPServer::Options& o, HTTPServer::Handler h)
        : opts(o), handler(std::move(h)),
          workers(static_cast<std::size_t>(std::max(1, o.workerThreads))) {
        if (opts.scheme == "https") {
            sslCtx = std::make_unique<ssl::context>(ssl::context::tls_server);
            // TLS 1.3 only
            ::SSL_CTX_set_min_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            ::SSL_CTX_set_max_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            try {
                sslCtx->use_certificate_chain_file(opts.certFile);
                sslCtx->use_private_key_file(opts.keyFile, ssl::context::file_format::pem);
            } catch (const std::exception& e) {
                LOG_ERROR("HTTPServer: failed to load certificate/key: {}", e.what());
                throw;
            }
            sslCtx->set_options(
                ssl::context::default_workarounds | ssl::context::no_sslv2 | ssl::context::no_sslv3 |
                ssl::context::no_tlsv1 | ssl::context::no_tlsv1_1 | ssl::context::no_tlsv1_2);
        } else if (opts.scheme != "http") {
            throw std::invalid_argument("HTTPServer: unsupported scheme: " + opts.scheme);
        }
    }

    ~Impl() {
        workers.stop();
        workers.join();
    }

    void recordFailure(std::exception_ptr ep) {
        std::lock_guard<std::mutex> lock(failuresMutex);
        failures.Add(std::move(ep));
    }

    void logSessionError(const char* kind, const std::exception& e) {
        if (!running.load()) {
            LOG_DEBUG("HTTPServer {} session suppressed during shutdown: {}", kind, e.what());
        } else {
            LOG_WARN("HTTPServer {} session error: {}", kind, e.what());
        }
    }

    void bind() {
        // Validate port strictly: numeric and within [0, 65535]
        if (opts.port.empty()) {
            throw std::invalid_argument("HTTPServer invalid port: empty");
        }
        bool allDigits = std::all_of(opts.port.begin(), opts.port.end(), [](unsigned char ch){ return std::isdigit(ch) != 0; });
        if (!allDigits || opts.port.size() > 5 || std::stoul(opts.port) > 65535ul) {
            throw std::invalid_argument("HTTPServer invalid port: " + opts.port);
        }
        tcp::resolver resolver(ioc);
        auto r = resolver.resolve(opts.address, opts.port);
        tcp::endpoint ep = *r.begin();

        acceptor = std::make_unique<tcp::acceptor>(ioc);
        acceptor->open(ep.protocol());
        acceptor->set_option(tcp::acceptor::reuse_address(true));
        acceptor->bind(ep);
        acceptor->listen();
        boundPort = acceptor->local_endpoint().port();
    }

    // Handler calls run on the worker pool; the connection coroutine resumes on the event loop.
    net::awaitable<HttpReply> handleOnWorkers(const HttpRequest& req) {
        try {
            co_return co_await net::co_spawn(
                workers,
                [this, &req]() -> net::awaitable<HttpReply> { co_return handler(req); },
                net::use_awaitable);
        } catch (const std::exception& e) {
            LOG_ERROR("HTTPServer: handler failed: {}", e.what());
        }
        co_return MakeTextReply(http::status::internal_server_error, "Internal Server Error", req.version());
    }

    template <class Stream>
    net::awaitable<void> streamEvents(Stream& stream, const HttpRequest& req, HttpReply& reply) {
        struct CloseOnExit {
            std::shared_ptr<EventStream> events;
            ~CloseOnExit() { events->Close(); }
        } guard{reply.eventStream};

        http::response<http::empty_body> head{reply.response.result(), req.version()};
        for (const auto& field : reply.response) {
            head.set(field.name_string(), field.value());
        }
        head.chunked(true);
        head.keep_alive(false);
        http::response_serializer<http::empty_body> sr{head};
        co_await http::async_write_header(stream, sr, net::use_awaitable);

        net::steady_timer timer(co_await net::this_coro::executor);
        const auto interval = std::chrono::seconds(std::max(1, opts.eventStreamKeepaliveSeconds));
        auto nextPing = std::chrono::steady_clock::now() + interval;
        while (running.load() && guard.events->IsOpen()) {
            timer.expires_after(EventStreamTick);
            co_await timer.async_wait(net::use_awaitable);
            if (std::chrono::steady_clock::now() >= nextPing) {
                co_await net::async_write(stream, http::make_chunk(net::buffer(KeepaliveComment)), net::use_awaitable);
                nextPing += interval;
            }
        }
        LOG_DEBUG("HTTPServer: event stream for session {} ended", guard.events->SessionId());
        co_await net::async_write(stream, http::make_chunk_last(), net::use_awaitable);
    }

    // Persistent connection: serve requests until the peer closes or asks to close.
    template <class Stream>
    net::awaitable<void> serveConnection(Stream& stream) {
        boost::beast::flat_buffer buffer;
        for (;;) {
            HttpRequest req;
            boost::system::error_code ec;
            co_await http::async_read(stream, buffer, req, net::redirect_error(net::use_awaitable, ec));
            if (ec == http::error::end_of_stream) {
                co_return;
            }
            if (ec) {
                throw boost::system::system_error(ec);
            }
            HttpReply reply = co_await handleOnWorkers(req);
            if (reply.eventStream) {
                co_await streamEvents(stream, req, reply);
                co_return;
            }
            reply.response.keep_alive(req.keep_alive());
            reply.response.prepare_payload();
            co_await http::async_write(stream, reply.response, net::use_awaitable);
            if (!reply.response.keep_alive()) {
                co_return;
            }
        }
    }

    net::awaitable<void> session_plain(tcp::socket socket) {
        try {
            boost::beast::tcp_stream stream(std::move(socket));
            co_await serveConnection(stream);
            boost::system::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_send, ec);
        } catch (const std::exception& e) {
            logSessionError("plain", e);
        }
        co_return;
    }

    net::awaitable<void> session_tls(tcp::socket socket) {
        try {
            ssl::stream<tcp::socket> tls(std::move(socket), *sslCtx);
            co_await tls.async_handshake(ssl::stream_base::server, net::use_awaitable);
            co_await serveConnection(tls);
            boost::system::error_code ec;
            tls.shutdown(ec);
        } catch (const std::exception& e) {
            logSessionError("TLS", e);
        }
        co_return;
    }

    net::awaitable<void> acceptLoop() {
        while (running.load()) {
            tcp::socket socket = co_await acceptor->async_accept(net::use_awaitable);
            if (sslCtx) {
                net::co_spawn(ioc, session_tls(std::move(socket)), net::detached);
            } else {
                net::co_spawn(ioc, session_plain(std::move(socket)), net::detached);
            }
        }
    }
};

HTTPServer::HTTPServer(const Options& opts, Handler handler)
    : pImpl(std::make_unique<Impl>(opts, std::move(handler))) {}

HTTPServer::~HTTPServer() = default;

void HTTPServer::SetListeningCallback(ListeningCallback cb) {
    pImpl->onListening = std::move(cb);
}

void HTTPServer::Serve() {
    if (pImpl->served.exchange(true)) {
        throw std::logic_error("HTTPServer: Serve() may only be called once");
    }
    pImpl->bind();
    pImpl->running.store(true);
    LOG_INFO("HTTPServer listening on {}://{}:{}", pImpl->opts.scheme, pImpl->opts.address, pImpl->boundPort.load());
    if (pImpl->onListening) {
        pImpl->onListening(pImpl->boundPort.load());
    }

    net::co_spawn(pImpl->ioc, pImpl->acceptLoop(), [this](std::exception_ptr ep) {
        if (!ep) return;
        if (!pImpl->running.load()) {
            LOG_DEBUG("HTTPServer accept suppressed during shutdown: {}", errors::DescribeException(ep));
            return;
        }
        pImpl->recordFailure(ep);
        pImpl->running.store(false);
        pImpl->ioc.stop();
    });
    if (pImpl->stopRequested.load()) {
        pImpl->ioc.stop();
    }

    try {
        pImpl->ioc.run();
    } catch (const std::exception&) {
        pImpl->recordFailure(std::current_exception());
    }

    pImpl->running.store(false);
    boost::system::error_code ec;
    pImpl->acceptor->close(ec);
    pImpl->workers.join();
    LOG_INFO("HTTPServer stopped");

    std::lock_guard<std::mutex> lock(pImpl->failuresMutex);
    pImpl->failures.RethrowIfAny("HTTP listener failed");
}

void HTTPServer::Stop() {
    pImpl->stopRequested.store(true);
    pImpl->running.store(false);
    pImpl->ioc.stop();
}

unsigned short HTTPServer::BoundPort() const {
    return pImpl->boundPort.load();
}

HTTPServer::Options MakeHTTPServerOptions(const ServerConfig& config, const std::string& host, int port) {
    HTTPServer::Options opts;
    opts.address = host;
    opts.port = std::to_string(port);
    if (!config.tlsCertFile.empty()) {
        opts.scheme = "https";
        opts.certFile = config.tlsCertFile;
        opts.keyFile = config.tlsKeyFile;
    }
    opts.workerThreads = config.httpWorkerThreads;
    opts.eventStreamKeepaliveSeconds = config.httpKeepaliveSeconds;
    return opts;
}

} // namespace dorismcp
