//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HTTPServer.h
// Purpose: HTTP/HTTPS listener using Boost.Beast (TLS 1.3 only for HTTPS)
//==========================================================================================================

#pragma once

#include <functional>
#include <memory>
#include <string>

#include "dorismcp/Config.h"
#include "dorismcp/HTTPMessages.h"

namespace dorismcp {

class HTTPServer {
public:
    struct Options {
        std::string address{"localhost"};
        std::string port{"3000"};          // "0" picks a free port
        std::string scheme{"http"};        // "http" or "https"
        std::string certFile;              // PEM (https)
        std::string keyFile;               // PEM (https)
        int workerThreads{4};
        int eventStreamKeepaliveSeconds{15};
    };

    using Handler = std::function<HttpReply(const HttpRequest&)>;
    using ListeningCallback = std::function<void(unsigned short port)>;

    // Throws when the TLS certificate or key cannot be loaded.
    HTTPServer(const Options& opts, Handler handler);
    ~HTTPServer();

    HTTPServer(const HTTPServer&) = delete;
    HTTPServer& operator=(const HTTPServer&) = delete;

    void SetListeningCallback(ListeningCallback cb);

    //==========================================================================================================
    // Serve
    // Purpose: Bind, report the bound port, and run the accept loop on the calling thread until Stop().
    // Notes:
    //   Bind failures propagate. Accept-loop failures are collected; several are thrown together as an
    //   errors::AggregateError.
    //==========================================================================================================
    void Serve();

    // Thread-safe; makes Serve() return.
    void Stop();

    // 0 until bound.
    unsigned short BoundPort() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

HTTPServer::Options MakeHTTPServerOptions(const ServerConfig& config, const std::string& host, int port);

} // namespace dorismcp
