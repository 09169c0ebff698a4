//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: DorisServer.cpp
// Purpose: Server façade and process run policy
//==========================================================================================================

#include <atomic>
#include <csignal>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "dorismcp/DorisConnectionManager.h"
#include "dorismcp/DorisServer.h"
#include "dorismcp/HTTPBridge.h"
#include "dorismcp/HTTPServer.h"
#include "dorismcp/HTTPSessionManager.h"
#include "dorismcp/OperationDispatcher.h"
#include "dorismcp/Registries.h"
#include "dorismcp/SessionLifecycleCoordinator.h"
#include "dorismcp/StdioTransport.h"
#include "dorismcp/async/FutureAwaitable.h"
#include "dorismcp/async/Task.h"
#include "dorismcp/errors/Errors.h"
#include "logging/Logger.h"

namespace dorismcp {

ServerComponents MakeDefaultComponents(const ServerConfig& config) {
    auto resources = std::make_shared<ResourceRegistry>();
    auto tools = std::make_shared<ToolRegistry>();
    auto prompts = std::make_shared<PromptRegistry>();
    RegisterBuiltinCatalog(config, *resources, *tools, *prompts);

    ServerComponents components;
    components.connections = std::make_shared<DorisConnectionManager>(config.database);
    components.resources = resources;
    components.tools = tools;
    components.prompts = prompts;
    return components;
}

class DorisServer::Impl {
public:
    ServerConfig config;
    ServerComponents components;
    OperationDispatcher dispatcher;
    ListeningCallback onListening;
    std::optional<std::pair<int, int>> stdioDescriptors;

    std::mutex activeMutex;
    bool started{false};
    bool stopRequested{false};
    StdioTransport* activeStdio{nullptr};
    SessionLifecycleCoordinator* activeHttp{nullptr};

    std::atomic<bool> shutDown{false};

    Impl(ServerConfig c, ServerComponents comps)
        : config(std::move(c)), components(std::move(comps)),
          dispatcher(components.resources, components.tools, components.prompts) {}

    async::Task<void> initializeConnections() {
        co_await async::makeFutureAwaitable(components.connections->Initialize());
    }

    // Registers the transport for RequestStop(); false when a stop already arrived.
    template <typename T>
    bool activate(T*& slot, T* transport) {
        std::lock_guard<std::mutex> lock(activeMutex);
        if (stopRequested) return false;
        slot = transport;
        return true;
    }

    template <typename T>
    void deactivate(T*& slot) {
        std::lock_guard<std::mutex> lock(activeMutex);
        slot = nullptr;
    }

    void serveStdio(DorisServer& owner) {
        StdioOptions options = MakeStdioOptions(config);
        if (stdioDescriptors) {
            options.inputFd = stdioDescriptors->first;
            options.outputFd = stdioDescriptors->second;
        }
        StdioTransport transport(options);
        if (!activate(activeStdio, &transport)) {
            LOG_INFO("Stop requested before stdio transport started");
            return;
        }
        try {
            transport.Serve(dispatcher, [&owner]() { return owner.MakeInitializationOptions(); });
        } catch (...) {
            deactivate(activeStdio);
            throw;
        }
        deactivate(activeStdio);
    }

    void serveHttp(DorisServer& owner, const std::string& host, int port) {
        HttpSessionOptions sessionOptions;
        sessionOptions.stateless = config.httpStateless;
        HTTPSessionManager manager(dispatcher, [&owner]() { return owner.MakeInitializationOptions(); },
                                   sessionOptions);
        HTTPBridge bridge([&manager](const HttpRequest& req) { return manager.HandleRequest(req); });
        HTTPServer listener(MakeHTTPServerOptions(config, host, port),
                            [&bridge](const HttpRequest& req) { return bridge.Handle(req); });
        if (onListening) {
            listener.SetListeningCallback(onListening);
        }
        SessionLifecycleCoordinator coordinator(manager,
                                                [&listener]() { listener.Serve(); },
                                                [&listener]() { listener.Stop(); });
        if (!activate(activeHttp, &coordinator)) {
            LOG_INFO("Stop requested before HTTP transport started");
            return;
        }
        try {
            coordinator.Serve();
        } catch (...) {
            deactivate(activeHttp);
            throw;
        }
        deactivate(activeHttp);
    }
};

DorisServer::DorisServer(ServerConfig config, ServerComponents components) {
    if (!components.connections || !components.resources || !components.tools || !components.prompts) {
        throw std::invalid_argument("DorisServer: all server components are required");
    }
    pImpl = std::make_unique<Impl>(std::move(config), std::move(components));
}

DorisServer::~DorisServer() = default;

void DorisServer::Start(TransportKind transport, std::optional<std::string> host, std::optional<int> port) {
    {
        std::lock_guard<std::mutex> lock(pImpl->activeMutex);
        if (pImpl->started) {
            throw std::logic_error("DorisServer: Start() may only be called once");
        }
        pImpl->started = true;
    }
    if (transport == TransportKind::Http && (!host.has_value() || !port.has_value())) {
        throw std::invalid_argument("DorisServer: http transport requires host and port");
    }

    LOG_INFO("Starting {} {} ({} transport)", pImpl->config.serverName, pImpl->config.serverVersion,
             TransportKindName(transport));
    pImpl->initializeConnections().toFuture().get();
    LOG_INFO("Database connection manager initialized");

    if (transport == TransportKind::Stdio) {
        pImpl->serveStdio(*this);
    } else {
        pImpl->serveHttp(*this, host.value(), port.value());
    }
    LOG_INFO("{} transport finished", TransportKindName(transport));
}

void DorisServer::RequestStop() {
    std::lock_guard<std::mutex> lock(pImpl->activeMutex);
    pImpl->stopRequested = true;
    if (pImpl->activeStdio) {
        pImpl->activeStdio->Stop();
    }
    if (pImpl->activeHttp) {
        pImpl->activeHttp->Stop();
    }
}

void DorisServer::Shutdown() {
    if (pImpl->shutDown.exchange(true)) {
        LOG_DEBUG("Shutdown already performed");
        return;
    }
    LOG_INFO("Shutting down {}", pImpl->config.serverName);
    try {
        pImpl->components.connections->Close().get();
    } catch (...) {
        LOG_ERROR("Error while closing database connections: {}",
                  errors::DescribeException(std::current_exception()));
    }
    LOG_INFO("Server shutdown complete");
}

void DorisServer::SetListeningCallback(ListeningCallback cb) {
    pImpl->onListening = std::move(cb);
}

void DorisServer::SetStdioDescriptors(int inputFd, int outputFd) {
    pImpl->stdioDescriptors = std::make_pair(inputFd, outputFd);
}

InitializationOptions DorisServer::MakeInitializationOptions() const {
    InitializationOptions options;
    options.serverName = pImpl->config.serverName;
    options.serverVersion = pImpl->config.serverVersion;
    options.capabilities = MakeServerCapabilities(NotificationOptions{}, {});
    return options;
}

const ServerConfig& DorisServer::GetConfig() const {
    return pImpl->config;
}

namespace {

// Stops the signal loop and joins its thread on every exit path of RunServer
class SignalThreadGuard {
public:
    SignalThreadGuard(boost::asio::io_context& ctx, std::thread& t) : context(ctx), thread(t) {}
    ~SignalThreadGuard() {
        context.stop();
        if (thread.joinable()) {
            thread.join();
        }
    }
    SignalThreadGuard(const SignalThreadGuard&) = delete;
    SignalThreadGuard& operator=(const SignalThreadGuard&) = delete;

private:
    boost::asio::io_context& context;
    std::thread& thread;
};

} // namespace

int RunServer(DorisServer& server) {
    const ServerConfig& config = server.GetConfig();

    boost::asio::io_context signalContext;
    boost::asio::signal_set signals(signalContext, SIGINT, SIGTERM);
    std::atomic<bool> interrupted{false};
    signals.async_wait([&](const boost::system::error_code& ec, int signo) {
        if (ec) return;
        interrupted = true;
        LOG_INFO("Received signal {}, stopping server", signo);
        server.RequestStop();
    });

    int exitCode = 0;
    {
        std::thread signalThread([&signalContext]() { signalContext.run(); });
        SignalThreadGuard guard(signalContext, signalThread);
        try {
            std::optional<TransportKind> kind = ParseTransportKind(config.transport);
            if (!kind.has_value()) {
                LOG_ERROR("Unsupported transport: {}", config.transport);
                server.Shutdown();
                exitCode = 1;
            } else {
                server.Start(kind.value(), config.serverHost, config.serverPort);
                if (interrupted.load()) {
                    LOG_INFO("Server stopped by user");
                }
            }
        } catch (...) {
            const std::string detail = errors::DescribeException(std::current_exception());
            if (interrupted.load()) {
                LOG_INFO("Server stopped by user ({})", detail);
            } else {
                LOG_ERROR("Server failed: {}", detail);
                server.Shutdown();
                exitCode = 1;
            }
        }
    }

    server.Shutdown();
    return exitCode;
}

} // namespace dorismcp
