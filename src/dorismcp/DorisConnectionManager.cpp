//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: DorisConnectionManager.cpp
// Purpose: Settings validation and TCP reachability probe for the Doris frontend
//==========================================================================================================

#include <atomic>
#include <chrono>
#include <format>
#include <mutex>
#include <utility>

#include <boost/asio.hpp>

#include "dorismcp/DorisConnectionManager.h"
#include "logging/Logger.h"

namespace dorismcp {
namespace net = boost::asio;
using tcp = net::ip::tcp;

class DorisConnectionManager::Impl {
public:
    DatabaseConfig config;
    std::mutex stateMutex;
    std::atomic<bool> initialized{false};

    explicit Impl(const DatabaseConfig& c) : config(c) {}

    void validate() const {
        if (config.host.empty()) {
            throw ConnectionError("Database host must not be empty");
        }
        if (config.user.empty()) {
            throw ConnectionError("Database user must not be empty");
        }
        if (config.port <= 0 || config.port > 65535) {
            throw ConnectionError(std::format("Database port out of range: {}", config.port));
        }
    }

    // Connect to host:port and disconnect again, bounded by the configured timeout
    void probe() const {
        net::io_context ioc;
        tcp::resolver resolver(ioc);
        tcp::socket socket(ioc);

        boost::system::error_code ec;
        auto endpoints = resolver.resolve(config.host, std::to_string(config.port), ec);
        if (ec) {
            throw ConnectionError(std::format("Cannot resolve Doris host {}: {}", config.host, ec.message()));
        }

        boost::system::error_code result = net::error::would_block;
        net::async_connect(socket, endpoints,
            [&result](const boost::system::error_code& e, const tcp::endpoint&) { result = e; });
        ioc.run_for(std::chrono::seconds(config.connectTimeoutSeconds));

        if (result == net::error::would_block) {
            throw ConnectionError(std::format("Timed out after {}s connecting to Doris at {}:{}",
                                              config.connectTimeoutSeconds, config.host, config.port));
        }
        if (result) {
            throw ConnectionError(std::format("Cannot connect to Doris at {}:{}: {}",
                                              config.host, config.port, result.message()));
        }
        boost::system::error_code closeEc;
        socket.shutdown(tcp::socket::shutdown_both, closeEc);
        socket.close(closeEc);
    }

    void initialize() {
        std::lock_guard<std::mutex> lock(stateMutex);
        if (initialized.load()) {
            LOG_DEBUG("Doris connection manager already initialized");
            return;
        }
        validate();
        if (config.connectTimeoutSeconds > 0) {
            probe();
            LOG_INFO("Doris frontend reachable at {}:{}", config.host, config.port);
        } else {
            LOG_INFO("Doris connectivity probe disabled (DB_CONNECT_TIMEOUT=0)");
        }
        initialized.store(true);
    }

    void close() {
        std::lock_guard<std::mutex> lock(stateMutex);
        if (!initialized.exchange(false)) {
            return;
        }
        LOG_INFO("Doris connection manager closed");
    }
};

DorisConnectionManager::DorisConnectionManager(const DatabaseConfig& config)
    : pImpl(std::make_unique<Impl>(config)) {}

DorisConnectionManager::~DorisConnectionManager() = default;

std::future<void> DorisConnectionManager::Initialize() {
    return std::async(std::launch::async, [this]() { pImpl->initialize(); });
}

std::future<void> DorisConnectionManager::Close() {
    return std::async(std::launch::async, [this]() { pImpl->close(); });
}

bool DorisConnectionManager::IsInitialized() const {
    return pImpl->initialized.load();
}

} // namespace dorismcp
