//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: DorisConnectionManager.h
// Purpose: Default connection manager validating settings and probing the Doris frontend endpoint
//==========================================================================================================

#pragma once

#include <future>
#include <memory>
#include <stdexcept>
#include <string>

#include "dorismcp/Collaborators.h"
#include "dorismcp/Config.h"

namespace dorismcp {

//==========================================================================================================
// ConnectionError
// Purpose: Raised by DorisConnectionManager::Initialize when settings are invalid or the FE is unreachable.
//==========================================================================================================
class ConnectionError : public std::runtime_error {
public:
    explicit ConnectionError(const std::string& what) : std::runtime_error(what) {}
};

//==========================================================================================================
// DorisConnectionManager
// Purpose: IConnectionManager for Apache Doris.
// Notes:
//   - Initialize() validates host/user/port and, unless connectTimeoutSeconds == 0, opens and closes a TCP
//     connection to host:port within the timeout.
//   - Close() is idempotent. Both methods are safe to call from any thread.
//==========================================================================================================
class DorisConnectionManager : public IConnectionManager {
public:
    explicit DorisConnectionManager(const DatabaseConfig& config);
    ~DorisConnectionManager() override;

    std::future<void> Initialize() override;
    std::future<void> Close() override;

    bool IsInitialized() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace dorismcp
