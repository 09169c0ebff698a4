//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: DorisServer.h
// Purpose: Server façade: collaborator wiring, transport selection, shutdown, and the process run policy
//==========================================================================================================

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "dorismcp/Collaborators.h"
#include "dorismcp/Config.h"
#include "dorismcp/Protocol.h"

namespace dorismcp {

// Connection manager plus the in-memory registries populated with the built-in catalogue.
ServerComponents MakeDefaultComponents(const ServerConfig& config);

class DorisServer {
public:
    using ListeningCallback = std::function<void(unsigned short port)>;

    // All four components must be set; throws std::invalid_argument otherwise.
    DorisServer(ServerConfig config, ServerComponents components);
    ~DorisServer();

    DorisServer(const DorisServer&) = delete;
    DorisServer& operator=(const DorisServer&) = delete;

    //==========================================================================================================
    // Start
    // Purpose: Initialize the connection manager once, then serve on the chosen transport until it ends.
    // Args:
    //   transport: Stdio ignores host/port; Http requires both.
    // Notes:
    //   Blocks. Initialization failures propagate before any transport is engaged. A server is started once.
    //==========================================================================================================
    void Start(TransportKind transport,
               std::optional<std::string> host = std::nullopt,
               std::optional<int> port = std::nullopt);

    // Thread-safe. Stops the active transport (or the one about to start).
    void RequestStop();

    // Idempotent. Closes the connection manager; cleanup failures are logged, never thrown.
    void Shutdown();

    // Called with the bound port once the HTTP listener accepts connections.
    void SetListeningCallback(ListeningCallback cb);

    // Serve stdio on this descriptor pair instead of stdin/stdout. Both are duplicated, not owned.
    void SetStdioDescriptors(int inputFd, int outputFd);

    // Descriptor sent in the initialize result (capabilities snapshot included).
    InitializationOptions MakeInitializationOptions() const;

    const ServerConfig& GetConfig() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// RunServer
// Purpose: Process-level policy around Start(): SIGINT/SIGTERM stop the server, unsupported transports
//          and failures are logged, and Shutdown() always runs.
// Returns:
//   0 on normal exit or interrupt; 1 on unsupported transport or failure.
//==========================================================================================================
int RunServer(DorisServer& server);

} // namespace dorismcp
