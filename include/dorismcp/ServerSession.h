//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerSession.h
// Purpose: Per-peer MCP protocol state: initialize handshake, ping, batches, and operation routing
//==========================================================================================================

#pragma once

#include <memory>
#include <optional>
#include <string>

#include "dorismcp/JSONRPCTypes.h"
#include "dorismcp/OperationDispatcher.h"
#include "dorismcp/Protocol.h"

namespace dorismcp {

class ServerSession {
public:
    enum class State {
        Fresh,          // no initialize received yet
        Initializing,   // initialize answered, waiting for notifications/initialized
        Initialized
    };

    //==========================================================================================================
    // Constructs a session over a shared dispatcher.
    // Args:
    //   dispatcher: Operation dispatcher; must outlive the session.
    //   options: Initialization descriptor returned from initialize.
    //==========================================================================================================
    ServerSession(OperationDispatcher& dispatcher, InitializationOptions options);
    ~ServerSession();

    ServerSession(const ServerSession&) = delete;
    ServerSession& operator=(const ServerSession&) = delete;

    //==========================================================================================================
    // HandleMessage
    // Purpose: Process one inbound JSON-RPC message or batch.
    // Returns:
    //   Response object, array of responses for a batch, or std::nullopt when nothing is to be sent
    //   (notifications, client responses, batches without requests).
    // Notes:
    //   Requests are processed one at a time in call order.
    //==========================================================================================================
    std::optional<JSONValue> HandleMessage(const JSONValue& message);

    //==========================================================================================================
    // HandleText
    // Purpose: Parse and process one serialized message. Unparseable text yields a ParseError response
    //          with a null id.
    // Returns:
    //   Serialized reply, or std::nullopt when nothing is to be sent.
    //==========================================================================================================
    std::optional<std::string> HandleText(const std::string& text);

    // Skip the handshake (stateless HTTP exchanges).
    void MarkInitialized(const std::string& protocolVersion);

    State GetState() const;
    std::optional<std::string> GetProtocolVersion() const;
    std::optional<Implementation> GetClientInfo() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace dorismcp
