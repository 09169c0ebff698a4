//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerSession.cpp
// Purpose: JSON-RPC request routing and initialization state for one peer
//==========================================================================================================

#include <format>
#include <mutex>

#include "dorismcp/ServerSession.h"
#include "dorismcp/errors/Errors.h"
#include "logging/Logger.h"

namespace dorismcp {

class ServerSession::Impl {
public:
    OperationDispatcher& dispatcher;
    InitializationOptions options;

    mutable std::mutex stateMutex;
    State state{State::Fresh};
    std::optional<std::string> protocolVersion;
    std::optional<Implementation> clientInfo;

    std::mutex requestMutex;

    Impl(OperationDispatcher& d, InitializationOptions o) : dispatcher(d), options(std::move(o)) {}

    State currentState() const {
        std::lock_guard<std::mutex> lock(stateMutex);
        return state;
    }

    JSONValue handleInitialize(const JSONRPCRequest& request) {
        LOG_INFO("Handling initialize request");
        std::optional<std::string> requested;
        if (request.params.has_value()) {
            requested = GetStringMember(request.params.value(), "protocolVersion");
            if (const JSONValue* info = FindMember(request.params.value(), "clientInfo")) {
                Implementation impl;
                impl.name = GetStringMember(*info, "name").value_or("");
                impl.version = GetStringMember(*info, "version").value_or("");
                LOG_INFO("Client: {} {}", impl.name, impl.version);
                std::lock_guard<std::mutex> lock(stateMutex);
                clientInfo = impl;
            }
        }
        const std::string negotiated = NegotiateProtocolVersion(requested);
        if (requested.has_value() && requested.value() != negotiated) {
            LOG_WARN("Client requested unsupported protocol version {}; offering {}", requested.value(), negotiated);
        }
        {
            std::lock_guard<std::mutex> lock(stateMutex);
            protocolVersion = negotiated;
            if (state == State::Fresh) state = State::Initializing;
        }
        return MakeInitializeResult(options, negotiated);
    }

    JSONValue handleRequest(const JSONRPCRequest& request) {
        LOG_DEBUG("Received request: {} id={}", request.method, IdToString(request.id));
        try {
            if (request.method == Methods::Initialize) {
                return JSONRPCResponse(request.id, handleInitialize(request)).ToJSON();
            }
            if (request.method == Methods::Ping) {
                return JSONRPCResponse(request.id, JSONValue(JSONValue::Object{})).ToJSON();
            }
            if (currentState() == State::Fresh) {
                LOG_WARN("Rejecting {} received before initialization", request.method);
                return errors::makeErrorResponse(request.id, errors::McpError{
                    JSONRPCErrorCodes::InvalidRequest,
                    "Received request before initialization was complete", std::nullopt})->ToJSON();
            }
            if (!dispatcher.Handles(request.method)) {
                LOG_WARN("Unknown method: {}", request.method);
                return CreateErrorResponse(request.id, JSONRPCErrorCodes::MethodNotFound,
                                           std::format("Method not found: {}", request.method))->ToJSON();
            }
            JSONValue result = dispatcher.Dispatch(request.method, request.params);
            return JSONRPCResponse(request.id, std::move(result)).ToJSON();
        } catch (const errors::ProtocolError& e) {
            LOG_WARN("{} rejected: {}", request.method, e.what());
            return errors::makeErrorResponse(request.id, e.Error())->ToJSON();
        } catch (const std::exception& e) {
            LOG_ERROR("{} failed: {}", request.method, e.what());
            return CreateErrorResponse(request.id, JSONRPCErrorCodes::InternalError, e.what())->ToJSON();
        }
    }

    void handleNotification(const JSONRPCNotification& notification) {
        LOG_DEBUG("Received notification: {}", notification.method);
        if (notification.method == Methods::Initialized) {
            std::lock_guard<std::mutex> lock(stateMutex);
            state = State::Initialized;
            LOG_INFO("MCP session initialized by client");
        } else if (notification.method == Methods::Cancelled) {
            LOG_DEBUG("Cancellation notification ignored; requests run to completion");
        } else if (notification.method == Methods::Progress) {
            LOG_DEBUG("Progress update received");
        } else {
            LOG_WARN("Unknown notification method: {}", notification.method);
        }
    }

    // Single (non-batch) message
    std::optional<JSONValue> handleOne(const JSONValue& message) {
        switch (ClassifyMessage(message)) {
            case MessageKind::Request: {
                JSONRPCRequest request;
                if (!request.FromJSON(message)) break;
                return handleRequest(request);
            }
            case MessageKind::Notification: {
                JSONRPCNotification notification;
                if (!notification.FromJSON(message)) break;
                handleNotification(notification);
                return std::nullopt;
            }
            case MessageKind::Response:
                LOG_DEBUG("Ignoring client response message");
                return std::nullopt;
            case MessageKind::Invalid:
                break;
        }
        LOG_WARN("Invalid JSON-RPC message");
        JSONRPCId id = nullptr;
        if (const JSONValue* idVal = FindMember(message, "id")) {
            if (std::holds_alternative<std::string>(idVal->value)) id = std::get<std::string>(idVal->value);
            else if (std::holds_alternative<int64_t>(idVal->value)) id = std::get<int64_t>(idVal->value);
        }
        return CreateErrorResponse(id, JSONRPCErrorCodes::InvalidRequest, "Invalid Request")->ToJSON();
    }
};

ServerSession::ServerSession(OperationDispatcher& dispatcher, InitializationOptions options)
    : pImpl(std::make_unique<Impl>(dispatcher, std::move(options))) {}

ServerSession::~ServerSession() = default;

std::optional<JSONValue> ServerSession::HandleMessage(const JSONValue& message) {
    std::lock_guard<std::mutex> lock(pImpl->requestMutex);
    if (!message.isArray()) {
        return pImpl->handleOne(message);
    }
    const auto& batch = std::get<JSONValue::Array>(message.value);
    if (batch.empty()) {
        return CreateErrorResponse(nullptr, JSONRPCErrorCodes::InvalidRequest, "Empty batch")->ToJSON();
    }
    JSONValue::Array replies;
    for (const auto& item : batch) {
        const JSONValue nullValue;
        auto reply = pImpl->handleOne(item ? *item : nullValue);
        if (reply.has_value()) {
            replies.push_back(std::make_shared<JSONValue>(std::move(reply.value())));
        }
    }
    if (replies.empty()) return std::nullopt;
    return JSONValue(std::move(replies));
}

std::optional<std::string> ServerSession::HandleText(const std::string& text) {
    JSONValue message;
    try {
        message = ParseJSON(text);
    } catch (const JSONParseError& e) {
        LOG_WARN("Parse error on inbound message: {}", e.what());
        return CreateErrorResponse(nullptr, JSONRPCErrorCodes::ParseError, "Parse error")->Serialize();
    }
    auto reply = HandleMessage(message);
    if (!reply.has_value()) return std::nullopt;
    return SerializeJSON(reply.value());
}

void ServerSession::MarkInitialized(const std::string& protocolVersion) {
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    pImpl->state = State::Initialized;
    pImpl->protocolVersion = protocolVersion;
}

ServerSession::State ServerSession::GetState() const {
    return pImpl->currentState();
}

std::optional<std::string> ServerSession::GetProtocolVersion() const {
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    return pImpl->protocolVersion;
}

std::optional<Implementation> ServerSession::GetClientInfo() const {
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    return pImpl->clientInfo;
}

} // namespace dorismcp
