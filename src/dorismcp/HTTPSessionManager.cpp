//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HTTPSessionManager.cpp
// Purpose: Streamable HTTP session table (JSON response mode)
//==========================================================================================================

#include <algorithm>
#include <format>
#include <map>
#include <mutex>
#include <stdexcept>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include "dorismcp/HTTPSessionManager.h"
#include "dorismcp/ServerSession.h"
#include "logging/Logger.h"

namespace dorismcp {

namespace {

struct SessionEntry {
    std::string id;
    std::unique_ptr<ServerSession> session;
    std::shared_ptr<EventStream> stream;
};

bool isInitializeRequest(const JSONValue& message) {
    return ClassifyMessage(message) == MessageKind::Request &&
           GetStringMember(message, "method").value_or("") == Methods::Initialize;
}

std::string headerValue(const HttpRequest& req, const char* name) {
    auto it = req.find(name);
    if (it == req.end()) return std::string();
    return std::string(it->value());
}

} // namespace

class HTTPSessionManager::Impl {
public:
    OperationDispatcher& dispatcher;
    OptionsFactory makeOptions;
    HttpSessionOptions options;

    mutable std::mutex sessionsMutex;
    bool running{false};
    std::map<std::string, std::shared_ptr<SessionEntry>> sessions;
    boost::uuids::random_generator uuidGenerator;

    Impl(OperationDispatcher& d, OptionsFactory f, HttpSessionOptions o)
        : dispatcher(d), makeOptions(std::move(f)), options(o) {}

    std::string newSessionId() {
        std::string id = boost::uuids::to_string(uuidGenerator());
        id.erase(std::remove(id.begin(), id.end(), '-'), id.end());
        return id;
    }

    std::shared_ptr<SessionEntry> findSession(const std::string& id) const {
        std::lock_guard<std::mutex> lock(sessionsMutex);
        auto it = sessions.find(id);
        return it == sessions.end() ? nullptr : it->second;
    }

    void terminateAll() {
        std::map<std::string, std::shared_ptr<SessionEntry>> closing;
        {
            std::lock_guard<std::mutex> lock(sessionsMutex);
            running = false;
            closing.swap(sessions);
        }
        for (auto& [id, entry] : closing) {
            if (entry->stream) entry->stream->Close();
        }
        if (!closing.empty()) {
            LOG_INFO("Terminated {} HTTP session(s)", closing.size());
        }
    }

    // 400 when the client names a protocol version this server does not speak
    std::optional<HttpReply> checkProtocolVersion(const HttpRequest& req) const {
        const std::string version = headerValue(req, Headers::ProtocolVersion);
        if (!version.empty() && !IsSupportedProtocolVersion(version)) {
            LOG_WARN("Rejecting unsupported protocol version header: {}", version);
            return MakeRpcErrorReply(http::status::bad_request, JSONRPCErrorCodes::InvalidRequest,
                                     std::format("Bad Request: Unsupported protocol version: {}", version),
                                     req.version());
        }
        return std::nullopt;
    }

    // Resolve the session named by the request header: 400 when missing, 404 when unknown
    std::shared_ptr<SessionEntry> requireSession(const HttpRequest& req, std::optional<HttpReply>& rejection) const {
        const std::string id = headerValue(req, Headers::SessionId);
        if (id.empty()) {
            rejection = MakeRpcErrorReply(http::status::bad_request, JSONRPCErrorCodes::InvalidRequest,
                                          "Bad Request: Missing session ID", req.version());
            return nullptr;
        }
        auto entry = findSession(id);
        if (!entry) {
            LOG_DEBUG("Unknown session id {}", id);
            rejection = MakeRpcErrorReply(http::status::not_found, JSONRPCErrorCodes::InvalidRequest,
                                          "Session not found", req.version());
            return nullptr;
        }
        return entry;
    }

    HttpReply renderResult(const HttpRequest& req, const std::optional<JSONValue>& result, const std::string& sessionId) {
        HttpReply reply;
        if (result.has_value()) {
            reply = MakeJsonReply(http::status::ok, result.value(), req.version());
        } else {
            reply.response = HttpResponse{http::status::accepted, req.version()};
            reply.response.prepare_payload();
        }
        if (!sessionId.empty()) {
            reply.response.set(Headers::SessionId, sessionId);
        }
        return reply;
    }

    HttpReply handlePost(const HttpRequest& req) {
        const std::string accept = headerValue(req, "accept");
        if (!HeaderContains(accept, "application/json") && !HeaderContains(accept, "*/*")) {
            return MakeRpcErrorReply(http::status::not_acceptable, JSONRPCErrorCodes::InvalidRequest,
                                     "Not Acceptable: Client must accept application/json", req.version());
        }
        const std::string contentType = headerValue(req, "content-type");
        if (!HeaderContains(contentType, "application/json")) {
            return MakeRpcErrorReply(http::status::unsupported_media_type, JSONRPCErrorCodes::InvalidRequest,
                                     "Unsupported Media Type: Content-Type must be application/json", req.version());
        }

        JSONValue message;
        try {
            message = ParseJSON(req.body());
        } catch (const JSONParseError& e) {
            LOG_WARN("Rejecting unparseable POST body: {}", e.what());
            return MakeRpcErrorReply(http::status::bad_request, JSONRPCErrorCodes::ParseError,
                                     std::format("Parse error: {}", e.what()), req.version());
        }
        if (!message.isArray() && ClassifyMessage(message) == MessageKind::Invalid) {
            return MakeRpcErrorReply(http::status::bad_request, JSONRPCErrorCodes::InvalidParams,
                                     "Validation error: body is not a JSON-RPC message", req.version());
        }

        if (options.stateless) {
            if (auto rejected = checkProtocolVersion(req)) return std::move(rejected.value());
            ServerSession session(dispatcher, makeOptions());
            if (!isInitializeRequest(message)) {
                std::string version = headerValue(req, Headers::ProtocolVersion);
                session.MarkInitialized(version.empty() ? DEFAULT_NEGOTIATED_VERSION : version);
            }
            return renderResult(req, session.HandleMessage(message), std::string());
        }

        std::shared_ptr<SessionEntry> entry;
        const std::string requestedId = headerValue(req, Headers::SessionId);
        if (requestedId.empty() && isInitializeRequest(message)) {
            entry = std::make_shared<SessionEntry>();
            entry->session = std::make_unique<ServerSession>(dispatcher, makeOptions());
            std::lock_guard<std::mutex> lock(sessionsMutex);
            // The run scope may have closed while the session was being built
            if (!running) {
                throw std::logic_error("HTTPSessionManager: request received outside of Run() scope");
            }
            entry->id = newSessionId();
            sessions.emplace(entry->id, entry);
            LOG_INFO("Created HTTP session {}", entry->id);
        } else {
            std::optional<HttpReply> rejection;
            entry = requireSession(req, rejection);
            if (!entry) return std::move(rejection.value());
            if (!isInitializeRequest(message)) {
                if (auto rejected = checkProtocolVersion(req)) return std::move(rejected.value());
            }
        }
        return renderResult(req, entry->session->HandleMessage(message), entry->id);
    }

    HttpReply handleGet(const HttpRequest& req) {
        if (!HeaderContains(headerValue(req, "accept"), "text/event-stream")) {
            return MakeRpcErrorReply(http::status::not_acceptable, JSONRPCErrorCodes::InvalidRequest,
                                     "Not Acceptable: Client must accept text/event-stream", req.version());
        }
        std::optional<HttpReply> rejection;
        auto entry = requireSession(req, rejection);
        if (!entry) return std::move(rejection.value());
        if (auto rejected = checkProtocolVersion(req)) return std::move(rejected.value());

        std::shared_ptr<EventStream> stream;
        {
            std::lock_guard<std::mutex> lock(sessionsMutex);
            // A stream attached to a session that already left the table would never be closed
            if (!running) {
                throw std::logic_error("HTTPSessionManager: request received outside of Run() scope");
            }
            if (sessions.find(entry->id) == sessions.end()) {
                return MakeRpcErrorReply(http::status::not_found, JSONRPCErrorCodes::InvalidRequest,
                                         "Session not found", req.version());
            }
            if (entry->stream && entry->stream->IsOpen()) {
                return MakeRpcErrorReply(http::status::conflict, JSONRPCErrorCodes::InvalidRequest,
                                         "Conflict: Only one SSE stream is allowed per session", req.version());
            }
            entry->stream = std::make_shared<EventStream>(entry->id);
            stream = entry->stream;
        }
        LOG_INFO("Opened event stream for session {}", entry->id);

        HttpReply reply;
        reply.response = HttpResponse{http::status::ok, req.version()};
        reply.response.set(http::field::content_type, "text/event-stream");
        reply.response.set(http::field::cache_control, "no-cache, no-transform");
        reply.response.set(Headers::SessionId, entry->id);
        reply.eventStream = std::move(stream);
        return reply;
    }

    HttpReply handleDelete(const HttpRequest& req) {
        std::optional<HttpReply> rejection;
        auto entry = requireSession(req, rejection);
        if (!entry) return std::move(rejection.value());
        if (auto rejected = checkProtocolVersion(req)) return std::move(rejected.value());
        {
            std::lock_guard<std::mutex> lock(sessionsMutex);
            sessions.erase(entry->id);
            if (entry->stream) entry->stream->Close();
        }
        LOG_INFO("Terminated HTTP session {}", entry->id);
        HttpReply reply;
        reply.response = HttpResponse{http::status::ok, req.version()};
        reply.response.prepare_payload();
        return reply;
    }

    HttpReply methodNotAllowed(const HttpRequest& req, const char* allow) {
        HttpReply reply = MakeRpcErrorReply(http::status::method_not_allowed, JSONRPCErrorCodes::InvalidRequest,
                                            "Method Not Allowed", req.version());
        reply.response.set(http::field::allow, allow);
        return reply;
    }
};

HTTPSessionManager::RunScope::RunScope(RunScope&& other) noexcept : owner(other.owner) {
    other.owner = nullptr;
}

HTTPSessionManager::RunScope::~RunScope() {
    if (owner) {
        owner->pImpl->terminateAll();
        LOG_INFO("HTTP session manager stopped");
    }
}

HTTPSessionManager::HTTPSessionManager(OperationDispatcher& dispatcher, OptionsFactory makeOptions,
                                       HttpSessionOptions options)
    : pImpl(std::make_unique<Impl>(dispatcher, std::move(makeOptions), options)) {}

HTTPSessionManager::~HTTPSessionManager() = default;

HTTPSessionManager::RunScope HTTPSessionManager::Run() {
    {
        std::lock_guard<std::mutex> lock(pImpl->sessionsMutex);
        if (pImpl->running) {
            throw std::logic_error("HTTPSessionManager: Run() scope already active");
        }
        pImpl->running = true;
    }
    LOG_INFO("HTTP session manager started ({} mode)", pImpl->options.stateless ? "stateless" : "stateful");
    return RunScope(this);
}

HttpReply HTTPSessionManager::HandleRequest(const HttpRequest& req) {
    if (!IsRunning()) {
        throw std::logic_error("HTTPSessionManager: request received outside of Run() scope");
    }
    const bool stateless = pImpl->options.stateless;
    switch (req.method()) {
        case http::verb::post:
            return pImpl->handlePost(req);
        case http::verb::get:
            if (stateless) return pImpl->methodNotAllowed(req, "POST");
            return pImpl->handleGet(req);
        case http::verb::delete_:
            if (stateless) return pImpl->methodNotAllowed(req, "POST");
            return pImpl->handleDelete(req);
        default:
            break;
    }
    return pImpl->methodNotAllowed(req, stateless ? "POST" : "GET, POST, DELETE");
}

bool HTTPSessionManager::IsRunning() const {
    std::lock_guard<std::mutex> lock(pImpl->sessionsMutex);
    return pImpl->running;
}

std::size_t HTTPSessionManager::SessionCount() const {
    std::lock_guard<std::mutex> lock(pImpl->sessionsMutex);
    return pImpl->sessions.size();
}

} // namespace dorismcp
