//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HTTPMessages.h
// Purpose: HTTP request/response types shared by the listener, bridge, and session manager
//==========================================================================================================

#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <string_view>

#include <boost/beast/http.hpp>

#include "dorismcp/JSONRPCTypes.h"

namespace dorismcp {

namespace http = boost::beast::http;

using HttpRequest = http::request<http::string_body>;
using HttpResponse = http::response<http::string_body>;

//==========================================================================================================
// EventStream
// Purpose: Handle for a session's standalone server-to-client event stream. The listener keeps the
//          connection open (sending keepalive comments) while IsOpen() holds; either side may Close().
//==========================================================================================================
class EventStream {
public:
    explicit EventStream(std::string sessionId) : sessionId(std::move(sessionId)) {}

    const std::string& SessionId() const { return sessionId; }
    bool IsOpen() const { return open.load(); }
    void Close() { open.store(false); }

private:
    std::string sessionId;
    std::atomic<bool> open{true};
};

// A rendered response, plus the event stream to hold open when the response starts one.
struct HttpReply {
    HttpResponse response;
    std::shared_ptr<EventStream> eventStream;
};

// Header names used by the streamable HTTP transport
namespace Headers {
    inline constexpr const char* SessionId = "mcp-session-id";
    inline constexpr const char* ProtocolVersion = "mcp-protocol-version";
}

// Request path without the query string
std::string_view RequestPath(const HttpRequest& req);

// Case-insensitive substring test on a header value
bool HeaderContains(std::string_view headerValue, std::string_view token);

HttpReply MakeTextReply(http::status status, const std::string& text, unsigned version = 11);
HttpReply MakeJsonReply(http::status status, const JSONValue& body, unsigned version = 11);

// JSON-RPC error body with id "server-error", used for transport-level rejections
HttpReply MakeRpcErrorReply(http::status status, int code, const std::string& message, unsigned version = 11);

} // namespace dorismcp
