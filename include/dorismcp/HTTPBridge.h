//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HTTPBridge.h
// Purpose: Path routing in front of the MCP session manager (health probe, MCP endpoint, 404)
//==========================================================================================================

#pragma once

#include <functional>
#include <string_view>

#include "dorismcp/HTTPMessages.h"

namespace dorismcp {

enum class Route {
    Health,     // "/health"
    Mcp,        // "/mcp" and "/mcp/..."
    NotFound
};

// Query strings are ignored.
Route ClassifyPath(std::string_view target);

// True for a GET that accepts text/event-stream but not application/json.
bool NeedsAcceptCompatibility(const HttpRequest& req);

// Copy of req whose Accept header also lists application/json; req is not modified.
HttpRequest ApplyAcceptCompatibility(const HttpRequest& req);

class HTTPBridge {
public:
    using Forwarder = std::function<HttpReply(const HttpRequest&)>;

    explicit HTTPBridge(Forwarder forwarder);

    //==========================================================================================================
    // Handle
    // Purpose: Route one request. Never throws: a failure in the forwarder becomes a 500 reply.
    //==========================================================================================================
    HttpReply Handle(const HttpRequest& req) const;

private:
    HttpReply forward(const HttpRequest& req) const;

    Forwarder forwarder;
};

} // namespace dorismcp
