//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HTTPBridge.cpp
// Purpose: Path routing in front of the MCP session manager
//==========================================================================================================

#include "dorismcp/HTTPBridge.h"
#include "dorismcp/errors/Errors.h"
#include "logging/Logger.h"

namespace dorismcp {

namespace {
constexpr std::string_view HealthPath = "/health";
constexpr std::string_view McpPath = "/mcp";
}

Route ClassifyPath(std::string_view target) {
    auto q = target.find('?');
    if (q != std::string_view::npos) {
        target = target.substr(0, q);
    }
    if (target == HealthPath) {
        return Route::Health;
    }
    if (target == McpPath || (target.size() > McpPath.size() && target.substr(0, McpPath.size()) == McpPath &&
                              target[McpPath.size()] == '/')) {
        return Route::Mcp;
    }
    return Route::NotFound;
}

bool NeedsAcceptCompatibility(const HttpRequest& req) {
    if (req.method() != http::verb::get) {
        return false;
    }
    auto it = req.find(http::field::accept);
    if (it == req.end()) {
        return false;
    }
    std::string_view accept(it->value().data(), it->value().size());
    return HeaderContains(accept, "text/event-stream") && !HeaderContains(accept, "application/json");
}

HttpRequest ApplyAcceptCompatibility(const HttpRequest& req) {
    HttpRequest copy = req;
    std::string accept(req[http::field::accept]);
    copy.set(http::field::accept, accept + ", application/json");
    return copy;
}

HTTPBridge::HTTPBridge(Forwarder forwarder) : forwarder(std::move(forwarder)) {}

HttpReply HTTPBridge::forward(const HttpRequest& req) const {
    if (NeedsAcceptCompatibility(req)) {
        HttpRequest rewritten = ApplyAcceptCompatibility(req);
        LOG_DEBUG("Added application/json to Accept header: {}", std::string(rewritten[http::field::accept]));
        return forwarder(rewritten);
    }
    return forwarder(req);
}

HttpReply HTTPBridge::Handle(const HttpRequest& req) const {
    const std::string path(RequestPath(req));
    LOG_DEBUG("HTTP {} {}", std::string(req.method_string()), path);
    for (const auto& field : req) {
        LOG_DEBUG("  {}: {}", std::string(field.name_string()), std::string(field.value()));
    }

    switch (ClassifyPath(path)) {
        case Route::Health: {
            if (req.method() != http::verb::get) {
                HttpReply reply = MakeTextReply(http::status::method_not_allowed, "Method Not Allowed", req.version());
                reply.response.set(http::field::allow, "GET");
                return reply;
            }
            return MakeJsonReply(http::status::ok,
                                 MakeObject({{"status", JSONValue(std::string("healthy"))},
                                             {"service", JSONValue(std::string("doris-mcp-server"))}}),
                                 req.version());
        }
        case Route::Mcp:
            try {
                return forward(req);
            } catch (...) {
                errors::LogFailureDetail(std::string("Error handling MCP request ") + path, std::current_exception());
                return MakeTextReply(http::status::internal_server_error, "Internal Server Error", req.version());
            }
        case Route::NotFound:
            break;
    }
    LOG_DEBUG("No route for {}", path);
    return MakeTextReply(http::status::not_found, "Not Found", req.version());
}

} // namespace dorismcp
