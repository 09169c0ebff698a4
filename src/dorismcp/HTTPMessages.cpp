//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HTTPMessages.cpp
// Purpose: HTTP reply builders and header helpers
//==========================================================================================================

#include <algorithm>
#include <cctype>

#include "dorismcp/HTTPMessages.h"

namespace dorismcp {

std::string_view RequestPath(const HttpRequest& req) {
    std::string_view target(req.target().data(), req.target().size());
    auto q = target.find('?');
    if (q != std::string_view::npos) {
        target = target.substr(0, q);
    }
    return target;
}

bool HeaderContains(std::string_view headerValue, std::string_view token) {
    auto it = std::search(headerValue.begin(), headerValue.end(), token.begin(), token.end(),
                          [](char a, char b) {
                              return std::tolower(static_cast<unsigned char>(a)) ==
                                     std::tolower(static_cast<unsigned char>(b));
                          });
    return it != headerValue.end();
}

HttpReply MakeTextReply(http::status status, const std::string& text, unsigned version) {
    HttpReply reply;
    reply.response = HttpResponse{status, version};
    reply.response.set(http::field::content_type, "text/plain; charset=utf-8");
    reply.response.body() = text;
    reply.response.prepare_payload();
    return reply;
}

HttpReply MakeJsonReply(http::status status, const JSONValue& body, unsigned version) {
    HttpReply reply;
    reply.response = HttpResponse{status, version};
    reply.response.set(http::field::content_type, "application/json");
    reply.response.body() = SerializeJSON(body);
    reply.response.prepare_payload();
    return reply;
}

HttpReply MakeRpcErrorReply(http::status status, int code, const std::string& message, unsigned version) {
    JSONRPCId id = std::string("server-error");
    return MakeJsonReply(status, CreateErrorResponse(id, code, message)->ToJSON(), version);
}

} // namespace dorismcp
