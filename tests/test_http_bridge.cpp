//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_http_bridge.cpp
// Purpose: Tests for HTTP path routing, the Accept compatibility rewrite, and the health endpoint
//==========================================================================================================

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "dorismcp/HTTPBridge.h"

using namespace dorismcp;

namespace {

HttpRequest makeRequest(http::verb verb, const std::string& target, const std::string& accept = "") {
    HttpRequest req{verb, target, 11};
    if (!accept.empty()) {
        req.set(http::field::accept, accept);
    }
    return req;
}

} // namespace

TEST(HTTPBridgeRouting, ClassifiesPaths) {
    EXPECT_EQ(ClassifyPath("/health"), Route::Health);
    EXPECT_EQ(ClassifyPath("/health?x=1"), Route::Health);
    EXPECT_EQ(ClassifyPath("/mcp"), Route::Mcp);
    EXPECT_EQ(ClassifyPath("/mcp/"), Route::Mcp);
    EXPECT_EQ(ClassifyPath("/mcp/session"), Route::Mcp);
    EXPECT_EQ(ClassifyPath("/mcpx"), Route::NotFound);
    EXPECT_EQ(ClassifyPath("/"), Route::NotFound);
}

TEST(HTTPBridgeRouting, AcceptRewriteAppliesToCopyOnly) {
    HttpRequest req = makeRequest(http::verb::get, "/mcp", "text/event-stream");
    ASSERT_TRUE(NeedsAcceptCompatibility(req));
    HttpRequest rewritten = ApplyAcceptCompatibility(req);
    EXPECT_EQ(std::string(rewritten[http::field::accept]), "text/event-stream, application/json");
    EXPECT_EQ(std::string(req[http::field::accept]), "text/event-stream");
}

TEST(HTTPBridgeRouting, NoRewriteWhenJsonAlreadyAcceptedOrNotGet) {
    EXPECT_FALSE(NeedsAcceptCompatibility(makeRequest(http::verb::get, "/mcp", "application/json, text/event-stream")));
    EXPECT_FALSE(NeedsAcceptCompatibility(makeRequest(http::verb::post, "/mcp", "text/event-stream")));
    EXPECT_FALSE(NeedsAcceptCompatibility(makeRequest(http::verb::get, "/mcp")));
}

TEST(HTTPBridgeHandle, ForwardsMcpWithRewrittenAccept) {
    std::string seenAccept;
    HTTPBridge bridge([&seenAccept](const HttpRequest& req) {
        seenAccept = std::string(req[http::field::accept]);
        return MakeTextReply(http::status::ok, "forwarded", req.version());
    });
    HttpReply reply = bridge.Handle(makeRequest(http::verb::get, "/mcp", "text/event-stream"));
    EXPECT_EQ(reply.response.result(), http::status::ok);
    EXPECT_EQ(reply.response.body(), "forwarded");
    EXPECT_EQ(seenAccept, "text/event-stream, application/json");
}

TEST(HTTPBridgeHandle, ForwardsAcceptUnchangedWhenJsonAlreadyListed) {
    std::string seenAccept;
    HTTPBridge bridge([&seenAccept](const HttpRequest& req) {
        seenAccept = std::string(req[http::field::accept]);
        return MakeTextReply(http::status::ok, "forwarded", req.version());
    });
    HttpReply reply = bridge.Handle(makeRequest(http::verb::get, "/mcp", "text/event-stream, application/json"));
    EXPECT_EQ(reply.response.result(), http::status::ok);
    EXPECT_EQ(seenAccept, "text/event-stream, application/json");
}

TEST(HTTPBridgeHandle, UnknownPathIsNotFound) {
    bool forwarded = false;
    HTTPBridge bridge([&forwarded](const HttpRequest& req) {
        forwarded = true;
        return MakeTextReply(http::status::ok, "", req.version());
    });
    HttpReply reply = bridge.Handle(makeRequest(http::verb::get, "/nope"));
    EXPECT_EQ(reply.response.result(), http::status::not_found);
    EXPECT_EQ(reply.response.body(), "Not Found");
    EXPECT_FALSE(forwarded);
}

TEST(HTTPBridgeHandle, ForwarderFailureBecomesInternalServerError) {
    HTTPBridge bridge([](const HttpRequest&) -> HttpReply { throw std::runtime_error("session manager exploded"); });
    HttpReply reply = bridge.Handle(makeRequest(http::verb::post, "/mcp", "application/json"));
    EXPECT_EQ(reply.response.result(), http::status::internal_server_error);
    EXPECT_EQ(reply.response.body(), "Internal Server Error");
}

TEST(HTTPBridgeHandle, HealthReportsStatus) {
    HTTPBridge bridge([](const HttpRequest& req) { return MakeTextReply(http::status::ok, "", req.version()); });
    HttpReply reply = bridge.Handle(makeRequest(http::verb::get, "/health"));
    EXPECT_EQ(reply.response.result(), http::status::ok);
    EXPECT_EQ(std::string(reply.response[http::field::content_type]), "application/json");
    JSONValue expected = ParseJSON(R"({"status":"healthy","service":"doris-mcp-server"})");
    EXPECT_EQ(ParseJSON(reply.response.body()), expected);

    HttpReply post = bridge.Handle(makeRequest(http::verb::post, "/health"));
    EXPECT_EQ(post.response.result(), http::status::method_not_allowed);
    EXPECT_EQ(std::string(post.response[http::field::allow]), "GET");
}
