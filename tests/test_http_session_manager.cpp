//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_http_session_manager.cpp
// Purpose: Tests for the streamable HTTP session table (POST/GET/DELETE, headers, stateless mode)
//==========================================================================================================

#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "dorismcp/HTTPSessionManager.h"
#include "FakeCollaborators.h"

using namespace dorismcp;

namespace {

const char* InitializeBody =
    R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2025-03-26","capabilities":{},"clientInfo":{"name":"t","version":"1"}}})";

InitializationOptions testOptions() {
    InitializationOptions options;
    options.serverName = "doris-mcp-server";
    options.serverVersion = "0.3.0";
    options.capabilities = MakeServerCapabilities(NotificationOptions{}, {});
    return options;
}

HttpRequest post(const std::string& body, const std::string& sessionId = "") {
    HttpRequest req{http::verb::post, "/mcp", 11};
    req.set(http::field::accept, "application/json, text/event-stream");
    req.set(http::field::content_type, "application/json");
    if (!sessionId.empty()) req.set(Headers::SessionId, sessionId);
    req.body() = body;
    req.prepare_payload();
    return req;
}

HttpRequest get(const std::string& sessionId) {
    HttpRequest req{http::verb::get, "/mcp", 11};
    req.set(http::field::accept, "text/event-stream, application/json");
    if (!sessionId.empty()) req.set(Headers::SessionId, sessionId);
    return req;
}

HttpRequest del(const std::string& sessionId) {
    HttpRequest req{http::verb::delete_, "/mcp", 11};
    if (!sessionId.empty()) req.set(Headers::SessionId, sessionId);
    return req;
}

int errorCode(const HttpReply& reply) {
    JSONValue body = ParseJSON(reply.response.body());
    const JSONValue* error = FindMember(body, "error");
    if (error == nullptr) return 0;
    const JSONValue* code = FindMember(*error, "code");
    if (code == nullptr || !std::holds_alternative<int64_t>(code->value)) return 0;
    return static_cast<int>(std::get<int64_t>(code->value));
}

class SessionManagerFixture : public ::testing::Test {
protected:
    fakes::FakeComponents parts;
    OperationDispatcher dispatcher{parts.resources, parts.tools, parts.prompts};

    std::unique_ptr<HTTPSessionManager> makeManager(bool stateless = false) {
        HttpSessionOptions options;
        options.stateless = stateless;
        return std::make_unique<HTTPSessionManager>(dispatcher, testOptions, options);
    }

    std::string openSession(HTTPSessionManager& manager) {
        HttpReply reply = manager.HandleRequest(post(InitializeBody));
        EXPECT_EQ(reply.response.result(), http::status::ok);
        std::string id(reply.response[Headers::SessionId]);
        EXPECT_FALSE(id.empty());
        HttpReply ack = manager.HandleRequest(post(R"({"jsonrpc":"2.0","method":"notifications/initialized"})", id));
        EXPECT_EQ(ack.response.result(), http::status::accepted);
        return id;
    }
};

} // namespace

TEST_F(SessionManagerFixture, RequestOutsideRunScopeThrows) {
    auto manager = makeManager();
    EXPECT_FALSE(manager->IsRunning());
    EXPECT_THROW(manager->HandleRequest(post(InitializeBody)), std::logic_error);
}

TEST_F(SessionManagerFixture, RunScopeIsExclusiveAndTerminatesSessions) {
    auto manager = makeManager();
    {
        auto scope = manager->Run();
        EXPECT_TRUE(manager->IsRunning());
        EXPECT_THROW(manager->Run(), std::logic_error);
        openSession(*manager);
        EXPECT_EQ(manager->SessionCount(), 1u);
    }
    EXPECT_FALSE(manager->IsRunning());
    EXPECT_EQ(manager->SessionCount(), 0u);
    auto again = manager->Run();
    EXPECT_TRUE(manager->IsRunning());
}

TEST_F(SessionManagerFixture, InitializeRacingScopeTeardownLeavesNoSession) {
    // The options factory runs while the new session is being built; closing the scope there
    // reproduces a teardown that lands between the scope check and the table insert.
    std::optional<HTTPSessionManager::RunScope> scope;
    auto closeScopeThenBuild = [&scope]() {
        scope.reset();
        return testOptions();
    };
    HTTPSessionManager manager(dispatcher, closeScopeThenBuild);
    scope.emplace(manager.Run());

    EXPECT_THROW(manager.HandleRequest(post(InitializeBody)), std::logic_error);
    EXPECT_FALSE(manager.IsRunning());
    EXPECT_EQ(manager.SessionCount(), 0u);
    scope.reset();
}

TEST_F(SessionManagerFixture, InitializeCreatesSessionAndRoutesFollowUps) {
    auto manager = makeManager();
    auto scope = manager->Run();
    parts.tools->tools = {Tool("get_server_info", "info")};

    std::string id = openSession(*manager);
    EXPECT_EQ(id.size(), 32u);
    EXPECT_EQ(id.find('-'), std::string::npos);

    HttpReply reply = manager->HandleRequest(post(R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})", id));
    EXPECT_EQ(reply.response.result(), http::status::ok);
    EXPECT_EQ(std::string(reply.response[Headers::SessionId]), id);
    JSONValue body = ParseJSON(reply.response.body());
    const JSONValue* result = FindMember(body, "result");
    ASSERT_NE(result, nullptr);
    EXPECT_NE(FindMember(*result, "tools"), nullptr);
}

TEST_F(SessionManagerFixture, MissingAndUnknownSessionIds) {
    auto manager = makeManager();
    auto scope = manager->Run();
    HttpReply missing = manager->HandleRequest(post(R"({"jsonrpc":"2.0","id":2,"method":"ping"})"));
    EXPECT_EQ(missing.response.result(), http::status::bad_request);
    EXPECT_EQ(errorCode(missing), JSONRPCErrorCodes::InvalidRequest);

    HttpReply unknown = manager->HandleRequest(post(R"({"jsonrpc":"2.0","id":2,"method":"ping"})", "deadbeef"));
    EXPECT_EQ(unknown.response.result(), http::status::not_found);
}

TEST_F(SessionManagerFixture, DeleteEndsTheSession) {
    auto manager = makeManager();
    auto scope = manager->Run();
    std::string id = openSession(*manager);

    HttpReply deleted = manager->HandleRequest(del(id));
    EXPECT_EQ(deleted.response.result(), http::status::ok);
    EXPECT_EQ(manager->SessionCount(), 0u);

    HttpReply after = manager->HandleRequest(post(R"({"jsonrpc":"2.0","id":3,"method":"ping"})", id));
    EXPECT_EQ(after.response.result(), http::status::not_found);
}

TEST_F(SessionManagerFixture, PostHeaderAndBodyChecks) {
    auto manager = makeManager();
    auto scope = manager->Run();

    HttpRequest noAccept = post(InitializeBody);
    noAccept.set(http::field::accept, "text/html");
    EXPECT_EQ(manager->HandleRequest(noAccept).response.result(), http::status::not_acceptable);

    HttpRequest wrongType = post(InitializeBody);
    wrongType.set(http::field::content_type, "text/plain");
    EXPECT_EQ(manager->HandleRequest(wrongType).response.result(), http::status::unsupported_media_type);

    HttpReply parse = manager->HandleRequest(post("{nope"));
    EXPECT_EQ(parse.response.result(), http::status::bad_request);
    EXPECT_EQ(errorCode(parse), JSONRPCErrorCodes::ParseError);

    HttpReply invalid = manager->HandleRequest(post(R"({"hello":"world"})"));
    EXPECT_EQ(invalid.response.result(), http::status::bad_request);
    EXPECT_EQ(errorCode(invalid), JSONRPCErrorCodes::InvalidParams);
}

TEST_F(SessionManagerFixture, UnsupportedProtocolVersionHeaderIsRejected) {
    auto manager = makeManager();
    auto scope = manager->Run();
    std::string id = openSession(*manager);
    HttpRequest req = post(R"({"jsonrpc":"2.0","id":2,"method":"ping"})", id);
    req.set(Headers::ProtocolVersion, "1999-01-01");
    EXPECT_EQ(manager->HandleRequest(req).response.result(), http::status::bad_request);
}

TEST_F(SessionManagerFixture, EventStreamIsExclusivePerSession) {
    auto manager = makeManager();
    auto scope = manager->Run();
    std::string id = openSession(*manager);

    HttpRequest noAccept = get(id);
    noAccept.set(http::field::accept, "application/json");
    EXPECT_EQ(manager->HandleRequest(noAccept).response.result(), http::status::not_acceptable);

    HttpReply first = manager->HandleRequest(get(id));
    EXPECT_EQ(first.response.result(), http::status::ok);
    EXPECT_EQ(std::string(first.response[http::field::content_type]), "text/event-stream");
    ASSERT_NE(first.eventStream, nullptr);
    EXPECT_TRUE(first.eventStream->IsOpen());
    EXPECT_EQ(first.eventStream->SessionId(), id);

    EXPECT_EQ(manager->HandleRequest(get(id)).response.result(), http::status::conflict);

    first.eventStream->Close();
    HttpReply reopened = manager->HandleRequest(get(id));
    EXPECT_EQ(reopened.response.result(), http::status::ok);

    manager->HandleRequest(del(id));
    EXPECT_FALSE(reopened.eventStream->IsOpen());
}

TEST_F(SessionManagerFixture, UnsupportedMethodsAreRejected) {
    auto manager = makeManager();
    auto scope = manager->Run();
    HttpRequest put{http::verb::put, "/mcp", 11};
    HttpReply reply = manager->HandleRequest(put);
    EXPECT_EQ(reply.response.result(), http::status::method_not_allowed);
    EXPECT_EQ(std::string(reply.response[http::field::allow]), "GET, POST, DELETE");
}

TEST_F(SessionManagerFixture, StatelessModeServesWithoutSessions) {
    auto manager = makeManager(true);
    auto scope = manager->Run();

    HttpReply ping = manager->HandleRequest(post(R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})"));
    EXPECT_EQ(ping.response.result(), http::status::ok);
    EXPECT_EQ(ping.response.find(Headers::SessionId), ping.response.end());
    EXPECT_NE(FindMember(ParseJSON(ping.response.body()), "result"), nullptr);

    HttpReply init = manager->HandleRequest(post(InitializeBody));
    EXPECT_EQ(init.response.result(), http::status::ok);
    EXPECT_EQ(manager->SessionCount(), 0u);

    HttpReply getReply = manager->HandleRequest(get("abc"));
    EXPECT_EQ(getReply.response.result(), http::status::method_not_allowed);
    EXPECT_EQ(std::string(getReply.response[http::field::allow]), "POST");
    EXPECT_EQ(manager->HandleRequest(del("abc")).response.result(), http::status::method_not_allowed);
}
