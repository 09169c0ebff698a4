//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_server_session.cpp
// Purpose: Tests for the initialize handshake, ping, batches, and error replies of ServerSession
//==========================================================================================================

#include <gtest/gtest.h>

#include <string>

#include "dorismcp/ServerSession.h"
#include "FakeCollaborators.h"

using namespace dorismcp;

namespace {

InitializationOptions testOptions() {
    InitializationOptions options;
    options.serverName = "doris-mcp-server";
    options.serverVersion = "0.3.0";
    options.capabilities = MakeServerCapabilities(NotificationOptions{}, {});
    return options;
}

struct SessionFixture : public ::testing::Test {
    fakes::FakeComponents parts;
    OperationDispatcher dispatcher{parts.resources, parts.tools, parts.prompts};
    ServerSession session{dispatcher, testOptions()};

    JSONValue send(const std::string& text) {
        auto reply = session.HandleText(text);
        EXPECT_TRUE(reply.has_value()) << text;
        return reply.has_value() ? ParseJSON(reply.value()) : JSONValue();
    }

    void initialize() {
        send(R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2025-03-26","capabilities":{},"clientInfo":{"name":"test","version":"1"}}})");
        EXPECT_FALSE(session.HandleText(R"({"jsonrpc":"2.0","method":"notifications/initialized"})").has_value());
    }
};

int errorCode(const JSONValue& response) {
    const JSONValue* error = FindMember(response, "error");
    if (error == nullptr) return 0;
    const JSONValue* code = FindMember(*error, "code");
    if (code == nullptr || !std::holds_alternative<int64_t>(code->value)) return 0;
    return static_cast<int>(std::get<int64_t>(code->value));
}

} // namespace

TEST_F(SessionFixture, InitializeNegotiatesVersionAndReportsServerInfo) {
    JSONValue reply = send(R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2024-11-05","clientInfo":{"name":"c","version":"9"}}})");
    const JSONValue* result = FindMember(reply, "result");
    ASSERT_NE(result, nullptr);
    EXPECT_EQ(GetStringMember(*result, "protocolVersion").value_or(""), "2024-11-05");
    const JSONValue* info = FindMember(*result, "serverInfo");
    ASSERT_NE(info, nullptr);
    EXPECT_EQ(GetStringMember(*info, "name").value_or(""), "doris-mcp-server");
    EXPECT_EQ(GetStringMember(*info, "version").value_or(""), "0.3.0");
    const JSONValue* caps = FindMember(*result, "capabilities");
    ASSERT_NE(caps, nullptr);
    EXPECT_NE(FindMember(*caps, "tools"), nullptr);
    EXPECT_NE(FindMember(*caps, "resources"), nullptr);
    EXPECT_NE(FindMember(*caps, "prompts"), nullptr);

    EXPECT_EQ(session.GetState(), ServerSession::State::Initializing);
    ASSERT_TRUE(session.GetClientInfo().has_value());
    EXPECT_EQ(session.GetClientInfo()->name, "c");
}

TEST_F(SessionFixture, UnsupportedVersionFallsBackToLatest) {
    JSONValue reply = send(R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"1999-01-01"}})");
    const JSONValue* result = FindMember(reply, "result");
    ASSERT_NE(result, nullptr);
    EXPECT_EQ(GetStringMember(*result, "protocolVersion").value_or(""), LATEST_PROTOCOL_VERSION);
}

TEST_F(SessionFixture, RequestBeforeInitializeIsRejected) {
    JSONValue reply = send(R"({"jsonrpc":"2.0","id":7,"method":"tools/list"})");
    EXPECT_EQ(errorCode(reply), JSONRPCErrorCodes::InvalidRequest);
    EXPECT_EQ(FindMember(reply, "id") ? *FindMember(reply, "id") : JSONValue(), JSONValue(static_cast<int64_t>(7)));
}

TEST_F(SessionFixture, PingIsAnsweredAnytime) {
    JSONValue reply = send(R"({"jsonrpc":"2.0","id":"p","method":"ping"})");
    const JSONValue* result = FindMember(reply, "result");
    ASSERT_NE(result, nullptr);
    EXPECT_EQ(*result, JSONValue(JSONValue::Object{}));
}

TEST_F(SessionFixture, OperationsRouteAfterHandshake) {
    initialize();
    EXPECT_EQ(session.GetState(), ServerSession::State::Initialized);
    parts.tools->tools = {Tool("get_server_info", "info")};
    JSONValue reply = send(R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})");
    const JSONValue* result = FindMember(reply, "result");
    ASSERT_NE(result, nullptr);
    const JSONValue* tools = FindMember(*result, "tools");
    ASSERT_NE(tools, nullptr);
    EXPECT_EQ(std::get<JSONValue::Array>(tools->value).size(), 1u);
}

TEST_F(SessionFixture, UnknownMethodAndBadParams) {
    initialize();
    EXPECT_EQ(errorCode(send(R"({"jsonrpc":"2.0","id":3,"method":"sampling/createMessage"})")),
              JSONRPCErrorCodes::MethodNotFound);
    EXPECT_EQ(errorCode(send(R"({"jsonrpc":"2.0","id":4,"method":"tools/call","params":{}})")),
              JSONRPCErrorCodes::InvalidParams);
}

TEST_F(SessionFixture, ParseErrorHasNullId) {
    JSONValue reply = send("{not json");
    EXPECT_EQ(errorCode(reply), JSONRPCErrorCodes::ParseError);
    const JSONValue* id = FindMember(reply, "id");
    ASSERT_NE(id, nullptr);
    EXPECT_TRUE(id->isNull());
}

TEST_F(SessionFixture, BatchesAnswerRequestsOnly) {
    initialize();
    JSONValue reply = send(R"([{"jsonrpc":"2.0","id":1,"method":"ping"},{"jsonrpc":"2.0","method":"notifications/progress"},{"jsonrpc":"2.0","id":2,"method":"ping"}])");
    ASSERT_TRUE(reply.isArray());
    EXPECT_EQ(std::get<JSONValue::Array>(reply.value).size(), 2u);

    EXPECT_FALSE(session.HandleText(R"([{"jsonrpc":"2.0","method":"notifications/cancelled"}])").has_value());
    EXPECT_EQ(errorCode(send("[]")), JSONRPCErrorCodes::InvalidRequest);
}

TEST_F(SessionFixture, InvalidMessageIsRejected) {
    JSONValue reply = send(R"({"jsonrpc":"1.0","id":5,"method":"ping"})");
    EXPECT_EQ(errorCode(reply), JSONRPCErrorCodes::InvalidRequest);
}
