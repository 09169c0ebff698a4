//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_json.cpp
// Purpose: GoogleTests for the JSON parser/serializer and JSON-RPC message classification
//==========================================================================================================

#include <gtest/gtest.h>

#include <string>

#include "dorismcp/JSONRPCTypes.h"

using namespace dorismcp;

TEST(JSONParser, ParsesScalarsAndContainers) {
    JSONValue v = ParseJSON(R"({"s":"x","i":-42,"d":1.5,"b":true,"n":null,"a":[1,"two",false]})");
    ASSERT_TRUE(v.isObject());
    EXPECT_EQ(GetStringMember(v, "s").value_or(""), "x");
    EXPECT_EQ(*FindMember(v, "i"), JSONValue(static_cast<int64_t>(-42)));
    EXPECT_EQ(*FindMember(v, "d"), JSONValue(1.5));
    EXPECT_EQ(*FindMember(v, "b"), JSONValue(true));
    EXPECT_TRUE(FindMember(v, "n")->isNull());
    const JSONValue* a = FindMember(v, "a");
    ASSERT_TRUE(a != nullptr && a->isArray());
    EXPECT_EQ(std::get<JSONValue::Array>(a->value).size(), 3u);
    EXPECT_EQ(FindMember(v, "missing"), nullptr);
    EXPECT_FALSE(GetStringMember(v, "i").has_value());
}

TEST(JSONParser, DecodesEscapesAndSurrogatePairs) {
    JSONValue v = ParseJSON(R"("tab\tquote\"snow\u2603face\ud83d\ude00")");
    ASSERT_TRUE(v.isString());
    EXPECT_EQ(std::get<std::string>(v.value), "tab\tquote\"snow\xE2\x98\x83" "face\xF0\x9F\x98\x80");
}

TEST(JSONParser, RejectsMalformedInput) {
    EXPECT_THROW(ParseJSON(""), JSONParseError);
    EXPECT_THROW(ParseJSON("{"), JSONParseError);
    EXPECT_THROW(ParseJSON(R"({"a":1,})"), JSONParseError);
    EXPECT_THROW(ParseJSON(R"({"a" 1})"), JSONParseError);
    EXPECT_THROW(ParseJSON("[1] trailing"), JSONParseError);
    EXPECT_THROW(ParseJSON(R"("\ud800")"), JSONParseError);
    EXPECT_THROW(ParseJSON("01.e"), JSONParseError);
    EXPECT_THROW(ParseJSON(std::string(600, '[') + std::string(600, ']')), JSONParseError);
}

TEST(JSONSerializer, CompactAndIndentedOutput) {
    JSONValue v = MakeObject({{"b", JSONValue(static_cast<int64_t>(2))}, {"a", JSONValue("line\nbreak")}});
    EXPECT_EQ(SerializeJSON(v), R"({"a":"line\nbreak","b":2})");
    std::string pretty = SerializeJSON(v, 2);
    EXPECT_NE(pretty.find("\n  \"a\": "), std::string::npos);
    EXPECT_EQ(ParseJSON(pretty), v);
}

TEST(JSONValueEquality, ComparesDeeply) {
    EXPECT_EQ(ParseJSON(R"({"x":[1,{"y":null}]})"), ParseJSON(R"({ "x" : [ 1 , { "y" : null } ] })"));
    EXPECT_NE(ParseJSON(R"({"x":[1]})"), ParseJSON(R"({"x":[2]})"));
    EXPECT_NE(ParseJSON("1"), ParseJSON(R"("1")"));
}

TEST(JSONRPCMessages, ClassifiesMessageKinds) {
    EXPECT_EQ(ClassifyMessage(ParseJSON(R"({"jsonrpc":"2.0","id":1,"method":"ping"})")), MessageKind::Request);
    EXPECT_EQ(ClassifyMessage(ParseJSON(R"({"jsonrpc":"2.0","method":"notifications/initialized"})")),
              MessageKind::Notification);
    EXPECT_EQ(ClassifyMessage(ParseJSON(R"({"jsonrpc":"2.0","id":"a","result":{}})")), MessageKind::Response);
    EXPECT_EQ(ClassifyMessage(ParseJSON(R"({"jsonrpc":"1.0","id":1,"method":"ping"})")), MessageKind::Invalid);
    EXPECT_EQ(ClassifyMessage(ParseJSON(R"([1,2])")), MessageKind::Invalid);
}

TEST(JSONRPCMessages, ErrorResponseShape) {
    auto response = CreateErrorResponse(JSONRPCId{std::string("server-error")}, JSONRPCErrorCodes::InvalidRequest,
                                        "Bad Request: Missing session ID");
    ASSERT_TRUE(response->IsError());
    JSONValue expected = ParseJSON(
        R"({"jsonrpc":"2.0","id":"server-error","error":{"code":-32600,"message":"Bad Request: Missing session ID"}})");
    EXPECT_EQ(response->ToJSON(), expected);

    JSONRPCRequest request;
    ASSERT_TRUE(request.Deserialize(R"({"jsonrpc":"2.0","id":7,"method":"tools/list","params":{}})"));
    EXPECT_EQ(request.method, "tools/list");
    EXPECT_EQ(IdToString(request.id), "7");
}
