//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_json_parser.cpp
// Purpose: Tests for the JSON value model and JSON-RPC message (de)serialization
//==========================================================================================================

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "stdiomcp/JSONRPCTypes.h"

using namespace stdiomcp;

TEST(JSONParser, ParsesNestedDocument) {
    JSONValue v = ParseJSON("{\"a\":[1,2.5,\"x\",true,null],\"b\":{\"c\":-7}}");
    ASSERT_TRUE(v.isObject());
    const JSONValue* a = v.find("a");
    ASSERT_NE(a, nullptr);
    ASSERT_TRUE(a->isArray());
    const auto& arr = std::get<JSONValue::Array>(a->value);
    ASSERT_EQ(arr.size(), 5u);
    EXPECT_EQ(std::get<int64_t>(arr[0]->value), 1);
    EXPECT_DOUBLE_EQ(std::get<double>(arr[1]->value), 2.5);
    EXPECT_EQ(std::get<std::string>(arr[2]->value), "x");
    EXPECT_TRUE(std::get<bool>(arr[3]->value));
    EXPECT_TRUE(std::holds_alternative<std::nullptr_t>(arr[4]->value));
    const JSONValue* b = v.find("b");
    ASSERT_NE(b, nullptr);
    EXPECT_EQ(std::get<int64_t>(b->find("c")->value), -7);
}

TEST(JSONParser, DecodesEscapesAndSurrogatePairs) {
    JSONValue v = ParseJSON("\"line\\nbreak \\u00e9 \\ud83d\\ude00\"");
    ASSERT_TRUE(v.isString());
    EXPECT_EQ(std::get<std::string>(v.value), "line\nbreak \xC3\xA9 \xF0\x9F\x98\x80");
}

TEST(JSONParser, RejectsMalformedInput) {
    EXPECT_THROW(ParseJSON("{"), std::runtime_error);
    EXPECT_THROW(ParseJSON("{\"a\":}"), std::runtime_error);
    EXPECT_THROW(ParseJSON("[1,2"), std::runtime_error);
    EXPECT_THROW(ParseJSON("{} trailing"), std::runtime_error);
    EXPECT_THROW(ParseJSON("not json"), std::runtime_error);
    EXPECT_THROW(ParseJSON(""), std::runtime_error);
}

TEST(JSONParser, FindOnNonObjectIsNull) {
    JSONValue arr = ParseJSON("[1]");
    EXPECT_EQ(arr.find("x"), nullptr);
    JSONValue obj = ParseJSON("{\"x\":1}");
    EXPECT_EQ(obj.find("y"), nullptr);
}

TEST(JSONParser, SerializerEscapesControlCharactersOnOneLine) {
    JSONValue::Object o;
    o["text"] = std::make_shared<JSONValue>(std::string("a\nb\tc\x01"));
    const std::string out = SerializeJSON(JSONValue{o});
    EXPECT_EQ(out, "{\"text\":\"a\\nb\\tc\\u0001\"}");
    EXPECT_EQ(out.find('\n'), std::string::npos);
}

TEST(JSONParser, SerializerSortsObjectKeys) {
    JSONValue v = ParseJSON("{\"zeta\":1,\"alpha\":2}");
    EXPECT_EQ(SerializeJSON(v), "{\"alpha\":2,\"zeta\":1}");
}

TEST(JSONRPCTypes, RequestSerializeAndDeserialize) {
    JSONValue::Object params;
    params["name"] = std::make_shared<JSONValue>(std::string("greet"));
    JSONRPCRequest req(JSONRPCId{static_cast<int64_t>(7)}, "tools/call", JSONValue{params});
    const std::string json = req.Serialize();

    JSONRPCRequest parsed;
    ASSERT_TRUE(parsed.Deserialize(json));
    EXPECT_EQ(parsed.method, "tools/call");
    EXPECT_EQ(IdToString(parsed.id), "7");
    ASSERT_TRUE(parsed.params.has_value());
    EXPECT_EQ(std::get<std::string>(parsed.params->find("name")->value), "greet");
}

TEST(JSONRPCTypes, ResponseRequiresResultOrError) {
    JSONRPCResponse r;
    EXPECT_FALSE(r.Deserialize("{\"jsonrpc\":\"2.0\",\"id\":1}"));
    EXPECT_TRUE(r.Deserialize("{\"jsonrpc\":\"2.0\",\"id\":1,\"result\":{}}"));
    EXPECT_FALSE(r.IsError());

    JSONRPCResponse e;
    ASSERT_TRUE(e.Deserialize("{\"jsonrpc\":\"2.0\",\"id\":\"x\",\"error\":{\"code\":-32601,\"message\":\"nope\"}}"));
    EXPECT_TRUE(e.IsError());
    EXPECT_EQ(IdToString(e.id), "x");
}

TEST(JSONRPCTypes, NotificationRejectsId) {
    JSONRPCNotification n;
    EXPECT_FALSE(n.Deserialize("{\"jsonrpc\":\"2.0\",\"method\":\"m\",\"id\":1}"));
    EXPECT_TRUE(n.Deserialize("{\"jsonrpc\":\"2.0\",\"method\":\"notifications/message\"}"));
    EXPECT_EQ(n.method, "notifications/message");
    EXPECT_FALSE(n.params.has_value());
}

TEST(JSONRPCTypes, IdToStringForms) {
    EXPECT_EQ(IdToString(JSONRPCId{std::string("req-1")}), "req-1");
    EXPECT_EQ(IdToString(JSONRPCId{static_cast<int64_t>(42)}), "42");
    EXPECT_EQ(IdToString(JSONRPCId{nullptr}), "null");
}

TEST(JSONRPCTypes, CreateErrorResponseShape) {
    auto resp = CreateErrorResponse(JSONRPCId{static_cast<int64_t>(3)}, JSONRPCErrorCodes::InvalidParams, "bad");
    ASSERT_TRUE(resp->IsError());
    JSONValue doc = ParseJSON(resp->Serialize());
    const JSONValue* err = doc.find("error");
    ASSERT_NE(err, nullptr);
    EXPECT_EQ(std::get<int64_t>(err->find("code")->value), JSONRPCErrorCodes::InvalidParams);
    EXPECT_EQ(std::get<std::string>(err->find("message")->value), "bad");
    EXPECT_EQ(doc.find("result"), nullptr);
}
