//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_errors.cpp
// Purpose: GoogleTests for the client exception taxonomy and JSON-RPC error mapping helpers
//==========================================================================================================

#include <gtest/gtest.h>

#include <string>

#include "stdiomcp/JSONRPCTypes.h"
#include "stdiomcp/errors/Errors.h"

using namespace stdiomcp;

TEST(Errors, CategoryMapping) {
    using errors::ErrorCategory;
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::ParseError), ErrorCategory::JsonRpcParse);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InvalidRequest), ErrorCategory::JsonRpcInvalidRequest);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::MethodNotFound), ErrorCategory::JsonRpcMethodNotFound);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InvalidParams), ErrorCategory::JsonRpcInvalidParams);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InternalError), ErrorCategory::JsonRpcInternal);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InvalidRequestId), ErrorCategory::McpInvalidRequestId);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::MethodNotAllowed), ErrorCategory::McpMethodNotAllowed);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::ResourceNotFound), ErrorCategory::McpResourceNotFound);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::ToolNotFound), ErrorCategory::McpToolNotFound);
    EXPECT_EQ(errors::errorCategoryFromCode(12345), ErrorCategory::Unknown);
}

TEST(Errors, TaxonomyIsCatchableAsClientError) {
    EXPECT_THROW(throw errors::LaunchError("x"), errors::ClientError);
    EXPECT_THROW(throw errors::HandshakeError("x"), errors::ClientError);
    EXPECT_THROW(throw errors::UnknownToolError("x"), errors::ClientError);
    EXPECT_THROW(throw errors::InvalidStateError("x"), errors::ClientError);
    EXPECT_THROW(throw errors::SessionClosedError(), errors::TransportError);
    EXPECT_THROW(throw errors::RequestTimeoutError("x"), errors::ProtocolError);
}

TEST(Errors, UnknownToolCarriesName) {
    errors::UnknownToolError e("frobnicate");
    EXPECT_EQ(e.toolName(), "frobnicate");
    EXPECT_NE(std::string(e.what()).find("frobnicate"), std::string::npos);
}

TEST(Errors, McpErrorFromResponseWithData) {
    JSONValue::Object data;
    data["field"] = std::make_shared<JSONValue>(std::string("name"));
    auto resp = CreateErrorResponse(JSONRPCId{static_cast<int64_t>(4)}, JSONRPCErrorCodes::InvalidParams,
                                    "missing name", JSONValue{data});
    auto typed = errors::mcpErrorFromResponse(*resp);
    ASSERT_TRUE(typed.has_value());
    EXPECT_EQ(typed->code, JSONRPCErrorCodes::InvalidParams);
    EXPECT_EQ(typed->message, "missing name");
    EXPECT_EQ(typed->category, errors::ErrorCategory::JsonRpcInvalidParams);
    ASSERT_TRUE(typed->data.has_value());
    EXPECT_EQ(std::get<std::string>(typed->data->find("field")->value), "name");
}

TEST(Errors, MalformedErrorObjectIsNotTyped) {
    JSONRPCResponse resp(JSONRPCId{static_cast<int64_t>(1)}, ParseJSON("{\"code\":\"oops\"}"), true);
    EXPECT_FALSE(errors::mcpErrorFromResponse(resp).has_value());
    errors::ProtocolError pe = errors::protocolErrorFromResponse("tools/call", resp);
    EXPECT_FALSE(pe.error().has_value());
    EXPECT_NE(std::string(pe.what()).find("tools/call"), std::string::npos);
}

TEST(Errors, ProtocolErrorFromResponseCarriesCodeAndMessage) {
    auto resp = CreateErrorResponse(JSONRPCId{static_cast<int64_t>(2)}, JSONRPCErrorCodes::MethodNotFound,
                                    "Method not found");
    errors::ProtocolError pe = errors::protocolErrorFromResponse("tools/list", *resp);
    ASSERT_TRUE(pe.error().has_value());
    EXPECT_EQ(pe.error()->code, JSONRPCErrorCodes::MethodNotFound);
    const std::string what = pe.what();
    EXPECT_NE(what.find("Method not found"), std::string::npos);
    EXPECT_NE(what.find("-32601"), std::string::npos);
}

TEST(Errors, MakeErrorResponseRoundTripsMcpError) {
    errors::McpError e;
    e.code = JSONRPCErrorCodes::ToolNotFound;
    e.message = "no such tool";
    auto resp = errors::makeErrorResponse(JSONRPCId{std::string("r")}, e);
    auto back = errors::mcpErrorFromResponse(*resp);
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back->code, JSONRPCErrorCodes::ToolNotFound);
    EXPECT_EQ(back->category, errors::ErrorCategory::McpToolNotFound);
}
