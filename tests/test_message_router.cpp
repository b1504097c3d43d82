//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_message_router.cpp
// Purpose: Tests for JsonRpcMessageRouter
//==========================================================================================================

#include <gtest/gtest.h>

#include <optional>
#include <stdexcept>
#include <string>

#include "stdiomcp/JsonRpcMessageRouter.h"
#include "stdiomcp/JSONRPCTypes.h"

namespace stdiomcp {

TEST(Router, ClassifyBasic) {
    auto router = MakeDefaultJsonRpcMessageRouter();

    JSONRPCRequest req(JSONRPCId{std::string("id-1")}, "ping");
    EXPECT_EQ(router->classify(req.Serialize()), IJsonRpcMessageRouter::MessageKind::Request);

    JSONRPCResponse resp(JSONRPCId{std::string("id-1")}, JSONValue(static_cast<int64_t>(123)));
    EXPECT_EQ(router->classify(resp.Serialize()), IJsonRpcMessageRouter::MessageKind::Response);

    JSONRPCNotification note{"notify", std::nullopt};
    EXPECT_EQ(router->classify(note.Serialize()), IJsonRpcMessageRouter::MessageKind::Notification);
}

TEST(Router, ClassifyInvalidJsonIsUnknown) {
    auto router = MakeDefaultJsonRpcMessageRouter();
    EXPECT_EQ(router->classify("{"), IJsonRpcMessageRouter::MessageKind::Unknown);
    EXPECT_EQ(router->classify("server booting..."), IJsonRpcMessageRouter::MessageKind::Unknown);
    EXPECT_EQ(router->classify("[1,2]"), IJsonRpcMessageRouter::MessageKind::Unknown);
}

TEST(Router, ClassifyIdOnlyIsUnknown) {
    auto router = MakeDefaultJsonRpcMessageRouter();
    EXPECT_EQ(router->classify("{\"jsonrpc\":\"2.0\",\"id\":\"x\"}"), IJsonRpcMessageRouter::MessageKind::Unknown);
}

TEST(Router, ClassifyNullIdIsRequest) {
    auto router = MakeDefaultJsonRpcMessageRouter();
    EXPECT_EQ(router->classify("{\"jsonrpc\":\"2.0\",\"method\":\"ping\",\"id\":null}"),
              IJsonRpcMessageRouter::MessageKind::Request);
}

TEST(Router, ClassifyNestedIdIsNotification) {
    auto router = MakeDefaultJsonRpcMessageRouter();
    EXPECT_EQ(router->classify("{\"jsonrpc\":\"2.0\",\"method\":\"ping\",\"params\":{\"id\":\"x\"}}"),
              IJsonRpcMessageRouter::MessageKind::Notification);
}

TEST(Router, RouteInvalidJsonCallsErrorHandler) {
    auto router = MakeDefaultJsonRpcMessageRouter();
    bool errored = false;
    RouterHandlers handlers{};
    handlers.errorHandler = [&](const std::string&){ errored = true; };
    auto resolve = [](JSONRPCResponse&&){};
    auto out = router->route("{", handlers, resolve);
    EXPECT_FALSE(out.has_value());
    EXPECT_TRUE(errored);
}

TEST(Router, RouteResponseResolves) {
    auto router = MakeDefaultJsonRpcMessageRouter();
    JSONRPCResponse resp(JSONRPCId{std::string("abc")}, JSONValue(static_cast<int64_t>(42)));

    std::string resolvedId;
    auto resolve = [&](JSONRPCResponse&& r) { resolvedId = IdToString(r.id); };

    RouterHandlers handlers{};
    auto out = router->route(resp.Serialize(), handlers, resolve);
    EXPECT_FALSE(out.has_value());
    EXPECT_EQ(resolvedId, "abc");
}

TEST(Router, RouteRequestWithoutHandlerIsMethodNotFound) {
    auto router = MakeDefaultJsonRpcMessageRouter();
    JSONRPCRequest req(JSONRPCId{static_cast<int64_t>(9)}, "sampling/createMessage");
    RouterHandlers handlers{};
    auto out = router->route(req.Serialize(), handlers, [](JSONRPCResponse&&){});
    ASSERT_TRUE(out.has_value());
    JSONRPCResponse parsed;
    ASSERT_TRUE(parsed.Deserialize(out.value()));
    ASSERT_TRUE(parsed.IsError());
    EXPECT_EQ(IdToString(parsed.id), "9");
    EXPECT_EQ(std::get<int64_t>(parsed.error->find("code")->value), JSONRPCErrorCodes::MethodNotFound);
}

TEST(Router, RouteRequestHandlerThrowsReturnsErrorResponse) {
    auto router = MakeDefaultJsonRpcMessageRouter();
    JSONRPCRequest req(JSONRPCId{std::string("t-1")}, "boom");
    RouterHandlers handlers{};
    handlers.requestHandler = [](const JSONRPCRequest&) -> std::unique_ptr<JSONRPCResponse> {
        throw std::runtime_error("handler threw");
    };
    auto out = router->route(req.Serialize(), handlers, [](JSONRPCResponse&&){});
    ASSERT_TRUE(out.has_value());
    JSONRPCResponse parsed;
    ASSERT_TRUE(parsed.Deserialize(out.value()));
    EXPECT_TRUE(parsed.IsError());
    EXPECT_EQ(IdToString(parsed.id), "t-1");
}

TEST(Router, RouteRequestReplyCarriesRequestId) {
    auto router = MakeDefaultJsonRpcMessageRouter();
    JSONRPCRequest req(JSONRPCId{std::string("r-1")}, "ping");
    RouterHandlers handlers{};
    handlers.requestHandler = [](const JSONRPCRequest&) -> std::unique_ptr<JSONRPCResponse> {
        // id left unset on purpose; the router fills it in
        auto resp = std::make_unique<JSONRPCResponse>();
        resp->result = JSONValue{JSONValue::Object{}};
        return resp;
    };
    auto out = router->route(req.Serialize(), handlers, [](JSONRPCResponse&&){});
    ASSERT_TRUE(out.has_value());
    JSONRPCResponse parsed;
    ASSERT_TRUE(parsed.Deserialize(out.value()));
    EXPECT_FALSE(parsed.IsError());
    EXPECT_EQ(IdToString(parsed.id), "r-1");
}

TEST(Router, RouteNotificationDispatches) {
    auto router = MakeDefaultJsonRpcMessageRouter();
    JSONRPCNotification note{"notifications/message", std::nullopt};

    std::string method;
    RouterHandlers handlers{};
    handlers.notificationHandler = [&](std::unique_ptr<JSONRPCNotification> n) { method = n->method; };

    auto out = router->route(note.Serialize(), handlers, [](JSONRPCResponse&&){});
    EXPECT_FALSE(out.has_value());
    EXPECT_EQ(method, "notifications/message");
}

} // namespace stdiomcp
