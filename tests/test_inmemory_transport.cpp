//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_inmemory_transport.cpp
// Purpose: InMemoryTransport pair behaviour relied on by the session tests
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <future>

#include "stdiomcp/InMemoryTransport.hpp"
#include "stdiomcp/JSONRPCTypes.h"
#include "stdiomcp/errors/Errors.h"

using namespace stdiomcp;

namespace {
std::unique_ptr<JSONRPCRequest> request(int64_t id, const std::string& method) {
    return std::make_unique<JSONRPCRequest>(JSONRPCId{id}, method, JSONValue{JSONValue::Object{}});
}

class InMemoryTransportTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto pair = InMemoryTransport::CreatePair();
        client = std::move(pair.first);
        server = std::move(pair.second);
    }

    void TearDown() override {
        client->Close().get();
        server->Close().get();
    }

    void startBoth() {
        client->Start().get();
        server->Start().get();
    }

    // Server answers every request with its method name as the result.
    void echoMethod() {
        server->SetRequestHandler([](const JSONRPCRequest& req) {
            return std::make_unique<JSONRPCResponse>(req.id, JSONValue{req.method});
        });
    }

    std::unique_ptr<InMemoryTransport> client;
    std::unique_ptr<InMemoryTransport> server;
};
} // namespace

TEST_F(InMemoryTransportTest, ResponseResolvesRequestById) {
    echoMethod();
    startBoth();
    auto fut = client->SendRequest(request(7, "tools/list"));
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    auto resp = fut.get();
    ASSERT_NE(resp, nullptr);
    EXPECT_FALSE(resp->IsError());
    EXPECT_EQ(IdToString(resp->id), "7");
    EXPECT_EQ(std::get<std::string>(resp->result->value), "tools/list");
}

TEST_F(InMemoryTransportTest, MissingIdIsGenerated) {
    echoMethod();
    startBoth();
    auto req = std::make_unique<JSONRPCRequest>();
    req->method = "ping";
    auto fut = client->SendRequest(std::move(req));
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    auto resp = fut.get();
    ASSERT_TRUE(std::holds_alternative<std::string>(resp->id));
    EXPECT_FALSE(std::get<std::string>(resp->id).empty());
}

TEST_F(InMemoryTransportTest, RequestWithoutServerHandlerIsMethodNotFound) {
    startBoth();
    auto fut = client->SendRequest(request(1, "x/y"));
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    auto resp = fut.get();
    ASSERT_TRUE(resp->IsError());
    EXPECT_EQ(std::get<int64_t>(resp->error->find("code")->value), JSONRPCErrorCodes::MethodNotFound);
}

TEST_F(InMemoryTransportTest, SendingToClosedPeerFails) {
    startBoth();
    server->Close().get();

    auto fut = client->SendRequest(request(1, "tools/call"));
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_THROW(fut.get(), errors::TransportError);
    EXPECT_THROW(client->SendNotification(std::make_unique<JSONRPCNotification>("notifications/initialized")).get(),
                 errors::TransportError);
}

TEST_F(InMemoryTransportTest, NotificationReachesPeerHandler) {
    std::promise<std::string> seen;
    server->SetNotificationHandler([&seen](std::unique_ptr<JSONRPCNotification> note) {
        seen.set_value(note->method);
    });
    startBoth();

    JSONValue::Object params;
    params["level"] = std::make_shared<JSONValue>(std::string("info"));
    client->SendNotification(std::make_unique<JSONRPCNotification>("notifications/message", JSONValue{params})).get();

    auto method = seen.get_future();
    ASSERT_EQ(method.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_EQ(method.get(), "notifications/message");
}

TEST_F(InMemoryTransportTest, CloseFailsPendingRequests) {
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    server->SetRequestHandler([released](const JSONRPCRequest& req) {
        released.wait();
        return std::make_unique<JSONRPCResponse>(req.id, JSONValue{JSONValue::Object{}});
    });
    startBoth();

    auto fut = client->SendRequest(request(3, "tools/call"));
    EXPECT_EQ(fut.wait_for(std::chrono::milliseconds(50)), std::future_status::timeout);
    client->Close().get();
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_THROW(fut.get(), errors::TransportError);
    EXPECT_FALSE(client->IsConnected());

    release.set_value();
}

TEST_F(InMemoryTransportTest, SlowRequestDoesNotBlockLaterOnes) {
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    server->SetRequestHandler([released](const JSONRPCRequest& req) {
        if (req.method == "slow") {
            released.wait();
        }
        return std::make_unique<JSONRPCResponse>(req.id, JSONValue{req.method});
    });
    startBoth();

    auto slow = client->SendRequest(request(1, "slow"));
    auto fast = client->SendRequest(request(2, "fast"));
    ASSERT_EQ(fast.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_EQ(std::get<std::string>(fast.get()->result->value), "fast");
    EXPECT_EQ(slow.wait_for(std::chrono::milliseconds(20)), std::future_status::timeout);

    release.set_value();
    ASSERT_EQ(slow.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_EQ(std::get<std::string>(slow.get()->result->value), "slow");
}
