//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryTransport.hpp
// Purpose: In-memory transport pair for tests and embedding
//==========================================================================================================
#pragma once

#include "stdiomcp/Transport.h"
#include <memory>
#include <utility>

namespace stdiomcp {

//==========================================================================================================
// InMemoryTransport
// Purpose: In-process ITransport delivering serialized messages to a paired instance. Each side has a
//          processing thread; inbound requests are handled on their own thread so a handler that blocks
//          does not hold up other requests (used to force out-of-order replies in tests).
// Notes:
//   - Close() fails this side's pending requests with errors::TransportError.
//   - Sending after either side closed fails with errors::TransportError.
//==========================================================================================================
class InMemoryTransport : public ITransport {
public:
    InMemoryTransport();
    virtual ~InMemoryTransport();

    //==========================================================================================================
    // CreatePair
    // Purpose: Creates two transports wired to each other.
    // Returns:
    //   pair(left,right) where sending on one delivers to the other.
    //==========================================================================================================
    static std::pair<std::unique_ptr<InMemoryTransport>, std::unique_ptr<InMemoryTransport>> CreatePair();

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    std::future<void> Start() override;
    std::future<void> Close() override;
    bool IsConnected() const override;
    std::string GetSessionId() const override;

    std::future<std::unique_ptr<JSONRPCResponse>> SendRequest(
        std::unique_ptr<JSONRPCRequest> request) override;

    std::future<void> SendNotification(
        std::unique_ptr<JSONRPCNotification> notification) override;

    void SetNotificationHandler(NotificationHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;
    void SetRequestHandler(RequestHandler handler) override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace stdiomcp
