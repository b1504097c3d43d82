//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.h
// Purpose: Message transport interface between the protocol session and a peer
//==========================================================================================================

#pragma once

#include <memory>
#include <string>
#include <functional>
#include <future>
#include <cstdint>

namespace stdiomcp {

// Forward declarations
class JSONRPCRequest;
class JSONRPCResponse;
class JSONRPCNotification;

//==========================================================================================================
// ITransport
// Purpose: A single bidirectional JSON-RPC channel. Implementations own the inbound read loop and
//          resolve pending requests by id.
// Failure contract:
//   Futures returned by SendRequest/SendNotification carry errors::TransportError when the channel is
//   closed or breaks (including every request still pending at that moment), and
//   errors::RequestTimeoutError when a configured request timeout expires.
//==========================================================================================================
class ITransport {
public:
    virtual ~ITransport() = default;

    /////////////////////////////////////////// Connection lifecycle ///////////////////////////////////////////
    //==========================================================================================================
    // Starts the transport I/O loop.
    // Returns:
    //   A future that completes when the transport is running.
    //==========================================================================================================
    virtual std::future<void> Start() = 0;

    //==========================================================================================================
    // Closes the transport and releases resources. Idempotent.
    // Returns:
    //   A future that completes when the transport has closed.
    //==========================================================================================================
    virtual std::future<void> Close() = 0;

    //==========================================================================================================
    // Indicates whether the transport is currently connected.
    //==========================================================================================================
    virtual bool IsConnected() const = 0;

    //==========================================================================================================
    // Returns a transport session identifier for diagnostics.
    //==========================================================================================================
    virtual std::string GetSessionId() const = 0;

    /////////////////////////////////////////// Message sending ///////////////////////////////////////////
    //==========================================================================================================
    // Sends a JSON-RPC request and returns a future for the response.
    // Args:
    //   request: Request to send. A caller-set id (non-empty string or integer) is preserved.
    // Returns:
    //   Future resolving to the matching response (which may carry a JSON-RPC error object).
    //==========================================================================================================
    virtual std::future<std::unique_ptr<JSONRPCResponse>> SendRequest(
        std::unique_ptr<JSONRPCRequest> request) = 0;

    //==========================================================================================================
    // Sends a JSON-RPC notification (no response expected).
    // Returns:
    //   Future completing when the notification has been written to the transport.
    //==========================================================================================================
    virtual std::future<void> SendNotification(
        std::unique_ptr<JSONRPCNotification> notification) = 0;

    /////////////////////////////////////////// Inbound handling ///////////////////////////////////////////
    //==========================================================================================================
    // Registers a callback for incoming notifications.
    //==========================================================================================================
    using NotificationHandler = std::function<void(std::unique_ptr<JSONRPCNotification>)>;
    virtual void SetNotificationHandler(NotificationHandler handler) = 0;

    //==========================================================================================================
    // Registers a handler for requests initiated by the peer; the transport sends back the returned
    // response.
    //==========================================================================================================
    using RequestHandler = std::function<std::unique_ptr<JSONRPCResponse>(const JSONRPCRequest&)>;
    virtual void SetRequestHandler(RequestHandler handler) = 0;

    //==========================================================================================================
    // Registers an error handler to receive transport errors (EOF, broken pipe, ...).
    //==========================================================================================================
    using ErrorHandler = std::function<void(const std::string& error)>;
    virtual void SetErrorHandler(ErrorHandler handler) = 0;
};

} // namespace stdiomcp
