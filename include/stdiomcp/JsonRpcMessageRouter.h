//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JsonRpcMessageRouter.h
// Purpose: Interface for JSON-RPC message routing (classification and dispatch)
//========================================================================================================

#pragma once

#include <functional>
#include <optional>
#include <string>
#include <memory>

#include "stdiomcp/Transport.h"
#include "stdiomcp/JSONRPCTypes.h"

namespace stdiomcp {

struct RouterHandlers {
    ITransport::RequestHandler requestHandler;
    ITransport::NotificationHandler notificationHandler;
    ITransport::ErrorHandler errorHandler;
};

using ResponseResolver = std::function<void(JSONRPCResponse&&)>;

class IJsonRpcMessageRouter {
public:
    virtual ~IJsonRpcMessageRouter() = default;

    enum class MessageKind {
        Request,
        Response,
        Notification,
        Unknown
    };

    // Classify a JSON-RPC message by its top-level members without invoking handlers.
    // Anything that is not a JSON object is Unknown.
    virtual MessageKind classify(const std::string& json) = 0;

    // Routes a JSON-RPC message. For requests, returns the serialized response payload to send back
    // (MethodNotFound when no request handler is set); for responses/notifications, returns std::nullopt.
    // The resolver is invoked for responses and must resolve any pending promise.
    virtual std::optional<std::string> route(
        const std::string& json,
        RouterHandlers& handlers,
        const ResponseResolver& resolve) = 0;
};

// Factory: returns the default router implementation
std::unique_ptr<IJsonRpcMessageRouter> MakeDefaultJsonRpcMessageRouter();

} // namespace stdiomcp
