//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JsonRpcMessageRouter.cpp
// Purpose: Default implementation for JSON-RPC message routing
//========================================================================================================

#include <optional>
#include <string>

#include "logging/Logger.h"
#include "stdiomcp/JsonRpcMessageRouter.h"
#include "stdiomcp/JSONRPCTypes.h"

namespace stdiomcp {

namespace {
using MessageKind = IJsonRpcMessageRouter::MessageKind;

MessageKind classifyDocument(const JSONValue& doc) {
    if (!doc.isObject()) {
        return MessageKind::Unknown;
    }
    const bool hasId = doc.find("id") != nullptr;
    const JSONValue* method = doc.find("method");
    if (method && method->isString()) {
        return hasId ? MessageKind::Request : MessageKind::Notification;
    }
    if (hasId && (doc.find("result") != nullptr || doc.find("error") != nullptr)) {
        return MessageKind::Response;
    }
    return MessageKind::Unknown;
}

std::string errorReply(const JSONRPCId& id, int code, const std::string& message) {
    return CreateErrorResponse(id, code, message)->Serialize();
}

class JsonRpcMessageRouter : public IJsonRpcMessageRouter {
public:
    MessageKind classify(const std::string& json) override {
        try {
            return classifyDocument(ParseJSON(json));
        } catch (const std::exception& e) {
            LOG_DEBUG("Router: not JSON ({})", e.what());
            return MessageKind::Unknown;
        }
    }

    std::optional<std::string> route(
        const std::string& json,
        RouterHandlers& handlers,
        const ResponseResolver& resolve) override {
        switch (classify(json)) {
            case MessageKind::Response: {
                JSONRPCResponse response;
                if (response.Deserialize(json)) {
                    resolve(std::move(response));
                    return std::nullopt;
                }
                break;
            }
            case MessageKind::Request: {
                JSONRPCRequest request;
                if (!request.Deserialize(json)) {
                    break;
                }
                if (!handlers.requestHandler) {
                    return errorReply(request.id, JSONRPCErrorCodes::MethodNotFound, "Method not found: " + request.method);
                }
                try {
                    auto resp = handlers.requestHandler(request);
                    if (!resp) {
                        return errorReply(request.id, JSONRPCErrorCodes::InternalError, "Null response from handler");
                    }
                    resp->id = request.id;
                    return resp->Serialize();
                } catch (const std::exception& e) {
                    LOG_ERROR("Request handler exception: {}", e.what());
                    return errorReply(request.id, JSONRPCErrorCodes::InternalError, e.what());
                }
            }
            case MessageKind::Notification: {
                JSONRPCNotification notification;
                if (notification.Deserialize(json)) {
                    if (handlers.notificationHandler) {
                        handlers.notificationHandler(std::make_unique<JSONRPCNotification>(std::move(notification)));
                    }
                    return std::nullopt;
                }
                break;
            }
            case MessageKind::Unknown:
                break;
        }

        LOG_WARN("Router: dropping unrecognized inbound frame: {}", json);
        if (handlers.errorHandler) {
            handlers.errorHandler("Router: unrecognized JSON-RPC message");
        }
        return std::nullopt;
    }
};
} // namespace

std::unique_ptr<IJsonRpcMessageRouter> MakeDefaultJsonRpcMessageRouter() {
    return std::make_unique<JsonRpcMessageRouter>();
}

} // namespace stdiomcp
