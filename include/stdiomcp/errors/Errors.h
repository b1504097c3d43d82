//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Client exception taxonomy and JSON-RPC error mapping helpers
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "stdiomcp/JSONRPCTypes.h"

namespace stdiomcp {
namespace errors {

// Categorization of common JSON-RPC and MCP error codes.
enum class ErrorCategory {
    JsonRpcParse,
    JsonRpcInvalidRequest,
    JsonRpcMethodNotFound,
    JsonRpcInvalidParams,
    JsonRpcInternal,
    McpInvalidRequestId,
    McpMethodNotAllowed,
    McpResourceNotFound,
    McpToolNotFound,
    Unknown
};

// Typed representation of a JSON-RPC error object received from the server.
struct McpError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
    ErrorCategory category{ErrorCategory::Unknown};
};

//////////////////////////////////////////// Exceptions ////////////////////////////////////////////
//==========================================================================================================
// ClientError
// Purpose: Root of every exception the client raises across its public API.
//==========================================================================================================
class ClientError : public std::runtime_error {
public:
    explicit ClientError(const std::string& what) : std::runtime_error(what) {}
};

// The server subprocess could not be started. No process or descriptors remain.
class LaunchError : public ClientError {
public:
    explicit LaunchError(const std::string& what) : ClientError(what) {}
};

// Initialize failed, timed out, or the acknowledgement was incompatible. The session is Closed.
class HandshakeError : public ClientError {
public:
    explicit HandshakeError(const std::string& what) : ClientError(what) {}
};

// The byte stream to or from the server closed or broke. Later calls fail fast.
class TransportError : public ClientError {
public:
    explicit TransportError(const std::string& what) : ClientError(what) {}
};

// The call was issued on, or was pending when, the session was closed.
class SessionClosedError : public TransportError {
public:
    SessionClosedError() : TransportError("session closed") {}
    explicit SessionClosedError(const std::string& what) : TransportError(what) {}
};

//==========================================================================================================
// ProtocolError
// Purpose: Malformed or unexpected response, or a JSON-RPC error reply. The session stays usable.
// Members:
//   error(): The server's typed error when the failure came from a JSON-RPC error object.
//==========================================================================================================
class ProtocolError : public ClientError {
public:
    explicit ProtocolError(const std::string& what) : ClientError(what) {}
    ProtocolError(const std::string& what, McpError err) : ClientError(what), mcpError(std::move(err)) {}

    const std::optional<McpError>& error() const { return mcpError; }

private:
    std::optional<McpError> mcpError;
};

// A configured per-request timeout expired before the response arrived.
class RequestTimeoutError : public ProtocolError {
public:
    explicit RequestTimeoutError(const std::string& what) : ProtocolError(what) {}
};

// The requested tool is absent from the cached catalog; nothing was sent.
class UnknownToolError : public ClientError {
public:
    explicit UnknownToolError(const std::string& name)
        : ClientError("Unknown tool '" + name + "'"), tool(name) {}

    const std::string& toolName() const { return tool; }

private:
    std::string tool;
};

// Operation not valid in the current lifecycle state (e.g. before the handshake completed).
class InvalidStateError : public ClientError {
public:
    explicit InvalidStateError(const std::string& what) : ClientError(what) {}
};

//////////////////////////////////////////// Mapping helpers ////////////////////////////////////////////

// Map a JSON-RPC/MCP numeric error code to an ErrorCategory.
//
// Args:
//   code: The integer error code (JSON-RPC standard or MCP-specific).
//
// Returns:
//   ErrorCategory corresponding to the code, or Unknown when unmapped.
inline ErrorCategory errorCategoryFromCode(int code) {
    switch (code) {
        case JSONRPCErrorCodes::ParseError: return ErrorCategory::JsonRpcParse;
        case JSONRPCErrorCodes::InvalidRequest: return ErrorCategory::JsonRpcInvalidRequest;
        case JSONRPCErrorCodes::MethodNotFound: return ErrorCategory::JsonRpcMethodNotFound;
        case JSONRPCErrorCodes::InvalidParams: return ErrorCategory::JsonRpcInvalidParams;
        case JSONRPCErrorCodes::InternalError: return ErrorCategory::JsonRpcInternal;
        case JSONRPCErrorCodes::InvalidRequestId: return ErrorCategory::McpInvalidRequestId;
        case JSONRPCErrorCodes::MethodNotAllowed: return ErrorCategory::McpMethodNotAllowed;
        case JSONRPCErrorCodes::ResourceNotFound: return ErrorCategory::McpResourceNotFound;
        case JSONRPCErrorCodes::ToolNotFound: return ErrorCategory::McpToolNotFound;
        default: return ErrorCategory::Unknown;
    }
}

// Convert a JSON-RPC error object (shape: { code, message, data? }) to McpError.
// Returns std::nullopt when the input is not a valid error object.
inline std::optional<McpError> mcpErrorFromErrorValue(const JSONValue& errVal) {
    const JSONValue* codeVal = errVal.find("code");
    const JSONValue* msgVal = errVal.find("message");
    if (!codeVal || !msgVal) {
        return std::nullopt;
    }
    if (!std::holds_alternative<int64_t>(codeVal->value) || !msgVal->isString()) {
        return std::nullopt;
    }
    McpError e;
    e.code = static_cast<int>(std::get<int64_t>(codeVal->value));
    e.message = std::get<std::string>(msgVal->value);
    if (const JSONValue* data = errVal.find("data")) {
        e.data = *data;
    }
    e.category = errorCategoryFromCode(e.code);
    return e;
}

// Extract McpError from a JSONRPCResponse if it carries an error.
inline std::optional<McpError> mcpErrorFromResponse(const JSONRPCResponse& response) {
    if (!response.error.has_value()) {
        return std::nullopt;
    }
    return mcpErrorFromErrorValue(response.error.value());
}

//==========================================================================================================
// protocolErrorFromResponse
// Purpose: Builds the ProtocolError raised for a JSON-RPC error reply to `method`.
//          Error objects without a valid {code, message} shape still produce an error (without McpError).
//==========================================================================================================
inline ProtocolError protocolErrorFromResponse(const std::string& method, const JSONRPCResponse& response) {
    auto typed = mcpErrorFromResponse(response);
    if (!typed.has_value()) {
        return ProtocolError(method + " failed with a malformed error object");
    }
    std::string what = method + " failed: " + typed->message + " (code " + std::to_string(typed->code) + ")";
    return ProtocolError(what, std::move(typed.value()));
}

// Convenience: Create a JSONRPCResponse error from McpError and id.
inline std::unique_ptr<JSONRPCResponse> makeErrorResponse(const JSONRPCId& id, const McpError& err) {
    return CreateErrorResponse(id, err.code, err.message, err.data);
}

} // namespace errors
} // namespace stdiomcp
