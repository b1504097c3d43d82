//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Session.h
// Purpose: MCP protocol session over a transport (handshake, tool discovery, tool invocation)
//==========================================================================================================

#pragma once

#include <chrono>
#include <future>
#include <memory>
#include <string>

#include "stdiomcp/JSONRPCTypes.h"
#include "stdiomcp/Protocol.h"
#include "stdiomcp/Transport.h"

namespace stdiomcp {

// Lifecycle of a Session. Transitions only move forward; Closed is terminal.
enum class SessionState {
    Unconnected,
    Handshaking,
    Ready,
    Closed
};

const char* SessionStateName(SessionState state);

//==========================================================================================================
// SessionOptions
// Fields:
//   initializeTimeout: Upper bound on the wait for the initialize acknowledgement (0 = unbounded).
//==========================================================================================================
struct SessionOptions {
    std::chrono::milliseconds initializeTimeout{30000};
};

//==========================================================================================================
// MCP session interface
// Purpose: One JSON-RPC conversation with a single MCP server.
//==========================================================================================================
class ISession {
public:
    virtual ~ISession() = default;

    //==========================================================================================================
    // Connect
    // Purpose: Starts the transport and performs the initialize handshake, then sends
    //          notifications/initialized.
    // Args:
    //   transport: The transport to use (takes ownership).
    // Returns:
    //   The server's initialize acknowledgement.
    // Throws:
    //   errors::HandshakeError on any failure; the session is Closed afterwards.
    //   errors::InvalidStateError when called more than once.
    //==========================================================================================================
    virtual InitializeResult Connect(std::unique_ptr<ITransport> transport) = 0;

    //==========================================================================================================
    // ListTools
    // Purpose: Fetches every page of tools/list and replaces the cached catalog with the result.
    // Returns:
    //   The new catalog snapshot. Duplicate names keep the last definition.
    // Throws:
    //   errors::ProtocolError, errors::TransportError, errors::SessionClosedError, errors::InvalidStateError.
    //==========================================================================================================
    virtual std::shared_ptr<const ToolCatalog> ListTools() = 0;

    // Last catalog published by ListTools (empty before the first discovery).
    virtual std::shared_ptr<const ToolCatalog> Tools() const = 0;

    //==========================================================================================================
    // CallToolAsync
    // Purpose: Writes a tools/call request immediately and returns a future for its result.
    // Returns:
    //   Future resolving to the CallToolResult (isError=true for tool-level failures). The future
    //   throws errors::ProtocolError for JSON-RPC error replies, errors::SessionClosedError when the
    //   session closed while the call was pending, errors::TransportError when the stream broke.
    // Throws:
    //   errors::SessionClosedError / errors::InvalidStateError when the session is not Ready.
    //==========================================================================================================
    virtual std::future<CallToolResult> CallToolAsync(const std::string& name, const JSONValue& arguments) = 0;

    // Blocking form of CallToolAsync.
    virtual CallToolResult CallTool(const std::string& name, const JSONValue& arguments) = 0;

    // Moves to Closed and closes the transport; pending calls fail with SessionClosedError. Idempotent.
    virtual void Close() = 0;

    virtual SessionState State() const = 0;
};

//==========================================================================================================
// Session
// Purpose: Default ISession. Request ids are a monotonically increasing integer sequence starting at 1.
//==========================================================================================================
class Session : public ISession {
public:
    explicit Session(const Implementation& clientInfo, const SessionOptions& options = SessionOptions{});
    virtual ~Session();

    InitializeResult Connect(std::unique_ptr<ITransport> transport) override;
    std::shared_ptr<const ToolCatalog> ListTools() override;
    std::shared_ptr<const ToolCatalog> Tools() const override;
    std::future<CallToolResult> CallToolAsync(const std::string& name, const JSONValue& arguments) override;
    CallToolResult CallTool(const std::string& name, const JSONValue& arguments) override;
    void Close() override;
    SessionState State() const override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace stdiomcp
