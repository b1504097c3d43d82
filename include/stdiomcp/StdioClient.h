//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioClient.h
// Purpose: Session lifecycle manager - launches an MCP server subprocess and owns its session
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "stdiomcp/ContentFramer.h"
#include "stdiomcp/JSONRPCTypes.h"
#include "stdiomcp/Process.hpp"
#include "stdiomcp/Protocol.h"

namespace stdiomcp {

//==========================================================================================================
// IToolClient
// Purpose: What an interactive front end needs from a connected client: the tool catalog and calls.
//==========================================================================================================
class IToolClient {
public:
    virtual ~IToolClient() = default;

    // Current catalog snapshot (never null).
    virtual std::shared_ptr<const ToolCatalog> Tools() const = 0;

    //==========================================================================================================
    // CallTool
    // Purpose: Invokes a tool by name.
    // Throws:
    //   errors::UnknownToolError when name is not in the catalog (nothing is sent);
    //   errors::ProtocolError / errors::TransportError / errors::SessionClosedError from the session.
    //==========================================================================================================
    virtual CallToolResult CallTool(const std::string& name, const JSONValue& arguments) = 0;
};

//==========================================================================================================
// ClientOptions
// Fields:
//   clientInfo: Sent in initialize (defaults to stdio-mcp-client / library version).
//   terminateTimeout: Wait after SIGTERM before escalating to SIGKILL.
//   killTimeout: Wait after SIGKILL.
//   initializeTimeout: Handshake bound (0 = unbounded).
//   requestTimeoutMs: Per-request bound for tools/list and tools/call (0 = unbounded).
//   framing: Wire framing toward the server.
//   stderrMode: Whether the server's stderr reaches the user's terminal.
//==========================================================================================================
struct ClientOptions {
    Implementation clientInfo;
    std::chrono::milliseconds terminateTimeout{2000};
    std::chrono::milliseconds killTimeout{2000};
    std::chrono::milliseconds initializeTimeout{30000};
    uint64_t requestTimeoutMs{0};
    FramingMode framing{FramingMode::NewlineDelimited};
    StderrMode stderrMode{StderrMode::Inherit};

    ClientOptions();

    // Defaults overridden by the STDIOMCP_* environment variables; malformed values are logged and ignored.
    static ClientOptions FromEnvironment();
};

//==========================================================================================================
// StdioClient
// Purpose: Owns one MCP server subprocess and the session talking to it.
// Notes:
//   - Close() is idempotent and safe before or without ConnectToServer; the destructor calls it.
//   - A failed ConnectToServer leaves no child process running.
//==========================================================================================================
class StdioClient : public IToolClient {
public:
    explicit StdioClient(ClientOptions options = ClientOptions{});
    virtual ~StdioClient();

    StdioClient(const StdioClient&) = delete;
    StdioClient& operator=(const StdioClient&) = delete;

    //==========================================================================================================
    // ConnectToServer
    // Purpose: Launch the server, attach a pipe transport, run the handshake and discover tools.
    // Args:
    //   config: Launch descriptor.
    // Throws:
    //   errors::LaunchError (propagated unchanged); errors::HandshakeError, errors::ProtocolError or
    //   errors::TransportError from handshake/discovery, raised only after the process has been killed
    //   and reaped; errors::InvalidStateError when already connected or closed.
    //==========================================================================================================
    void ConnectToServer(const ServerConfig& config);

    std::shared_ptr<const ToolCatalog> Tools() const override;

    // Catalog entry for name, if present.
    std::optional<Tool> FindTool(const std::string& name) const;

    CallToolResult CallTool(const std::string& name, const JSONValue& arguments) override;

    // Re-runs discovery and replaces the catalog wholesale.
    std::shared_ptr<const ToolCatalog> RefreshTools();

    //==========================================================================================================
    // Close
    // Purpose: Closes the session, then SIGTERM -> wait terminateTimeout -> SIGKILL -> wait killTimeout.
    //          Errors are logged, never thrown.
    //==========================================================================================================
    void Close() noexcept;

    // Pid of the launched server; retained after Close for diagnostics.
    std::optional<int> ServerPid() const;

    bool IsServerAlive() const;

    // True between a successful ConnectToServer and Close.
    bool IsConnected() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace stdiomcp
