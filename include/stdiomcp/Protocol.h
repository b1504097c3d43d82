//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: MCP protocol data types used by the stdio client (handshake, tools, launch descriptor)
//==========================================================================================================

#pragma once

#include <array>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "stdiomcp/JSONRPCTypes.h"

namespace stdiomcp {

// Protocol revision requested in initialize
constexpr const char* PROTOCOL_VERSION = "2025-06-18";

// Revisions this client accepts in the server's initialize acknowledgement
constexpr std::array<const char*, 4> SUPPORTED_PROTOCOL_VERSIONS = {
    "2025-11-25", "2025-06-18", "2025-03-26", "2024-11-05"
};

bool IsSupportedProtocolVersion(const std::string& version);

///////////////////////////////////////// Implementation ///////////////////////////////////////////
// Implementation information
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}
};

///////////////////////////////////////// Capabilities ///////////////////////////////////////////
struct ToolsCapability {
    bool listChanged = false;
};

// Only the tools capability matters to this client; absent means the server did not advertise tools.
struct ServerCapabilities {
    std::optional<ToolsCapability> tools;
};

//==========================================================================================================
// InitializeResult
// Purpose: What the server reported in its initialize acknowledgement.
//==========================================================================================================
struct InitializeResult {
    std::string protocolVersion;
    Implementation serverInfo;
    ServerCapabilities capabilities;
};

///////////////////////////////////////// Launch ///////////////////////////////////////////
//==========================================================================================================
// ServerConfig
// Purpose: Launch descriptor for an MCP server subprocess.
// Fields:
//   command: Executable path or name (resolved through PATH). Must be non-empty.
//   args: Arguments passed after the command, in order.
//   env: Variables overlaid onto the inherited environment; entries here win on collision.
//==========================================================================================================
struct ServerConfig {
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
};

///////////////////////////////////////// Tools ///////////////////////////////////////////
struct Tool {
    std::string name;
    std::string description;
    JSONValue inputSchema;  // JSON Schema for tool parameters

    Tool() = default;
    Tool(std::string name, std::string description, JSONValue inputSchema = JSONValue{})
        : name(std::move(name)), description(std::move(description)), inputSchema(std::move(inputSchema)) {}
};

// Tools keyed by name; published as an immutable snapshot and rebuilt on every discovery
using ToolCatalog = std::map<std::string, Tool>;

struct ToolsListResult {
    std::vector<Tool> tools;
    std::optional<std::string> nextCursor;
};

struct CallToolResult {
    std::vector<JSONValue> content;  // Array of content items
    bool isError = false;
    std::optional<JSONValue> structuredContent;
};

//==========================================================================================================
// SchemaProperty
// Purpose: One entry of a tool's inputSchema.properties, flattened for prompting.
//==========================================================================================================
struct SchemaProperty {
    std::string name;
    std::string type;  // empty when the schema does not declare one
    std::optional<std::string> description;
    bool required = false;
};

//==========================================================================================================
// DescribeInputSchema
// Purpose: Flattens inputSchema.properties (name order) and marks names listed in "required".
//          Property entries that are not objects are skipped.
//==========================================================================================================
std::vector<SchemaProperty> DescribeInputSchema(const JSONValue& inputSchema);

///////////////////////////////////////// Parsing ///////////////////////////////////////////
// Result parsers. Each throws errors::ProtocolError when the payload does not have the expected shape.
InitializeResult ParseInitializeResult(const JSONValue& result);
ToolsListResult ParseToolsListResult(const JSONValue& result);
CallToolResult ParseCallToolResult(const JSONValue& result);

///////////////////////////////////////// Method names ///////////////////////////////////////////
namespace Methods {
    // Client to server
    constexpr const char* Initialize = "initialize";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
    constexpr const char* Ping = "ping";

    // Notifications
    constexpr const char* Initialized = "notifications/initialized";
    constexpr const char* Log = "notifications/message";
    constexpr const char* ToolListChanged = "notifications/tools/list_changed";
    constexpr const char* Cancelled = "notifications/cancelled";
}

} // namespace stdiomcp
