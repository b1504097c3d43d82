//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.cpp
// Purpose: Parsing of initialize / tools/list / tools/call results and input schema flattening
//==========================================================================================================

#include <algorithm>
#include <set>
#include <string>

#include "logging/Logger.h"
#include "stdiomcp/Protocol.h"
#include "stdiomcp/errors/Errors.h"

namespace stdiomcp {

namespace {
std::optional<std::string> optionalString(const JSONValue& obj, const char* key) {
    const JSONValue* v = obj.find(key);
    if (v && v->isString()) {
        return std::get<std::string>(v->value);
    }
    return std::nullopt;
}

bool optionalBool(const JSONValue& obj, const char* key, bool fallback) {
    const JSONValue* v = obj.find(key);
    if (v && std::holds_alternative<bool>(v->value)) {
        return std::get<bool>(v->value);
    }
    return fallback;
}

ServerCapabilities parseServerCapabilities(const JSONValue& caps) {
    ServerCapabilities out;
    if (!caps.isObject()) {
        return out;
    }
    if (const JSONValue* tools = caps.find("tools")) {
        out.tools = ToolsCapability{optionalBool(*tools, "listChanged", false)};
    }
    return out;
}
} // namespace

bool IsSupportedProtocolVersion(const std::string& version) {
    return std::any_of(SUPPORTED_PROTOCOL_VERSIONS.begin(), SUPPORTED_PROTOCOL_VERSIONS.end(),
                       [&](const char* v) { return version == v; });
}

InitializeResult ParseInitializeResult(const JSONValue& result) {
    FUNC_SCOPE();
    if (!result.isObject()) {
        throw errors::ProtocolError("initialize result is not an object");
    }
    auto version = optionalString(result, "protocolVersion");
    if (!version.has_value()) {
        throw errors::ProtocolError("initialize result is missing protocolVersion");
    }
    InitializeResult out;
    out.protocolVersion = version.value();
    if (const JSONValue* info = result.find("serverInfo")) {
        out.serverInfo.name = optionalString(*info, "name").value_or("");
        out.serverInfo.version = optionalString(*info, "version").value_or("");
    }
    if (const JSONValue* caps = result.find("capabilities")) {
        out.capabilities = parseServerCapabilities(*caps);
    }
    return out;
}

ToolsListResult ParseToolsListResult(const JSONValue& result) {
    FUNC_SCOPE();
    const JSONValue* toolsVal = result.find("tools");
    if (!toolsVal || !toolsVal->isArray()) {
        throw errors::ProtocolError("tools/list result is missing the tools array");
    }
    ToolsListResult out;
    for (const auto& item : std::get<JSONValue::Array>(toolsVal->value)) {
        if (!item || !item->isObject()) {
            throw errors::ProtocolError("tools/list entry is not an object");
        }
        auto name = optionalString(*item, "name");
        if (!name.has_value() || name->empty()) {
            throw errors::ProtocolError("tools/list entry has no name");
        }
        Tool tool;
        tool.name = name.value();
        tool.description = optionalString(*item, "description").value_or("");
        if (const JSONValue* schema = item->find("inputSchema")) {
            tool.inputSchema = *schema;
        } else {
            tool.inputSchema = JSONValue{JSONValue::Object{}};
        }
        out.tools.push_back(std::move(tool));
    }
    out.nextCursor = optionalString(result, "nextCursor");
    return out;
}

CallToolResult ParseCallToolResult(const JSONValue& result) {
    FUNC_SCOPE();
    if (!result.isObject()) {
        throw errors::ProtocolError("tools/call result is not an object");
    }
    CallToolResult out;
    if (const JSONValue* content = result.find("content")) {
        if (!content->isArray()) {
            throw errors::ProtocolError("tools/call result content is not an array");
        }
        for (const auto& item : std::get<JSONValue::Array>(content->value)) {
            out.content.push_back(item ? *item : JSONValue{});
        }
    }
    out.isError = optionalBool(result, "isError", false);
    if (const JSONValue* structured = result.find("structuredContent")) {
        out.structuredContent = *structured;
    }
    return out;
}

std::vector<SchemaProperty> DescribeInputSchema(const JSONValue& inputSchema) {
    std::vector<SchemaProperty> out;
    std::set<std::string> required;
    if (const JSONValue* req = inputSchema.find("required"); req && req->isArray()) {
        for (const auto& r : std::get<JSONValue::Array>(req->value)) {
            if (r && r->isString()) {
                required.insert(std::get<std::string>(r->value));
            }
        }
    }
    const JSONValue* props = inputSchema.find("properties");
    if (!props || !props->isObject()) {
        return out;
    }
    for (const auto& [name, schema] : std::get<JSONValue::Object>(props->value)) {
        if (!schema || !schema->isObject()) {
            LOG_DEBUG("Skipping schema property '{}' without an object definition", name);
            continue;
        }
        SchemaProperty p;
        p.name = name;
        p.type = optionalString(*schema, "type").value_or("");
        p.description = optionalString(*schema, "description");
        p.required = required.count(name) > 0;
        out.push_back(std::move(p));
    }
    return out;
}

} // namespace stdiomcp
