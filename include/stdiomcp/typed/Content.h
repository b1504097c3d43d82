//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Content.h
// Purpose: Helpers for building and reading text content items of tool results
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "stdiomcp/Protocol.h"

namespace stdiomcp {
namespace typed {

//------------------------------ Builders ------------------------------
inline JSONValue makeText(const std::string& text) {
    JSONValue::Object obj;
    obj["type"] = std::make_shared<JSONValue>(std::string("text"));
    obj["text"] = std::make_shared<JSONValue>(text);
    return JSONValue{obj};
}

inline CallToolResult makeTextResult(const std::string& text, bool isError = false) {
    CallToolResult r;
    r.content.push_back(makeText(text));
    r.isError = isError;
    return r;
}

//------------------------------ Inspectors ------------------------------
inline bool isText(const JSONValue& v) {
    const JSONValue* type = v.find("type");
    return type && type->isString() && std::get<std::string>(type->value) == "text";
}

inline std::optional<std::string> getText(const JSONValue& v) {
    if (!isText(v)) return std::nullopt;
    const JSONValue* text = v.find("text");
    if (!text || !text->isString()) return std::nullopt;
    return std::get<std::string>(text->value);
}

// Text of every text item, in order; non-text items (images, resources) are skipped.
inline std::vector<std::string> collectText(const std::vector<JSONValue>& arr) {
    std::vector<std::string> out;
    out.reserve(arr.size());
    for (const auto& v : arr) {
        auto t = getText(v);
        if (t.has_value()) out.push_back(t.value());
    }
    return out;
}

//------------------------------ From results ------------------------------
inline std::vector<std::string> collectText(const CallToolResult& r) {
    return collectText(r.content);
}

inline std::optional<std::string> firstText(const CallToolResult& r) {
    auto v = collectText(r);
    if (v.empty()) return std::nullopt;
    return v.front();
}

inline std::string joinText(const CallToolResult& r, const std::string& separator = "\n") {
    std::string out;
    bool first = true;
    for (const auto& t : collectText(r)) {
        if (!first) out += separator;
        out += t;
        first = false;
    }
    return out;
}

} // namespace typed
} // namespace stdiomcp
