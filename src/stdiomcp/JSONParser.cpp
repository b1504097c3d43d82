//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONParser.cpp
// Purpose: Recursive-descent JSON parser, compact serializer and JSON-RPC message (de)serialization
//==========================================================================================================

#include <cctype>
#include <cmath>
#include <format>
#include <sstream>
#include <stdexcept>

#include "stdiomcp/JSONRPCTypes.h"
#include "logging/Logger.h"

namespace stdiomcp {

//----------------------------------------------------------------------------------------------------------
// JSONValue special members (out-of-line definitions)
//----------------------------------------------------------------------------------------------------------
JSONValue::JSONValue() : value(nullptr) {}
JSONValue::JSONValue(const JSONValue&) = default;
JSONValue::JSONValue(JSONValue&&) noexcept = default;
JSONValue& JSONValue::operator=(const JSONValue&) = default;
JSONValue& JSONValue::operator=(JSONValue&&) noexcept = default;
JSONValue::~JSONValue() = default;

JSONValue::JSONValue(std::nullptr_t) : value(nullptr) {}
JSONValue::JSONValue(bool v) : value(v) {}
JSONValue::JSONValue(int64_t v) : value(v) {}
JSONValue::JSONValue(double v) : value(v) {}
JSONValue::JSONValue(const char* s) : value(std::string(s ? s : "")) {}
JSONValue::JSONValue(const std::string& s) : value(s) {}
JSONValue::JSONValue(std::string&& s) : value(std::move(s)) {}
JSONValue::JSONValue(const Array& a) : value(a) {}
JSONValue::JSONValue(Array&& a) : value(std::move(a)) {}
JSONValue::JSONValue(const Object& o) : value(o) {}
JSONValue::JSONValue(Object&& o) : value(std::move(o)) {}

const JSONValue* JSONValue::find(const std::string& key) const {
    if (!isObject()) {
        return nullptr;
    }
    const auto& obj = std::get<Object>(value);
    auto it = obj.find(key);
    if (it == obj.end() || !it->second) {
        return nullptr;
    }
    return it->second.get();
}

// -------------------------------
// Recursive JSON parser
// -------------------------------
namespace {
constexpr unsigned int MaxNestingDepth = 512u;

struct JsonParser {
    const std::string& s;
    std::size_t i{0};
    unsigned int depth{0};

    explicit JsonParser(const std::string& str) : s(str) {}

    [[noreturn]] void fail(const char* what) const {
        throw std::runtime_error(std::format("JSON parse error at offset {}: {}", i, what));
    }

    void skipWs() {
        while (i < s.size()) {
            char c = s[i];
            if (c == ' ' || c == '\t' || c == '\r' || c == '\n') { ++i; } else { break; }
        }
    }

    bool match(char c) {
        skipWs();
        if (i < s.size() && s[i] == c) { ++i; return true; }
        return false;
    }

    unsigned int parseHex4() {
        if (i + 4 > s.size()) fail("truncated unicode escape");
        unsigned int code = 0;
        for (int k = 0; k < 4; ++k) {
            char h = s[i++];
            code <<= 4;
            if (h >= '0' && h <= '9') code += static_cast<unsigned int>(h - '0');
            else if (h >= 'a' && h <= 'f') code += 10u + static_cast<unsigned int>(h - 'a');
            else if (h >= 'A' && h <= 'F') code += 10u + static_cast<unsigned int>(h - 'A');
            else fail("invalid hex digit in unicode escape");
        }
        return code;
    }

    static void appendUtf8(std::string& out, unsigned int code) {
        if (code <= 0x7F) {
            out.push_back(static_cast<char>(code));
        } else if (code <= 0x7FF) {
            out.push_back(static_cast<char>(0xC0 | ((code >> 6) & 0x1F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        } else if (code <= 0xFFFF) {
            out.push_back(static_cast<char>(0xE0 | ((code >> 12) & 0x0F)));
            out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | ((code >> 18) & 0x07)));
            out.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        }
    }

    std::string parseString() {
        skipWs();
        if (i >= s.size() || s[i] != '"') fail("expected '\"' at string start");
        ++i;
        std::string out;
        while (true) {
            if (i >= s.size()) fail("unterminated string");
            char c = s[i++];
            if (c == '"') break;
            if (static_cast<unsigned char>(c) < 0x20) fail("unescaped control character in string");
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (i >= s.size()) fail("invalid escape");
            char e = s[i++];
            switch (e) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/': out.push_back('/'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'u': {
                    unsigned int code = parseHex4();
                    // Combine UTF-16 surrogate pairs; a lone surrogate becomes U+FFFD
                    if (code >= 0xD800 && code <= 0xDBFF) {
                        if (i + 6 <= s.size() && s[i] == '\\' && s[i + 1] == 'u') {
                            i += 2;
                            unsigned int low = parseHex4();
                            if (low >= 0xDC00 && low <= 0xDFFF) {
                                code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
                            } else {
                                appendUtf8(out, 0xFFFD);
                                code = low;
                            }
                        } else {
                            code = 0xFFFD;
                        }
                    } else if (code >= 0xDC00 && code <= 0xDFFF) {
                        code = 0xFFFD;
                    }
                    appendUtf8(out, code);
                    break;
                }
                default: fail("unknown escape");
            }
        }
        return out;
    }

    JSONValue parseNumber() {
        std::size_t start = i;
        if (i < s.size() && s[i] == '-') ++i;
        std::size_t intStart = i;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        if (i == intStart) fail("expected value");
        bool isFloat = false;
        if (i < s.size() && s[i] == '.') {
            isFloat = true; ++i;
            std::size_t fracStart = i;
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
            if (i == fracStart) fail("expected digits after decimal point");
        }
        if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
            isFloat = true; ++i;
            if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;
            std::size_t expStart = i;
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
            if (i == expStart) fail("expected exponent digits");
        }
        std::string num = s.substr(start, i - start);
        if (!isFloat) {
            try {
                return JSONValue(static_cast<int64_t>(std::stoll(num)));
            } catch (const std::out_of_range&) {
                // Integers beyond int64 degrade to double
            }
        }
        try {
            return JSONValue(std::stod(num));
        } catch (const std::out_of_range&) {
            fail("number out of range");
        }
    }

    JSONValue parseArray() {
        ++i; // '['
        JSONValue::Array arr;
        if (match(']')) return JSONValue(std::move(arr));
        while (true) {
            arr.push_back(std::make_shared<JSONValue>(parseValue()));
            if (match(']')) break;
            if (!match(',')) fail("expected ',' or ']' in array");
        }
        return JSONValue(std::move(arr));
    }

    JSONValue parseObject() {
        ++i; // '{'
        JSONValue::Object obj;
        if (match('}')) return JSONValue(std::move(obj));
        while (true) {
            std::string key = parseString();
            if (!match(':')) fail("expected ':' after key");
            obj[key] = std::make_shared<JSONValue>(parseValue());
            if (match('}')) break;
            if (!match(',')) fail("expected ',' or '}' in object");
        }
        return JSONValue(std::move(obj));
    }

    JSONValue parseValue() {
        skipWs();
        if (i >= s.size()) fail("unexpected end of input");
        if (++depth > MaxNestingDepth) fail("nesting too deep");
        JSONValue out;
        char c = s[i];
        if (c == '"') {
            out = JSONValue(parseString());
        } else if (c == '{') {
            out = parseObject();
        } else if (c == '[') {
            out = parseArray();
        } else if (s.compare(i, 4, "true") == 0) {
            i += 4; out = JSONValue(true);
        } else if (s.compare(i, 5, "false") == 0) {
            i += 5; out = JSONValue(false);
        } else if (s.compare(i, 4, "null") == 0) {
            i += 4; out = JSONValue(nullptr);
        } else {
            out = parseNumber();
        }
        --depth;
        return out;
    }
};

void appendEscaped(std::string& out, const std::string& v) {
    out.push_back('"');
    for (char c : v) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += std::format("\\u{:04x}", static_cast<unsigned int>(static_cast<unsigned char>(c)));
                } else {
                    out.push_back(c);
                }
                break;
        }
    }
    out.push_back('"');
}

void appendJSON(std::string& out, const JSONValue& value) {
    std::visit([&out](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            out += "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            out += v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            out += std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            if (std::isfinite(v)) {
                out += std::format("{}", v);
            } else {
                out += "null";
            }
        } else if constexpr (std::is_same_v<T, std::string>) {
            appendEscaped(out, v);
        } else if constexpr (std::is_same_v<T, JSONValue::Array>) {
            out.push_back('[');
            for (std::size_t k = 0; k < v.size(); ++k) {
                if (k > 0) out.push_back(',');
                if (v[k]) { appendJSON(out, *v[k]); } else { out += "null"; }
            }
            out.push_back(']');
        } else if constexpr (std::is_same_v<T, JSONValue::Object>) {
            out.push_back('{');
            bool first = true;
            for (const auto& [key, val] : v) {
                if (!first) out.push_back(',');
                first = false;
                appendEscaped(out, key);
                out.push_back(':');
                if (val) { appendJSON(out, *val); } else { out += "null"; }
            }
            out.push_back('}');
        }
    }, value.get());
}

void appendId(std::string& out, const JSONRPCId& id) {
    std::visit([&out](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            appendEscaped(out, v);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            out += std::to_string(v);
        } else {
            out += "null";
        }
    }, id);
}

// Reads an id member; returns false when the value is not a legal JSON-RPC id.
bool readId(const JSONValue& v, JSONRPCId& id) {
    if (std::holds_alternative<std::string>(v.value)) {
        id = std::get<std::string>(v.value);
        return true;
    }
    if (std::holds_alternative<int64_t>(v.value)) {
        id = std::get<int64_t>(v.value);
        return true;
    }
    if (std::holds_alternative<std::nullptr_t>(v.value)) {
        id = nullptr;
        return true;
    }
    return false;
}

// Parses json and returns its top-level object, or nullopt (with a debug log) when it is not one.
std::optional<JSONValue> parseEnvelope(const std::string& json, const char* kind) {
    try {
        JSONValue doc = ParseJSON(json);
        if (!doc.isObject()) {
            LOG_DEBUG("{}: top-level JSON is not an object", kind);
            return std::nullopt;
        }
        return doc;
    } catch (const std::exception& e) {
        LOG_DEBUG("{}: {}", kind, e.what());
        return std::nullopt;
    }
}
} // namespace

JSONValue ParseJSON(const std::string& text) {
    JsonParser p(text);
    JSONValue v = p.parseValue();
    p.skipWs();
    if (p.i != text.size()) {
        p.fail("trailing characters after JSON value");
    }
    return v;
}

std::string SerializeJSON(const JSONValue& value) {
    std::string out;
    appendJSON(out, value);
    return out;
}

std::string IdToString(const JSONRPCId& id) {
    std::string out;
    std::visit([&out](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            out = v;
        } else if constexpr (std::is_same_v<T, int64_t>) {
            out = std::to_string(v);
        } else {
            out = "null";
        }
    }, id);
    return out;
}

// JSONRPCRequest implementation
std::string JSONRPCRequest::Serialize() const {
    FUNC_SCOPE();
    std::string out = "{\"jsonrpc\":";
    appendEscaped(out, jsonrpc);
    out += ",\"id\":";
    appendId(out, id);
    out += ",\"method\":";
    appendEscaped(out, method);
    if (params.has_value()) {
        out += ",\"params\":";
        appendJSON(out, params.value());
    }
    out.push_back('}');
    return out;
}

bool JSONRPCRequest::Deserialize(const std::string& json) {
    FUNC_SCOPE();
    auto doc = parseEnvelope(json, "JSONRPCRequest");
    if (!doc) {
        return false;
    }
    const JSONValue* m = doc->find("method");
    const JSONValue* idVal = doc->find("id");
    if (!m || !m->isString() || !idVal || !readId(*idVal, id)) {
        return false;
    }
    method = std::get<std::string>(m->value);
    if (const JSONValue* p = doc->find("params")) {
        params = *p;
    }
    return !method.empty();
}

// JSONRPCResponse implementation
std::string JSONRPCResponse::Serialize() const {
    FUNC_SCOPE();
    std::string out = "{\"jsonrpc\":";
    appendEscaped(out, jsonrpc);
    out += ",\"id\":";
    appendId(out, id);
    if (result.has_value()) {
        out += ",\"result\":";
        appendJSON(out, result.value());
    }
    if (error.has_value()) {
        out += ",\"error\":";
        appendJSON(out, error.value());
    }
    out.push_back('}');
    return out;
}

bool JSONRPCResponse::Deserialize(const std::string& json) {
    FUNC_SCOPE();
    auto doc = parseEnvelope(json, "JSONRPCResponse");
    if (!doc) {
        return false;
    }
    const JSONValue* idVal = doc->find("id");
    if (!idVal || !readId(*idVal, id)) {
        return false;
    }
    const JSONValue* r = doc->find("result");
    const JSONValue* e = doc->find("error");
    if (!r && !e) {
        return false;
    }
    if (r) {
        result = *r;
    }
    if (e) {
        error = *e;
    }
    return true;
}

// JSONRPCNotification implementation
std::string JSONRPCNotification::Serialize() const {
    FUNC_SCOPE();
    std::string out = "{\"jsonrpc\":";
    appendEscaped(out, jsonrpc);
    out += ",\"method\":";
    appendEscaped(out, method);
    if (params.has_value()) {
        out += ",\"params\":";
        appendJSON(out, params.value());
    }
    out.push_back('}');
    return out;
}

bool JSONRPCNotification::Deserialize(const std::string& json) {
    FUNC_SCOPE();
    auto doc = parseEnvelope(json, "JSONRPCNotification");
    if (!doc) {
        return false;
    }
    const JSONValue* m = doc->find("method");
    if (!m || !m->isString() || doc->find("id") != nullptr) {
        return false;
    }
    method = std::get<std::string>(m->value);
    if (const JSONValue* p = doc->find("params")) {
        params = *p;
    }
    return !method.empty();
}

// Utility functions
JSONValue CreateErrorObject(int code, const std::string& message,
                            const std::optional<JSONValue>& data) {
    FUNC_SCOPE();
    JSONValue::Object errorObj;
    errorObj["code"] = std::make_shared<JSONValue>(static_cast<int64_t>(code));
    errorObj["message"] = std::make_shared<JSONValue>(message);
    if (data.has_value()) {
        errorObj["data"] = std::make_shared<JSONValue>(data.value());
    }
    return JSONValue(std::move(errorObj));
}

std::unique_ptr<JSONRPCResponse> CreateErrorResponse(
    const JSONRPCId& id, int code, const std::string& message,
    const std::optional<JSONValue>& data) {
    FUNC_SCOPE();
    auto response = std::make_unique<JSONRPCResponse>();
    response->id = id;
    response->error = CreateErrorObject(code, message, data);
    return response;
}

} // namespace stdiomcp
