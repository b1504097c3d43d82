//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: NewlineFramer.cpp
// Purpose: Newline-delimited JSON framing (MCP stdio) and framer selection helpers
//========================================================================================================

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>

#include "logging/Logger.h"
#include "stdiomcp/ContentFramer.h"

namespace stdiomcp {

namespace {
bool isBlank(const std::string& s, std::size_t begin, std::size_t end) {
    for (std::size_t k = begin; k < end; ++k) {
        if (!std::isspace(static_cast<unsigned char>(s[k]))) {
            return false;
        }
    }
    return true;
}

//==========================================================================================================
// NewlineFramer
// Purpose: One message per line. A trailing '\r' is stripped; blank lines are skipped. Serialized
//          messages never contain a raw newline, so no escaping is needed on encode.
//==========================================================================================================
class NewlineFramer : public IContentFramer {
public:
    explicit NewlineFramer(std::size_t maxLen) : maxLineLength(maxLen) {}

    std::string encode(const std::string& payload) override {
        std::string frame;
        frame.reserve(payload.size() + 1);
        frame.append(payload);
        frame.push_back('\n');
        return frame;
    }

    DecodeResult tryDecodeEx(const std::string& buffer) override {
        std::size_t start = 0;
        while (true) {
            const std::size_t eol = buffer.find('\n', start);
            if (eol == std::string::npos) {
                if (buffer.size() - start > maxLineLength) {
                    LOG_WARN("Inbound line exceeds {} bytes without a newline; dropping it", maxLineLength);
                    return { DecodeStatus::BodyTooLarge, std::nullopt, buffer.size() };
                }
                // Leading blank lines can be dropped even while the next line is incomplete
                return { DecodeStatus::Incomplete, std::nullopt, start };
            }
            std::size_t end = eol;
            if (end > start && buffer[end - 1] == '\r') {
                --end;
            }
            if (isBlank(buffer, start, end)) {
                start = eol + 1;
                continue;
            }
            if (end - start > maxLineLength) {
                LOG_WARN("Inbound line of {} bytes exceeds limit {}", end - start, maxLineLength);
                return { DecodeStatus::BodyTooLarge, std::nullopt, eol + 1 };
            }
            return { DecodeStatus::Ok, buffer.substr(start, end - start), eol + 1 };
        }
    }

    std::optional<std::string> tryDecode(std::string& buffer) override {
        DecodeResult r = tryDecodeEx(buffer);
        if (r.bytesConsumed > 0) {
            buffer.erase(0, std::min(r.bytesConsumed, buffer.size()));
        }
        if (r.status == DecodeStatus::Ok) {
            return r.payload;
        }
        return std::nullopt;
    }

private:
    std::size_t maxLineLength;
};
} // namespace

std::unique_ptr<IContentFramer> MakeNewlineFramer(std::size_t maxLineLength) {
    return std::make_unique<NewlineFramer>(maxLineLength);
}

std::unique_ptr<IContentFramer> MakeFramer(FramingMode mode, std::size_t maxFrameBytes) {
    switch (mode) {
        case FramingMode::ContentLength: return MakeContentLengthFramer(maxFrameBytes);
        case FramingMode::NewlineDelimited: break;
    }
    return MakeNewlineFramer(maxFrameBytes);
}

std::optional<FramingMode> FramingModeFromString(const std::string& text) {
    std::string s; s.reserve(text.size());
    for (char c : text) s.push_back(static_cast<char>(::tolower(static_cast<unsigned char>(c))));
    if (s == "ndjson" || s == "newline" || s == "jsonl") {
        return FramingMode::NewlineDelimited;
    }
    if (s == "content-length" || s == "contentlength" || s == "lsp") {
        return FramingMode::ContentLength;
    }
    return std::nullopt;
}

} // namespace stdiomcp
