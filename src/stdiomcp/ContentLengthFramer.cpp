//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ContentLengthFramer.cpp
// Purpose: Content-Length header framing (LSP-style) for pipe transports
//========================================================================================================

#include <algorithm>
#include <cctype>
#include <limits>
#include <optional>
#include <string>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "stdiomcp/ContentFramer.h"

namespace stdiomcp {

namespace {
constexpr std::size_t MaxHeaderBytes = 8 * 1024;
const std::string HeaderSeparator = "\r\n\r\n";

std::string trim(const std::string& s) {
    auto first = std::find_if(s.begin(), s.end(), [](unsigned char ch){ return !std::isspace(ch); });
    auto last = std::find_if(s.rbegin(), s.rend(), [](unsigned char ch){ return !std::isspace(ch); }).base();
    return (first < last) ? std::string(first, last) : std::string();
}

class ContentLengthFramer : public IContentFramer {
public:
    explicit ContentLengthFramer(std::size_t maxLen) : maxContentLength(maxLen) {}

    std::string encode(const std::string& payload) override {
        std::string frame = "Content-Length: " + std::to_string(payload.size()) + HeaderSeparator;
        frame.append(payload);
        return frame;
    }

    DecodeResult tryDecodeEx(const std::string& buffer) override {
        const std::size_t headerEnd = buffer.find(HeaderSeparator);
        if (headerEnd == std::string::npos) {
            if (buffer.size() > MaxHeaderBytes) {
                LOG_WARN("Content-Length header block exceeds {} bytes; dropping buffered bytes", MaxHeaderBytes);
                return { DecodeStatus::InvalidHeader, std::nullopt, buffer.size() };
            }
            return { DecodeStatus::Incomplete, std::nullopt, 0 };
        }
        const std::size_t headerAndSep = headerEnd + HeaderSeparator.size();

        std::optional<uint64_t> length;
        std::size_t pos = 0;
        while (pos < headerEnd) {
            std::size_t eol = buffer.find("\r\n", pos);
            if (eol == std::string::npos || eol > headerEnd) {
                eol = headerEnd;
            }
            const std::string line = buffer.substr(pos, eol - pos);
            pos = eol + 2;
            const auto colon = line.find(':');
            if (colon == std::string::npos) {
                continue;
            }
            std::string name = trim(line.substr(0, colon));
            std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
            if (name != "content-length") {
                continue;  // Content-Type and friends are ignored
            }
            const std::string value = trim(line.substr(colon + 1));
            length = ParseUnsigned(value);
            if (!length.has_value()) {
                LOG_WARN("Invalid Content-Length header: {}", value);
                return { DecodeStatus::InvalidHeader, std::nullopt, headerAndSep };
            }
        }

        if (!length.has_value()) {
            LOG_WARN("Missing Content-Length header");
            return { DecodeStatus::InvalidHeader, std::nullopt, headerAndSep };
        }
        if (length.value() > maxContentLength) {
            LOG_WARN("Content-Length {} exceeds limit {}", length.value(), maxContentLength);
            return { DecodeStatus::BodyTooLarge, std::nullopt, headerAndSep };
        }
        const std::size_t frameTotal = headerAndSep + static_cast<std::size_t>(length.value());
        if (buffer.size() < frameTotal) {
            return { DecodeStatus::Incomplete, std::nullopt, 0 };
        }
        return { DecodeStatus::Ok, buffer.substr(headerAndSep, static_cast<std::size_t>(length.value())), frameTotal };
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
    std::size_t maxContentLength;
};
} // namespace

std::unique_ptr<IContentFramer> MakeContentLengthFramer(std::size_t maxContentLength) {
    return std::make_unique<ContentLengthFramer>(maxContentLength);
}

} // namespace stdiomcp
