//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ContentFramer.h
// Purpose: Interface for message framing on a byte stream (MCP stdio framing)
//========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <memory>

namespace stdiomcp {

class IContentFramer {
public:
    virtual ~IContentFramer() = default;
    enum class DecodeStatus {
        Ok,
        Incomplete,
        InvalidHeader,
        BodyTooLarge
    };
    struct DecodeResult {
        DecodeStatus status;
        std::optional<std::string> payload; // present when status==Ok
        std::size_t bytesConsumed{0};       // bytes to drop from the buffer (frame, or the bad prefix)
    };
    virtual std::string encode(const std::string& payload) = 0;
    virtual std::optional<std::string> tryDecode(std::string& buffer) = 0;
    virtual DecodeResult tryDecodeEx(const std::string& buffer) = 0;
};

// Which framer a pipe transport uses
enum class FramingMode {
    NewlineDelimited,  // one JSON message per line (MCP stdio)
    ContentLength      // "Content-Length: N\r\n\r\n" header then N bytes
};

constexpr std::size_t DefaultMaxFrameBytes = 4 * 1024 * 1024;

std::unique_ptr<IContentFramer> MakeContentLengthFramer(std::size_t maxContentLength = DefaultMaxFrameBytes);
std::unique_ptr<IContentFramer> MakeNewlineFramer(std::size_t maxLineLength = DefaultMaxFrameBytes);
std::unique_ptr<IContentFramer> MakeFramer(FramingMode mode, std::size_t maxFrameBytes = DefaultMaxFrameBytes);

// Parses "ndjson"/"newline" or "content-length" (case-insensitive); nullopt otherwise.
std::optional<FramingMode> FramingModeFromString(const std::string& text);

} // namespace stdiomcp
