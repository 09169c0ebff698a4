//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ContentFramer.h
// Purpose: Interface for message framing on the stdio byte stream
//========================================================================================================

#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include "dorismcp/Config.h"

namespace dorismcp {

//========================================================================================================
// IContentFramer
// Purpose: Splits a byte stream into message payloads and wraps outbound payloads into frames.
// Methods:
//   encode(payload): Full frame for one message.
//   tryDecodeEx(buffer): Inspect the front of buffer without modifying it. On Ok, payload holds the
//                        message and bytesConsumed the frame length. On InvalidHeader/BodyTooLarge,
//                        bytesConsumed is how much to drop to resynchronize (always > 0).
//   tryDecode(buffer): Convenience that erases a decoded frame from buffer.
//========================================================================================================
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
        std::size_t bytesConsumed{0};
    };
    virtual std::string encode(const std::string& payload) = 0;
    virtual std::optional<std::string> tryDecode(std::string& buffer) = 0;
    virtual DecodeResult tryDecodeEx(const std::string& buffer) = 0;
};

// "Content-Length: N\r\n\r\n<payload>" framing
std::unique_ptr<IContentFramer> MakeContentLengthFramer(std::size_t maxContentLength = 1024 * 1024);

// One message per '\n'-terminated line (trailing '\r' and blank lines are ignored)
std::unique_ptr<IContentFramer> MakeNewlineFramer(std::size_t maxLineLength = 1024 * 1024);

// Framer for the configured stdio framing
std::unique_ptr<IContentFramer> MakeFramer(StdioFraming framing, std::size_t maxFrameBytes);

} // namespace dorismcp
