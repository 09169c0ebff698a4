//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: NewlineFramer.cpp
// Purpose: Newline-delimited JSON framer (MCP stdio framing) and framer selection
//========================================================================================================

#include <string>

#include "logging/Logger.h"
#include "dorismcp/ContentFramer.h"

namespace dorismcp {

namespace {
class NewlineFramer : public IContentFramer {
public:
    explicit NewlineFramer(std::size_t maxLen) : maxLineLength(maxLen) {}

    std::string encode(const std::string& payload) override {
        // Serialized JSON never contains a raw newline; strip any so the frame stays one line
        std::string frame;
        frame.reserve(payload.size() + 1);
        for (char c : payload) {
            if (c != '\n' && c != '\r') frame.push_back(c);
        }
        frame.push_back('\n');
        return frame;
    }

    DecodeResult tryDecodeEx(const std::string& buffer) override {
        std::size_t start = 0;
        while (true) {
            std::size_t eol = buffer.find('\n', start);
            if (eol == std::string::npos) {
                if (buffer.size() - start > maxLineLength) {
                    LOG_WARN("Unterminated line exceeds limit (max={})", maxLineLength);
                    return { DecodeStatus::BodyTooLarge, std::nullopt, buffer.size() };
                }
                return { DecodeStatus::Incomplete, std::nullopt, 0 };
            }
            std::size_t end = eol;
            if (end > start && buffer[end - 1] == '\r') --end;
            if (end == start) {
                // Blank line: skip and keep scanning
                start = eol + 1;
                continue;
            }
            if (end - start > maxLineLength) {
                LOG_WARN("Line of {} bytes exceeds limit (max={})", end - start, maxLineLength);
                return { DecodeStatus::BodyTooLarge, std::nullopt, eol + 1 };
            }
            return { DecodeStatus::Ok, buffer.substr(start, end - start), eol + 1 };
        }
    }

    std::optional<std::string> tryDecode(std::string& buffer) override {
        DecodeResult r = tryDecodeEx(buffer);
        if (r.status == DecodeStatus::Ok && r.payload.has_value()) {
            buffer.erase(0, r.bytesConsumed);
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

std::unique_ptr<IContentFramer> MakeFramer(StdioFraming framing, std::size_t maxFrameBytes) {
    switch (framing) {
        case StdioFraming::ContentLength: return MakeContentLengthFramer(maxFrameBytes);
        case StdioFraming::Newline: break;
    }
    return MakeNewlineFramer(maxFrameBytes);
}

} // namespace dorismcp
