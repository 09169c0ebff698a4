//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ContentLengthFramer.cpp
// Purpose: Content-Length header framer for the stdio transport
//========================================================================================================

#include <cctype>
#include <charconv>
#include <optional>
#include <string>
#include <string_view>

#include "logging/Logger.h"
#include "dorismcp/ContentFramer.h"

namespace dorismcp {

namespace {

constexpr std::string_view kHeaderTerminator = "\r\n\r\n";
constexpr std::string_view kLineBreak = "\r\n";

std::string_view trimmed(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

bool equalsIgnoreCase(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

// Outcome of reading the header block that precedes a body
struct HeaderScan {
    IContentFramer::DecodeStatus status{IContentFramer::DecodeStatus::Ok};
    std::size_t length{0};
};

//========================================================================================================
// scanHeaders
// Purpose: Finds the Content-Length value among the header lines. Other headers are ignored; the last
//          Content-Length line wins.
//========================================================================================================
HeaderScan scanHeaders(std::string_view block, std::size_t maxLength) {
    using Status = IContentFramer::DecodeStatus;
    std::optional<std::string_view> lengthText;
    while (!block.empty()) {
        const std::size_t eol = block.find(kLineBreak);
        const std::string_view line = block.substr(0, eol);
        block = (eol == std::string_view::npos) ? std::string_view{} : block.substr(eol + kLineBreak.size());

        const std::size_t colon = line.find(':');
        if (colon == std::string_view::npos) continue;
        if (equalsIgnoreCase(trimmed(line.substr(0, colon)), "content-length")) {
            lengthText = trimmed(line.substr(colon + 1));
        }
    }

    if (!lengthText) {
        LOG_WARN("Missing Content-Length header");
        return { Status::InvalidHeader, 0 };
    }

    const std::string_view text = *lengthText;
    unsigned long long value = 0;
    const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || end != text.data() + text.size() || (ec != std::errc{} && ec != std::errc::result_out_of_range)) {
        LOG_WARN("Invalid Content-Length header: {}", text);
        return { Status::InvalidHeader, 0 };
    }
    if (ec == std::errc::result_out_of_range || value > maxLength) {
        LOG_WARN("Content-Length {} exceeds limits (max={})", text, maxLength);
        return { Status::BodyTooLarge, 0 };
    }
    return { Status::Ok, static_cast<std::size_t>(value) };
}

class ContentLengthFramer : public IContentFramer {
public:
    explicit ContentLengthFramer(std::size_t maxLen) : maxContentLength(maxLen) {}

    std::string encode(const std::string& payload) override {
        std::string frame = "Content-Length: " + std::to_string(payload.size());
        frame.append(kHeaderTerminator);
        frame.append(payload);
        return frame;
    }

    DecodeResult tryDecodeEx(const std::string& buffer) override {
        const std::string_view view(buffer);
        const std::size_t headerEnd = view.find(kHeaderTerminator);
        if (headerEnd == std::string_view::npos) {
            return { DecodeStatus::Incomplete, std::nullopt, 0 };
        }
        const std::size_t bodyStart = headerEnd + kHeaderTerminator.size();

        const HeaderScan scan = scanHeaders(view.substr(0, headerEnd), maxContentLength);
        if (scan.status != DecodeStatus::Ok) {
            // Drop the bad header block so the next frame can be found
            return { scan.status, std::nullopt, bodyStart };
        }
        if (view.size() - bodyStart < scan.length) {
            return { DecodeStatus::Incomplete, std::nullopt, 0 };
        }
        return { DecodeStatus::Ok, buffer.substr(bodyStart, scan.length), bodyStart + scan.length };
    }

    std::optional<std::string> tryDecode(std::string& buffer) override {
        DecodeResult r = tryDecodeEx(buffer);
        if (r.status != DecodeStatus::Ok) return std::nullopt;
        buffer.erase(0, r.bytesConsumed);
        return std::move(r.payload);
    }

private:
    std::size_t maxContentLength;
};

} // namespace

std::unique_ptr<IContentFramer> MakeContentLengthFramer(std::size_t maxContentLength) {
    return std::make_unique<ContentLengthFramer>(maxContentLength);
}

} // namespace dorismcp
