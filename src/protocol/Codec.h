#pragma once

#include "protocol/Message.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace deskrelay::protocol {

struct CodecOptions {
    std::size_t max_frame_bytes = 16 * 1024 * 1024;
    std::size_t compress_threshold = 1024;  // 0 disables payload compression
};

/**
 * Wire layout, integers big-endian:
 *
 *   [u32 body_length][u16 header_length][header JSON][payload][binary]
 *
 * `body_length` counts every byte after itself. The header JSON carries the
 * version, type tag, ids, timestamp, payload encoding and lengths, and a
 * CRC-32 over payload and binary. The payload is a JSON object, zlib
 * compressed when larger than `compress_threshold`.
 */
class Codec {
public:
    static constexpr int kVersion = 1;
    static constexpr std::size_t kLengthPrefix = 4;
    static constexpr std::size_t kFixedHeader = kLengthPrefix + 2;

    explicit Codec(CodecOptions options = {});

    // Deterministic; throws std::length_error only for messages no frame can hold.
    std::string encode(const Message& message) const;

    // Throws MalformedMessage or UnknownMessageType.
    Message decode(std::string_view bytes) const;

    const CodecOptions& options() const noexcept { return options_; }

private:
    CodecOptions options_;
};

/**
 * Reframes a byte stream (e.g. a plain TCP socket) into encoded messages.
 * Each returned string is one complete frame, length prefix included,
 * ready for Codec::decode.
 */
class FrameReader {
public:
    explicit FrameReader(std::size_t max_frame_bytes = CodecOptions{}.max_frame_bytes);

    void append(std::string_view bytes);

    // Throws MalformedMessage when the next frame declares a length above the limit.
    std::optional<std::string> next();

    std::size_t buffered() const noexcept { return buffer_.size(); }

private:
    std::size_t max_frame_bytes_;
    std::string buffer_;
};

} // namespace deskrelay::protocol
