#include "protocol/Codec.h"

#include "protocol/ProtocolError.h"

#include <boost/json.hpp>
#include <zlib.h>

#include <limits>
#include <stdexcept>

namespace deskrelay::protocol {

namespace json = boost::json;

namespace {

constexpr const char* kEncNone = "none";
constexpr const char* kEncZlib = "zlib";

void put_u32(std::string& out, std::uint32_t v) {
    out.push_back(static_cast<char>((v >> 24) & 0xFF));
    out.push_back(static_cast<char>((v >> 16) & 0xFF));
    out.push_back(static_cast<char>((v >> 8) & 0xFF));
    out.push_back(static_cast<char>(v & 0xFF));
}

void put_u16(std::string& out, std::uint16_t v) {
    out.push_back(static_cast<char>((v >> 8) & 0xFF));
    out.push_back(static_cast<char>(v & 0xFF));
}

std::uint32_t get_u32(std::string_view in, std::size_t at) {
    auto b = [&](std::size_t i) { return static_cast<std::uint32_t>(static_cast<unsigned char>(in[at + i])); };
    return (b(0) << 24) | (b(1) << 16) | (b(2) << 8) | b(3);
}

std::uint16_t get_u16(std::string_view in, std::size_t at) {
    auto b = [&](std::size_t i) { return static_cast<std::uint16_t>(static_cast<unsigned char>(in[at + i])); };
    return static_cast<std::uint16_t>((b(0) << 8) | b(1));
}

std::uint32_t crc_of(std::string_view payload, std::string_view binary) {
    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, reinterpret_cast<const Bytef*>(payload.data()), static_cast<uInt>(payload.size()));
    crc = crc32(crc, reinterpret_cast<const Bytef*>(binary.data()), static_cast<uInt>(binary.size()));
    return static_cast<std::uint32_t>(crc);
}

std::optional<std::string> zlib_compress(const std::string& text) {
    uLongf bound = compressBound(static_cast<uLong>(text.size()));
    std::string out(bound, '\0');
    int rc = compress2(reinterpret_cast<Bytef*>(out.data()), &bound,
                       reinterpret_cast<const Bytef*>(text.data()), static_cast<uLong>(text.size()),
                       Z_DEFAULT_COMPRESSION);
    if (rc != Z_OK) return std::nullopt;
    out.resize(bound);
    return out;
}

std::string zlib_uncompress(std::string_view data, std::size_t raw_size) {
    std::string out(raw_size, '\0');
    uLongf out_len = static_cast<uLongf>(raw_size);
    int rc = uncompress(reinterpret_cast<Bytef*>(out.data()), &out_len,
                        reinterpret_cast<const Bytef*>(data.data()), static_cast<uLong>(data.size()));
    if (rc != Z_OK || out_len != raw_size) throw MalformedMessage("payload does not decompress");
    return out;
}

const json::value& header_field(const json::object& header, const char* key) {
    const json::value* v = header.if_contains(key);
    if (!v) throw MalformedMessage(std::string("header lacks '") + key + "'");
    return *v;
}

std::string header_string(const json::object& header, const char* key) {
    const auto& v = header_field(header, key);
    if (!v.is_string()) throw MalformedMessage(std::string("header '") + key + "' is not a string");
    return json::value_to<std::string>(v);
}

std::int64_t header_int(const json::object& header, const char* key) {
    const auto& v = header_field(header, key);
    if (v.is_int64()) return v.as_int64();
    if (v.is_uint64() && v.as_uint64() <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        return static_cast<std::int64_t>(v.as_uint64());
    }
    throw MalformedMessage(std::string("header '") + key + "' is not an integer");
}

std::uint64_t header_uint(const json::object& header, const char* key) {
    std::int64_t v = header_int(header, key);
    if (v < 0) throw MalformedMessage(std::string("header '") + key + "' is negative");
    return static_cast<std::uint64_t>(v);
}

} // namespace

Codec::Codec(CodecOptions options)
    : options_(options) {}

std::string Codec::encode(const Message& message) const {
    const std::string payload_text = json::serialize(message.payload);

    std::string payload = payload_text;
    const char* enc = kEncNone;
    if (options_.compress_threshold > 0 && payload_text.size() > options_.compress_threshold) {
        if (auto packed = zlib_compress(payload_text); packed && packed->size() < payload_text.size()) {
            payload = std::move(*packed);
            enc = kEncZlib;
        }
    }

    json::object header{
        {"v", kVersion},
        {"type", to_string(message.type)},
        {"id", message.message_id},
        {"sid", message.session_id},
        {"ts", message.timestamp_ms},
        {"enc", enc},
        {"raw", static_cast<std::uint64_t>(payload_text.size())},
        {"plen", static_cast<std::uint64_t>(payload.size())},
        {"blen", static_cast<std::uint64_t>(message.binary.size())},
        {"crc", static_cast<std::uint64_t>(crc_of(payload, message.binary))}
    };
    const std::string header_text = json::serialize(header);

    if (header_text.size() > std::numeric_limits<std::uint16_t>::max()) {
        throw std::length_error("message header too large");
    }
    const std::size_t body = 2 + header_text.size() + payload.size() + message.binary.size();
    if (body > std::numeric_limits<std::uint32_t>::max()) {
        throw std::length_error("message too large");
    }

    std::string out;
    out.reserve(kLengthPrefix + body);
    put_u32(out, static_cast<std::uint32_t>(body));
    put_u16(out, static_cast<std::uint16_t>(header_text.size()));
    out += header_text;
    out += payload;
    out += message.binary;
    return out;
}

Message Codec::decode(std::string_view bytes) const {
    if (bytes.size() < kFixedHeader) throw MalformedMessage("truncated frame");
    if (bytes.size() - kLengthPrefix > options_.max_frame_bytes) throw MalformedMessage("frame exceeds size limit");

    const std::uint32_t body = get_u32(bytes, 0);
    if (static_cast<std::size_t>(body) != bytes.size() - kLengthPrefix) {
        throw MalformedMessage("frame length mismatch");
    }

    const std::size_t header_len = get_u16(bytes, kLengthPrefix);
    if (kFixedHeader + header_len > bytes.size()) throw MalformedMessage("header overruns frame");

    boost::system::error_code ec;
    json::value header_value = json::parse(bytes.substr(kFixedHeader, header_len), ec);
    if (ec || !header_value.is_object()) throw MalformedMessage("header is not a JSON object");
    const auto& header = header_value.as_object();

    if (header_int(header, "v") != kVersion) throw MalformedMessage("unsupported protocol version");

    const std::string type_tag = header_string(header, "type");
    const std::string enc = header_string(header, "enc");
    const std::uint64_t raw = header_uint(header, "raw");
    const std::uint64_t plen = header_uint(header, "plen");
    const std::uint64_t blen = header_uint(header, "blen");
    const std::uint64_t crc = header_uint(header, "crc");

    const std::size_t rest = bytes.size() - kFixedHeader - header_len;
    if (plen > rest || blen != rest - plen) throw MalformedMessage("payload lengths do not match frame");

    const std::string_view payload_bytes = bytes.substr(kFixedHeader + header_len, plen);
    const std::string_view binary_bytes = bytes.substr(kFixedHeader + header_len + plen, blen);
    if (crc != crc_of(payload_bytes, binary_bytes)) throw MalformedMessage("checksum mismatch");

    auto type = type_from_string(type_tag);
    if (!type) throw UnknownMessageType(type_tag);

    std::string payload_text;
    if (enc == kEncNone) {
        payload_text.assign(payload_bytes);
    } else if (enc == kEncZlib) {
        if (raw > options_.max_frame_bytes) throw MalformedMessage("payload exceeds size limit");
        payload_text = zlib_uncompress(payload_bytes, static_cast<std::size_t>(raw));
    } else {
        throw MalformedMessage("unknown payload encoding '" + enc + "'");
    }

    json::value payload_value = json::parse(payload_text, ec);
    if (ec || !payload_value.is_object()) throw MalformedMessage("payload is not a JSON object");

    Message m;
    m.type = *type;
    m.message_id = header_string(header, "id");
    m.session_id = header_string(header, "sid");
    m.timestamp_ms = header_int(header, "ts");
    m.payload = std::move(payload_value.as_object());
    m.binary.assign(binary_bytes);
    return m;
}

FrameReader::FrameReader(std::size_t max_frame_bytes)
    : max_frame_bytes_(max_frame_bytes) {}

void FrameReader::append(std::string_view bytes) {
    buffer_.append(bytes.data(), bytes.size());
}

std::optional<std::string> FrameReader::next() {
    if (buffer_.size() < Codec::kLengthPrefix) return std::nullopt;

    const std::uint32_t body = get_u32(buffer_, 0);
    if (body > max_frame_bytes_) throw MalformedMessage("frame exceeds size limit");

    const std::size_t total = Codec::kLengthPrefix + body;
    if (buffer_.size() < total) return std::nullopt;

    std::string frame = buffer_.substr(0, total);
    buffer_.erase(0, total);
    return frame;
}

} // namespace deskrelay::protocol
