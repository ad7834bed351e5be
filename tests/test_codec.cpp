#include <catch2/catch.hpp>

#include "protocol/Codec.h"
#include "protocol/Payloads.h"
#include "protocol/ProtocolError.h"

#include <boost/json.hpp>

#include <random>

using namespace deskrelay::protocol;
namespace json = boost::json;

namespace {

std::string random_bytes(std::size_t n, unsigned seed) {
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> dist(0, 255);
    std::string out(n, '\0');
    for (auto& c : out) c = static_cast<char>(dist(rng));
    return out;
}

// Rewrites the header JSON of an encoded frame and fixes up the length fields.
std::string with_header(const std::string& frame, const json::object& header) {
    const std::size_t old_len = (static_cast<unsigned char>(frame[4]) << 8) | static_cast<unsigned char>(frame[5]);
    const std::string tail = frame.substr(Codec::kFixedHeader + old_len);
    const std::string h = json::serialize(header);

    std::string out;
    const std::uint32_t body = static_cast<std::uint32_t>(2 + h.size() + tail.size());
    out.push_back(static_cast<char>(body >> 24));
    out.push_back(static_cast<char>(body >> 16));
    out.push_back(static_cast<char>(body >> 8));
    out.push_back(static_cast<char>(body));
    out.push_back(static_cast<char>(h.size() >> 8));
    out.push_back(static_cast<char>(h.size()));
    return out + h + tail;
}

json::object header_of(const std::string& frame) {
    const std::size_t len = (static_cast<unsigned char>(frame[4]) << 8) | static_cast<unsigned char>(frame[5]);
    return json::parse(frame.substr(Codec::kFixedHeader, len)).as_object();
}

} // namespace

TEST_CASE("screen frame with 10 KB of random bytes decodes to the same message", "[codec]") {
    Codec codec;

    ScreenFramePayload frame;
    frame.width = 1280;
    frame.height = 720;
    frame.original_width = 2560;
    frame.original_height = 1440;
    frame.format = "jpeg";
    frame.data = random_bytes(10 * 1024, 42);

    Message m = frame.to_message();
    m.session_id = "sess-1";

    const Message back = codec.decode(codec.encode(m));
    REQUIRE(back == m);
    REQUIRE(back.binary.size() == 10 * 1024);

    auto decoded = ScreenFramePayload::from_message(back);
    CHECK(decoded.width == 1280);
    CHECK(decoded.original_height == 1440);
    CHECK(decoded.format == "jpeg");
    CHECK(decoded.data == frame.data);
}

TEST_CASE("encode is deterministic", "[codec]") {
    Codec codec;
    Message m = MouseEventPayload{"click", 10, 20, "left", {"shift"}}.to_message();
    CHECK(codec.encode(m) == codec.encode(m));
}

TEST_CASE("large payloads are zlib compressed and restored", "[codec]") {
    Codec codec(CodecOptions{16 * 1024 * 1024, 64});

    DeviceListPayload list;
    for (int i = 0; i < 50; ++i) {
        list.devices.push_back({"device-" + std::to_string(i), "Workstation " + std::to_string(i), "connected",
                                {"screen", "keyboard", "mouse"}});
    }
    const Message m = list.to_message();
    const std::string bytes = codec.encode(m);

    auto header = header_of(bytes);
    CHECK(header.at("enc").as_string() == "zlib");
    CHECK(header.at("plen").to_number<std::uint64_t>() < header.at("raw").to_number<std::uint64_t>());

    const Message back = codec.decode(bytes);
    CHECK(back == m);
    CHECK(DeviceListPayload::from_message(back).devices.size() == 50);
}

TEST_CASE("small payloads and a zero threshold stay uncompressed", "[codec]") {
    const Message m = EndControlPayload{"user"}.to_message();

    CHECK(header_of(Codec().encode(m)).at("enc").as_string() == "none");

    DeviceListPayload big;
    for (int i = 0; i < 50; ++i) big.devices.push_back({"d" + std::to_string(i), "n", "connected", {}});
    CHECK(header_of(Codec(CodecOptions{16 * 1024 * 1024, 0}).encode(big.to_message())).at("enc").as_string() == "none");
}

TEST_CASE("malformed input is rejected", "[codec]") {
    Codec codec;
    const Message m = ScreenFramePayload{4, 4, 4, 4, "raw", random_bytes(64, 7)}.to_message();
    const std::string good = codec.encode(m);

    SECTION("empty and short buffers") {
        CHECK_THROWS_AS(codec.decode(""), MalformedMessage);
        CHECK_THROWS_AS(codec.decode(good.substr(0, 5)), MalformedMessage);
    }

    SECTION("truncated frame") {
        CHECK_THROWS_AS(codec.decode(good.substr(0, good.size() - 1)), MalformedMessage);
    }

    SECTION("trailing garbage") {
        CHECK_THROWS_AS(codec.decode(good + "x"), MalformedMessage);
    }

    SECTION("flipped bit in the binary attachment") {
        std::string bad = good;
        bad[bad.size() - 3] = static_cast<char>(bad[bad.size() - 3] ^ 0x01);
        CHECK_THROWS_AS(codec.decode(bad), MalformedMessage);
    }

    SECTION("header that is not JSON") {
        std::string bad = good;
        bad[Codec::kFixedHeader] = '#';
        CHECK_THROWS_AS(codec.decode(bad), MalformedMessage);
    }

    SECTION("unsupported version") {
        auto h = header_of(good);
        h["v"] = 2;
        CHECK_THROWS_AS(codec.decode(with_header(good, h)), MalformedMessage);
    }

    SECTION("unknown payload encoding") {
        auto h = header_of(good);
        h["enc"] = "brotli";
        CHECK_THROWS_AS(codec.decode(with_header(good, h)), MalformedMessage);
    }

    SECTION("frame above the configured limit") {
        Codec tiny(CodecOptions{32, 1024});
        CHECK_THROWS_AS(tiny.decode(good), MalformedMessage);
    }

    SECTION("malformed messages are protocol errors") {
        CHECK_THROWS_AS(codec.decode("garbage!"), ProtocolError);
    }
}

TEST_CASE("unknown type tag is reported separately from malformed bytes", "[codec]") {
    Codec codec;
    const std::string good = codec.encode(HeartbeatPayload{123}.to_message());

    auto h = header_of(good);
    h["type"] = "file_transfer";

    try {
        codec.decode(with_header(good, h));
        FAIL("decode should have thrown");
    } catch (const UnknownMessageType& e) {
        CHECK(e.type_name() == "file_transfer");
    }
}

TEST_CASE("every type tag maps back to its type", "[codec]") {
    for (int i = static_cast<int>(MessageType::Connect); i <= static_cast<int>(MessageType::Error); ++i) {
        const auto t = static_cast<MessageType>(i);
        auto parsed = type_from_string(to_string(t));
        REQUIRE(parsed);
        CHECK(*parsed == t);
    }
    CHECK_FALSE(type_from_string("screen_data_v2"));
    CHECK(is_droppable(MessageType::ScreenFrame));
    CHECK(is_droppable(MessageType::AudioData));
    CHECK_FALSE(is_droppable(MessageType::MouseEvent));
    CHECK_FALSE(is_droppable(MessageType::ControlRequest));
}

TEST_CASE("FrameReader reassembles split and coalesced frames", "[codec][framing]") {
    Codec codec;
    const std::string a = codec.encode(HeartbeatPayload{1}.to_message());
    const std::string b = codec.encode(ScreenFramePayload{1, 1, 1, 1, "raw", random_bytes(300, 3)}.to_message());

    FrameReader reader;

    SECTION("byte by byte") {
        std::vector<std::string> out;
        for (char c : a) {
            reader.append(std::string_view(&c, 1));
            while (auto f = reader.next()) out.push_back(*f);
        }
        REQUIRE(out.size() == 1);
        CHECK(out[0] == a);
        CHECK(reader.buffered() == 0);
    }

    SECTION("two frames in one chunk plus a partial third") {
        reader.append(a + b + a.substr(0, 3));
        auto f1 = reader.next();
        auto f2 = reader.next();
        REQUIRE(f1);
        REQUIRE(f2);
        CHECK(*f1 == a);
        CHECK(*f2 == b);
        CHECK_FALSE(reader.next());
        CHECK(reader.buffered() == 3);

        reader.append(a.substr(3));
        auto f3 = reader.next();
        REQUIRE(f3);
        CHECK(codec.decode(*f3).type == MessageType::Heartbeat);
    }

    SECTION("oversized declared length") {
        FrameReader small(16);
        small.append(b);
        CHECK_THROWS_AS(small.next(), MalformedMessage);
    }
}

TEST_CASE("payload views reject missing or mistyped fields", "[codec][payload]") {
    Message m = Message::make(MessageType::ControlRequest, {{"password", "x"}});
    CHECK_THROWS_AS(ControlRequestPayload::from_message(m), MalformedMessage);

    m = Message::make(MessageType::ControlResponse, {{"accepted", "yes"}});
    CHECK_THROWS_AS(ControlResponsePayload::from_message(m), MalformedMessage);

    m = Message::make(MessageType::Connect, {{"device_id", "d1"}, {"role", "observer"}});
    CHECK_THROWS_AS(ConnectPayload::from_message(m), MalformedMessage);

    // wrong message type for the view
    CHECK_THROWS_AS(AuthPayload::from_message(HeartbeatPayload{1}.to_message()), MalformedMessage);

    auto kb = KeyboardEventPayload::from_message(KeyboardEventPayload{"combo", "", {"ctrl", "c"}}.to_message());
    CHECK(kb.keys == std::vector<std::string>{"ctrl", "c"});
}
