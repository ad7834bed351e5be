#pragma once

#include <boost/json/object.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace deskrelay::protocol {

enum class MessageType {
    Connect,
    Ack,
    Auth,
    Logout,
    Disconnect,
    DeviceList,
    ControlRequest,
    ControlRequestResult,
    ControlResponse,
    ScreenFrame,
    AudioData,
    MouseEvent,
    KeyboardEvent,
    EndControl,
    ControlEnded,
    Heartbeat,
    Error
};

// Wire tag, e.g. "control_request".
const char* to_string(MessageType type) noexcept;
std::optional<MessageType> type_from_string(std::string_view tag) noexcept;

// Media messages may be dropped under backpressure; everything else is delivered or fails.
bool is_droppable(MessageType type) noexcept;

/**
 * One unit of wire communication.
 *
 * `payload` holds the type-specific fields; `binary` carries raw bytes
 * (frame or audio data) next to the payload without any text encoding.
 */
struct Message {
    MessageType type = MessageType::Heartbeat;
    std::string message_id;
    std::string session_id;
    std::int64_t timestamp_ms = 0;  // wall clock, milliseconds since the Unix epoch
    boost::json::object payload;
    std::string binary;

    // Stamps a fresh message id and the current time.
    static Message make(MessageType type,
                        boost::json::object payload = {},
                        std::string binary = {});

    bool operator==(const Message& other) const;
    bool operator!=(const Message& other) const { return !(*this == other); }
};

std::int64_t now_ms();

} // namespace deskrelay::protocol
