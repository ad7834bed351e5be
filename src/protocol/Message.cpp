#include "protocol/Message.h"

#include <array>
#include <atomic>
#include <chrono>
#include <utility>

namespace deskrelay::protocol {

namespace {

struct TypeTag {
    MessageType type;
    std::string_view tag;
};

constexpr std::array<TypeTag, 17> kTags{{
    {MessageType::Connect,              "connect"},
    {MessageType::Ack,                  "ack"},
    {MessageType::Auth,                 "auth"},
    {MessageType::Logout,               "logout"},
    {MessageType::Disconnect,           "disconnect"},
    {MessageType::DeviceList,           "device_list"},
    {MessageType::ControlRequest,       "control_request"},
    {MessageType::ControlRequestResult, "control_request_result"},
    {MessageType::ControlResponse,      "control_response"},
    {MessageType::ScreenFrame,          "screen_frame"},
    {MessageType::AudioData,            "audio_data"},
    {MessageType::MouseEvent,           "mouse_event"},
    {MessageType::KeyboardEvent,        "keyboard_event"},
    {MessageType::EndControl,           "end_control"},
    {MessageType::ControlEnded,         "control_ended"},
    {MessageType::Heartbeat,            "heartbeat"},
    {MessageType::Error,                "error"},
}};

std::atomic<std::uint64_t> g_next_id{1};

} // namespace

const char* to_string(MessageType type) noexcept {
    for (const auto& t : kTags) {
        if (t.type == type) return t.tag.data();
    }
    return "unknown";
}

std::optional<MessageType> type_from_string(std::string_view tag) noexcept {
    for (const auto& t : kTags) {
        if (t.tag == tag) return t.type;
    }
    return std::nullopt;
}

bool is_droppable(MessageType type) noexcept {
    return type == MessageType::ScreenFrame || type == MessageType::AudioData;
}

std::int64_t now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

Message Message::make(MessageType type, boost::json::object payload, std::string binary) {
    Message m;
    m.type = type;
    m.message_id = std::to_string(g_next_id.fetch_add(1, std::memory_order_relaxed));
    m.timestamp_ms = now_ms();
    m.payload = std::move(payload);
    m.binary = std::move(binary);
    return m;
}

bool Message::operator==(const Message& other) const {
    return type == other.type &&
           message_id == other.message_id &&
           session_id == other.session_id &&
           timestamp_ms == other.timestamp_ms &&
           payload == other.payload &&
           binary == other.binary;
}

} // namespace deskrelay::protocol
