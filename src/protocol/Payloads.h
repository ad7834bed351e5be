#pragma once

#include "protocol/Message.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Typed views of message payloads. from_message() throws MalformedMessage
// when a required field is missing or has the wrong JSON type.
namespace deskrelay::protocol {

enum class Role { Controller, Controlled };

const char* to_string(Role role) noexcept;
std::optional<Role> role_from_string(std::string_view name) noexcept;

struct ConnectPayload {
    std::string device_id;
    std::string device_name;
    Role role = Role::Controlled;
    std::vector<std::string> capabilities;
    std::string password;  // controlled devices only; empty = no access password

    Message to_message() const;
    static ConnectPayload from_message(const Message& m);
};

struct AckPayload {
    std::string status;
    std::string connection_id;
    std::string session_id;
    std::vector<std::string> permissions;
    std::string message;

    Message to_message() const;
    static AckPayload from_message(const Message& m);
};

struct AuthPayload {
    std::string username;
    std::string password;

    Message to_message() const;
    static AuthPayload from_message(const Message& m);
};

struct DeviceSummary {
    std::string device_id;
    std::string name;
    std::string status;
    std::vector<std::string> capabilities;
};

struct DeviceListPayload {
    std::vector<DeviceSummary> devices;

    Message to_message() const;
    static DeviceListPayload from_message(const Message& m);
};

struct ControlRequestPayload {
    std::string target_id;
    std::string password;
    // filled in by the broker on the forwarded copy
    std::string controller_id;
    std::string controller_name;
    std::string request_id;

    Message to_message() const;
    static ControlRequestPayload from_message(const Message& m);
};

struct ControlRequestResultPayload {
    bool success = false;
    std::string reason;
    std::string target_id;

    Message to_message() const;
    static ControlRequestResultPayload from_message(const Message& m);
};

struct ControlResponsePayload {
    bool accepted = false;
    std::string request_id;
    std::string controlled_id;  // added by the broker on the relayed copy

    Message to_message() const;
    static ControlResponsePayload from_message(const Message& m);
};

struct ScreenFramePayload {
    std::int64_t width = 0;
    std::int64_t height = 0;
    std::int64_t original_width = 0;
    std::int64_t original_height = 0;
    std::string format;  // e.g. "jpeg"; the codec is opaque to the broker
    std::string data;    // sent as the binary attachment

    Message to_message() const;
    static ScreenFramePayload from_message(const Message& m);
};

struct MouseEventPayload {
    std::string event_type;  // move, click, double_click, scroll, drag
    std::int64_t x = 0;
    std::int64_t y = 0;
    std::string button;
    std::vector<std::string> modifiers;

    Message to_message() const;
    static MouseEventPayload from_message(const Message& m);
};

struct KeyboardEventPayload {
    std::string event_type;  // press, release, combo
    std::string key;
    std::vector<std::string> keys;  // key combination, e.g. {"ctrl", "c"}

    Message to_message() const;
    static KeyboardEventPayload from_message(const Message& m);
};

struct EndControlPayload {
    std::string reason;

    Message to_message() const;
    static EndControlPayload from_message(const Message& m);
};

struct ControlEndedPayload {
    std::string reason;

    Message to_message() const;
    static ControlEndedPayload from_message(const Message& m);
};

struct HeartbeatPayload {
    std::int64_t timestamp = 0;

    Message to_message() const;
    static HeartbeatPayload from_message(const Message& m);
};

struct ErrorPayload {
    std::string code;
    std::string message;

    Message to_message() const;
    static ErrorPayload from_message(const Message& m);
};

} // namespace deskrelay::protocol
