#pragma once

#include "protocol/Payloads.h"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace deskrelay::relay {

enum class ConnectionStatus {
    Connected,
    Authenticated,
    Controlling,
    Controlled,
    Disconnected
};

const char* to_string(ConnectionStatus status) noexcept;

// One announced client. Owned by the ConnectionRegistry; everyone else holds the id.
struct Connection {
    using Clock = std::chrono::steady_clock;
    static constexpr std::size_t kMaxNameLen = 64;

    std::string connection_id;  // "conn-<ulid>"
    std::string device_id;      // client-declared, stable across reconnects
    std::string device_name;
    protocol::Role role = protocol::Role::Controlled;
    ConnectionStatus status = ConnectionStatus::Connected;
    std::vector<std::string> capabilities;
    std::string access_password_hash;  // controlled devices only

    std::uint64_t sequence = 0;  // registration order
    Clock::time_point registered_at{};
    Clock::time_point last_heartbeat{};

    void touch(Clock::time_point now) noexcept { last_heartbeat = now; }
};

// Trimmed, capped at kMaxNameLen; falls back to "Device_<last 8 chars of id>".
std::string sanitize_device_name(std::string name, const std::string& device_id);

} // namespace deskrelay::relay
