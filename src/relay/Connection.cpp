#include "relay/Connection.h"

namespace deskrelay::relay {

namespace {

bool is_space(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

std::string trim_copy(std::string s) {
    std::size_t start = 0;
    while (start < s.size() && is_space(s[start])) ++start;

    std::size_t end = s.size();
    while (end > start && is_space(s[end - 1])) --end;

    if (start == 0 && end == s.size()) return s;
    return s.substr(start, end - start);
}

} // namespace

const char* to_string(ConnectionStatus status) noexcept {
    switch (status) {
        case ConnectionStatus::Connected:     return "connected";
        case ConnectionStatus::Authenticated: return "authenticated";
        case ConnectionStatus::Controlling:   return "controlling";
        case ConnectionStatus::Controlled:    return "controlled";
        case ConnectionStatus::Disconnected:  return "disconnected";
    }
    return "unknown";
}

std::string sanitize_device_name(std::string name, const std::string& device_id) {
    name = trim_copy(std::move(name));

    if (name.size() > Connection::kMaxNameLen) {
        name.resize(Connection::kMaxNameLen);
        name = trim_copy(std::move(name));
    }

    if (name.empty()) {
        name = "Device_" + (device_id.size() > 8 ? device_id.substr(device_id.size() - 8) : device_id);
    }
    return name;
}

} // namespace deskrelay::relay
