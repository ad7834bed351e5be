#include "relay/ConnectionRegistry.h"

#include "common/Logging.h"

#include <algorithm>

namespace deskrelay::relay {

namespace {
constexpr const char* kLog = "registry";
}

void ConnectionRegistry::add_unregister_listener(UnregisterListener listener) {
    std::lock_guard<std::mutex> lk(mu_);
    listeners_.push_back(std::move(listener));
}

Connection ConnectionRegistry::register_connection(const std::string& connection_id,
                                                   const std::string& device_id,
                                                   const std::string& device_name,
                                                   protocol::Role role,
                                                   Extras extras,
                                                   Clock::time_point now) {
    std::lock_guard<std::mutex> lk(mu_);

    if (connections_.count(connection_id)) throw DuplicateConnection(connection_id);
    if (by_device_.count(device_id)) throw DuplicateDevice(device_id);

    Connection c;
    c.connection_id = connection_id;
    c.device_id = device_id;
    c.device_name = sanitize_device_name(device_name, device_id);
    c.role = role;
    c.status = ConnectionStatus::Connected;
    c.capabilities = std::move(extras.capabilities);
    c.access_password_hash = std::move(extras.access_password_hash);
    c.sequence = next_sequence_++;
    c.registered_at = now;
    c.last_heartbeat = now;

    connections_.emplace(connection_id, c);
    by_device_.emplace(device_id, connection_id);

    DESKRELAY_LOG_INFO(kLog, "registered " << connection_id << " as " << protocol::to_string(role)
                                           << " '" << c.device_name << "' (" << device_id << ")");
    return c;
}

void ConnectionRegistry::update_status(const std::string& connection_id, ConnectionStatus status) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = connections_.find(connection_id);
    if (it == connections_.end()) throw UnknownConnection(connection_id);
    it->second.status = status;
}

Connection ConnectionRegistry::unregister(const std::string& connection_id) {
    Connection removed;
    std::vector<UnregisterListener> listeners;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = connections_.find(connection_id);
        if (it == connections_.end()) throw UnknownConnection(connection_id);

        removed = std::move(it->second);
        connections_.erase(it);
        by_device_.erase(removed.device_id);
        listeners = listeners_;
    }

    removed.status = ConnectionStatus::Disconnected;
    DESKRELAY_LOG_INFO(kLog, "unregistered " << connection_id << " ('" << removed.device_name << "')");

    for (auto& l : listeners) l(removed);
    return removed;
}

bool ConnectionRegistry::touch(const std::string& connection_id, Clock::time_point now) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = connections_.find(connection_id);
    if (it == connections_.end()) return false;
    it->second.touch(now);
    return true;
}

std::optional<Connection> ConnectionRegistry::find(const std::string& connection_id) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = connections_.find(connection_id);
    if (it == connections_.end()) return std::nullopt;
    return it->second;
}

std::optional<Connection> ConnectionRegistry::find_by_device(const std::string& device_id) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = by_device_.find(device_id);
    if (it == by_device_.end()) return std::nullopt;
    return connections_.at(it->second);
}

bool ConnectionRegistry::contains(const std::string& connection_id) const {
    std::lock_guard<std::mutex> lk(mu_);
    return connections_.count(connection_id) != 0;
}

std::size_t ConnectionRegistry::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return connections_.size();
}

std::vector<Connection> ConnectionRegistry::list_controlled_devices() const {
    std::lock_guard<std::mutex> lk(mu_);
    return sorted_locked(true);
}

std::vector<Connection> ConnectionRegistry::list_connections() const {
    std::lock_guard<std::mutex> lk(mu_);
    return sorted_locked(false);
}

std::vector<std::string> ConnectionRegistry::controller_ids() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<std::string> out;
    for (const auto& c : sorted_locked(false)) {
        if (c.role == protocol::Role::Controller) out.push_back(c.connection_id);
    }
    return out;
}

std::vector<std::string> ConnectionRegistry::stale_connections(Clock::time_point now,
                                                               Clock::duration max_silence) const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<std::string> out;
    for (const auto& [id, c] : connections_) {
        if (now - c.last_heartbeat >= max_silence) out.push_back(id);
    }
    return out;
}

std::vector<Connection> ConnectionRegistry::sorted_locked(bool controlled_only) const {
    std::vector<Connection> out;
    out.reserve(connections_.size());
    for (const auto& [id, c] : connections_) {
        if (!controlled_only || c.role == protocol::Role::Controlled) out.push_back(c);
    }
    std::sort(out.begin(), out.end(),
              [](const Connection& a, const Connection& b) { return a.sequence < b.sequence; });
    return out;
}

} // namespace deskrelay::relay
