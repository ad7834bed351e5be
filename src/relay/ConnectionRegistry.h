#pragma once

#include "relay/Connection.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace deskrelay::relay {

class RegistryError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class UnknownConnection : public RegistryError {
public:
    explicit UnknownConnection(const std::string& id)
        : RegistryError("unknown connection " + id) {}
};

class DuplicateConnection : public RegistryError {
public:
    explicit DuplicateConnection(const std::string& id)
        : RegistryError("connection " + id + " is already registered") {}
};

class DuplicateDevice : public RegistryError {
public:
    explicit DuplicateDevice(const std::string& device_id)
        : RegistryError("device " + device_id + " is already connected") {}
};

/**
 * The single source of truth for "what is connected right now".
 *
 * Every operation is atomic under one mutex; reads return copies. Unregister
 * listeners run after the lock is released, so they may call back into the
 * registry.
 */
class ConnectionRegistry {
public:
    using Clock = Connection::Clock;
    using UnregisterListener = std::function<void(const Connection&)>;

    struct Extras {
        std::vector<std::string> capabilities;
        std::string access_password_hash;
    };

    ConnectionRegistry() = default;
    ConnectionRegistry(const ConnectionRegistry&) = delete;
    ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

    // Listeners are called in the order they were added.
    void add_unregister_listener(UnregisterListener listener);

    // Throws DuplicateConnection or DuplicateDevice.
    Connection register_connection(const std::string& connection_id,
                                   const std::string& device_id,
                                   const std::string& device_name,
                                   protocol::Role role,
                                   Extras extras = {},
                                   Clock::time_point now = Clock::now());

    // Throws UnknownConnection.
    void update_status(const std::string& connection_id, ConnectionStatus status);

    // Removes the record, then runs the unregister listeners. Throws UnknownConnection.
    Connection unregister(const std::string& connection_id);

    // Records a heartbeat; false when the id is not registered.
    bool touch(const std::string& connection_id, Clock::time_point now);

    std::optional<Connection> find(const std::string& connection_id) const;
    std::optional<Connection> find_by_device(const std::string& device_id) const;
    bool contains(const std::string& connection_id) const;
    std::size_t size() const;

    // Role = controlled, in registration order.
    std::vector<Connection> list_controlled_devices() const;
    // Everything, in registration order.
    std::vector<Connection> list_connections() const;
    std::vector<std::string> controller_ids() const;

    // Connections whose last heartbeat is at least `max_silence` old.
    std::vector<std::string> stale_connections(Clock::time_point now, Clock::duration max_silence) const;

private:
    std::vector<Connection> sorted_locked(bool controlled_only) const;

    mutable std::mutex mu_;
    std::uint64_t next_sequence_ = 1;
    std::unordered_map<std::string, Connection> connections_;
    std::unordered_map<std::string, std::string> by_device_;  // device id -> connection id
    std::vector<UnregisterListener> listeners_;
};

} // namespace deskrelay::relay
