#pragma once

#include "auth/AuthManager.h"
#include "common/IDGenerator.hpp"
#include "protocol/Message.h"
#include "relay/ConnectionRegistry.h"
#include "relay/Transport.h"

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace deskrelay::relay {

enum class SlotState { Idle, PendingRequest, Bound };

const char* to_string(SlotState state) noexcept;

struct ControlPair {
    std::string controller_id;   // connection ids
    std::string controlled_id;
    Connection::Clock::time_point established_at{};
    std::string password_hash;   // access hash the handshake was checked against, may be empty
};

// One non-idle slot, as reported by snapshot().
struct SlotSnapshot {
    SlotState state = SlotState::Idle;
    std::string controller_id;
    std::string controlled_id;
    std::string target_device_id;
    std::string request_id;
    Connection::Clock::time_point since{};
};

/**
 * Control handoff state machine, one slot per controlled connection:
 *
 *   Idle --ControlRequest--> PendingRequest --accept--> Bound --end/disconnect--> Idle
 *                                  |--reject/timeout/cancel--> Idle
 *
 * A controlled connection is in at most one pending request or pair, and so
 * is a controller. Every ControlRequest is answered with exactly one
 * ControlRequestResult. Outgoing messages are collected under the lock and
 * sent after it is released; lock order is Broker -> Registry/AuthManager.
 */
class Broker {
public:
    using Clock = Connection::Clock;
    using PairEndedListener = std::function<void(const ControlPair&)>;

    Broker(ConnectionRegistry& registry,
           auth::AuthManager& auth,
           Transport transport,
           std::chrono::milliseconds request_timeout);

    Broker(const Broker&) = delete;
    Broker& operator=(const Broker&) = delete;

    // Runs after a bound pair is torn down, outside the broker lock.
    void add_pair_ended_listener(PairEndedListener listener);

    // Throws MalformedMessage on a bad payload; pairing failures are answered on the wire.
    void request_control(const std::string& connection_id, const protocol::Message& message,
                         Clock::time_point now = Clock::now());

    // ControlResponse from a controlled device. Stale responses are ignored.
    void respond(const std::string& connection_id, const protocol::Message& message,
                 Clock::time_point now = Clock::now());

    // EndControl from either side; false when the connection had nothing to end.
    bool end_control(const std::string& connection_id, const std::string& reason);

    // Registry unregister listener.
    void on_connection_lost(const Connection& connection);

    // Resolves pending requests older than the timeout; returns how many.
    std::size_t expire_pending(Clock::time_point now = Clock::now());

    // Tears down the pair of a connection that can no longer be written to.
    bool drop_pair(const std::string& lost_connection_id, const std::string& reason);

    std::optional<ControlPair> bound_pair_of(const std::string& connection_id) const;
    SlotState slot_state(const std::string& controlled_connection_id) const;
    std::vector<SlotSnapshot> snapshot() const;

    void broadcast_device_list();
    void send_device_list(const std::string& connection_id);

    std::chrono::milliseconds request_timeout() const noexcept { return request_timeout_; }

private:
    struct Slot {
        SlotState state = SlotState::Idle;
        std::string controller_id;
        std::string target_device_id;
        std::string request_id;
        std::string password_hash;
        Clock::time_point requested_at{};
        Clock::time_point established_at{};
    };

    using Outbox = std::vector<std::pair<std::string, protocol::Message>>;
    using SlotMap = std::unordered_map<std::string, Slot>;

    void deliver(Outbox& outbox);
    void notify_ended(const std::vector<ControlPair>& pairs);
    protocol::Message device_list_message() const;

    static void result(Outbox& out, const std::string& to, bool success,
                       const std::string& reason, const std::string& target_id);
    static void ended(Outbox& out, const std::string& to, const std::string& reason);

    void set_status_locked(const std::string& connection_id, ConnectionStatus status);
    void restore_status_locked(const std::string& connection_id);
    void erase_slot_locked(SlotMap::iterator it);

    // Ends whatever `connection_id` takes part in; `initiator_gone` skips messages to it.
    // A torn-down bound pair is appended to `ended_pairs`.
    bool end_locked(const std::string& connection_id, const std::string& reason,
                    bool initiator_gone, Outbox& out, std::vector<ControlPair>& ended_pairs);

    ConnectionRegistry& registry_;
    auth::AuthManager& auth_;
    Transport transport_;
    const std::chrono::milliseconds request_timeout_;
    common::IDGenerator ids_;

    std::mutex listeners_mu_;
    std::vector<PairEndedListener> pair_listeners_;

    mutable std::mutex mu_;
    SlotMap slots_;                                                // controlled id -> slot
    std::unordered_map<std::string, std::string> controller_index_;  // controller id -> controlled id
};

} // namespace deskrelay::relay
