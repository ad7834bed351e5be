#pragma once

#include "relay/ConnectionRegistry.h"
#include "relay/Transport.h"

#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace deskrelay::relay {

/**
 * Reaps connections that stopped sending heartbeats.
 *
 * A registered connection is reaped once `now - last_heartbeat >= interval * missed`:
 * it is unregistered (running the usual cascade) and its transport closed.
 * Transports that never announce themselves with Connect are closed after
 * the same window.
 */
class HeartbeatMonitor {
public:
    using Clock = Connection::Clock;

    HeartbeatMonitor(ConnectionRegistry& registry,
                     Transport transport,
                     std::chrono::milliseconds interval,
                     unsigned missed);

    void transport_opened(const std::string& connection_id, Clock::time_point now);
    void transport_closed(const std::string& connection_id);
    // Connect was accepted; the registry tracks liveness from here on.
    void announced(const std::string& connection_id);

    bool heartbeat(const std::string& connection_id, Clock::time_point now);

    // Returns the ids that were reaped or closed.
    std::vector<std::string> sweep(Clock::time_point now);

    Clock::duration timeout() const noexcept { return timeout_; }
    std::chrono::milliseconds interval() const noexcept { return interval_; }

private:
    ConnectionRegistry& registry_;
    Transport transport_;
    const std::chrono::milliseconds interval_;
    const Clock::duration timeout_;

    std::mutex mu_;
    std::unordered_map<std::string, Clock::time_point> unannounced_;
};

} // namespace deskrelay::relay
