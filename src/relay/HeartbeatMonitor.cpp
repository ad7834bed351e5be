#include "relay/HeartbeatMonitor.h"

#include "common/Logging.h"

namespace deskrelay::relay {

namespace {
constexpr const char* kLog = "heartbeat";
}

HeartbeatMonitor::HeartbeatMonitor(ConnectionRegistry& registry,
                                   Transport transport,
                                   std::chrono::milliseconds interval,
                                   unsigned missed)
    : registry_(registry),
      transport_(std::move(transport)),
      interval_(interval),
      timeout_(interval * (missed == 0 ? 1u : missed)) {}

void HeartbeatMonitor::transport_opened(const std::string& connection_id, Clock::time_point now) {
    std::lock_guard<std::mutex> lk(mu_);
    unannounced_[connection_id] = now;
}

void HeartbeatMonitor::transport_closed(const std::string& connection_id) {
    std::lock_guard<std::mutex> lk(mu_);
    unannounced_.erase(connection_id);
}

void HeartbeatMonitor::announced(const std::string& connection_id) {
    std::lock_guard<std::mutex> lk(mu_);
    unannounced_.erase(connection_id);
}

bool HeartbeatMonitor::heartbeat(const std::string& connection_id, Clock::time_point now) {
    return registry_.touch(connection_id, now);
}

std::vector<std::string> HeartbeatMonitor::sweep(Clock::time_point now) {
    std::vector<std::string> reaped;

    for (const auto& id : registry_.stale_connections(now, timeout_)) {
        try {
            registry_.unregister(id);
        } catch (const UnknownConnection&) {
            continue;  // closed concurrently
        }
        DESKRELAY_LOG_WARN(kLog, "no heartbeat from " << id << " for "
                                 << std::chrono::duration_cast<std::chrono::milliseconds>(timeout_).count()
                                 << "ms, disconnecting");
        reaped.push_back(id);
    }

    {
        std::lock_guard<std::mutex> lk(mu_);
        for (auto it = unannounced_.begin(); it != unannounced_.end();) {
            if (now - it->second >= timeout_) {
                DESKRELAY_LOG_WARN(kLog, it->first << " never sent connect, closing");
                reaped.push_back(it->first);
                it = unannounced_.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (const auto& id : reaped) transport_.close(id);
    return reaped;
}

} // namespace deskrelay::relay
