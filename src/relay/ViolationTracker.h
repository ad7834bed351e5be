#pragma once

#include <chrono>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>

namespace deskrelay::relay {

// Sliding-window count of protocol violations per connection.
class ViolationTracker {
public:
    using Clock = std::chrono::steady_clock;

    ViolationTracker(unsigned max_violations, std::chrono::milliseconds window)
        : max_(max_violations), window_(window) {}

    // True when the connection has now exceeded the limit inside the window.
    bool record(const std::string& connection_id, Clock::time_point now);

    std::size_t count(const std::string& connection_id, Clock::time_point now);
    void forget(const std::string& connection_id);

private:
    void prune_locked(std::deque<Clock::time_point>& hits, Clock::time_point now) const;

    const unsigned max_;
    const std::chrono::milliseconds window_;

    std::mutex mu_;
    std::unordered_map<std::string, std::deque<Clock::time_point>> hits_;
};

} // namespace deskrelay::relay
