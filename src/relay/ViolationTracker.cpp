#include "relay/ViolationTracker.h"

namespace deskrelay::relay {

bool ViolationTracker::record(const std::string& connection_id, Clock::time_point now) {
    std::lock_guard<std::mutex> lk(mu_);
    auto& hits = hits_[connection_id];
    prune_locked(hits, now);
    hits.push_back(now);
    return hits.size() > max_;
}

std::size_t ViolationTracker::count(const std::string& connection_id, Clock::time_point now) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = hits_.find(connection_id);
    if (it == hits_.end()) return 0;
    prune_locked(it->second, now);
    return it->second.size();
}

void ViolationTracker::forget(const std::string& connection_id) {
    std::lock_guard<std::mutex> lk(mu_);
    hits_.erase(connection_id);
}

void ViolationTracker::prune_locked(std::deque<Clock::time_point>& hits, Clock::time_point now) const {
    while (!hits.empty() && now - hits.front() >= window_) hits.pop_front();
}

} // namespace deskrelay::relay
