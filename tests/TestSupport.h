#pragma once

#include "common/Config.h"
#include "protocol/Message.h"
#include "protocol/Payloads.h"
#include "relay/Transport.h"

#include <chrono>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace deskrelay::test {

using Clock = std::chrono::steady_clock;
using namespace std::chrono_literals;

// In-memory Transport: records every message and close request.
class RecordingTransport {
public:
    struct Sent {
        std::string to;
        protocol::Message message;
    };

    relay::Transport transport() {
        relay::Transport t;
        t.send = [this](const std::string& to, const protocol::Message& m) {
            std::lock_guard<std::mutex> lk(mu_);
            if (dead_.count(to)) return relay::SendResult::Closed;
            if (full_.count(to) && protocol::is_droppable(m.type)) return relay::SendResult::Dropped;
            sent_.push_back({to, m});
            return relay::SendResult::Queued;
        };
        t.close = [this](const std::string& id) {
            std::lock_guard<std::mutex> lk(mu_);
            closed_.push_back(id);
        };
        return t;
    }

    // Sends to `id` fail as if the connection were gone.
    void kill(const std::string& id) {
        std::lock_guard<std::mutex> lk(mu_);
        dead_.insert(id);
    }

    // Droppable sends to `id` are dropped as if its queue were full.
    void saturate(const std::string& id) {
        std::lock_guard<std::mutex> lk(mu_);
        full_.insert(id);
    }

    std::vector<protocol::Message> received(const std::string& id) const {
        std::lock_guard<std::mutex> lk(mu_);
        std::vector<protocol::Message> out;
        for (const auto& s : sent_) {
            if (s.to == id) out.push_back(s.message);
        }
        return out;
    }

    std::vector<protocol::Message> received(const std::string& id, protocol::MessageType type) const {
        std::vector<protocol::Message> out;
        for (auto& m : received(id)) {
            if (m.type == type) out.push_back(std::move(m));
        }
        return out;
    }

    std::optional<protocol::Message> last(const std::string& id, protocol::MessageType type) const {
        auto all = received(id, type);
        if (all.empty()) return std::nullopt;
        return all.back();
    }

    std::size_t count(const std::string& id, protocol::MessageType type) const {
        return received(id, type).size();
    }

    std::vector<std::string> closed() const {
        std::lock_guard<std::mutex> lk(mu_);
        return closed_;
    }

    bool was_closed(const std::string& id) const {
        for (const auto& c : closed()) {
            if (c == id) return true;
        }
        return false;
    }

    void clear() {
        std::lock_guard<std::mutex> lk(mu_);
        sent_.clear();
        closed_.clear();
    }

private:
    mutable std::mutex mu_;
    std::vector<Sent> sent_;
    std::vector<std::string> closed_;
    std::set<std::string> dead_;
    std::set<std::string> full_;
};

// Defaults with cheap password hashing and two users:
// alice/secret (view, control) and bob/hunter2 (view only).
inline common::Config test_config() {
    common::Config c;
    c.security.pbkdf2_iterations = 1000;
    c.security.users = {
        {"alice", "secret", "", "user", {"view", "control"}},
        {"bob", "hunter2", "", "user", {"view"}},
    };
    c.heartbeat.interval = 1000ms;
    c.heartbeat.missed = 3;
    c.relay.control_request_timeout = 15000ms;
    return c;
}

inline protocol::ControlRequestResultPayload last_result(const RecordingTransport& rec, const std::string& id) {
    auto m = rec.last(id, protocol::MessageType::ControlRequestResult);
    if (!m) return {false, "<none>", ""};
    return protocol::ControlRequestResultPayload::from_message(*m);
}

} // namespace deskrelay::test
