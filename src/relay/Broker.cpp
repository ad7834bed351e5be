#include "relay/Broker.h"

#include "common/Logging.h"
#include "protocol/Payloads.h"

namespace deskrelay::relay {

using protocol::Message;

namespace {
constexpr const char* kLog = "broker";
constexpr const char* kControlPermission = "control";
}

const char* to_string(SlotState state) noexcept {
    switch (state) {
        case SlotState::Idle:           return "idle";
        case SlotState::PendingRequest: return "pending";
        case SlotState::Bound:          return "bound";
    }
    return "unknown";
}

Broker::Broker(ConnectionRegistry& registry,
               auth::AuthManager& auth,
               Transport transport,
               std::chrono::milliseconds request_timeout)
    : registry_(registry),
      auth_(auth),
      transport_(std::move(transport)),
      request_timeout_(request_timeout) {}

void Broker::add_pair_ended_listener(PairEndedListener listener) {
    std::lock_guard<std::mutex> lk(listeners_mu_);
    pair_listeners_.push_back(std::move(listener));
}

void Broker::request_control(const std::string& connection_id, const Message& message, Clock::time_point now) {
    const auto req = protocol::ControlRequestPayload::from_message(message);
    Outbox out;

    auto requester = registry_.find(connection_id);
    if (!requester) throw UnknownConnection(connection_id);

    if (requester->role != protocol::Role::Controller) {
        DESKRELAY_LOG_WARN(kLog, "control request from non-controller " << connection_id);
        result(out, connection_id, false, "bad_request", req.target_id);
        deliver(out);
        return;
    }

    if (auth_.require_auth()) {
        auto owner = auth_.validate(message.session_id, now);
        if (!owner || *owner != connection_id || !auth_.has_permission(connection_id, kControlPermission, now)) {
            DESKRELAY_LOG_WARN(kLog, "unauthorized control request from " << connection_id);
            result(out, connection_id, false, "unauthorized", req.target_id);
            deliver(out);
            return;
        }
    }

    std::string target_conn;
    std::string request_id;
    std::optional<Message> forward;
    {
        std::lock_guard<std::mutex> lk(mu_);

        auto target = registry_.find_by_device(req.target_id);
        if (!registry_.contains(connection_id)) {
            // reaped since the lookup above; its unregister cascade has already run
            DESKRELAY_LOG_INFO(kLog, "dropping control request from departed " << connection_id);
            result(out, connection_id, false, "not_found", req.target_id);
        } else if (controller_index_.count(connection_id)) {
            result(out, connection_id, false, "already_controlling", req.target_id);
        } else if (!target || target->role != protocol::Role::Controlled) {
            result(out, connection_id, false, "not_found", req.target_id);
        } else if (slots_.count(target->connection_id)) {
            result(out, connection_id, false, "busy", req.target_id);
        } else if (!auth::AuthManager::check_pair_password(target->access_password_hash, req.password)) {
            DESKRELAY_LOG_WARN(kLog, "wrong access password for " << req.target_id << " from " << connection_id);
            result(out, connection_id, false, "bad_password", req.target_id);
        } else {
            target_conn = target->connection_id;
            request_id = ids_.requestID();

            Slot slot;
            slot.state = SlotState::PendingRequest;
            slot.controller_id = connection_id;
            slot.target_device_id = req.target_id;
            slot.request_id = request_id;
            slot.password_hash = target->access_password_hash;
            slot.requested_at = now;
            slots_.emplace(target_conn, std::move(slot));
            controller_index_.emplace(connection_id, target_conn);

            protocol::ControlRequestPayload fwd;
            fwd.target_id = req.target_id;
            // the device only sees the password when it has to check it itself
            if (target->access_password_hash.empty()) fwd.password = req.password;
            fwd.controller_id = requester->device_id;
            fwd.controller_name = requester->device_name;
            fwd.request_id = request_id;

            DESKRELAY_LOG_INFO(kLog, "control request " << request_id << ": " << connection_id
                                                        << " -> " << target_conn);
            forward = fwd.to_message();
        }
    }
    deliver(out);

    if (!forward || transport_.send(target_conn, *forward) == SendResult::Queued) return;

    // forwarding failed: the device is going away
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = slots_.find(target_conn);
        if (it == slots_.end() || it->second.request_id != request_id) return;
        erase_slot_locked(it);
        result(out, connection_id, false, "not_found", req.target_id);
    }
    deliver(out);
}

void Broker::respond(const std::string& connection_id, const Message& message, Clock::time_point now) {
    const auto resp = protocol::ControlResponsePayload::from_message(message);
    Outbox out;
    bool bound = false;
    {
        std::lock_guard<std::mutex> lk(mu_);

        auto it = slots_.find(connection_id);
        if (it == slots_.end() || it->second.state != SlotState::PendingRequest) {
            DESKRELAY_LOG_DEBUG(kLog, "ignoring control response from " << connection_id << " with nothing pending");
            return;
        }
        Slot& slot = it->second;
        if (!resp.request_id.empty() && resp.request_id != slot.request_id) {
            DESKRELAY_LOG_DEBUG(kLog, "ignoring stale control response " << resp.request_id);
            return;
        }

        auto device = registry_.find(connection_id);
        protocol::ControlResponsePayload relayed;
        relayed.accepted = resp.accepted;
        relayed.request_id = slot.request_id;
        relayed.controlled_id = device ? device->device_id : slot.target_device_id;

        const std::string controller = slot.controller_id;
        const std::string target = slot.target_device_id;
        out.emplace_back(controller, relayed.to_message());

        if (resp.accepted) {
            slot.state = SlotState::Bound;
            slot.established_at = now;
            set_status_locked(controller, ConnectionStatus::Controlling);
            set_status_locked(connection_id, ConnectionStatus::Controlled);
            result(out, controller, true, "accepted", target);
            bound = true;
            DESKRELAY_LOG_INFO(kLog, "pair bound: " << controller << " controls " << connection_id);
        } else {
            erase_slot_locked(it);
            result(out, controller, false, "rejected", target);
            DESKRELAY_LOG_INFO(kLog, connection_id << " rejected control by " << controller);
        }
    }
    deliver(out);
    if (bound) broadcast_device_list();
}

bool Broker::end_control(const std::string& connection_id, const std::string& reason) {
    Outbox out;
    std::vector<ControlPair> ended_pairs;
    bool ended_any = false;
    {
        std::lock_guard<std::mutex> lk(mu_);
        ended_any = end_locked(connection_id, reason.empty() ? "ended" : reason, false, out, ended_pairs);
    }
    deliver(out);
    notify_ended(ended_pairs);
    if (ended_any) broadcast_device_list();
    return ended_any;
}

void Broker::on_connection_lost(const Connection& connection) {
    Outbox out;
    std::vector<ControlPair> ended_pairs;
    bool ended_any = false;
    {
        std::lock_guard<std::mutex> lk(mu_);
        ended_any = end_locked(connection.connection_id, "peer_disconnected", true, out, ended_pairs);
    }
    deliver(out);
    notify_ended(ended_pairs);
    if (ended_any || connection.role == protocol::Role::Controlled) broadcast_device_list();
}

std::size_t Broker::expire_pending(Clock::time_point now) {
    Outbox out;
    std::size_t expired = 0;
    {
        std::lock_guard<std::mutex> lk(mu_);
        for (auto it = slots_.begin(); it != slots_.end();) {
            auto cur = it++;
            const Slot& slot = cur->second;
            if (slot.state != SlotState::PendingRequest || now - slot.requested_at < request_timeout_) continue;

            DESKRELAY_LOG_INFO(kLog, "control request " << slot.request_id << " timed out");
            result(out, slot.controller_id, false, "timeout", slot.target_device_id);
            ended(out, cur->first, "timeout");
            erase_slot_locked(cur);
            ++expired;
        }
    }
    deliver(out);
    return expired;
}

bool Broker::drop_pair(const std::string& lost_connection_id, const std::string& reason) {
    Outbox out;
    std::vector<ControlPair> ended_pairs;
    bool ended_any = false;
    {
        std::lock_guard<std::mutex> lk(mu_);
        ended_any = end_locked(lost_connection_id, reason, true, out, ended_pairs);
    }
    deliver(out);
    notify_ended(ended_pairs);
    if (ended_any) broadcast_device_list();
    return ended_any;
}

std::optional<ControlPair> Broker::bound_pair_of(const std::string& connection_id) const {
    std::lock_guard<std::mutex> lk(mu_);

    auto it = slots_.find(connection_id);
    if (it == slots_.end()) {
        auto ci = controller_index_.find(connection_id);
        if (ci == controller_index_.end()) return std::nullopt;
        it = slots_.find(ci->second);
        if (it == slots_.end()) return std::nullopt;
    }
    if (it->second.state != SlotState::Bound) return std::nullopt;

    ControlPair p;
    p.controller_id = it->second.controller_id;
    p.controlled_id = it->first;
    p.established_at = it->second.established_at;
    p.password_hash = it->second.password_hash;
    return p;
}

SlotState Broker::slot_state(const std::string& controlled_connection_id) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = slots_.find(controlled_connection_id);
    return it == slots_.end() ? SlotState::Idle : it->second.state;
}

std::vector<SlotSnapshot> Broker::snapshot() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<SlotSnapshot> out;
    out.reserve(slots_.size());
    for (const auto& [controlled, slot] : slots_) {
        SlotSnapshot s;
        s.state = slot.state;
        s.controller_id = slot.controller_id;
        s.controlled_id = controlled;
        s.target_device_id = slot.target_device_id;
        s.request_id = slot.request_id;
        s.since = slot.state == SlotState::Bound ? slot.established_at : slot.requested_at;
        out.push_back(std::move(s));
    }
    return out;
}

void Broker::broadcast_device_list() {
    const Message list = device_list_message();
    for (const auto& id : registry_.controller_ids()) {
        transport_.send(id, list);
    }
}

void Broker::send_device_list(const std::string& connection_id) {
    transport_.send(connection_id, device_list_message());
}

void Broker::deliver(Outbox& outbox) {
    for (const auto& [to, msg] : outbox) {
        if (transport_.send(to, msg) != SendResult::Queued) {
            DESKRELAY_LOG_DEBUG(kLog, "could not deliver " << protocol::to_string(msg.type) << " to " << to);
        }
    }
    outbox.clear();
}

void Broker::notify_ended(const std::vector<ControlPair>& pairs) {
    if (pairs.empty()) return;

    std::vector<PairEndedListener> listeners;
    {
        std::lock_guard<std::mutex> lk(listeners_mu_);
        listeners = pair_listeners_;
    }
    for (const auto& p : pairs) {
        for (auto& l : listeners) l(p);
    }
}

Message Broker::device_list_message() const {
    protocol::DeviceListPayload list;
    for (const auto& c : registry_.list_controlled_devices()) {
        list.devices.push_back({c.device_id, c.device_name, to_string(c.status), c.capabilities});
    }
    return list.to_message();
}

void Broker::result(Outbox& out, const std::string& to, bool success,
                    const std::string& reason, const std::string& target_id) {
    out.emplace_back(to, protocol::ControlRequestResultPayload{success, reason, target_id}.to_message());
}

void Broker::ended(Outbox& out, const std::string& to, const std::string& reason) {
    out.emplace_back(to, protocol::ControlEndedPayload{reason}.to_message());
}

void Broker::set_status_locked(const std::string& connection_id, ConnectionStatus status) {
    try {
        registry_.update_status(connection_id, status);
    } catch (const UnknownConnection& e) {
        // lost a race with the unregister cascade, which will clean up the slot
        DESKRELAY_LOG_DEBUG(kLog, e.what());
    }
}

void Broker::restore_status_locked(const std::string& connection_id) {
    set_status_locked(connection_id, auth_.session_for(connection_id)
                                         ? ConnectionStatus::Authenticated
                                         : ConnectionStatus::Connected);
}

void Broker::erase_slot_locked(SlotMap::iterator it) {
    controller_index_.erase(it->second.controller_id);
    slots_.erase(it);
}

bool Broker::end_locked(const std::string& connection_id, const std::string& reason,
                        bool initiator_gone, Outbox& out, std::vector<ControlPair>& ended_pairs) {
    auto it = slots_.find(connection_id);
    bool is_controller = false;
    if (it == slots_.end()) {
        auto ci = controller_index_.find(connection_id);
        if (ci == controller_index_.end()) return false;
        it = slots_.find(ci->second);
        if (it == slots_.end()) {
            controller_index_.erase(ci);
            return false;
        }
        is_controller = true;
    }

    const std::string controlled = it->first;
    const Slot slot = it->second;
    erase_slot_locked(it);

    if (slot.state == SlotState::PendingRequest) {
        if (is_controller) {
            const std::string why = initiator_gone ? reason : "cancelled";
            if (!initiator_gone) result(out, slot.controller_id, false, "cancelled", slot.target_device_id);
            ended(out, controlled, why);
            DESKRELAY_LOG_INFO(kLog, "control request " << slot.request_id << " cancelled (" << why << ")");
        } else {
            // the device went away or dismissed the prompt
            result(out, slot.controller_id, false, initiator_gone ? "not_found" : "rejected", slot.target_device_id);
            DESKRELAY_LOG_INFO(kLog, "control request " << slot.request_id << " dropped by " << controlled);
        }
        return true;
    }

    ended_pairs.push_back(ControlPair{slot.controller_id, controlled, slot.established_at, slot.password_hash});

    const std::string& survivor = is_controller ? controlled : slot.controller_id;
    ended(out, survivor, reason);
    if (!initiator_gone) restore_status_locked(connection_id);
    restore_status_locked(survivor);

    DESKRELAY_LOG_INFO(kLog, "pair ended: " << slot.controller_id << " / " << controlled << " (" << reason << ")");
    return true;
}

} // namespace deskrelay::relay
