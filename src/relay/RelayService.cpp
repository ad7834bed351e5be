#include "relay/RelayService.h"

#include "common/Logging.h"
#include "protocol/Payloads.h"
#include "protocol/ProtocolError.h"

#include <boost/json/array.hpp>
#include <boost/json/serialize.hpp>

namespace deskrelay::relay {

namespace json = boost::json;
using protocol::Message;
using protocol::MessageType;

namespace {

constexpr const char* kLog = "relay";

protocol::CodecOptions codec_options(const common::ProtocolConfig& c) {
    protocol::CodecOptions o;
    o.max_frame_bytes = c.max_frame_bytes;
    o.compress_threshold = c.compress_threshold;
    return o;
}

std::int64_t millis(std::chrono::steady_clock::duration d) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
}

json::array to_array(const std::vector<std::string>& v) {
    json::array a;
    for (const auto& s : v) a.emplace_back(s);
    return a;
}

} // namespace

RelayService::RelayService(const common::Config& config, Transport transport)
    : max_connections_(config.server.max_connections),
      heartbeat_interval_(config.heartbeat.interval),
      transport_(transport),
      codec_(codec_options(config.protocol)),
      auth_(config.security),
      broker_(registry_, auth_, transport, config.relay.control_request_timeout),
      pipeline_(broker_, transport),
      monitor_(registry_, transport, config.heartbeat.interval, config.heartbeat.missed),
      violations_(config.protocol.max_violations, config.protocol.violation_window) {
    registry_.add_unregister_listener([this](const Connection& c) { auth_.invalidate(c.connection_id); });
    registry_.add_unregister_listener([this](const Connection& c) { broker_.on_connection_lost(c); });
    registry_.add_unregister_listener([this](const Connection& c) {
        if (c.role == protocol::Role::Controlled) pipeline_.forget(c.connection_id);
    });
    broker_.add_pair_ended_listener([this](const ControlPair& p) { pipeline_.forget(p.controlled_id); });
}

void RelayService::on_open(const std::string& connection_id, Clock::time_point now) {
    DESKRELAY_LOG_DEBUG(kLog, "transport opened: " << connection_id);
    monitor_.transport_opened(connection_id, now);
}

void RelayService::on_message(const std::string& connection_id, std::string_view bytes, Clock::time_point now) {
    Message message;
    try {
        message = codec_.decode(bytes);
    } catch (const protocol::UnknownMessageType& e) {
        violation(connection_id, "unknown_message_type", e.what(), now);
        return;
    } catch (const protocol::MalformedMessage& e) {
        violation(connection_id, "malformed_message", e.what(), now);
        return;
    }

    try {
        dispatch(connection_id, std::move(message), now);
    } catch (const protocol::MalformedMessage& e) {
        violation(connection_id, "malformed_message", e.what(), now);
    } catch (const auth::AuthFailed& e) {
        reply_error(connection_id, e.code(), e.what());
    } catch (const UnknownConnection& e) {
        DESKRELAY_LOG_ERROR(kLog, "[" << connection_id << "] " << e.what());
        reply_error(connection_id, "not_registered", e.what());
    } catch (const std::exception& e) {
        DESKRELAY_LOG_ERROR(kLog, "[" << connection_id << "] handler failed: " << e.what());
        reply_error(connection_id, "internal_error", "internal error");
    }
}

void RelayService::on_close(const std::string& connection_id) {
    monitor_.transport_closed(connection_id);
    violations_.forget(connection_id);

    if (!registry_.contains(connection_id)) {
        DESKRELAY_LOG_DEBUG(kLog, "transport closed: " << connection_id);
        return;
    }
    try {
        registry_.unregister(connection_id);
    } catch (const UnknownConnection&) {
        // reaped by the heartbeat sweep in the meantime
    }
}

void RelayService::tick(Clock::time_point now) {
    broker_.expire_pending(now);
    monitor_.sweep(now);
    if (auto n = auth_.purge_expired(now)) {
        DESKRELAY_LOG_DEBUG(kLog, "purged " << n << " expired session(s)");
    }
}

void RelayService::dispatch(const std::string& connection_id, Message message, Clock::time_point now) {
    if (message.type != MessageType::Connect && !registry_.contains(connection_id)) {
        violation(connection_id, "not_registered",
                  std::string("send connect before ") + protocol::to_string(message.type), now);
        return;
    }

    switch (message.type) {
        case MessageType::Connect:
            handle_connect(connection_id, message, now);
            break;
        case MessageType::Auth:
            handle_auth(connection_id, message, now);
            break;
        case MessageType::Logout:
            handle_logout(connection_id);
            break;
        case MessageType::Disconnect:
            handle_disconnect(connection_id, message);
            break;
        case MessageType::Heartbeat:
            monitor_.heartbeat(connection_id, now);
            break;
        case MessageType::ControlRequest:
            broker_.request_control(connection_id, message, now);
            break;
        case MessageType::ControlResponse:
            broker_.respond(connection_id, message, now);
            break;
        case MessageType::EndControl:
            handle_end_control(connection_id, message);
            break;
        case MessageType::ScreenFrame:
        case MessageType::AudioData:
        case MessageType::MouseEvent:
        case MessageType::KeyboardEvent:
            if (pipeline_.route(connection_id, std::move(message)) == RouteResult::WrongDirection) {
                violation(connection_id, "bad_request", "message not allowed in this direction", now);
            }
            break;
        case MessageType::Ack:
        case MessageType::DeviceList:
        case MessageType::ControlRequestResult:
        case MessageType::ControlEnded:
        case MessageType::Error:
            violation(connection_id, "bad_request",
                      std::string(protocol::to_string(message.type)) + " is sent by the broker only", now);
            break;
    }
}

void RelayService::handle_connect(const std::string& connection_id, const Message& message, Clock::time_point now) {
    if (registry_.contains(connection_id)) {
        violation(connection_id, "bad_request", "already connected", now);
        return;
    }

    auto info = protocol::ConnectPayload::from_message(message);
    if (info.device_id.empty()) throw protocol::MalformedMessage("device_id must not be empty");

    if (registry_.size() >= max_connections_) {
        DESKRELAY_LOG_WARN(kLog, "rejecting " << connection_id << ": " << max_connections_ << " connections reached");
        reply_error(connection_id, "server_full", "server is full");
        transport_.close(connection_id);
        return;
    }

    ConnectionRegistry::Extras extras;
    extras.capabilities = info.capabilities;
    if (info.role == protocol::Role::Controlled && !info.password.empty()) {
        extras.access_password_hash = auth::AuthManager::hash_pair_password(info.password);
    }

    try {
        registry_.register_connection(connection_id, info.device_id, info.device_name, info.role,
                                      std::move(extras), now);
    } catch (const DuplicateDevice& e) {
        DESKRELAY_LOG_WARN(kLog, "[" << connection_id << "] " << e.what());
        reply_error(connection_id, "device_in_use", e.what());
        return;
    }
    monitor_.announced(connection_id);

    protocol::AckPayload ack;
    ack.status = "connected";
    ack.connection_id = connection_id;
    Message reply = ack.to_message();
    reply.payload["server"] = json::object{
        {"name", "deskrelay"},
        {"version", DESKRELAY_VERSION},
        {"require_auth", auth_.require_auth()},
        {"heartbeat_interval_ms", heartbeat_interval_.count()}
    };
    transport_.send(connection_id, reply);

    if (info.role == protocol::Role::Controller) {
        broker_.send_device_list(connection_id);
    } else {
        broker_.broadcast_device_list();
    }
}

void RelayService::handle_auth(const std::string& connection_id, const Message& message, Clock::time_point now) {
    const auto creds = protocol::AuthPayload::from_message(message);
    const auto session = auth_.authenticate(connection_id, {creds.username, creds.password}, now);

    // the heartbeat sweep may have reaped the connection while the password was hashed
    if (!registry_.contains(connection_id)) {
        auth_.invalidate(connection_id);
        DESKRELAY_LOG_INFO(kLog, "discarding session of departed " << connection_id);
        return;
    }

    auto conn = registry_.find(connection_id);
    if (conn && conn->status == ConnectionStatus::Connected) {
        registry_.update_status(connection_id, ConnectionStatus::Authenticated);
    }

    protocol::AckPayload ack;
    ack.status = "authenticated";
    ack.connection_id = connection_id;
    ack.session_id = session.session_id;
    ack.permissions = session.permissions;
    Message reply = ack.to_message();
    reply.session_id = session.session_id;
    transport_.send(connection_id, reply);
}

void RelayService::handle_logout(const std::string& connection_id) {
    protocol::AckPayload ack;
    ack.status = "logged_out";
    ack.connection_id = connection_id;

    if (auth_.logout(connection_id)) {
        auto conn = registry_.find(connection_id);
        if (conn && conn->status == ConnectionStatus::Authenticated) {
            registry_.update_status(connection_id, ConnectionStatus::Connected);
        }
    } else {
        ack.message = "no active session";
    }
    transport_.send(connection_id, ack.to_message());
}

void RelayService::handle_disconnect(const std::string& connection_id, const Message& message) {
    std::string reason;
    if (auto it = message.payload.find("reason"); it != message.payload.end() && it->value().is_string()) {
        reason = std::string(it->value().get_string());
    }
    DESKRELAY_LOG_INFO(kLog, connection_id << " disconnecting" << (reason.empty() ? "" : ": ") << reason);
    disconnect(connection_id);
}

void RelayService::handle_end_control(const std::string& connection_id, const Message& message) {
    const auto end = protocol::EndControlPayload::from_message(message);
    if (!broker_.end_control(connection_id, end.reason)) {
        DESKRELAY_LOG_DEBUG(kLog, connection_id << " sent end_control with no active control");
    }
}

void RelayService::reply_error(const std::string& connection_id, const std::string& code, const std::string& text) {
    transport_.send(connection_id, protocol::ErrorPayload{code, text}.to_message());
}

void RelayService::violation(const std::string& connection_id, const std::string& code, const std::string& text,
                             Clock::time_point now) {
    DESKRELAY_LOG_WARN(kLog, "[" << connection_id << "] " << code << ": " << text);
    reply_error(connection_id, code, text);

    if (violations_.record(connection_id, now)) {
        DESKRELAY_LOG_WARN(kLog, "[" << connection_id << "] too many protocol violations, disconnecting");
        disconnect(connection_id);
    }
}

void RelayService::disconnect(const std::string& connection_id) {
    if (registry_.contains(connection_id)) {
        try {
            registry_.unregister(connection_id);
        } catch (const UnknownConnection&) {
            // already gone
        }
    }
    transport_.close(connection_id);
}

HttpReply RelayService::handle_http(std::string_view method, std::string_view target, Clock::time_point now) const {
    const auto path = target.substr(0, target.find('?'));

    if (method != "GET") {
        return {405, json::serialize(json::object{{"error", "method not allowed"}})};
    }
    if (path == "/api/devices") return {200, json::serialize(devices_json())};
    if (path == "/api/sessions") return {200, json::serialize(sessions_json(now))};
    if (path == "/healthz") {
        return {200, json::serialize(json::object{
            {"status", "ok"},
            {"version", DESKRELAY_VERSION},
            {"connections", registry_.size()},
            {"sessions", auth_.session_count()}
        })};
    }
    return {404, json::serialize(json::object{{"error", "not found"}})};
}

json::object RelayService::devices_json() const {
    json::array devices;
    for (const auto& c : registry_.list_controlled_devices()) {
        devices.push_back(json::object{
            {"device_id", c.device_id},
            {"name", c.device_name},
            {"status", to_string(c.status)},
            {"capabilities", to_array(c.capabilities)},
            {"password_protected", !c.access_password_hash.empty()}
        });
    }
    return json::object{{"devices", std::move(devices)}};
}

json::object RelayService::sessions_json(Clock::time_point now) const {
    json::array sessions;
    for (const auto& s : broker_.snapshot()) {
        json::object o{
            {"state", to_string(s.state)},
            {"controller_id", s.controller_id},
            {"controlled_id", s.controlled_id},
            {"target_id", s.target_device_id},
            {"request_id", s.request_id},
            {"age_ms", millis(now - s.since)}
        };
        if (s.state == SlotState::Bound) {
            const auto st = pipeline_.stats_for(s.controlled_id);
            o["frames_forwarded"] = st.frames_forwarded;
            o["frames_dropped"] = st.frames_dropped;
            o["inputs_forwarded"] = st.inputs_forwarded;
        }
        sessions.push_back(std::move(o));
    }
    return json::object{{"sessions", std::move(sessions)}};
}

} // namespace deskrelay::relay
