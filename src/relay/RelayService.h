#pragma once

#include "auth/AuthManager.h"
#include "common/Config.h"
#include "protocol/Codec.h"
#include "protocol/Message.h"
#include "relay/Broker.h"
#include "relay/ConnectionRegistry.h"
#include "relay/FramePipeline.h"
#include "relay/HeartbeatMonitor.h"
#include "relay/Transport.h"
#include "relay/ViolationTracker.h"

#include <boost/json/object.hpp>

#include <chrono>
#include <string>
#include <string_view>

namespace deskrelay::relay {

struct HttpReply {
    unsigned status = 200;
    std::string body;  // JSON
};

/**
 * Transport-facing boundary of the broker.
 *
 * Decodes each inbound frame and dispatches it to the registry, auth manager,
 * broker or pipeline. Every message is handled inside its own error boundary:
 * a failure is logged and answered with an Error message to the sender, and
 * repeated protocol violations get the connection closed.
 *
 * Calls for one connection must not overlap (the networking layer runs them
 * on the connection's strand); calls for different connections may.
 */
class RelayService {
public:
    using Clock = Connection::Clock;

    RelayService(const common::Config& config, Transport transport);

    RelayService(const RelayService&) = delete;
    RelayService& operator=(const RelayService&) = delete;

    void on_open(const std::string& connection_id, Clock::time_point now = Clock::now());
    void on_message(const std::string& connection_id, std::string_view bytes, Clock::time_point now = Clock::now());
    void on_close(const std::string& connection_id);

    // Periodic work: pending-request timeouts, heartbeat reaping, session expiry.
    void tick(Clock::time_point now = Clock::now());

    // Read-only HTTP API: /api/devices, /api/sessions, /healthz.
    HttpReply handle_http(std::string_view method, std::string_view target, Clock::time_point now = Clock::now()) const;

    boost::json::object devices_json() const;
    boost::json::object sessions_json(Clock::time_point now = Clock::now()) const;

    const protocol::Codec& codec() const noexcept { return codec_; }
    ConnectionRegistry& registry() noexcept { return registry_; }
    auth::AuthManager& auth() noexcept { return auth_; }
    Broker& broker() noexcept { return broker_; }
    FramePipeline& pipeline() noexcept { return pipeline_; }
    HeartbeatMonitor& monitor() noexcept { return monitor_; }
    ViolationTracker& violations() noexcept { return violations_; }

private:
    void dispatch(const std::string& connection_id, protocol::Message message, Clock::time_point now);

    void handle_connect(const std::string& connection_id, const protocol::Message& message, Clock::time_point now);
    void handle_auth(const std::string& connection_id, const protocol::Message& message, Clock::time_point now);
    void handle_logout(const std::string& connection_id);
    void handle_disconnect(const std::string& connection_id, const protocol::Message& message);
    void handle_end_control(const std::string& connection_id, const protocol::Message& message);

    void reply_error(const std::string& connection_id, const std::string& code, const std::string& text);
    void violation(const std::string& connection_id, const std::string& code, const std::string& text,
                   Clock::time_point now);
    void disconnect(const std::string& connection_id);

    const std::size_t max_connections_;
    const std::chrono::milliseconds heartbeat_interval_;

    Transport transport_;
    protocol::Codec codec_;
    ConnectionRegistry registry_;
    auth::AuthManager auth_;
    Broker broker_;
    FramePipeline pipeline_;
    HeartbeatMonitor monitor_;
    ViolationTracker violations_;
};

} // namespace deskrelay::relay
