#include "common/Config.h"
#include "common/Logging.h"
#include "networking/WebSocketServer.h"
#include "protocol/Message.h"
#include "relay/RelayService.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>

#include <algorithm>
#include <chrono>
#include <csignal>
#include <exception>
#include <functional>
#include <iostream>
#include <memory>
#include <string_view>
#include <thread>
#include <vector>

namespace {

constexpr const char* kLog = "main";

deskrelay::relay::SendResult to_send_result(deskrelay::networking::SendStatus s) {
    using deskrelay::networking::SendStatus;
    using deskrelay::relay::SendResult;
    switch (s) {
        case SendStatus::Queued:  return SendResult::Queued;
        case SendStatus::Dropped: return SendResult::Dropped;
        case SendStatus::Closed:  return SendResult::Closed;
    }
    return SendResult::Closed;
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace deskrelay;
    using networking::ConnectionId;

    common::Config config;
    try {
        if (!config.parse_args(argc, argv)) return 0;
    } catch (const common::ConfigError& e) {
        std::cerr << "deskrelay: " << e.what() << "\n";
        return 2;
    }

    if (!common::Logging::init(config.logging.level, config.logging.file)) {
        DESKRELAY_LOG_WARN(kLog, "could not open log file '" << config.logging.file << "', logging to console");
    }

    boost::asio::io_context ioc;

    networking::ServerOptions options;
    options.host = config.server.host;
    options.port = config.server.port;
    options.max_message_bytes = config.protocol.max_frame_bytes;
    options.max_send_queue = config.server.max_send_queue;

    std::unique_ptr<networking::WebSocketServer> server;
    std::unique_ptr<relay::RelayService> service;
    try {
        server = std::make_unique<networking::WebSocketServer>(ioc, options);

        relay::Transport transport;
        transport.send = [&](const std::string& id, const protocol::Message& msg) {
            return to_send_result(server->send(id, service->codec().encode(msg), protocol::is_droppable(msg.type)));
        };
        transport.close = [&](const std::string& id) { server->close(id); };

        service = std::make_unique<relay::RelayService>(config, transport);
    } catch (const std::exception& e) {
        DESKRELAY_LOG_ERROR(kLog, "startup failed: " << e.what());
        common::Logging::shutdown();
        return 1;
    }

    server->set_on_connect([&](const ConnectionId& id) { service->on_open(id); });
    server->set_on_disconnect([&](const ConnectionId& id) { service->on_close(id); });
    server->set_on_message([&](const ConnectionId& id, const std::string& bytes) { service->on_message(id, bytes); });
    server->set_on_http([&](std::string_view method, std::string_view target) {
        auto reply = service->handle_http(method, target);
        return networking::WebSocketServer::HttpResponse{reply.status, std::move(reply.body)};
    });

    server->start();

    // Heartbeat sweep, pending-request timeouts and session expiry.
    boost::asio::steady_timer timer(ioc);
    const auto tick_every = std::min(config.heartbeat.interval, std::chrono::milliseconds(1000));
    std::function<void()> schedule_tick = [&] {
        timer.expires_after(tick_every);
        timer.async_wait([&](const boost::system::error_code& ec) {
            if (ec) return;
            service->tick();
            schedule_tick();
        });
    };
    schedule_tick();

    // Graceful shutdown on Ctrl+C / SIGTERM
    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code&, int) {
        DESKRELAY_LOG_INFO(kLog, "shutting down...");
        timer.cancel();
        server->stop();
        ioc.stop();
    });

    DESKRELAY_LOG_INFO(kLog, "deskrelay " << DESKRELAY_VERSION << " on " << config.server.host << ":"
                                          << config.server.port << " with " << config.server.threads
                                          << " thread(s), auth " << (config.security.require_auth ? "on" : "off"));

    std::vector<std::thread> workers;
    workers.reserve(config.server.threads > 0 ? config.server.threads - 1 : 0);
    for (unsigned i = 1; i < config.server.threads; ++i) {
        workers.emplace_back([&ioc] { ioc.run(); });
    }
    ioc.run();
    for (auto& t : workers) t.join();

    DESKRELAY_LOG_INFO(kLog, "exit.");
    common::Logging::shutdown();
    return 0;
}
