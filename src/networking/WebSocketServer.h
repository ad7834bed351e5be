#pragma once

#include <boost/asio/io_context.hpp>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace deskrelay::networking {

using ConnectionId = std::string;

struct ServerOptions {
    std::string host = "0.0.0.0";
    unsigned short port = 8765;
    std::size_t max_message_bytes = 16 * 1024 * 1024;
    std::size_t max_send_queue = 64;  // applies to droppable messages only
};

enum class SendStatus { Queued, Dropped, Closed };

class WebSocketServer {
public:
    struct HttpResponse {
        unsigned status = 404;
        std::string body;
    };

    using OnConnect    = std::function<void(const ConnectionId&)>;
    using OnDisconnect = std::function<void(const ConnectionId&)>;
    using OnMessage    = std::function<void(const ConnectionId&, const std::string&)>;
    using OnHttp       = std::function<HttpResponse(std::string_view method, std::string_view target)>;

    WebSocketServer(boost::asio::io_context& ioc, ServerOptions options);
    ~WebSocketServer();

    WebSocketServer(const WebSocketServer&) = delete;
    WebSocketServer& operator=(const WebSocketServer&) = delete;

    // Callbacks for one connection run on its strand, never concurrently.
    void set_on_connect(OnConnect cb);
    void set_on_disconnect(OnDisconnect cb);
    void set_on_message(OnMessage cb);
    // Plain HTTP requests (anything that is not a WebSocket upgrade).
    void set_on_http(OnHttp cb);

    void start();  // start accepting
    void stop();   // stop accepting + close active connections

    // Queues a binary frame. A droppable frame is discarded when the
    // connection already has max_send_queue frames waiting.
    SendStatus send(const ConnectionId& connection, std::string bytes, bool droppable = false);

    // Graceful close once the queued frames are written.
    void close(const ConnectionId& connection);

    std::size_t connection_count() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace deskrelay::networking
