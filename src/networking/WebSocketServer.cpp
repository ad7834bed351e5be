#include "networking/WebSocketServer.h"

#include "common/Config.h"
#include "common/IDGenerator.hpp"
#include "common/Logging.h"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/beast/websocket.hpp>

#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace deskrelay::networking {

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace {
constexpr const char* kLog = "ws";
constexpr auto kHttpTimeout = std::chrono::seconds(30);
}

class WebSocketServer::Impl {
public:
    Impl(asio::io_context& ioc, ServerOptions options)
        : ioc_(ioc),
          options_(std::move(options)),
          acceptor_(ioc, tcp::endpoint(asio::ip::make_address(options_.host), options_.port)) {}

    void start() {
        DESKRELAY_LOG_INFO(kLog, "listening on " << options_.host << ":" << options_.port);
        do_accept();
    }

    void stop() {
        beast::error_code ec;
        acceptor_.close(ec);

        // Close all sessions
        std::lock_guard<std::mutex> lk(mu_);
        for (auto& [id, s] : sessions_) {
            s->close();
        }
    }

    SendStatus send(const ConnectionId& connection, std::string bytes, bool droppable) {
        auto s = find(connection);
        if (!s) return SendStatus::Closed;
        return s->send(std::move(bytes), droppable);
    }

    void close(const ConnectionId& connection) {
        if (auto s = find(connection)) s->close();
    }

    std::size_t connection_count() const {
        std::lock_guard<std::mutex> lk(mu_);
        return sessions_.size();
    }

    void set_on_connect(OnConnect cb) { on_connect_ = std::move(cb); }
    void set_on_disconnect(OnDisconnect cb) { on_disconnect_ = std::move(cb); }
    void set_on_message(OnMessage cb) { on_message_ = std::move(cb); }
    void set_on_http(OnHttp cb) { on_http_ = std::move(cb); }

private:
    class Session : public std::enable_shared_from_this<Session> {
    public:
        Session(Impl& server, tcp::socket socket, ConnectionId id)
            : server_(server),
              id_(std::move(id)),
              ws_(std::move(socket)),
              strand_(asio::make_strand(server_.ioc_)) {}

        const ConnectionId& id() const { return id_; }

        void start() {
            ws_.next_layer().expires_after(kHttpTimeout);

            http::async_read(
                ws_.next_layer(), buffer_, req_,
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](beast::error_code ec, std::size_t) {
                        if (ec) return self->drop("http read", ec);

                        if (websocket::is_upgrade(self->req_)) return self->do_upgrade();
                        self->do_http();
                    }));
        }

        SendStatus send(std::string bytes, bool droppable) {
            if (closing_.load()) return SendStatus::Closed;

            if (droppable && queued_.load() >= server_.options_.max_send_queue) {
                return SendStatus::Dropped;
            }
            ++queued_;

            asio::post(
                strand_,
                [self = shared_from_this(), bytes = std::move(bytes)]() mutable {
                    if (!self->open_ || self->close_sent_) {
                        --self->queued_;
                        return;
                    }
                    bool writing = !self->write_queue_.empty();
                    self->write_queue_.push_back(std::move(bytes));
                    if (!writing) self->do_write();
                });
            return SendStatus::Queued;
        }

        void close() {
            if (closing_.exchange(true)) return;

            asio::post(
                strand_,
                [self = shared_from_this()] {
                    // an in-flight write finishes first; do_write closes once the queue drains
                    if (self->write_queue_.empty()) self->do_close();
                });
        }

    private:
        void do_upgrade() {
            ws_.next_layer().expires_never();
            ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
            ws_.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
                res.set(http::field::server, "deskrelay/" DESKRELAY_VERSION);
            }));
            ws_.read_message_max(server_.options_.max_message_bytes);
            ws_.binary(true);

            ws_.async_accept(
                req_,
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](beast::error_code ec) {
                        if (ec) return self->drop("accept", ec);

                        self->open_ = true;
                        DESKRELAY_LOG_DEBUG(kLog, "[Session " << self->id_ << "] websocket open");
                        if (self->server_.on_connect_) self->server_.on_connect_(self->id_);
                        self->do_read();
                    }));
        }

        void do_http() {
            WebSocketServer::HttpResponse reply;
            if (server_.on_http_) {
                reply = server_.on_http_(std::string_view(req_.method_string().data(), req_.method_string().size()),
                                         std::string_view(req_.target().data(), req_.target().size()));
            }

            res_.version(req_.version());
            res_.result(static_cast<http::status>(reply.status));
            res_.set(http::field::server, "deskrelay/" DESKRELAY_VERSION);
            res_.set(http::field::content_type, "application/json");
            res_.keep_alive(false);
            res_.body() = std::move(reply.body);
            res_.prepare_payload();

            http::async_write(
                ws_.next_layer(), res_,
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](beast::error_code ec, std::size_t) {
                        if (ec) DESKRELAY_LOG_DEBUG(kLog, "[Session " << self->id_ << "] http write: " << ec.message());

                        beast::error_code ignored;
                        self->ws_.next_layer().socket().shutdown(tcp::socket::shutdown_send, ignored);
                        self->server_.remove_session(self->id_);
                    }));
        }

        void do_read() {
            ws_.async_read(
                buffer_,
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](beast::error_code ec, std::size_t) {
                        if (ec) return self->on_close_or_fail(ec);

                        std::string msg = beast::buffers_to_string(self->buffer_.data());
                        self->buffer_.consume(self->buffer_.size());

                        if (self->server_.on_message_) self->server_.on_message_(self->id_, msg);

                        self->do_read();
                    }));
        }

        void do_write() {
            ws_.async_write(
                asio::buffer(write_queue_.front()),
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](beast::error_code ec, std::size_t) {
                        self->write_queue_.pop_front();
                        --self->queued_;
                        if (ec) return self->on_close_or_fail(ec);

                        if (!self->write_queue_.empty()) return self->do_write();
                        if (self->closing_.load()) self->do_close();
                    }));
        }

        void do_close() {
            if (!open_ || close_sent_) return;
            close_sent_ = true;

            ws_.async_close(
                websocket::close_code::normal,
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](beast::error_code ec) {
                        if (ec) self->fail("close", ec);
                        // the pending read completes with websocket::error::closed
                    }));
        }

        void on_close_or_fail(beast::error_code ec) {
            if (!open_) return;
            open_ = false;
            closing_ = true;

            // WebSocket close is common; treat it as disconnect.
            if (ec != websocket::error::closed && ec != asio::error::operation_aborted && ec != asio::error::eof) {
                fail("io", ec);
            }

            queued_ -= write_queue_.size();
            write_queue_.clear();

            server_.remove_session(id_);
            if (server_.on_disconnect_) server_.on_disconnect_(id_);
        }

        // Failure before the WebSocket handshake completed: nobody was told about this connection.
        void drop(const char* what, beast::error_code ec) {
            if (ec != http::error::end_of_stream) fail(what, ec);
            closing_ = true;
            server_.remove_session(id_);
        }

        void fail(const char* what, beast::error_code ec) {
            DESKRELAY_LOG_WARN(kLog, "[Session " << id_ << "] " << what << ": " << ec.message());
        }

        Impl& server_;
        ConnectionId id_;

        websocket::stream<beast::tcp_stream> ws_;
        // Use the io_context executor type for compatibility with older Boost.Asio.
        asio::strand<asio::io_context::executor_type> strand_;

        beast::flat_buffer buffer_;
        http::request<http::string_body> req_;
        http::response<http::string_body> res_;

        std::deque<std::string> write_queue_;  // strand only
        bool open_ = false;                    // strand only
        bool close_sent_ = false;              // strand only

        std::atomic<std::size_t> queued_{0};
        std::atomic<bool> closing_{false};
    };

    std::shared_ptr<Session> find(const ConnectionId& id) {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = sessions_.find(id);
        if (it == sessions_.end()) return nullptr;
        return it->second;
    }

    void do_accept() {
        acceptor_.async_accept(
            [this](beast::error_code ec, tcp::socket socket) {
                if (ec) {
                    // If acceptor closed during shutdown, ignore.
                    if (ec == asio::error::operation_aborted) return;
                    DESKRELAY_LOG_WARN("accept", ec.message());
                    return do_accept();
                }

                auto session = std::make_shared<Session>(*this, std::move(socket), ids_.connectionID());

                {
                    std::lock_guard<std::mutex> lk(mu_);
                    sessions_[session->id()] = session;
                }

                session->start();
                do_accept();
            });
    }

    void remove_session(const ConnectionId& id) {
        std::lock_guard<std::mutex> lk(mu_);
        sessions_.erase(id);
    }

private:
    asio::io_context& ioc_;
    const ServerOptions options_;
    tcp::acceptor acceptor_;

    common::IDGenerator ids_;

    mutable std::mutex mu_;
    std::unordered_map<ConnectionId, std::shared_ptr<Session>> sessions_;

    OnConnect on_connect_;
    OnDisconnect on_disconnect_;
    OnMessage on_message_;
    OnHttp on_http_;
};

// ---- WebSocketServer wrapper ----

WebSocketServer::WebSocketServer(asio::io_context& ioc, ServerOptions options)
    : impl_(new Impl(ioc, std::move(options))) {}

void WebSocketServer::set_on_connect(OnConnect cb) { impl_->set_on_connect(std::move(cb)); }
void WebSocketServer::set_on_disconnect(OnDisconnect cb) { impl_->set_on_disconnect(std::move(cb)); }
void WebSocketServer::set_on_message(OnMessage cb) { impl_->set_on_message(std::move(cb)); }
void WebSocketServer::set_on_http(OnHttp cb) { impl_->set_on_http(std::move(cb)); }

void WebSocketServer::start() { impl_->start(); }
void WebSocketServer::stop() { impl_->stop(); }

SendStatus WebSocketServer::send(const ConnectionId& connection, std::string bytes, bool droppable) {
    return impl_->send(connection, std::move(bytes), droppable);
}

void WebSocketServer::close(const ConnectionId& connection) { impl_->close(connection); }

std::size_t WebSocketServer::connection_count() const { return impl_->connection_count(); }

WebSocketServer::~WebSocketServer() = default;

} // namespace deskrelay::networking
