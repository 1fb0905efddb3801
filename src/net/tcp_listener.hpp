#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include "core/errors/bridge_errors.hpp"
#include "net/response_sink.hpp"
#include "runtime/event_loop.hpp"

namespace toolbridge::net {

struct ListenerOptions {
    std::string host = "127.0.0.1";
    std::uint16_t port = 8752;  // 0 picks an ephemeral port
    std::chrono::milliseconds idle_timeout{120000};
    std::size_t max_message_bytes = 16 * 1024 * 1024;
    std::size_t max_connections = 64;
};

// Newline-delimited JSON over TCP, multiplexed on the event loop. Lines are
// handed over in arrival order per client; writes are buffered and flushed
// when the socket becomes writable.
class TcpListener : public ResponseSink {
public:
    using LineHandler = std::function<void(session::ClientId, const std::string&)>;
    using DisconnectHandler = std::function<void(session::ClientId)>;

    TcpListener(runtime::EventLoop& loop, ListenerOptions options);
    ~TcpListener() override;

    // Non-copyable, non-movable (owns file descriptors)
    TcpListener(const TcpListener&) = delete;
    TcpListener& operator=(const TcpListener&) = delete;

    void set_line_handler(LineHandler handler);
    void set_disconnect_handler(DisconnectHandler handler);

    core::errors::Result<bool> start();
    // Closes the listening socket and every client
    void stop();
    bool running() const { return server_fd_ >= 0; }
    std::uint16_t bound_port() const { return bound_port_; }

    bool send(session::ClientId client, const nlohmann::json& response) override;
    std::size_t client_count() const override { return connections_.size(); }

    void close_client(session::ClientId client, const std::string& reason);

private:
    struct Connection {
        int fd = -1;
        std::string peer;
        std::string read_buffer;
        std::string write_buffer;
        std::chrono::steady_clock::time_point last_activity;
    };

    void accept_connections();
    void on_client_event(session::ClientId client, short revents);
    bool read_available(session::ClientId client);
    void deliver_lines(session::ClientId client);
    bool flush(session::ClientId client);
    void check_idle();

    runtime::EventLoop& loop_;
    ListenerOptions options_;
    int server_fd_ = -1;
    std::uint16_t bound_port_ = 0;
    runtime::EventLoop::TimerId idle_timer_ = 0;
    session::ClientId next_client_ = 1;
    std::map<session::ClientId, Connection> connections_;
    LineHandler on_line_;
    DisconnectHandler on_disconnect_;
};

}  // namespace toolbridge::net
