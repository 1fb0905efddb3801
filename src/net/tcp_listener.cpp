#include "net/tcp_listener.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <algorithm>
#include <utility>
#include <vector>
#include "core/logging/logger.hpp"

namespace toolbridge::net {

using core::errors::BridgeError;
using core::errors::ErrorCategory;

namespace {

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
    }
}

std::string describe_peer(const sockaddr_storage& addr) {
    char host[INET6_ADDRSTRLEN] = {0};
    std::uint16_t port = 0;
    if (addr.ss_family == AF_INET) {
        const auto* in = reinterpret_cast<const sockaddr_in*>(&addr);
        inet_ntop(AF_INET, &in->sin_addr, host, sizeof(host));
        port = ntohs(in->sin_port);
    } else if (addr.ss_family == AF_INET6) {
        const auto* in6 = reinterpret_cast<const sockaddr_in6*>(&addr);
        inet_ntop(AF_INET6, &in6->sin6_addr, host, sizeof(host));
        port = ntohs(in6->sin6_port);
    }
    return std::string(host) + ":" + std::to_string(port);
}

}  // namespace

TcpListener::TcpListener(runtime::EventLoop& loop, ListenerOptions options)
    : loop_(loop), options_(std::move(options)) {}

TcpListener::~TcpListener() {
    stop();
}

void TcpListener::set_line_handler(LineHandler handler) {
    on_line_ = std::move(handler);
}

void TcpListener::set_disconnect_handler(DisconnectHandler handler) {
    on_disconnect_ = std::move(handler);
}

core::errors::Result<bool> TcpListener::start() {
    if (server_fd_ >= 0) {
        return true;
    }

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_PASSIVE | AI_NUMERICSERV;
    addrinfo* resolved = nullptr;
    const std::string port = std::to_string(options_.port);
    const int rc = getaddrinfo(options_.host.c_str(), port.c_str(), &hints, &resolved);
    if (rc != 0) {
        return BridgeError{ErrorCategory::Input,
                           "Cannot resolve host '" + options_.host + "': " + gai_strerror(rc),
                           "invalid_host"};
    }

    std::string last_error = "no usable address";
    for (addrinfo* candidate = resolved; candidate != nullptr; candidate = candidate->ai_next) {
        const int fd = socket(candidate->ai_family, candidate->ai_socktype | SOCK_CLOEXEC,
                              candidate->ai_protocol);
        if (fd < 0) {
            last_error = std::strerror(errno);
            continue;
        }
        const int reuse = 1;
        static_cast<void>(setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)));
        if (bind(fd, candidate->ai_addr, candidate->ai_addrlen) < 0 || listen(fd, SOMAXCONN) < 0) {
            last_error = std::strerror(errno);
            ::close(fd);
            continue;
        }
        server_fd_ = fd;
        break;
    }
    freeaddrinfo(resolved);

    if (server_fd_ < 0) {
        return BridgeError{ErrorCategory::Transport,
                           "Failed to listen on " + options_.host + ":" + port + ": " + last_error,
                           "bind_failed"};
    }
    set_nonblocking(server_fd_);

    sockaddr_storage bound{};
    socklen_t length = sizeof(bound);
    if (getsockname(server_fd_, reinterpret_cast<sockaddr*>(&bound), &length) == 0) {
        bound_port_ = bound.ss_family == AF_INET6
                          ? ntohs(reinterpret_cast<sockaddr_in6*>(&bound)->sin6_port)
                          : ntohs(reinterpret_cast<sockaddr_in*>(&bound)->sin_port);
    }

    loop_.watch(server_fd_, POLLIN, [this](short) { accept_connections(); });

    const auto check_every =
        std::clamp(options_.idle_timeout / 4, std::chrono::milliseconds(10),
                   std::chrono::milliseconds(1000));
    idle_timer_ = loop_.schedule_every(check_every, [this]() { check_idle(); });

    LOG_INFO("TcpListener: listening on " + options_.host + ":" + std::to_string(bound_port_));
    return true;
}

void TcpListener::stop() {
    while (!connections_.empty()) {
        close_client(connections_.begin()->first, "listener stopped");
    }
    if (idle_timer_ != 0) {
        loop_.cancel(idle_timer_);
        idle_timer_ = 0;
    }
    if (server_fd_ >= 0) {
        loop_.unwatch(server_fd_);
        ::close(server_fd_);
        server_fd_ = -1;
        LOG_INFO("TcpListener: stopped");
    }
}

bool TcpListener::send(const session::ClientId client, const nlohmann::json& response) {
    auto it = connections_.find(client);
    if (it == connections_.end()) {
        LOG_DEBUG("TcpListener: dropping response for departed client " + std::to_string(client));
        return false;
    }
    it->second.write_buffer += response.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    it->second.write_buffer += '\n';
    return flush(client);
}

void TcpListener::close_client(const session::ClientId client, const std::string& reason) {
    auto it = connections_.find(client);
    if (it == connections_.end()) {
        return;
    }
    loop_.unwatch(it->second.fd);
    ::close(it->second.fd);
    LOG_INFO("TcpListener: client " + std::to_string(client) + " (" + it->second.peer +
             ") disconnected: " + reason + " (total=" + std::to_string(connections_.size() - 1) +
             ")");
    connections_.erase(it);
    if (on_disconnect_) {
        on_disconnect_(client);
    }
}

void TcpListener::accept_connections() {
    while (true) {
        sockaddr_storage addr{};
        socklen_t length = sizeof(addr);
        const int fd = accept4(server_fd_, reinterpret_cast<sockaddr*>(&addr), &length,
                               SOCK_NONBLOCK | SOCK_CLOEXEC);
        if (fd < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno != EAGAIN && errno != EWOULDBLOCK) {
                LOG_WARN(std::string("TcpListener: accept() failed: ") + std::strerror(errno));
            }
            return;
        }

        if (connections_.size() >= options_.max_connections) {
            LOG_WARN("TcpListener: max connections reached, rejecting " + describe_peer(addr));
            ::close(fd);
            continue;
        }

        const session::ClientId client = next_client_++;
        Connection connection;
        connection.fd = fd;
        connection.peer = describe_peer(addr);
        connection.last_activity = std::chrono::steady_clock::now();
        connections_.emplace(client, std::move(connection));
        loop_.watch(fd, POLLIN, [this, client](short revents) { on_client_event(client, revents); });

        LOG_INFO("TcpListener: client " + std::to_string(client) + " connected from " +
                 describe_peer(addr) + " (total=" + std::to_string(connections_.size()) + ")");
    }
}

void TcpListener::on_client_event(const session::ClientId client, const short revents) {
    if (revents & POLLOUT) {
        if (!flush(client)) {
            return;
        }
    }
    if (revents & (POLLIN | POLLHUP)) {
        // Lines already read are still answered when the peer half-closes
        const bool open = read_available(client);
        deliver_lines(client);
        if (!open) {
            close_client(client, "connection closed by peer");
            return;
        }
    }
    if (revents & (POLLERR | POLLNVAL)) {
        close_client(client, "socket error");
    }
}

bool TcpListener::read_available(const session::ClientId client) {
    auto it = connections_.find(client);
    if (it == connections_.end()) {
        return false;
    }
    Connection& connection = it->second;
    char buffer[4096];
    while (true) {
        const ssize_t n = ::read(connection.fd, buffer, sizeof(buffer));
        if (n > 0) {
            connection.read_buffer.append(buffer, static_cast<std::size_t>(n));
            connection.last_activity = std::chrono::steady_clock::now();
            continue;
        }
        if (n == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

void TcpListener::deliver_lines(const session::ClientId client) {
    while (true) {
        auto it = connections_.find(client);
        if (it == connections_.end()) {
            return;
        }
        std::string& buffer = it->second.read_buffer;
        const auto newline = buffer.find('\n');
        if (newline == std::string::npos) {
            if (buffer.size() > options_.max_message_bytes) {
                LOG_WARN("TcpListener: client " + std::to_string(client) +
                         " sent an oversized message");
                close_client(client, "message too large");
            }
            return;
        }

        std::string line = buffer.substr(0, newline);
        buffer.erase(0, newline + 1);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.find_first_not_of(" \t") == std::string::npos) {
            continue;
        }
        if (on_line_) {
            on_line_(client, line);
        }
    }
}

bool TcpListener::flush(const session::ClientId client) {
    auto it = connections_.find(client);
    if (it == connections_.end()) {
        return false;
    }
    Connection& connection = it->second;
    while (!connection.write_buffer.empty()) {
        const ssize_t n = ::send(connection.fd, connection.write_buffer.data(),
                                 connection.write_buffer.size(), MSG_NOSIGNAL);
        if (n > 0) {
            connection.write_buffer.erase(0, static_cast<std::size_t>(n));
            connection.last_activity = std::chrono::steady_clock::now();
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            break;
        }
        close_client(client, std::string("write failed: ") + std::strerror(errno));
        return false;
    }
    loop_.set_events(connection.fd,
                     connection.write_buffer.empty() ? POLLIN : static_cast<short>(POLLIN | POLLOUT));
    return true;
}

void TcpListener::check_idle() {
    const auto now = std::chrono::steady_clock::now();
    std::vector<session::ClientId> idle;
    for (const auto& [client, connection] : connections_) {
        if (now - connection.last_activity >= options_.idle_timeout) {
            idle.push_back(client);
        }
    }
    for (const auto client : idle) {
        close_client(client, "idle timeout");
    }
}

}  // namespace toolbridge::net
