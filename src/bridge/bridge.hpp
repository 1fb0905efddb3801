#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include "bridge/command_dispatcher.hpp"
#include "core/config/bridge_config.hpp"
#include "core/errors/bridge_errors.hpp"
#include "net/response_sink.hpp"
#include "net/tcp_listener.hpp"
#include "registry/service_registry.hpp"
#include "runtime/async_runner.hpp"
#include "runtime/event_loop.hpp"
#include "session/connection_manager.hpp"
#include "session/request_tracker.hpp"
#include "tools/tool_client.hpp"

namespace toolbridge::bridge {

// The whole bridge: one event loop owning the registry, connection state,
// pending requests and client sockets. Without an external sink it serves
// TCP itself; with one, lines are fed through handle_line().
class Bridge {
public:
    Bridge(core::config::BridgeConfig config, std::shared_ptr<tools::ToolClientFactory> factory,
           net::ResponseSink* sink = nullptr);
    ~Bridge();
    Bridge(const Bridge&) = delete;
    Bridge& operator=(const Bridge&) = delete;

    // Binds the listener (when serving TCP) and arms the sweep timer
    core::errors::Result<bool> start();

    // Blocks on the event loop until stop()
    void run();
    // Safe from any thread and from signal handlers
    void stop();
    // Closes every socket and adapter; loop thread only
    void shutdown();

    void handle_line(session::ClientId client, const std::string& line);
    void client_disconnected(session::ClientId client);

    // One sweep tick: request timeouts, then adapter health
    void sweep();

    std::uint16_t port() const;

    runtime::EventLoop& loop() { return loop_; }
    runtime::AsyncRunner& runner() { return runner_; }
    registry::ServiceRegistry& registry() { return registry_; }
    session::ConnectionManager& connections() { return connections_; }
    session::RequestTracker& tracker() { return tracker_; }
    const core::config::BridgeConfig& config() const { return config_; }

private:
    void seed_default_service();

    core::config::BridgeConfig config_;
    runtime::EventLoop loop_;
    runtime::AsyncRunner runner_;
    registry::ServiceRegistry registry_;
    session::RequestTracker tracker_;
    session::ConnectionManager connections_;
    std::unique_ptr<net::TcpListener> listener_;
    net::ResponseSink* sink_;
    CommandDispatcher dispatcher_;
    runtime::EventLoop::TimerId sweep_timer_ = 0;
    bool shut_down_ = false;
};

}  // namespace toolbridge::bridge
