#include "bridge/bridge.hpp"

#include <utility>
#include "core/logging/logger.hpp"
#include "protocol/service_descriptor.hpp"

namespace toolbridge::bridge {

namespace {

net::ListenerOptions listener_options(const core::config::BridgeConfig& config) {
    net::ListenerOptions options;
    options.host = config.host;
    options.port = config.port;
    options.idle_timeout = config.idle_timeout;
    options.max_message_bytes = config.max_message_bytes;
    options.max_connections = config.max_connections;
    return options;
}

}  // namespace

Bridge::Bridge(core::config::BridgeConfig config,
               std::shared_ptr<tools::ToolClientFactory> factory, net::ResponseSink* sink)
    : config_(std::move(config)),
      runner_(loop_),
      connections_(loop_, runner_, registry_, std::move(factory), config_),
      listener_(sink == nullptr ? std::make_unique<net::TcpListener>(loop_, listener_options(config_))
                                : nullptr),
      sink_(sink == nullptr ? listener_.get() : sink),
      dispatcher_(config_, runner_, registry_, connections_, tracker_, *sink_) {
    runner_.set_lane_limit(config_.max_calls_per_service);
    if (listener_) {
        listener_->set_line_handler(
            [this](session::ClientId client, const std::string& line) { handle_line(client, line); });
        listener_->set_disconnect_handler(
            [this](session::ClientId client) { client_disconnected(client); });
    }
    seed_default_service();
}

Bridge::~Bridge() {
    shutdown();
    // Workers still post completions into the loop; it must outlive them
    runner_.join_all();
}

core::errors::Result<bool> Bridge::start() {
    if (!loop_.valid()) {
        return core::errors::BridgeError{core::errors::ErrorCategory::Internal,
                                         "Failed to create event loop wakeup pipe",
                                         "event_loop_failed"};
    }
    if (listener_) {
        auto listening = listener_->start();
        if (core::errors::is_error(listening)) {
            return core::errors::get_error(listening);
        }
    }
    if (sweep_timer_ == 0) {
        sweep_timer_ = loop_.schedule_every(config_.sweep_interval, [this]() { sweep(); });
    }
    LOG_INFO("Bridge: started (version " + std::string(core::config::kVersion) + ")");
    return true;
}

void Bridge::run() {
    loop_.run();
}

void Bridge::stop() {
    loop_.stop();
}

void Bridge::shutdown() {
    if (shut_down_) {
        return;
    }
    shut_down_ = true;
    LOG_INFO("Bridge: shutting down");
    if (sweep_timer_ != 0) {
        loop_.cancel(sweep_timer_);
        sweep_timer_ = 0;
    }
    if (listener_) {
        listener_->stop();
    }
    connections_.close_all();
    tracker_.clear();
}

void Bridge::handle_line(const session::ClientId client, const std::string& line) {
    dispatcher_.dispatch_line(client, line);
}

void Bridge::client_disconnected(const session::ClientId client) {
    const std::size_t dropped = tracker_.drop_client(client);
    if (dropped > 0) {
        LOG_INFO("Bridge: dropped " + std::to_string(dropped) + " pending request(s) of client " +
                 std::to_string(client));
    }
}

void Bridge::sweep() {
    dispatcher_.expire_requests();
    connections_.check_health();
}

std::uint16_t Bridge::port() const {
    return listener_ ? listener_->bound_port() : config_.port;
}

void Bridge::seed_default_service() {
    if (config_.default_command.empty()) {
        return;
    }
    protocol::LocalService local;
    local.command = config_.default_command;
    local.args = config_.default_args;

    protocol::ServiceDescriptor descriptor;
    descriptor.name = core::config::kDefaultServiceName;
    descriptor.kind = std::move(local);
    descriptor.description = "MCP Service: " + descriptor.name;
    descriptor.created_at = protocol::now_unix_ms();
    if (registry_.register_service(descriptor)) {
        LOG_INFO("Bridge: registered default service '" + descriptor.name + "' (" +
                 config_.default_command + "), start it with spawn");
    }
}

}  // namespace toolbridge::bridge
