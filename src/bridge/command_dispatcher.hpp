#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "core/config/bridge_config.hpp"
#include "net/response_sink.hpp"
#include "protocol/command_envelope.hpp"
#include "registry/service_registry.hpp"
#include "runtime/async_runner.hpp"
#include "session/connection_manager.hpp"
#include "session/request_tracker.hpp"

namespace toolbridge::bridge {

// Turns command lines into registry and connection-manager operations and
// writes the replies. Runs on the event-loop thread only.
class CommandDispatcher {
public:
    CommandDispatcher(const core::config::BridgeConfig& config, runtime::AsyncRunner& runner,
                      registry::ServiceRegistry& registry, session::ConnectionManager& connections,
                      session::RequestTracker& tracker, net::ResponseSink& sink);

    // Parses one line and answers it; toolcall answers later
    void dispatch_line(session::ClientId client, const std::string& line);
    void dispatch(session::ClientId client, const protocol::Command& command);

    // Replies with "Request timeout" for every pending call older than the timeout
    void expire_requests();

private:
    using Handler = void (CommandDispatcher::*)(session::ClientId, const protocol::Command&);

    void handle_ping(session::ClientId client, const protocol::Command& command);
    void handle_status(session::ClientId client, const protocol::Command& command);
    void handle_listtools(session::ClientId client, const protocol::Command& command);
    void handle_list(session::ClientId client, const protocol::Command& command);
    void handle_spawn(session::ClientId client, const protocol::Command& command);
    void handle_shutdown(session::ClientId client, const protocol::Command& command);
    void handle_register(session::ClientId client, const protocol::Command& command);
    void handle_unregister(session::ClientId client, const protocol::Command& command);
    void handle_toolcall(session::ClientId client, const protocol::Command& command);
    void handle_reset(session::ClientId client, const protocol::Command& command);

    void finish_toolcall(const std::string& id, const std::string& service,
                         const std::shared_ptr<tools::ToolClient>& adapter,
                         const core::errors::Result<protocol::ToolCallResult>& result);

    nlohmann::json service_state(const std::string& name) const;

    void reply(session::ClientId client, const nlohmann::json& response);
    void fail(session::ClientId client, const std::string& id, int code, const std::string& message);

    const core::config::BridgeConfig& config_;
    runtime::AsyncRunner& runner_;
    registry::ServiceRegistry& registry_;
    session::ConnectionManager& connections_;
    session::RequestTracker& tracker_;
    net::ResponseSink& sink_;
    std::map<std::string, Handler> handlers_;
};

}  // namespace toolbridge::bridge
