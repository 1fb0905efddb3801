#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "core/config/bridge_config.hpp"
#include "protocol/service_descriptor.hpp"
#include "protocol/tool_contract.hpp"
#include "registry/service_registry.hpp"
#include "runtime/async_runner.hpp"
#include "runtime/event_loop.hpp"
#include "session/launch_environment.hpp"
#include "session/reconnection_supervisor.hpp"
#include "tools/tool_client.hpp"

namespace toolbridge::session {

// The adapter of one active service. "Active" means a client is allocated,
// which happens before the handshake completes.
struct ActiveClient {
    std::shared_ptr<tools::ToolClient> client;
    std::uint64_t generation = 0;
    bool connected = false;
};

// Owns the lifecycle of one Tool Client Adapter per active service. All
// methods run on the event-loop thread; blocking adapter work goes through
// the AsyncRunner and completions carrying a stale generation are ignored.
class ConnectionManager {
public:
    ConnectionManager(runtime::EventLoop& loop, runtime::AsyncRunner& runner,
                      registry::ServiceRegistry& registry,
                      std::shared_ptr<tools::ToolClientFactory> factory,
                      const core::config::BridgeConfig& config);

    void start(const protocol::ServiceDescriptor& descriptor);
    void start_local(const std::string& name, const protocol::LocalService& service);
    void connect_remote(const std::string& name, const protocol::RemoteService& service);

    void fetch_tools(const std::string& name);

    // Close and forget everything about the service, registry entry included
    void close_service(const std::string& name);
    // Close and forget runtime state; the registry entry is left to the caller
    void deactivate(const std::string& name);
    void close_all();

    // Connect failure or observed drop: clear state, then let the supervisor decide
    void handle_service_closure(const std::string& name);

    // Called when a caller saw a transport failure on this exact client
    void report_lost(const std::string& name, const std::shared_ptr<tools::ToolClient>& client);

    // Hands every connected client whose adapter is no longer alive to closure handling
    void check_health();

    bool is_active(const std::string& name) const;
    bool is_ready(const std::string& name) const;
    bool is_connected(const std::string& name) const;
    std::vector<protocol::ToolInfo> tools(const std::string& name) const;
    std::optional<std::string> last_error(const std::string& name) const;
    std::vector<std::string> active_services() const;
    // Whether any adapter, readiness or tool state is still held for the service
    bool has_state(const std::string& name) const;
    std::shared_ptr<tools::ToolClient> client(const std::string& name) const;

    ReconnectionSupervisor& supervisor();
    const ReconnectionSupervisor& supervisor() const;

    void set_launch_context(LaunchContext context);

private:
    void activate(const std::string& name, const protocol::ConnectSpec& spec);
    void on_connected(const std::string& name, std::uint64_t generation,
                      const core::errors::Result<bool>& result);
    void on_tools(const std::string& name, std::uint64_t generation,
                  const core::errors::Result<std::vector<protocol::ToolInfo>>& result);
    bool is_current(const std::string& name, std::uint64_t generation) const;
    void close_client(const std::string& name, std::shared_ptr<tools::ToolClient> client);

    runtime::AsyncRunner& runner_;
    registry::ServiceRegistry& registry_;
    std::shared_ptr<tools::ToolClientFactory> factory_;
    ReconnectionSupervisor supervisor_;
    LaunchContext launch_context_;
    std::uint64_t next_generation_ = 1;

    std::map<std::string, ActiveClient> clients_;
    std::map<std::string, bool> ready_;
    std::map<std::string, std::vector<protocol::ToolInfo>> tools_;
    std::map<std::string, std::string> errors_;
};

}  // namespace toolbridge::session
