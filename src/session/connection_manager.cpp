#include "session/connection_manager.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace toolbridge::session {

using core::errors::Result;
using protocol::ToolInfo;

ConnectionManager::ConnectionManager(runtime::EventLoop& loop, runtime::AsyncRunner& runner,
                                     registry::ServiceRegistry& registry,
                                     std::shared_ptr<tools::ToolClientFactory> factory,
                                     const core::config::BridgeConfig& config)
    : runner_(runner),
      registry_(registry),
      factory_(std::move(factory)),
      supervisor_(loop, config.restart),
      launch_context_(current_launch_context()) {
    supervisor_.set_restart_handler([this](const std::string& name) {
        const auto descriptor = registry_.get(name);
        if (!descriptor) {
            return;
        }
        LOG_INFO("ConnectionManager: restarting service " + name);
        start(descriptor.value());
    });
}

void ConnectionManager::start(const protocol::ServiceDescriptor& descriptor) {
    if (const auto* local = std::get_if<protocol::LocalService>(&descriptor.kind)) {
        start_local(descriptor.name, *local);
    } else {
        connect_remote(descriptor.name, std::get<protocol::RemoteService>(descriptor.kind));
    }
}

void ConnectionManager::start_local(const std::string& name,
                                    const protocol::LocalService& service) {
    if (service.command.empty()) {
        LOG_WARN("ConnectionManager: [" + name + "] no command specified, skipping startup");
        return;
    }
    if (is_active(name)) {
        LOG_INFO("ConnectionManager: [" + name + "] service is already running");
        return;
    }
    activate(name, build_launch_spec(name, service, launch_context_));
}

void ConnectionManager::connect_remote(const std::string& name,
                                       const protocol::RemoteService& service) {
    if (is_active(name)) {
        LOG_INFO("ConnectionManager: [" + name + "] service is already connected");
        return;
    }
    activate(name, protocol::StreamSpec{service.endpoint, service.connection_type});
}

void ConnectionManager::activate(const std::string& name, const protocol::ConnectSpec& spec) {
    LOG_INFO("ConnectionManager: [" + name + "] connecting via " + protocol::describe(spec));

    std::shared_ptr<tools::ToolClient> client = factory_ ? factory_->create(spec) : nullptr;
    if (!client) {
        errors_[name] = "No adapter available for " + protocol::describe(spec);
        LOG_ERROR("ConnectionManager: [" + name + "] " + errors_[name]);
        handle_service_closure(name);
        return;
    }

    const std::uint64_t generation = next_generation_++;
    clients_[name] = ActiveClient{client, generation, false};
    ready_[name] = false;
    tools_[name] = {};
    errors_.erase(name);

    runner_.submit<bool>(
        [client, spec]() { return client->connect(spec); },
        [this, name, generation](Result<bool> result) { on_connected(name, generation, result); });
}

void ConnectionManager::on_connected(const std::string& name, const std::uint64_t generation,
                                     const Result<bool>& result) {
    if (!is_current(name, generation)) {
        LOG_DEBUG("ConnectionManager: [" + name + "] ignoring late connect completion");
        return;
    }

    if (core::errors::is_error(result)) {
        const auto& err = core::errors::get_error(result);
        errors_[name] = err.message;
        LOG_WARN("ConnectionManager: [" + name + "] connect failed [" + err.code + "]: " +
                 err.message);
        handle_service_closure(name);
        return;
    }

    clients_[name].connected = true;
    LOG_INFO("ConnectionManager: [" + name + "] connected");
    supervisor_.on_connected(name, [this, name, generation]() {
        return is_current(name, generation) && clients_.at(name).connected;
    });
    fetch_tools(name);
}

void ConnectionManager::fetch_tools(const std::string& name) {
    auto it = clients_.find(name);
    if (it == clients_.end()) {
        tools_[name] = {};
        ready_[name] = true;
        return;
    }

    const std::uint64_t generation = it->second.generation;
    std::shared_ptr<tools::ToolClient> client = it->second.client;
    runner_.submit<std::vector<ToolInfo>>(
        [client]() { return client->get_all_tools(); },
        [this, name, generation](Result<std::vector<ToolInfo>> result) {
            on_tools(name, generation, result);
        });
}

void ConnectionManager::on_tools(const std::string& name, const std::uint64_t generation,
                                 const Result<std::vector<ToolInfo>>& result) {
    if (!is_current(name, generation)) {
        LOG_DEBUG("ConnectionManager: [" + name + "] ignoring late tool list");
        return;
    }

    if (core::errors::is_error(result)) {
        const auto& err = core::errors::get_error(result);
        errors_[name] = "Failed to list tools: " + err.message;
        tools_[name] = {};
        LOG_WARN("ConnectionManager: [" + name + "] " + errors_[name]);
    } else {
        tools_[name] = core::errors::get_value(result);
    }
    ready_[name] = true;
    LOG_INFO("ConnectionManager: [" + name + "] ready with " +
             std::to_string(tools_[name].size()) + " tools");
}

void ConnectionManager::close_service(const std::string& name) {
    deactivate(name);
    registry_.unregister_service(name);
}

void ConnectionManager::deactivate(const std::string& name) {
    auto it = clients_.find(name);
    if (it != clients_.end()) {
        LOG_INFO("ConnectionManager: [" + name + "] closing adapter");
        close_client(name, it->second.client);
        clients_.erase(it);
    }
    ready_.erase(name);
    tools_.erase(name);
    errors_.erase(name);
    supervisor_.forget(name);
}

void ConnectionManager::close_all() {
    for (auto& [name, active] : clients_) {
        LOG_INFO("ConnectionManager: [" + name + "] closing adapter");
        close_client(name, active.client);
    }
    clients_.clear();
    ready_.clear();
    tools_.clear();
    errors_.clear();
    supervisor_.clear();
}

void ConnectionManager::handle_service_closure(const std::string& name) {
    LOG_INFO("ConnectionManager: [" + name + "] connection closed or failed");
    auto it = clients_.find(name);
    if (it != clients_.end()) {
        close_client(name, it->second.client);
        clients_.erase(it);
    }
    if (!registry_.contains(name)) {
        ready_.erase(name);
        tools_.erase(name);
        errors_.erase(name);
        supervisor_.forget(name);
        return;
    }
    ready_[name] = false;
    tools_[name] = {};

    if (supervisor_.on_failure(name) == ClosureDecision::GaveUp) {
        // Terminal: resolve the tool list as empty so the service is not left pending
        fetch_tools(name);
    }
}

void ConnectionManager::report_lost(const std::string& name,
                                    const std::shared_ptr<tools::ToolClient>& client) {
    auto it = clients_.find(name);
    // A client still in its handshake is owned by on_connected
    if (it == clients_.end() || it->second.client != client || !it->second.connected ||
        client->is_alive()) {
        return;
    }
    errors_[name] = "Connection lost";
    handle_service_closure(name);
}

void ConnectionManager::check_health() {
    std::vector<std::string> lost;
    for (const auto& [name, active] : clients_) {
        if (active.connected && !active.client->is_alive()) {
            lost.push_back(name);
        }
    }
    for (const auto& name : lost) {
        errors_[name] = "Connection lost";
        LOG_WARN("ConnectionManager: [" + name + "] backend is no longer alive");
        handle_service_closure(name);
    }
}

bool ConnectionManager::is_active(const std::string& name) const {
    return clients_.find(name) != clients_.end();
}

bool ConnectionManager::is_ready(const std::string& name) const {
    auto it = ready_.find(name);
    return it != ready_.end() && it->second;
}

bool ConnectionManager::is_connected(const std::string& name) const {
    auto it = clients_.find(name);
    return it != clients_.end() && it->second.connected;
}

std::vector<ToolInfo> ConnectionManager::tools(const std::string& name) const {
    auto it = tools_.find(name);
    if (it == tools_.end()) {
        return {};
    }
    return it->second;
}

std::optional<std::string> ConnectionManager::last_error(const std::string& name) const {
    auto it = errors_.find(name);
    if (it == errors_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> ConnectionManager::active_services() const {
    std::vector<std::string> names;
    names.reserve(clients_.size());
    for (const auto& entry : clients_) {
        names.push_back(entry.first);
    }
    return names;
}

bool ConnectionManager::has_state(const std::string& name) const {
    return clients_.count(name) > 0 || ready_.count(name) > 0 || tools_.count(name) > 0;
}

std::shared_ptr<tools::ToolClient> ConnectionManager::client(const std::string& name) const {
    auto it = clients_.find(name);
    if (it == clients_.end()) {
        return nullptr;
    }
    return it->second.client;
}

ReconnectionSupervisor& ConnectionManager::supervisor() {
    return supervisor_;
}

const ReconnectionSupervisor& ConnectionManager::supervisor() const {
    return supervisor_;
}

void ConnectionManager::set_launch_context(LaunchContext context) {
    launch_context_ = std::move(context);
}

bool ConnectionManager::is_current(const std::string& name, const std::uint64_t generation) const {
    auto it = clients_.find(name);
    return it != clients_.end() && it->second.generation == generation;
}

void ConnectionManager::close_client(const std::string& name,
                                     std::shared_ptr<tools::ToolClient> client) {
    if (!client) {
        return;
    }
    runner_.detach([name, client = std::move(client)]() {
        client->close();
        LOG_DEBUG("ConnectionManager: [" + name + "] adapter closed");
    });
}

}  // namespace toolbridge::session
