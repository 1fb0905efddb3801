#include "bridge/command_dispatcher.hpp"

#include <exception>
#include <optional>
#include <utility>
#include "core/config/id_generator.hpp"
#include "core/logging/logger.hpp"
#include "protocol/service_descriptor.hpp"

namespace toolbridge::bridge {

using core::errors::Result;
using nlohmann::json;
using protocol::Command;
using session::ClientId;

namespace codes = core::errors::codes;

namespace {

std::optional<std::string> text_param(const json& params, const char* key) {
    if (!params.is_object() || !params.contains(key) || !params[key].is_string()) {
        return std::nullopt;
    }
    std::string value = params[key].get<std::string>();
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

CommandDispatcher::CommandDispatcher(const core::config::BridgeConfig& config,
                                     runtime::AsyncRunner& runner,
                                     registry::ServiceRegistry& registry,
                                     session::ConnectionManager& connections,
                                     session::RequestTracker& tracker, net::ResponseSink& sink)
    : config_(config),
      runner_(runner),
      registry_(registry),
      connections_(connections),
      tracker_(tracker),
      sink_(sink),
      handlers_{{"ping", &CommandDispatcher::handle_ping},
                {"status", &CommandDispatcher::handle_status},
                {"listtools", &CommandDispatcher::handle_listtools},
                {"list", &CommandDispatcher::handle_list},
                {"spawn", &CommandDispatcher::handle_spawn},
                {"shutdown", &CommandDispatcher::handle_shutdown},
                {"register", &CommandDispatcher::handle_register},
                {"unregister", &CommandDispatcher::handle_unregister},
                {"toolcall", &CommandDispatcher::handle_toolcall},
                {"reset", &CommandDispatcher::handle_reset}} {}

void CommandDispatcher::dispatch_line(const ClientId client, const std::string& line) {
    auto parsed = protocol::parse_command(line);
    if (core::errors::is_error(parsed)) {
        const auto& err = core::errors::get_error(parsed);
        const int code = err.code == "parse_error" ? codes::kParseError : codes::kInvalidRequest;
        LOG_WARN("CommandDispatcher: rejected line from client " + std::to_string(client) + ": " +
                 err.message);
        reply(client, protocol::make_failure(protocol::salvage_id(line), code, err.message));
        return;
    }
    dispatch(client, core::errors::get_value(parsed));
}

void CommandDispatcher::dispatch(const ClientId client, const Command& command) {
    LOG_DEBUG("CommandDispatcher: client " + std::to_string(client) + " -> " + command.command +
              " (" + command.id + ")");
    const auto it = handlers_.find(command.command);
    if (it == handlers_.end()) {
        fail(client, command.id, codes::kNotFound, "Unknown command: " + command.command);
        return;
    }

    try {
        (this->*(it->second))(client, command);
    } catch (const std::exception& e) {
        LOG_ERROR("CommandDispatcher: " + command.command + " failed: " + e.what());
        fail(client, command.id, codes::kInternalError,
             std::string("Internal server error: ") + e.what());
    }
}

void CommandDispatcher::expire_requests() {
    const auto expired =
        tracker_.sweep(session::RequestTracker::Clock::now(), config_.request_timeout);
    for (const auto& request : expired) {
        fail(request.client, request.id, codes::kInternalError, "Request timeout");
    }
}

void CommandDispatcher::handle_ping(const ClientId client, const Command& command) {
    auto name = text_param(command.params, "serviceName");
    if (!name) {
        name = text_param(command.params, "name");
    }

    if (!name) {
        const auto active = connections_.active_services();
        json result;
        result["timestamp"] = protocol::now_unix_ms();
        result["status"] = "ok";
        result["activeServices"] = active;
        result["serviceCount"] = active.size();
        reply(client, protocol::make_success(command.id, std::move(result)));
        return;
    }

    const auto descriptor = registry_.get(name.value());
    if (!descriptor) {
        fail(client, command.id, codes::kNotFound, "Service '" + name.value() + "' not registered");
        return;
    }

    const bool active = connections_.is_active(name.value());
    json result;
    result["status"] = active ? "ok" : "registered_not_active";
    result["name"] = name.value();
    result["type"] = protocol::kind_name(descriptor.value());
    result["description"] = descriptor->description;
    result["timestamp"] = protocol::now_unix_ms();
    result["active"] = active;
    result["ready"] = connections_.is_ready(name.value());
    registry_.touch(name.value(), protocol::now_unix_ms());
    reply(client, protocol::make_success(command.id, std::move(result)));
}

void CommandDispatcher::handle_status(const ClientId client, const Command& command) {
    json registered = json::object();
    json states = json::object();
    for (const auto& descriptor : registry_.list()) {
        registered[descriptor.name] = protocol::descriptor_to_json(descriptor);
        json state = service_state(descriptor.name);
        state["type"] = protocol::kind_name(descriptor);
        const auto error = connections_.last_error(descriptor.name);
        if (error) {
            state["error"] = error.value();
        }
        states[descriptor.name] = std::move(state);
    }

    json result;
    result["registeredServices"] = std::move(registered);
    result["serviceStatus"] = std::move(states);
    result["activeServiceCount"] = connections_.active_services().size();
    result["pendingRequests"] = tracker_.size();
    result["activeConnections"] = sink_.client_count();
    reply(client, protocol::make_success(command.id, std::move(result)));
}

void CommandDispatcher::handle_listtools(const ClientId client, const Command& command) {
    const auto name = text_param(command.params, "name");
    if (name) {
        if (!connections_.is_active(name.value())) {
            fail(client, command.id, codes::kInternalError,
                 "Service '" + name.value() + "' not active");
            return;
        }
        reply(client, protocol::make_success(
                          command.id,
                          {{"tools", protocol::tools_to_json(connections_.tools(name.value()))}}));
        return;
    }

    json all = json::object();
    for (const auto& service : connections_.active_services()) {
        all[service] = protocol::tools_to_json(connections_.tools(service));
    }
    reply(client, protocol::make_success(command.id, {{"serviceTools", std::move(all)}}));
}

void CommandDispatcher::handle_list(const ClientId client, const Command& command) {
    json services = json::array();
    for (const auto& descriptor : registry_.list()) {
        json entry = protocol::descriptor_to_json(descriptor);
        entry.update(service_state(descriptor.name));
        services.push_back(std::move(entry));
    }
    reply(client, protocol::make_success(command.id, {{"services", std::move(services)}}));
}

void CommandDispatcher::handle_spawn(const ClientId client, const Command& command) {
    if (command.params.empty()) {
        fail(client, command.id, codes::kInvalidParams, "Missing parameters");
        return;
    }
    const auto name = text_param(command.params, "name");
    if (!name) {
        fail(client, command.id, codes::kInvalidParams, "Missing required parameter: name");
        return;
    }

    auto descriptor = registry_.get(name.value());
    if (!descriptor) {
        if (!text_param(command.params, "command")) {
            fail(client, command.id, codes::kInvalidParams,
                 "Service '" + name.value() + "' is not registered and no command provided.");
            return;
        }

        json params = command.params;
        params["type"] = "local";
        params["description"] = "Auto-registered service " + name.value();
        auto built = protocol::descriptor_from_params(params, protocol::now_unix_ms());
        if (core::errors::is_error(built)) {
            fail(client, command.id, codes::kInvalidParams, core::errors::get_error(built).message);
            return;
        }
        if (!registry_.register_service(core::errors::get_value(built))) {
            fail(client, command.id, codes::kInvalidParams, "Failed to register service");
            return;
        }
        LOG_INFO("CommandDispatcher: auto-registered new service " + name.value());
        descriptor = core::errors::get_value(built);
    }

    // An explicit spawn gets a fresh restart budget
    connections_.supervisor().forget(name.value());
    connections_.start(descriptor.value());

    json result;
    result["status"] = "started";
    result["name"] = name.value();
    if (const auto* local = std::get_if<protocol::LocalService>(&descriptor->kind)) {
        result["command"] = local->command;
        result["args"] = local->args;
        result["cwd"] = local->cwd ? json(local->cwd.value()) : json(nullptr);
    } else {
        const auto& remote = std::get<protocol::RemoteService>(descriptor->kind);
        result["endpoint"] = remote.endpoint;
        result["connectionType"] = protocol::to_string(remote.connection_type);
    }
    reply(client, protocol::make_success(command.id, std::move(result)));
}

void CommandDispatcher::handle_shutdown(const ClientId client, const Command& command) {
    const auto name = text_param(command.params, "name");
    if (!name) {
        fail(client, command.id, codes::kInvalidParams, "Missing required parameter: name");
        return;
    }
    if (!connections_.is_active(name.value())) {
        fail(client, command.id, codes::kInvalidParams, "Service '" + name.value() + "' not active");
        return;
    }

    LOG_INFO("CommandDispatcher: shutting down service " + name.value());
    connections_.close_service(name.value());
    reply(client, protocol::make_success(command.id,
                                         {{"status", "shutdown"}, {"name", name.value()}}));
}

void CommandDispatcher::handle_register(const ClientId client, const Command& command) {
    auto built = protocol::descriptor_from_params(command.params, protocol::now_unix_ms());
    if (core::errors::is_error(built)) {
        fail(client, command.id, codes::kInvalidParams, core::errors::get_error(built).message);
        return;
    }

    const auto& descriptor = core::errors::get_value(built);
    if (!registry_.register_service(descriptor)) {
        fail(client, command.id, codes::kInvalidParams, "Failed to register service");
        return;
    }
    connections_.supervisor().forget(descriptor.name);
    reply(client, protocol::make_success(command.id,
                                         {{"status", "registered"}, {"name", descriptor.name}}));
}

void CommandDispatcher::handle_unregister(const ClientId client, const Command& command) {
    const auto name = text_param(command.params, "name");
    if (!name) {
        fail(client, command.id, codes::kInvalidParams, "Missing required parameter: name");
        return;
    }
    if (!registry_.contains(name.value())) {
        fail(client, command.id, codes::kInvalidParams,
             "Service '" + name.value() + "' not registered");
        return;
    }

    connections_.deactivate(name.value());
    if (!registry_.unregister_service(name.value())) {
        fail(client, command.id, codes::kInvalidParams,
             "Service '" + name.value() + "' does not exist");
        return;
    }
    reply(client, protocol::make_success(command.id,
                                         {{"status", "unregistered"}, {"name", name.value()}}));
}

void CommandDispatcher::handle_toolcall(const ClientId client, const Command& command) {
    const auto method = text_param(command.params, "method");
    if (!method) {
        fail(client, command.id, codes::kInvalidParams, "Missing required parameter: method");
        return;
    }

    auto service = text_param(command.params, "name");
    if (!service) {
        const auto active = connections_.active_services();
        if (!active.empty()) {
            service = active.front();
        }
    }
    if (!service) {
        LOG_WARN("CommandDispatcher: cannot handle tool call, no service specified and no default available");
        fail(client, command.id, codes::kInvalidParams,
             "No service specified and no default available");
        return;
    }

    const auto adapter = connections_.client(service.value());
    if (!adapter) {
        fail(client, command.id, codes::kInternalError,
             "Service '" + service.value() + "' is not active");
        return;
    }
    if (!connections_.is_connected(service.value())) {
        fail(client, command.id, codes::kInternalError,
             "Service '" + service.value() + "' is not ready");
        return;
    }

    protocol::ToolCall call;
    call.id = core::config::generate_id("call");
    call.name = method.value();
    if (command.params.contains("params") && command.params["params"].is_object()) {
        call.arguments = command.params["params"];
    }

    session::PendingRequest pending;
    pending.id = command.id;
    pending.client = client;
    pending.service = service.value();
    pending.created_at = session::RequestTracker::Clock::now();
    pending.inner_call_id = call.id;
    if (!tracker_.track(pending)) {
        fail(client, command.id, codes::kInvalidParams,
             "Duplicate request id: " + command.id);
        return;
    }
    registry_.touch(service.value(), protocol::now_unix_ms());

    LOG_INFO("CommandDispatcher: [" + service.value() + "] calling tool " + call.name + " (" +
             command.id + ")");
    const std::string id = command.id;
    const std::string target = service.value();
    runner_.submit<protocol::ToolCallResult>(
        target, [adapter, call]() { return adapter->call_tool(call); },
        [this, id, target, adapter](Result<protocol::ToolCallResult> result) {
            finish_toolcall(id, target, adapter, result);
        });
}

void CommandDispatcher::handle_reset(const ClientId client, const Command& command) {
    LOG_INFO("CommandDispatcher: resetting bridge, closing all services and clearing registry");
    connections_.close_all();
    registry_.clear();
    tracker_.clear();
    reply(client, protocol::make_success(
                      command.id,
                      {{"status", "reset"}, {"message", "All services closed and registry cleared"}}));
}

void CommandDispatcher::finish_toolcall(const std::string& id, const std::string& service,
                                        const std::shared_ptr<tools::ToolClient>& adapter,
                                        const Result<protocol::ToolCallResult>& result) {
    const auto pending = tracker_.resolve(id);

    if (core::errors::is_error(result)) {
        const auto& err = core::errors::get_error(result);
        LOG_WARN("CommandDispatcher: [" + service + "] tool call " + id + " failed [" + err.code +
                 "]: " + err.message);
        if (err.category == core::errors::ErrorCategory::Transport) {
            connections_.report_lost(service, adapter);
        }
        if (pending) {
            fail(pending->client, id, codes::kInternalError, "Tool call failed: " + err.message);
        }
        return;
    }

    if (!pending) {
        LOG_DEBUG("CommandDispatcher: dropping late result for " + id);
        return;
    }

    const auto& outcome = core::errors::get_value(result);
    LOG_INFO("CommandDispatcher: [" + service + "] tool call " + id + " finished in " +
             std::to_string(static_cast<long long>(outcome.duration_ms)) + " ms");
    if (outcome.is_error) {
        const std::string text = outcome.first_text();
        reply(pending->client,
              protocol::make_failure(id, codes::kToolError, text.empty() ? "Remote tool error" : text,
                                     {{"content", outcome.content}}));
        return;
    }
    reply(pending->client, protocol::make_success(id, {{"content", outcome.content}}));
}

json CommandDispatcher::service_state(const std::string& name) const {
    json state;
    state["active"] = connections_.is_active(name);
    state["ready"] = connections_.is_ready(name);
    state["toolCount"] = connections_.tools(name).size();
    return state;
}

void CommandDispatcher::reply(const ClientId client, const json& response) {
    if (!sink_.send(client, response)) {
        LOG_DEBUG("CommandDispatcher: client " + std::to_string(client) +
                  " is gone, response dropped");
    }
}

void CommandDispatcher::fail(const ClientId client, const std::string& id, const int code,
                             const std::string& message) {
    reply(client, protocol::make_failure(id, code, message));
}

}  // namespace toolbridge::bridge
