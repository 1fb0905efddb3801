#include "protocol/service_descriptor.hpp"

#include <chrono>
#include <utility>

namespace toolbridge::protocol {

using core::errors::BridgeError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

std::optional<std::string> string_field(const json& params, const char* key) {
    if (!params.contains(key) || !params[key].is_string()) {
        return std::nullopt;
    }
    return params[key].get<std::string>();
}

core::errors::Result<std::vector<std::string>> string_list_field(const json& params,
                                                                 const char* key) {
    std::vector<std::string> values;
    if (!params.contains(key) || params[key].is_null()) {
        return values;
    }
    if (!params[key].is_array()) {
        return BridgeError{ErrorCategory::Input,
                           std::string("Parameter '") + key + "' must be an array of strings",
                           "invalid_parameter"};
    }
    for (const auto& item : params[key]) {
        if (!item.is_string()) {
            return BridgeError{ErrorCategory::Input,
                               std::string("Parameter '") + key + "' must be an array of strings",
                               "invalid_parameter"};
        }
        values.push_back(item.get<std::string>());
    }
    return values;
}

core::errors::Result<std::map<std::string, std::string>> env_field(const json& params) {
    std::map<std::string, std::string> env;
    if (!params.contains("env") || params["env"].is_null()) {
        return env;
    }
    if (!params["env"].is_object()) {
        return BridgeError{ErrorCategory::Input, "Parameter 'env' must be an object",
                           "invalid_parameter"};
    }
    for (const auto& [key, value] : params["env"].items()) {
        // Scalars are accepted and stringified; clients often send numbers and booleans
        env[key] = value.is_string() ? value.get<std::string>() : value.dump();
    }
    return env;
}

}  // namespace

std::string kind_name(const ServiceDescriptor& descriptor) {
    return is_local(descriptor) ? "local" : "remote";
}

bool is_valid(const ServiceDescriptor& descriptor) {
    if (descriptor.name.empty()) {
        return false;
    }
    if (const auto* local = std::get_if<LocalService>(&descriptor.kind)) {
        return !local->command.empty();
    }
    return !std::get<RemoteService>(descriptor.kind).endpoint.empty();
}

std::int64_t now_unix_ms() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch())
                        .count();
    return static_cast<std::int64_t>(ms);
}

json descriptor_to_json(const ServiceDescriptor& descriptor) {
    json payload;
    payload["name"] = descriptor.name;
    payload["type"] = kind_name(descriptor);
    payload["description"] = descriptor.description;
    payload["created"] = descriptor.created_at;
    payload["lastUsed"] = descriptor.last_used_at.has_value()
                              ? json(descriptor.last_used_at.value())
                              : json(nullptr);

    if (const auto* local = std::get_if<LocalService>(&descriptor.kind)) {
        payload["command"] = local->command;
        payload["args"] = local->args;
        payload["cwd"] = local->cwd.has_value() ? json(local->cwd.value()) : json(nullptr);
        payload["env"] = local->env;
    } else {
        const auto& remote = std::get<RemoteService>(descriptor.kind);
        payload["endpoint"] = remote.endpoint;
        payload["connectionType"] = to_string(remote.connection_type);
    }
    return payload;
}

core::errors::Result<ServiceDescriptor> descriptor_from_params(const json& params,
                                                               const std::int64_t now_ms) {
    if (!params.is_object()) {
        return BridgeError{ErrorCategory::Input, "Missing parameters", "missing_parameter"};
    }

    const auto name = string_field(params, "name");
    const auto type = string_field(params, "type");
    if (!name || name->empty() || !type) {
        return BridgeError{ErrorCategory::Input, "Missing required parameters: name, type",
                           "missing_parameter"};
    }

    ServiceDescriptor descriptor;
    descriptor.name = name.value();
    descriptor.created_at = now_ms;
    const auto description = string_field(params, "description");
    descriptor.description =
        description && !description->empty() ? description.value() : "MCP Service: " + descriptor.name;

    if (type.value() == "local") {
        const auto command = string_field(params, "command");
        if (!command || command->empty()) {
            return BridgeError{ErrorCategory::Input,
                               "Missing parameter 'command' for local service",
                               "missing_command"};
        }
        auto args = string_list_field(params, "args");
        if (core::errors::is_error(args)) {
            return core::errors::get_error(args);
        }
        auto env = env_field(params);
        if (core::errors::is_error(env)) {
            return core::errors::get_error(env);
        }

        LocalService local;
        local.command = command.value();
        local.args = core::errors::get_value(args);
        local.env = core::errors::get_value(env);
        const auto cwd = string_field(params, "cwd");
        if (cwd && !cwd->empty()) {
            local.cwd = cwd.value();
        }
        descriptor.kind = std::move(local);
    } else if (type.value() == "remote") {
        const auto endpoint = string_field(params, "endpoint");
        if (!endpoint || endpoint->empty()) {
            return BridgeError{ErrorCategory::Input, "Missing 'endpoint' for remote service",
                               "missing_endpoint"};
        }
        RemoteService remote;
        remote.endpoint = endpoint.value();
        const auto connection_type = string_field(params, "connectionType");
        if (connection_type) {
            const auto parsed = parse_stream_type(connection_type.value());
            if (!parsed) {
                return BridgeError{ErrorCategory::Input,
                                   "Unsupported connectionType: " + connection_type.value(),
                                   "invalid_connection_type", "Use 'httpStream' or 'sse'."};
            }
            remote.connection_type = parsed.value();
        }
        descriptor.kind = std::move(remote);
    } else {
        return BridgeError{ErrorCategory::Input, "Unsupported service type: " + type.value(),
                           "invalid_service_type", "Use 'local' or 'remote'."};
    }

    return descriptor;
}

}  // namespace toolbridge::protocol
