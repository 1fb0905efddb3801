#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/bridge_errors.hpp"
#include "protocol/tool_contract.hpp"

namespace toolbridge::protocol {

    // A backend launched as a subprocess speaking MCP over stdio
    struct LocalService {
        std::string command;
        std::vector<std::string> args;
        std::optional<std::string> cwd;
        std::map<std::string, std::string> env;
    };

    // A backend reached over HTTP
    struct RemoteService {
        std::string endpoint;
        StreamType connection_type = StreamType::HttpStream;
    };

    using ServiceKind = std::variant<LocalService, RemoteService>;

    struct ServiceDescriptor {
        std::string name;
        ServiceKind kind;
        std::string description;
        std::int64_t created_at = 0;
        std::optional<std::int64_t> last_used_at;
    };

    inline bool is_local(const ServiceDescriptor& descriptor) {
        return std::holds_alternative<LocalService>(descriptor.kind);
    }

    // "local" or "remote", as used on the wire
    std::string kind_name(const ServiceDescriptor& descriptor);

    // Name present, local has a command, remote has an endpoint
    bool is_valid(const ServiceDescriptor& descriptor);

    std::int64_t now_unix_ms();

    nlohmann::json descriptor_to_json(const ServiceDescriptor& descriptor);

    // Builds a descriptor from register/spawn command parameters
    core::errors::Result<ServiceDescriptor> descriptor_from_params(
        const nlohmann::json& params, std::int64_t now_ms);

} // namespace toolbridge::protocol
