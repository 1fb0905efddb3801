#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/bridge_errors.hpp"

namespace toolbridge::protocol {

    // One inbound line: {"id": ..., "command": ..., "params": {...}}
    struct Command {
        std::string id;
        std::string command;
        nlohmann::json params = nlohmann::json::object();
    };

    // Parses a line. Failures carry code "parse_error" (malformed JSON) or
    // "invalid_request" (valid JSON that is not a command object).
    core::errors::Result<Command> parse_command(const std::string& line);

    // Best-effort id recovery from text that failed to parse; null when none found
    nlohmann::json salvage_id(const std::string& raw);

    nlohmann::json make_success(const std::string& id, nlohmann::json result);

    nlohmann::json make_failure(const nlohmann::json& id, int code, const std::string& message,
                                nlohmann::json result = nullptr);

    nlohmann::json make_failure(const nlohmann::json& id, const core::errors::BridgeError& error);

    // Single-line serialization; invalid UTF-8 from backends is replaced, never thrown
    std::string serialize(const nlohmann::json& message);

} // namespace toolbridge::protocol
