#include "protocol/command_envelope.hpp"

#include <cctype>
#include <utility>
#include "core/config/id_generator.hpp"

namespace toolbridge::protocol {

using core::errors::BridgeError;
using core::errors::ErrorCategory;
using nlohmann::json;

core::errors::Result<Command> parse_command(const std::string& line) {
    json payload = json::parse(line, nullptr, false);
    if (payload.is_discarded()) {
        return BridgeError{ErrorCategory::Input, "Invalid JSON", "parse_error"};
    }
    if (!payload.is_object()) {
        return BridgeError{ErrorCategory::Input, "Invalid request: expected a JSON object",
                           "invalid_request"};
    }

    Command command;
    if (payload.contains("id") && payload["id"].is_string() &&
        !payload["id"].get<std::string>().empty()) {
        command.id = payload["id"].get<std::string>();
    } else if (payload.contains("id") && payload["id"].is_number()) {
        command.id = payload["id"].dump();
    } else {
        command.id = core::config::generate_id("req");
    }

    if (!payload.contains("command") || !payload["command"].is_string() ||
        payload["command"].get<std::string>().empty()) {
        return BridgeError{ErrorCategory::Input, "Invalid request: no command specified",
                           "invalid_request"};
    }
    command.command = payload["command"].get<std::string>();

    if (payload.contains("params") && payload["params"].is_object()) {
        command.params = payload["params"];
    }
    return command;
}

json salvage_id(const std::string& raw) {
    const auto key = raw.find("\"id\"");
    if (key == std::string::npos) {
        return nullptr;
    }
    std::size_t pos = key + 4;
    while (pos < raw.size() && std::isspace(static_cast<unsigned char>(raw[pos])) != 0) {
        ++pos;
    }
    if (pos >= raw.size() || raw[pos] != ':') {
        return nullptr;
    }
    ++pos;
    while (pos < raw.size() && std::isspace(static_cast<unsigned char>(raw[pos])) != 0) {
        ++pos;
    }
    if (pos >= raw.size()) {
        return nullptr;
    }

    if (raw[pos] == '"') {
        std::string value;
        for (++pos; pos < raw.size(); ++pos) {
            if (raw[pos] == '\\' && pos + 1 < raw.size()) {
                value.push_back(raw[++pos]);
                continue;
            }
            if (raw[pos] == '"') {
                return value;
            }
            value.push_back(raw[pos]);
        }
        return nullptr;
    }

    std::string digits;
    while (pos < raw.size() && (std::isdigit(static_cast<unsigned char>(raw[pos])) != 0 ||
                                (digits.empty() && raw[pos] == '-'))) {
        digits.push_back(raw[pos++]);
    }
    if (digits.empty() || digits == "-") {
        return nullptr;
    }
    return digits;
}

json make_success(const std::string& id, json result) {
    json response;
    response["id"] = id;
    response["success"] = true;
    response["result"] = std::move(result);
    return response;
}

json make_failure(const json& id, const int code, const std::string& message, json result) {
    json response;
    response["id"] = id;
    response["success"] = false;
    if (!result.is_null()) {
        response["result"] = std::move(result);
    }
    response["error"] = {{"code", code}, {"message", message}};
    return response;
}

json make_failure(const json& id, const BridgeError& error) {
    return make_failure(id, core::errors::to_wire_code(error.category), error.message);
}

std::string serialize(const json& message) {
    return message.dump(-1, ' ', false, json::error_handler_t::replace);
}

}  // namespace toolbridge::protocol
