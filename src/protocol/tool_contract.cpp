#include "protocol/tool_contract.hpp"

namespace toolbridge::protocol {

using nlohmann::json;

std::string to_string(const StreamType type) {
    switch (type) {
        case StreamType::HttpStream:
            return "httpStream";
        case StreamType::Sse:
            return "sse";
        default:
            return "unknown";
    }
}

std::optional<StreamType> parse_stream_type(const std::string& text) {
    if (text == "httpStream" || text == "http-stream" || text == "streamable-http" ||
        text == "http") {
        return StreamType::HttpStream;
    }
    if (text == "sse") {
        return StreamType::Sse;
    }
    return std::nullopt;
}

std::string describe(const ConnectSpec& spec) {
    if (const auto* stdio = std::get_if<StdioSpec>(&spec)) {
        std::string text = "stdio:" + stdio->command;
        for (const auto& arg : stdio->args) {
            text += " " + arg;
        }
        return text;
    }
    const auto& stream = std::get<StreamSpec>(spec);
    return to_string(stream.type) + ":" + stream.url;
}

std::string ToolCallResult::first_text() const {
    if (!content.is_array() || content.empty()) {
        return "";
    }
    const json& first = content.front();
    if (first.is_object() && first.contains("text") && first["text"].is_string()) {
        return first["text"].get<std::string>();
    }
    return "";
}

json tool_to_json(const ToolInfo& tool) {
    json payload;
    payload["name"] = tool.name;
    payload["description"] = tool.description;
    payload["inputSchema"] = tool.input_schema;
    return payload;
}

json tools_to_json(const std::vector<ToolInfo>& tools) {
    json payload = json::array();
    for (const auto& tool : tools) {
        payload.push_back(tool_to_json(tool));
    }
    return payload;
}

std::optional<ToolInfo> tool_from_json(const json& payload) {
    if (!payload.is_object() || !payload.contains("name") || !payload["name"].is_string()) {
        return std::nullopt;
    }
    ToolInfo tool;
    tool.name = payload["name"].get<std::string>();
    if (payload.contains("description") && payload["description"].is_string()) {
        tool.description = payload["description"].get<std::string>();
    }
    if (payload.contains("inputSchema") && payload["inputSchema"].is_object()) {
        tool.input_schema = payload["inputSchema"];
    }
    return tool;
}

}  // namespace toolbridge::protocol
