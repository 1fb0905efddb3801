#pragma once
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace toolbridge::protocol {

    // How a remote service streams MCP messages
    enum class StreamType {
        HttpStream,  // Streamable HTTP: POST per message, JSON or SSE response body
        Sse          // Legacy HTTP+SSE: GET event stream plus POST endpoint
    };

    std::string to_string(StreamType type);
    std::optional<StreamType> parse_stream_type(const std::string& text);

    // Launch description for a stdio backend, after path expansion and env merging
    struct StdioSpec {
        std::string command;
        std::vector<std::string> args;
        std::map<std::string, std::string> env;
        std::string cwd;
    };

    struct StreamSpec {
        std::string url;
        StreamType type = StreamType::HttpStream;
    };

    // What a Tool Client Adapter is asked to connect to
    using ConnectSpec = std::variant<StdioSpec, StreamSpec>;

    std::string describe(const ConnectSpec& spec);

    // One tool exposed by a backend
    struct ToolInfo {
        std::string name;
        std::string description;
        nlohmann::json input_schema = nlohmann::json::object();
    };

    // How the bridge asks a backend to run a tool
    struct ToolCall {
        std::string id;
        std::string name;
        nlohmann::json arguments = nlohmann::json::object();
    };

    // How the backend replies
    struct ToolCallResult {
        nlohmann::json content = nlohmann::json::array();
        bool is_error = false;
        double duration_ms = 0.0;

        // Text of the first content item, or empty when there is none
        std::string first_text() const;
    };

    nlohmann::json tool_to_json(const ToolInfo& tool);
    nlohmann::json tools_to_json(const std::vector<ToolInfo>& tools);
    std::optional<ToolInfo> tool_from_json(const nlohmann::json& payload);

} // namespace toolbridge::protocol
