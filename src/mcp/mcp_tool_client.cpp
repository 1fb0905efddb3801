#include "mcp/mcp_tool_client.hpp"

#include <utility>
#include "core/logging/logger.hpp"
#include "mcp/http_stream_transport.hpp"
#include "mcp/sse_transport.hpp"
#include "mcp/stdio_transport.hpp"

namespace toolbridge::mcp {

using core::errors::BridgeError;
using core::errors::ErrorCategory;
using nlohmann::json;

std::unique_ptr<Transport> make_transport(const protocol::ConnectSpec& spec,
                                          const std::chrono::milliseconds handshake_timeout) {
    if (const auto* stdio = std::get_if<protocol::StdioSpec>(&spec)) {
        return std::make_unique<StdioTransport>(*stdio);
    }
    const auto& stream = std::get<protocol::StreamSpec>(spec);
    if (stream.type == protocol::StreamType::Sse) {
        return std::make_unique<SseTransport>(stream.url, handshake_timeout);
    }
    return std::make_unique<HttpStreamTransport>(stream.url);
}

McpToolClient::McpToolClient(McpClientOptions options, TransportFactory transports)
    : options_(std::move(options)), transports_(std::move(transports)) {
    if (!transports_) {
        const auto timeout = options_.handshake_timeout;
        transports_ = [timeout](const protocol::ConnectSpec& spec) {
            return make_transport(spec, timeout);
        };
    }
}

McpToolClient::~McpToolClient() {
    close();
}

core::errors::Result<bool> McpToolClient::connect(const protocol::ConnectSpec& spec) {
    std::shared_ptr<Transport> transport(transports_(spec));
    if (!transport) {
        return BridgeError{ErrorCategory::Internal, "No transport for " + protocol::describe(spec),
                           "transport_unavailable"};
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_.load()) {
            return BridgeError{ErrorCategory::Transport, "Client closed", "client_closed"};
        }
        transport_ = transport;
    }

    auto opened = transport->open();
    if (core::errors::is_error(opened)) {
        return core::errors::get_error(opened);
    }

    json params;
    params["protocolVersion"] = kProtocolVersion;
    params["capabilities"] = json::object();
    params["clientInfo"] = {{"name", options_.client_name}, {"version", options_.client_version}};
    auto initialized = rpc("initialize", std::move(params), options_.handshake_timeout);
    if (core::errors::is_error(initialized)) {
        return core::errors::get_error(initialized);
    }

    const json& result = core::errors::get_value(initialized);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        server_info_ = result.value("serverInfo", json::object());
    }

    json notification;
    notification["jsonrpc"] = "2.0";
    notification["method"] = "notifications/initialized";
    auto notified = transport->notify(notification);
    if (core::errors::is_error(notified)) {
        return core::errors::get_error(notified);
    }

    LOG_DEBUG("McpToolClient: initialized " + protocol::describe(spec) + " (server " +
              result.value("serverInfo", json::object()).dump() + ")");
    return true;
}

core::errors::Result<std::vector<protocol::ToolInfo>> McpToolClient::get_all_tools() {
    std::vector<protocol::ToolInfo> tools;
    std::string cursor;
    do {
        json params = json::object();
        if (!cursor.empty()) {
            params["cursor"] = cursor;
        }
        auto listed = rpc("tools/list", std::move(params), options_.handshake_timeout);
        if (core::errors::is_error(listed)) {
            return core::errors::get_error(listed);
        }

        const json& result = core::errors::get_value(listed);
        if (result.contains("tools") && result["tools"].is_array()) {
            for (const auto& entry : result["tools"]) {
                auto tool = protocol::tool_from_json(entry);
                if (tool) {
                    tools.push_back(std::move(*tool));
                }
            }
        }
        cursor = result.contains("nextCursor") && result["nextCursor"].is_string()
                     ? result["nextCursor"].get<std::string>()
                     : std::string();
    } while (!cursor.empty());
    return tools;
}

core::errors::Result<protocol::ToolCallResult> McpToolClient::call_tool(
    const protocol::ToolCall& call) {
    json params;
    params["name"] = call.name;
    params["arguments"] = call.arguments.is_object() ? call.arguments : json::object();

    const auto started = std::chrono::steady_clock::now();
    auto called = rpc("tools/call", std::move(params), options_.call_timeout);
    if (core::errors::is_error(called)) {
        return core::errors::get_error(called);
    }

    const json& result = core::errors::get_value(called);
    protocol::ToolCallResult outcome;
    if (result.contains("content") && result["content"].is_array()) {
        outcome.content = result["content"];
    }
    outcome.is_error = result.value("isError", false);
    outcome.duration_ms = std::chrono::duration<double, std::milli>(
                              std::chrono::steady_clock::now() - started)
                              .count();
    return outcome;
}

void McpToolClient::close() {
    std::shared_ptr<Transport> transport;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_.exchange(true)) {
            return;
        }
        transport = transport_;
    }
    if (transport) {
        transport->close();
    }
}

bool McpToolClient::is_alive() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !closed_.load() && transport_ && transport_->is_open();
}

json McpToolClient::server_info() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return server_info_;
}

core::errors::Result<json> McpToolClient::rpc(const std::string& method, json params,
                                              const std::chrono::milliseconds timeout) {
    std::shared_ptr<Transport> transport;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        transport = transport_;
    }
    if (!transport || closed_.load()) {
        return BridgeError{ErrorCategory::Transport, "Client is not connected", "not_connected"};
    }

    json message;
    message["jsonrpc"] = "2.0";
    message["id"] = next_id_.fetch_add(1);
    message["method"] = method;
    message["params"] = std::move(params);

    auto response = transport->request(message, timeout);
    if (core::errors::is_error(response)) {
        return core::errors::get_error(response);
    }

    const json& reply = core::errors::get_value(response);
    if (reply.contains("error") && !reply["error"].is_null()) {
        const json& error = reply["error"];
        const std::string text = error.is_object() && error.contains("message") &&
                                         error["message"].is_string()
                                     ? error["message"].get<std::string>()
                                     : error.dump();
        return BridgeError{ErrorCategory::Execution, method + " failed: " + text, "rpc_error",
                           error.is_object() && error.contains("code") ? error["code"].dump() : ""};
    }
    if (!reply.contains("result")) {
        return BridgeError{ErrorCategory::Transport, method + " returned no result",
                           "invalid_response"};
    }
    return reply["result"];
}

McpToolClientFactory::McpToolClientFactory(McpClientOptions options)
    : options_(std::move(options)) {}

std::shared_ptr<tools::ToolClient> McpToolClientFactory::create(const protocol::ConnectSpec&) {
    return std::make_shared<McpToolClient>(options_);
}

}  // namespace toolbridge::mcp
