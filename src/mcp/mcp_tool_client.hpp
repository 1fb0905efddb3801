#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include "mcp/transport.hpp"
#include "tools/tool_client.hpp"

namespace toolbridge::mcp {

constexpr const char* kProtocolVersion = "2025-03-26";

struct McpClientOptions {
    std::chrono::milliseconds handshake_timeout{30000};
    std::chrono::milliseconds call_timeout{185000};
    std::string client_name = "toolbridge";
    std::string client_version = "1.0.0";
};

// Builds the transport for a connect spec; replaced in tests
using TransportFactory = std::function<std::unique_ptr<Transport>(const protocol::ConnectSpec&)>;

std::unique_ptr<Transport> make_transport(const protocol::ConnectSpec& spec,
                                          std::chrono::milliseconds handshake_timeout);

// ToolClient speaking MCP over stdio, Streamable HTTP or HTTP+SSE
class McpToolClient : public tools::ToolClient {
public:
    explicit McpToolClient(McpClientOptions options, TransportFactory transports = nullptr);
    ~McpToolClient() override;

    core::errors::Result<bool> connect(const protocol::ConnectSpec& spec) override;
    core::errors::Result<std::vector<protocol::ToolInfo>> get_all_tools() override;
    core::errors::Result<protocol::ToolCallResult> call_tool(const protocol::ToolCall& call) override;
    void close() override;
    bool is_alive() const override;

    // What the server reported during initialize
    nlohmann::json server_info() const;

private:
    core::errors::Result<nlohmann::json> rpc(const std::string& method, nlohmann::json params,
                                             std::chrono::milliseconds timeout);

    McpClientOptions options_;
    TransportFactory transports_;

    // Guards the transport pointer itself; never held across a request
    mutable std::mutex mutex_;
    std::shared_ptr<Transport> transport_;
    nlohmann::json server_info_ = nlohmann::json::object();
    std::atomic<long long> next_id_{1};
    std::atomic_bool closed_{false};
};

class McpToolClientFactory : public tools::ToolClientFactory {
public:
    explicit McpToolClientFactory(McpClientOptions options);

    std::shared_ptr<tools::ToolClient> create(const protocol::ConnectSpec& spec) override;

private:
    McpClientOptions options_;
};

}  // namespace toolbridge::mcp
