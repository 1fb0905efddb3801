#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include "app/cli_parser.hpp"
#include "bridge/bridge.hpp"
#include "core/config/id_generator.hpp"
#include "core/errors/bridge_errors.hpp"
#include "core/logging/logger.hpp"
#include "mcp/mcp_tool_client.hpp"

namespace {

toolbridge::bridge::Bridge* g_bridge = nullptr;

extern "C" void handle_stop_signal(int) {
    if (g_bridge != nullptr) {
        g_bridge->stop();
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    // 1. Tag every log line with this bridge instance
    toolbridge::core::logging::Logger::get().set_instance_tag(
        toolbridge::core::config::generate_id("bridge"));

    // 2. Parse CLI input and return normalized input errors
    auto parsed = toolbridge::app::cli::parse_and_validate(argc, argv);
    if (toolbridge::core::errors::is_error(parsed)) {
        const auto& err = toolbridge::core::errors::get_error(parsed);
        LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }

    const auto& options = toolbridge::core::errors::get_value(parsed);
    if (options.show_help) {
        std::cout << toolbridge::app::cli::usage() << std::endl;
        return 0;
    }
    const auto& config = options.config;
    toolbridge::core::logging::Logger::get().set_level(config.log_level);

    // 3. Wire the MCP adapter into the bridge
    toolbridge::mcp::McpClientOptions client_options;
    client_options.handshake_timeout = config.adapter_timeout;
    // The bridge-level timeout answers the caller first; the adapter gives up a little later
    client_options.call_timeout = config.request_timeout + config.sweep_interval;
    client_options.client_version = toolbridge::core::config::kVersion;
    auto factory = std::make_shared<toolbridge::mcp::McpToolClientFactory>(client_options);

    toolbridge::bridge::Bridge bridge(config, factory);
    auto started = bridge.start();
    if (toolbridge::core::errors::is_error(started)) {
        const auto& err = toolbridge::core::errors::get_error(started);
        LOG_ERROR("Failed to start bridge [" + err.code + "]: " + err.message);
        return 3;
    }

    // 4. Signals stop the loop; the bridge then closes sockets and adapters
    g_bridge = &bridge;
    std::signal(SIGPIPE, SIG_IGN);
    std::signal(SIGINT, handle_stop_signal);
    std::signal(SIGTERM, handle_stop_signal);

    LOG_INFO("TCP bridge server running on " + config.host + ":" + std::to_string(bridge.port()));
    bridge.run();

    LOG_INFO("Bridge: stop requested");
    bridge.shutdown();
    g_bridge = nullptr;
    return 0;
}
