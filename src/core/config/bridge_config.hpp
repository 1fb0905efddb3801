#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "core/logging/logger.hpp"

namespace toolbridge::core::config {

    constexpr std::uint16_t kDefaultPort = 8752;
    constexpr const char* kDefaultHost = "127.0.0.1";
    constexpr const char* kDefaultServiceName = "default";
    constexpr const char* kVersion = "1.0.0";

    // Backoff parameters for the reconnection supervisor
    struct RestartPolicy {
        std::chrono::milliseconds base_delay{5000};
        int max_attempts = 5;
        std::chrono::milliseconds stability_window{60000};
    };

    // Everything the bridge needs to run, after defaults, environment and CLI are applied
    struct BridgeConfig {
        std::string host = kDefaultHost;
        std::uint16_t port = kDefaultPort;

        // Seed for the "default" local service; registered but never started automatically
        std::string default_command;
        std::vector<std::string> default_args;

        std::chrono::milliseconds request_timeout{180000};
        std::chrono::milliseconds sweep_interval{5000};
        std::chrono::milliseconds idle_timeout{120000};
        std::chrono::milliseconds adapter_timeout{30000};
        RestartPolicy restart;

        std::size_t max_message_bytes = 16 * 1024 * 1024;
        std::size_t max_connections = 64;
        // Tool calls in flight per service; more wait their turn
        std::size_t max_calls_per_service = 4;
        logging::LogLevel log_level = logging::LogLevel::INFO;
    };

} // namespace toolbridge::core::config
