#pragma once

#include <chrono>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/bridge_errors.hpp"

namespace toolbridge::mcp {

// Moves JSON-RPC messages to and from one MCP server. request() may be called
// from several threads; close() may be called while a request is blocked and
// must make it return promptly.
class Transport {
public:
    virtual ~Transport() = default;

    virtual core::errors::Result<bool> open() = 0;

    // Sends a request and waits for the response carrying the same id
    virtual core::errors::Result<nlohmann::json> request(const nlohmann::json& message,
                                                         std::chrono::milliseconds timeout) = 0;

    virtual core::errors::Result<bool> notify(const nlohmann::json& message) = 0;

    virtual void close() = 0;

    virtual bool is_open() const = 0;
};

// Correlation key for a JSON-RPC id; numbers and strings never collide
inline std::string id_key(const nlohmann::json& id) {
    return id.dump();
}

}  // namespace toolbridge::mcp
