#pragma once

#include <memory>
#include <vector>
#include "core/errors/bridge_errors.hpp"
#include "protocol/tool_contract.hpp"

namespace toolbridge::tools {

// One connection to one backend. The bridge treats it as opaque: it is created
// by a ToolClientFactory, driven from worker threads, and closed exactly once.
// Implementations must allow close() to be called while another thread is
// blocked inside call_tool().
class ToolClient {
public:
    virtual ~ToolClient() = default;

    virtual core::errors::Result<bool> connect(const protocol::ConnectSpec& spec) = 0;

    virtual core::errors::Result<std::vector<protocol::ToolInfo>> get_all_tools() = 0;

    virtual core::errors::Result<protocol::ToolCallResult> call_tool(
        const protocol::ToolCall& call) = 0;

    // Best-effort teardown; never throws
    virtual void close() = 0;

    // False once the underlying process or stream is gone
    virtual bool is_alive() const = 0;
};

class ToolClientFactory {
public:
    virtual ~ToolClientFactory() = default;

    virtual std::shared_ptr<ToolClient> create(const protocol::ConnectSpec& spec) = 0;
};

}  // namespace toolbridge::tools
