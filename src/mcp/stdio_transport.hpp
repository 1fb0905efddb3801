#pragma once

#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <sys/types.h>
#include "mcp/transport.hpp"
#include "protocol/tool_contract.hpp"

namespace toolbridge::mcp {

// MCP over a child process's stdin/stdout, one JSON message per line. The
// child's stderr is inherited so backend diagnostics land in the bridge log.
class StdioTransport : public Transport {
public:
    explicit StdioTransport(protocol::StdioSpec spec);
    ~StdioTransport() override;

    core::errors::Result<bool> open() override;
    core::errors::Result<nlohmann::json> request(const nlohmann::json& message,
                                                 std::chrono::milliseconds timeout) override;
    core::errors::Result<bool> notify(const nlohmann::json& message) override;
    void close() override;
    bool is_open() const override;

    pid_t pid() const;
    std::optional<int> exit_code() const;

private:
    core::errors::Result<bool> write_line(const std::string& line);
    core::errors::Result<nlohmann::json> read_message(
        std::chrono::steady_clock::time_point deadline);
    void answer_server_request(const nlohmann::json& message);
    bool reap(bool block) const;
    std::string exit_description() const;

    protocol::StdioSpec spec_;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    std::string read_buffer_;

    std::mutex request_mutex_;
    mutable std::mutex process_mutex_;
    pid_t pid_ = -1;
    mutable bool exited_ = false;
    mutable int exit_code_ = -1;
    std::atomic_bool closing_{false};
    std::atomic_bool stream_closed_{false};
};

}  // namespace toolbridge::mcp
