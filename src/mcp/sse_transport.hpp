#pragma once

#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include "mcp/transport.hpp"

namespace toolbridge::mcp {

// Legacy MCP HTTP+SSE: a long-lived GET event stream carries every server
// message, and the first "endpoint" event names the URL that client messages
// are POSTed to.
class SseTransport : public Transport {
public:
    explicit SseTransport(std::string url,
                          std::chrono::milliseconds endpoint_timeout = std::chrono::milliseconds(30000));
    ~SseTransport() override;

    core::errors::Result<bool> open() override;
    core::errors::Result<nlohmann::json> request(const nlohmann::json& message,
                                                 std::chrono::milliseconds timeout) override;
    core::errors::Result<bool> notify(const nlohmann::json& message) override;
    void close() override;
    bool is_open() const override;

    std::string endpoint() const;

private:
    void read_stream();
    void handle_message(const std::string& data);
    core::errors::Result<bool> post(const nlohmann::json& message, std::chrono::milliseconds timeout);

    std::string url_;
    std::chrono::milliseconds endpoint_timeout_;
    std::thread reader_;

    mutable std::mutex mutex_;
    std::condition_variable changed_;
    std::string endpoint_;
    std::string stream_error_;
    std::map<std::string, nlohmann::json> responses_;
    std::map<std::string, int> waiting_;
    bool stream_ended_ = false;

    std::atomic_bool started_{false};
    std::atomic_bool closing_{false};
};

}  // namespace toolbridge::mcp
