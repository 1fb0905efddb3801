#pragma once

#include <atomic>
#include <mutex>
#include <string>
#include "mcp/http_client.hpp"
#include "mcp/transport.hpp"

namespace toolbridge::mcp {

// MCP Streamable HTTP: every message is a POST to one endpoint and the reply
// arrives either as a JSON body or as an event stream. The server may pin a
// session with the Mcp-Session-Id header.
class HttpStreamTransport : public Transport {
public:
    explicit HttpStreamTransport(std::string url);
    ~HttpStreamTransport() override;

    core::errors::Result<bool> open() override;
    core::errors::Result<nlohmann::json> request(const nlohmann::json& message,
                                                 std::chrono::milliseconds timeout) override;
    core::errors::Result<bool> notify(const nlohmann::json& message) override;
    void close() override;
    bool is_open() const override;

    std::string session_id() const;

private:
    HttpRequest make_post(const nlohmann::json& message, std::chrono::milliseconds timeout) const;
    void remember_session(const HttpResponse& response);
    core::errors::Result<HttpResponse> send(const HttpRequest& request);

    std::string url_;
    mutable std::mutex session_mutex_;
    std::string session_id_;
    std::atomic_bool opened_{false};
    std::atomic_bool closed_{false};
    std::atomic_bool lost_{false};
};

}  // namespace toolbridge::mcp
