#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <string>
#include <utility>
#include <vector>
#include "core/errors/bridge_errors.hpp"

namespace toolbridge::mcp {

struct HttpResponse {
    long status = 0;
    std::map<std::string, std::string> headers;  // Names lower-cased
    std::string body;
    bool stopped_early = false;

    std::string header(const std::string& name) const;
};

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;

    // Zero disables the overall deadline, used for long-lived event streams
    std::chrono::milliseconds timeout{30000};
    std::chrono::milliseconds connect_timeout{10000};

    // Checked while the transfer runs; setting it aborts the transfer
    const std::atomic_bool* cancel = nullptr;

    // When set, body bytes are handed over as they arrive instead of being
    // collected. Status and headers are already filled in. Returning false
    // stops the transfer.
    std::function<bool(const HttpResponse&, const std::string&)> on_chunk;
};

// Blocking HTTP round-trip through libcurl. Network failures become
// Transport errors; any HTTP status is returned as a response.
core::errors::Result<HttpResponse> perform(const HttpRequest& request);

// Resolves a possibly relative reference against an absolute base URL
std::string resolve_url(const std::string& base, const std::string& reference);

}  // namespace toolbridge::mcp
