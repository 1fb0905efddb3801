#include "mcp/http_stream_transport.hpp"

#include <optional>
#include <utility>
#include "core/logging/logger.hpp"
#include "mcp/sse_parser.hpp"

namespace toolbridge::mcp {

using core::errors::BridgeError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

std::optional<json> find_response(const json& payload, const std::string& wanted) {
    if (payload.is_array()) {
        for (const auto& item : payload) {
            auto found = find_response(item, wanted);
            if (found) {
                return found;
            }
        }
        return std::nullopt;
    }
    if (payload.is_object() && !payload.contains("method") && payload.contains("id") &&
        id_key(payload["id"]) == wanted) {
        return payload;
    }
    return std::nullopt;
}

std::optional<json> match_event(const SseEvent& event, const std::string& wanted) {
    json payload = json::parse(event.data, nullptr, false);
    if (payload.is_discarded()) {
        return std::nullopt;
    }
    return find_response(payload, wanted);
}

bool is_event_stream(const HttpResponse& response) {
    return response.header("content-type").find("text/event-stream") != std::string::npos;
}

}  // namespace

HttpStreamTransport::HttpStreamTransport(std::string url) : url_(std::move(url)) {}

HttpStreamTransport::~HttpStreamTransport() {
    close();
}

core::errors::Result<bool> HttpStreamTransport::open() {
    if (url_.rfind("http://", 0) != 0 && url_.rfind("https://", 0) != 0) {
        return BridgeError{ErrorCategory::Input, "Unsupported endpoint URL: " + url_,
                           "invalid_endpoint"};
    }
    opened_.store(true);
    return true;
}

core::errors::Result<json> HttpStreamTransport::request(const json& message,
                                                        const std::chrono::milliseconds timeout) {
    if (!is_open()) {
        return BridgeError{ErrorCategory::Transport, "Transport is closed", "transport_closed"};
    }

    const std::string wanted = id_key(message["id"]);
    std::optional<json> matched;
    SseParser parser;
    std::string collected;
    bool streaming = false;

    // Event-stream replies are consumed as they arrive so the stream can be
    // dropped as soon as our response shows up
    HttpRequest post = make_post(message, timeout);
    post.on_chunk = [&](const HttpResponse& partial, const std::string& chunk) {
        streaming = is_event_stream(partial);
        if (!streaming) {
            collected += chunk;
            return true;
        }
        for (const auto& event : parser.feed(chunk)) {
            matched = match_event(event, wanted);
            if (matched) {
                return false;
            }
        }
        return true;
    };

    auto sent = send(post);
    if (core::errors::is_error(sent)) {
        return core::errors::get_error(sent);
    }
    const HttpResponse& response = core::errors::get_value(sent);

    if (response.status == 404 && !session_id().empty()) {
        lost_.store(true);
        return BridgeError{ErrorCategory::Transport, "MCP session expired", "session_expired"};
    }
    if (response.status < 200 || response.status >= 300) {
        return BridgeError{ErrorCategory::Transport,
                           "HTTP " + std::to_string(response.status) + " from " + url_,
                           "http_status"};
    }

    if (!matched && streaming) {
        for (const auto& event : parser.finish()) {
            matched = match_event(event, wanted);
            if (matched) {
                break;
            }
        }
    } else if (!matched) {
        json payload = json::parse(collected, nullptr, false);
        if (payload.is_discarded()) {
            return BridgeError{ErrorCategory::Transport, "Invalid JSON in HTTP response",
                               "invalid_response"};
        }
        matched = find_response(payload, wanted);
    }

    if (!matched) {
        return BridgeError{ErrorCategory::Transport, "No response received for request " + wanted,
                           "missing_response"};
    }
    return *matched;
}

core::errors::Result<bool> HttpStreamTransport::notify(const json& message) {
    if (!is_open()) {
        return BridgeError{ErrorCategory::Transport, "Transport is closed", "transport_closed"};
    }
    auto sent = send(make_post(message, std::chrono::milliseconds(10000)));
    if (core::errors::is_error(sent)) {
        return core::errors::get_error(sent);
    }
    const long status = core::errors::get_value(sent).status;
    if (status < 200 || status >= 300) {
        return BridgeError{ErrorCategory::Transport,
                           "HTTP " + std::to_string(status) + " for notification", "http_status"};
    }
    return true;
}

void HttpStreamTransport::close() {
    if (!opened_.load() || closed_.exchange(true)) {
        return;
    }
    const std::string session = session_id();
    if (session.empty()) {
        return;
    }

    HttpRequest terminate;
    terminate.method = "DELETE";
    terminate.url = url_;
    terminate.headers.emplace_back("Mcp-Session-Id", session);
    terminate.timeout = std::chrono::milliseconds(2000);
    auto result = perform(terminate);
    if (core::errors::is_error(result)) {
        LOG_DEBUG("HttpStreamTransport: session delete failed: " +
                  core::errors::get_error(result).message);
    }
}

bool HttpStreamTransport::is_open() const {
    return opened_.load() && !closed_.load() && !lost_.load();
}

std::string HttpStreamTransport::session_id() const {
    std::lock_guard<std::mutex> lock(session_mutex_);
    return session_id_;
}

HttpRequest HttpStreamTransport::make_post(const json& message,
                                           const std::chrono::milliseconds timeout) const {
    HttpRequest post;
    post.method = "POST";
    post.url = url_;
    post.body = message.dump();
    post.timeout = timeout;
    post.cancel = &closed_;
    post.headers.emplace_back("Content-Type", "application/json");
    post.headers.emplace_back("Accept", "application/json, text/event-stream");
    const std::string session = session_id();
    if (!session.empty()) {
        post.headers.emplace_back("Mcp-Session-Id", session);
    }
    return post;
}

void HttpStreamTransport::remember_session(const HttpResponse& response) {
    const std::string session = response.header("mcp-session-id");
    if (session.empty()) {
        return;
    }
    std::lock_guard<std::mutex> lock(session_mutex_);
    session_id_ = session;
}

core::errors::Result<HttpResponse> HttpStreamTransport::send(const HttpRequest& request) {
    auto result = perform(request);
    if (core::errors::is_error(result)) {
        const auto& error = core::errors::get_error(result);
        if (error.code != "request_timeout") {
            lost_.store(true);
        }
        return error;
    }
    if (closed_.load()) {
        return BridgeError{ErrorCategory::Transport, "Transport closed", "transport_closed"};
    }
    remember_session(core::errors::get_value(result));
    return result;
}

}  // namespace toolbridge::mcp
