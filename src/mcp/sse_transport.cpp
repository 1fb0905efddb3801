#include "mcp/sse_transport.hpp"

#include <utility>
#include "core/logging/logger.hpp"
#include "mcp/http_client.hpp"
#include "mcp/sse_parser.hpp"

namespace toolbridge::mcp {

using core::errors::BridgeError;
using core::errors::ErrorCategory;
using nlohmann::json;

SseTransport::SseTransport(std::string url, const std::chrono::milliseconds endpoint_timeout)
    : url_(std::move(url)), endpoint_timeout_(endpoint_timeout) {}

SseTransport::~SseTransport() {
    close();
}

core::errors::Result<bool> SseTransport::open() {
    if (url_.rfind("http://", 0) != 0 && url_.rfind("https://", 0) != 0) {
        return BridgeError{ErrorCategory::Input, "Unsupported endpoint URL: " + url_,
                           "invalid_endpoint"};
    }
    if (started_.exchange(true)) {
        return BridgeError{ErrorCategory::Internal, "Transport already opened", "already_open"};
    }

    reader_ = std::thread([this]() { read_stream(); });

    std::unique_lock<std::mutex> lock(mutex_);
    const bool ready = changed_.wait_for(lock, endpoint_timeout_, [this]() {
        return !endpoint_.empty() || stream_ended_ || closing_.load();
    });
    if (!endpoint_.empty()) {
        LOG_INFO("SseTransport: message endpoint " + endpoint_);
        return true;
    }
    if (!ready) {
        return BridgeError{ErrorCategory::Transport,
                           "Timed out waiting for endpoint event from " + url_, "request_timeout"};
    }
    return BridgeError{ErrorCategory::Transport,
                       "Event stream closed before endpoint event" +
                           (stream_error_.empty() ? std::string() : ": " + stream_error_),
                       "stream_closed"};
}

core::errors::Result<json> SseTransport::request(const json& message,
                                                 const std::chrono::milliseconds timeout) {
    const std::string key = id_key(message["id"]);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (endpoint_.empty() || stream_ended_ || closing_.load()) {
            return BridgeError{ErrorCategory::Transport, "Event stream is not open",
                               "transport_closed"};
        }
        ++waiting_[key];
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    auto posted = post(message, timeout);

    std::unique_lock<std::mutex> lock(mutex_);
    auto release = [this, &key]() {
        if (--waiting_[key] <= 0) {
            waiting_.erase(key);
        }
    };
    if (core::errors::is_error(posted)) {
        release();
        return core::errors::get_error(posted);
    }

    changed_.wait_until(lock, deadline, [this, &key]() {
        return responses_.count(key) > 0 || stream_ended_ || closing_.load();
    });
    release();

    const auto it = responses_.find(key);
    if (it != responses_.end()) {
        json response = std::move(it->second);
        responses_.erase(it);
        return response;
    }
    if (closing_.load()) {
        return BridgeError{ErrorCategory::Transport, "Transport closed", "transport_closed"};
    }
    if (stream_ended_) {
        return BridgeError{ErrorCategory::Transport, "Event stream closed", "stream_closed"};
    }
    return BridgeError{ErrorCategory::Transport, "Timed out waiting for response", "request_timeout"};
}

core::errors::Result<bool> SseTransport::notify(const json& message) {
    if (!is_open()) {
        return BridgeError{ErrorCategory::Transport, "Event stream is not open", "transport_closed"};
    }
    return post(message, std::chrono::milliseconds(10000));
}

void SseTransport::close() {
    if (closing_.exchange(true)) {
        return;
    }
    changed_.notify_all();
    if (reader_.joinable()) {
        if (reader_.get_id() == std::this_thread::get_id()) {
            reader_.detach();
        } else {
            reader_.join();
        }
    }
}

bool SseTransport::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !endpoint_.empty() && !stream_ended_ && !closing_.load();
}

std::string SseTransport::endpoint() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return endpoint_;
}

void SseTransport::read_stream() {
    SseParser parser;
    HttpRequest get;
    get.url = url_;
    get.timeout = std::chrono::milliseconds(0);
    get.cancel = &closing_;
    get.headers.emplace_back("Accept", "text/event-stream");
    get.headers.emplace_back("Cache-Control", "no-cache");
    get.on_chunk = [this, &parser](const HttpResponse& partial, const std::string& chunk) {
        if (partial.status != 0 && (partial.status < 200 || partial.status >= 300)) {
            std::lock_guard<std::mutex> lock(mutex_);
            stream_error_ = "HTTP " + std::to_string(partial.status);
            return false;
        }
        for (const auto& event : parser.feed(chunk)) {
            if (event.event == "endpoint") {
                std::lock_guard<std::mutex> lock(mutex_);
                endpoint_ = resolve_url(url_, event.data);
                changed_.notify_all();
            } else if (event.event == "message") {
                handle_message(event.data);
            }
        }
        return !closing_.load();
    };

    auto result = perform(get);
    std::lock_guard<std::mutex> lock(mutex_);
    if (core::errors::is_error(result)) {
        stream_error_ = core::errors::get_error(result).message;
    } else if (stream_error_.empty() && core::errors::get_value(result).status >= 300) {
        stream_error_ = "HTTP " + std::to_string(core::errors::get_value(result).status);
    }
    if (!closing_.load()) {
        LOG_WARN("SseTransport: event stream from " + url_ + " ended" +
                 (stream_error_.empty() ? std::string() : ": " + stream_error_));
    }
    stream_ended_ = true;
    changed_.notify_all();
}

void SseTransport::handle_message(const std::string& data) {
    json payload = json::parse(data, nullptr, false);
    if (payload.is_discarded() || !payload.is_object()) {
        LOG_DEBUG("SseTransport: ignoring malformed message");
        return;
    }

    if (payload.contains("method")) {
        if (!payload.contains("id")) {
            return;
        }
        json reply;
        reply["jsonrpc"] = "2.0";
        reply["id"] = payload["id"];
        if (payload["method"] == "ping") {
            reply["result"] = json::object();
        } else {
            reply["error"] = {{"code", core::errors::codes::kNotFound},
                              {"message", "Method not supported by client"}};
        }
        auto sent = post(reply, std::chrono::milliseconds(5000));
        if (core::errors::is_error(sent)) {
            LOG_DEBUG("SseTransport: failed to answer server request: " +
                      core::errors::get_error(sent).message);
        }
        return;
    }

    if (!payload.contains("id")) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string key = id_key(payload["id"]);
    if (waiting_.count(key) == 0) {
        LOG_DEBUG("SseTransport: discarding response for id " + key);
        return;
    }
    responses_[key] = std::move(payload);
    changed_.notify_all();
}

core::errors::Result<bool> SseTransport::post(const json& message,
                                              const std::chrono::milliseconds timeout) {
    HttpRequest request;
    request.method = "POST";
    request.url = endpoint();
    request.body = message.dump();
    request.timeout = timeout;
    request.cancel = &closing_;
    request.headers.emplace_back("Content-Type", "application/json");

    auto result = perform(request);
    if (core::errors::is_error(result)) {
        return core::errors::get_error(result);
    }
    const HttpResponse& response = core::errors::get_value(result);
    if (response.status < 200 || response.status >= 300) {
        return BridgeError{ErrorCategory::Transport,
                           "HTTP " + std::to_string(response.status) + " from " + request.url,
                           "http_status"};
    }

    // Some servers answer inline instead of on the stream
    if (message.contains("id") && !message.contains("method")) {
        return true;
    }
    json inline_reply = json::parse(response.body, nullptr, false);
    if (!inline_reply.is_discarded() && inline_reply.is_object() && inline_reply.contains("id") &&
        !inline_reply.contains("method")) {
        std::lock_guard<std::mutex> lock(mutex_);
        const std::string key = id_key(inline_reply["id"]);
        if (waiting_.count(key) > 0) {
            responses_[key] = std::move(inline_reply);
            changed_.notify_all();
        }
    }
    return true;
}

}  // namespace toolbridge::mcp
