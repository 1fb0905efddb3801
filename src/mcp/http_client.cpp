#include "mcp/http_client.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <sstream>

namespace toolbridge::mcp {

using core::errors::BridgeError;
using core::errors::ErrorCategory;

namespace {

class CurlGlobal {
public:
    CurlGlobal() : code_(curl_global_init(CURL_GLOBAL_DEFAULT)) {}

    ~CurlGlobal() {
        if (code_ == CURLE_OK) {
            curl_global_cleanup();
        }
    }

    bool ok() const { return code_ == CURLE_OK; }

private:
    CURLcode code_;
};

// Initialised once before any worker thread touches curl
const CurlGlobal& curl_global() {
    static CurlGlobal global;
    return global;
}

struct TransferState {
    const HttpRequest* request = nullptr;
    HttpResponse* response = nullptr;
    CURL* handle = nullptr;
};

std::string lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string trim(const std::string& text) {
    const auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    auto* state = static_cast<TransferState*>(userdata);
    if (state->request->on_chunk) {
        if (state->response->status == 0) {
            curl_easy_getinfo(state->handle, CURLINFO_RESPONSE_CODE, &state->response->status);
        }
        if (!state->request->on_chunk(*state->response, std::string(ptr, total))) {
            state->response->stopped_early = true;
            return 0;
        }
        return total;
    }
    state->response->body.append(ptr, total);
    return total;
}

size_t header_callback(char* ptr, size_t size, size_t nitems, void* userdata) {
    const size_t total = size * nitems;
    auto* state = static_cast<TransferState*>(userdata);
    const std::string line(ptr, total);
    const auto colon = line.find(':');
    if (colon == std::string::npos) {
        // Status line of a new response (redirects, 100-continue): start over
        if (line.rfind("HTTP/", 0) == 0) {
            state->response->headers.clear();
            state->response->status = 0;
        }
        return total;
    }
    state->response->headers[lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    return total;
}

int progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* state = static_cast<TransferState*>(userdata);
    if (state->request->cancel != nullptr && state->request->cancel->load()) {
        state->response->stopped_early = true;
        return 1;
    }
    return 0;
}

}  // namespace

std::string HttpResponse::header(const std::string& name) const {
    const auto it = headers.find(lower(name));
    return it == headers.end() ? std::string() : it->second;
}

core::errors::Result<HttpResponse> perform(const HttpRequest& request) {
    if (!curl_global().ok()) {
        return BridgeError{ErrorCategory::Internal, "curl_global_init failed", "curl_init_failed"};
    }

    CURL* handle = curl_easy_init();
    if (!handle) {
        return BridgeError{ErrorCategory::Internal, "curl_easy_init failed", "curl_init_failed"};
    }

    HttpResponse response;
    TransferState state{&request, &response, handle};

    curl_easy_setopt(handle, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, 1L);
    if (request.method == "POST") {
        curl_easy_setopt(handle, CURLOPT_POST, 1L);
        curl_easy_setopt(handle, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    } else if (request.method != "GET") {
        curl_easy_setopt(handle, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    }
    curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(handle, CURLOPT_WRITEDATA, &state);
    curl_easy_setopt(handle, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(handle, CURLOPT_HEADERDATA, &state);
    curl_easy_setopt(handle, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(handle, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(handle, CURLOPT_XFERINFODATA, &state);
    curl_easy_setopt(handle, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
    curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(request.connect_timeout.count()));

    struct curl_slist* header_list = nullptr;
    for (const auto& header : request.headers) {
        const std::string line = header.first + ": " + header.second;
        header_list = curl_slist_append(header_list, line.c_str());
    }
    curl_easy_setopt(handle, CURLOPT_HTTPHEADER, header_list);

    const CURLcode code = curl_easy_perform(handle);
    curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &response.status);

    curl_slist_free_all(header_list);
    curl_easy_cleanup(handle);

    // Aborts we asked for are not failures
    if (code != CURLE_OK && !response.stopped_early) {
        std::ostringstream oss;
        oss << request.method << " " << request.url << " failed: " << curl_easy_strerror(code);
        return BridgeError{ErrorCategory::Transport, oss.str(),
                           code == CURLE_OPERATION_TIMEDOUT ? "request_timeout" : "http_failed"};
    }
    return response;
}

std::string resolve_url(const std::string& base, const std::string& reference) {
    if (reference.find("://") != std::string::npos) {
        return reference;
    }
    const auto scheme_end = base.find("://");
    if (scheme_end == std::string::npos) {
        return reference;
    }
    const auto path_start = base.find('/', scheme_end + 3);
    const std::string origin = path_start == std::string::npos ? base : base.substr(0, path_start);
    if (!reference.empty() && reference.front() == '/') {
        return origin + reference;
    }

    std::string directory = path_start == std::string::npos ? "/" : base.substr(path_start);
    const auto query = directory.find_first_of("?#");
    if (query != std::string::npos) {
        directory.erase(query);
    }
    directory.erase(directory.rfind('/') + 1);
    return origin + directory + reference;
}

}  // namespace toolbridge::mcp
