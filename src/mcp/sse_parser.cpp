#include "mcp/sse_parser.hpp"

namespace toolbridge::mcp {

std::vector<SseEvent> SseParser::feed(const std::string& chunk) {
    std::vector<SseEvent> events;
    buffer_ += chunk;

    std::size_t start = 0;
    while (true) {
        const auto end = buffer_.find('\n', start);
        if (end == std::string::npos) {
            break;
        }
        std::string line = buffer_.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        handle_line(line, events);
        start = end + 1;
    }
    buffer_.erase(0, start);
    return events;
}

std::vector<SseEvent> SseParser::finish() {
    std::vector<SseEvent> events;
    if (!buffer_.empty()) {
        std::string line;
        line.swap(buffer_);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        handle_line(line, events);
    }
    dispatch(events);
    return events;
}

void SseParser::handle_line(const std::string& line, std::vector<SseEvent>& out) {
    if (line.empty()) {
        dispatch(out);
        return;
    }
    if (line.front() == ':') {
        return;  // comment / keep-alive
    }

    const auto colon = line.find(':');
    const std::string field = line.substr(0, colon);
    std::string value;
    if (colon != std::string::npos) {
        value = line.substr(colon + 1);
        if (!value.empty() && value.front() == ' ') {
            value.erase(0, 1);
        }
    }

    if (field == "data") {
        if (has_data_) {
            current_.data += '\n';
        }
        current_.data += value;
        has_data_ = true;
    } else if (field == "event") {
        current_.event = value.empty() ? "message" : value;
    } else if (field == "id") {
        current_.id = value;
    }
}

void SseParser::dispatch(std::vector<SseEvent>& out) {
    if (has_data_) {
        out.push_back(current_);
    }
    current_ = SseEvent{};
    has_data_ = false;
}

}  // namespace toolbridge::mcp
