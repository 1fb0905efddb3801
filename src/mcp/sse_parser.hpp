#pragma once

#include <string>
#include <vector>

namespace toolbridge::mcp {

struct SseEvent {
    std::string event = "message";
    std::string data;
    std::string id;
};

// Incremental text/event-stream decoder. Chunks may split lines anywhere.
class SseParser {
public:
    std::vector<SseEvent> feed(const std::string& chunk);

    // Flushes an event left open by a stream that ended without a blank line
    std::vector<SseEvent> finish();

private:
    void handle_line(const std::string& line, std::vector<SseEvent>& out);
    void dispatch(std::vector<SseEvent>& out);

    std::string buffer_;
    SseEvent current_;
    bool has_data_ = false;
};

}  // namespace toolbridge::mcp
