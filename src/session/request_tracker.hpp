#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace toolbridge::session {

// Identifies a TCP client; a back-reference only, never ownership of the socket
using ClientId = std::uint64_t;

struct PendingRequest {
    std::string id;
    ClientId client = 0;
    std::string service;
    std::chrono::steady_clock::time_point created_at;
    std::optional<std::string> inner_call_id;
};

// Outstanding tool calls. Every entry leaves the table exactly once, through
// resolve(), sweep(), drop_client() or clear(); removing an absent id is a no-op.
class RequestTracker {
public:
    using Clock = std::chrono::steady_clock;

    // False when the id is already pending
    bool track(PendingRequest request);

    std::optional<PendingRequest> resolve(const std::string& id);
    bool contains(const std::string& id) const;

    // Removes and returns every entry older than timeout at now
    std::vector<PendingRequest> sweep(Clock::time_point now, Clock::duration timeout);

    // Removes the client's entries without replying; returns how many were dropped
    std::size_t drop_client(ClientId client);

    void clear();
    std::size_t size() const;

private:
    std::map<std::string, PendingRequest> pending_;
};

}  // namespace toolbridge::session
