#include "session/request_tracker.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace toolbridge::session {

bool RequestTracker::track(PendingRequest request) {
    if (pending_.find(request.id) != pending_.end()) {
        return false;
    }
    const std::string id = request.id;
    pending_.emplace(id, std::move(request));
    return true;
}

std::optional<PendingRequest> RequestTracker::resolve(const std::string& id) {
    auto it = pending_.find(id);
    if (it == pending_.end()) {
        return std::nullopt;
    }
    PendingRequest request = std::move(it->second);
    pending_.erase(it);
    return request;
}

bool RequestTracker::contains(const std::string& id) const {
    return pending_.find(id) != pending_.end();
}

std::vector<PendingRequest> RequestTracker::sweep(const Clock::time_point now,
                                                  const Clock::duration timeout) {
    std::vector<PendingRequest> expired;
    for (auto it = pending_.begin(); it != pending_.end();) {
        if (now - it->second.created_at > timeout) {
            LOG_WARN("RequestTracker: request " + it->first + " to " + it->second.service +
                     " timed out");
            expired.push_back(std::move(it->second));
            it = pending_.erase(it);
        } else {
            ++it;
        }
    }
    return expired;
}

std::size_t RequestTracker::drop_client(const ClientId client) {
    std::size_t dropped = 0;
    for (auto it = pending_.begin(); it != pending_.end();) {
        if (it->second.client == client) {
            it = pending_.erase(it);
            ++dropped;
        } else {
            ++it;
        }
    }
    if (dropped > 0) {
        LOG_INFO("RequestTracker: dropped " + std::to_string(dropped) +
                 " pending request(s) of disconnected client " + std::to_string(client));
    }
    return dropped;
}

void RequestTracker::clear() {
    pending_.clear();
}

std::size_t RequestTracker::size() const {
    return pending_.size();
}

}  // namespace toolbridge::session
