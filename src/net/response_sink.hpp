#pragma once

#include <cstddef>
#include <nlohmann/json.hpp>
#include "session/request_tracker.hpp"

namespace toolbridge::net {

// Where responses go. Implemented by the TCP listener and by test recorders.
class ResponseSink {
public:
    virtual ~ResponseSink() = default;

    // Queues one newline-terminated JSON document; false when the client is gone
    virtual bool send(session::ClientId client, const nlohmann::json& response) = 0;

    virtual std::size_t client_count() const = 0;
};

}  // namespace toolbridge::net
