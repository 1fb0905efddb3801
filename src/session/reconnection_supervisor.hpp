#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include "core/config/bridge_config.hpp"
#include "runtime/event_loop.hpp"

namespace toolbridge::session {

struct RestartState {
    int attempts = 0;
    bool exhausted = false;
    std::optional<runtime::EventLoop::TimerId> retry_timer;
    std::optional<runtime::EventLoop::TimerId> stability_timer;
};

enum class ClosureDecision {
    RetryScheduled,
    GaveUp
};

// Per-service backoff state machine. Retries are cancellable timers stored with
// the attempt counter, so forgetting a service deterministically cancels them.
class ReconnectionSupervisor {
public:
    using RestartHandler = std::function<void(const std::string& name)>;
    using LivenessCheck = std::function<bool()>;

    ReconnectionSupervisor(runtime::EventLoop& loop, core::config::RestartPolicy policy);

    void set_restart_handler(RestartHandler handler);

    // Counts a failure; schedules the next retry or enters the terminal state
    ClosureDecision on_failure(const std::string& name);

    // Resets the counter, cancels any pending retry and arms the stability check
    void on_connected(const std::string& name, LivenessCheck still_connected);

    // Drops all state for the service and cancels its timers
    void forget(const std::string& name);
    void clear();

    int attempts(const std::string& name) const;
    bool retry_pending(const std::string& name) const;
    bool exhausted(const std::string& name) const;

    const core::config::RestartPolicy& policy() const;

    // base * 2^(attempt-1)
    static std::chrono::milliseconds backoff_delay(std::chrono::milliseconds base, int attempt);

private:
    void cancel_timers(RestartState& state);

    runtime::EventLoop& loop_;
    core::config::RestartPolicy policy_;
    RestartHandler restart_;
    std::map<std::string, RestartState> states_;
};

}  // namespace toolbridge::session
