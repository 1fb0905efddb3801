#include "session/reconnection_supervisor.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace toolbridge::session {

ReconnectionSupervisor::ReconnectionSupervisor(runtime::EventLoop& loop,
                                               core::config::RestartPolicy policy)
    : loop_(loop), policy_(policy) {}

void ReconnectionSupervisor::set_restart_handler(RestartHandler handler) {
    restart_ = std::move(handler);
}

std::chrono::milliseconds ReconnectionSupervisor::backoff_delay(
    const std::chrono::milliseconds base, const int attempt) {
    if (attempt <= 1) {
        return base;
    }
    return base * (1LL << (attempt - 1));
}

ClosureDecision ReconnectionSupervisor::on_failure(const std::string& name) {
    RestartState& state = states_[name];
    cancel_timers(state);

    state.attempts += 1;
    if (state.attempts > policy_.max_attempts) {
        state.exhausted = true;
        LOG_ERROR("ReconnectionSupervisor: service " + name + " failed " +
                  std::to_string(state.attempts) + " times; giving up until it is re-registered or re-spawned");
        return ClosureDecision::GaveUp;
    }

    const auto delay = backoff_delay(policy_.base_delay, state.attempts);
    LOG_INFO("ReconnectionSupervisor: reconnecting " + name + " in " +
             std::to_string(delay.count()) + "ms (attempt " +
             std::to_string(state.attempts) + ")");

    state.retry_timer = loop_.schedule_after(delay, [this, name]() {
        auto it = states_.find(name);
        if (it == states_.end()) {
            return;
        }
        it->second.retry_timer.reset();
        if (restart_) {
            restart_(name);
        }
    });
    return ClosureDecision::RetryScheduled;
}

void ReconnectionSupervisor::on_connected(const std::string& name, LivenessCheck still_connected) {
    RestartState& state = states_[name];
    cancel_timers(state);
    state.attempts = 0;
    state.exhausted = false;

    state.stability_timer = loop_.schedule_after(
        policy_.stability_window, [this, name, still_connected = std::move(still_connected)]() {
            auto it = states_.find(name);
            if (it == states_.end()) {
                return;
            }
            it->second.stability_timer.reset();
            if (still_connected && still_connected()) {
                it->second.attempts = 0;
                LOG_DEBUG("ReconnectionSupervisor: service " + name + " is stable");
            }
        });
}

void ReconnectionSupervisor::forget(const std::string& name) {
    auto it = states_.find(name);
    if (it == states_.end()) {
        return;
    }
    cancel_timers(it->second);
    states_.erase(it);
}

void ReconnectionSupervisor::clear() {
    for (auto& entry : states_) {
        cancel_timers(entry.second);
    }
    states_.clear();
}

int ReconnectionSupervisor::attempts(const std::string& name) const {
    auto it = states_.find(name);
    return it == states_.end() ? 0 : it->second.attempts;
}

bool ReconnectionSupervisor::retry_pending(const std::string& name) const {
    auto it = states_.find(name);
    return it != states_.end() && it->second.retry_timer.has_value();
}

bool ReconnectionSupervisor::exhausted(const std::string& name) const {
    auto it = states_.find(name);
    return it != states_.end() && it->second.exhausted;
}

const core::config::RestartPolicy& ReconnectionSupervisor::policy() const {
    return policy_;
}

void ReconnectionSupervisor::cancel_timers(RestartState& state) {
    if (state.retry_timer) {
        loop_.cancel(state.retry_timer.value());
        state.retry_timer.reset();
    }
    if (state.stability_timer) {
        loop_.cancel(state.stability_timer.value());
        state.stability_timer.reset();
    }
}

}  // namespace toolbridge::session
