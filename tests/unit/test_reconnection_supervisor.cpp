#include <chrono>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "core/config/bridge_config.hpp"
#include "runtime/event_loop.hpp"
#include "session/reconnection_supervisor.hpp"

namespace {

using namespace std::chrono_literals;
using toolbridge::core::config::RestartPolicy;
using toolbridge::runtime::EventLoop;
using toolbridge::session::ClosureDecision;
using toolbridge::session::ReconnectionSupervisor;

RestartPolicy fast_policy() {
    RestartPolicy policy;
    policy.base_delay = 5ms;
    policy.max_attempts = 5;
    policy.stability_window = 20ms;
    return policy;
}

TEST(ReconnectionSupervisorTest, BackoffDoublesFromBaseDelay) {
    const auto base = std::chrono::milliseconds(5000);
    EXPECT_EQ(ReconnectionSupervisor::backoff_delay(base, 1), 5000ms);
    EXPECT_EQ(ReconnectionSupervisor::backoff_delay(base, 2), 10000ms);
    EXPECT_EQ(ReconnectionSupervisor::backoff_delay(base, 3), 20000ms);
    EXPECT_EQ(ReconnectionSupervisor::backoff_delay(base, 4), 40000ms);
    EXPECT_EQ(ReconnectionSupervisor::backoff_delay(base, 5), 80000ms);
}

TEST(ReconnectionSupervisorTest, RetriesThenStopsAfterMaxAttempts) {
    EventLoop loop;
    ReconnectionSupervisor supervisor(loop, fast_policy());
    std::vector<std::string> restarts;
    supervisor.set_restart_handler([&](const std::string& name) { restarts.push_back(name); });

    for (int attempt = 1; attempt <= 5; ++attempt) {
        EXPECT_EQ(supervisor.on_failure("echo"), ClosureDecision::RetryScheduled);
        EXPECT_EQ(supervisor.attempts("echo"), attempt);
        EXPECT_TRUE(supervisor.retry_pending("echo"));
        ASSERT_TRUE(loop.run_until([&]() { return static_cast<int>(restarts.size()) == attempt; },
                                   2s));
        EXPECT_FALSE(supervisor.retry_pending("echo"));
    }

    // The sixth consecutive failure is terminal: no timer, no further restarts
    EXPECT_EQ(supervisor.on_failure("echo"), ClosureDecision::GaveUp);
    EXPECT_TRUE(supervisor.exhausted("echo"));
    EXPECT_FALSE(supervisor.retry_pending("echo"));
    loop.run_until([]() { return false; }, 100ms);
    EXPECT_EQ(restarts.size(), 5u);
}

TEST(ReconnectionSupervisorTest, ConnectResetsAttemptsAndStabilityKeepsThemAtZero) {
    EventLoop loop;
    ReconnectionSupervisor supervisor(loop, fast_policy());
    supervisor.set_restart_handler([](const std::string&) {});

    supervisor.on_failure("echo");
    supervisor.on_failure("echo");
    EXPECT_EQ(supervisor.attempts("echo"), 2);

    bool checked = false;
    supervisor.on_connected("echo", [&]() {
        checked = true;
        return true;
    });
    EXPECT_EQ(supervisor.attempts("echo"), 0);
    EXPECT_FALSE(supervisor.retry_pending("echo"));

    EXPECT_TRUE(loop.run_until([&]() { return checked; }, 2s));
    EXPECT_EQ(supervisor.attempts("echo"), 0);
}

TEST(ReconnectionSupervisorTest, ForgetCancelsPendingRetry) {
    EventLoop loop;
    ReconnectionSupervisor supervisor(loop, fast_policy());
    int restarts = 0;
    supervisor.set_restart_handler([&](const std::string&) { ++restarts; });

    supervisor.on_failure("echo");
    ASSERT_TRUE(supervisor.retry_pending("echo"));
    supervisor.forget("echo");

    EXPECT_FALSE(supervisor.retry_pending("echo"));
    EXPECT_EQ(supervisor.attempts("echo"), 0);
    loop.run_until([]() { return false; }, 50ms);
    EXPECT_EQ(restarts, 0);
    EXPECT_EQ(loop.timer_count(), 0u);
}

TEST(ReconnectionSupervisorTest, ForgetLiftsTerminalState) {
    EventLoop loop;
    RestartPolicy policy = fast_policy();
    policy.max_attempts = 1;
    ReconnectionSupervisor supervisor(loop, policy);
    supervisor.set_restart_handler([](const std::string&) {});

    supervisor.on_failure("echo");
    EXPECT_EQ(supervisor.on_failure("echo"), ClosureDecision::GaveUp);
    supervisor.forget("echo");

    EXPECT_FALSE(supervisor.exhausted("echo"));
    EXPECT_EQ(supervisor.on_failure("echo"), ClosureDecision::RetryScheduled);
    supervisor.clear();
    EXPECT_EQ(loop.timer_count(), 0u);
}

}  // namespace
