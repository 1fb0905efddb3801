#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include "core/errors/bridge_errors.hpp"
#include "runtime/async_runner.hpp"
#include "runtime/event_loop.hpp"

namespace {

using namespace std::chrono_literals;
using toolbridge::core::errors::BridgeError;
using toolbridge::core::errors::ErrorCategory;
using toolbridge::core::errors::Result;
using toolbridge::runtime::AsyncRunner;
using toolbridge::runtime::EventLoop;

TEST(EventLoopTest, RunsTimersInDeadlineOrder) {
    EventLoop loop;
    ASSERT_TRUE(loop.valid());

    std::vector<int> order;
    loop.schedule_after(30ms, [&]() { order.push_back(2); });
    loop.schedule_after(5ms, [&]() { order.push_back(1); });

    EXPECT_TRUE(loop.run_until([&]() { return order.size() == 2; }, 2s));
    EXPECT_EQ(order, (std::vector<int>{1, 2}));
    EXPECT_EQ(loop.timer_count(), 0u);
}

TEST(EventLoopTest, CancelledTimerNeverFires) {
    EventLoop loop;
    bool fired = false;
    const auto id = loop.schedule_after(10ms, [&]() { fired = true; });
    EXPECT_TRUE(loop.has_timer(id));
    EXPECT_TRUE(loop.cancel(id));
    EXPECT_FALSE(loop.has_timer(id));

    loop.run_until([]() { return false; }, 50ms);
    EXPECT_FALSE(fired);
    EXPECT_FALSE(loop.cancel(id));
}

TEST(EventLoopTest, PeriodicTimerRepeats) {
    EventLoop loop;
    int ticks = 0;
    const auto id = loop.schedule_every(5ms, [&]() { ++ticks; });
    EXPECT_TRUE(loop.run_until([&]() { return ticks >= 3; }, 2s));
    EXPECT_TRUE(loop.has_timer(id));
    loop.cancel(id);
}

TEST(EventLoopTest, PostFromAnotherThreadWakesLoop) {
    EventLoop loop;
    std::atomic_bool ran{false};
    std::thread poster([&]() { loop.post([&]() { ran = true; }); });
    EXPECT_TRUE(loop.run_until([&]() { return ran.load(); }, 2s));
    poster.join();
}

TEST(EventLoopTest, StopEndsRun) {
    EventLoop loop;
    loop.schedule_after(10ms, [&]() { loop.stop(); });
    loop.run();
    EXPECT_TRUE(loop.stopped());
}

TEST(AsyncRunnerTest, DeliversResultOnLoopThread) {
    EventLoop loop;
    AsyncRunner runner(loop);
    const auto loop_thread = std::this_thread::get_id();

    bool done = false;
    std::thread::id completion_thread;
    runner.submit<int>([]() -> Result<int> { return 41 + 1; },
                       [&](Result<int> result) {
                           ASSERT_FALSE(toolbridge::core::errors::is_error(result));
                           EXPECT_EQ(toolbridge::core::errors::get_value(result), 42);
                           completion_thread = std::this_thread::get_id();
                           done = true;
                       });

    EXPECT_TRUE(loop.run_until([&]() { return done; }, 2s));
    EXPECT_EQ(completion_thread, loop_thread);
    runner.join_all();
    EXPECT_EQ(runner.in_flight(), 0u);
}

TEST(AsyncRunnerTest, ConvertsExceptionsToInternalErrors) {
    EventLoop loop;
    AsyncRunner runner(loop);

    bool done = false;
    runner.submit<std::string>(
        []() -> Result<std::string> { throw std::runtime_error("adapter exploded"); },
        [&](Result<std::string> result) {
            ASSERT_TRUE(toolbridge::core::errors::is_error(result));
            const auto& err = toolbridge::core::errors::get_error(result);
            EXPECT_EQ(err.category, ErrorCategory::Internal);
            EXPECT_EQ(err.code, "unhandled_exception");
            EXPECT_EQ(err.message, "adapter exploded");
            done = true;
        });

    EXPECT_TRUE(loop.run_until([&]() { return done; }, 2s));
}

TEST(AsyncRunnerTest, DetachedWorkRunsToCompletion) {
    EventLoop loop;
    AsyncRunner runner(loop);
    std::atomic_bool closed{false};
    runner.detach([&]() {
        std::this_thread::sleep_for(5ms);
        closed = true;
    });
    runner.join_all();
    EXPECT_TRUE(closed.load());
}

TEST(AsyncRunnerTest, LaneLimitQueuesWorkInSubmissionOrder) {
    EventLoop loop;
    AsyncRunner runner(loop);
    runner.set_lane_limit(1);

    std::mutex mutex;
    std::condition_variable cv;
    bool open = false;
    std::vector<int> order;
    std::atomic_int running{0};
    std::atomic_int peak{0};

    auto task = [&](int n) {
        return [&, n]() -> Result<int> {
            const int now = ++running;
            if (now > peak.load()) {
                peak = now;
            }
            if (n == 1) {
                std::unique_lock<std::mutex> lock(mutex);
                cv.wait_for(lock, 2s, [&]() { return open; });
            }
            --running;
            return n;
        };
    };
    auto record = [&](Result<int> result) { order.push_back(toolbridge::core::errors::get_value(result)); };

    runner.submit<int>("svc", task(1), record);
    runner.submit<int>("svc", task(2), record);
    runner.submit<int>("svc", task(3), record);
    EXPECT_EQ(runner.queued("svc"), 2u);

    // Another key is not held up by the blocked lane
    bool other_done = false;
    runner.submit<int>("other", []() -> Result<int> { return 0; },
                       [&](Result<int>) { other_done = true; });
    EXPECT_TRUE(loop.run_until([&]() { return other_done; }, 2s));
    EXPECT_TRUE(order.empty());

    {
        std::lock_guard<std::mutex> lock(mutex);
        open = true;
    }
    cv.notify_all();

    EXPECT_TRUE(loop.run_until([&]() { return order.size() == 3; }, 2s));
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(peak.load(), 1);
    EXPECT_EQ(runner.queued("svc"), 0u);
    runner.join_all();
}

TEST(AsyncRunnerTest, JoinDiscardsQueuedLaneWork) {
    EventLoop loop;
    AsyncRunner runner(loop);
    runner.set_lane_limit(1);

    std::atomic_int ran{0};
    runner.submit<int>("svc", [&]() -> Result<int> {
        std::this_thread::sleep_for(20ms);
        ++ran;
        return 1;
    }, [](Result<int>) {});
    runner.submit<int>("svc", [&]() -> Result<int> {
        ++ran;
        return 2;
    }, [](Result<int>) {});

    runner.join_all();
    EXPECT_EQ(ran.load(), 1);
    EXPECT_EQ(runner.in_flight(), 0u);
}

}  // namespace
