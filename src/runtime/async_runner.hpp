#pragma once

#include <atomic>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include "core/errors/bridge_errors.hpp"
#include "runtime/event_loop.hpp"

namespace toolbridge::runtime {

// Runs blocking adapter work (connect, list tools, call tool, close) on its own
// thread and delivers the Result back on the event-loop thread. Exceptions
// thrown by the work become Internal errors instead of escaping the thread.
class AsyncRunner {
public:
    explicit AsyncRunner(EventLoop& loop);
    ~AsyncRunner();
    AsyncRunner(const AsyncRunner&) = delete;
    AsyncRunner& operator=(const AsyncRunner&) = delete;

    template <typename T>
    void submit(std::function<core::errors::Result<T>()> work,
                std::function<void(core::errors::Result<T>)> on_done) {
        EventLoop* loop = &loop_;
        launch([loop, work = std::move(work), on_done = std::move(on_done)]() {
            auto result = std::make_shared<core::errors::Result<T>>(guarded(work));
            loop->post([on_done, result]() { on_done(std::move(*result)); });
        });
    }

    // Like submit(), but at most lane_limit() tasks sharing a key run at once;
    // the rest wait in submission order.
    template <typename T>
    void submit(const std::string& key, std::function<core::errors::Result<T>()> work,
                std::function<void(core::errors::Result<T>)> on_done) {
        EventLoop* loop = &loop_;
        enqueue(key, [loop, work = std::move(work), on_done = std::move(on_done)]() {
            auto result = std::make_shared<core::errors::Result<T>>(guarded(work));
            loop->post([on_done, result]() { on_done(std::move(*result)); });
        });
    }

    // Work whose outcome nobody waits for, e.g. adapter teardown
    void detach(std::function<void()> work);

    void set_lane_limit(std::size_t limit);
    std::size_t lane_limit() const;
    std::size_t queued(const std::string& key) const;

    std::size_t in_flight() const;
    // Joins every worker; lane work still queued is discarded
    void join_all();

private:
    template <typename T>
    static core::errors::Result<T> guarded(const std::function<core::errors::Result<T>()>& work) {
        try {
            return work();
        } catch (const std::exception& e) {
            return core::errors::BridgeError{core::errors::ErrorCategory::Internal,
                                             e.what(), "unhandled_exception"};
        }
    }

    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic_bool> finished;
    };

    struct Lane {
        std::size_t running = 0;
        std::deque<std::function<void()>> waiting;
    };

    void launch(std::function<void()> body);
    void launch_locked(std::function<void()> body);
    void enqueue(const std::string& key, std::function<void()> body);
    void start_lane_task_locked(const std::string& key, std::function<void()> body);
    void finish_lane_task(const std::string& key);
    void reap_finished_locked();

    EventLoop& loop_;
    mutable std::mutex mutex_;
    std::list<Worker> workers_;
    std::map<std::string, Lane> lanes_;
    std::size_t lane_limit_ = 4;
    bool joining_ = false;
};

}  // namespace toolbridge::runtime
