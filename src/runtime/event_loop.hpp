#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <vector>

namespace toolbridge::runtime {

// Single-threaded poll(2) loop: file-descriptor watchers, one-shot and periodic
// timers, and a thread-safe post() queue for completions coming back from
// worker threads. Everything except post() and stop() must be called on the
// loop thread.
class EventLoop {
public:
    using Task = std::function<void()>;
    using FdCallback = std::function<void(short revents)>;
    using Clock = std::chrono::steady_clock;
    using TimerId = std::uint64_t;

    EventLoop();
    ~EventLoop();
    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    // False when the wakeup pipe could not be created
    bool valid() const;

    void post(Task task);

    TimerId schedule_after(Clock::duration delay, Task task);
    TimerId schedule_every(Clock::duration interval, Task task);
    bool cancel(TimerId id);
    bool has_timer(TimerId id) const;
    std::size_t timer_count() const;

    void watch(int fd, short events, FdCallback callback);
    void set_events(int fd, short events);
    void unwatch(int fd);

    void run_once(std::chrono::milliseconds max_wait);
    void run();
    void stop();
    bool stopped() const;

    // Spins the loop until done() holds or the timeout elapses; returns done()
    bool run_until(const std::function<bool()>& done, Clock::duration timeout);

private:
    struct Timer {
        Clock::time_point deadline;
        Clock::duration interval{0};
        bool periodic = false;
        Task task;
    };

    struct Watcher {
        short events = 0;
        FdCallback callback;
    };

    void drain_wakeups();
    void run_expired_timers();
    void run_posted();
    int next_timeout_ms(std::chrono::milliseconds max_wait) const;

    int wake_read_ = -1;
    int wake_write_ = -1;
    std::atomic_bool stop_requested_{false};

    std::mutex posted_mutex_;
    std::vector<Task> posted_;

    std::map<TimerId, Timer> timers_;
    TimerId next_timer_id_ = 1;
    std::map<int, Watcher> watchers_;
};

}  // namespace toolbridge::runtime
