#include "runtime/event_loop.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <string>
#include <unistd.h>
#include <utility>
#include "core/logging/logger.hpp"

namespace toolbridge::runtime {

namespace {

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

}  // namespace

EventLoop::EventLoop() {
    int fds[2] = {-1, -1};
    if (pipe(fds) != 0) {
        LOG_ERROR(std::string("EventLoop: failed to create wakeup pipe: ") + std::strerror(errno));
        return;
    }
    set_nonblocking(fds[0]);
    set_nonblocking(fds[1]);
    static_cast<void>(fcntl(fds[0], F_SETFD, FD_CLOEXEC));
    static_cast<void>(fcntl(fds[1], F_SETFD, FD_CLOEXEC));
    wake_read_ = fds[0];
    wake_write_ = fds[1];
}

EventLoop::~EventLoop() {
    if (wake_read_ >= 0) {
        static_cast<void>(close(wake_read_));
    }
    if (wake_write_ >= 0) {
        static_cast<void>(close(wake_write_));
    }
}

bool EventLoop::valid() const {
    return wake_read_ >= 0 && wake_write_ >= 0;
}

void EventLoop::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(posted_mutex_);
        posted_.push_back(std::move(task));
    }
    if (wake_write_ >= 0) {
        const char byte = 1;
        // A full pipe already guarantees a pending wakeup
        static_cast<void>(write(wake_write_, &byte, 1));
    }
}

EventLoop::TimerId EventLoop::schedule_after(const Clock::duration delay, Task task) {
    const TimerId id = next_timer_id_++;
    Timer timer;
    timer.deadline = Clock::now() + delay;
    timer.task = std::move(task);
    timers_.emplace(id, std::move(timer));
    return id;
}

EventLoop::TimerId EventLoop::schedule_every(const Clock::duration interval, Task task) {
    const TimerId id = next_timer_id_++;
    Timer timer;
    timer.deadline = Clock::now() + interval;
    timer.interval = interval;
    timer.periodic = true;
    timer.task = std::move(task);
    timers_.emplace(id, std::move(timer));
    return id;
}

bool EventLoop::cancel(const TimerId id) {
    return timers_.erase(id) > 0;
}

bool EventLoop::has_timer(const TimerId id) const {
    return timers_.find(id) != timers_.end();
}

std::size_t EventLoop::timer_count() const {
    return timers_.size();
}

void EventLoop::watch(const int fd, const short events, FdCallback callback) {
    watchers_[fd] = Watcher{events, std::move(callback)};
}

void EventLoop::set_events(const int fd, const short events) {
    auto it = watchers_.find(fd);
    if (it != watchers_.end()) {
        it->second.events = events;
    }
}

void EventLoop::unwatch(const int fd) {
    watchers_.erase(fd);
}

int EventLoop::next_timeout_ms(const std::chrono::milliseconds max_wait) const {
    auto wait = max_wait;
    const auto now = Clock::now();
    for (const auto& entry : timers_) {
        const auto until = std::chrono::duration_cast<std::chrono::milliseconds>(
            entry.second.deadline - now);
        if (until < wait) {
            wait = until;
        }
    }
    if (wait.count() < 0) {
        return 0;
    }
    return static_cast<int>(wait.count());
}

void EventLoop::run_once(const std::chrono::milliseconds max_wait) {
    std::vector<pollfd> fds;
    fds.reserve(watchers_.size() + 1);
    if (wake_read_ >= 0) {
        fds.push_back({wake_read_, POLLIN, 0});
    }
    for (const auto& [fd, watcher] : watchers_) {
        fds.push_back({fd, watcher.events, 0});
    }

    int timeout_ms = next_timeout_ms(max_wait);
    {
        std::lock_guard<std::mutex> lock(posted_mutex_);
        if (!posted_.empty()) {
            timeout_ms = 0;
        }
    }

    const int ready = ::poll(fds.data(), static_cast<nfds_t>(fds.size()), timeout_ms);
    if (ready < 0 && errno != EINTR) {
        LOG_ERROR(std::string("EventLoop: poll() failed: ") + std::strerror(errno));
    }

    if (ready > 0) {
        for (const auto& entry : fds) {
            if (entry.revents == 0) {
                continue;
            }
            if (entry.fd == wake_read_) {
                drain_wakeups();
                continue;
            }
            // A previous callback may have removed this watcher
            auto it = watchers_.find(entry.fd);
            if (it == watchers_.end()) {
                continue;
            }
            FdCallback callback = it->second.callback;
            callback(entry.revents);
        }
    }

    run_expired_timers();
    run_posted();
}

void EventLoop::run() {
    while (!stop_requested_.load()) {
        run_once(std::chrono::milliseconds(1000));
    }
}

void EventLoop::stop() {
    stop_requested_.store(true);
    if (wake_write_ >= 0) {
        const char byte = 1;
        static_cast<void>(write(wake_write_, &byte, 1));
    }
}

bool EventLoop::stopped() const {
    return stop_requested_.load();
}

bool EventLoop::run_until(const std::function<bool()>& done, const Clock::duration timeout) {
    const auto deadline = Clock::now() + timeout;
    while (!done()) {
        const auto now = Clock::now();
        if (now >= deadline) {
            return done();
        }
        const auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        run_once(std::min(remaining, std::chrono::milliseconds(20)));
    }
    return true;
}

void EventLoop::drain_wakeups() {
    char buffer[256];
    while (read(wake_read_, buffer, sizeof(buffer)) > 0) {
    }
}

void EventLoop::run_expired_timers() {
    const auto now = Clock::now();
    std::vector<std::pair<Clock::time_point, TimerId>> due;
    for (const auto& [id, timer] : timers_) {
        if (timer.deadline <= now) {
            due.emplace_back(timer.deadline, id);
        }
    }
    std::sort(due.begin(), due.end());

    for (const auto& entry : due) {
        auto it = timers_.find(entry.second);
        if (it == timers_.end()) {
            continue;  // cancelled by an earlier timer in this batch
        }
        Task task;
        if (it->second.periodic) {
            it->second.deadline = now + it->second.interval;
            task = it->second.task;
        } else {
            task = std::move(it->second.task);
            timers_.erase(it);
        }
        task();
    }
}

void EventLoop::run_posted() {
    std::vector<Task> tasks;
    {
        std::lock_guard<std::mutex> lock(posted_mutex_);
        tasks.swap(posted_);
    }
    for (auto& task : tasks) {
        task();
    }
}

}  // namespace toolbridge::runtime
