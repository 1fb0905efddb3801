#include "runtime/async_runner.hpp"

#include <string>
#include "core/logging/logger.hpp"

namespace toolbridge::runtime {

AsyncRunner::AsyncRunner(EventLoop& loop) : loop_(loop) {}

AsyncRunner::~AsyncRunner() {
    join_all();
}

void AsyncRunner::detach(std::function<void()> work) {
    launch([work = std::move(work)]() {
        try {
            work();
        } catch (const std::exception& e) {
            LOG_WARN(std::string("AsyncRunner: background task failed: ") + e.what());
        }
    });
}

void AsyncRunner::launch(std::function<void()> body) {
    std::lock_guard<std::mutex> lock(mutex_);
    launch_locked(std::move(body));
}

void AsyncRunner::launch_locked(std::function<void()> body) {
    reap_finished_locked();
    auto finished = std::make_shared<std::atomic_bool>(false);
    Worker worker;
    worker.finished = finished;
    worker.thread = std::thread([body = std::move(body), finished]() {
        body();
        finished->store(true);
    });
    workers_.push_back(std::move(worker));
}

void AsyncRunner::enqueue(const std::string& key, std::function<void()> body) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (joining_) {
        return;
    }
    Lane& lane = lanes_[key];
    if (lane.running >= lane_limit_) {
        lane.waiting.push_back(std::move(body));
        LOG_DEBUG("AsyncRunner: lane " + key + " is full, " +
                  std::to_string(lane.waiting.size()) + " task(s) waiting");
        return;
    }
    start_lane_task_locked(key, std::move(body));
}

void AsyncRunner::start_lane_task_locked(const std::string& key, std::function<void()> body) {
    lanes_[key].running += 1;
    launch_locked([this, key, body = std::move(body)]() {
        body();
        finish_lane_task(key);
    });
}

void AsyncRunner::finish_lane_task(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = lanes_.find(key);
    if (it == lanes_.end()) {
        return;
    }
    Lane& lane = it->second;
    lane.running -= 1;
    if (!joining_ && !lane.waiting.empty()) {
        auto next = std::move(lane.waiting.front());
        lane.waiting.pop_front();
        start_lane_task_locked(key, std::move(next));
        return;
    }
    if (lane.running == 0 && lane.waiting.empty()) {
        lanes_.erase(it);
    }
}

void AsyncRunner::set_lane_limit(const std::size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    lane_limit_ = limit == 0 ? 1 : limit;
}

std::size_t AsyncRunner::lane_limit() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lane_limit_;
}

std::size_t AsyncRunner::queued(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = lanes_.find(key);
    return it == lanes_.end() ? 0 : it->second.waiting.size();
}

void AsyncRunner::reap_finished_locked() {
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (it->finished->load()) {
            if (it->thread.joinable()) {
                it->thread.join();
            }
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

std::size_t AsyncRunner::in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t count = 0;
    for (const auto& worker : workers_) {
        if (!worker.finished->load()) {
            ++count;
        }
    }
    return count;
}

void AsyncRunner::join_all() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        joining_ = true;
        for (auto& entry : lanes_) {
            entry.second.waiting.clear();
        }
    }
    // Finishing lane tasks may still launch detached work, so drain until empty
    while (true) {
        std::list<Worker> workers;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            workers.swap(workers_);
        }
        if (workers.empty()) {
            break;
        }
        LOG_DEBUG("AsyncRunner: joining " + std::to_string(workers.size()) + " worker(s)");
        for (auto& worker : workers) {
            if (worker.thread.joinable()) {
                worker.thread.join();
            }
        }
    }
    std::lock_guard<std::mutex> lock(mutex_);
    joining_ = false;
}

}  // namespace toolbridge::runtime
