#include "rediskit/actor/scheduler.hpp"

#include <exception>
#include <string>

#include "rediskit/util/logger.hpp"

namespace rediskit::actor {

Scheduler::Scheduler() : thread_(&Scheduler::run, this) {}

Scheduler::~Scheduler() {
    shutdown();
}

Scheduler::TaskId Scheduler::schedule_once(util::Duration delay, std::function<void()> task) {
    return add(std::chrono::steady_clock::now() + delay, util::Duration(0), std::move(task));
}

Scheduler::TaskId Scheduler::schedule_repeatedly(util::Duration initial_delay,
                                                 util::Duration interval,
                                                 std::function<void()> task) {
    if (interval.count() <= 0) {
        interval = util::Duration(1);
    }
    return add(std::chrono::steady_clock::now() + initial_delay, interval, std::move(task));
}

Scheduler::TaskId Scheduler::add(util::TimePoint due, util::Duration interval,
                                 std::function<void()> fn) {
    std::lock_guard lock(mutex_);
    if (stopping_) {
        return 0;
    }
    TaskId id = next_id_++;
    tasks_.emplace(id, Task{std::move(fn), interval, due});
    queue_.emplace(due, id);
    cv_.notify_one();
    return id;
}

void Scheduler::cancel(TaskId id) {
    std::lock_guard lock(mutex_);
    // the queue entry stays behind and is skipped when it comes due
    tasks_.erase(id);
}

void Scheduler::shutdown() {
    {
        std::lock_guard lock(mutex_);
        if (stopping_) {
            return;
        }
        stopping_ = true;
        tasks_.clear();
        queue_.clear();
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void Scheduler::run() {
    std::unique_lock lock(mutex_);
    while (!stopping_) {
        if (queue_.empty()) {
            cv_.wait(lock);
            continue;
        }

        auto it = queue_.begin();
        if (it->first > std::chrono::steady_clock::now()) {
            cv_.wait_until(lock, it->first);
            continue;
        }

        TaskId id = it->second;
        queue_.erase(it);
        auto task_it = tasks_.find(id);
        if (task_it == tasks_.end()) {
            continue;  // cancelled
        }

        std::function<void()> fn = task_it->second.fn;
        if (task_it->second.interval.count() > 0) {
            task_it->second.due += task_it->second.interval;
            queue_.emplace(task_it->second.due, id);
        } else {
            tasks_.erase(task_it);
        }

        lock.unlock();
        try {
            fn();
        } catch (const std::exception& e) {
            LOG_ERROR("scheduled task failed: " + std::string(e.what()));
        }
        lock.lock();
    }
}

}  // namespace rediskit::actor
