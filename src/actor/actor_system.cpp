#include "rediskit/actor/actor_system.hpp"

#include <algorithm>
#include <exception>
#include <string>

#include "rediskit/util/logger.hpp"

namespace rediskit::actor {

ActorSystem::ActorSystem(std::size_t threads) {
    if (threads == 0) {
        threads = std::max<std::size_t>(2, std::thread::hardware_concurrency());
    }
    workers_.reserve(threads);
    for (std::size_t i = 0; i < threads; ++i) {
        workers_.emplace_back(&ActorSystem::worker_loop, this);
    }
}

ActorSystem::~ActorSystem() {
    shutdown();
}

void ActorSystem::dispatch(std::function<void()> task) {
    {
        std::lock_guard lock(mutex_);
        if (stopping_) {
            LOG_WARN("actor system is shut down, dropping task");
            return;
        }
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
}

void ActorSystem::shutdown() {
    scheduler_.shutdown();
    {
        std::lock_guard lock(mutex_);
        if (stopping_) {
            return;
        }
        stopping_ = true;
    }
    cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void ActorSystem::worker_loop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
            // remaining tasks are still run so mailboxes finish what they accepted
            if (tasks_.empty()) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }
        try {
            task();
        } catch (const std::exception& e) {
            LOG_ERROR("dispatched task failed: " + std::string(e.what()));
        }
    }
}

}  // namespace rediskit::actor
