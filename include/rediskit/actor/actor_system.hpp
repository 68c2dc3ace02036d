#ifndef REDISKIT_ACTOR_ACTOR_SYSTEM_HPP
#define REDISKIT_ACTOR_ACTOR_SYSTEM_HPP

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

#include "rediskit/actor/scheduler.hpp"

namespace rediskit::actor {

/*
    worker pool shared by every actor plus one scheduler.
    clients created on a system must be closed before the system is destroyed: work dispatched
    after shutdown is dropped.
*/
class ActorSystem {
   public:
    explicit ActorSystem(std::size_t threads = 0);  // 0 = hardware concurrency, at least 2
    ~ActorSystem();

    ActorSystem(const ActorSystem&) = delete;
    ActorSystem& operator=(const ActorSystem&) = delete;

    void dispatch(std::function<void()> task);

    [[nodiscard]] Scheduler& scheduler() noexcept { return scheduler_; }
    [[nodiscard]] std::size_t threads() const noexcept { return workers_.size(); }

    void shutdown();

   private:
    void worker_loop();

    Scheduler scheduler_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::function<void()>> tasks_;
    bool stopping_ = false;
    std::vector<std::thread> workers_;
};

}  // namespace rediskit::actor

#endif
