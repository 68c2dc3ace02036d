#ifndef REDISKIT_ACTOR_SCHEDULER_HPP
#define REDISKIT_ACTOR_SCHEDULER_HPP

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>

#include "rediskit/util/types.hpp"

namespace rediskit::actor {

/*
    single timer thread. tasks must be short: they normally only post a message to an actor.
    a cancelled task that is already running completes normally.
*/
class Scheduler {
   public:
    using TaskId = uint64_t;

    Scheduler();
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    TaskId schedule_once(util::Duration delay, std::function<void()> task);
    TaskId schedule_repeatedly(util::Duration initial_delay, util::Duration interval,
                               std::function<void()> task);
    void cancel(TaskId id);

    void shutdown();

   private:
    struct Task {
        std::function<void()> fn;
        util::Duration interval{0};  // zero for one-shot tasks
        util::TimePoint due;
    };

    TaskId add(util::TimePoint due, util::Duration interval, std::function<void()> fn);
    void run();

    std::mutex mutex_;
    std::condition_variable cv_;
    std::multimap<util::TimePoint, TaskId> queue_;
    std::unordered_map<TaskId, Task> tasks_;
    TaskId next_id_ = 1;
    bool stopping_ = false;
    std::thread thread_;
};

}  // namespace rediskit::actor

#endif
