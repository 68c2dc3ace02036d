#ifndef REDISKIT_ACTOR_COMPLETION_HPP
#define REDISKIT_ACTOR_COMPLETION_HPP

#include <atomic>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <string>

#include "rediskit/actor/scheduler.hpp"
#include "rediskit/core/errors.hpp"
#include "rediskit/core/op_result.hpp"

namespace rediskit::actor {

/*
    caller side of one request: a promise completed exactly once, by the reply or by the timeout,
    whichever comes first. the loser is ignored.
*/
template <typename T>
class Completion {
   public:
    Completion() : future_(promise_.get_future()) {}

    std::future<T> future() { return std::move(future_); }

    bool succeed(T value) {
        if (done_.exchange(true)) {
            return false;
        }
        disarm();
        promise_.set_value(std::move(value));
        return true;
    }

    bool fail(std::exception_ptr error) {
        if (done_.exchange(true)) {
            return false;
        }
        disarm();
        promise_.set_exception(std::move(error));
        return true;
    }

    bool complete(core::OpResult<T> result) {
        if (!result.is_success()) {
            return fail(result.cause());
        }
        return succeed(std::move(result).get());
    }

    [[nodiscard]] bool done() const noexcept { return done_.load(); }

    // non-positive timeout means wait forever. on_timeout runs after the caller was failed
    static void arm(const std::shared_ptr<Completion>& completion, Scheduler& scheduler,
                    util::Duration timeout, std::string what, std::function<void()> on_timeout = {}) {
        if (timeout.count() <= 0 || completion->done()) {
            return;
        }
        completion->scheduler_.store(&scheduler);
        std::weak_ptr<Completion> weak = completion;
        auto id = scheduler.schedule_once(timeout, [weak, what, timeout, on_timeout] {
            auto self = weak.lock();
            if (!self) {
                return;
            }
            if (self->fail(std::make_exception_ptr(core::TimeoutException(
                    what + " timed out after " + util::format_duration(timeout))))) {
                if (on_timeout) {
                    on_timeout();
                }
            }
        });
        completion->timer_.store(id);
        // completed while arming: nothing will cancel the timer any more
        if (completion->done()) {
            completion->disarm();
        }
    }

   private:
    void disarm() {
        auto id = timer_.exchange(0);
        auto* scheduler = scheduler_.load();
        if (id != 0 && scheduler != nullptr) {
            scheduler->cancel(id);
        }
    }

    std::promise<T> promise_;
    std::future<T> future_;
    std::atomic<bool> done_{false};
    std::atomic<Scheduler*> scheduler_{nullptr};
    std::atomic<Scheduler::TaskId> timer_{0};
};

}  // namespace rediskit::actor

#endif
