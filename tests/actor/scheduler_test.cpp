#include "rediskit/actor/scheduler.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>
#include <vector>

#include "rediskit/actor/actor.hpp"
#include "rediskit/actor/actor_system.hpp"
#include "rediskit/actor/completion.hpp"

namespace rediskit::actor::test {

using namespace std::chrono_literals;

namespace {

class RecordingActor : public Actor {
   public:
    explicit RecordingActor(ActorSystem& system) : Actor(system, "recording") {}

    void post(int value) {
        auto self = this->self<RecordingActor>();
        tell([self, value] {
            // would interleave if two messages ever ran concurrently
            int before = self->in_flight_.fetch_add(1);
            if (before != 0) {
                self->overlapped_ = true;
            }
            self->seen_.push_back(value);
            self->in_flight_.fetch_sub(1);
        });
    }

    void post_failing() {
        tell([] { throw std::runtime_error("handler failure"); });
    }

    std::future<std::vector<int>> snapshot() {
        auto promise = std::make_shared<std::promise<std::vector<int>>>();
        auto self = this->self<RecordingActor>();
        tell([self, promise] { promise->set_value(self->seen_); });
        return promise->get_future();
    }

    bool overlapped() const { return overlapped_.load(); }

   private:
    std::vector<int> seen_;
    std::atomic<int> in_flight_{0};
    std::atomic<bool> overlapped_{false};
};

}  // namespace

TEST(SchedulerTest, ScheduleOnce) {
    Scheduler scheduler;
    std::promise<void> fired;
    auto start = std::chrono::steady_clock::now();
    scheduler.schedule_once(util::Duration(20), [&fired] { fired.set_value(); });

    auto future = fired.get_future();
    ASSERT_EQ(future.wait_for(2s), std::future_status::ready);
    EXPECT_GE(std::chrono::steady_clock::now() - start, 20ms);
}

TEST(SchedulerTest, CancelledTaskDoesNotRun) {
    Scheduler scheduler;
    std::atomic<bool> ran{false};
    auto id = scheduler.schedule_once(util::Duration(50), [&ran] { ran = true; });
    scheduler.cancel(id);

    std::this_thread::sleep_for(150ms);
    EXPECT_FALSE(ran.load());
}

TEST(SchedulerTest, ScheduleRepeatedly) {
    Scheduler scheduler;
    std::atomic<int> runs{0};
    auto id = scheduler.schedule_repeatedly(util::Duration(0), util::Duration(10),
                                            [&runs] { ++runs; });

    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (runs.load() < 3 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    scheduler.cancel(id);
    EXPECT_GE(runs.load(), 3);
}

TEST(SchedulerTest, RejectsTasksAfterShutdown) {
    Scheduler scheduler;
    scheduler.shutdown();
    EXPECT_EQ(scheduler.schedule_once(util::Duration(1), [] {}), 0u);
}

TEST(SchedulerTest, TaskFailureDoesNotStopTimerThread) {
    Scheduler scheduler;
    scheduler.schedule_once(util::Duration(0), [] { throw std::runtime_error("boom"); });
    std::promise<void> fired;
    scheduler.schedule_once(util::Duration(10), [&fired] { fired.set_value(); });
    EXPECT_EQ(fired.get_future().wait_for(2s), std::future_status::ready);
}

TEST(ActorTest, MessagesRunInOrderOneAtATime) {
    ActorSystem system(4);
    auto actor = std::make_shared<RecordingActor>(system);
    for (int i = 0; i < 500; ++i) {
        actor->post(i);
    }

    auto future = actor->snapshot();
    ASSERT_EQ(future.wait_for(5s), std::future_status::ready);
    auto seen = future.get();
    ASSERT_EQ(seen.size(), 500u);
    for (int i = 0; i < 500; ++i) {
        EXPECT_EQ(seen[static_cast<std::size_t>(i)], i);
    }
    EXPECT_FALSE(actor->overlapped());
}

TEST(ActorTest, FailingHandlerDoesNotBreakMailbox) {
    ActorSystem system(2);
    auto actor = std::make_shared<RecordingActor>(system);
    actor->post(1);
    actor->post_failing();
    actor->post(2);

    auto future = actor->snapshot();
    ASSERT_EQ(future.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(future.get(), (std::vector<int>{1, 2}));
}

TEST(CompletionTest, TimeoutFailsCaller) {
    Scheduler scheduler;
    auto completion = std::make_shared<Completion<int>>();
    auto future = completion->future();
    std::atomic<bool> timed_out{false};
    Completion<int>::arm(completion, scheduler, util::Duration(20), "GET",
                         [&timed_out] { timed_out = true; });

    ASSERT_EQ(future.wait_for(2s), std::future_status::ready);
    EXPECT_THROW(future.get(), core::TimeoutException);
    EXPECT_TRUE(timed_out.load());
    EXPECT_FALSE(completion->succeed(1));
}

TEST(CompletionTest, FirstCompletionWins) {
    Scheduler scheduler;
    auto completion = std::make_shared<Completion<int>>();
    auto future = completion->future();
    Completion<int>::arm(completion, scheduler, util::Duration(50), "GET");

    EXPECT_TRUE(completion->succeed(7));
    EXPECT_FALSE(completion->fail(std::make_exception_ptr(core::OperationAbortedException())));
    EXPECT_EQ(future.get(), 7);

    // the timer was cancelled: nothing fires later
    std::this_thread::sleep_for(100ms);
    EXPECT_TRUE(completion->done());
}

}  // namespace rediskit::actor::test
