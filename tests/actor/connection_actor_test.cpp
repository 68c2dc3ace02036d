#include "rediskit/actor/connection_actor.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>

#include "fake_redis_server.hpp"
#include "rediskit/core/commands.hpp"
#include "rediskit/core/errors.hpp"

namespace rediskit::actor::test {

using namespace std::chrono_literals;
using protocol::RespValue;
using rediskit::test::FakeRedisServer;

namespace {

class RecordingListener : public core::DebugListener {
   public:
    void on_send(std::string_view data) override {
        std::lock_guard lock(mutex_);
        sent_.append(data);
    }

    void on_receive(std::string_view data) override {
        std::lock_guard lock(mutex_);
        received_.append(data);
    }

    std::string sent() {
        std::lock_guard lock(mutex_);
        return sent_;
    }

    std::string received() {
        std::lock_guard lock(mutex_);
        return received_;
    }

   private:
    std::mutex mutex_;
    std::string sent_;
    std::string received_;
};

}  // namespace

class ConnectionActorTest : public ::testing::Test {
   protected:
    void SetUp() override {
        server_.start();
    }

    void TearDown() override {
        for (auto& connection : connections_) {
            connection->stop();
        }
        connections_.clear();
        system_.shutdown();
        server_.stop();
    }

    std::shared_ptr<ConnectionActor> open(core::ConnectionConfig config = {},
                                          bool reconnectable = true) {
        auto connection = ConnectionActor::create(system_, server_.address(), std::move(config),
                                                  reconnectable);
        connection->open(true);
        connections_.push_back(connection);
        return connection;
    }

    static std::future<BatchOutcome> submit(const std::shared_ptr<ConnectionActor>& connection,
                                            const core::RawCommandPacks& packs,
                                            ReservationId owner = 0, bool reserving = false) {
        auto promise = std::make_shared<std::promise<BatchOutcome>>();
        auto future = promise->get_future();
        auto callback = [promise](BatchOutcome outcome) { promise->set_value(std::move(outcome)); };
        if (reserving) {
            connection->reserving(packs, owner, callback);
        } else {
            connection->execute(packs, callback, owner);
        }
        return future;
    }

    static BatchOutcome await(std::future<BatchOutcome>& future) {
        if (future.wait_for(5s) != std::future_status::ready) {
            ADD_FAILURE() << "batch did not complete";
            return BatchOutcome::failed(
                std::make_exception_ptr(core::TimeoutException("test wait timed out")));
        }
        return future.get();
    }

    template <typename Predicate>
    static bool wait_until(Predicate predicate, std::chrono::milliseconds timeout = 5000ms) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (!predicate()) {
            if (std::chrono::steady_clock::now() > deadline) {
                return false;
            }
            std::this_thread::sleep_for(5ms);
        }
        return true;
    }

    FakeRedisServer server_;
    ActorSystem system_{4};
    std::vector<std::shared_ptr<ConnectionActor>> connections_;
};

TEST_F(ConnectionActorTest, ExecutesBatch) {
    auto connection = open();
    auto batch = core::sequence(core::commands::set("k", "v"), core::commands::get("k"));

    auto future = submit(connection, batch.packs());
    auto outcome = await(future);
    ASSERT_TRUE(outcome.ok());
    auto [stored, value] = batch.decode_replies(outcome.replies);
    EXPECT_TRUE(stored);
    EXPECT_EQ(value.value_or(""), "v");
    EXPECT_EQ(connection->state(), ConnectionState::Connected);
}

TEST_F(ConnectionActorTest, RepliesMatchRequestOrder) {
    auto connection = open();
    std::vector<std::future<BatchOutcome>> futures;
    for (int i = 0; i < 100; ++i) {
        futures.push_back(submit(connection, core::commands::incr("counter").packs()));
    }

    for (int i = 0; i < 100; ++i) {
        auto outcome = await(futures[static_cast<std::size_t>(i)]);
        ASSERT_TRUE(outcome.ok());
        EXPECT_EQ(outcome.replies.at(0), RespValue::number(i + 1));
    }
}

TEST_F(ConnectionActorTest, InitCommandsRunBeforeQueuedBatches) {
    core::ConnectionConfig config;
    config.init_commands = core::commands::client_setname("worker-1").packs();
    auto connection = open(config);

    auto future = submit(connection, core::commands::raw({"CLIENT", "GETNAME"}).packs());
    auto outcome = await(future);
    ASSERT_TRUE(outcome.ok());
    EXPECT_EQ(outcome.replies.at(0), RespValue::bulk("worker-1"));

    auto log = server_.command_log();
    ASSERT_GE(log.size(), 2u);
    EXPECT_EQ(log[0].args, (std::vector<std::string>{"CLIENT", "SETNAME", "worker-1"}));
}

TEST_F(ConnectionActorTest, FailedInitCommandFailsOpen) {
    server_.fail_on("CLIENT", "ERR not allowed");
    core::ConnectionConfig config;
    config.init_commands = core::commands::client_setname("worker-1").packs();
    auto connection = ConnectionActor::create(system_, server_.address(), config);
    connections_.push_back(connection);

    std::promise<std::exception_ptr> ready;
    connection->open(true, [&ready](std::exception_ptr error) { ready.set_value(error); });
    auto future = ready.get_future();
    ASSERT_EQ(future.wait_for(5s), std::future_status::ready);
    auto error = future.get();
    ASSERT_TRUE(error);
    EXPECT_THROW(std::rethrow_exception(error), core::ConnectionException);
    EXPECT_TRUE(wait_until([&] { return connection->state() == ConnectionState::Closed; }));
}

TEST_F(ConnectionActorTest, MustInitiallyConnectFailsWhenUnreachable) {
    FakeRedisServer gone;
    gone.start();
    auto address = gone.address();
    gone.stop();

    auto connection = ConnectionActor::create(system_, address, {});
    connections_.push_back(connection);
    std::promise<std::exception_ptr> ready;
    connection->open(true, [&ready](std::exception_ptr error) { ready.set_value(error); });

    auto future = ready.get_future();
    ASSERT_EQ(future.wait_for(5s), std::future_status::ready);
    EXPECT_TRUE(future.get());

    auto batch = submit(connection, core::commands::ping().packs());
    auto outcome = await(batch);
    EXPECT_FALSE(outcome.ok());
}

TEST_F(ConnectionActorTest, OpenWithoutWaitingQueuesUntilConnected) {
    auto connection = ConnectionActor::create(system_, server_.address(), {});
    connections_.push_back(connection);
    auto early = submit(connection, core::commands::ping().packs());

    std::promise<std::exception_ptr> ready;
    connection->open(false, [&ready](std::exception_ptr error) { ready.set_value(error); });
    auto future = ready.get_future();
    ASSERT_EQ(future.wait_for(5s), std::future_status::ready);
    EXPECT_FALSE(future.get());
    EXPECT_EQ(connection->state(), ConnectionState::Connected);

    auto outcome = await(early);
    ASSERT_TRUE(outcome.ok());
    EXPECT_EQ(outcome.replies.at(0), RespValue::simple("PONG"));
}

TEST_F(ConnectionActorTest, GivesUpAfterReconnectionStrategyIsExhausted) {
    FakeRedisServer gone;
    gone.start();
    auto address = gone.address();
    gone.stop();

    core::ConnectionConfig config;
    config.reconnection_strategy =
        std::make_shared<core::ExponentialBackoff>(util::Duration(10), util::Duration(10), 2);
    auto connection = ConnectionActor::create(system_, address, config);
    connections_.push_back(connection);
    auto pending = submit(connection, core::commands::ping().packs());

    std::promise<std::exception_ptr> ready;
    connection->open(false, [&ready](std::exception_ptr error) { ready.set_value(error); });
    auto future = ready.get_future();
    ASSERT_EQ(future.wait_for(5s), std::future_status::ready);
    EXPECT_TRUE(future.get());

    auto outcome = await(pending);
    EXPECT_FALSE(outcome.ok());
    // still usable: a new batch triggers a new connection attempt
    EXPECT_EQ(connection->state(), ConnectionState::Disconnected);
}

TEST_F(ConnectionActorTest, PeerClosingRightAfterAcceptBacksOff) {
    server_.close_on_accept(true);
    core::ConnectionConfig config;
    config.reconnection_strategy =
        std::make_shared<core::ExponentialBackoff>(util::Duration(200), util::Duration(1000), 2);
    auto connection = open(config);
    auto pending = submit(connection, core::commands::ping().packs());

    EXPECT_TRUE(wait_until([&] { return connection->state() == ConnectionState::Disconnected; }));
    EXPECT_FALSE(await(pending).ok());
    std::this_thread::sleep_for(300ms);
    // first connection plus two reconnects 200ms and 400ms apart
    EXPECT_EQ(server_.connections_accepted(), 3u);
    EXPECT_EQ(connection->state(), ConnectionState::Disconnected);
}

TEST_F(ConnectionActorTest, AnsweredRequestResetsReconnectBackoff) {
    server_.put("k", "v");
    server_.delay_on("GET", util::Duration(100));
    core::ConnectionConfig config;
    config.reconnection_strategy =
        std::make_shared<core::ExponentialBackoff>(util::Duration(10), util::Duration(10), 2);
    auto connection = open(config);

    // more losses than reconnects allowed, each one followed by a working connection
    for (std::size_t i = 0; i < 4; ++i) {
        auto get = submit(connection, core::commands::get("k").packs());
        ASSERT_TRUE(wait_until([&] { return server_.count("GET") == 2 * i + 1; }));
        server_.kill_connections();
        auto outcome = await(get);
        ASSERT_TRUE(outcome.ok()) << "round " << i;
        EXPECT_EQ(outcome.replies.at(0), RespValue::bulk("v"));
    }
    EXPECT_EQ(server_.count("GET"), 8u);
    EXPECT_EQ(connection->state(), ConnectionState::Connected);
}

TEST_F(ConnectionActorTest, DebugListenerSeesRawTraffic) {
    auto listener = std::make_shared<RecordingListener>();
    core::ConnectionConfig config;
    config.debug_listener = listener;
    auto connection = open(config);

    auto future = submit(connection, core::commands::echo("hi").packs());
    ASSERT_TRUE(await(future).ok());
    EXPECT_EQ(listener->sent(), "*2\r\n$4\r\nECHO\r\n$2\r\nhi\r\n");
    EXPECT_EQ(listener->received(), "$2\r\nhi\r\n");
}

TEST_F(ConnectionActorTest, ReservationHoldsOffOtherCallers) {
    auto connection = open();
    auto owner = ConnectionActor::new_reservation_id();

    auto watch = submit(connection, core::commands::watch({"k"}).packs(), owner, true);
    ASSERT_TRUE(await(watch).ok());
    EXPECT_EQ(connection->reserved_by(), owner);

    // another caller's write to the watched key must wait for the release
    auto other = submit(connection, core::commands::set("k", "other").packs());
    EXPECT_EQ(other.wait_for(100ms), std::future_status::timeout);

    auto transaction = core::commands::set("k", "mine").transaction();
    auto exec = submit(connection, transaction.packs(), owner);
    auto exec_outcome = await(exec);
    ASSERT_TRUE(exec_outcome.ok());
    EXPECT_TRUE(transaction.decode_replies(exec_outcome.replies));

    connection->release(owner);
    ASSERT_TRUE(await(other).ok());
    EXPECT_EQ(server_.value("k").value_or(""), "other");
    EXPECT_TRUE(wait_until([&] { return connection->reserved_by() == 0; }));

    auto names = server_.command_names();
    EXPECT_EQ(names, (std::vector<std::string>{"WATCH", "MULTI", "SET", "EXEC", "SET"}));
}

TEST_F(ConnectionActorTest, WatchedKeyChangedByOthersAbortsTransaction) {
    auto connection = open();
    auto owner = ConnectionActor::new_reservation_id();

    auto watch = submit(connection, core::commands::watch({"k"}).packs(), owner, true);
    ASSERT_TRUE(await(watch).ok());
    server_.put("k", "changed");

    auto transaction = core::commands::set("k", "mine").transaction();
    auto exec = submit(connection, transaction.packs(), owner);
    auto outcome = await(exec);
    ASSERT_TRUE(outcome.ok());
    EXPECT_THROW(transaction.decode_replies(outcome.replies), core::OptimisticLockException);
    connection->release(owner);
    EXPECT_EQ(server_.value("k").value_or(""), "changed");
}

TEST_F(ConnectionActorTest, ReleaseBeforeGrantCancelsQueuedBatches) {
    auto connection = open();
    auto holder = ConnectionActor::new_reservation_id();
    auto waiter = ConnectionActor::new_reservation_id();

    auto first = submit(connection, core::commands::ping().packs(), holder, true);
    ASSERT_TRUE(await(first).ok());

    auto queued = submit(connection, core::commands::ping().packs(), waiter, true);
    EXPECT_EQ(queued.wait_for(50ms), std::future_status::timeout);
    connection->release(waiter);

    auto outcome = await(queued);
    ASSERT_FALSE(outcome.ok());
    EXPECT_THROW(std::rethrow_exception(outcome.failure), core::OperationAbortedException);
    EXPECT_EQ(connection->reserved_by(), holder);
    connection->release(holder);
}

TEST_F(ConnectionActorTest, UnansweredBatchIsResent) {
    server_.put("k", "v");
    server_.drop_on("GET");
    auto connection = open();

    auto future = submit(connection, core::commands::get("k").packs());
    auto outcome = await(future);
    ASSERT_TRUE(outcome.ok());
    EXPECT_EQ(outcome.replies.at(0), RespValue::bulk("v"));
    EXPECT_EQ(server_.count("GET"), 2u);
    EXPECT_EQ(server_.connections_accepted(), 2u);
}

TEST_F(ConnectionActorTest, ResendWaitsForRetryDelay) {
    server_.put("k", "v");
    server_.drop_on("GET");
    core::ConnectionConfig config;
    config.reconnection_strategy =
        std::make_shared<core::ExponentialBackoff>(util::Duration(10), util::Duration(10));
    config.retry_strategy =
        std::make_shared<core::ExponentialBackoff>(util::Duration(300), util::Duration(300), 1);
    auto connection = open(config);
    auto ping = submit(connection, core::commands::ping().packs());
    ASSERT_TRUE(await(ping).ok());

    auto started = std::chrono::steady_clock::now();
    auto future = submit(connection, core::commands::get("k").packs());
    auto outcome = await(future);
    ASSERT_TRUE(outcome.ok());
    EXPECT_GE(std::chrono::steady_clock::now() - started, 300ms);
    EXPECT_EQ(server_.count("GET"), 2u);
}

TEST_F(ConnectionActorTest, NoRetryFailsUnansweredBatch) {
    server_.drop_on("GET");
    core::ConnectionConfig config;
    config.retry_strategy = std::make_shared<core::NoRetryStrategy>();
    auto connection = open(config);

    auto future = submit(connection, core::commands::get("k").packs());
    auto outcome = await(future);
    ASSERT_FALSE(outcome.ok());
    EXPECT_THROW(std::rethrow_exception(outcome.failure), core::ConnectionException);
    EXPECT_EQ(server_.count("GET"), 1u);

    // reconnects for the next batch
    auto next = submit(connection, core::commands::ping().packs());
    EXPECT_TRUE(await(next).ok());
}

TEST_F(ConnectionActorTest, ReservedBatchIsNeverResent) {
    server_.drop_on("WATCH");
    auto connection = open();
    auto owner = ConnectionActor::new_reservation_id();

    auto watch = submit(connection, core::commands::watch({"k"}).packs(), owner, true);
    auto outcome = await(watch);
    ASSERT_FALSE(outcome.ok());
    EXPECT_THROW(std::rethrow_exception(outcome.failure), core::ConnectionException);
    EXPECT_EQ(server_.count("WATCH"), 1u);

    // the follow-up of the lost reservation is refused, not run unreserved
    auto follow_up = submit(connection, core::commands::get("k").packs(), owner);
    EXPECT_FALSE(await(follow_up).ok());
    EXPECT_EQ(server_.count("GET"), 0u);
}

TEST_F(ConnectionActorTest, NonReconnectableConnectionTerminatesOnLoss) {
    auto connection = open({}, false);
    std::promise<void> terminated;
    connection->watch([&terminated] { terminated.set_value(); });
    auto ping = submit(connection, core::commands::ping().packs());
    ASSERT_TRUE(await(ping).ok());

    server_.kill_connections();
    auto future = terminated.get_future();
    ASSERT_EQ(future.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(connection->state(), ConnectionState::Closed);
}

TEST_F(ConnectionActorTest, StopFailsPendingAndLaterBatches) {
    server_.delay_on("GET", util::Duration(300));
    auto connection = open();
    auto ping = submit(connection, core::commands::ping().packs());
    ASSERT_TRUE(await(ping).ok());

    auto pending = submit(connection, core::commands::get("k").packs());
    std::this_thread::sleep_for(50ms);
    connection->stop();

    auto outcome = await(pending);
    ASSERT_FALSE(outcome.ok());
    EXPECT_THROW(std::rethrow_exception(outcome.failure), core::ClientStoppedException);

    auto later = submit(connection, core::commands::ping().packs());
    auto later_outcome = await(later);
    ASSERT_FALSE(later_outcome.ok());
    EXPECT_THROW(std::rethrow_exception(later_outcome.failure), core::ClientStoppedException);
    EXPECT_EQ(connection->state(), ConnectionState::Closed);
}

TEST_F(ConnectionActorTest, WatchAfterCloseFiresImmediately) {
    auto connection = open();
    connection->stop();

    std::promise<void> terminated;
    connection->watch([&terminated] { terminated.set_value(); });
    EXPECT_EQ(terminated.get_future().wait_for(5s), std::future_status::ready);
}

}  // namespace rediskit::actor::test
