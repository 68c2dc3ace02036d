#ifndef REDISKIT_ACTOR_CONNECTION_ACTOR_HPP
#define REDISKIT_ACTOR_CONNECTION_ACTOR_HPP

#include <atomic>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>

#include "rediskit/actor/actor.hpp"
#include "rediskit/core/config.hpp"
#include "rediskit/core/node_address.hpp"
#include "rediskit/core/raw_command.hpp"
#include "rediskit/net/socket.hpp"
#include "rediskit/protocol/resp.hpp"

namespace rediskit::actor {

// identifies the logical caller holding a reservation. 0 means no reservation
using ReservationId = uint64_t;

struct BatchOutcome {
    std::exception_ptr failure;
    protocol::Replies replies;  // one per command, in send order

    [[nodiscard]] bool ok() const noexcept { return !failure; }

    static BatchOutcome success(protocol::Replies replies) { return {nullptr, std::move(replies)}; }
    static BatchOutcome failed(std::exception_ptr error) { return {std::move(error), {}}; }
};

using BatchCallback = std::function<void(BatchOutcome)>;

enum class ConnectionState : uint8_t {
    Disconnected = 0,
    Connecting = 1,
    Connected = 2,
    Closing = 3,
    Closed = 4,
};

const char* state_name(ConnectionState state);

/*
    owns one physical connection to one redis node and executes batches over it.

    - batches are written in the order they were accepted, each in one contiguous write, and replies
      are matched to callers in that same order.
    - a reservation gives one caller exclusive use of the connection across several asynchronous
      steps: reserving() writes its batch and blocks everybody else's batches (queued, FIFO) until
      release() from the same owner.
    - on connection loss the reconnection strategy decides when to reconnect, the retry strategy
      whether unanswered batches are written again. batches of a reservation are never resent.
    - every callback is invoked exactly once, from the actor's own thread.

    a dedicated reader thread blocks on the socket and posts decoded replies back to the mailbox.
*/
class ConnectionActor : public Actor {
   public:
    static std::shared_ptr<ConnectionActor> create(ActorSystem& system, core::NodeAddress address,
                                                   core::ConnectionConfig config,
                                                   bool reconnectable = true);
    ~ConnectionActor() override;

    // on_ready is signaled after the first successful connection, or with the error once connecting
    // is given up. must_initially_connect makes a failure of the very first attempt fatal,
    // otherwise it goes through the reconnection strategy. batches queue until connected
    void open(bool must_initially_connect, std::function<void(std::exception_ptr)> on_ready = {});

    void execute(core::RawCommandPacks packs, BatchCallback callback, ReservationId owner = 0);
    void reserving(core::RawCommandPacks packs, ReservationId owner, BatchCallback callback);
    // releasing a reservation that was not granted yet cancels its queued batches
    void release(ReservationId owner);

    // on_terminated runs once the actor is closed, immediately if it already is
    uint64_t watch(std::function<void()> on_terminated);
    void unwatch(uint64_t watch_id);

    // closes permanently. pending and later callers fail with ClientStoppedException
    void stop();

    [[nodiscard]] const core::NodeAddress& address() const noexcept { return address_; }
    [[nodiscard]] ConnectionState state() const noexcept { return state_.load(); }
    [[nodiscard]] ReservationId reserved_by() const noexcept { return reserved_view_.load(); }

    static ReservationId new_reservation_id();

   private:
    ConnectionActor(ActorSystem& system, core::NodeAddress address, core::ConnectionConfig config,
                    bool reconnectable);

    struct Request {
        core::RawCommandPacks packs;
        BatchCallback callback;
        ReservationId owner = 0;
        bool reserving = false;
        bool internal = false;  // init commands
        int attempts = 0;
        std::size_t expected = 0;
        protocol::Replies replies;
    };

    void handle_open(bool must_initially_connect, std::function<void(std::exception_ptr)> on_ready);
    void handle_request(Request request);
    void handle_release(ReservationId owner);
    void handle_watch(uint64_t id, std::function<void()> on_terminated);
    void handle_connected(uint64_t generation, std::shared_ptr<net::Socket> socket);
    void handle_connect_failed(uint64_t generation, std::exception_ptr error);
    void handle_replies(uint64_t generation, protocol::Replies replies);
    void handle_connection_lost(uint64_t generation, std::exception_ptr error);
    void handle_reconnect();
    void handle_stop();

    void connect();
    void on_init_replies(const protocol::Replies& replies);
    void on_connected();
    void on_connect_failure(std::exception_ptr error,
                            util::Duration at_least = util::Duration(0));
    void schedule_reconnect(util::Duration delay);
    void give_up(std::exception_ptr error);
    void terminate(std::exception_ptr error);

    [[nodiscard]] bool can_write(const Request& request) const;
    void write(Request request);
    void drain_queue();
    void complete(Request& request, BatchOutcome outcome);
    void fail_all(std::deque<Request>& requests, std::exception_ptr error);
    void fail_owned(std::deque<Request>& requests, ReservationId owner, std::exception_ptr error);
    void signal_ready(std::exception_ptr error);
    void set_state(ConnectionState state);
    void set_reserved(ReservationId owner);
    void close_transport();

    // socket of one connection attempt, shared with its reader thread
    struct Transport {
        std::mutex mutex;
        std::shared_ptr<net::Socket> socket;
        bool closed = false;

        bool attach(std::shared_ptr<net::Socket> connected);
        void close();
    };

    static void read_loop(std::weak_ptr<ConnectionActor> weak, std::shared_ptr<Transport> transport,
                          uint64_t generation, core::NodeAddress address, util::Duration timeout,
                          std::shared_ptr<core::DebugListener> listener);

    const core::NodeAddress address_;
    const core::ConnectionConfig config_;
    const bool reconnectable_;

    std::atomic<ConnectionState> state_{ConnectionState::Disconnected};
    std::atomic<ReservationId> reserved_view_{0};

    bool opened_ = false;
    bool must_initially_connect_ = false;
    bool ever_connected_ = false;
    bool initializing_ = false;  // init commands written, replies pending
    std::function<void(std::exception_ptr)> on_ready_;

    std::shared_ptr<Transport> transport_;
    std::shared_ptr<net::Socket> socket_;
    std::thread reader_;
    uint64_t generation_ = 0;  // bumped per physical connection, stale reader events are ignored
    int reconnect_attempt_ = 0;
    Scheduler::TaskId reconnect_timer_ = 0;

    ReservationId reserved_by_ = 0;
    std::deque<Request> queue_;  // accepted, not written yet
    std::deque<Request> sent_;   // written, waiting for replies

    std::atomic<uint64_t> next_watch_id_{1};
    std::unordered_map<uint64_t, std::function<void()>> watchers_;
    std::exception_ptr closed_error_;
};

}  // namespace rediskit::actor

#endif
