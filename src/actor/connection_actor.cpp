#include "rediskit/actor/connection_actor.hpp"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

#include "rediskit/core/errors.hpp"
#include "rediskit/util/logger.hpp"

namespace rediskit::actor {

namespace {

constexpr std::size_t kReadBufferSize = 16 * 1024;

std::atomic<ReservationId> next_reservation{1};

}  // namespace

const char* state_name(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Connecting: return "connecting";
        case ConnectionState::Connected: return "connected";
        case ConnectionState::Closing: return "closing";
        case ConnectionState::Closed: return "closed";
    }
    return "unknown";
}

bool ConnectionActor::Transport::attach(std::shared_ptr<net::Socket> connected) {
    std::lock_guard lock(mutex);
    if (closed) {
        return false;
    }
    socket = std::move(connected);
    return true;
}

void ConnectionActor::Transport::close() {
    std::shared_ptr<net::Socket> current;
    {
        std::lock_guard lock(mutex);
        closed = true;
        current = socket;
    }
    if (current) {
        current->shutdown();
    }
}

std::shared_ptr<ConnectionActor> ConnectionActor::create(ActorSystem& system,
                                                         core::NodeAddress address,
                                                         core::ConnectionConfig config,
                                                         bool reconnectable) {
    return std::shared_ptr<ConnectionActor>(
        new ConnectionActor(system, std::move(address), std::move(config), reconnectable));
}

ConnectionActor::ConnectionActor(ActorSystem& system, core::NodeAddress address,
                                 core::ConnectionConfig config, bool reconnectable)
    : Actor(system, config.actor_name.value_or("connection-" + address.to_string())),
      address_(std::move(address)),
      config_(std::move(config)),
      reconnectable_(reconnectable) {}

ConnectionActor::~ConnectionActor() {
    if (reconnect_timer_ != 0) {
        system_.scheduler().cancel(reconnect_timer_);
    }
    if (transport_) {
        transport_->close();
    }
    if (reader_.joinable()) {
        // the last reference may be dropped by the reader itself
        if (reader_.get_id() == std::this_thread::get_id()) {
            reader_.detach();
        } else {
            reader_.join();
        }
    }
    if (!sent_.empty() || !queue_.empty()) {
        LOG_WARN(name() + ": destroyed with pending requests");
        auto error = std::make_exception_ptr(core::ClientStoppedException(address_));
        fail_all(sent_, error);
        fail_all(queue_, error);
    }
}

ReservationId ConnectionActor::new_reservation_id() {
    return next_reservation.fetch_add(1);
}

void ConnectionActor::open(bool must_initially_connect,
                           std::function<void(std::exception_ptr)> on_ready) {
    auto self = this->self<ConnectionActor>();
    tell([self, must_initially_connect, on_ready = std::move(on_ready)]() mutable {
        self->handle_open(must_initially_connect, std::move(on_ready));
    });
}

void ConnectionActor::execute(core::RawCommandPacks packs, BatchCallback callback,
                              ReservationId owner) {
    Request request;
    request.packs = std::move(packs);
    request.callback = std::move(callback);
    request.owner = owner;
    auto self = this->self<ConnectionActor>();
    tell([self, request = std::move(request)]() mutable {
        self->handle_request(std::move(request));
    });
}

void ConnectionActor::reserving(core::RawCommandPacks packs, ReservationId owner,
                                BatchCallback callback) {
    Request request;
    request.packs = std::move(packs);
    request.callback = std::move(callback);
    request.owner = owner;
    request.reserving = true;
    auto self = this->self<ConnectionActor>();
    tell([self, request = std::move(request)]() mutable {
        self->handle_request(std::move(request));
    });
}

void ConnectionActor::release(ReservationId owner) {
    auto self = this->self<ConnectionActor>();
    tell([self, owner] { self->handle_release(owner); });
}

uint64_t ConnectionActor::watch(std::function<void()> on_terminated) {
    uint64_t id = next_watch_id_.fetch_add(1);
    auto self = this->self<ConnectionActor>();
    tell([self, id, on_terminated = std::move(on_terminated)]() mutable {
        self->handle_watch(id, std::move(on_terminated));
    });
    return id;
}

void ConnectionActor::unwatch(uint64_t watch_id) {
    auto self = this->self<ConnectionActor>();
    tell([self, watch_id] { self->watchers_.erase(watch_id); });
}

void ConnectionActor::stop() {
    auto self = this->self<ConnectionActor>();
    tell([self] { self->handle_stop(); });
}

// message handlers

void ConnectionActor::handle_open(bool must_initially_connect,
                                  std::function<void(std::exception_ptr)> on_ready) {
    if (state_ == ConnectionState::Closed) {
        if (on_ready) {
            on_ready(closed_error_);
        }
        return;
    }
    if (opened_) {
        LOG_WARN(name() + ": already opened");
        if (on_ready) {
            on_ready(nullptr);
        }
        return;
    }
    opened_ = true;
    must_initially_connect_ = must_initially_connect;
    on_ready_ = std::move(on_ready);
    connect();
}

void ConnectionActor::handle_request(Request request) {
    if (state_ == ConnectionState::Closed || state_ == ConnectionState::Closing) {
        complete(request, BatchOutcome::failed(closed_error_));
        return;
    }
    request.expected = request.packs.reply_count();
    if (request.reserving && reserved_by_ == request.owner) {
        request.reserving = false;
    }
    // a follow-up step whose reservation was lost with the previous connection
    if (!request.reserving && request.owner != 0 && reserved_by_ != request.owner) {
        complete(request, BatchOutcome::failed(std::make_exception_ptr(
                              core::ConnectionException(address_, "reservation was lost"))));
        return;
    }

    if (can_write(request)) {
        write(std::move(request));
        return;
    }
    queue_.push_back(std::move(request));
    // connecting was given up earlier, try again on demand
    if (opened_ && state_ == ConnectionState::Disconnected && reconnect_timer_ == 0) {
        connect();
    }
}

void ConnectionActor::handle_release(ReservationId owner) {
    if (owner == 0) {
        return;
    }
    if (reserved_by_ == owner) {
        set_reserved(0);
        drain_queue();
        return;
    }
    // reservation never granted: drop what the owner still has waiting
    fail_owned(queue_, owner, std::make_exception_ptr(core::OperationAbortedException()));
}

void ConnectionActor::handle_watch(uint64_t id, std::function<void()> on_terminated) {
    if (state_ == ConnectionState::Closed) {
        on_terminated();
        return;
    }
    watchers_.emplace(id, std::move(on_terminated));
}

void ConnectionActor::handle_connected(uint64_t generation, std::shared_ptr<net::Socket> socket) {
    if (generation != generation_ || state_ != ConnectionState::Connecting) {
        return;
    }
    socket_ = std::move(socket);
    LOG_DEBUG(name() + ": connected to " + address_.to_string());

    if (config_.init_commands.empty()) {
        on_connected();
        return;
    }
    Request init;
    init.packs = config_.init_commands;
    init.internal = true;
    init.expected = init.packs.reply_count();
    initializing_ = true;
    write(std::move(init));
}

void ConnectionActor::handle_connect_failed(uint64_t generation, std::exception_ptr error) {
    if (generation != generation_ || state_ != ConnectionState::Connecting) {
        return;
    }
    close_transport();
    on_connect_failure(std::move(error));
}

void ConnectionActor::handle_replies(uint64_t generation, protocol::Replies replies) {
    if (generation != generation_) {
        return;
    }
    for (auto& reply : replies) {
        if (sent_.empty()) {
            handle_connection_lost(generation_, std::make_exception_ptr(core::ProtocolException(
                                                    "reply received with no pending request")));
            return;
        }
        auto& front = sent_.front();
        front.replies.push_back(std::move(reply));
        if (front.replies.size() < front.expected) {
            continue;
        }
        Request done = std::move(front);
        sent_.pop_front();
        if (done.internal) {
            on_init_replies(done.replies);
            if (generation != generation_) {
                return;
            }
            continue;
        }
        // an answered request proves the connection usable
        reconnect_attempt_ = 0;
        complete(done, BatchOutcome::success(std::move(done.replies)));
    }
}

void ConnectionActor::handle_connection_lost(uint64_t generation, std::exception_ptr error) {
    if (generation != generation_) {
        return;
    }
    auto state = state_.load();
    if (state != ConnectionState::Connected && state != ConnectionState::Connecting) {
        return;
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        LOG_WARN(name() + ": connection lost: " + e.what());
    }
    close_transport();

    if (state == ConnectionState::Connecting) {
        // lost while sending init commands
        initializing_ = false;
        sent_.clear();
        on_connect_failure(std::move(error));
        return;
    }

    set_state(ConnectionState::Connecting);
    ReservationId holder = reserved_by_;
    set_reserved(0);

    // resent batches go out on the next connection, which is not opened before the
    // longest retry delay has passed
    util::Duration resend_delay{0};
    std::deque<Request> retried;
    std::deque<Request> failed;
    for (auto& request : sent_) {
        if (request.internal) {
            continue;
        }
        std::optional<util::Duration> delay;
        if (request.owner == 0 && config_.retry_strategy) {
            delay = config_.retry_strategy->retry_delay(request.attempts);
        }
        if (delay) {
            resend_delay = std::max(resend_delay, *delay);
            ++request.attempts;
            request.replies.clear();
            retried.push_back(std::move(request));
        } else {
            failed.push_back(std::move(request));
        }
    }
    sent_.clear();
    if (!retried.empty()) {
        LOG_DEBUG(name() + ": resending " + std::to_string(retried.size()) + " unanswered batches");
    }
    for (auto it = retried.rbegin(); it != retried.rend(); ++it) {
        queue_.push_front(std::move(*it));
    }

    fail_all(failed, error);
    if (holder != 0) {
        fail_owned(queue_, holder, error);
    }

    if (!reconnectable_) {
        terminate(error);
        return;
    }
    on_connect_failure(std::move(error), resend_delay);
}

void ConnectionActor::handle_reconnect() {
    reconnect_timer_ = 0;
    if (state_ != ConnectionState::Connecting) {
        return;
    }
    connect();
}

void ConnectionActor::handle_stop() {
    terminate(std::make_exception_ptr(core::ClientStoppedException(address_)));
}

// connection lifecycle

void ConnectionActor::connect() {
    set_state(ConnectionState::Connecting);
    ++generation_;
    if (reader_.joinable()) {
        reader_.join();
    }
    transport_ = std::make_shared<Transport>();
    LOG_DEBUG(name() + ": connecting to " + address_.to_string());
    reader_ = std::thread(&ConnectionActor::read_loop, weak_self<ConnectionActor>(), transport_,
                          generation_, address_, config_.connect_timeout, config_.debug_listener);
}

void ConnectionActor::on_init_replies(const protocol::Replies& replies) {
    initializing_ = false;
    for (const auto& reply : replies) {
        if (reply.is_error()) {
            auto error = std::make_exception_ptr(core::ConnectionException(
                address_, "initialization command failed: " + reply.str));
            LOG_WARN(name() + ": initialization command failed: " + reply.str);
            close_transport();
            on_connect_failure(error);
            return;
        }
    }
    reconnect_attempt_ = 0;
    on_connected();
}

void ConnectionActor::on_connected() {
    set_state(ConnectionState::Connected);
    ever_connected_ = true;
    LOG_INFO(name() + ": connection to " + address_.to_string() + " ready");
    signal_ready(nullptr);
    drain_queue();
}

void ConnectionActor::on_connect_failure(std::exception_ptr error, util::Duration at_least) {
    if (!reconnectable_ || (must_initially_connect_ && !ever_connected_)) {
        terminate(std::move(error));
        return;
    }
    std::optional<util::Duration> delay;
    if (config_.reconnection_strategy) {
        delay = config_.reconnection_strategy->retry_delay(reconnect_attempt_);
    }
    ++reconnect_attempt_;
    if (!delay) {
        give_up(std::move(error));
        return;
    }
    delay = std::max(*delay, at_least);
    LOG_DEBUG(name() + ": reconnecting in " + util::format_duration(*delay));
    schedule_reconnect(*delay);
}

void ConnectionActor::schedule_reconnect(util::Duration delay) {
    std::weak_ptr<ConnectionActor> weak = weak_self<ConnectionActor>();
    reconnect_timer_ = system_.scheduler().schedule_once(delay, [weak] {
        if (auto self = weak.lock()) {
            self->tell([self] { self->handle_reconnect(); });
        }
    });
}

void ConnectionActor::give_up(std::exception_ptr error) {
    LOG_ERROR(name() + ": giving up connecting to " + address_.to_string());
    set_state(ConnectionState::Disconnected);
    reconnect_attempt_ = 0;
    fail_all(queue_, error);
    signal_ready(error);
}

void ConnectionActor::terminate(std::exception_ptr error) {
    auto state = state_.load();
    if (state == ConnectionState::Closed || state == ConnectionState::Closing) {
        return;
    }
    set_state(ConnectionState::Closing);
    if (reconnect_timer_ != 0) {
        system_.scheduler().cancel(reconnect_timer_);
        reconnect_timer_ = 0;
    }
    close_transport();
    set_reserved(0);
    initializing_ = false;
    closed_error_ = error;

    fail_all(sent_, error);
    fail_all(queue_, error);
    signal_ready(error);
    set_state(ConnectionState::Closed);
    LOG_DEBUG(name() + ": closed");

    auto watchers = std::move(watchers_);
    watchers_.clear();
    for (auto& [id, on_terminated] : watchers) {
        on_terminated();
    }
}

// request queue

bool ConnectionActor::can_write(const Request& request) const {
    if (state_ != ConnectionState::Connected || initializing_) {
        return false;
    }
    if (reserved_by_ == 0) {
        return queue_.empty();
    }
    return request.owner == reserved_by_;
}

void ConnectionActor::write(Request request) {
    if (request.reserving && reserved_by_ == 0) {
        set_reserved(request.owner);
    }
    if (request.expected == 0) {
        complete(request, BatchOutcome::success({}));
        return;
    }
    std::string data = request.packs.encode();
    if (config_.debug_listener) {
        config_.debug_listener->on_send(data);
    }
    LOG_DEBUG(name() + ": writing " + std::to_string(data.size()) + " bytes");
    sent_.push_back(std::move(request));
    try {
        socket_->send_all(data);
    } catch (const core::ConnectionException&) {
        handle_connection_lost(generation_, std::current_exception());
    }
}

void ConnectionActor::drain_queue() {
    while (state_ == ConnectionState::Connected && !initializing_ && !queue_.empty()) {
        auto it = queue_.begin();
        if (reserved_by_ != 0) {
            while (it != queue_.end() && it->owner != reserved_by_) {
                ++it;
            }
            if (it == queue_.end()) {
                return;
            }
        }
        Request next = std::move(*it);
        queue_.erase(it);
        write(std::move(next));
    }
}

void ConnectionActor::complete(Request& request, BatchOutcome outcome) {
    if (!request.callback) {
        return;
    }
    auto callback = std::move(request.callback);
    request.callback = nullptr;
    try {
        callback(std::move(outcome));
    } catch (const std::exception& e) {
        LOG_ERROR(name() + ": batch callback failed: " + e.what());
    }
}

void ConnectionActor::fail_all(std::deque<Request>& requests, std::exception_ptr error) {
    auto failing = std::move(requests);
    requests.clear();
    for (auto& request : failing) {
        complete(request, BatchOutcome::failed(error));
    }
}

void ConnectionActor::fail_owned(std::deque<Request>& requests, ReservationId owner,
                                 std::exception_ptr error) {
    std::deque<Request> failing;
    for (auto it = requests.begin(); it != requests.end();) {
        if (it->owner == owner) {
            failing.push_back(std::move(*it));
            it = requests.erase(it);
        } else {
            ++it;
        }
    }
    fail_all(failing, error);
}

void ConnectionActor::signal_ready(std::exception_ptr error) {
    if (!on_ready_) {
        return;
    }
    auto on_ready = std::move(on_ready_);
    on_ready_ = nullptr;
    on_ready(std::move(error));
}

void ConnectionActor::set_state(ConnectionState state) {
    state_.store(state);
}

void ConnectionActor::set_reserved(ReservationId owner) {
    reserved_by_ = owner;
    reserved_view_.store(owner);
}

void ConnectionActor::close_transport() {
    ++generation_;
    if (transport_) {
        transport_->close();
        transport_.reset();
    }
    socket_.reset();
}

// reader thread

void ConnectionActor::read_loop(std::weak_ptr<ConnectionActor> weak,
                                std::shared_ptr<Transport> transport, uint64_t generation,
                                core::NodeAddress address, util::Duration timeout,
                                std::shared_ptr<core::DebugListener> listener) {
    auto post = [&weak](auto handler) {
        if (auto self = weak.lock()) {
            self->tell([self, handler = std::move(handler)]() mutable { handler(*self); });
            return true;
        }
        return false;
    };

    std::shared_ptr<net::Socket> socket;
    try {
        socket = std::make_shared<net::Socket>(net::Socket::connect(address, timeout));
    } catch (const core::ConnectionException&) {
        post([generation, error = std::current_exception()](ConnectionActor& self) {
            self.handle_connect_failed(generation, error);
        });
        return;
    }
    if (!transport->attach(socket)) {
        return;
    }
    if (!post([generation, socket](ConnectionActor& self) {
            self.handle_connected(generation, socket);
        })) {
        return;
    }

    protocol::RespParser parser;
    std::vector<char> buf(kReadBufferSize);
    try {
        for (;;) {
            std::size_t n = socket->receive(buf.data(), buf.size());
            if (n == 0) {
                throw core::ConnectionException(address, "connection closed by peer");
            }
            std::string_view chunk(buf.data(), n);
            LOG_DEBUG("connection-" + address.to_string() + ": received " + std::to_string(n) +
                      " bytes");
            if (listener) {
                listener->on_receive(chunk);
            }
            parser.feed(chunk);
            protocol::Replies replies;
            while (auto reply = parser.next()) {
                replies.push_back(std::move(*reply));
            }
            if (replies.empty()) {
                continue;
            }
            if (!post([generation, replies = std::move(replies)](ConnectionActor& self) mutable {
                    self.handle_replies(generation, std::move(replies));
                })) {
                return;
            }
        }
    } catch (const core::RedisException&) {
        post([generation, error = std::current_exception()](ConnectionActor& self) {
            self.handle_connection_lost(generation, error);
        });
    }
}

}  // namespace rediskit::actor
