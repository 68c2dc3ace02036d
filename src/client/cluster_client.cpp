#include "rediskit/client/cluster_client.hpp"

#include <algorithm>
#include <mutex>
#include <optional>
#include <random>
#include <sstream>
#include <utility>

#include "rediskit/core/errors.hpp"
#include "rediskit/util/logger.hpp"

namespace rediskit::client {

ClusterState::ClusterState(actor::ClusterMonitor::Mapping mapping) : mapping_(std::move(mapping)) {
    for (const auto& [range, client] : mapping_) {
        if (std::find(masters_.begin(), masters_.end(), client) == masters_.end()) {
            masters_.push_back(client);
        }
    }
}

std::shared_ptr<NodeClient> ClusterState::client_for_slot(int slot) const {
    // last range starting at or before the slot
    auto it = std::upper_bound(mapping_.begin(), mapping_.end(), slot,
                               [](int s, const auto& entry) { return s < entry.first.start; });
    if (it == mapping_.begin()) {
        return nullptr;
    }
    --it;
    return it->first.contains(slot) ? it->second : nullptr;
}

std::shared_ptr<NodeClient> ClusterState::random_master() const {
    if (masters_.empty()) {
        return nullptr;
    }
    thread_local std::mt19937 random{std::random_device{}()};
    std::uniform_int_distribution<std::size_t> pick(0, masters_.size() - 1);
    return masters_[pick(random)];
}

namespace detail {

namespace {

struct Redirection {
    bool ask = false;
    int slot = 0;
    core::NodeAddress address;
    std::string reply;
};

// "MOVED <slot> <host:port>" or "ASK <slot> <host:port>"
std::optional<Redirection> parse_redirection(const protocol::RespValue& reply) {
    if (!reply.is_error()) {
        return std::nullopt;
    }
    std::istringstream in(reply.str);
    std::string kind;
    std::string slot;
    std::string address;
    in >> kind >> slot >> address;
    if (kind != "MOVED" && kind != "ASK") {
        return std::nullopt;
    }
    try {
        return Redirection{kind == "ASK", std::stoi(slot), core::NodeAddress::parse(address),
                           reply.str};
    } catch (const std::exception& e) {
        LOG_WARN("malformed redirection '" + reply.str + "': " + e.what());
        return std::nullopt;
    }
}

core::RawCommandPack asking_pack() {
    core::RawCommandPack pack;
    pack.commands.push_back(core::RawCommand{{"ASKING"}, core::Level::Node, {}});
    return pack;
}

// one routed batch: per pack results, filled in as node replies (and redirections) arrive
struct Routing {
    core::RawCommandPacks packs;
    actor::BatchCallback callback;

    std::mutex mutex;
    std::vector<std::optional<protocol::Replies>> results;
    std::vector<int> redirections;
    std::size_t remaining = 0;
    bool finished = false;

    Routing(core::RawCommandPacks p, actor::BatchCallback cb)
        : packs(std::move(p)),
          callback(std::move(cb)),
          results(packs.packs.size()),
          redirections(packs.packs.size(), 0),
          remaining(packs.packs.size()) {}

    void fail(std::exception_ptr error) {
        {
            std::lock_guard lock(mutex);
            if (finished) {
                return;
            }
            finished = true;
        }
        callback(actor::BatchOutcome::failed(std::move(error)));
    }

    void store(std::size_t index, protocol::Replies replies) {
        protocol::Replies all;
        {
            std::lock_guard lock(mutex);
            if (finished || results[index]) {
                return;
            }
            results[index] = std::move(replies);
            if (--remaining > 0) {
                return;
            }
            finished = true;
            for (auto& result : results) {
                for (auto& reply : *result) {
                    all.push_back(std::move(reply));
                }
            }
        }
        callback(actor::BatchOutcome::success(std::move(all)));
    }
};

}  // namespace

class ClusterRuntime : public std::enable_shared_from_this<ClusterRuntime> {
   public:
    using StateCallback =
        std::function<void(std::shared_ptr<const ClusterState>, std::exception_ptr)>;

    ClusterRuntime(actor::ActorSystem& system, core::ClusterConfig config)
        : system_(system), config_(std::move(config)), ready_future_(ready_.get_future().share()) {}

    void start(std::vector<core::NodeAddress> seeds, std::shared_ptr<util::Clock> clock) {
        std::weak_ptr<ClusterRuntime> weak = shared_from_this();
        actor::ClusterMonitor::Listener listener;
        listener.on_mapping = [weak](const actor::ClusterMonitor::Mapping& mapping) {
            if (auto self = weak.lock()) {
                self->on_mapping(mapping);
            }
        };
        listener.on_init_failure = [weak](std::exception_ptr error) {
            if (auto self = weak.lock()) {
                self->on_init_failure(std::move(error));
            }
        };
        monitor_ = actor::ClusterMonitor::create(system_, std::move(seeds), config_,
                                                 std::move(listener), std::move(clock));
        monitor_->start();
    }

    std::shared_future<void> initialized() const { return ready_future_; }

    std::shared_ptr<const ClusterState> current_state() {
        std::lock_guard lock(mutex_);
        return state_;
    }

    void close() {
        std::vector<StateCallback> waiting;
        {
            std::lock_guard lock(mutex_);
            if (closed_) {
                return;
            }
            closed_ = true;
            waiting.swap(waiting_);
        }
        monitor_->stop();
        auto error = std::make_exception_ptr(core::ClientStoppedException());
        for (auto& callback : waiting) {
            callback(nullptr, error);
        }
    }

    void execute(core::RawCommandPacks packs, actor::BatchCallback callback) {
        auto self = shared_from_this();
        auto routing = std::make_shared<Routing>(std::move(packs), std::move(callback));
        with_state([self, routing](std::shared_ptr<const ClusterState> state,
                                   std::exception_ptr error) {
            if (error) {
                routing->fail(error);
                return;
            }
            self->route(*state, routing);
        });
    }

    RedisExecutor::AbortHandle run_op(std::unique_ptr<core::OpStep> first,
                                      actor::OperationActor::Listener listener) {
        std::optional<int> slot;
        try {
            slot = step_slot(first->packs());
        } catch (const core::CrossSlotException&) {
            listener(std::current_exception());
            return {};
        }
        if (!slot) {
            listener(std::make_exception_ptr(core::NoKeysException()));
            return {};
        }

        // abort may come before the operation reached its node
        struct Abort {
            std::mutex mutex;
            bool aborted = false;
            RedisExecutor::AbortHandle handle;
        };
        auto abort = std::make_shared<Abort>();
        auto step = std::make_shared<std::unique_ptr<core::OpStep>>(std::move(first));
        int target = *slot;
        with_state([abort, step, target, listener](std::shared_ptr<const ClusterState> state,
                                                   std::exception_ptr error) {
            if (error) {
                listener(error);
                return;
            }
            auto node = state->client_for_slot(target);
            if (!node) {
                listener(std::make_exception_ptr(core::UnmappedSlotException(target)));
                return;
            }
            std::lock_guard lock(abort->mutex);
            if (abort->aborted) {
                listener(std::make_exception_ptr(core::OperationAbortedException()));
                return;
            }
            abort->handle = node->run_op(std::move(*step), listener);
        });

        return [abort] {
            RedisExecutor::AbortHandle handle;
            {
                std::lock_guard lock(abort->mutex);
                abort->aborted = true;
                handle = abort->handle;
            }
            if (handle) {
                handle();
            }
        };
    }

   private:
    void on_mapping(const actor::ClusterMonitor::Mapping& mapping) {
        auto state = std::make_shared<const ClusterState>(mapping);
        std::vector<StateCallback> waiting;
        bool first = false;
        {
            std::lock_guard lock(mutex_);
            first = !ready_set_;
            ready_set_ = true;
            init_error_ = nullptr;
            state_ = state;
            waiting.swap(waiting_);
        }
        if (first) {
            ready_.set_value();
        }
        LOG_DEBUG("cluster client: slot mapping updated, " + std::to_string(mapping.size()) +
                  " ranges");
        for (auto& callback : waiting) {
            callback(state, nullptr);
        }
    }

    void on_init_failure(std::exception_ptr error) {
        std::vector<StateCallback> waiting;
        bool first = false;
        {
            std::lock_guard lock(mutex_);
            if (state_) {
                return;
            }
            first = !ready_set_;
            ready_set_ = true;
            init_error_ = error;
            waiting.swap(waiting_);
        }
        if (first) {
            ready_.set_exception(error);
        }
        for (auto& callback : waiting) {
            callback(nullptr, error);
        }
    }

    void with_state(StateCallback callback) {
        std::shared_ptr<const ClusterState> state;
        std::exception_ptr error;
        {
            std::lock_guard lock(mutex_);
            if (closed_) {
                error = std::make_exception_ptr(core::ClientStoppedException());
            } else if (state_) {
                state = state_;
            } else if (init_error_) {
                error = init_error_;
            } else {
                waiting_.push_back(std::move(callback));
                return;
            }
        }
        callback(std::move(state), std::move(error));
    }

    // the slot shared by all keyed packs of a step, nullopt when keyless
    static std::optional<int> step_slot(const core::RawCommandPacks& packs) {
        std::optional<int> slot;
        for (const auto& pack : packs.packs) {
            auto pack_slot = pack.slot();
            if (!pack_slot) {
                continue;
            }
            if (slot && *slot != *pack_slot) {
                throw core::CrossSlotException();
            }
            slot = pack_slot;
        }
        return slot;
    }

    void route(const ClusterState& state, const std::shared_ptr<Routing>& routing) {
        if (routing->packs.empty()) {
            routing->callback(actor::BatchOutcome::success({}));
            return;
        }

        // packs grouped per node, in order of first appearance
        std::vector<std::pair<std::shared_ptr<NodeClient>, std::vector<std::size_t>>> groups;
        for (std::size_t i = 0; i < routing->packs.packs.size(); ++i) {
            std::shared_ptr<NodeClient> node;
            try {
                auto slot = routing->packs.packs[i].slot();
                node = slot ? state.client_for_slot(*slot) : state.random_master();
                if (!node) {
                    if (slot) {
                        throw core::UnmappedSlotException(*slot);
                    }
                    throw core::ClusterInitializationException("no master is known");
                }
            } catch (const core::RedisException&) {
                routing->fail(std::current_exception());
                return;
            }
            auto group = std::find_if(groups.begin(), groups.end(),
                                      [&node](const auto& g) { return g.first == node; });
            if (group == groups.end()) {
                groups.emplace_back(node, std::vector<std::size_t>{i});
            } else {
                group->second.push_back(i);
            }
        }

        for (auto& [node, indexes] : groups) {
            send(node, routing, std::move(indexes), false);
        }
    }

    void send(const std::shared_ptr<NodeClient>& node, const std::shared_ptr<Routing>& routing,
              std::vector<std::size_t> indexes, bool asking) {
        core::RawCommandPacks packs;
        if (asking) {
            packs.packs.push_back(asking_pack());
        }
        for (auto index : indexes) {
            packs.packs.push_back(routing->packs.packs[index]);
        }
        std::weak_ptr<ClusterRuntime> weak = shared_from_this();
        node->execute_raw(std::move(packs), [weak, routing, indexes,
                                             asking](actor::BatchOutcome outcome) {
            if (!outcome.ok()) {
                routing->fail(outcome.failure);
                return;
            }
            auto self = weak.lock();
            std::size_t offset = asking ? 1 : 0;
            for (auto index : indexes) {
                auto count = routing->packs.packs[index].reply_count();
                protocol::Replies replies(
                    std::make_move_iterator(outcome.replies.begin() + offset),
                    std::make_move_iterator(outcome.replies.begin() + offset + count));
                offset += count;

                std::optional<Redirection> redirection;
                for (const auto& reply : replies) {
                    if ((redirection = parse_redirection(reply))) {
                        break;
                    }
                }
                if (redirection && self) {
                    self->redirect(routing, index, std::move(*redirection));
                } else {
                    routing->store(index, std::move(replies));
                }
            }
        });
    }

    void redirect(const std::shared_ptr<Routing>& routing, std::size_t index,
                  Redirection redirection) {
        int count = 0;
        {
            std::lock_guard lock(routing->mutex);
            if (routing->finished) {
                return;
            }
            count = ++routing->redirections[index];
        }
        if (count > config_.max_redirections) {
            routing->fail(
                std::make_exception_ptr(core::TooManyRedirectionsException(redirection.reply)));
            return;
        }
        LOG_DEBUG("cluster client: redirected: " + redirection.reply);
        if (!redirection.ask) {
            monitor_->refresh();
        }

        std::weak_ptr<ClusterRuntime> weak = shared_from_this();
        bool asking = redirection.ask;
        monitor_->get_client(redirection.address,
                             [weak, routing, index, asking](std::shared_ptr<NodeClient> node) {
                                 auto self = weak.lock();
                                 if (!node || !self) {
                                     routing->fail(std::make_exception_ptr(
                                         core::ClientStoppedException()));
                                     return;
                                 }
                                 self->send(node, routing, {index}, asking);
                             });
    }

    actor::ActorSystem& system_;
    const core::ClusterConfig config_;
    std::shared_ptr<actor::ClusterMonitor> monitor_;

    std::mutex mutex_;
    std::shared_ptr<const ClusterState> state_;
    std::vector<StateCallback> waiting_;
    std::exception_ptr init_error_;
    bool closed_ = false;
    bool ready_set_ = false;
    std::promise<void> ready_;
    std::shared_future<void> ready_future_;
};

}  // namespace detail

ClusterClient::ClusterClient(actor::ActorSystem& system, std::vector<core::NodeAddress> seeds,
                             core::ClusterConfig config, std::shared_ptr<util::Clock> clock)
    : RedisExecutor(system),
      runtime_(std::make_shared<detail::ClusterRuntime>(system, std::move(config))) {
    runtime_->start(std::move(seeds), std::move(clock));
}

ClusterClient::~ClusterClient() {
    close();
}

std::shared_future<void> ClusterClient::initialized() const {
    return runtime_->initialized();
}

std::shared_ptr<const ClusterState> ClusterClient::current_state() const {
    return runtime_->current_state();
}

void ClusterClient::close() {
    runtime_->close();
}

void ClusterClient::execute_raw(core::RawCommandPacks packs, actor::BatchCallback callback) {
    runtime_->execute(std::move(packs), std::move(callback));
}

RedisExecutor::AbortHandle ClusterClient::run_op(std::unique_ptr<core::OpStep> first,
                                                 actor::OperationActor::Listener listener) {
    return runtime_->run_op(std::move(first), std::move(listener));
}

}  // namespace rediskit::client
