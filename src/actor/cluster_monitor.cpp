#include "rediskit/actor/cluster_monitor.hpp"

#include <algorithm>
#include <sstream>

#include "rediskit/client/node_client.hpp"
#include "rediskit/core/commands.hpp"
#include "rediskit/core/errors.hpp"
#include "rediskit/util/logger.hpp"

namespace rediskit::actor {

std::shared_ptr<ClusterMonitor> ClusterMonitor::create(ActorSystem& system,
                                                       std::vector<core::NodeAddress> seeds,
                                                       core::ClusterConfig config,
                                                       Listener listener,
                                                       std::shared_ptr<util::Clock> clock) {
    return std::shared_ptr<ClusterMonitor>(new ClusterMonitor(
        system, std::move(seeds), std::move(config), std::move(listener), std::move(clock)));
}

ClusterMonitor::ClusterMonitor(ActorSystem& system, std::vector<core::NodeAddress> seeds,
                               core::ClusterConfig config, Listener listener,
                               std::shared_ptr<util::Clock> clock)
    : Actor(system, "cluster-monitor"),
      seeds_(std::move(seeds)),
      config_(std::move(config)),
      listener_(std::move(listener)),
      clock_(std::move(clock)),
      random_(std::random_device{}()) {}

ClusterMonitor::~ClusterMonitor() {
    if (refresh_timer_ != 0) {
        system_.scheduler().cancel(refresh_timer_);
    }
}

void ClusterMonitor::start() {
    auto self = this->self<ClusterMonitor>();
    tell([self] { self->handle_start(); });
}

void ClusterMonitor::refresh(std::optional<std::vector<core::NodeAddress>> nodes) {
    auto self = this->self<ClusterMonitor>();
    tell([self, nodes = std::move(nodes)] { self->handle_refresh(nodes, false); });
}

void ClusterMonitor::get_client(const core::NodeAddress& address,
                                std::function<void(std::shared_ptr<client::NodeClient>)> callback) {
    auto self = this->self<ClusterMonitor>();
    tell([self, address, callback = std::move(callback)] {
        callback(self->stopped_ ? nullptr : self->client_for(address));
    });
}

void ClusterMonitor::stop() {
    auto self = this->self<ClusterMonitor>();
    tell([self] { self->handle_stop(); });
}

void ClusterMonitor::handle_start() {
    if (started_ || stopped_) {
        return;
    }
    started_ = true;
    std::weak_ptr<ClusterMonitor> weak = weak_self<ClusterMonitor>();
    refresh_timer_ = system_.scheduler().schedule_repeatedly(
        config_.auto_refresh_interval, config_.auto_refresh_interval, [weak] {
            if (auto self = weak.lock()) {
                self->tell([self] { self->handle_refresh(std::nullopt, false); });
            }
        });
    handle_refresh(seeds_, true);
}

void ClusterMonitor::handle_refresh(const std::optional<std::vector<core::NodeAddress>>& nodes,
                                    bool initial) {
    if (stopped_) {
        return;
    }
    auto now = clock_->now();
    if (now < suspend_until_) {
        LOG_DEBUG(name() + ": refresh suppressed");
        return;
    }

    auto targets = nodes ? *nodes : random_masters();
    if (targets.empty()) {
        // no master known (yet, or any more): fall back to the seeds
        targets = seeds_;
    }
    if (initial) {
        initial_pending_ = targets.size();
    }

    auto slots = core::commands::cluster_slots();
    auto self = this->self<ClusterMonitor>();
    for (const auto& node : targets) {
        connection_for(node)->execute(slots.packs(), [self, node, initial](BatchOutcome outcome) {
            self->tell([self, node, initial, outcome = std::move(outcome)]() mutable {
                self->handle_slots(node, initial, std::move(outcome));
            });
        });
    }
    suspend_until_ = now + config_.min_refresh_interval;
}

void ClusterMonitor::handle_slots(const core::NodeAddress& node, bool initial,
                                  BatchOutcome outcome) {
    if (stopped_) {
        return;
    }

    std::vector<core::SlotRangeMapping> slots;
    try {
        if (!outcome.ok()) {
            std::rethrow_exception(outcome.failure);
        }
        slots = core::commands::cluster_slots().decode_replies(outcome.replies);
    } catch (const core::ConnectionException& e) {
        // unreachable node: the next probe starts over with a fresh connection
        drop_connection(node);
        refresh_failed(node, initial, e.what());
        return;
    } catch (const std::exception& e) {
        refresh_failed(node, initial, e.what());
        return;
    }
    received_ = true;

    Mapping mapping;
    mapping.reserve(slots.size());
    std::vector<core::NodeAddress> masters;
    for (const auto& slot_mapping : slots) {
        mapping.emplace_back(slot_mapping.range, client_for(slot_mapping.master));
        if (std::find(masters.begin(), masters.end(), slot_mapping.master) == masters.end()) {
            masters.push_back(slot_mapping.master);
        }
    }
    std::sort(mapping.begin(), mapping.end(),
              [](const auto& a, const auto& b) { return a.first.start < b.first.start; });
    masters_ = masters;

    for (const auto& master : masters_) {
        connection_for(master);
    }

    if (!same_mapping(mapping)) {
        if (util::Logger::instance().enabled(util::LogLevel::Debug)) {
            std::ostringstream os;
            os << name() << ": new slot mapping from " << node.to_string() << ":";
            for (const auto& slot_mapping : slots) {
                os << " " << slot_mapping.range.to_string() << "->"
                   << slot_mapping.master.to_string();
            }
            LOG_DEBUG(os.str());
        }
        mapping_ = std::move(mapping);
        if (listener_.on_mapping) {
            listener_.on_mapping(mapping_);
        }
    }

    auto is_master = [this](const core::NodeAddress& address) {
        return std::find(masters_.begin(), masters_.end(), address) != masters_.end();
    };
    for (auto it = connections_.begin(); it != connections_.end();) {
        if (is_master(it->first)) {
            ++it;
            continue;
        }
        it->second->stop();
        it = connections_.erase(it);
    }
    for (auto it = clients_.begin(); it != clients_.end();) {
        if (is_master(it->first)) {
            ++it;
            continue;
        }
        LOG_INFO(name() + ": " + it->first.to_string() + " is no longer a master, closing its client");
        auto client = it->second;
        system_.scheduler().schedule_once(config_.node_client_close_delay,
                                          [client] { client->close(); });
        it = clients_.erase(it);
    }
}

void ClusterMonitor::handle_stop() {
    if (stopped_) {
        return;
    }
    stopped_ = true;
    if (refresh_timer_ != 0) {
        system_.scheduler().cancel(refresh_timer_);
        refresh_timer_ = 0;
    }
    for (auto& [address, connection] : connections_) {
        connection->stop();
    }
    connections_.clear();
    for (auto& [address, client] : clients_) {
        client->close();
    }
    clients_.clear();
    mapping_.clear();
}

void ClusterMonitor::refresh_failed(const core::NodeAddress& node, bool initial,
                                    const std::string& reason) {
    LOG_ERROR(name() + ": failed to refresh cluster state from " + node.to_string() + ": " + reason);
    if (initial && !received_ && initial_pending_ > 0 && --initial_pending_ == 0 &&
        listener_.on_init_failure) {
        listener_.on_init_failure(
            std::make_exception_ptr(core::ClusterInitializationException(reason)));
    }
}

void ClusterMonitor::drop_connection(const core::NodeAddress& node) {
    auto it = connections_.find(node);
    if (it == connections_.end()) {
        return;
    }
    it->second->stop();
    connections_.erase(it);
}

// partial Fisher-Yates: the first `count` entries end up a uniform sample without replacement
std::vector<core::NodeAddress> ClusterMonitor::random_masters() {
    auto pool = masters_;
    std::size_t count = std::min(config_.nodes_to_query_for_state(pool.size()), pool.size());
    for (std::size_t i = 0; i < count; ++i) {
        std::uniform_int_distribution<std::size_t> pick(i, pool.size() - 1);
        std::swap(pool[i], pool[pick(random_)]);
    }
    pool.resize(count);
    return pool;
}

std::shared_ptr<ConnectionActor> ClusterMonitor::connection_for(const core::NodeAddress& address) {
    auto it = connections_.find(address);
    if (it != connections_.end()) {
        return it->second;
    }
    auto config = config_.monitoring_connection_configs(address);
    if (!config.actor_name) {
        config.actor_name = "monitor-" + address.to_string();
    }
    auto connection = ConnectionActor::create(system_, address, std::move(config));
    // a probe to a node that cannot be reached fails instead of waiting for it
    connection->open(true);
    connections_.emplace(address, connection);
    return connection;
}

std::shared_ptr<client::NodeClient> ClusterMonitor::client_for(const core::NodeAddress& address) {
    auto it = clients_.find(address);
    if (it != clients_.end()) {
        return it->second;
    }
    auto client = std::make_shared<client::NodeClient>(system_, address, config_.node_configs(address));
    clients_.emplace(address, client);
    return client;
}

bool ClusterMonitor::same_mapping(const Mapping& other) const {
    if (mapping_.size() != other.size()) {
        return false;
    }
    for (std::size_t i = 0; i < other.size(); ++i) {
        if (mapping_[i].first != other[i].first || mapping_[i].second != other[i].second) {
            return false;
        }
    }
    return true;
}

}  // namespace rediskit::actor
