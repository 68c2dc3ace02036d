#ifndef REDISKIT_ACTOR_CLUSTER_MONITOR_HPP
#define REDISKIT_ACTOR_CLUSTER_MONITOR_HPP

#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "rediskit/actor/actor.hpp"
#include "rediskit/actor/connection_actor.hpp"
#include "rediskit/core/config.hpp"
#include "rediskit/core/node_address.hpp"
#include "rediskit/core/slots.hpp"
#include "rediskit/util/clock.hpp"

namespace rediskit::client {
class NodeClient;
}

namespace rediskit::actor {

/*
    sole owner of the slot -> node client routing table.

    queries CLUSTER SLOTS from the seeds on start and from a random sample of known masters on every
    refresh (periodic, or requested after a MOVED redirection). refreshes closer than
    min_refresh_interval to the previous honored one are dropped. the listener sees a new mapping
    only when it differs from the published one; a failed query keeps the current mapping.

    node clients of nodes that stop being masters are closed after node_client_close_delay, so
    traffic already routed to them can finish.
*/
class ClusterMonitor : public Actor {
   public:
    // sorted by range start
    using Mapping = std::vector<std::pair<core::SlotRange, std::shared_ptr<client::NodeClient>>>;

    struct Listener {
        std::function<void(const Mapping&)> on_mapping;
        // every seed query of the initial refresh failed before any mapping was received
        std::function<void(std::exception_ptr)> on_init_failure;
    };

    static std::shared_ptr<ClusterMonitor> create(
        ActorSystem& system, std::vector<core::NodeAddress> seeds, core::ClusterConfig config,
        Listener listener, std::shared_ptr<util::Clock> clock = util::system_clock());
    ~ClusterMonitor() override;

    void start();

    // nodes to query, or a random sample of known masters
    void refresh(std::optional<std::vector<core::NodeAddress>> nodes = std::nullopt);

    // node client for any address, created if unknown. nullptr once stopped
    void get_client(const core::NodeAddress& address,
                    std::function<void(std::shared_ptr<client::NodeClient>)> callback);

    // closes all node clients and monitoring connections
    void stop();

   private:
    ClusterMonitor(ActorSystem& system, std::vector<core::NodeAddress> seeds,
                   core::ClusterConfig config, Listener listener,
                   std::shared_ptr<util::Clock> clock);

    void handle_start();
    void handle_refresh(const std::optional<std::vector<core::NodeAddress>>& nodes, bool initial);
    void handle_slots(const core::NodeAddress& node, bool initial, BatchOutcome outcome);
    void handle_stop();

    void refresh_failed(const core::NodeAddress& node, bool initial, const std::string& reason);
    void drop_connection(const core::NodeAddress& node);
    std::vector<core::NodeAddress> random_masters();
    std::shared_ptr<ConnectionActor> connection_for(const core::NodeAddress& address);
    std::shared_ptr<client::NodeClient> client_for(const core::NodeAddress& address);
    bool same_mapping(const Mapping& other) const;

    const std::vector<core::NodeAddress> seeds_;
    const core::ClusterConfig config_;
    const Listener listener_;
    const std::shared_ptr<util::Clock> clock_;

    std::mt19937 random_;
    std::vector<core::NodeAddress> masters_;  // in CLUSTER SLOTS order
    std::unordered_map<core::NodeAddress, std::shared_ptr<ConnectionActor>, core::NodeAddressHash>
        connections_;
    std::unordered_map<core::NodeAddress, std::shared_ptr<client::NodeClient>, core::NodeAddressHash>
        clients_;
    Mapping mapping_;
    util::TimePoint suspend_until_{};

    bool started_ = false;
    bool stopped_ = false;
    bool received_ = false;
    std::size_t initial_pending_ = 0;
    Scheduler::TaskId refresh_timer_ = 0;
};

}  // namespace rediskit::actor

#endif
