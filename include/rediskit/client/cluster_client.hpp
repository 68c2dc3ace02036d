#ifndef REDISKIT_CLIENT_CLUSTER_CLIENT_HPP
#define REDISKIT_CLIENT_CLUSTER_CLIENT_HPP

#include <future>
#include <memory>
#include <string>
#include <vector>

#include "rediskit/actor/cluster_monitor.hpp"
#include "rediskit/client/executor.hpp"
#include "rediskit/client/node_client.hpp"
#include "rediskit/core/config.hpp"
#include "rediskit/core/node_address.hpp"
#include "rediskit/util/clock.hpp"

namespace rediskit::client {

// immutable snapshot of the routing table. readers keep the snapshot they started with
class ClusterState {
   public:
    explicit ClusterState(actor::ClusterMonitor::Mapping mapping);

    // nullptr when no known range covers the slot
    [[nodiscard]] std::shared_ptr<NodeClient> client_for_slot(int slot) const;
    // nullptr when no master is known
    [[nodiscard]] std::shared_ptr<NodeClient> random_master() const;

    [[nodiscard]] const actor::ClusterMonitor::Mapping& mapping() const noexcept { return mapping_; }
    [[nodiscard]] const std::vector<std::shared_ptr<NodeClient>>& masters() const noexcept {
        return masters_;
    }

   private:
    actor::ClusterMonitor::Mapping mapping_;
    std::vector<std::shared_ptr<NodeClient>> masters_;
};

/*
    key routed client for a redis cluster. each pack of a batch goes to the master owning its slot,
    packs for the same master are pipelined together and the replies put back in the original order.
    MOVED refreshes the topology and resends to the named node, ASK resends once prefixed with
    ASKING. operations run on the master owning the slot of their first step.
    work submitted before the first slot mapping arrives waits for it.
*/
class ClusterClient : public RedisExecutor {
   public:
    ClusterClient(actor::ActorSystem& system, std::vector<core::NodeAddress> seeds,
                  core::ClusterConfig config = {},
                  std::shared_ptr<util::Clock> clock = util::system_clock());
    ~ClusterClient() override;

    // completes with the first slot mapping, or with ClusterInitializationException
    [[nodiscard]] std::shared_future<void> initialized() const;

    // current snapshot, nullptr before the first mapping
    [[nodiscard]] std::shared_ptr<const ClusterState> current_state() const;

    // idempotent
    void close();

   protected:
    void execute_raw(core::RawCommandPacks packs, actor::BatchCallback callback) override;
    AbortHandle run_op(std::unique_ptr<core::OpStep> first,
                       actor::OperationActor::Listener listener) override;
    [[nodiscard]] core::Level batch_level() const override { return core::Level::Cluster; }
    [[nodiscard]] std::string client_type() const override { return "cluster client"; }

   private:
    std::shared_ptr<detail::ClusterRuntime> runtime_;
};

}  // namespace rediskit::client

#endif
