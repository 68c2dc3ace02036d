#ifndef REDISKIT_CLIENT_NODE_CLIENT_HPP
#define REDISKIT_CLIENT_NODE_CLIENT_HPP

#include <atomic>
#include <cstddef>
#include <future>
#include <memory>
#include <string>
#include <vector>

#include "rediskit/client/executor.hpp"
#include "rediskit/core/config.hpp"
#include "rediskit/core/node_address.hpp"

namespace rediskit::client {

namespace detail {
class ClusterRuntime;
}

/*
    fixed pool of reconnecting connections to one node, used round robin. operations reserve one
    pooled connection for their whole chain, so WATCH ... EXEC never interleaves with other callers.
    connection state commands are forbidden: the connection running them is shared.
*/
class NodeClient : public RedisExecutor {
   public:
    // throws std::invalid_argument for an empty pool
    NodeClient(actor::ActorSystem& system, core::NodeAddress address, core::NodeConfig config = {});
    ~NodeClient() override;

    // completes once every pooled connection is ready, or with the first fatal failure
    [[nodiscard]] std::shared_future<void> initialized() const { return initialized_; }
    [[nodiscard]] const core::NodeAddress& address() const noexcept { return address_; }
    [[nodiscard]] std::size_t pool_size() const noexcept { return connections_.size(); }
    [[nodiscard]] bool closed() const noexcept { return closed_.load(); }

    // idempotent
    void close();

   protected:
    void execute_raw(core::RawCommandPacks packs, actor::BatchCallback callback) override;
    AbortHandle run_op(std::unique_ptr<core::OpStep> first,
                       actor::OperationActor::Listener listener) override;
    [[nodiscard]] core::Level batch_level() const override { return core::Level::Node; }
    [[nodiscard]] std::string client_type() const override { return "node client"; }

   private:
    friend class detail::ClusterRuntime;

    std::shared_ptr<actor::ConnectionActor> next_connection();

    core::NodeAddress address_;
    std::vector<std::shared_ptr<actor::ConnectionActor>> connections_;
    std::atomic<std::size_t> next_{0};
    std::shared_future<void> initialized_;
    std::atomic<bool> closed_{false};
};

}  // namespace rediskit::client

#endif
