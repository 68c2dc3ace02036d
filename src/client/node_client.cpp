#include "rediskit/client/node_client.hpp"

#include <mutex>
#include <stdexcept>
#include <utility>

#include "rediskit/core/errors.hpp"

namespace rediskit::client {

namespace {

// resolves the pool's initialized future once all connections reported
struct PoolReadiness {
    std::mutex mutex;
    std::size_t remaining;
    bool settled = false;
    std::promise<void> promise;

    explicit PoolReadiness(std::size_t count) : remaining(count) {}

    void report(std::exception_ptr error) {
        std::lock_guard lock(mutex);
        if (settled) {
            return;
        }
        if (error) {
            settled = true;
            promise.set_exception(error);
            return;
        }
        if (--remaining == 0) {
            settled = true;
            promise.set_value();
        }
    }
};

}  // namespace

NodeClient::NodeClient(actor::ActorSystem& system, core::NodeAddress address,
                       core::NodeConfig config)
    : RedisExecutor(system), address_(std::move(address)) {
    if (config.pool_size == 0) {
        throw std::invalid_argument("node client pool size must be positive");
    }
    auto readiness = std::make_shared<PoolReadiness>(config.pool_size);
    initialized_ = readiness->promise.get_future().share();

    connections_.reserve(config.pool_size);
    for (std::size_t i = 0; i < config.pool_size; ++i) {
        auto connection_config = config.connection_configs(i);
        if (!connection_config.actor_name) {
            connection_config.actor_name =
                "node-" + address_.to_string() + "-" + std::to_string(i);
        }
        connections_.push_back(
            actor::ConnectionActor::create(system_, address_, std::move(connection_config)));
    }
    for (auto& connection : connections_) {
        connection->open(false, [readiness](std::exception_ptr error) { readiness->report(error); });
    }
}

NodeClient::~NodeClient() {
    close();
}

void NodeClient::close() {
    if (closed_.exchange(true)) {
        return;
    }
    for (auto& connection : connections_) {
        connection->stop();
    }
}

std::shared_ptr<actor::ConnectionActor> NodeClient::next_connection() {
    return connections_[next_.fetch_add(1) % connections_.size()];
}

void NodeClient::execute_raw(core::RawCommandPacks packs, actor::BatchCallback callback) {
    if (closed_) {
        callback(actor::BatchOutcome::failed(
            std::make_exception_ptr(core::ClientStoppedException(address_))));
        return;
    }
    next_connection()->execute(std::move(packs), std::move(callback));
}

RedisExecutor::AbortHandle NodeClient::run_op(std::unique_ptr<core::OpStep> first,
                                              actor::OperationActor::Listener listener) {
    if (closed_) {
        listener(std::make_exception_ptr(core::ClientStoppedException(address_)));
        return {};
    }
    auto op = actor::OperationActor::create(system_, next_connection(),
                                            core::Level::OperationOnly, client_type());
    op->run(std::move(first), std::move(listener));
    std::weak_ptr<actor::OperationActor> weak = op;
    return [weak] {
        if (auto running = weak.lock()) {
            running->abort();
        }
    };
}

}  // namespace rediskit::client
