#include "rediskit/client/connection_client.hpp"

#include <utility>

#include "rediskit/core/errors.hpp"

namespace rediskit::client {

ConnectionClient::ConnectionClient(actor::ActorSystem& system, core::NodeAddress address,
                                   core::ConnectionConfig config)
    : RedisExecutor(system), address_(std::move(address)) {
    config.reconnection_strategy = std::make_shared<core::NoRetryStrategy>();
    config.retry_strategy = std::make_shared<core::NoRetryStrategy>();

    auto ready = std::make_shared<std::promise<void>>();
    initialized_ = ready->get_future().share();
    connection_ = actor::ConnectionActor::create(system_, address_, std::move(config), false);
    connection_->open(true, [ready](std::exception_ptr error) {
        if (error) {
            ready->set_exception(error);
        } else {
            ready->set_value();
        }
    });
}

ConnectionClient::~ConnectionClient() {
    close();
}

void ConnectionClient::close() {
    if (closed_.exchange(true)) {
        return;
    }
    connection_->stop();
}

void ConnectionClient::execute_raw(core::RawCommandPacks packs, actor::BatchCallback callback) {
    if (closed_) {
        callback(actor::BatchOutcome::failed(
            std::make_exception_ptr(core::ClientStoppedException(address_))));
        return;
    }
    connection_->execute(std::move(packs), std::move(callback));
}

RedisExecutor::AbortHandle ConnectionClient::run_op(std::unique_ptr<core::OpStep> first,
                                                    actor::OperationActor::Listener listener) {
    if (closed_) {
        listener(std::make_exception_ptr(core::ClientStoppedException(address_)));
        return {};
    }
    auto op = actor::OperationActor::create(system_, connection_, core::Level::Connection,
                                            client_type());
    op->run(std::move(first), std::move(listener));
    std::weak_ptr<actor::OperationActor> weak = op;
    return [weak] {
        if (auto running = weak.lock()) {
            running->abort();
        }
    };
}

}  // namespace rediskit::client
