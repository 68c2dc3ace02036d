#ifndef REDISKIT_CLIENT_CONNECTION_CLIENT_HPP
#define REDISKIT_CLIENT_CONNECTION_CLIENT_HPP

#include <atomic>
#include <future>
#include <memory>
#include <string>

#include "rediskit/client/executor.hpp"
#include "rediskit/core/config.hpp"
#include "rediskit/core/node_address.hpp"

namespace rediskit::client {

/*
    one dedicated connection, never reconnected and never retrying: connection state set by commands
    (CLIENT SETNAME, SELECT) is only valid as long as the socket lives. once it is lost every
    later call fails.
    the only client allowed to run Connection level commands.
*/
class ConnectionClient : public RedisExecutor {
   public:
    ConnectionClient(actor::ActorSystem& system, core::NodeAddress address,
                     core::ConnectionConfig config = {});
    ~ConnectionClient() override;

    // completes once connected and initialized, or with the connection failure
    [[nodiscard]] std::shared_future<void> initialized() const { return initialized_; }
    [[nodiscard]] const core::NodeAddress& address() const noexcept { return address_; }

    // idempotent
    void close();

   protected:
    void execute_raw(core::RawCommandPacks packs, actor::BatchCallback callback) override;
    AbortHandle run_op(std::unique_ptr<core::OpStep> first,
                       actor::OperationActor::Listener listener) override;
    [[nodiscard]] core::Level batch_level() const override { return core::Level::Connection; }
    [[nodiscard]] std::string client_type() const override { return "connection client"; }

   private:
    core::NodeAddress address_;
    std::shared_ptr<actor::ConnectionActor> connection_;
    std::shared_future<void> initialized_;
    std::atomic<bool> closed_{false};
};

}  // namespace rediskit::client

#endif
