#ifndef REDISKIT_CORE_CONFIG_HPP
#define REDISKIT_CORE_CONFIG_HPP

#include <algorithm>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "rediskit/core/node_address.hpp"
#include "rediskit/core/raw_command.hpp"
#include "rediskit/util/types.hpp"

namespace rediskit::core {

using util::Duration;

class RetryStrategy {
   public:
    virtual ~RetryStrategy() = default;

    // delay before retry number `attempt` (0-based), nullopt means give up
    [[nodiscard]] virtual std::optional<Duration> retry_delay(int attempt) const = 0;
};

class NoRetryStrategy : public RetryStrategy {
   public:
    [[nodiscard]] std::optional<Duration> retry_delay(int) const override { return std::nullopt; }
};

// initial * 2^attempt, capped at max. max_retries < 0 means unlimited
class ExponentialBackoff : public RetryStrategy {
   public:
    ExponentialBackoff(Duration initial, Duration max, int max_retries = -1)
        : initial_(initial), max_(max), max_retries_(max_retries) {}

    [[nodiscard]] std::optional<Duration> retry_delay(int attempt) const override;

   private:
    Duration initial_;
    Duration max_;
    int max_retries_;
};

// observes raw traffic of a connection. called from the connection's own threads
class DebugListener {
   public:
    virtual ~DebugListener() = default;
    virtual void on_send(std::string_view data) = 0;
    virtual void on_receive(std::string_view data) = 0;
};

struct ConnectionConfig {
    // sent on every (re)connect before any queued batch, e.g. AUTH or SELECT
    RawCommandPacks init_commands;
    // delay before each reconnect, after a failed connect or a lost connection
    std::shared_ptr<const RetryStrategy> reconnection_strategy =
        std::make_shared<ExponentialBackoff>(Duration(100), Duration(10000));
    // whether batches written but not answered before a disconnect are sent again.
    // the next connection is not opened before the delay of any batch to resend
    std::shared_ptr<const RetryStrategy> retry_strategy =
        std::make_shared<ExponentialBackoff>(Duration(0), Duration(0), 3);
    Duration connect_timeout{5000};
    std::optional<std::string> actor_name;
    std::shared_ptr<DebugListener> debug_listener;
};

struct NodeConfig {
    std::size_t pool_size = 1;
    std::function<ConnectionConfig(std::size_t index)> connection_configs =
        [](std::size_t) { return ConnectionConfig{}; };
};

struct ClusterConfig {
    std::function<NodeConfig(const NodeAddress&)> node_configs =
        [](const NodeAddress&) { return NodeConfig{}; };
    std::function<ConnectionConfig(const NodeAddress&)> monitoring_connection_configs =
        [](const NodeAddress&) { return ConnectionConfig{}; };
    Duration auto_refresh_interval{5000};
    Duration min_refresh_interval{1000};
    // how many of the known masters to ask for cluster state on each refresh
    std::function<std::size_t(std::size_t known_masters)> nodes_to_query_for_state =
        [](std::size_t known) { return std::min<std::size_t>(known, 3); };
    Duration node_client_close_delay{1000};
    int max_redirections = 3;
};

}  // namespace rediskit::core

#endif
