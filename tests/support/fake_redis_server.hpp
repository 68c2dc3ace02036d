#ifndef REDISKIT_TESTS_SUPPORT_FAKE_REDIS_SERVER_HPP
#define REDISKIT_TESTS_SUPPORT_FAKE_REDIS_SERVER_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "rediskit/core/node_address.hpp"
#include "rediskit/core/slots.hpp"
#include "rediskit/util/types.hpp"

namespace rediskit::test {

// one command as seen by the server, in arrival order across all connections
struct LoggedCommand {
    std::size_t connection = 0;  // 1-based, in accept order
    std::vector<std::string> args;
};

/*
    in-process RESP server on an ephemeral local port, one thread per connection.
    implements PING ECHO GET SET DEL INCR EXISTS WATCH UNWATCH MULTI EXEC DISCARD CLIENT CLUSTER
    ASKING with per key versions for optimistic locking, and hooks to misbehave on demand.
*/
class FakeRedisServer {
   public:
    FakeRedisServer();
    ~FakeRedisServer();

    FakeRedisServer(const FakeRedisServer&) = delete;
    FakeRedisServer& operator=(const FakeRedisServer&) = delete;

    void start();
    void stop();

    [[nodiscard]] uint16_t port() const noexcept;
    [[nodiscard]] core::NodeAddress address() const;

    // CLUSTER SLOTS answer. empty (default) answers an error like a non cluster node
    void set_cluster_slots(std::vector<core::SlotRangeMapping> slots);

    // keyed commands whose key hashes into range answer -MOVED / -ASK to target.
    // with ask, a command directly preceded by ASKING is served
    void redirect(core::SlotRange range, core::NodeAddress target, bool ask);
    void clear_redirections();

    // close the connection instead of answering the next `times` commands with that name
    void drop_on(const std::string& command, int times = 1);
    // sleep before answering every command with that name
    void delay_on(const std::string& command, util::Duration delay);
    // answer every command with that name with an error reply
    void fail_on(const std::string& command, const std::string& error);

    // accept and immediately close new connections without reading anything
    void close_on_accept(bool enabled);

    // shuts down every open client connection
    void kill_connections();

    [[nodiscard]] std::vector<LoggedCommand> command_log() const;
    // upper cased command names in arrival order
    [[nodiscard]] std::vector<std::string> command_names() const;
    [[nodiscard]] std::size_t count(const std::string& command) const;
    [[nodiscard]] std::size_t connections_accepted() const;

    // direct store access, bypassing the protocol. put() breaks WATCHes on the key
    [[nodiscard]] std::optional<std::string> value(const std::string& key) const;
    void put(const std::string& key, const std::string& value);

   private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace rediskit::test

#endif
