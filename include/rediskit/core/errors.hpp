#ifndef REDISKIT_CORE_ERRORS_HPP
#define REDISKIT_CORE_ERRORS_HPP

#include <optional>
#include <stdexcept>
#include <string>

#include "rediskit/core/node_address.hpp"

namespace rediskit::core {

class RedisException : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

// socket level failure: connect, write or read
class ConnectionException : public RedisException {
   public:
    ConnectionException(const NodeAddress& address, const std::string& reason)
        : RedisException("connection to " + address.to_string() + " failed: " + reason),
          address_(address) {}

    [[nodiscard]] const NodeAddress& address() const noexcept { return address_; }

   private:
    NodeAddress address_;
};

class ProtocolException : public RedisException {
   public:
    explicit ProtocolException(const std::string& reason)
        : RedisException("protocol error: " + reason) {}
};

class TimeoutException : public RedisException {
   public:
    explicit TimeoutException(const std::string& what) : RedisException(what) {}
};

class ClientStoppedException : public RedisException {
   public:
    explicit ClientStoppedException(const std::optional<NodeAddress>& address = std::nullopt)
        : RedisException(address ? "client for " + address->to_string() + " was stopped"
                                 : std::string("client was stopped")) {}
};

// a command needs a capability (e.g. connection state) the executing client does not provide
class ForbiddenCommandException : public RedisException {
   public:
    ForbiddenCommandException(const std::string& command, const std::string& client_type)
        : RedisException(command + " cannot be executed by " + client_type) {}
};

class OperationAbortedException : public RedisException {
   public:
    OperationAbortedException() : RedisException("operation killed before finishing") {}
};

class ErrorReplyException : public RedisException {
   public:
    explicit ErrorReplyException(const std::string& message)
        : RedisException(message), message_(message) {}

    [[nodiscard]] const std::string& message() const noexcept { return message_; }

   private:
    std::string message_;
};

class UnexpectedReplyException : public RedisException {
   public:
    explicit UnexpectedReplyException(const std::string& what) : RedisException(what) {}
};

class OptimisticLockException : public RedisException {
   public:
    OptimisticLockException() : RedisException("transaction aborted: watched key was modified") {}
};

class CrossSlotException : public RedisException {
   public:
    CrossSlotException() : RedisException("keys in request don't hash to the same slot") {}
};

class NoKeysException : public RedisException {
   public:
    NoKeysException() : RedisException("cannot route operation without keys") {}
};

class UnmappedSlotException : public RedisException {
   public:
    explicit UnmappedSlotException(int slot)
        : RedisException("slot " + std::to_string(slot) + " is not served by any known node") {}
};

class TooManyRedirectionsException : public RedisException {
   public:
    explicit TooManyRedirectionsException(const std::string& last)
        : RedisException("too many redirections, last one: " + last) {}
};

class ClusterInitializationException : public RedisException {
   public:
    explicit ClusterInitializationException(const std::string& reason)
        : RedisException("could not read cluster state from seed nodes: " + reason) {}
};

}  // namespace rediskit::core

#endif
