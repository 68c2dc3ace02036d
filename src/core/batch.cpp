#include "rediskit/core/batch.hpp"

#include <optional>
#include <string>

#include "rediskit/core/errors.hpp"

namespace rediskit::core {

const RespValue& ReplyCursor::next() {
    if (index_ >= replies_.size()) {
        throw UnexpectedReplyException("expected " + std::to_string(index_ + 1) +
                                       " replies, got " + std::to_string(replies_.size()));
    }
    return replies_[index_++];
}

namespace detail {

RawCommandPack wrap_in_transaction(const RawCommandPacks& packs) {
    RawCommandPack pack;
    pack.commands.push_back(RawCommand{{"MULTI"}, Level::Cluster, {}});
    for (const auto& inner : packs.packs) {
        pack.commands.insert(pack.commands.end(), inner.commands.begin(), inner.commands.end());
    }
    pack.commands.push_back(RawCommand{{"EXEC"}, Level::Cluster, {}});
    return pack;
}

const std::vector<RespValue>& unwrap_transaction(ReplyCursor& cursor, std::size_t queued) {
    const auto& multi = cursor.next();
    if (multi.is_error()) {
        throw ErrorReplyException(multi.str);
    }

    // a command rejected while queueing makes EXEC fail with EXECABORT. report the cause instead
    std::optional<std::string> queue_error;
    for (std::size_t i = 0; i < queued; ++i) {
        const auto& reply = cursor.next();
        if (reply.is_error() && !queue_error) {
            queue_error = reply.str;
        }
    }

    const auto& exec = cursor.next();
    if (exec.is_nil()) {
        throw OptimisticLockException();
    }
    if (exec.is_error()) {
        throw ErrorReplyException(queue_error ? *queue_error : exec.str);
    }
    if (!exec.is_array() || exec.elements.size() != queued) {
        throw UnexpectedReplyException("unexpected EXEC reply: " + exec.to_string());
    }
    return exec.elements;
}

}  // namespace detail

}  // namespace rediskit::core
