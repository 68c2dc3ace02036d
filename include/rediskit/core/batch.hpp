#ifndef REDISKIT_CORE_BATCH_HPP
#define REDISKIT_CORE_BATCH_HPP

#include <cstddef>
#include <functional>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include "rediskit/core/raw_command.hpp"
#include "rediskit/protocol/resp.hpp"

namespace rediskit::core {

using protocol::Replies;
using protocol::RespValue;

// sequential read access over the ordered replies of one batch
class ReplyCursor {
   public:
    explicit ReplyCursor(const Replies& replies, std::size_t index = 0)
        : replies_(replies), index_(index) {}

    // throws UnexpectedReplyException when no replies are left
    const RespValue& next();

    [[nodiscard]] std::size_t position() const noexcept { return index_; }
    [[nodiscard]] bool exhausted() const noexcept { return index_ >= replies_.size(); }

   private:
    const Replies& replies_;
    std::size_t index_;
};

namespace detail {

RawCommandPack wrap_in_transaction(const RawCommandPacks& packs);

// consumes MULTI and QUEUED replies, returns EXEC's reply array (throws on abort)
const std::vector<RespValue>& unwrap_transaction(ReplyCursor& cursor, std::size_t queued);

}  // namespace detail

/*
    ordered group of commands sent together in one write, plus the function turning their replies
    into a single value. batches are immutable values; combinators build new ones.
*/
template <typename T>
class Batch {
   public:
    using value_type = T;
    using Decoder = std::function<T(ReplyCursor&)>;

    Batch(RawCommandPacks packs, Decoder decoder, bool transactional = false)
        : packs_(std::move(packs)), decoder_(std::move(decoder)), transactional_(transactional) {}

    [[nodiscard]] const RawCommandPacks& packs() const noexcept { return packs_; }
    [[nodiscard]] bool transactional() const noexcept { return transactional_; }

    T decode(ReplyCursor& cursor) const { return decoder_(cursor); }

    T decode_replies(const Replies& replies) const {
        ReplyCursor cursor(replies);
        return decoder_(cursor);
    }

    template <typename F>
    auto map(F f) const -> Batch<std::invoke_result_t<F, T>> {
        using U = std::invoke_result_t<F, T>;
        auto decoder = decoder_;
        return Batch<U>(packs_, [decoder, f](ReplyCursor& cursor) -> U { return f(decoder(cursor)); },
                        transactional_);
    }

    // always wrapped in MULTI/EXEC
    Batch transaction() const {
        if (transactional_) {
            return *this;
        }
        RawCommandPacks wrapped;
        wrapped.packs.push_back(detail::wrap_in_transaction(packs_));
        auto queued = packs_.reply_count();
        auto decoder = decoder_;
        return Batch(std::move(wrapped),
                     [decoder, queued](ReplyCursor& cursor) -> T {
                         const auto& results = detail::unwrap_transaction(cursor, queued);
                         ReplyCursor inner(results);
                         return decoder(inner);
                     },
                     true);
    }

    // a single command is atomic by itself, only groups need MULTI/EXEC
    Batch atomic() const {
        if (packs_.reply_count() <= 1) {
            return *this;
        }
        return transaction();
    }

   private:
    RawCommandPacks packs_;
    Decoder decoder_;
    bool transactional_ = false;
};

// braced initialization evaluates the decoders left to right, matching the reply order
template <typename... Ts>
Batch<std::tuple<Ts...>> sequence(const Batch<Ts>&... batches) {
    RawCommandPacks packs;
    (packs.append(batches.packs()), ...);
    return Batch<std::tuple<Ts...>>(std::move(packs), [batches...](ReplyCursor& cursor) {
        return std::tuple<Ts...>{batches.decode(cursor)...};
    });
}

template <typename T>
Batch<std::vector<T>> sequence(const std::vector<Batch<T>>& batches) {
    RawCommandPacks packs;
    for (const auto& batch : batches) {
        packs.append(batch.packs());
    }
    return Batch<std::vector<T>>(std::move(packs), [batches](ReplyCursor& cursor) {
        std::vector<T> results;
        results.reserve(batches.size());
        for (const auto& batch : batches) {
            results.push_back(batch.decode(cursor));
        }
        return results;
    });
}

}  // namespace rediskit::core

#endif
