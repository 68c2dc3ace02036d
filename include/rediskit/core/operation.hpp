#ifndef REDISKIT_CORE_OPERATION_HPP
#define REDISKIT_CORE_OPERATION_HPP

#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>

#include "rediskit/core/batch.hpp"

namespace rediskit::core {

/*
    dependent chain of batches. either
        Leaf(batch)                   - terminal, its decoded value is the result
        FlatMapped(batch, next)       - the decoded value of batch picks the next operation
    used for sequences that cannot be pipelined as one batch because later commands depend on earlier
    replies (WATCH, read, then a conditional MULTI/EXEC).
*/
template <typename T>
class RedisOp {
   public:
    using value_type = T;
    // decodes this step's replies and produces the rest of the chain
    using Continuation = std::function<RedisOp<T>(ReplyCursor&)>;

    enum class Kind { Leaf, FlatMapped };

    static RedisOp leaf(const Batch<T>& batch) {
        RedisOp op;
        op.kind_ = Kind::Leaf;
        op.packs_ = batch.packs();
        op.decoder_ = [batch](ReplyCursor& cursor) { return batch.decode(cursor); };
        return op;
    }

    static RedisOp flat_mapped(RawCommandPacks packs, Continuation continuation) {
        RedisOp op;
        op.kind_ = Kind::FlatMapped;
        op.packs_ = std::move(packs);
        op.continuation_ = std::move(continuation);
        return op;
    }

    [[nodiscard]] Kind kind() const noexcept { return kind_; }
    [[nodiscard]] bool is_leaf() const noexcept { return kind_ == Kind::Leaf; }
    [[nodiscard]] const RawCommandPacks& packs() const noexcept { return packs_; }

    // Leaf only
    T finish(ReplyCursor& cursor) const { return decoder_(cursor); }
    T finish(const Replies& replies) const {
        ReplyCursor cursor(replies);
        return decoder_(cursor);
    }

    // FlatMapped only. exceptions from decoding or from user code propagate to the caller
    RedisOp next(ReplyCursor& cursor) const { return continuation_(cursor); }
    RedisOp next(const Replies& replies) const {
        ReplyCursor cursor(replies);
        return continuation_(cursor);
    }

    template <typename F>
    auto map(F f) const -> RedisOp<std::invoke_result_t<F, T>> {
        using U = std::invoke_result_t<F, T>;
        if (is_leaf()) {
            auto decoder = decoder_;
            return RedisOp<U>::leaf(
                Batch<U>(packs_, [decoder, f](ReplyCursor& cursor) { return f(decoder(cursor)); }));
        }
        auto continuation = continuation_;
        return RedisOp<U>::flat_mapped(packs_, [continuation, f](ReplyCursor& cursor) {
            return continuation(cursor).map(f);
        });
    }

   private:
    RedisOp() = default;

    Kind kind_ = Kind::Leaf;
    RawCommandPacks packs_;
    std::function<T(ReplyCursor&)> decoder_;
    Continuation continuation_;
};

template <typename T>
RedisOp<T> op(const Batch<T>& batch) {
    return RedisOp<T>::leaf(batch);
}

// batch >>= f, where f: A -> RedisOp<B>
template <typename A, typename F>
auto flat_map(const Batch<A>& batch, F f) -> std::invoke_result_t<F, A> {
    using Result = std::invoke_result_t<F, A>;
    return Result::flat_mapped(batch.packs(), [batch, f](ReplyCursor& cursor) -> Result {
        return f(batch.decode(cursor));
    });
}

// op >>= f: the continuation is attached to the terminal step of op
template <typename A, typename F>
auto flat_map(const RedisOp<A>& first, F f) -> std::invoke_result_t<F, A> {
    using Result = std::invoke_result_t<F, A>;
    if (first.is_leaf()) {
        return Result::flat_mapped(first.packs(), [first, f](ReplyCursor& cursor) -> Result {
            return f(first.finish(cursor));
        });
    }
    return Result::flat_mapped(first.packs(), [first, f](ReplyCursor& cursor) -> Result {
        return flat_map(first.next(cursor), f);
    });
}

/*
    type erased step driven by the operation interpreter. the typed result of the terminal step is
    written into a slot shared with whoever awaits it.
*/
class OpStep {
   public:
    virtual ~OpStep() = default;

    [[nodiscard]] virtual const RawCommandPacks& packs() const = 0;

    // consumes the replies of this step: next step, or nullptr once the result slot is filled
    virtual std::unique_ptr<OpStep> advance(const Replies& replies) = 0;
};

template <typename T>
class TypedOpStep : public OpStep {
   public:
    TypedOpStep(RedisOp<T> op, std::shared_ptr<std::optional<T>> result)
        : op_(std::move(op)), result_(std::move(result)) {}

    [[nodiscard]] const RawCommandPacks& packs() const override { return op_.packs(); }

    std::unique_ptr<OpStep> advance(const Replies& replies) override {
        if (op_.is_leaf()) {
            result_->emplace(op_.finish(replies));
            return nullptr;
        }
        return std::make_unique<TypedOpStep<T>>(op_.next(replies), result_);
    }

   private:
    RedisOp<T> op_;
    std::shared_ptr<std::optional<T>> result_;
};

}  // namespace rediskit::core

#endif
