#ifndef REDISKIT_CLIENT_EXECUTOR_HPP
#define REDISKIT_CLIENT_EXECUTOR_HPP

#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>

#include "rediskit/actor/actor_system.hpp"
#include "rediskit/actor/completion.hpp"
#include "rediskit/actor/connection_actor.hpp"
#include "rediskit/actor/operation_actor.hpp"
#include "rediskit/core/batch.hpp"
#include "rediskit/core/errors.hpp"
#include "rediskit/core/op_result.hpp"
#include "rediskit/core/operation.hpp"
#include "rediskit/util/logger.hpp"
#include "rediskit/util/types.hpp"

namespace rediskit::client {

/*
    common surface of the three clients: typed batches and operations in, futures out.
    every returned future completes exactly once, with the decoded value or with the failure
    (TimeoutException when the deadline passes first; the reply arriving later is discarded).
    a non-positive timeout waits forever.
*/
class RedisExecutor {
   public:
    using AbortHandle = std::function<void()>;

    explicit RedisExecutor(actor::ActorSystem& system) : system_(system) {}
    virtual ~RedisExecutor() = default;

    RedisExecutor(const RedisExecutor&) = delete;
    RedisExecutor& operator=(const RedisExecutor&) = delete;

    template <typename T>
    std::future<T> execute_batch(const core::Batch<T>& batch, util::Duration timeout) {
        auto completion = std::make_shared<actor::Completion<T>>();
        auto future = completion->future();
        try {
            batch.packs().require_level(batch_level(), client_type());
        } catch (const core::ForbiddenCommandException&) {
            completion->fail(std::current_exception());
            return future;
        }

        actor::Completion<T>::arm(completion, system_.scheduler(), timeout,
                                  "batch " + describe(batch.packs()));
        execute_raw(batch.packs(), [completion, batch](actor::BatchOutcome outcome) {
            if (completion->done()) {
                LOG_DEBUG("discarding late reply of batch " + describe(batch.packs()));
                return;
            }
            if (!outcome.ok()) {
                completion->fail(outcome.failure);
                return;
            }
            try {
                completion->succeed(batch.decode_replies(outcome.replies));
            } catch (const std::exception&) {
                completion->fail(std::current_exception());
            }
        });
        return future;
    }

    template <typename T>
    std::future<T> execute_op(const core::RedisOp<T>& op, util::Duration timeout) {
        auto completion = std::make_shared<actor::Completion<T>>();
        auto future = completion->future();
        auto result = std::make_shared<std::optional<T>>();
        auto what = "operation " + describe(op.packs());

        auto abort = run_op(std::make_unique<core::TypedOpStep<T>>(op, result),
                            [completion, result, what](std::exception_ptr error) {
                                if (completion->done()) {
                                    LOG_DEBUG("discarding late result of " + what);
                                    return;
                                }
                                if (error) {
                                    completion->complete(core::OpResult<T>::failure(error));
                                } else if (!result->has_value()) {
                                    completion->fail(std::make_exception_ptr(
                                        core::UnexpectedReplyException(what + " produced no result")));
                                } else {
                                    completion->complete(
                                        core::OpResult<T>::success(std::move(**result)));
                                }
                            });
        actor::Completion<T>::arm(completion, system_.scheduler(), timeout, what, abort);
        return future;
    }

   protected:
    // replies of every command in order, or the failure. callback runs on an actor thread
    virtual void execute_raw(core::RawCommandPacks packs, actor::BatchCallback callback) = 0;

    // starts the step chain; the returned handle aborts it
    virtual AbortHandle run_op(std::unique_ptr<core::OpStep> first,
                               actor::OperationActor::Listener listener) = 0;

    // lowest command level a plain batch may contain on this client
    [[nodiscard]] virtual core::Level batch_level() const = 0;
    [[nodiscard]] virtual std::string client_type() const = 0;

    static std::string describe(const core::RawCommandPacks& packs) {
        if (packs.empty() || packs.packs.front().commands.empty()) {
            return "(empty)";
        }
        std::string name = packs.packs.front().commands.front().name();
        if (packs.reply_count() > 1) {
            name += " (+" + std::to_string(packs.reply_count() - 1) + ")";
        }
        return name;
    }

    actor::ActorSystem& system_;
};

}  // namespace rediskit::client

#endif
