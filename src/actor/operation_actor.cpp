#include "rediskit/actor/operation_actor.hpp"

#include <stdexcept>
#include <utility>

#include "rediskit/core/errors.hpp"
#include "rediskit/util/logger.hpp"

namespace rediskit::actor {

std::shared_ptr<OperationActor> OperationActor::create(ActorSystem& system,
                                                       std::shared_ptr<ConnectionActor> connection,
                                                       core::Level min_level,
                                                       std::string client_type) {
    return std::shared_ptr<OperationActor>(
        new OperationActor(system, std::move(connection), min_level, std::move(client_type)));
}

OperationActor::OperationActor(ActorSystem& system, std::shared_ptr<ConnectionActor> connection,
                               core::Level min_level, std::string client_type)
    : Actor(system, "operation-" + connection->address().to_string()),
      connection_(std::move(connection)),
      min_level_(min_level),
      client_type_(std::move(client_type)),
      reservation_(ConnectionActor::new_reservation_id()) {}

OperationActor::~OperationActor() {
    if (started_ && !responded_) {
        respond(std::make_exception_ptr(core::OperationAbortedException()));
    }
}

void OperationActor::run(std::unique_ptr<core::OpStep> first, Listener listener) {
    auto self = this->self<OperationActor>();
    // the step is moved through a shared_ptr: std::function needs a copyable closure
    auto step = std::make_shared<std::unique_ptr<core::OpStep>>(std::move(first));
    tell([self, step, listener = std::move(listener)]() mutable {
        self->handle_run(std::move(*step), std::move(listener));
    });
}

void OperationActor::abort() {
    auto self = this->self<OperationActor>();
    tell([self] {
        if (!self->responded_) {
            LOG_WARN(self->name() + ": aborting");
            self->respond(std::make_exception_ptr(core::OperationAbortedException()));
        }
    });
}

void OperationActor::handle_run(std::unique_ptr<core::OpStep> first, Listener listener) {
    if (started_) {
        LOG_ERROR(name() + ": operation already running, rejecting another one");
        listener(std::make_exception_ptr(
            std::logic_error("operation actor accepts exactly one operation")));
        return;
    }
    started_ = true;
    if (responded_) {
        // aborted before it started
        listener(std::make_exception_ptr(core::OperationAbortedException()));
        return;
    }
    listener_ = std::move(listener);

    std::weak_ptr<OperationActor> weak = weak_self<OperationActor>();
    watch_id_ = connection_->watch([weak] {
        if (auto self = weak.lock()) {
            self->tell([self] {
                if (!self->responded_) {
                    self->respond(std::make_exception_ptr(core::OperationAbortedException()));
                }
            });
        }
    });
    issue(std::move(first));
}

void OperationActor::issue(std::unique_ptr<core::OpStep> step) {
    try {
        step->packs().require_level(min_level_, client_type_);
    } catch (const core::ForbiddenCommandException&) {
        respond(std::current_exception());
        return;
    }

    uint64_t id = ++step_;
    current_ = std::move(step);
    auto self = this->self<OperationActor>();
    auto callback = [self, id](BatchOutcome outcome) {
        self->tell([self, id, outcome = std::move(outcome)]() mutable {
            self->handle_step(id, std::move(outcome));
        });
    };
    // the first step claims the connection, the following ones run under the claim
    if (id == 1) {
        connection_->reserving(current_->packs(), reservation_, std::move(callback));
    } else {
        connection_->execute(current_->packs(), std::move(callback), reservation_);
    }
}

void OperationActor::handle_step(uint64_t step, BatchOutcome outcome) {
    if (responded_ || step != step_) {
        LOG_DEBUG(name() + ": discarding reply of finished step");
        return;
    }
    if (!outcome.ok()) {
        respond(outcome.failure);
        return;
    }
    std::unique_ptr<core::OpStep> next;
    try {
        next = current_->advance(outcome.replies);
    } catch (const std::exception&) {
        respond(std::current_exception());
        return;
    }
    if (!next) {
        respond(nullptr);
        return;
    }
    issue(std::move(next));
}

void OperationActor::respond(std::exception_ptr error) {
    if (responded_) {
        LOG_ERROR(name() + ": operation responded more than once");
        return;
    }
    responded_ = true;
    LOG_DEBUG(name() + (error ? ": operation failed" : ": operation succeeded") + " after " +
              std::to_string(step_) + " steps");
    connection_->release(reservation_);
    if (watch_id_ != 0) {
        connection_->unwatch(watch_id_);
    }
    current_.reset();

    if (!listener_) {
        return;
    }
    auto listener = std::move(listener_);
    listener_ = nullptr;
    try {
        listener(std::move(error));
    } catch (const std::exception& e) {
        LOG_ERROR(name() + ": operation listener failed: " + e.what());
    }
}

}  // namespace rediskit::actor
