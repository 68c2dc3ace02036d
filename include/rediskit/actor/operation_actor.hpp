#ifndef REDISKIT_ACTOR_OPERATION_ACTOR_HPP
#define REDISKIT_ACTOR_OPERATION_ACTOR_HPP

#include <exception>
#include <functional>
#include <memory>
#include <string>

#include "rediskit/actor/actor.hpp"
#include "rediskit/actor/connection_actor.hpp"
#include "rediskit/core/operation.hpp"
#include "rediskit/core/raw_command.hpp"

namespace rediskit::actor {

/*
    drives one operation, step by step, over one connection held under a reservation for the whole
    chain. one instance per operation: a second run() is rejected.

    the listener is invoked exactly once: null on success (the step chain filled its result slot),
    the failure otherwise. the reservation is released right after.
*/
class OperationActor : public Actor {
   public:
    using Listener = std::function<void(std::exception_ptr)>;

    static std::shared_ptr<OperationActor> create(ActorSystem& system,
                                                  std::shared_ptr<ConnectionActor> connection,
                                                  core::Level min_level, std::string client_type);
    ~OperationActor() override;

    void run(std::unique_ptr<core::OpStep> first, Listener listener);

    // fails the operation with OperationAbortedException unless it already finished
    void abort();

   private:
    OperationActor(ActorSystem& system, std::shared_ptr<ConnectionActor> connection,
                   core::Level min_level, std::string client_type);

    void handle_run(std::unique_ptr<core::OpStep> first, Listener listener);
    void handle_step(uint64_t step, BatchOutcome outcome);
    void issue(std::unique_ptr<core::OpStep> step);
    void respond(std::exception_ptr error);

    std::shared_ptr<ConnectionActor> connection_;
    const core::Level min_level_;
    const std::string client_type_;
    const ReservationId reservation_;

    bool started_ = false;
    bool responded_ = false;
    Listener listener_;
    std::unique_ptr<core::OpStep> current_;
    uint64_t step_ = 0;
    uint64_t watch_id_ = 0;
};

}  // namespace rediskit::actor

#endif
