#ifndef REDISKIT_ACTOR_ACTOR_HPP
#define REDISKIT_ACTOR_ACTOR_HPP

#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "rediskit/actor/actor_system.hpp"

namespace rediskit::actor {

/*
    mailbox bound to the system's worker pool. messages are closures run one at a time, in the order
    they were told, never concurrently with each other - actor state needs no locks as long as it is
    only touched from message handlers.
    actors are always owned by shared_ptr: every queued message keeps its actor alive.
*/
class Actor : public std::enable_shared_from_this<Actor> {
   public:
    Actor(ActorSystem& system, std::string name) : system_(system), name_(std::move(name)) {}
    virtual ~Actor() = default;

    Actor(const Actor&) = delete;
    Actor& operator=(const Actor&) = delete;

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

   protected:
    void tell(std::function<void()> message);

    template <typename Derived>
    std::shared_ptr<Derived> self() {
        return std::static_pointer_cast<Derived>(shared_from_this());
    }

    template <typename Derived>
    std::weak_ptr<Derived> weak_self() {
        return std::static_pointer_cast<Derived>(shared_from_this());
    }

    ActorSystem& system_;

   private:
    // messages handled per dispatch before yielding the worker to other actors
    static constexpr int kThroughput = 32;

    void drain();

    std::string name_;
    std::mutex mutex_;
    std::deque<std::function<void()>> mailbox_;
    bool scheduled_ = false;
};

}  // namespace rediskit::actor

#endif
