#include "rediskit/actor/actor.hpp"

#include <exception>

#include "rediskit/util/logger.hpp"

namespace rediskit::actor {

void Actor::tell(std::function<void()> message) {
    {
        std::lock_guard lock(mutex_);
        mailbox_.push_back(std::move(message));
        if (scheduled_) {
            return;
        }
        scheduled_ = true;
    }
    auto self = shared_from_this();
    system_.dispatch([self] { self->drain(); });
}

void Actor::drain() {
    for (int processed = 0; processed < kThroughput; ++processed) {
        std::function<void()> message;
        {
            std::lock_guard lock(mutex_);
            if (mailbox_.empty()) {
                scheduled_ = false;
                return;
            }
            message = std::move(mailbox_.front());
            mailbox_.pop_front();
        }
        try {
            message();
        } catch (const std::exception& e) {
            LOG_ERROR(name_ + ": message handler failed: " + e.what());
        }
    }

    // more messages left: go to the back of the pool queue
    {
        std::lock_guard lock(mutex_);
        if (mailbox_.empty()) {
            scheduled_ = false;
            return;
        }
    }
    auto self = shared_from_this();
    system_.dispatch([self] { self->drain(); });
}

}  // namespace rediskit::actor
