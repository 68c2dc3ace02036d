#include "rediskit/util/clock.hpp"

namespace rediskit::util {

std::shared_ptr<Clock> system_clock() {
    static std::shared_ptr<Clock> clock = std::make_shared<SystemClock>();
    return clock;
}

}  // namespace rediskit::util
