#include "rediskit/core/config.hpp"

namespace rediskit::core {

std::optional<Duration> ExponentialBackoff::retry_delay(int attempt) const {
    if (max_retries_ >= 0 && attempt >= max_retries_) {
        return std::nullopt;
    }
    // cap the shift so the multiplication cannot overflow
    int shift = std::min(attempt, 30);
    auto delay = initial_.count() * (int64_t{1} << shift);
    if (delay > max_.count() || delay < 0) {
        return max_;
    }
    return Duration(delay);
}

}  // namespace rediskit::core
