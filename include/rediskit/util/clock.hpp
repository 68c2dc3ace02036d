#ifndef REDISKIT_UTIL_CLOCK_HPP
#define REDISKIT_UTIL_CLOCK_HPP

#include <chrono>
#include <memory>
#include <mutex>

#include "rediskit/util/types.hpp"

namespace rediskit::util {

class Clock {
public:
    virtual ~Clock() = default;
    [[nodiscard]] virtual TimePoint now() const = 0;
};

class SystemClock : public Clock {
public:
    [[nodiscard]] TimePoint now() const override {
        return std::chrono::steady_clock::now();
    }
};

// read from actor threads while the test thread advances it
class MockClock : public Clock {
public:
    [[nodiscard]] TimePoint now() const override {
        std::lock_guard lock(mutex_);
        return current_;
    }

    void set(TimePoint time) {
        std::lock_guard lock(mutex_);
        current_ = time;
    }

    void advance(Duration duration) {
        std::lock_guard lock(mutex_);
        current_ += duration;
    }

private:
    mutable std::mutex mutex_;
    TimePoint current_ = std::chrono::steady_clock::now();
};

std::shared_ptr<Clock> system_clock();

}//namespace rediskit::util

#endif
