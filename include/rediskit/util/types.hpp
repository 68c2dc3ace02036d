#ifndef REDISKIT_UTIL_TYPES_HPP
#define REDISKIT_UTIL_TYPES_HPP

#include <chrono>
#include <cstdint>
#include <string>

namespace rediskit::util {

using TimePoint = std::chrono::steady_clock::time_point;
using Duration = std::chrono::milliseconds;

inline std::string format_duration(Duration d) {
    return std::to_string(d.count()) + "ms";
}

} //namespace rediskit::util

#endif
