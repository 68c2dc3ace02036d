#ifndef REDISKIT_UTIL_SIGNAL_HANDLER_HPP
#define REDISKIT_UTIL_SIGNAL_HANDLER_HPP

#include <atomic>

namespace rediskit::util {

// SIGINT/SIGTERM -> shutdown flag, polled by the cli read loop
class SignalHandler {
public:
    static void install();
    static bool should_shutdown();
    static void request_shutdown();
    static void reset();

private:
    static std::atomic<bool> shutdown_requested_;
};

} //namespace rediskit::util

#endif
