#include "rediskit/util/signal_handler.hpp"

#include <csignal>

namespace rediskit::util {

std::atomic<bool> SignalHandler::shutdown_requested_{false};

namespace {

void signal_handler(int signal) {
    (void)signal;
    SignalHandler::request_shutdown();
}

} //namespace

void SignalHandler::install() {
    // no SA_RESTART: a blocked read on stdin returns EINTR so the loop can observe the flag
    struct sigaction action{};
    action.sa_handler = signal_handler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
    std::signal(SIGPIPE, SIG_IGN);
}

bool SignalHandler::should_shutdown() {
    return shutdown_requested_.load();
}

void SignalHandler::request_shutdown() {
    // lock-free atomic store is async-signal-safe
    shutdown_requested_.store(true);
}

void SignalHandler::reset() {
    shutdown_requested_.store(false);
}

} //namespace rediskit::util
