#ifndef REDISKIT_UTIL_LOGGER_HPP
#define REDISKIT_UTIL_LOGGER_HPP

#include <atomic>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>

namespace rediskit::util {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    None = 4
};

class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level);
    [[nodiscard]] LogLevel level() const;
    [[nodiscard]] bool enabled(LogLevel level) const;

    void debug(std::string_view message);
    void info(std::string_view message);
    void warn(std::string_view message);
    void error(std::string_view message);

    void log(LogLevel level, std::string_view message);

private:
    Logger() = default;

    [[nodiscard]] std::string timestamp() const;
    [[nodiscard]] std::string_view level_string(LogLevel level) const;

    std::atomic<LogLevel> level_{LogLevel::Info};
    std::mutex mutex_;
};

LogLevel parse_log_level(const std::string& s);

//convenience macros. message expressions are only built when the level is enabled
#define LOG_DEBUG(msg)                                                                   \
    do {                                                                                 \
        if (rediskit::util::Logger::instance().enabled(rediskit::util::LogLevel::Debug)) \
            rediskit::util::Logger::instance().debug(msg);                               \
    } while (0)
#define LOG_INFO(msg) rediskit::util::Logger::instance().info(msg)
#define LOG_WARN(msg) rediskit::util::Logger::instance().warn(msg)
#define LOG_ERROR(msg) rediskit::util::Logger::instance().error(msg)

} //namespace rediskit::util

#endif
