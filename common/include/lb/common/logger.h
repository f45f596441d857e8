#pragma once

#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace lb {

enum class LogLevel {
    LOG_LEVEL_ERROR = SPDLOG_LEVEL_ERROR,
    LOG_LEVEL_WARN = SPDLOG_LEVEL_WARN,
    LOG_LEVEL_INFO = SPDLOG_LEVEL_INFO,
    LOG_LEVEL_DEBUG = SPDLOG_LEVEL_DEBUG,
    LOG_LEVEL_TRACE = SPDLOG_LEVEL_TRACE,
};

/**
 * Named logger. All instances share the program-wide level and output callback.
 */
class Logger {
public:
    using Callback = std::function<void(LogLevel level, std::string_view message)>;

    explicit Logger(const std::string &name);

    /**
     * Set a program-wide logging level
     * @param level desired logging level
     */
    static void set_log_level(LogLevel level);

    /**
     * @return current program-wide logging level
     */
    static LogLevel get_log_level();

    /**
     * Set the function that outputs a log message.
     * @param cb output function, nullptr restores the default (stderr) output
     */
    static void set_callback(Callback cb);

    [[nodiscard]] bool is_enabled(LogLevel level) const {
        return m_logger->should_log(static_cast<spdlog::level::level_enum>(level));
    }

    template <typename... Args>
    void log(LogLevel level, fmt::format_string<Args...> format, Args &&...args) const {
        m_logger->log(static_cast<spdlog::level::level_enum>(level), format, std::forward<Args>(args)...);
    }

private:
    std::shared_ptr<spdlog::logger> m_logger;
};

} // namespace lb

#define errlog(l_, fmt_, ...) (l_).log(lb::LogLevel::LOG_LEVEL_ERROR, fmt_, ##__VA_ARGS__)
#define warnlog(l_, fmt_, ...) (l_).log(lb::LogLevel::LOG_LEVEL_WARN, fmt_, ##__VA_ARGS__)
#define infolog(l_, fmt_, ...) (l_).log(lb::LogLevel::LOG_LEVEL_INFO, fmt_, ##__VA_ARGS__)
#define dbglog(l_, fmt_, ...)                                                                                          \
    do {                                                                                                               \
        if ((l_).is_enabled(lb::LogLevel::LOG_LEVEL_DEBUG))                                                            \
            (l_).log(lb::LogLevel::LOG_LEVEL_DEBUG, fmt_, ##__VA_ARGS__);                                  \
    } while (0)
#define tracelog(l_, fmt_, ...)                                                                                        \
    do {                                                                                                               \
        if ((l_).is_enabled(lb::LogLevel::LOG_LEVEL_TRACE))                                                            \
            (l_).log(lb::LogLevel::LOG_LEVEL_TRACE, fmt_, ##__VA_ARGS__);                                  \
    } while (0)
