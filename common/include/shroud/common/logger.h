#pragma once

#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace shroud {

enum LogLevel {
    LOG_LEVEL_TRACE = SPDLOG_LEVEL_TRACE,
    LOG_LEVEL_DEBUG = SPDLOG_LEVEL_DEBUG,
    LOG_LEVEL_INFO = SPDLOG_LEVEL_INFO,
    LOG_LEVEL_WARN = SPDLOG_LEVEL_WARN,
    LOG_LEVEL_ERROR = SPDLOG_LEVEL_ERROR,
};

using LoggerCallback = std::function<void(LogLevel level, std::string_view message)>;

/**
 * Named logger. Every instance with the same name shares one spdlog logger.
 * Query names and payloads must never be passed to it.
 */
class Logger {
public:
    explicit Logger(const std::string &name);

    spdlog::logger *operator->() const {
        return m_logger.get();
    }

    [[nodiscard]] bool is_enabled(LogLevel level) const {
        return m_logger->should_log((spdlog::level::level_enum) level);
    }

private:
    std::shared_ptr<spdlog::logger> m_logger;
};

/**
 * Set a program-wide logging level
 * @param level desired logging level
 */
void set_default_log_level(LogLevel level);

/**
 * @return the program-wide logging level
 */
LogLevel get_default_log_level();

/**
 * Set the function that outputs a log message
 * @param cb callback, nullptr restores the default stderr output
 */
void set_logger_callback(LoggerCallback cb);

} // namespace shroud

#define errlog(l_, fmt_, ...)                                                                                          \
    do {                                                                                                               \
        (l_)->error(FMT_STRING(fmt_), ##__VA_ARGS__);                                                                  \
    } while (0)
#define warnlog(l_, fmt_, ...)                                                                                         \
    do {                                                                                                               \
        (l_)->warn(FMT_STRING(fmt_), ##__VA_ARGS__);                                                                   \
    } while (0)
#define infolog(l_, fmt_, ...)                                                                                         \
    do {                                                                                                               \
        (l_)->info(FMT_STRING(fmt_), ##__VA_ARGS__);                                                                   \
    } while (0)
#define dbglog(l_, fmt_, ...)                                                                                          \
    do {                                                                                                               \
        if ((l_)->should_log(spdlog::level::debug))                                                                    \
            (l_)->debug(FMT_STRING(fmt_), ##__VA_ARGS__);                                                              \
    } while (0)
#define tracelog(l_, fmt_, ...)                                                                                        \
    do {                                                                                                               \
        if ((l_)->should_log(spdlog::level::trace))                                                                    \
            (l_)->trace(FMT_STRING(fmt_), ##__VA_ARGS__);                                                              \
    } while (0)
