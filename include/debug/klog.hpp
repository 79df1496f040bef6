#pragma once

#include "core/types.hpp"

// Compile-time floor: messages above this level are compiled out
// (0 = none, 1 = error, 2 = warn, 3 = info, 4 = debug, 5 = trace)
#ifndef STRATA_LOG_LEVEL
#define STRATA_LOG_LEVEL 5
#endif

namespace strata::debug {

using namespace strata::system;

enum class LogLevel : u8 {
    NONE = 0,
    ERROR = 1,
    WARN = 2,
    INFO = 3,
    DEBUG = 4,
    TRACE = 5
};

/**
 * @brief Set the runtime log level; messages above it are dropped
 */
void set_log_level(LogLevel level);

LogLevel get_log_level();

/**
 * @brief Emit one log line as "[LEVEL] tag: message\n" through k_printf
 * @param level Severity of the message
 * @param tag Subsystem name
 * @param format printf-style format string
 */
void log_message(LogLevel level, const char* tag, const char* format, ...) __attribute__((format(printf, 3, 4)));

} // namespace strata::debug

#if STRATA_LOG_LEVEL >= 1
#define LOG_ERROR(tag, format, ...) \
    strata::debug::log_message(strata::debug::LogLevel::ERROR, tag, format, ##__VA_ARGS__)
#else
#define LOG_ERROR(tag, format, ...) do {} while (0)
#endif

#if STRATA_LOG_LEVEL >= 2
#define LOG_WARN(tag, format, ...) \
    strata::debug::log_message(strata::debug::LogLevel::WARN, tag, format, ##__VA_ARGS__)
#else
#define LOG_WARN(tag, format, ...) do {} while (0)
#endif

#if STRATA_LOG_LEVEL >= 3
#define LOG_INFO(tag, format, ...) \
    strata::debug::log_message(strata::debug::LogLevel::INFO, tag, format, ##__VA_ARGS__)
#else
#define LOG_INFO(tag, format, ...) do {} while (0)
#endif

#if STRATA_LOG_LEVEL >= 4
#define LOG_DEBUG(tag, format, ...) \
    strata::debug::log_message(strata::debug::LogLevel::DEBUG, tag, format, ##__VA_ARGS__)
#else
#define LOG_DEBUG(tag, format, ...) do {} while (0)
#endif

#if STRATA_LOG_LEVEL >= 5
#define LOG_TRACE(tag, format, ...) \
    strata::debug::log_message(strata::debug::LogLevel::TRACE, tag, format, ##__VA_ARGS__)
#else
#define LOG_TRACE(tag, format, ...) do {} while (0)
#endif
