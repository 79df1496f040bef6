#include "debug/klog.hpp"
#include "core/utils.hpp"
#include "display/console_sink.hpp"

namespace strata::debug {

using namespace strata::utils;
using namespace strata::display;

static volatile LogLevel gLogLevel = LogLevel::INFO;

void set_log_level(LogLevel level) {
    gLogLevel = level;
}

LogLevel get_log_level() {
    return gLogLevel;
}

static const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
        default:              return "?";
    }
}

static u16 level_color(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return VGA_RED_ON_BLUE;
        case LogLevel::WARN:  return VGA_YELLOW_ON_BLUE;
        case LogLevel::INFO:  return VGA_WHITE_ON_BLUE;
        default:              return VGA_LIGHT_GRAY_ON_BLUE;
    }
}

void log_message(LogLevel level, const char* tag, const char* format, ...) {
    if (level == LogLevel::NONE || static_cast<u8>(level) > static_cast<u8>(gLogLevel)) {
        return;
    }
    
    constexpr u32 MESSAGE_SIZE = 384;
    char message[MESSAGE_SIZE];
    
    __builtin_va_list args;
    __builtin_va_start(args, format);
    k_vsnprintf(message, MESSAGE_SIZE, format, args);
    __builtin_va_end(args);
    
    k_printf_colored(level_color(level), "[%s] %s: %s\n", level_name(level), tag ? tag : "kernel", message);
}

} // namespace strata::debug
