#pragma once

#include "core/types.hpp"

namespace strata::display {

using namespace strata::system;

// Console color attributes (VGA text mode encoding, foreground on blue)
constexpr u16 VGA_WHITE_ON_BLUE = 0x1F00;
constexpr u16 VGA_YELLOW_ON_BLUE = 0x1E00;
constexpr u16 VGA_GREEN_ON_BLUE = 0x1A00;
constexpr u16 VGA_RED_ON_BLUE = 0x1C00;
constexpr u16 VGA_CYAN_ON_BLUE = 0x1B00;
constexpr u16 VGA_MAGENTA_ON_BLUE = 0x1D00;
constexpr u16 VGA_LIGHT_GRAY_ON_BLUE = 0x1700;

/**
 * @brief Output function receiving fully formatted k_printf text
 * @param text Null-terminated text (may contain newlines)
 * @param color Color attribute requested by the caller
 */
using ConsoleSink = void (*)(const char* text, u16 color);

/**
 * @brief Register the console that k_printf writes to
 * @param sink Output function, or nullptr to discard output
 */
void set_console_sink(ConsoleSink sink);

/**
 * @brief Get the currently registered console sink
 */
ConsoleSink get_console_sink();

} // namespace strata::display
