#pragma once

#include "core/types.hpp"

namespace strata::debug {

using namespace strata::system;

/**
 * @brief Polled 16550 UART used as the console sink on the x86_64 port
 *
 * The loader logs through k_printf long before the embedding kernel has a
 * terminal of its own, so the port writes straight to COM1 until another
 * sink is registered with set_console_sink().
 */
class SerialDebugger {
public:
    static constexpr u16 COM1_PORT = 0x3F8;
    static constexpr u16 DEFAULT_DIVISOR = 3;    // 38400 baud

    /**
     * @brief Program the UART for 8N1 at 115200 / divisor baud
     */
    static void init(u16 divisor = DEFAULT_DIVISOR);

    static void write(const char* text);

    // Matches ConsoleSinkFn; serial output has no colors
    static void console_sink(const char* text, u16 color);

private:
    static constexpr u16 REG_DATA = 0;
    static constexpr u16 REG_INTERRUPT_ENABLE = 1;
    static constexpr u16 REG_FIFO_CONTROL = 2;
    static constexpr u16 REG_LINE_CONTROL = 3;
    static constexpr u16 REG_MODEM_CONTROL = 4;
    static constexpr u16 REG_LINE_STATUS = 5;

    static constexpr u8 LINE_DLAB = 0x80;
    static constexpr u8 LINE_8N1 = 0x03;
    static constexpr u8 STATUS_THR_EMPTY = 0x20;

    static void put(char c);
};

} // namespace strata::debug
