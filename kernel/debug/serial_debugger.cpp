#include "debug/serial_debugger.hpp"
#include "core/io.hpp"

namespace strata::debug {

void SerialDebugger::put(char c) {
    while ((port_read8(COM1_PORT + REG_LINE_STATUS) & STATUS_THR_EMPTY) == 0) {
    }
    port_write8(COM1_PORT + REG_DATA, static_cast<u8>(c));
}

void SerialDebugger::init(u16 divisor) {
    port_write8(COM1_PORT + REG_INTERRUPT_ENABLE, 0x00);
    port_write8(COM1_PORT + REG_LINE_CONTROL, LINE_DLAB);
    port_write8(COM1_PORT + REG_DATA, static_cast<u8>(divisor & 0xFF));
    port_write8(COM1_PORT + REG_INTERRUPT_ENABLE, static_cast<u8>(divisor >> 8));
    port_write8(COM1_PORT + REG_LINE_CONTROL, LINE_8N1);
    port_write8(COM1_PORT + REG_FIFO_CONTROL, 0xC7);    // enable and clear, 14-byte threshold
    port_write8(COM1_PORT + REG_MODEM_CONTROL, 0x03);   // DTR and RTS, no IRQs
}

void SerialDebugger::write(const char* text) {
    if (!text) return;
    for (; *text; ++text) {
        if (*text == '\n') {
            put('\r');
        }
        put(*text);
    }
}

void SerialDebugger::console_sink(const char* text, u16) {
    write(text);
}

} // namespace strata::debug
