#pragma once

#include "core/types.hpp"

namespace strata::system {

// x86 port I/O, used only by the bare-metal serial console
inline void port_write8(u16 port, u8 value) {
    asm volatile("outb %0, %1" : : "a"(value), "Nd"(port));
}

inline u8 port_read8(u16 port) {
    u8 value;
    asm volatile("inb %1, %0" : "=a"(value) : "Nd"(port));
    return value;
}

} // namespace strata::system
