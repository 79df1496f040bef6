#include "arch/cpu.hpp"
#include "display/console_sink.hpp"

#include <cstdio>

namespace strata::arch {

using namespace strata::display;

// Host processes cannot mask interrupts; the state is only round-tripped
u64 interrupts_save_disable() {
    return 0;
}

void interrupts_restore(u64) {
}

void cpu_relax() {
#if defined(__x86_64__) || defined(__i386__)
    asm volatile("pause" ::: "memory");
#else
    asm volatile("" ::: "memory");
#endif
}

u32 atomic_exchange(volatile u32* target, u32 value) {
    return __atomic_exchange_n(target, value, __ATOMIC_ACQ_REL);
}

void flush_tlb_single(uintptr_t) {
}

//=============================================================================
// Host stdout console
//=============================================================================

static const char* ansi_color(u16 color) {
    switch (color) {
        case VGA_RED_ON_BLUE:    return "\033[31m";
        case VGA_GREEN_ON_BLUE:  return "\033[32m";
        case VGA_YELLOW_ON_BLUE: return "\033[33m";
        case VGA_CYAN_ON_BLUE:   return "\033[36m";
        case VGA_MAGENTA_ON_BLUE: return "\033[35m";
        default:                 return nullptr;
    }
}

static void stdout_sink(const char* text, u16 color) {
    const char* escape = ansi_color(color);
    if (escape) {
        std::fputs(escape, stdout);
    }
    std::fputs(text, stdout);
    if (escape) {
        std::fputs("\033[0m", stdout);
    }
    std::fflush(stdout);
}

void early_console_init() {
    set_console_sink(stdout_sink);
}

} // namespace strata::arch
