#include "arch/cpu.hpp"
#include "debug/serial_debugger.hpp"
#include "display/console_sink.hpp"

namespace strata::arch {

constexpr u64 RFLAGS_IF = 1ULL << 9;

u64 interrupts_save_disable() {
    u64 flags;
    asm volatile("pushfq; popq %0; cli" : "=r"(flags) : : "memory");
    return flags;
}

void interrupts_restore(u64 state) {
    if (state & RFLAGS_IF) {
        asm volatile("sti" : : : "memory");
    }
}

void cpu_relax() {
    asm volatile("pause" : : : "memory");
}

u32 atomic_exchange(volatile u32* target, u32 value) {
    asm volatile(
        "xchgl %0, %1"
        : "+r"(value), "+m"(*target)
        :
        : "memory"
    );
    return value;
}

void flush_tlb_single(uintptr_t virtualAddr) {
    asm volatile("invlpg (%0)" : : "r"(virtualAddr) : "memory");
}

void early_console_init() {
    strata::debug::SerialDebugger::init();
    strata::display::set_console_sink(strata::debug::SerialDebugger::console_sink);
}

} // namespace strata::arch
