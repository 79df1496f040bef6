#pragma once

#include "core/types.hpp"

/**
 * @brief Architecture hooks used by the portable kernel code
 * 
 * One implementation exists per port: kernel/arch/x86_64 for the real
 * kernel and kernel/arch/hosted for running the kernel library inside a
 * host process (test builds).
 */
namespace strata::arch {

using namespace strata::system;

/**
 * @brief Disable interrupts on the local CPU
 * @return Opaque interrupt state to pass to interrupts_restore()
 */
u64 interrupts_save_disable();

/**
 * @brief Restore the interrupt state saved by interrupts_save_disable()
 */
void interrupts_restore(u64 state);

/**
 * @brief Spin-wait hint for busy loops
 */
void cpu_relax();

/**
 * @brief Atomically store value into target
 * @return Previous value of target
 */
u32 atomic_exchange(volatile u32* target, u32 value);

/**
 * @brief Invalidate the TLB entry for one virtual page
 */
void flush_tlb_single(uintptr_t virtualAddr);

/**
 * @brief Register the port's early console as the k_printf sink
 */
void early_console_init();

} // namespace strata::arch
