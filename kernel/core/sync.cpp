#include "core/sync.hpp"
#include "arch/cpu.hpp"

namespace strata::sync {

using namespace strata::system;

//=============================================================================
// Spinlock Implementation
//=============================================================================

void Spinlock::lock() {
    // Disable interrupts to prevent deadlock with handlers on this CPU
    u64 state = arch::interrupts_save_disable();
    
    while (arch::atomic_exchange(&m_locked, 1) != 0) {
        // Spin with interrupts restored so this CPU stays responsive
        arch::interrupts_restore(state);
        while (m_locked) {
            arch::cpu_relax();
        }
        state = arch::interrupts_save_disable();
    }
    
    m_savedState = state;
}

void Spinlock::unlock() {
    u64 state = m_savedState;
    
    // Release the lock
    arch::atomic_exchange(&m_locked, 0);
    
    arch::interrupts_restore(state);
}

bool Spinlock::try_lock() {
    u64 state = arch::interrupts_save_disable();
    
    // Return true if we acquired the lock (previous value was 0)
    if (arch::atomic_exchange(&m_locked, 1) == 0) {
        m_savedState = state;
        return true;
    }
    
    arch::interrupts_restore(state);
    return false;
}

//=============================================================================
// ReadWriteLock Implementation
//=============================================================================

void ReadWriteLock::lock_shared() {
    while (!try_lock_shared()) {
        arch::cpu_relax();
    }
}

void ReadWriteLock::unlock_shared() {
    SpinlockGuard guard(m_stateLock);
    if (m_readers > 0) {
        m_readers = m_readers - 1;
    }
}

bool ReadWriteLock::try_lock_shared() {
    SpinlockGuard guard(m_stateLock);
    
    // Readers only wait for an active writer, never for queued ones
    if (m_writer) {
        return false;
    }
    m_readers = m_readers + 1;
    return true;
}

void ReadWriteLock::lock() {
    while (!try_lock()) {
        arch::cpu_relax();
    }
}

void ReadWriteLock::unlock() {
    SpinlockGuard guard(m_stateLock);
    m_writer = 0;
}

bool ReadWriteLock::try_lock() {
    SpinlockGuard guard(m_stateLock);
    
    if (m_writer || m_readers > 0) {
        return false;
    }
    m_writer = 1;
    return true;
}

} // namespace strata::sync
