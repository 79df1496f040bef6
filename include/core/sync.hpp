#pragma once

#include "core/types.hpp"

namespace strata::sync {

using namespace strata::system;

/**
 * @brief Simple spinlock for short critical sections
 * Disables local interrupts while held and restores the previous
 * interrupt state on release, so spinlocks may nest.
 */
class Spinlock {
private:
    volatile u32 m_locked;  // 0 = unlocked, 1 = locked
    u64 m_savedState;       // Interrupt state of the holder

public:
    Spinlock() : m_locked(0), m_savedState(0) {}
    
    /**
     * @brief Acquire the spinlock (busy wait)
     */
    void lock();
    
    /**
     * @brief Release the spinlock
     */
    void unlock();
    
    /**
     * @brief Try to acquire lock without blocking
     * @return true if lock acquired, false otherwise
     */
    bool try_lock();
    
    bool is_locked() const { return m_locked != 0; }
    
    // Prevent copying
    Spinlock(const Spinlock&) = delete;
    Spinlock& operator=(const Spinlock&) = delete;
};

/**
 * @brief Reader-preferring shared/exclusive lock
 * 
 * Any number of readers may hold the lock at once. A reader is admitted
 * whenever no writer holds the lock, even while writers are waiting, so
 * lookups never queue behind a pending commit.
 */
class ReadWriteLock {
private:
    Spinlock m_stateLock;       // Protects the two counters below
    volatile u32 m_readers;     // Number of shared holders
    volatile u32 m_writer;      // 1 while an exclusive holder exists

public:
    ReadWriteLock() : m_readers(0), m_writer(0) {}
    
    /**
     * @brief Acquire shared (read) access
     */
    void lock_shared();
    
    /**
     * @brief Release shared (read) access
     */
    void unlock_shared();
    
    /**
     * @brief Try to acquire shared access without blocking
     */
    bool try_lock_shared();
    
    /**
     * @brief Acquire exclusive (write) access
     */
    void lock();
    
    /**
     * @brief Release exclusive (write) access
     */
    void unlock();
    
    /**
     * @brief Try to acquire exclusive access without blocking
     */
    bool try_lock();
    
    u32 reader_count() const { return m_readers; }
    bool is_write_locked() const { return m_writer != 0; }
    
    // Prevent copying
    ReadWriteLock(const ReadWriteLock&) = delete;
    ReadWriteLock& operator=(const ReadWriteLock&) = delete;
};

/**
 * @brief RAII lock guard for automatic lock management
 */
template<typename LockType>
class LockGuard {
private:
    LockType& m_lock;

public:
    explicit LockGuard(LockType& lock) : m_lock(lock) {
        m_lock.lock();
    }
    
    ~LockGuard() {
        m_lock.unlock();
    }
    
    // Prevent copying
    LockGuard(const LockGuard&) = delete;
    LockGuard& operator=(const LockGuard&) = delete;
};

/**
 * @brief RAII guard holding shared access to a ReadWriteLock
 */
template<typename LockType>
class SharedLockGuard {
private:
    LockType& m_lock;

public:
    explicit SharedLockGuard(LockType& lock) : m_lock(lock) {
        m_lock.lock_shared();
    }
    
    ~SharedLockGuard() {
        m_lock.unlock_shared();
    }
    
    // Prevent copying
    SharedLockGuard(const SharedLockGuard&) = delete;
    SharedLockGuard& operator=(const SharedLockGuard&) = delete;
};

// Convenience typedefs
using SpinlockGuard = LockGuard<Spinlock>;
using WriteGuard = LockGuard<ReadWriteLock>;
using ReadGuard = SharedLockGuard<ReadWriteLock>;

} // namespace strata::sync
