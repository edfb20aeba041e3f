#pragma once
/**
 * @file shared_memory_spinlock.hpp
 * @brief Spinlock over a region of shared memory (cross-process).
 *
 * The lock state (SharedSpinLockState) lives inside a shared memory segment; this
 * module does not allocate that memory. The IPC registry and every service
 * segment embed one state in their header. Spin loops use utils::ExponentialBackoff.
 */
#include "solohub_utils_export.h"
#include "solo_platform.hpp"

#include <atomic>
#include <cstdint>
#include <string>

namespace solohub::hub
{

/**
 * @struct SharedSpinLockState
 * @brief The atomic state of a shared spin-lock residing in shared memory.
 *
 * 32 bytes. A zero-filled state is a free lock, so a freshly created
 * (zero-filled) segment needs no further initialization.
 */
struct SharedSpinLockState
{
    std::atomic<uint64_t> owner_pid{0};
    std::atomic<uint64_t> owner_tid{0};
    std::atomic<uint64_t> generation{0};
    std::atomic<uint32_t> recursion_count{0};
    uint8_t padding[4];
};

static_assert(sizeof(SharedSpinLockState) == 32, "SharedSpinLockState layout is shared between processes");
static_assert(std::atomic<uint64_t>::is_always_lock_free, "shared memory atomics must be lock-free");

/**
 * Resets one spinlock state to "free" (all fields zero).
 * No-op if state is null.
 */
inline void init_spinlock_state(SharedSpinLockState *state) noexcept
{
    if (!state)
        return;
    state->owner_pid.store(0, std::memory_order_release);
    state->owner_tid.store(0, std::memory_order_release);
    state->generation.store(0, std::memory_order_release);
    state->recursion_count.store(0, std::memory_order_release);
}

/**
 * @class SharedSpinLock
 * @brief Cross-process spin-lock kept entirely in shared memory.
 *
 * Ownership is the holder's PID (CAS target) plus its native thread id. A lock held
 * by a process that no longer exists is reclaimed by the next contender, so a crash
 * inside a critical section does not wedge every other process. The same thread
 * may lock recursively.
 *
 * The object itself is a cheap view; several SharedSpinLock objects (in one or
 * several processes) may refer to the same state.
 */
class SOLOHUB_UTILS_EXPORT SharedSpinLock
{
  public:
    /**
     * @param state The SharedSpinLockState in shared memory. Must not be null.
     * @param name A name for log messages (segment name, typically).
     * @throws std::invalid_argument if state is null.
     */
    SharedSpinLock(SharedSpinLockState *state, std::string name);

    /**
     * @brief Acquires the spin-lock, waiting at most timeout_ms.
     * @param timeout_ms The maximum time to wait. 0 means wait indefinitely.
     * @return True if the lock was acquired, false on timeout.
     */
    bool try_lock_for(int timeout_ms = 0);

    /**
     * @brief Acquires the spin-lock, blocking indefinitely until acquired.
     */
    void lock();

    /**
     * @brief Releases the spin-lock (one level of recursion).
     * @throws std::runtime_error if the caller is not the owner.
     */
    void unlock();

    /**
     * @brief True if the calling thread of this process holds the lock.
     */
    [[nodiscard]] bool is_locked_by_current_thread() const;

    [[nodiscard]] const std::string &name() const noexcept { return m_name; }

  private:
    SharedSpinLockState *m_state;
    std::string m_name;
};

/**
 * @class SharedSpinLockGuard
 * @brief RAII guard for SharedSpinLock.
 *
 * If lock() throws in the constructor the guard does not exist, so unlock() is
 * never called without a prior successful lock.
 */
class SOLOHUB_UTILS_EXPORT SharedSpinLockGuard
{
  public:
    explicit SharedSpinLockGuard(SharedSpinLock &lock);
    ~SharedSpinLockGuard();

    SharedSpinLockGuard(const SharedSpinLockGuard &) = delete;
    SharedSpinLockGuard &operator=(const SharedSpinLockGuard &) = delete;
    SharedSpinLockGuard(SharedSpinLockGuard &&) noexcept = delete;
    SharedSpinLockGuard &operator=(SharedSpinLockGuard &&) noexcept = delete;

  private:
    SharedSpinLock &m_lock;
};

/**
 * @class SharedSpinLockGuardOwning
 * @brief RAII guard that owns its SharedSpinLock view.
 * The lock is constructed first so the guard can reference it.
 */
class SOLOHUB_UTILS_EXPORT SharedSpinLockGuardOwning
{
  public:
    SharedSpinLockGuardOwning(SharedSpinLockState *state, const std::string &name);
    ~SharedSpinLockGuardOwning();

    SharedSpinLockGuardOwning(const SharedSpinLockGuardOwning &) = delete;
    SharedSpinLockGuardOwning &operator=(const SharedSpinLockGuardOwning &) = delete;
    SharedSpinLockGuardOwning(SharedSpinLockGuardOwning &&) noexcept = delete;
    SharedSpinLockGuardOwning &operator=(SharedSpinLockGuardOwning &&) noexcept = delete;

  private:
    SharedSpinLock m_lock;
    SharedSpinLockGuard m_guard;
};

} // namespace solohub::hub
