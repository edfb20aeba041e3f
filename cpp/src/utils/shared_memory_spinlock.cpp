#include "utils/shared_memory_spinlock.hpp"
#include "solo_service.hpp" // For platform, logger, backoff_strategy

#include <stdexcept>

namespace solohub::hub
{

// ============================================================================
// SharedSpinLock Implementation
// ============================================================================

namespace
{
constexpr uint64_t kNsPerMs = 1'000'000;
}

SharedSpinLock::SharedSpinLock(SharedSpinLockState *state, std::string name)
    : m_state(state), m_name(std::move(name))
{
    if (m_state == nullptr)
    {
        LOGGER_ERROR("SharedSpinLock '{}': Initialized with a null SharedSpinLockState.", m_name);
        throw std::invalid_argument("SharedSpinLockState cannot be null.");
    }
}

bool SharedSpinLock::try_lock_for(int timeout_ms)
{
    const uint64_t my_pid = platform::get_pid();
    const uint64_t my_tid = platform::get_native_thread_id();

    // Recursive case
    if (m_state->owner_pid.load(std::memory_order_relaxed) == my_pid &&
        m_state->owner_tid.load(std::memory_order_relaxed) == my_tid)
    {
        m_state->recursion_count.fetch_add(1, std::memory_order_relaxed);
        return true;
    }

    const uint64_t start_ns = platform::monotonic_time_ns();
    utils::ExponentialBackoff backoff_strategy;
    int iteration = 0;

    uint64_t expected_pid = 0;
    while (!m_state->owner_pid.compare_exchange_weak(expected_pid, my_pid, std::memory_order_acquire,
                                                     std::memory_order_relaxed))
    {
        if (expected_pid != 0 && !platform::is_process_alive(expected_pid))
        {
            // CAS, not store: only one of several contenders may reclaim a dead holder.
            uint64_t zombie_pid = expected_pid;
            if (m_state->owner_pid.compare_exchange_strong(zombie_pid, my_pid,
                                                           std::memory_order_acquire,
                                                           std::memory_order_relaxed))
            {
                LOGGER_WARN("SharedSpinLock '{}': Reclaimed lock from dead PID {}.", m_name,
                            expected_pid);
                m_state->owner_tid.store(my_tid, std::memory_order_release);
                m_state->recursion_count.store(1, std::memory_order_relaxed);
                m_state->generation.fetch_add(1, std::memory_order_relaxed);
                return true;
            }
        }

        if (timeout_ms > 0)
        {
            const uint64_t elapsed_ms = platform::elapsed_time_ns(start_ns) / kNsPerMs;
            if (elapsed_ms >= static_cast<uint64_t>(timeout_ms))
                return false;
        }

        expected_pid = 0;
        backoff_strategy(iteration < 100 ? iteration++ : iteration);
    }

    m_state->owner_tid.store(my_tid, std::memory_order_relaxed);
    m_state->recursion_count.store(1, std::memory_order_relaxed);
    return true;
}

void SharedSpinLock::lock()
{
    if (!try_lock_for(0))
    {
        LOGGER_ERROR("SharedSpinLock '{}': Indefinite lock failed unexpectedly.", m_name);
        throw std::runtime_error("Indefinite lock failed.");
    }
}

void SharedSpinLock::unlock()
{
    const uint64_t current_pid = platform::get_pid();
    const uint64_t current_tid = platform::get_native_thread_id();

    if (m_state->owner_pid.load(std::memory_order_acquire) != current_pid ||
        m_state->owner_tid.load(std::memory_order_acquire) != current_tid)
    {
        LOGGER_ERROR("SharedSpinLock '{}': Attempted to unlock by non-owner. Current owner PID:TID "
                     "{}:{}, Caller PID:TID {}:{}.",
                     m_name, m_state->owner_pid.load(std::memory_order_acquire),
                     m_state->owner_tid.load(std::memory_order_acquire), current_pid, current_tid);
        throw std::runtime_error("Attempted to unlock by non-owner.");
    }

    if (m_state->recursion_count.load(std::memory_order_relaxed) > 1)
    {
        m_state->recursion_count.fetch_sub(1, std::memory_order_relaxed);
        return;
    }

    // owner_pid is the "lock free" signal for the CAS in try_lock_for(); it is cleared last.
    m_state->recursion_count.store(0, std::memory_order_release);
    m_state->generation.fetch_add(1, std::memory_order_relaxed);
    m_state->owner_tid.store(0, std::memory_order_relaxed);
    m_state->owner_pid.store(0, std::memory_order_release);
}

bool SharedSpinLock::is_locked_by_current_thread() const
{
    return m_state->owner_pid.load(std::memory_order_acquire) == platform::get_pid() &&
           m_state->owner_tid.load(std::memory_order_acquire) == platform::get_native_thread_id();
}

// ============================================================================
// SharedSpinLockGuard Implementation
// ============================================================================

SharedSpinLockGuard::SharedSpinLockGuard(SharedSpinLock &lock) : m_lock(lock)
{
    m_lock.lock();
}

// NOLINTNEXTLINE(bugprone-exception-escape) -- unlock() throws only on misuse
SharedSpinLockGuard::~SharedSpinLockGuard()
{
    m_lock.unlock();
}

// ============================================================================
// SharedSpinLockGuardOwning Implementation
// ============================================================================

SharedSpinLockGuardOwning::SharedSpinLockGuardOwning(SharedSpinLockState *state,
                                                     const std::string &name)
    : m_lock(state, name), m_guard(m_lock)
{
}

SharedSpinLockGuardOwning::~SharedSpinLockGuardOwning() = default;

} // namespace solohub::hub
