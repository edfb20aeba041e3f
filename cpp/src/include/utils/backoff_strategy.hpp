#pragma once
/**
 * @file backoff_strategy.hpp
 * @brief Header-only backoff strategies for busy-wait and retry loops.
 *
 * Spin loops (SharedSpinLock, the first listener polls) use the stateless
 * ExponentialBackoff, called with the current iteration count. Retry loops that compete with other
 * processes (the subscriber replace loop) use RandomizedExponentialBackoff,
 * which spreads competing retries apart.
 *
 * - SharedSpinLock: ExponentialBackoff
 * - Listener::timed_wait_all: backoff() for its first polls, then plain sleeps
 * - Replace/acquire loop: RandomizedExponentialBackoff
 */
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <random>
#include <thread>

namespace solohub::utils
{

// ============================================================================
// Backoff Strategies
// ============================================================================

/**
 * @brief Exponential backoff strategy with three phases.
 * @details Optimized for contention that is usually short-lived.
 *
 * Phase 1 (iterations 0-3): yield()
 * Phase 2 (iterations 4-9): 1us sleep
 * Phase 3 (iterations 10+): iteration * 10us sleep
 *
 * @example
 * ExponentialBackoff backoff;
 * int iteration = 0;
 * while (!lock.try_acquire()) {
 *     backoff(iteration++);
 * }
 */
struct ExponentialBackoff
{
    void operator()(int iteration) const noexcept
    {
        if (iteration < 4)
        {
            std::this_thread::yield();
        }
        else if (iteration < 10)
        {
            std::this_thread::sleep_for(std::chrono::microseconds(1));
        }
        else
        {
            std::this_thread::sleep_for(
                std::chrono::microseconds(static_cast<long>(iteration) * 10));
        }
    }
};

/**
 * @brief Randomized exponential backoff with a capped bound.
 * @details Each call to next_delay() draws a delay uniformly from
 *          [0, current bound] and then doubles the bound, up to max_bound.
 *          With the defaults the bounds run 2ms, 4ms, 8ms, ... 64ms, 100ms, 100ms.
 *
 * Random spreading keeps processes that race for the same resource from
 * retrying in lock step. The caller performs the wait itself, so that the
 * wait can be interrupted or reported.
 *
 * @example
 * RandomizedExponentialBackoff backoff;
 * while (!try_acquire()) {
 *     node.wait(backoff.next_delay());
 * }
 */
class RandomizedExponentialBackoff
{
  public:
    static constexpr std::chrono::nanoseconds kDefaultInitialBound = std::chrono::milliseconds(2);
    static constexpr std::chrono::nanoseconds kDefaultMaxBound = std::chrono::milliseconds(100);

    explicit RandomizedExponentialBackoff(
        std::chrono::nanoseconds initial_bound = kDefaultInitialBound,
        std::chrono::nanoseconds max_bound = kDefaultMaxBound,
        uint64_t seed = std::random_device{}())
        : m_initial_bound(initial_bound), m_max_bound(std::max(max_bound, initial_bound)),
          m_bound(initial_bound), m_rng(seed)
    {
    }

    /// Bound the next call to next_delay() draws from.
    [[nodiscard]] std::chrono::nanoseconds current_bound() const noexcept { return m_bound; }

    [[nodiscard]] std::chrono::nanoseconds max_bound() const noexcept { return m_max_bound; }

    /// Uniform delay in [0, current_bound()]; grows the bound afterwards.
    [[nodiscard]] std::chrono::nanoseconds next_delay()
    {
        std::uniform_int_distribution<std::chrono::nanoseconds::rep> dist(0, m_bound.count());
        const std::chrono::nanoseconds delay(dist(m_rng));
        m_bound = std::min(m_bound * 2, m_max_bound);
        return delay;
    }

    void reset() noexcept { m_bound = m_initial_bound; }

  private:
    std::chrono::nanoseconds m_initial_bound;
    std::chrono::nanoseconds m_max_bound;
    std::chrono::nanoseconds m_bound;
    std::mt19937_64 m_rng;
};

// ============================================================================
// Helper Functions
// ============================================================================

/// Non-template shorthand for ExponentialBackoff{}(iteration).
inline void backoff(int iteration) noexcept
{
    ExponentialBackoff{}(iteration);
}

} // namespace solohub::utils
