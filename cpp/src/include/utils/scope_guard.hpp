#pragma once

#include <concepts>
#include <functional>
#include <type_traits>
#include <utility>

namespace solohub::basics
{

/**
 * @class ScopeGuard
 * @brief An RAII-style guard that executes a callable on scope exit.
 *
 * Runs the cleanup action whether the scope is left normally or by an exception.
 * Movable but not copyable; a moved-from guard is inactive.
 *
 * The IPC layer uses it to roll back partially created shared-memory segments:
 *
 * @code
 *  auto unlink_guard = solohub::basics::make_scope_guard([&]() noexcept {
 *      platform::shm_close(&handle);
 *      platform::shm_unlink(name.c_str());
 *  });
 *  initialize(handle);          // may return early with an error
 *  unlink_guard.dismiss();      // segment is published, keep it
 * @endcode
 *
 * The callable must be `noexcept`: it runs from the destructor, possibly during
 * stack unwinding.
 *
 * Not thread-safe.
 */
template <typename Callable>
requires std::invocable<Callable &>
class ScopeGuard
{
  public:
    static_assert(!std::is_reference_v<Callable>, "ScopeGuard cannot hold a reference to a callable.");
    static_assert(std::is_nothrow_invocable_v<Callable &>,
                  "ScopeGuard's callable must be noexcept; it runs from a destructor.");

    [[nodiscard]] explicit operator bool() const noexcept { return m_active; }

    explicit ScopeGuard(Callable fn) noexcept(std::is_nothrow_move_constructible_v<Callable>)
        : m_func(std::move(fn))
    {
    }

    ScopeGuard(ScopeGuard &&other) noexcept(std::is_nothrow_move_constructible_v<Callable>)
        : m_func(std::move(other.m_func)), m_active(other.m_active)
    {
        other.dismiss();
    }

    ~ScopeGuard() noexcept
    {
        if (m_active)
            std::invoke(m_func);
    }

    ScopeGuard(const ScopeGuard &) = delete;
    ScopeGuard &operator=(const ScopeGuard &) = delete;
    ScopeGuard &operator=(ScopeGuard &&) = delete;

    /// Cancels the cleanup action.
    constexpr void dismiss() noexcept { m_active = false; }

    /// Runs the cleanup action now (once) and deactivates the guard.
    void invoke() noexcept
    {
        if (m_active)
        {
            m_active = false; // Must dismiss before invoke to prevent double execution.
            std::invoke(m_func);
        }
    }

  private:
    Callable m_func;
    bool m_active{true};
};

/**
 * @brief Creates a ScopeGuard; the callable is stored by value (decayed).
 * @note References captured by `f` must outlive the guard.
 */
template <typename F> auto make_scope_guard(F &&f) -> ScopeGuard<std::decay_t<F>>
{
    return ScopeGuard<std::decay_t<F>>(std::forward<F>(f));
}

} // namespace solohub::basics
