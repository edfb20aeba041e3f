#pragma once
/**
 * @file subscriber_handle.hpp
 * @brief Caller-side handle on a running subscriber loop.
 *
 * The loop thread owns the liveness flag; the handle only observes it through a
 * weak reference, so a handle never keeps a loop alive and stays valid after the
 * loop is gone. Handles compare and hash by id; ids are process-local and never
 * reused.
 */
#include "solohub_utils_export.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <utility>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace solohub::ipc
{

class SOLOHUB_UTILS_EXPORT SubscriberHandle
{
  public:
    /// Liveness flag as owned by the loop.
    using KeepAlive = std::shared_ptr<std::atomic<bool>>;

    /// A handle with id 0 that is closed from the start.
    SubscriberHandle() = default;

    /// New handle with the next id, plus the flag the loop must own.
    [[nodiscard]] static std::pair<SubscriberHandle, KeepAlive> create();

    [[nodiscard]] uint64_t id() const noexcept { return m_id; }

    /// True once the loop has exited or has been asked to stop.
    [[nodiscard]] bool is_closed() const noexcept;

    /// Asks the loop to stop after its current poll cycle. No-op once it has exited.
    void close() const noexcept;

    /**
     * @brief Blocks until the loop thread has released its state or `timeout` passes.
     * @return true if the loop is gone.
     */
    [[nodiscard]] bool wait_for_exit(std::chrono::milliseconds timeout) const;

    friend bool operator==(const SubscriberHandle &a, const SubscriberHandle &b) noexcept
    {
        return a.m_id == b.m_id;
    }

  private:
    SubscriberHandle(uint64_t id, std::weak_ptr<std::atomic<bool>> keep_alive)
        : m_id(id), m_keep_alive(std::move(keep_alive))
    {
    }

    uint64_t m_id = 0;
    std::weak_ptr<std::atomic<bool>> m_keep_alive;
};

} // namespace solohub::ipc

template <> struct std::hash<solohub::ipc::SubscriberHandle>
{
    size_t operator()(const solohub::ipc::SubscriberHandle &handle) const noexcept
    {
        return std::hash<uint64_t>{}(handle.id());
    }
};

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
