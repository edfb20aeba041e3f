#pragma once
/**
 * @file ipc_event.hpp
 * @brief Signal-only event service: notifiers fire event ids, listeners collect them.
 *
 * Each listener owns a 64-bit pending mask in the service segment. Firing id `i`
 * sets bit `i` in the mask of every attached listener; a wait hands every set
 * bit to the callback once and clears the mask. Events carry no payload and do
 * not queue: an id fired twice before a wait is seen once.
 */
#include "solohub_utils_export.h"
#include "utils/ipc_errors.hpp"
#include "utils/ipc_names.hpp"
#include "utils/ipc_node.hpp"
#include "utils/result.hpp"

#include <chrono>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>

#include <fmt/format.h>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace solohub::hub
{

/// Event ids are 0 .. kMaxEventIds-1.
inline constexpr size_t kMaxEventIds = 64;

class EventId
{
  public:
    constexpr explicit EventId(size_t value) noexcept : m_value(value) {}

    [[nodiscard]] constexpr size_t as_value() const noexcept { return m_value; }

    friend constexpr bool operator==(EventId, EventId) noexcept = default;
    friend constexpr auto operator<=>(EventId, EventId) noexcept = default;

  private:
    size_t m_value;
};

namespace detail
{
class ServiceCore;
class ListenerPort;
class NotifierPort;
} // namespace detail

class SOLOHUB_UTILS_EXPORT Listener
{
  public:
    using Callback = std::function<void(EventId)>;

    /**
     * @brief Waits up to `timeout` for at least one event, then calls `callback`
     *        once per fired id in ascending order.
     *
     * Polls the pending mask: a few quick spins, then sleeps doubling from 50us
     * to 5ms, so an idle wait wakes about 200 times per second.
     * Returns without calling `callback` when the timeout passes with nothing
     * fired. Exceptions thrown by `callback` propagate; the ids not yet handed
     * over are lost.
     */
    [[nodiscard]] utils::VoidResult<ListenerWaitError> timed_wait_all(const Callback &callback,
                                                                      std::chrono::nanoseconds timeout) const;

    /// Non-blocking variant of timed_wait_all().
    [[nodiscard]] utils::VoidResult<ListenerWaitError> try_wait_all(const Callback &callback) const;

    [[nodiscard]] uint64_t id() const noexcept;

  private:
    friend class EventService;
    explicit Listener(std::shared_ptr<detail::ListenerPort> port) : m_port(std::move(port)) {}

    std::shared_ptr<detail::ListenerPort> m_port;
};

class SOLOHUB_UTILS_EXPORT Notifier
{
  public:
    /// Fires the default event id. Returns the number of listeners signalled.
    [[nodiscard]] utils::Result<size_t, NotifyError> notify() const;
    [[nodiscard]] utils::Result<size_t, NotifyError> notify_with_id(EventId id) const;

    [[nodiscard]] EventId default_event_id() const noexcept { return m_default_id; }
    [[nodiscard]] uint64_t id() const noexcept;

  private:
    friend class EventService;
    Notifier(std::shared_ptr<detail::NotifierPort> port, EventId default_id)
        : m_port(std::move(port)), m_default_id(default_id)
    {
    }

    std::shared_ptr<detail::NotifierPort> m_port;
    EventId m_default_id;
};

class SOLOHUB_UTILS_EXPORT EventService
{
  public:
    [[nodiscard]] static utils::Result<EventService, ServiceOpenError> open_or_create(const Node &node,
                                                                                    const ServiceName &name);

    [[nodiscard]] utils::Result<Listener, ListenerCreateError> listener() const;
    [[nodiscard]] utils::Result<Notifier, NotifierCreateError> notifier(EventId default_id) const;

    [[nodiscard]] const ServiceName &name() const noexcept;

  private:
    explicit EventService(std::shared_ptr<detail::ServiceCore> core) : m_core(std::move(core)) {}

    std::shared_ptr<detail::ServiceCore> m_core;
};

} // namespace solohub::hub

template <> struct fmt::formatter<solohub::hub::EventId> : fmt::formatter<size_t>
{
    template <typename FormatContext>
    auto format(const solohub::hub::EventId &id, FormatContext &ctx) const
    {
        return fmt::formatter<size_t>::format(id.as_value(), ctx);
    }
};

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
