#include "utils/ipc_event.hpp"

#include "ipc_registry.hpp"

#include <algorithm>
#include <thread>

namespace solohub::hub
{

namespace detail
{

namespace
{
EventHeader *event_of(const ServiceCore &core) noexcept
{
    return core.layout<EventHeader>();
}

// The first polls back off like SharedSpinLock. After that the sleep doubles
// from kMinPollSleepNs up to kMaxPollSleepNs.
constexpr int kSpinPolls = 10;
constexpr uint64_t kMinPollSleepNs = 50'000;
constexpr uint64_t kMaxPollSleepNs = 5'000'000;
} // namespace

class ListenerPort
{
  public:
    ListenerPort(std::shared_ptr<ServiceCore> core, uint64_t port_id, size_t slot)
        : m_core(std::move(core)), m_port_id(port_id), m_slot(slot)
    {
    }
    ~ListenerPort()
    {
        try
        {
            SharedSpinLockGuard guard(m_core->lock());
            ListenerSlot &entry = slot();
            if (owns_port(entry.port, m_port_id))
            {
                release_port_slot(entry.port, m_port_id);
                entry.pending.store(0, std::memory_order_release);
            }
        }
        catch (const std::exception &e)
        {
            LOGGER_ERROR("Listener {} of '{}': release failed: {}", m_port_id,
                         m_core->service_name().as_string(), e.what());
        }
    }
    ListenerPort(const ListenerPort &) = delete;
    ListenerPort &operator=(const ListenerPort &) = delete;

    uint64_t port_id() const noexcept { return m_port_id; }
    ListenerSlot &slot() const noexcept { return event_of(*m_core)->listeners[m_slot]; }

  private:
    std::shared_ptr<ServiceCore> m_core;
    uint64_t m_port_id;
    size_t m_slot;
};

class NotifierPort
{
  public:
    NotifierPort(std::shared_ptr<ServiceCore> core, uint64_t port_id, size_t slot)
        : m_core(std::move(core)), m_port_id(port_id), m_slot(slot)
    {
    }
    ~NotifierPort()
    {
        try
        {
            SharedSpinLockGuard guard(m_core->lock());
            release_port_slot(event_of(*m_core)->notifiers[m_slot], m_port_id);
        }
        catch (const std::exception &e)
        {
            LOGGER_ERROR("Notifier {} of '{}': release failed: {}", m_port_id,
                         m_core->service_name().as_string(), e.what());
        }
    }
    NotifierPort(const NotifierPort &) = delete;
    NotifierPort &operator=(const NotifierPort &) = delete;

    ServiceCore &core() const noexcept { return *m_core; }
    uint64_t port_id() const noexcept { return m_port_id; }
    PortSlot &slot() const noexcept { return event_of(*m_core)->notifiers[m_slot]; }

  private:
    std::shared_ptr<ServiceCore> m_core;
    uint64_t m_port_id;
    size_t m_slot;
};

} // namespace detail

// ============================================================================
// Listener
// ============================================================================

namespace
{
// Returns false if the listener lost its slot; `fired` gets the drained mask.
bool drain_pending(const detail::ListenerPort &port, uint64_t &fired) noexcept
{
    detail::ListenerSlot &slot = port.slot();
    if (!detail::owns_port(slot.port, port.port_id()))
        return false;
    fired = slot.pending.exchange(0, std::memory_order_acq_rel);
    return true;
}

void dispatch(uint64_t fired, const Listener::Callback &callback)
{
    for (size_t id = 0; id < kMaxEventIds && fired != 0; ++id)
    {
        const uint64_t bit = uint64_t{1} << id;
        if ((fired & bit) != 0)
        {
            fired &= ~bit;
            callback(EventId(id));
        }
    }
}
} // namespace

utils::VoidResult<ListenerWaitError> Listener::timed_wait_all(const Callback &callback,
                                                              std::chrono::nanoseconds timeout) const
{
    using R = utils::VoidResult<ListenerWaitError>;
    const uint64_t start_ns = platform::monotonic_time_ns();
    const auto timeout_ns = static_cast<uint64_t>(std::max<int64_t>(timeout.count(), 0));
    int iteration = 0;
    uint64_t sleep_ns = detail::kMinPollSleepNs;

    for (;;)
    {
        uint64_t fired = 0;
        if (!drain_pending(*m_port, fired))
            return R::error(ListenerWaitError::ConnectionLost);
        if (fired != 0)
        {
            dispatch(fired, callback);
            return R::ok();
        }
        const uint64_t elapsed_ns = platform::elapsed_time_ns(start_ns);
        if (elapsed_ns >= timeout_ns)
            return R::ok();
        if (iteration < detail::kSpinPolls)
        {
            utils::backoff(iteration++);
            continue;
        }
        // Never sleep past the deadline.
        std::this_thread::sleep_for(
            std::chrono::nanoseconds(std::min(sleep_ns, timeout_ns - elapsed_ns)));
        sleep_ns = std::min(sleep_ns * 2, detail::kMaxPollSleepNs);
    }
}

utils::VoidResult<ListenerWaitError> Listener::try_wait_all(const Callback &callback) const
{
    using R = utils::VoidResult<ListenerWaitError>;
    uint64_t fired = 0;
    if (!drain_pending(*m_port, fired))
        return R::error(ListenerWaitError::ConnectionLost);
    dispatch(fired, callback);
    return R::ok();
}

uint64_t Listener::id() const noexcept
{
    return m_port->port_id();
}

// ============================================================================
// Notifier
// ============================================================================

utils::Result<size_t, NotifyError> Notifier::notify() const
{
    return notify_with_id(m_default_id);
}

utils::Result<size_t, NotifyError> Notifier::notify_with_id(EventId id) const
{
    using R = utils::Result<size_t, NotifyError>;
    if (id.as_value() >= kMaxEventIds)
        return R::error(NotifyError::EventIdOutOfBounds);

    detail::ServiceCore &core = m_port->core();
    SharedSpinLockGuard guard(core.lock());
    if (!detail::owns_port(m_port->slot(), m_port->port_id()))
        return R::error(NotifyError::ConnectionLost);

    detail::EventHeader *ev = detail::event_of(core);
    const uint64_t bit = uint64_t{1} << id.as_value();
    size_t signalled = 0;
    for (size_t i = 0; i < ev->max_listeners; ++i)
    {
        detail::ListenerSlot &listener = ev->listeners[i];
        if (listener.port.port_id.load(std::memory_order_acquire) == 0)
            continue;
        listener.pending.fetch_or(bit, std::memory_order_acq_rel);
        ++signalled;
    }
    return R::ok(signalled);
}

uint64_t Notifier::id() const noexcept
{
    return m_port->port_id();
}

// ============================================================================
// EventService
// ============================================================================

utils::Result<EventService, ServiceOpenError> EventService::open_or_create(const Node &node,
                                                                           const ServiceName &name)
{
    using R = utils::Result<EventService, ServiceOpenError>;
    const TransportConfig &config = node.config();

    detail::SegmentRequest request;
    request.kind = detail::ServiceKind::Event;
    request.size = sizeof(detail::EventHeader);
    request.init = [&](void *base) {
        auto *ev = static_cast<detail::EventHeader *>(base);
        ev->max_listeners = config.max_listeners;
        ev->max_notifiers = config.max_notifiers;
    };
    request.verify = [&](const void *base, size_t size) -> std::optional<ServiceOpenError> {
        if (size < sizeof(detail::EventHeader))
            return ServiceOpenError::ServiceInCorruptedState;
        const auto *ev = static_cast<const detail::EventHeader *>(base);
        if (ev->max_listeners < config.max_listeners || ev->max_notifiers < config.max_notifiers ||
            ev->max_listeners > detail::kMaxListeners || ev->max_notifiers > detail::kMaxNotifiers)
            return ServiceOpenError::IncompatibleAttributes;
        return std::nullopt;
    };

    auto core = detail::open_or_create_service(node.impl(), name, request);
    if (core.is_error())
        return R::error(core.error(), core.error_code());
    return R::ok(EventService(std::move(core).content()));
}

utils::Result<Listener, ListenerCreateError> EventService::listener() const
{
    using R = utils::Result<Listener, ListenerCreateError>;
    uint64_t port_id = 0;
    int slot = -1;
    {
        SharedSpinLockGuard guard(m_core->lock());
        detail::EventHeader *ev = detail::event_of(*m_core);
        port_id = m_core->allocate_port_id();
        for (size_t i = 0; i < ev->max_listeners; ++i)
        {
            detail::ListenerSlot &listener = ev->listeners[i];
            if (listener.port.port_id.load(std::memory_order_acquire) != 0)
                continue;
            listener.pending.store(0, std::memory_order_release);
            listener.port.node_id = m_core->node().id();
            listener.port.pid = platform::get_pid();
            listener.port.port_id.store(port_id, std::memory_order_release);
            slot = static_cast<int>(i);
            break;
        }
    }
    if (slot < 0)
        return R::error(ListenerCreateError::ExceedsMaxSupportedListeners);
    return R::ok(Listener(
        std::make_shared<detail::ListenerPort>(m_core, port_id, static_cast<size_t>(slot))));
}

utils::Result<Notifier, NotifierCreateError> EventService::notifier(EventId default_id) const
{
    using R = utils::Result<Notifier, NotifierCreateError>;
    uint64_t port_id = 0;
    int slot = -1;
    {
        SharedSpinLockGuard guard(m_core->lock());
        detail::EventHeader *ev = detail::event_of(*m_core);
        port_id = m_core->allocate_port_id();
        slot = detail::claim_port_slot(ev->notifiers, ev->max_notifiers, port_id,
                                       m_core->node().id());
    }
    if (slot < 0)
        return R::error(NotifierCreateError::ExceedsMaxSupportedNotifiers);
    return R::ok(Notifier(
        std::make_shared<detail::NotifierPort>(m_core, port_id, static_cast<size_t>(slot)),
        default_id));
}

const ServiceName &EventService::name() const noexcept
{
    return m_core->service_name();
}

} // namespace solohub::hub
