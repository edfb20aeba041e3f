#include "utils/ipc_pubsub.hpp"

#include "ipc_registry.hpp"
#include "solo_base.hpp"

#include <algorithm>
#include <cstring>

namespace solohub::hub::detail
{

namespace
{

PubSubHeader *pubsub_of(const ServiceCore &core) noexcept
{
    return core.layout<PubSubHeader>();
}

std::byte *queue_entry(PubSubHeader *ps, uint64_t index) noexcept
{
    return reinterpret_cast<std::byte *>(ps) + ps->queue_offset + index * ps->stride;
}

} // namespace

/// One claimed publisher slot. Frees it on destruction.
class PublisherPort
{
  public:
    PublisherPort(std::shared_ptr<ServiceCore> core, uint64_t port_id, size_t slot)
        : m_core(std::move(core)), m_port_id(port_id), m_slot(slot)
    {
    }
    ~PublisherPort()
    {
        try
        {
            SharedSpinLockGuard guard(m_core->lock());
            release_port_slot(pubsub_of(*m_core)->publishers[m_slot], m_port_id);
        }
        catch (const std::exception &e)
        {
            LOGGER_ERROR("Publisher {} of '{}': release failed: {}", m_port_id,
                         m_core->service_name().as_string(), e.what());
        }
    }
    PublisherPort(const PublisherPort &) = delete;
    PublisherPort &operator=(const PublisherPort &) = delete;

    ServiceCore &core() const noexcept { return *m_core; }
    uint64_t port_id() const noexcept { return m_port_id; }
    PortSlot &slot() const noexcept { return pubsub_of(*m_core)->publishers[m_slot]; }
    std::atomic<size_t> &loans() noexcept { return m_loans; }

  private:
    std::shared_ptr<ServiceCore> m_core;
    uint64_t m_port_id;
    size_t m_slot;
    std::atomic<size_t> m_loans{0};
};

/// The claimed subscriber slot. Frees it on destruction.
class SubscriberPort
{
  public:
    SubscriberPort(std::shared_ptr<ServiceCore> core, uint64_t port_id)
        : m_core(std::move(core)), m_port_id(port_id)
    {
    }
    ~SubscriberPort()
    {
        try
        {
            SharedSpinLockGuard guard(m_core->lock());
            release_port_slot(pubsub_of(*m_core)->subscriber, m_port_id);
        }
        catch (const std::exception &e)
        {
            LOGGER_ERROR("Subscriber {} of '{}': release failed: {}", m_port_id,
                         m_core->service_name().as_string(), e.what());
        }
    }
    SubscriberPort(const SubscriberPort &) = delete;
    SubscriberPort &operator=(const SubscriberPort &) = delete;

    ServiceCore &core() const noexcept { return *m_core; }
    uint64_t port_id() const noexcept { return m_port_id; }

  private:
    std::shared_ptr<ServiceCore> m_core;
    uint64_t m_port_id;
};

// ============================================================================
// RawPublisher
// ============================================================================

utils::VoidResult<LoanError> RawPublisher::acquire_loan() const
{
    using R = utils::VoidResult<LoanError>;
    if (!owns_port(m_port->slot(), m_port->port_id()))
        return R::error(LoanError::ConnectionLost);

    auto &loans = m_port->loans();
    size_t current = loans.load(std::memory_order_relaxed);
    do
    {
        if (current >= kMaxLoansPerPublisher)
            return R::error(LoanError::ExceedsMaxLoans);
    } while (!loans.compare_exchange_weak(current, current + 1, std::memory_order_acq_rel));
    return R::ok();
}

void RawPublisher::release_loan() const noexcept
{
    // Every SampleMut returns its loan exactly once.
    if (m_port->loans().fetch_sub(1, std::memory_order_acq_rel) == 0)
        SOLOHUB_PANIC("publisher {}: loan returned that was never handed out", m_port->port_id());
}

utils::Result<size_t, SendError> RawPublisher::send_bytes(const void *data, size_t size) const
{
    using R = utils::Result<size_t, SendError>;
    release_loan();

    ServiceCore &core = m_port->core();
    SharedSpinLockGuard guard(core.lock());
    PubSubHeader *ps = pubsub_of(core);
    if (!owns_port(m_port->slot(), m_port->port_id()))
        return R::error(SendError::ConnectionLost);
    if (ps->subscriber.port_id.load(std::memory_order_acquire) == 0)
        return R::ok(0);

    const uint64_t capacity = ps->subscriber_buffer_size;
    if (ps->ring_count == capacity)
    {
        ps->ring_head = (ps->ring_head + 1) % capacity;
        --ps->ring_count;
        ++ps->overwritten;
    }
    const uint64_t index = (ps->ring_head + ps->ring_count) % capacity;
    std::memcpy(queue_entry(ps, index), data, std::min<size_t>(size, ps->payload_size));
    ++ps->ring_count;
    return R::ok(1);
}

uint64_t RawPublisher::port_id() const noexcept
{
    return m_port->port_id();
}

// ============================================================================
// RawSubscriber
// ============================================================================

utils::Result<bool, ReceiveError> RawSubscriber::receive_bytes(void *out, size_t size) const
{
    using R = utils::Result<bool, ReceiveError>;
    ServiceCore &core = m_port->core();
    SharedSpinLockGuard guard(core.lock());
    PubSubHeader *ps = pubsub_of(core);
    if (!owns_port(ps->subscriber, m_port->port_id()))
        return R::error(ReceiveError::ConnectionLost);
    if (ps->ring_count == 0)
        return R::ok(false);

    std::memcpy(out, queue_entry(ps, ps->ring_head), std::min<size_t>(size, ps->payload_size));
    ps->ring_head = (ps->ring_head + 1) % ps->subscriber_buffer_size;
    --ps->ring_count;
    return R::ok(true);
}

uint64_t RawSubscriber::port_id() const noexcept
{
    return m_port->port_id();
}

// ============================================================================
// RawPubSubService
// ============================================================================

utils::Result<RawPubSubService, ServiceOpenError>
RawPubSubService::open_or_create(const Node &node, const ServiceName &name, const PayloadShape &shape)
{
    using R = utils::Result<RawPubSubService, ServiceOpenError>;
    const TransportConfig &config = node.config();
    const PubSubGeometry geometry =
        pubsub_geometry(shape.size, shape.align, config.subscriber_buffer_size);
    const std::string type_name = shape.type_name.substr(0, kTypeNameCapacity - 1);

    SegmentRequest request;
    request.kind = ServiceKind::PubSub;
    request.size = geometry.total_size;
    request.init = [&](void *base) {
        auto *ps = static_cast<PubSubHeader *>(base);
        ps->payload_size = shape.size;
        ps->payload_align = shape.align;
        copy_fixed(ps->type_name, kTypeNameCapacity, type_name);
        ps->max_subscribers = 1;
        ps->max_publishers = config.max_publishers;
        ps->subscriber_buffer_size = config.subscriber_buffer_size;
        ps->stride = geometry.stride;
        ps->queue_offset = geometry.queue_offset;
    };
    request.verify = [&](const void *base, size_t size) -> std::optional<ServiceOpenError> {
        if (size < sizeof(PubSubHeader))
            return ServiceOpenError::ServiceInCorruptedState;
        const auto *ps = static_cast<const PubSubHeader *>(base);
        if (ps->payload_size != shape.size || ps->payload_align != shape.align ||
            read_fixed(ps->type_name, kTypeNameCapacity) != type_name)
            return ServiceOpenError::IncompatibleTypes;
        if (ps->max_subscribers != 1 || ps->max_publishers < config.max_publishers ||
            ps->subscriber_buffer_size < config.subscriber_buffer_size)
            return ServiceOpenError::IncompatibleAttributes;
        if (ps->subscriber_buffer_size == 0 ||
            size < ps->queue_offset + ps->stride * ps->subscriber_buffer_size)
            return ServiceOpenError::ServiceInCorruptedState;
        return std::nullopt;
    };

    auto core = open_or_create_service(node.impl(), name, request);
    if (core.is_error())
        return R::error(core.error(), core.error_code());
    return R::ok(RawPubSubService(std::move(core).content()));
}

utils::Result<RawSubscriber, SubscriberCreateError> RawPubSubService::subscriber() const
{
    using R = utils::Result<RawSubscriber, SubscriberCreateError>;
    uint64_t port_id = 0;
    {
        SharedSpinLockGuard guard(m_core->lock());
        PubSubHeader *ps = pubsub_of(*m_core);
        port_id = m_core->allocate_port_id();
        if (claim_port_slot(&ps->subscriber, 1, port_id, m_core->node().id()) < 0)
            return R::error(SubscriberCreateError::ExceedsMaxSupportedSubscribers);
        ps->ring_head = 0;
        ps->ring_count = 0;
    }
    LOGGER_DEBUG("Service '{}': subscriber {} attached.", m_core->service_name().as_string(),
                 port_id);
    return R::ok(RawSubscriber(std::make_shared<SubscriberPort>(m_core, port_id)));
}

utils::Result<RawPublisher, PublisherCreateError> RawPubSubService::publisher() const
{
    using R = utils::Result<RawPublisher, PublisherCreateError>;
    uint64_t port_id = 0;
    int slot = -1;
    {
        SharedSpinLockGuard guard(m_core->lock());
        PubSubHeader *ps = pubsub_of(*m_core);
        port_id = m_core->allocate_port_id();
        slot = claim_port_slot(ps->publishers, ps->max_publishers, port_id, m_core->node().id());
    }
    if (slot < 0)
        return R::error(PublisherCreateError::ExceedsMaxSupportedPublishers);
    return R::ok(RawPublisher(
        std::make_shared<PublisherPort>(m_core, port_id, static_cast<size_t>(slot))));
}

const ServiceName &RawPubSubService::name() const noexcept
{
    return m_core->service_name();
}

} // namespace solohub::hub::detail
