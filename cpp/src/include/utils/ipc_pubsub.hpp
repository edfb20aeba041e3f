#pragma once
/**
 * @file ipc_pubsub.hpp
 * @brief Publish/subscribe service with a single subscriber slot.
 *
 * A PubSubService<M> is a named shared-memory segment holding a ring of M
 * samples, one subscriber slot and a table of publisher slots. At most one
 * Subscriber<M> exists per service across all processes of the domain; a second
 * subscriber() call fails with SubscriberCreateError::ExceedsMaxSupportedSubscribers,
 * which callers use as the "slot occupied" signal.
 *
 * Sending:
 * @code
 * auto loaned = publisher.loan();          // LoanError when too many loans are open
 * auto sample = std::move(loaned).content();
 * sample.write_payload(value);
 * auto reached = std::move(sample).send(); // 0 or 1 subscriber
 * @endcode
 *
 * A full queue drops its oldest sample. Samples queued before a subscriber
 * claims the slot are discarded on claim; samples sent while no subscriber
 * exists are not stored (send() reports 0).
 *
 * Ports release their slot when destroyed. A subscriber whose slot was reclaimed
 * by dead-node cleanup or recovery gets ReceiveError::ConnectionLost.
 */
#include "solohub_utils_export.h"
#include "utils/ipc_errors.hpp"
#include "utils/ipc_names.hpp"
#include "utils/ipc_node.hpp"
#include "utils/result.hpp"

#include <concepts>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <typeinfo>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace solohub::hub
{

/// Payload types are copied byte-wise through shared memory.
template <typename M>
concept ShmPayload = std::is_trivially_copyable_v<M> && std::is_default_constructible_v<M>;

/// Loans a single publisher may hold at once.
inline constexpr size_t kMaxLoansPerPublisher = 2;

/// Identity of a payload type as recorded in the service segment.
struct PayloadShape
{
    size_t size = 0;
    size_t align = 1;
    std::string type_name;
};

namespace detail
{
class ServiceCore;
class PublisherPort;
class SubscriberPort;

class SOLOHUB_UTILS_EXPORT RawPublisher
{
  public:
    /// Reserves one of the publisher's loans.
    [[nodiscard]] utils::VoidResult<LoanError> acquire_loan() const;
    /// Returns a loan that is not going to be sent.
    void release_loan() const noexcept;
    /**
     * @brief Copies `size` bytes into the subscriber's queue and returns the loan.
     * @return Number of subscribers reached (0 or 1).
     */
    [[nodiscard]] utils::Result<size_t, SendError> send_bytes(const void *data, size_t size) const;

    [[nodiscard]] uint64_t port_id() const noexcept;

  private:
    friend class RawPubSubService;
    explicit RawPublisher(std::shared_ptr<PublisherPort> port) : m_port(std::move(port)) {}

    std::shared_ptr<PublisherPort> m_port;
};

class SOLOHUB_UTILS_EXPORT RawSubscriber
{
  public:
    /// Pops the oldest sample into `out`; false when the queue is empty.
    [[nodiscard]] utils::Result<bool, ReceiveError> receive_bytes(void *out, size_t size) const;

    [[nodiscard]] uint64_t port_id() const noexcept;

  private:
    friend class RawPubSubService;
    explicit RawSubscriber(std::shared_ptr<SubscriberPort> port) : m_port(std::move(port)) {}

    std::shared_ptr<SubscriberPort> m_port;
};

class SOLOHUB_UTILS_EXPORT RawPubSubService
{
  public:
    [[nodiscard]] static utils::Result<RawPubSubService, ServiceOpenError>
    open_or_create(const Node &node, const ServiceName &name, const PayloadShape &shape);

    [[nodiscard]] utils::Result<RawSubscriber, SubscriberCreateError> subscriber() const;
    [[nodiscard]] utils::Result<RawPublisher, PublisherCreateError> publisher() const;

    [[nodiscard]] const ServiceName &name() const noexcept;

  private:
    explicit RawPubSubService(std::shared_ptr<ServiceCore> core) : m_core(std::move(core)) {}

    std::shared_ptr<ServiceCore> m_core;
};
} // namespace detail

template <ShmPayload M> class Publisher;

/**
 * @brief A loaned sample. Either sent with send() or, when dropped, returned to
 *        the publisher.
 */
template <ShmPayload M> class SampleMut
{
  public:
    ~SampleMut()
    {
        if (m_loaned)
            m_publisher.release_loan();
    }

    SampleMut(SampleMut &&other) noexcept
        : m_publisher(other.m_publisher), m_payload(other.m_payload), m_loaned(other.m_loaned)
    {
        other.m_loaned = false;
    }
    SampleMut &operator=(SampleMut &&) = delete;
    SampleMut(const SampleMut &) = delete;
    SampleMut &operator=(const SampleMut &) = delete;

    [[nodiscard]] M &payload_mut() noexcept { return m_payload; }
    [[nodiscard]] const M &payload() const noexcept { return m_payload; }

    void write_payload(const M &value) noexcept { m_payload = value; }

    /// Delivers the sample. The loan is returned whatever the outcome.
    [[nodiscard]] utils::Result<size_t, SendError> send() &&
    {
        m_loaned = false;
        return m_publisher.send_bytes(&m_payload, sizeof(M));
    }

  private:
    friend class Publisher<M>;
    explicit SampleMut(detail::RawPublisher publisher)
        : m_publisher(std::move(publisher)), m_loaned(true)
    {
    }

    detail::RawPublisher m_publisher;
    M m_payload{};
    bool m_loaned;
};

template <ShmPayload M> class Publisher
{
  public:
    [[nodiscard]] utils::Result<SampleMut<M>, LoanError> loan() const
    {
        using R = utils::Result<SampleMut<M>, LoanError>;
        if (auto loaned = m_raw.acquire_loan(); loaned.is_error())
            return R::error(loaned.error());
        return R::ok(SampleMut<M>(m_raw));
    }

    [[nodiscard]] uint64_t id() const noexcept { return m_raw.port_id(); }

  private:
    template <ShmPayload> friend class PubSubService;
    explicit Publisher(detail::RawPublisher raw) : m_raw(std::move(raw)) {}

    detail::RawPublisher m_raw;
};

template <ShmPayload M> class Subscriber
{
  public:
    /// Non-blocking. nullopt when nothing is queued.
    [[nodiscard]] utils::Result<std::optional<M>, ReceiveError> receive() const
    {
        using R = utils::Result<std::optional<M>, ReceiveError>;
        M value{};
        auto received = m_raw.receive_bytes(&value, sizeof(M));
        if (received.is_error())
            return R::error(received.error());
        if (!received.content())
            return R::ok(std::nullopt);
        return R::ok(std::optional<M>(value));
    }

    [[nodiscard]] uint64_t id() const noexcept { return m_raw.port_id(); }

  private:
    template <ShmPayload> friend class PubSubService;
    explicit Subscriber(detail::RawSubscriber raw) : m_raw(std::move(raw)) {}

    detail::RawSubscriber m_raw;
};

/**
 * @brief Typed handle on a pub/sub service. Copies share the same open handle.
 *
 * The segment records sizeof(M), alignof(M) and typeid(M).name(); opening a
 * service created for another type fails with ServiceOpenError::IncompatibleTypes.
 * Limits come from the node's TransportConfig.
 */
template <ShmPayload M> class PubSubService
{
  public:
    [[nodiscard]] static utils::Result<PubSubService, ServiceOpenError>
    open_or_create(const Node &node, const ServiceName &name)
    {
        using R = utils::Result<PubSubService, ServiceOpenError>;
        auto raw = detail::RawPubSubService::open_or_create(
            node, name, PayloadShape{sizeof(M), alignof(M), typeid(M).name()});
        if (raw.is_error())
            return R::error(raw.error(), raw.error_code());
        return R::ok(PubSubService(std::move(raw).content()));
    }

    [[nodiscard]] utils::Result<Subscriber<M>, SubscriberCreateError> subscriber() const
    {
        using R = utils::Result<Subscriber<M>, SubscriberCreateError>;
        auto raw = m_raw.subscriber();
        if (raw.is_error())
            return R::error(raw.error());
        return R::ok(Subscriber<M>(std::move(raw).content()));
    }

    [[nodiscard]] utils::Result<Publisher<M>, PublisherCreateError> publisher() const
    {
        using R = utils::Result<Publisher<M>, PublisherCreateError>;
        auto raw = m_raw.publisher();
        if (raw.is_error())
            return R::error(raw.error());
        return R::ok(Publisher<M>(std::move(raw).content()));
    }

    [[nodiscard]] const ServiceName &name() const noexcept { return m_raw.name(); }

  private:
    explicit PubSubService(detail::RawPubSubService raw) : m_raw(std::move(raw)) {}

    detail::RawPubSubService m_raw;
};

} // namespace solohub::hub

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
