#pragma once
/**
 * @file single_process.hpp
 * @brief Single-instance coordination over a one-subscriber pub/sub service.
 *
 * Every process that calls single_process() with the same service name races for
 * the service's only subscriber slot:
 *  - the winner spawns a subscriber loop on a background thread and gets
 *    BecameSubscriber with a SubscriberHandle;
 *  - everyone else produces one message, sends it to the winner, fires the
 *    notify event and gets DelegatedToExisting.
 *
 * subscribe_only() is for a process that must take over: it fires the replace
 * event until the current subscriber vacates the slot (or `timeout` passes).
 *
 * Event ids kNotifyEvent and kReplaceEvent are reserved on the service's event
 * channel.
 *
 * @code
 * solohub::ipc::SingleProcessConfig config;
 * config.node_name = "viewer";
 * auto outcome = solohub::ipc::single_process<OpenRequest>(
 *     config, [&] { return OpenRequest::from(argv[1]); },
 *     [](const OpenRequest &request) { open_window(request); });
 * @endcode
 */
#include "solo_service.hpp"
#include "utils/ipc_event.hpp"
#include "utils/ipc_node.hpp"
#include "utils/ipc_pubsub.hpp"
#include "utils/subscriber_handle.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <variant>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace solohub::ipc
{

/// "New data is available."
inline constexpr hub::EventId kNotifyEvent{11};
/// "The current subscriber must vacate the slot."
inline constexpr hub::EventId kReplaceEvent{13};

inline constexpr std::string_view kDefaultServiceName = "single_process";
inline constexpr std::string_view kDefaultThreadName = "single_process_subscriber";
inline constexpr std::chrono::milliseconds kDefaultReplaceTimeout{200};

/// Subscriber loop wait between drains when no event arrives.
inline constexpr std::chrono::milliseconds kSubscriberPollInterval{200};
/// Settle time after a send whose notify reached the subscriber.
inline constexpr std::chrono::milliseconds kNotifiedSettle{50};
/// Settle time after a send whose notify failed; one full subscriber poll.
inline constexpr std::chrono::milliseconds kUnnotifiedSettle{200};

enum class SingleProcessErrorKind : uint8_t
{
    InvalidName,
    NodeCreation,
    ServiceCreation,
    EventServiceCreation,
    SubscriberCreation,
    ListenerCreation,
    PublisherCreation,
    NotifierCreation,
    MessageProduction,
    Loan,
    Send,
    Notify,
    ThreadSpawn,
    Timeout,
    Receive,
    MessageHandling,
};

SOLOHUB_UTILS_EXPORT const char *to_string(SingleProcessErrorKind kind) noexcept;

/**
 * @brief The one error type of the coordination entry points.
 *
 * `code` carries the transport's detail code (usually errno) where there is one.
 * `timeout` is only set for SingleProcessErrorKind::Timeout.
 */
struct SOLOHUB_UTILS_EXPORT SingleProcessError
{
    SingleProcessErrorKind kind = SingleProcessErrorKind::InvalidName;
    std::string detail;
    int code = 0;
    std::chrono::nanoseconds timeout{0};

    [[nodiscard]] static SingleProcessError make(SingleProcessErrorKind kind, std::string detail,
                                                 int code = 0);
    [[nodiscard]] static SingleProcessError timed_out(std::chrono::nanoseconds timeout);

    /// "<Kind>: <detail>", or "subscribe_only reached timeout of 0.2000s".
    [[nodiscard]] std::string what() const;
};

/// Plain configuration of single_process(). Only node_name has no usable default.
struct SingleProcessConfig
{
    std::string node_name;
    std::string service_name{kDefaultServiceName};
    std::string thread_name{kDefaultThreadName};
    hub::TransportConfig transport{};
};

struct SubscribeOnlyConfig
{
    std::string node_name;
    std::string service_name{kDefaultServiceName};
    std::string thread_name{kDefaultThreadName};
    std::chrono::nanoseconds timeout{kDefaultReplaceTimeout};
    hub::TransportConfig transport{};
};

struct BecameSubscriber
{
    SubscriberHandle handle;
};

struct DelegatedToExisting
{
};

using SingleProcessOutcome = std::variant<BecameSubscriber, DelegatedToExisting>;

/// Builds the message a delegating process sends. May throw; nothing is sent then.
template <typename M> using MessageProducer = std::function<M()>;
/// Called on the loop thread once per received message. Throwing ends the loop.
template <typename M> using MessageHandler = std::function<void(const M &)>;

/// Node and both channels of one coordination service.
template <hub::ShmPayload M> struct Channels
{
    hub::Node node;
    hub::PubSubService<M> data;
    hub::EventService events;
};

namespace detail
{
struct ValidatedNames
{
    hub::NodeName node;
    hub::ServiceName service;
};

SOLOHUB_UTILS_EXPORT utils::Result<ValidatedNames, SingleProcessError>
validate_names(std::string_view node_name, std::string_view service_name);

/// Best-effort removal of every dead node of the domain. Failures are logged.
SOLOHUB_UTILS_EXPORT void cleanup_dead_nodes(const hub::TransportConfig &transport);

/// Open failures that mean "the service exists with another shape"; no cleanup helps those.
[[nodiscard]] SOLOHUB_UTILS_EXPORT bool is_shape_mismatch(hub::ServiceOpenError error) noexcept;

/**
 * @brief Waits on `node` after a send so the subscriber can drain it.
 * @return kNotifiedSettle when the notify went out, kUnnotifiedSettle when it failed.
 * A failed notify or an interrupted wait is logged only.
 */
SOLOHUB_UTILS_EXPORT std::chrono::milliseconds
settle_after_publish(const hub::Node &node, const utils::Result<size_t, hub::NotifyError> &notified);

template <hub::ShmPayload M>
utils::VoidResult<SingleProcessError> run_subscriber_loop(const hub::Subscriber<M> &subscriber,
                                                          const hub::EventService &events,
                                                          const MessageHandler<M> &on_message,
                                                          std::atomic<bool> &keep_alive)
{
    using R = utils::VoidResult<SingleProcessError>;
    auto listener = events.listener();
    if (listener.is_error())
        return R::error(SingleProcessError::make(SingleProcessErrorKind::ListenerCreation,
                                                 hub::to_string(listener.error())));

    const auto on_event = [&keep_alive](hub::EventId id) {
        if (id == kReplaceEvent)
        {
            LOGGER_INFO("received replace event, exiting subscribe loop");
            keep_alive.store(false, std::memory_order_relaxed);
        }
    };

    while (keep_alive.load(std::memory_order_relaxed))
    {
        auto waited = listener.content().timed_wait_all(on_event, kSubscriberPollInterval);
        if (waited.is_error())
            return R::error(SingleProcessError::make(SingleProcessErrorKind::Receive,
                                                     fmt::format("event wait: {}",
                                                                 hub::to_string(waited.error()))));
        for (;;)
        {
            auto received = subscriber.receive();
            if (received.is_error())
                return R::error(SingleProcessError::make(SingleProcessErrorKind::Receive,
                                                         hub::to_string(received.error())));
            if (!received.content().has_value())
                break;
            LOGGER_INFO("received ipc message");
            try
            {
                on_message(*received.content());
            }
            catch (const std::exception &e)
            {
                return R::error(
                    SingleProcessError::make(SingleProcessErrorKind::MessageHandling, e.what()));
            }
            catch (...)
            {
                // Anything else thrown here would reach std::terminate on the detached thread.
                return R::error(SingleProcessError::make(SingleProcessErrorKind::MessageHandling,
                                                         "unknown exception"));
            }
        }
    }
    return R::ok();
}
} // namespace detail

/**
 * @brief Opens the node, the data channel and the event channel.
 *
 * When the data channel cannot be opened for a reason other than a shape
 * mismatch, dead nodes of the domain are cleaned up once and the open is retried
 * once.
 */
template <hub::ShmPayload M>
utils::Result<Channels<M>, SingleProcessError> open_or_create_channels(const hub::NodeName &node_name,
                                                                       const hub::ServiceName &service_name,
                                                                       const hub::TransportConfig &transport = {})
{
    using R = utils::Result<Channels<M>, SingleProcessError>;

    auto node = hub::Node::create(node_name, transport);
    if (node.is_error())
        return R::error(SingleProcessError::make(SingleProcessErrorKind::NodeCreation,
                                                 hub::to_string(node.error()), node.error_code()));

    auto data = hub::PubSubService<M>::open_or_create(node.content(), service_name);
    if (data.is_error() && !detail::is_shape_mismatch(data.error()))
    {
        LOGGER_INFO("opening service '{}' failed ({}), cleaning up dead nodes and retrying",
                    service_name.as_string(), hub::to_string(data.error()));
        detail::cleanup_dead_nodes(transport);
        data = hub::PubSubService<M>::open_or_create(node.content(), service_name);
    }
    if (data.is_error())
        return R::error(SingleProcessError::make(SingleProcessErrorKind::ServiceCreation,
                                                 hub::to_string(data.error()), data.error_code()));

    auto events = hub::EventService::open_or_create(node.content(), service_name);
    if (events.is_error())
        return R::error(SingleProcessError::make(SingleProcessErrorKind::EventServiceCreation,
                                                 hub::to_string(events.error()),
                                                 events.error_code()));

    return R::ok(Channels<M>{std::move(node).content(), std::move(data).content(),
                             std::move(events).content()});
}

/**
 * @brief Starts the subscriber loop on a new thread named `thread_name`.
 *
 * The loop waits on the event channel for up to kSubscriberPollInterval, then
 * drains the data channel, calling `on_message` per message. A replace event or
 * SubscriberHandle::close() ends it after the current drain; a transport error or
 * a throwing handler ends it at once. On exit the subscriber slot is released
 * before the handle reports the loop gone.
 */
template <hub::ShmPayload M>
utils::Result<SubscriberHandle, SingleProcessError> spawn_subscriber_loop(hub::Subscriber<M> subscriber,
                                                                          hub::EventService events,
                                                                          std::string thread_name,
                                                                          MessageHandler<M> on_message)
{
    using R = utils::Result<SubscriberHandle, SingleProcessError>;
    auto created = SubscriberHandle::create();
    SubscriberHandle handle = created.first;
    SubscriberHandle::KeepAlive keep_alive = std::move(created.second);

    try
    {
        std::thread loop(
            [subscriber = std::move(subscriber), events = std::move(events),
             thread_name = std::move(thread_name), on_message = std::move(on_message),
             keep_alive = std::move(keep_alive)]() mutable {
                platform::set_current_thread_name(thread_name);
                {
                    // Ports die here, before the liveness flag goes away.
                    auto owned_subscriber = std::move(subscriber);
                    auto owned_events = std::move(events);
                    auto result = detail::run_subscriber_loop<M>(owned_subscriber, owned_events,
                                                                 on_message, *keep_alive);
                    if (result.is_error())
                        LOGGER_ERROR("error receiving ipc messages\n{}", result.error().what());
                }
                LOGGER_INFO("closing ipc thread");
                keep_alive->store(false, std::memory_order_relaxed);
                keep_alive.reset();
            });
        loop.detach();
    }
    catch (const std::system_error &e)
    {
        return R::error(SingleProcessError::make(SingleProcessErrorKind::ThreadSpawn, e.what(),
                                                 e.code().value()));
    }
    return R::ok(std::move(handle));
}

/**
 * @brief Sends one produced message to the current subscriber and notifies it.
 *
 * After a successful send the caller settles (see detail::settle_after_publish)
 * so the subscriber can pick the message up before this process exits.
 */
template <hub::ShmPayload M>
utils::VoidResult<SingleProcessError> publish_input(const hub::Node &node, const hub::PubSubService<M> &data,
                                                    const hub::EventService &events,
                                                    const MessageProducer<M> &produce)
{
    using R = utils::VoidResult<SingleProcessError>;

    auto publisher = data.publisher();
    if (publisher.is_error())
        return R::error(SingleProcessError::make(SingleProcessErrorKind::PublisherCreation,
                                                 hub::to_string(publisher.error())));
    auto notifier = events.notifier(kNotifyEvent);
    if (notifier.is_error())
        return R::error(SingleProcessError::make(SingleProcessErrorKind::NotifierCreation,
                                                 hub::to_string(notifier.error())));

    auto loaned = publisher.content().loan();
    if (loaned.is_error())
        return R::error(
            SingleProcessError::make(SingleProcessErrorKind::Loan, hub::to_string(loaned.error())));
    auto sample = std::move(loaned).content();

    try
    {
        sample.write_payload(produce());
    }
    catch (const std::exception &e)
    {
        return R::error(SingleProcessError::make(SingleProcessErrorKind::MessageProduction, e.what()));
    }

    auto sent = std::move(sample).send();
    if (sent.is_error())
        return R::error(
            SingleProcessError::make(SingleProcessErrorKind::Send, hub::to_string(sent.error())));
    if (sent.content() == 0)
        LOGGER_WARN("ipc message sent but the subscriber had already left");
    else
        LOGGER_INFO("sent ipc message");

    detail::settle_after_publish(node, notifier.content().notify());
    return R::ok();
}

/**
 * @brief Fires the replace event until the subscriber slot is free, then takes it.
 *
 * Between attempts waits `backoff.next_delay()`; the default draws a random
 * delay with a bound of 2ms doubling to 100ms. A failed replace notify aborts;
 * a failed wait is logged and the attempt goes ahead. Fails with
 * SingleProcessErrorKind::Timeout once more than `timeout` has elapsed and the
 * slot is still taken.
 */
template <hub::ShmPayload M, typename Backoff = utils::RandomizedExponentialBackoff>
utils::Result<SubscriberHandle, SingleProcessError>
acquire_or_replace(const Channels<M> &channels, std::string thread_name, MessageHandler<M> on_message,
                   std::chrono::nanoseconds timeout, Backoff backoff = Backoff{})
{
    using R = utils::Result<SubscriberHandle, SingleProcessError>;

    auto notifier = channels.events.notifier(kReplaceEvent);
    if (notifier.is_error())
        return R::error(SingleProcessError::make(SingleProcessErrorKind::NotifierCreation,
                                                 hub::to_string(notifier.error())));

    const uint64_t start_ns = platform::monotonic_time_ns();
    const auto timeout_ns = static_cast<uint64_t>(std::max<int64_t>(timeout.count(), 0));

    for (;;)
    {
        auto notified = notifier.content().notify();
        if (notified.is_error())
            return R::error(SingleProcessError::make(SingleProcessErrorKind::Notify,
                                                     hub::to_string(notified.error())));

        auto waited = channels.node.wait(backoff.next_delay());
        if (waited.is_error())
            LOGGER_WARN("replace wait interrupted, {}", hub::to_string(waited.error()));

        auto subscriber = channels.data.subscriber();
        if (subscriber.is_ok())
        {
            LOGGER_INFO("took over subscriber slot of '{}'", channels.data.name().as_string());
            return spawn_subscriber_loop<M>(std::move(subscriber).content(), channels.events,
                                            std::move(thread_name), std::move(on_message));
        }
        if (subscriber.error() != hub::SubscriberCreateError::ExceedsMaxSupportedSubscribers)
            return R::error(SingleProcessError::make(SingleProcessErrorKind::SubscriberCreation,
                                                     hub::to_string(subscriber.error())));
        if (platform::elapsed_time_ns(start_ns) > timeout_ns)
            return R::error(SingleProcessError::timed_out(timeout));
    }
}

/**
 * @brief Becomes the subscriber of `config.service_name`, or hands a message to
 *        the existing one.
 *
 * When this returns an error, no message has reached any subscriber.
 */
template <hub::ShmPayload M>
utils::Result<SingleProcessOutcome, SingleProcessError> single_process(const SingleProcessConfig &config,
                                                                       const MessageProducer<M> &produce,
                                                                       MessageHandler<M> on_message)
{
    using R = utils::Result<SingleProcessOutcome, SingleProcessError>;

    auto names = detail::validate_names(config.node_name, config.service_name);
    if (names.is_error())
        return R::error(names.error());
    auto channels =
        open_or_create_channels<M>(names.content().node, names.content().service, config.transport);
    if (channels.is_error())
        return R::error(channels.error());
    Channels<M> &ch = channels.content();

    auto subscriber = ch.data.subscriber();
    if (subscriber.is_ok())
    {
        auto handle = spawn_subscriber_loop<M>(std::move(subscriber).content(), ch.events,
                                               config.thread_name, std::move(on_message));
        if (handle.is_error())
            return R::error(handle.error());
        return R::ok(SingleProcessOutcome(BecameSubscriber{handle.content()}));
    }
    if (subscriber.error() != hub::SubscriberCreateError::ExceedsMaxSupportedSubscribers)
        return R::error(SingleProcessError::make(SingleProcessErrorKind::SubscriberCreation,
                                                 hub::to_string(subscriber.error())));

    auto published = publish_input<M>(ch.node, ch.data, ch.events, produce);
    if (published.is_error())
        return R::error(published.error());
    return R::ok(SingleProcessOutcome(DelegatedToExisting{}));
}

/// Positional form of single_process(); thread name and transport use their defaults.
template <hub::ShmPayload M>
utils::Result<SingleProcessOutcome, SingleProcessError>
single_process(std::string_view node_name, std::string_view service_name, std::string_view thread_name,
               const MessageProducer<M> &produce, MessageHandler<M> on_message)
{
    SingleProcessConfig config;
    config.node_name = std::string(node_name);
    config.service_name = std::string(service_name);
    config.thread_name = std::string(thread_name);
    return single_process<M>(config, produce, std::move(on_message));
}

/**
 * @brief Becomes the subscriber of `config.service_name`, replacing the current
 *        one if there is one.
 */
template <hub::ShmPayload M>
utils::Result<SubscriberHandle, SingleProcessError> subscribe_only(const SubscribeOnlyConfig &config,
                                                                   MessageHandler<M> on_message)
{
    using R = utils::Result<SubscriberHandle, SingleProcessError>;

    auto names = detail::validate_names(config.node_name, config.service_name);
    if (names.is_error())
        return R::error(names.error());
    auto channels =
        open_or_create_channels<M>(names.content().node, names.content().service, config.transport);
    if (channels.is_error())
        return R::error(channels.error());
    Channels<M> &ch = channels.content();

    auto subscriber = ch.data.subscriber();
    if (subscriber.is_ok())
        return spawn_subscriber_loop<M>(std::move(subscriber).content(), ch.events,
                                        config.thread_name, std::move(on_message));
    if (subscriber.error() != hub::SubscriberCreateError::ExceedsMaxSupportedSubscribers)
        return R::error(SingleProcessError::make(SingleProcessErrorKind::SubscriberCreation,
                                                 hub::to_string(subscriber.error())));

    return acquire_or_replace<M>(ch, config.thread_name, std::move(on_message), config.timeout);
}

template <hub::ShmPayload M>
utils::Result<SubscriberHandle, SingleProcessError>
subscribe_only(std::string_view node_name, std::string_view service_name, std::string_view thread_name,
               MessageHandler<M> on_message, std::chrono::nanoseconds timeout = kDefaultReplaceTimeout)
{
    SubscribeOnlyConfig config;
    config.node_name = std::string(node_name);
    config.service_name = std::string(service_name);
    config.thread_name = std::string(thread_name);
    config.timeout = timeout;
    return subscribe_only<M>(config, std::move(on_message));
}

} // namespace solohub::ipc

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
