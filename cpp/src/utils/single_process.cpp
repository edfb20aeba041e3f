#include "utils/single_process.hpp"

namespace solohub::ipc
{

const char *to_string(SingleProcessErrorKind kind) noexcept
{
    switch (kind)
    {
    case SingleProcessErrorKind::InvalidName:
        return "InvalidName";
    case SingleProcessErrorKind::NodeCreation:
        return "NodeCreation";
    case SingleProcessErrorKind::ServiceCreation:
        return "ServiceCreation";
    case SingleProcessErrorKind::EventServiceCreation:
        return "EventServiceCreation";
    case SingleProcessErrorKind::SubscriberCreation:
        return "SubscriberCreation";
    case SingleProcessErrorKind::ListenerCreation:
        return "ListenerCreation";
    case SingleProcessErrorKind::PublisherCreation:
        return "PublisherCreation";
    case SingleProcessErrorKind::NotifierCreation:
        return "NotifierCreation";
    case SingleProcessErrorKind::MessageProduction:
        return "MessageProduction";
    case SingleProcessErrorKind::Loan:
        return "Loan";
    case SingleProcessErrorKind::Send:
        return "Send";
    case SingleProcessErrorKind::Notify:
        return "Notify";
    case SingleProcessErrorKind::ThreadSpawn:
        return "ThreadSpawn";
    case SingleProcessErrorKind::Timeout:
        return "Timeout";
    case SingleProcessErrorKind::Receive:
        return "Receive";
    case SingleProcessErrorKind::MessageHandling:
        return "MessageHandling";
    }
    return "Unknown";
}

SingleProcessError SingleProcessError::make(SingleProcessErrorKind kind, std::string detail, int code)
{
    SingleProcessError error;
    error.kind = kind;
    error.detail = std::move(detail);
    error.code = code;
    return error;
}

SingleProcessError SingleProcessError::timed_out(std::chrono::nanoseconds timeout)
{
    SingleProcessError error;
    error.kind = SingleProcessErrorKind::Timeout;
    error.timeout = timeout;
    return error;
}

std::string SingleProcessError::what() const
{
    if (kind == SingleProcessErrorKind::Timeout)
    {
        const double seconds = std::chrono::duration<double>(timeout).count();
        return fmt::format("subscribe_only reached timeout of {:.4f}s", seconds);
    }
    if (code != 0)
        return fmt::format("{}: {} (code {})", to_string(kind), detail, code);
    return fmt::format("{}: {}", to_string(kind), detail);
}

namespace detail
{

utils::Result<ValidatedNames, SingleProcessError> validate_names(std::string_view node_name,
                                                                 std::string_view service_name)
{
    using R = utils::Result<ValidatedNames, SingleProcessError>;
    auto node = hub::NodeName::create(node_name);
    if (node.is_error())
        return R::error(SingleProcessError::make(
            SingleProcessErrorKind::InvalidName,
            fmt::format("node name '{}': {}", node_name, hub::to_string(node.error()))));
    auto service = hub::ServiceName::create(service_name);
    if (service.is_error())
        return R::error(SingleProcessError::make(
            SingleProcessErrorKind::InvalidName,
            fmt::format("service name '{}': {}", service_name, hub::to_string(service.error()))));
    return R::ok(ValidatedNames{std::move(node).content(), std::move(service).content()});
}

void cleanup_dead_nodes(const hub::TransportConfig &transport)
{
    auto listed = hub::Node::list(transport, [](const hub::NodeState &state) {
        if (state.liveness() != hub::NodeLiveness::Dead)
            return;
        const hub::NodeDetails &details = state.details();
        LOGGER_INFO("cleanup of dead node {} ('{}', PID {})", details.node_id, details.name,
                    details.owner_pid);
        if (auto removed = state.remove_stale_resources(); removed.is_error())
            LOGGER_WARN("could not clean up stale resources, {}", hub::to_string(removed.error()));
    });
    if (listed.is_error())
        LOGGER_ERROR("failed to perform stale resource cleanup, {}", hub::to_string(listed.error()));
}

bool is_shape_mismatch(hub::ServiceOpenError error) noexcept
{
    switch (error)
    {
    case hub::ServiceOpenError::IncompatibleTypes:
    case hub::ServiceOpenError::IncompatibleAttributes:
    case hub::ServiceOpenError::IncompatibleMessagingPattern:
        return true;
    default:
        return false;
    }
}

std::chrono::milliseconds settle_after_publish(const hub::Node &node,
                                               const utils::Result<size_t, hub::NotifyError> &notified)
{
    std::chrono::milliseconds settle = kNotifiedSettle;
    if (notified.is_error())
    {
        LOGGER_WARN("could not send notification event, {}", hub::to_string(notified.error()));
        settle = kUnnotifiedSettle;
    }
    auto waited = node.wait(settle);
    if (waited.is_error())
        LOGGER_WARN("after-publish wait interrupted, {}", hub::to_string(waited.error()));
    return settle;
}

} // namespace detail

} // namespace solohub::ipc
