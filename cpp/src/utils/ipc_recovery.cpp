#include "utils/ipc_recovery.hpp"

#include "ipc_registry.hpp"

namespace solohub::hub
{

const char *to_string(RecoveryResult r) noexcept
{
    switch (r)
    {
    case RecoveryResult::Success:
        return "Success";
    case RecoveryResult::Failed:
        return "Failed";
    case RecoveryResult::Unsafe:
        return "Unsafe";
    case RecoveryResult::NotFound:
        return "NotFound";
    case RecoveryResult::NothingToDo:
        return "NothingToDo";
    }
    return "Unknown";
}

namespace
{

/// Runs `fn(PubSubHeader &)` on the named segment, registry and segment locked.
template <typename Fn>
RecoveryResult with_pubsub_segment(const TransportConfig &config, const ServiceName &service, Fn &&fn)
{
    auto opened = detail::lock_registry(config.domain, false);
    if (opened.is_error())
    {
        return opened.error() == detail::RegistryOpenError::NotFound ? RecoveryResult::NotFound
                                                                     : RecoveryResult::Failed;
    }
    detail::LockedRegistry locked = std::move(opened).content();

    const std::string seg_name =
        detail::service_segment_name(config.domain, detail::ServiceKind::PubSub, service.as_string());
    if (locked->find_service(seg_name) == nullptr)
        return RecoveryResult::NotFound;

    auto segment = detail::attach_ready_segment(seg_name, detail::ServiceKind::PubSub);
    if (!segment || segment->size() < sizeof(detail::PubSubHeader))
    {
        LOGGER_WARN("Recovery: segment '{}' is registered but not usable.", seg_name);
        return RecoveryResult::Failed;
    }
    auto *ps = segment->as<detail::PubSubHeader>();
    SharedSpinLock seg_lock(&ps->common.lock, seg_name);
    SharedSpinLockGuard guard(seg_lock);
    return fn(*ps);
}

} // namespace

std::optional<PubSubDiagnostic> diagnose_pubsub_service(const TransportConfig &config,
                                                        const ServiceName &service)
{
    PubSubDiagnostic diag;
    try
    {
        const RecoveryResult r =
            with_pubsub_segment(config, service, [&diag](detail::PubSubHeader &ps) {
                diag.subscriber_port_id = ps.subscriber.port_id.load(std::memory_order_acquire);
                if (diag.subscriber_port_id != 0)
                {
                    diag.subscriber_node_id = ps.subscriber.node_id;
                    diag.subscriber_pid = ps.subscriber.pid;
                    diag.subscriber_alive = platform::is_process_alive(ps.subscriber.pid);
                }
                for (size_t i = 0; i < ps.max_publishers && i < detail::kMaxPublishers; ++i)
                {
                    if (ps.publishers[i].port_id.load(std::memory_order_acquire) != 0)
                        ++diag.publisher_count;
                }
                diag.queued_samples = ps.ring_count;
                diag.overwritten_samples = ps.overwritten;
                diag.open_handles = detail::count_open_handles(&ps.common);
                return RecoveryResult::Success;
            });
        if (r != RecoveryResult::Success)
            return std::nullopt;
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("Recovery: diagnosing '{}' failed: {}", service.as_string(), e.what());
        return std::nullopt;
    }
    return diag;
}

RecoveryResult force_release_subscriber(const TransportConfig &config, const ServiceName &service,
                                        bool force)
{
    try
    {
        return with_pubsub_segment(config, service, [&](detail::PubSubHeader &ps) {
            const uint64_t port_id = ps.subscriber.port_id.load(std::memory_order_acquire);
            if (port_id == 0)
                return RecoveryResult::NothingToDo;
            const uint64_t pid = ps.subscriber.pid;
            if (!force && platform::is_process_alive(pid))
            {
                LOGGER_WARN("Recovery: subscriber {} of '{}' is held by live PID {}; not released.",
                            port_id, service.as_string(), pid);
                return RecoveryResult::Unsafe;
            }
            detail::release_port_slot(ps.subscriber, port_id);
            ps.ring_head = 0;
            ps.ring_count = 0;
            LOGGER_WARN("Recovery: released subscriber {} of '{}' (PID {}).", port_id,
                        service.as_string(), pid);
            return RecoveryResult::Success;
        });
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("Recovery: releasing subscriber of '{}' failed: {}", service.as_string(),
                     e.what());
        return RecoveryResult::Failed;
    }
}

} // namespace solohub::hub
