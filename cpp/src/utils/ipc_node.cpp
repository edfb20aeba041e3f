#include "ipc_registry.hpp"

#include <cerrno>
#include <ctime>

namespace solohub::hub
{

namespace
{

NodeCreationFailure creation_failure_from(detail::RegistryOpenError e) noexcept
{
    switch (e)
    {
    case detail::RegistryOpenError::InsufficientPermissions:
        return NodeCreationFailure::InsufficientPermissions;
    case detail::RegistryOpenError::Corrupted:
        return NodeCreationFailure::RegistryCorrupted;
    default:
        return NodeCreationFailure::InternalError;
    }
}

bool in_range(size_t value, size_t lo, size_t hi) noexcept
{
    return value >= lo && value <= hi;
}

bool config_is_valid(const TransportConfig &config)
{
    if (auto name_check = validate_name(config.domain); name_check.is_error())
    {
        LOGGER_ERROR("Transport domain '{}' is not a valid name: {}.", config.domain,
                     to_string(name_check.error()));
        return false;
    }
    if (!in_range(config.subscriber_buffer_size, 1, detail::kMaxSubscriberBufferSize) ||
        !in_range(config.max_publishers, 1, detail::kMaxPublishers) ||
        !in_range(config.max_listeners, 1, detail::kMaxListeners) ||
        !in_range(config.max_notifiers, 1, detail::kMaxNotifiers))
    {
        LOGGER_ERROR("Transport limits out of range: buffer={} (1..{}), publishers={} (1..{}), "
                     "listeners={} (1..{}), notifiers={} (1..{}).",
                     config.subscriber_buffer_size, detail::kMaxSubscriberBufferSize,
                     config.max_publishers, detail::kMaxPublishers, config.max_listeners,
                     detail::kMaxListeners, config.max_notifiers, detail::kMaxNotifiers);
        return false;
    }
    return true;
}

void sweep_dead_nodes(const TransportConfig &config)
{
    auto listed = Node::list(config, [](const NodeState &state) {
        if (state.liveness() != NodeLiveness::Dead)
            return;
        if (auto cleaned = state.remove_stale_resources(); cleaned.is_error())
        {
            LOGGER_WARN("Could not remove dead node {} ('{}'): {}.", state.details().node_id,
                        state.details().name, to_string(cleaned.error()));
        }
    });
    if (listed.is_error())
        LOGGER_WARN("Dead node sweep of domain '{}' skipped: {}.", config.domain,
                    to_string(listed.error()));
}

} // namespace

// ============================================================================
// NodeState
// ============================================================================

NodeState::NodeState(std::string domain, NodeDetails details, NodeLiveness liveness)
    : m_domain(std::move(domain)), m_details(std::move(details)), m_liveness(liveness)
{
}

utils::VoidResult<NodeCleanupFailure> NodeState::remove_stale_resources() const
{
    return detail::remove_node_resources(m_domain, m_details);
}

// ============================================================================
// Node
// ============================================================================

utils::Result<Node, NodeCreationFailure> Node::create(const NodeName &name,
                                                      const TransportConfig &config)
{
    using R = utils::Result<Node, NodeCreationFailure>;
    if (!config_is_valid(config))
        return R::error(NodeCreationFailure::InvalidConfiguration);

    if (config.cleanup_dead_nodes_on_creation)
        sweep_dead_nodes(config);

    try
    {
        auto opened = detail::lock_registry(config.domain, true);
        if (opened.is_error())
        {
            LOGGER_ERROR("Node '{}': registry of domain '{}' unavailable: {}.", name.as_string(),
                         config.domain, detail::to_string(opened.error()));
            return R::error(creation_failure_from(opened.error()), opened.error_code());
        }
        detail::LockedRegistry locked = std::move(opened).content();

        detail::NodeEntry *entry = locked->find_free_node();
        if (entry == nullptr)
        {
            LOGGER_ERROR("Node '{}': all {} node slots of domain '{}' are taken.", name.as_string(),
                         detail::kMaxNodes, config.domain);
            return R::error(NodeCreationFailure::ExceedsMaxNumberOfNodes);
        }

        const uint64_t node_id = locked->header()->next_node_id++;
        entry->owner_pid = platform::get_pid();
        entry->created_ns = platform::monotonic_time_ns();
        detail::copy_fixed(entry->name, detail::kNodeNameCapacity, name.as_string());
        entry->node_id.store(node_id, std::memory_order_release);

        auto impl = std::make_shared<detail::NodeImpl>(locked.shared(), node_id, name, config);
        LOGGER_DEBUG("Node '{}' (id {}) registered in domain '{}'.", name.as_string(), node_id,
                     config.domain);
        return R::ok(Node(std::move(impl)));
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("Node '{}': creation failed: {}", name.as_string(), e.what());
        return R::error(NodeCreationFailure::InternalError);
    }
}

utils::VoidResult<NodeListFailure> Node::list(const TransportConfig &config,
                                              const std::function<void(const NodeState &)> &callback)
{
    using R = utils::VoidResult<NodeListFailure>;
    std::vector<NodeDetails> nodes;
    try
    {
        auto opened = detail::lock_registry(config.domain, false);
        if (opened.is_error())
        {
            switch (opened.error())
            {
            case detail::RegistryOpenError::NotFound:
                return R::ok();
            case detail::RegistryOpenError::InsufficientPermissions:
                return R::error(NodeListFailure::InsufficientPermissions, opened.error_code());
            case detail::RegistryOpenError::Corrupted:
                return R::error(NodeListFailure::RegistryCorrupted);
            case detail::RegistryOpenError::InternalError:
                break;
            }
            return R::error(NodeListFailure::InternalError, opened.error_code());
        }
        detail::LockedRegistry locked = std::move(opened).content();
        nodes = detail::snapshot_nodes(*locked.shared());
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("Listing nodes of domain '{}' failed: {}", config.domain, e.what());
        return R::error(NodeListFailure::InternalError);
    }

    for (auto &details : nodes)
    {
        const NodeLiveness liveness = platform::is_process_alive(details.owner_pid)
                                          ? NodeLiveness::Alive
                                          : NodeLiveness::Dead;
        callback(NodeState(config.domain, std::move(details), liveness));
    }
    return R::ok();
}

utils::VoidResult<NodeWaitFailure> Node::wait(std::chrono::nanoseconds duration) const
{
    using R = utils::VoidResult<NodeWaitFailure>;
    if (duration <= std::chrono::nanoseconds::zero())
        return R::ok();
#if defined(SOLOHUB_IS_WINDOWS)
    ::Sleep(static_cast<DWORD>(
        std::chrono::ceil<std::chrono::milliseconds>(duration).count()));
    return R::ok();
#else
    const auto secs = std::chrono::duration_cast<std::chrono::seconds>(duration);
    struct timespec request{};
    request.tv_sec = static_cast<time_t>(secs.count());
    request.tv_nsec = static_cast<long>((duration - secs).count());
    if (::nanosleep(&request, nullptr) != 0)
    {
        const int err = errno;
        return R::error(NodeWaitFailure::Interrupt, err);
    }
    return R::ok();
#endif
}

const NodeName &Node::name() const noexcept
{
    return m_impl->name();
}

uint64_t Node::id() const noexcept
{
    return m_impl->id();
}

const TransportConfig &Node::config() const noexcept
{
    return m_impl->config();
}

} // namespace solohub::hub
