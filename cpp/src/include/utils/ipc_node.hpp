#pragma once
/**
 * @file ipc_node.hpp
 * @brief Node: a process-local participant of a shared-memory transport domain.
 *
 * A domain is a registry segment (`/<domain>_registry`) shared by every process
 * on the host that uses the same TransportConfig::domain. The registry records
 * which nodes exist, which process owns each of them, and which service segments
 * are open. Everything else (pub/sub and event services, their ports) hangs off a
 * Node and keeps it alive through shared ownership.
 *
 * A process that dies without dropping its nodes leaves their entries and ports
 * behind. Node::list() reports such nodes as NodeLiveness::Dead and
 * NodeState::remove_stale_resources() reclaims what they held.
 *
 * Process signal handling is never touched by this module.
 */
#include "solohub_utils_export.h"
#include "utils/ipc_errors.hpp"
#include "utils/ipc_names.hpp"
#include "utils/result.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace solohub::hub
{

/**
 * @brief Limits and behavior of a transport domain.
 *
 * The limits apply to services this node creates. Opening an existing service
 * requires its limits to be at least the requested ones.
 */
struct TransportConfig
{
    /// Prefix of every shared-memory object of the domain. Same rules as NodeName.
    std::string domain = "solohub";
    /// Samples a subscriber can hold before the oldest one is overwritten (1..1024).
    size_t subscriber_buffer_size = 8;
    /// Publisher ports per pub/sub service (1..64).
    size_t max_publishers = 16;
    /// Listener ports per event service (1..32).
    size_t max_listeners = 16;
    /// Notifier ports per event service (1..32).
    size_t max_notifiers = 16;
    /// Node::create() sweeps dead nodes of the domain before registering.
    bool cleanup_dead_nodes_on_creation = true;
};

enum class NodeLiveness : uint8_t
{
    Alive,
    Dead,
};

struct NodeDetails
{
    uint64_t node_id = 0;
    uint64_t owner_pid = 0;
    std::string name;
};

/**
 * @brief Snapshot of one registered node, as reported by Node::list().
 */
class SOLOHUB_UTILS_EXPORT NodeState
{
  public:
    NodeState(std::string domain, NodeDetails details, NodeLiveness liveness);

    [[nodiscard]] NodeLiveness liveness() const noexcept { return m_liveness; }
    [[nodiscard]] const NodeDetails &details() const noexcept { return m_details; }

    /**
     * @brief Reclaims everything a dead node left behind.
     *
     * Releases the node's ports and service handles in every registered service,
     * unlinks service segments the node left half-initialized or that no longer
     * have any handle, and removes the node entry. Idempotent: a node that is
     * already gone counts as success.
     *
     * @return NodeStillAlive if the owning process is alive.
     */
    [[nodiscard]] utils::VoidResult<NodeCleanupFailure> remove_stale_resources() const;

  private:
    std::string m_domain;
    NodeDetails m_details;
    NodeLiveness m_liveness;
};

namespace detail
{
class NodeImpl;
}

class SOLOHUB_UTILS_EXPORT Node
{
  public:
    /**
     * @brief Registers a new node in the domain of `config`.
     *
     * Creates the domain registry if it does not exist yet.
     */
    [[nodiscard]] static utils::Result<Node, NodeCreationFailure>
    create(const NodeName &name, const TransportConfig &config = {});

    /**
     * @brief Calls `callback` once per registered node of the domain.
     *
     * The registry is snapshotted under its lock; callbacks run without holding it,
     * so they may call NodeState::remove_stale_resources(). A domain whose
     * registry does not exist has no nodes.
     */
    [[nodiscard]] static utils::VoidResult<NodeListFailure>
    list(const TransportConfig &config, const std::function<void(const NodeState &)> &callback);

    /**
     * @brief Sleeps for `duration`.
     * @return NodeWaitFailure::Interrupt if a signal cut the sleep short.
     */
    [[nodiscard]] utils::VoidResult<NodeWaitFailure> wait(std::chrono::nanoseconds duration) const;

    [[nodiscard]] const NodeName &name() const noexcept;
    [[nodiscard]] uint64_t id() const noexcept;
    [[nodiscard]] const TransportConfig &config() const noexcept;

    /// Shared state used by the services created from this node.
    [[nodiscard]] const std::shared_ptr<detail::NodeImpl> &impl() const noexcept { return m_impl; }

  private:
    explicit Node(std::shared_ptr<detail::NodeImpl> impl) : m_impl(std::move(impl)) {}

    std::shared_ptr<detail::NodeImpl> m_impl;
};

} // namespace solohub::hub

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
