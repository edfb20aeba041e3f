#pragma once
/**
 * @file ipc_registry.hpp
 * @brief Domain registry, node state and service segment bookkeeping.
 *
 * Internal header shared by ipc_node.cpp, ipc_pubsub.cpp, ipc_event.cpp and
 * ipc_recovery.cpp.
 */
#include "ipc_segment.hpp"
#include "utils/ipc_node.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace solohub::hub::detail
{

enum class RegistryOpenError : uint8_t
{
    InternalError,
    NotFound,
    InsufficientPermissions,
    Corrupted,
};

const char *to_string(RegistryOpenError e) noexcept;

/**
 * @class Registry
 * @brief Process-local mapping of a domain registry segment.
 *
 * Table accessors require the registry lock (see LockedRegistry).
 */
class Registry
{
  public:
    Registry(std::string domain, MappedSegment segment);

    Registry(const Registry &) = delete;
    Registry &operator=(const Registry &) = delete;

    /**
     * @brief Maps the registry of `domain`, creating it if `create` is set.
     *
     * Waits (bounded) for a concurrent creator to finish initialization. A
     * registry whose creator died mid-initialization is unlinked and recreated.
     * The returned registry may already be retired; lock_registry() handles that.
     */
    static utils::Result<std::shared_ptr<Registry>, RegistryOpenError> open(const std::string &domain,
                                                                            bool create);

    [[nodiscard]] RegistryHeader *header() const noexcept { return m_segment.as<RegistryHeader>(); }
    [[nodiscard]] SharedSpinLock &lock() noexcept { return m_lock; }
    [[nodiscard]] const std::string &domain() const noexcept { return m_domain; }
    [[nodiscard]] bool is_retired() const noexcept;

    [[nodiscard]] NodeEntry *find_node(uint64_t node_id) const noexcept;
    [[nodiscard]] NodeEntry *find_free_node() const noexcept;
    [[nodiscard]] ServiceEntry *find_service(std::string_view segment_name) const noexcept;
    [[nodiscard]] ServiceEntry *find_free_service() const noexcept;

    /// No nodes and no services left.
    [[nodiscard]] bool empty() const noexcept;

    /// Marks the registry retired and unlinks its name. Lock held.
    void retire() noexcept;

  private:
    std::string m_domain;
    MappedSegment m_segment;
    SharedSpinLock m_lock;
};

/**
 * @class LockedRegistry
 * @brief Holds the registry lock for its lifetime.
 */
class LockedRegistry
{
  public:
    explicit LockedRegistry(std::shared_ptr<Registry> registry);
    ~LockedRegistry();

    LockedRegistry(LockedRegistry &&other) noexcept;
    LockedRegistry &operator=(LockedRegistry &&) = delete;
    LockedRegistry(const LockedRegistry &) = delete;
    LockedRegistry &operator=(const LockedRegistry &) = delete;

    Registry *operator->() const noexcept { return m_registry.get(); }
    [[nodiscard]] const std::shared_ptr<Registry> &shared() const noexcept { return m_registry; }

  private:
    std::shared_ptr<Registry> m_registry;
};

/**
 * @brief Maps and locks a live (not retired) registry of `domain`.
 * @return NotFound only when `create` is false and the domain has no registry.
 */
utils::Result<LockedRegistry, RegistryOpenError> lock_registry(const std::string &domain, bool create);

/**
 * @class NodeImpl
 * @brief A registered node. Removes its registry entry on destruction and
 *        retires the registry when it was the last user.
 */
class NodeImpl
{
  public:
    NodeImpl(std::shared_ptr<Registry> registry, uint64_t node_id, NodeName name,
             TransportConfig config);
    ~NodeImpl();

    NodeImpl(const NodeImpl &) = delete;
    NodeImpl &operator=(const NodeImpl &) = delete;

    [[nodiscard]] uint64_t id() const noexcept { return m_id; }
    [[nodiscard]] const NodeName &name() const noexcept { return m_name; }
    [[nodiscard]] const TransportConfig &config() const noexcept { return m_config; }
    [[nodiscard]] const std::shared_ptr<Registry> &registry() const noexcept { return m_registry; }

  private:
    std::shared_ptr<Registry> m_registry;
    uint64_t m_id;
    NodeName m_name;
    TransportConfig m_config;
};

/**
 * @class ServiceCore
 * @brief One open handle on a service segment.
 *
 * Occupies a handle slot of the segment. On destruction the slot is freed and,
 * when no handle is left, the segment is unlinked and its registry entry removed.
 */
class ServiceCore
{
  public:
    ServiceCore(std::shared_ptr<NodeImpl> node, ServiceName service, MappedSegment segment,
                size_t handle_index);
    ~ServiceCore();

    ServiceCore(const ServiceCore &) = delete;
    ServiceCore &operator=(const ServiceCore &) = delete;

    [[nodiscard]] SegmentHeader *header() const noexcept { return m_segment.as<SegmentHeader>(); }
    template <typename T> [[nodiscard]] T *layout() const noexcept { return m_segment.as<T>(); }
    [[nodiscard]] SharedSpinLock &lock() noexcept { return m_lock; }
    [[nodiscard]] const ServiceName &service_name() const noexcept { return m_service; }
    [[nodiscard]] const std::string &segment_name() const noexcept { return m_segment.name(); }
    [[nodiscard]] const NodeImpl &node() const noexcept { return *m_node; }

    /// Next port id of this segment. Segment lock held.
    [[nodiscard]] uint64_t allocate_port_id() noexcept;

  private:
    std::shared_ptr<NodeImpl> m_node;
    ServiceName m_service;
    MappedSegment m_segment;
    SharedSpinLock m_lock;
    size_t m_handle_index;
};

/// Writes the kind-specific part of a fresh (zero-filled) segment.
using SegmentInit = std::function<void(void *base)>;
/// Checks an existing ready segment against the request; nullopt when compatible.
using SegmentVerify = std::function<std::optional<ServiceOpenError>(const void *base, size_t size)>;

struct SegmentRequest
{
    ServiceKind kind;
    size_t size;
    SegmentInit init;
    SegmentVerify verify;
};

/**
 * @brief Opens the service segment, creating it if the registry has no entry.
 *
 * Runs entirely under the registry lock, so opening and closing services of one
 * domain is serialized across processes.
 */
utils::Result<std::shared_ptr<ServiceCore>, ServiceOpenError>
open_or_create_service(const std::shared_ptr<NodeImpl> &node, const ServiceName &service,
                       const SegmentRequest &request);

/**
 * @brief Maps an existing ready service segment without taking a handle slot.
 *        For diagnostics and recovery. Registry lock held.
 */
std::optional<MappedSegment> attach_ready_segment(const std::string &segment_name, ServiceKind kind);

/// Node table snapshot (registry lock held).
std::vector<NodeDetails> snapshot_nodes(const Registry &registry);

/// Reclaims the resources of a dead node. See NodeState::remove_stale_resources().
utils::VoidResult<NodeCleanupFailure> remove_node_resources(const std::string &domain,
                                                            const NodeDetails &details);

} // namespace solohub::hub::detail
