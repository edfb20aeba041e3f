/**
 * @file ipc_registry.cpp
 * @brief Domain registry segment, node entries and service segment bookkeeping.
 */
#include "ipc_registry.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <thread>

namespace solohub::hub::detail
{

namespace
{
constexpr int kOpenAttempts = 16;
constexpr uint64_t kInitWaitNs = 1'000'000'000; // a creator gets 1s to publish its segment

void sleep_briefly()
{
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
}

RegistryOpenError registry_error_from_errno(int err) noexcept
{
    switch (err)
    {
    case EACCES:
    case EPERM:
        return RegistryOpenError::InsufficientPermissions;
    case ENOENT:
        return RegistryOpenError::NotFound;
    default:
        return RegistryOpenError::InternalError;
    }
}

ServiceOpenError service_error_from_errno(int err) noexcept
{
    return (err == EACCES || err == EPERM) ? ServiceOpenError::InsufficientPermissions
                                           : ServiceOpenError::InternalError;
}

void clear_service_entry(ServiceEntry &entry) noexcept
{
    entry = ServiceEntry{};
}

bool segment_is_ready(const MappedSegment &segment) noexcept
{
    if (segment.size() < sizeof(SegmentHeader))
        return false;
    const auto *hdr = segment.as<SegmentHeader>();
    return hdr->magic.load(std::memory_order_acquire) == kSegmentMagic &&
           hdr->state.load(std::memory_order_acquire) == SegmentState::Ready &&
           segment.size() >= hdr->total_size;
}
} // namespace

const char *to_string(RegistryOpenError e) noexcept
{
    switch (e)
    {
    case RegistryOpenError::InternalError:
        return "InternalError";
    case RegistryOpenError::NotFound:
        return "NotFound";
    case RegistryOpenError::InsufficientPermissions:
        return "InsufficientPermissions";
    case RegistryOpenError::Corrupted:
        return "Corrupted";
    }
    return "Unknown";
}

// ============================================================================
// Registry
// ============================================================================

Registry::Registry(std::string domain, MappedSegment segment)
    : m_domain(std::move(domain)), m_segment(std::move(segment)),
      m_lock(&m_segment.as<RegistryHeader>()->lock, m_segment.name())
{
}

utils::Result<std::shared_ptr<Registry>, RegistryOpenError> Registry::open(const std::string &domain,
                                                                           bool create)
{
    using R = utils::Result<std::shared_ptr<Registry>, RegistryOpenError>;
    const std::string name = registry_segment_name(domain);

    for (int attempt = 0; attempt < kOpenAttempts; ++attempt)
    {
        if (create)
        {
            platform::ShmHandle created =
                platform::shm_create(name.c_str(), sizeof(RegistryHeader), platform::SHM_CREATE_EXCLUSIVE);
            if (created.base != nullptr)
            {
                auto *hdr = static_cast<RegistryHeader *>(created.base);
                hdr->version = kLayoutVersion;
                hdr->creator_pid = platform::get_pid();
                hdr->next_node_id = 1;
                hdr->magic.store(kRegistryMagic, std::memory_order_release);
                LOGGER_DEBUG("Registry '{}': created.", name);
                return R::ok(std::make_shared<Registry>(domain, MappedSegment(created, name)));
            }
            if (errno != EEXIST)
            {
                const int err = errno;
                LOGGER_ERROR("Registry '{}': shm_create failed: {}.", name, std::strerror(err));
                return R::error(registry_error_from_errno(err), err);
            }
        }

        // Someone else's registry: wait until it is sized and initialized.
        const uint64_t start_ns = platform::monotonic_time_ns();
        platform::ShmHandle attached{};
        bool vanished = false;
        for (;;)
        {
            attached = platform::shm_attach(name.c_str());
            if (attached.base != nullptr)
                break;
            const int err = errno;
            if (err == ENOENT)
            {
                vanished = true;
                break;
            }
            if (err != EAGAIN)
            {
                LOGGER_ERROR("Registry '{}': shm_attach failed: {}.", name, std::strerror(err));
                return R::error(registry_error_from_errno(err), err);
            }
            if (platform::elapsed_time_ns(start_ns) > kInitWaitNs)
            {
                LOGGER_WARN("Registry '{}': never sized by its creator, removing it.", name);
                platform::shm_unlink(name.c_str());
                vanished = true;
                break;
            }
            sleep_briefly();
        }
        if (vanished)
        {
            if (!create)
                return R::error(RegistryOpenError::NotFound, ENOENT);
            continue;
        }

        MappedSegment segment(attached, name);
        if (segment.size() < sizeof(RegistryHeader))
        {
            LOGGER_ERROR("Registry '{}': size {} is smaller than the layout ({}).", name,
                         segment.size(), sizeof(RegistryHeader));
            return R::error(RegistryOpenError::Corrupted);
        }

        auto *hdr = segment.as<RegistryHeader>();
        while (hdr->magic.load(std::memory_order_acquire) != kRegistryMagic &&
               platform::elapsed_time_ns(start_ns) <= kInitWaitNs)
        {
            sleep_briefly();
        }
        if (hdr->magic.load(std::memory_order_acquire) != kRegistryMagic)
        {
            const uint64_t creator = hdr->creator_pid;
            if (creator == 0 || !platform::is_process_alive(creator))
            {
                LOGGER_WARN("Registry '{}': creator PID {} died during initialization, removing it.",
                            name, creator);
                platform::shm_unlink(name.c_str());
                continue;
            }
            LOGGER_ERROR("Registry '{}': creator PID {} never finished initialization.", name, creator);
            return R::error(RegistryOpenError::Corrupted);
        }
        if (hdr->version != kLayoutVersion)
        {
            LOGGER_ERROR("Registry '{}': layout version {} (expected {}).", name, hdr->version,
                         kLayoutVersion);
            return R::error(RegistryOpenError::Corrupted);
        }
        return R::ok(std::make_shared<Registry>(domain, std::move(segment)));
    }

    LOGGER_ERROR("Registry '{}': giving up after {} attempts.", name, kOpenAttempts);
    return R::error(RegistryOpenError::InternalError);
}

bool Registry::is_retired() const noexcept
{
    return header()->retired.load(std::memory_order_acquire) != 0;
}

NodeEntry *Registry::find_node(uint64_t node_id) const noexcept
{
    if (node_id == 0)
        return nullptr;
    for (auto &entry : header()->nodes)
    {
        if (entry.node_id.load(std::memory_order_acquire) == node_id)
            return &entry;
    }
    return nullptr;
}

NodeEntry *Registry::find_free_node() const noexcept
{
    for (auto &entry : header()->nodes)
    {
        if (entry.node_id.load(std::memory_order_acquire) == 0)
            return &entry;
    }
    return nullptr;
}

ServiceEntry *Registry::find_service(std::string_view segment_name) const noexcept
{
    for (auto &entry : header()->services)
    {
        if (entry.in_use != 0 && read_fixed(entry.segment_name, kSegmentNameCapacity) == segment_name)
            return &entry;
    }
    return nullptr;
}

ServiceEntry *Registry::find_free_service() const noexcept
{
    for (auto &entry : header()->services)
    {
        if (entry.in_use == 0)
            return &entry;
    }
    return nullptr;
}

bool Registry::empty() const noexcept
{
    for (const auto &entry : header()->nodes)
    {
        if (entry.node_id.load(std::memory_order_acquire) != 0)
            return false;
    }
    for (const auto &entry : header()->services)
    {
        if (entry.in_use != 0)
            return false;
    }
    return true;
}

void Registry::retire() noexcept
{
    header()->retired.store(1, std::memory_order_release);
    platform::shm_unlink(m_segment.name().c_str());
    LOGGER_DEBUG("Registry '{}': no nodes or services left, removed.", m_segment.name());
}

// ============================================================================
// LockedRegistry
// ============================================================================

LockedRegistry::LockedRegistry(std::shared_ptr<Registry> registry) : m_registry(std::move(registry))
{
    m_registry->lock().lock();
}

LockedRegistry::LockedRegistry(LockedRegistry &&other) noexcept
    : m_registry(std::move(other.m_registry))
{
}

LockedRegistry::~LockedRegistry()
{
    if (!m_registry)
        return;
    try
    {
        m_registry->lock().unlock();
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("Registry '{}': unlock failed: {}", m_registry->domain(), e.what());
    }
}

utils::Result<LockedRegistry, RegistryOpenError> lock_registry(const std::string &domain, bool create)
{
    using R = utils::Result<LockedRegistry, RegistryOpenError>;
    for (int attempt = 0; attempt < kOpenAttempts; ++attempt)
    {
        auto opened = Registry::open(domain, create);
        if (opened.is_error())
            return R::error(opened.error(), opened.error_code());

        LockedRegistry locked(std::move(opened).content());
        if (!locked->is_retired())
            return R::ok(std::move(locked));
        // Retired between our open and our lock: the name is gone, open again.
    }
    return R::error(RegistryOpenError::InternalError);
}

// ============================================================================
// NodeImpl
// ============================================================================

NodeImpl::NodeImpl(std::shared_ptr<Registry> registry, uint64_t node_id, NodeName name,
                   TransportConfig config)
    : m_registry(std::move(registry)), m_id(node_id), m_name(std::move(name)),
      m_config(std::move(config))
{
}

NodeImpl::~NodeImpl()
{
    try
    {
        LockedRegistry locked(m_registry);
        NodeEntry *entry = locked->find_node(m_id);
        if (entry != nullptr && entry->owner_pid == platform::get_pid())
            entry->node_id.store(0, std::memory_order_release);
        LOGGER_DEBUG("Node '{}' (id {}) removed.", m_name.as_string(), m_id);
        if (locked->empty())
            locked->retire();
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("Node '{}' (id {}): failed to remove registry entry: {}", m_name.as_string(),
                     m_id, e.what());
    }
}

// ============================================================================
// ServiceCore
// ============================================================================

ServiceCore::ServiceCore(std::shared_ptr<NodeImpl> node, ServiceName service, MappedSegment segment,
                         size_t handle_index)
    : m_node(std::move(node)), m_service(std::move(service)), m_segment(std::move(segment)),
      m_lock(&m_segment.as<SegmentHeader>()->lock, m_segment.name()), m_handle_index(handle_index)
{
}

ServiceCore::~ServiceCore()
{
    try
    {
        LockedRegistry locked(m_node->registry());
        size_t remaining = 0;
        {
            SharedSpinLockGuard guard(m_lock);
            uint64_t &slot = header()->handle_nodes[m_handle_index];
            if (slot == m_node->id())
                slot = 0;
            remaining = count_open_handles(header());
        }
        if (remaining == 0)
        {
            platform::shm_unlink(m_segment.name().c_str());
            if (ServiceEntry *entry = locked->find_service(m_segment.name()))
                clear_service_entry(*entry);
            LOGGER_DEBUG("Service '{}': last handle closed, segment '{}' removed.",
                         m_service.as_string(), m_segment.name());
        }
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("Service '{}': failed to close handle: {}", m_service.as_string(), e.what());
    }
}

uint64_t ServiceCore::allocate_port_id() noexcept
{
    return header()->next_port_id++;
}

// ============================================================================
// Service segments
// ============================================================================

utils::Result<std::shared_ptr<ServiceCore>, ServiceOpenError>
open_or_create_service(const std::shared_ptr<NodeImpl> &node, const ServiceName &service,
                       const SegmentRequest &request)
{
    using R = utils::Result<std::shared_ptr<ServiceCore>, ServiceOpenError>;
    const std::string seg_name =
        service_segment_name(node->config().domain, request.kind, service.as_string());

    try
    {
        LockedRegistry locked(node->registry());

        if (ServiceEntry *entry = locked->find_service(seg_name))
        {
            platform::ShmHandle attached = platform::shm_attach(seg_name.c_str());
            if (attached.base == nullptr)
            {
                const int err = errno;
                if (err == ENOENT || err == EAGAIN)
                {
                    LOGGER_WARN("Service '{}': registered by node {} but its segment was never "
                                "completed.",
                                service.as_string(), entry->creator_node_id);
                    return R::error(ServiceOpenError::ServiceInCorruptedState, err);
                }
                LOGGER_ERROR("Service '{}': shm_attach failed: {}.", service.as_string(),
                             std::strerror(err));
                return R::error(service_error_from_errno(err), err);
            }

            MappedSegment segment(attached, seg_name);
            if (!segment_is_ready(segment))
            {
                LOGGER_WARN("Service '{}': segment '{}' is not initialized.", service.as_string(),
                            seg_name);
                return R::error(ServiceOpenError::ServiceInCorruptedState);
            }
            auto *hdr = segment.as<SegmentHeader>();
            if (hdr->version != kLayoutVersion)
                return R::error(ServiceOpenError::IncompatibleAttributes);
            if (hdr->kind != request.kind)
                return R::error(ServiceOpenError::IncompatibleMessagingPattern);
            if (auto mismatch = request.verify(segment.base(), segment.size()))
            {
                LOGGER_DEBUG("Service '{}': existing segment rejected: {}.", service.as_string(),
                             to_string(*mismatch));
                return R::error(*mismatch);
            }

            int handle_index = -1;
            {
                SharedSpinLock seg_lock(&hdr->lock, seg_name);
                SharedSpinLockGuard guard(seg_lock);
                for (size_t i = 0; i < kMaxServiceHandles; ++i)
                {
                    if (hdr->handle_nodes[i] == 0)
                    {
                        hdr->handle_nodes[i] = node->id();
                        handle_index = static_cast<int>(i);
                        break;
                    }
                }
            }
            if (handle_index < 0)
                return R::error(ServiceOpenError::ExceedsMaxNumberOfNodes);

            return R::ok(std::make_shared<ServiceCore>(node, service, std::move(segment),
                                                       static_cast<size_t>(handle_index)));
        }

        // Not registered: create. The entry goes in first so that a creator dying
        // half-way leaves a trace that dead-node cleanup can find.
        ServiceEntry *entry = locked->find_free_service();
        if (entry == nullptr)
            return R::error(ServiceOpenError::ExceedsMaxNumberOfServices);
        entry->in_use = 1;
        entry->kind = request.kind;
        entry->creator_node_id = node->id();
        copy_fixed(entry->segment_name, kSegmentNameCapacity, seg_name);

        auto entry_guard = basics::make_scope_guard([entry]() noexcept { clear_service_entry(*entry); });

        platform::ShmHandle created =
            platform::shm_create(seg_name.c_str(), request.size, platform::SHM_CREATE_EXCLUSIVE);
        if (created.base == nullptr && errno == EEXIST)
        {
            LOGGER_WARN("Service '{}': segment '{}' exists without a registry entry, replacing it.",
                        service.as_string(), seg_name);
            platform::shm_unlink(seg_name.c_str());
            created = platform::shm_create(seg_name.c_str(), request.size,
                                           platform::SHM_CREATE_EXCLUSIVE);
        }
        if (created.base == nullptr)
        {
            const int err = errno;
            LOGGER_ERROR("Service '{}': shm_create failed: {}.", service.as_string(),
                         std::strerror(err));
            return R::error(service_error_from_errno(err), err);
        }

        auto *hdr = static_cast<SegmentHeader *>(created.base);
        hdr->kind = request.kind;
        hdr->version = kLayoutVersion;
        hdr->creator_node_id = node->id();
        hdr->creator_pid = platform::get_pid();
        hdr->total_size = request.size;
        hdr->next_port_id = 1;
        hdr->magic.store(kSegmentMagic, std::memory_order_release);
        request.init(created.base);
        hdr->handle_nodes[0] = node->id();
        hdr->state.store(SegmentState::Ready, std::memory_order_release);
        entry_guard.dismiss();

        LOGGER_DEBUG("Service '{}': created segment '{}' ({} bytes).", service.as_string(), seg_name,
                     request.size);
        return R::ok(std::make_shared<ServiceCore>(node, service, MappedSegment(created, seg_name), 0));
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("Service '{}': open failed: {}", service.as_string(), e.what());
        return R::error(ServiceOpenError::InternalError);
    }
}

std::optional<MappedSegment> attach_ready_segment(const std::string &segment_name, ServiceKind kind)
{
    platform::ShmHandle attached = platform::shm_attach(segment_name.c_str());
    if (attached.base == nullptr)
        return std::nullopt;
    MappedSegment segment(attached, segment_name);
    if (!segment_is_ready(segment) || segment.as<SegmentHeader>()->kind != kind)
        return std::nullopt;
    return segment;
}

std::vector<NodeDetails> snapshot_nodes(const Registry &registry)
{
    std::vector<NodeDetails> nodes;
    for (const auto &entry : registry.header()->nodes)
    {
        const uint64_t id = entry.node_id.load(std::memory_order_acquire);
        if (id == 0)
            continue;
        nodes.push_back(NodeDetails{id, entry.owner_pid,
                                    std::string(read_fixed(entry.name, kNodeNameCapacity))});
    }
    return nodes;
}

utils::VoidResult<NodeCleanupFailure> remove_node_resources(const std::string &domain,
                                                            const NodeDetails &details)
{
    using R = utils::VoidResult<NodeCleanupFailure>;
    try
    {
        auto opened = lock_registry(domain, false);
        if (opened.is_error())
        {
            switch (opened.error())
            {
            case RegistryOpenError::NotFound:
                return R::ok(); // the whole domain is gone already
            case RegistryOpenError::InsufficientPermissions:
                return R::error(NodeCleanupFailure::InsufficientPermissions, opened.error_code());
            case RegistryOpenError::Corrupted:
                return R::error(NodeCleanupFailure::RegistryCorrupted);
            case RegistryOpenError::InternalError:
                break;
            }
            return R::error(NodeCleanupFailure::InternalError, opened.error_code());
        }
        LockedRegistry locked = std::move(opened).content();

        NodeEntry *node_entry = locked->find_node(details.node_id);
        if (node_entry == nullptr || node_entry->owner_pid != details.owner_pid)
            return R::ok();
        if (platform::is_process_alive(details.owner_pid))
            return R::error(NodeCleanupFailure::NodeStillAlive);

        size_t released = 0;
        for (auto &service : locked->header()->services)
        {
            if (service.in_use == 0)
                continue;
            const std::string seg_name(read_fixed(service.segment_name, kSegmentNameCapacity));

            platform::ShmHandle attached = platform::shm_attach(seg_name.c_str());
            if (attached.base == nullptr)
            {
                const int err = errno;
                if (service.creator_node_id == details.node_id || err == ENOENT)
                {
                    platform::shm_unlink(seg_name.c_str());
                    clear_service_entry(service);
                    LOGGER_INFO("Removed incomplete service segment '{}' of dead node {}.", seg_name,
                                details.node_id);
                }
                continue;
            }

            MappedSegment segment(attached, seg_name);
            if (!segment_is_ready(segment))
            {
                if (service.creator_node_id == details.node_id)
                {
                    platform::shm_unlink(seg_name.c_str());
                    clear_service_entry(service);
                    LOGGER_INFO("Removed half-initialized service segment '{}' of dead node {}.",
                                seg_name, details.node_id);
                }
                continue;
            }

            auto *hdr = segment.as<SegmentHeader>();
            size_t remaining = 0;
            {
                SharedSpinLock seg_lock(&hdr->lock, seg_name);
                SharedSpinLockGuard guard(seg_lock);
                released += clear_node_from_segment(hdr, details.node_id);
                remaining = count_open_handles(hdr);
            }
            if (remaining == 0)
            {
                platform::shm_unlink(seg_name.c_str());
                clear_service_entry(service);
                LOGGER_DEBUG("Removed service segment '{}': no handles left.", seg_name);
            }
        }

        node_entry->node_id.store(0, std::memory_order_release);
        LOGGER_INFO("Removed dead node {} ('{}', PID {}), released {} slots.", details.node_id,
                    details.name, details.owner_pid, released);
        if (locked->empty())
            locked->retire();
        return R::ok();
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("Cleanup of node {} failed: {}", details.node_id, e.what());
        return R::error(NodeCleanupFailure::InternalError);
    }
}

} // namespace solohub::hub::detail
