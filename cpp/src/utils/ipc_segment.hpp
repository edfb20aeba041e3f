#pragma once
/**
 * @file ipc_segment.hpp
 * @brief Shared-memory layouts of the transport (registry and service segments).
 *
 * Internal header. All layouts are standard-layout structs of lock-free atomics
 * and plain integers, placed at offset 0 of their segment. A new segment is
 * zero-filled by shm_create(), which is the valid initial state of every field
 * (free spinlock, free port slots, empty ring).
 *
 * Locking:
 *  - Registry tables are read and written only under RegistryHeader::lock.
 *  - Service segment fields (port tables, ring, handle table) only under
 *    SegmentHeader::lock, except PortSlot::port_id and ListenerSlot::pending,
 *    which are also read without it.
 *  - Lock order is registry before segment.
 */
#include "solo_service.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace solohub::hub::detail
{

inline constexpr uint32_t kRegistryMagic = 0x534F5247; // "SORG"
inline constexpr uint32_t kSegmentMagic = 0x534F5347;  // "SOSG"
inline constexpr uint32_t kLayoutVersion = 1;

inline constexpr size_t kMaxNodes = 64;
inline constexpr size_t kMaxServices = 64;
inline constexpr size_t kMaxServiceHandles = 64;
inline constexpr size_t kMaxPublishers = 64;
inline constexpr size_t kMaxListeners = 32;
inline constexpr size_t kMaxNotifiers = 32;
inline constexpr size_t kMaxSubscriberBufferSize = 1024;
inline constexpr size_t kNodeNameCapacity = 72;     // 64 + NUL, padded
inline constexpr size_t kSegmentNameCapacity = 160; // "/<domain>_xx_<service>" + NUL
inline constexpr size_t kTypeNameCapacity = 128;
inline constexpr size_t kQueueAlignment = 64;

enum class ServiceKind : uint32_t
{
    PubSub = 1,
    Event = 2,
};

enum class SegmentState : uint32_t
{
    Creating = 0,
    Ready = 1,
};

// ============================================================================
// Registry segment
// ============================================================================

struct NodeEntry
{
    std::atomic<uint64_t> node_id; // 0 = free
    uint64_t owner_pid;
    uint64_t created_ns;
    char name[kNodeNameCapacity];
};

struct ServiceEntry
{
    uint32_t in_use;
    ServiceKind kind;
    uint64_t creator_node_id;
    char segment_name[kSegmentNameCapacity];
};

struct RegistryHeader
{
    std::atomic<uint32_t> magic; // stored last by the creator
    uint32_t version;
    uint64_t creator_pid;
    std::atomic<uint32_t> retired; // set under lock right before the name is unlinked
    uint32_t reserved;
    SharedSpinLockState lock;
    uint64_t next_node_id;
    NodeEntry nodes[kMaxNodes];
    ServiceEntry services[kMaxServices];
};

// ============================================================================
// Service segments
// ============================================================================

struct PortSlot
{
    std::atomic<uint64_t> port_id; // 0 = free; stored last on claim, first on release
    uint64_t node_id;
    uint64_t pid;
};

struct SegmentHeader
{
    std::atomic<uint32_t> magic;
    ServiceKind kind;
    std::atomic<SegmentState> state;
    uint32_t version;
    uint64_t creator_node_id;
    uint64_t creator_pid;
    uint64_t total_size;
    uint64_t next_port_id;
    SharedSpinLockState lock;
    /// Node id per open service handle; 0 = free. Zero handles left means the segment goes.
    uint64_t handle_nodes[kMaxServiceHandles];
};

struct PubSubHeader
{
    SegmentHeader common;
    uint64_t payload_size;
    uint64_t payload_align;
    char type_name[kTypeNameCapacity];
    uint64_t max_subscribers; // always 1
    uint64_t max_publishers;
    uint64_t subscriber_buffer_size;
    uint64_t stride;       // payload_size rounded up to payload_align
    uint64_t queue_offset; // from the segment base, kQueueAlignment aligned
    PortSlot subscriber;
    PortSlot publishers[kMaxPublishers];
    uint64_t ring_head;  // index of the oldest queued sample
    uint64_t ring_count; // number of queued samples
    uint64_t overwritten;
};

struct ListenerSlot
{
    PortSlot port;
    std::atomic<uint64_t> pending; // bit i set: event id i fired since the last wait
};

struct EventHeader
{
    SegmentHeader common;
    uint64_t max_listeners;
    uint64_t max_notifiers;
    ListenerSlot listeners[kMaxListeners];
    PortSlot notifiers[kMaxNotifiers];
};

static_assert(std::atomic<uint32_t>::is_always_lock_free);
static_assert(std::atomic<uint64_t>::is_always_lock_free);
static_assert(std::atomic<SegmentState>::is_always_lock_free);

// ============================================================================
// Helpers
// ============================================================================

/// "/<domain>_registry"
std::string registry_segment_name(std::string_view domain);

/// "/<domain>_ps_<service>" or "/<domain>_ev_<service>"
std::string service_segment_name(std::string_view domain, ServiceKind kind,
                                 std::string_view service);

/// Copies `src` into a fixed char array, truncating and NUL-terminating.
void copy_fixed(char *dst, size_t capacity, std::string_view src) noexcept;

/// Reads a NUL-terminated fixed char array.
std::string_view read_fixed(const char *src, size_t capacity) noexcept;

/**
 * @brief Claims the first free slot: node_id and pid first, port_id last (release).
 * @return Slot index, or -1 if all `count` slots are taken. Segment lock held.
 */
int claim_port_slot(PortSlot *slots, size_t count, uint64_t port_id, uint64_t node_id) noexcept;

/// True while `slot` still carries `port_id`.
inline bool owns_port(const PortSlot &slot, uint64_t port_id) noexcept
{
    return slot.port_id.load(std::memory_order_acquire) == port_id;
}

/// Frees `slot` if it still carries `port_id`. Segment lock held.
void release_port_slot(PortSlot &slot, uint64_t port_id) noexcept;

/**
 * @brief Frees every port slot and handle slot of `node_id` in a ready segment.
 * @return Number of slots freed. Segment lock held.
 */
size_t clear_node_from_segment(SegmentHeader *header, uint64_t node_id) noexcept;

/// Number of occupied handle slots. Segment lock held.
size_t count_open_handles(const SegmentHeader *header) noexcept;

/// Smallest segment size for a pub/sub layout and the queue placement inside it.
struct PubSubGeometry
{
    uint64_t stride;
    uint64_t queue_offset;
    size_t total_size;
};
PubSubGeometry pubsub_geometry(size_t payload_size, size_t payload_align, size_t buffer_size) noexcept;

/**
 * @class MappedSegment
 * @brief Move-only owner of one shared-memory mapping. Unmaps on destruction;
 *        never unlinks (unlinking is a registry decision).
 */
class MappedSegment
{
  public:
    MappedSegment() = default;
    MappedSegment(platform::ShmHandle handle, std::string name) noexcept
        : m_handle(handle), m_name(std::move(name))
    {
    }
    ~MappedSegment() { platform::shm_close(&m_handle); }

    MappedSegment(MappedSegment &&other) noexcept
        : m_handle(other.m_handle), m_name(std::move(other.m_name))
    {
        other.m_handle = platform::ShmHandle{};
    }
    MappedSegment &operator=(MappedSegment &&other) noexcept
    {
        if (this != &other)
        {
            platform::shm_close(&m_handle);
            m_handle = other.m_handle;
            m_name = std::move(other.m_name);
            other.m_handle = platform::ShmHandle{};
        }
        return *this;
    }
    MappedSegment(const MappedSegment &) = delete;
    MappedSegment &operator=(const MappedSegment &) = delete;

    [[nodiscard]] bool valid() const noexcept { return m_handle.base != nullptr; }
    [[nodiscard]] size_t size() const noexcept { return m_handle.size; }
    [[nodiscard]] const std::string &name() const noexcept { return m_name; }
    [[nodiscard]] void *base() const noexcept { return m_handle.base; }

    template <typename T> [[nodiscard]] T *as() const noexcept { return static_cast<T *>(m_handle.base); }

  private:
    platform::ShmHandle m_handle{};
    std::string m_name;
};

} // namespace solohub::hub::detail
