#include "ipc_segment.hpp"

#include <algorithm>
#include <cstring>

namespace solohub::hub::detail
{

std::string registry_segment_name(std::string_view domain)
{
    return fmt::format("/{}_registry", domain);
}

std::string service_segment_name(std::string_view domain, ServiceKind kind,
                                 std::string_view service)
{
    return fmt::format("/{}_{}_{}", domain, kind == ServiceKind::PubSub ? "ps" : "ev", service);
}

void copy_fixed(char *dst, size_t capacity, std::string_view src) noexcept
{
    if (capacity == 0)
        return;
    const size_t n = std::min(src.size(), capacity - 1);
    std::memcpy(dst, src.data(), n);
    std::memset(dst + n, 0, capacity - n);
}

std::string_view read_fixed(const char *src, size_t capacity) noexcept
{
    const void *nul = std::memchr(src, '\0', capacity);
    const size_t len = nul ? static_cast<size_t>(static_cast<const char *>(nul) - src) : capacity;
    return {src, len};
}

int claim_port_slot(PortSlot *slots, size_t count, uint64_t port_id, uint64_t node_id) noexcept
{
    for (size_t i = 0; i < count; ++i)
    {
        if (slots[i].port_id.load(std::memory_order_acquire) == 0)
        {
            slots[i].node_id = node_id;
            slots[i].pid = platform::get_pid();
            slots[i].port_id.store(port_id, std::memory_order_release);
            return static_cast<int>(i);
        }
    }
    return -1;
}

void release_port_slot(PortSlot &slot, uint64_t port_id) noexcept
{
    if (slot.port_id.load(std::memory_order_acquire) != port_id)
        return;
    slot.port_id.store(0, std::memory_order_release);
    slot.node_id = 0;
    slot.pid = 0;
}

namespace
{
size_t clear_slots_of_node(PortSlot *slots, size_t count, uint64_t node_id) noexcept
{
    size_t cleared = 0;
    for (size_t i = 0; i < count; ++i)
    {
        const uint64_t port_id = slots[i].port_id.load(std::memory_order_acquire);
        if (port_id != 0 && slots[i].node_id == node_id)
        {
            release_port_slot(slots[i], port_id);
            ++cleared;
        }
    }
    return cleared;
}
} // namespace

size_t clear_node_from_segment(SegmentHeader *header, uint64_t node_id) noexcept
{
    size_t cleared = 0;
    for (auto &handle_node : header->handle_nodes)
    {
        if (handle_node == node_id)
        {
            handle_node = 0;
            ++cleared;
        }
    }

    if (header->kind == ServiceKind::PubSub)
    {
        auto *ps = reinterpret_cast<PubSubHeader *>(header);
        cleared += clear_slots_of_node(&ps->subscriber, 1, node_id);
        cleared += clear_slots_of_node(ps->publishers, kMaxPublishers, node_id);
    }
    else if (header->kind == ServiceKind::Event)
    {
        auto *ev = reinterpret_cast<EventHeader *>(header);
        for (auto &listener : ev->listeners)
        {
            if (clear_slots_of_node(&listener.port, 1, node_id) > 0)
            {
                listener.pending.store(0, std::memory_order_release);
                ++cleared;
            }
        }
        cleared += clear_slots_of_node(ev->notifiers, kMaxNotifiers, node_id);
    }
    return cleared;
}

size_t count_open_handles(const SegmentHeader *header) noexcept
{
    return static_cast<size_t>(std::count_if(std::begin(header->handle_nodes),
                                             std::end(header->handle_nodes),
                                             [](uint64_t id) { return id != 0; }));
}

PubSubGeometry pubsub_geometry(size_t payload_size, size_t payload_align, size_t buffer_size) noexcept
{
    const size_t align = std::max<size_t>(payload_align, 1);
    const size_t stride = std::max<size_t>((payload_size + align - 1) / align * align, align);
    const size_t queue_alignment = std::max(kQueueAlignment, align);
    const size_t queue_offset =
        (sizeof(PubSubHeader) + queue_alignment - 1) / queue_alignment * queue_alignment;
    return PubSubGeometry{stride, queue_offset, queue_offset + stride * buffer_size};
}

} // namespace solohub::hub::detail
