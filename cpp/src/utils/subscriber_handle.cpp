#include "utils/subscriber_handle.hpp"

#include <thread>

namespace solohub::ipc
{

namespace
{
std::atomic<uint64_t> g_next_subscriber_id{1};
constexpr auto kExitPollInterval = std::chrono::milliseconds(5);
} // namespace

std::pair<SubscriberHandle, SubscriberHandle::KeepAlive> SubscriberHandle::create()
{
    const uint64_t id = g_next_subscriber_id.fetch_add(1, std::memory_order_relaxed);
    auto keep_alive = std::make_shared<std::atomic<bool>>(true);
    return {SubscriberHandle(id, keep_alive), keep_alive};
}

bool SubscriberHandle::is_closed() const noexcept
{
    const auto keep_alive = m_keep_alive.lock();
    return !keep_alive || !keep_alive->load(std::memory_order_relaxed);
}

void SubscriberHandle::close() const noexcept
{
    if (const auto keep_alive = m_keep_alive.lock())
        keep_alive->store(false, std::memory_order_relaxed);
}

bool SubscriberHandle::wait_for_exit(std::chrono::milliseconds timeout) const
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!m_keep_alive.expired())
    {
        if (std::chrono::steady_clock::now() >= deadline)
            return false;
        std::this_thread::sleep_for(kExitPollInterval);
    }
    return true;
}

} // namespace solohub::ipc
