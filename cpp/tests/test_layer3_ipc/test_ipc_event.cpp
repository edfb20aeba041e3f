/**
 * @file test_ipc_event.cpp
 * @brief Event service: notifier/listener delivery, id bounds, timeouts.
 */
#include "solo_ipc.hpp"
#include "shared_test_helpers.h"
#include "test_patterns.h"
#include "workers/ipc_test_types.h"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#if defined(SOLOHUB_PLATFORM_LINUX)
#include <sys/resource.h>
#endif

using namespace solohub::hub;
using namespace solohub::tests;
using namespace solohub::tests::helper;
using namespace std::chrono_literals;

namespace
{

class IpcEventTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        guard_.emplace(::testing::UnitTest::GetInstance()->current_test_info()->name(),
                       std::vector<std::string>{"events", "few"});
        config_ = test_transport(guard_->domain());
        auto node = Node::create(NodeName::create("event_test").content(), config_);
        ASSERT_TRUE(node.is_ok()) << to_string(node.error());
        node_.emplace(std::move(node).content());
        auto svc = EventService::open_or_create(*node_, ServiceName::create("events").content());
        ASSERT_TRUE(svc.is_ok()) << to_string(svc.error());
        events_.emplace(std::move(svc).content());
    }

    void TearDown() override
    {
        events_.reset();
        node_.reset();
        guard_.reset();
    }

    /// Collects every id delivered by one try_wait_all().
    static std::vector<size_t> Drain(const Listener &listener)
    {
        std::vector<size_t> ids;
        auto waited = listener.try_wait_all([&ids](EventId id) { ids.push_back(id.as_value()); });
        EXPECT_TRUE(waited.is_ok());
        return ids;
    }

    std::optional<DomainTestGuard> guard_;
    TransportConfig config_;
    std::optional<Node> node_;
    std::optional<EventService> events_;
};

} // namespace

TEST_F(IpcEventTest, NotifyReachesEveryListener)
{
    auto l1 = events_->listener();
    auto l2 = events_->listener();
    auto notifier = events_->notifier(EventId(3));
    ASSERT_TRUE(l1.is_ok());
    ASSERT_TRUE(l2.is_ok());
    ASSERT_TRUE(notifier.is_ok());
    EXPECT_EQ(notifier.content().default_event_id(), EventId(3));

    auto notified = notifier.content().notify();
    ASSERT_TRUE(notified.is_ok());
    EXPECT_EQ(notified.content(), 2u);

    EXPECT_EQ(Drain(l1.content()), std::vector<size_t>{3});
    EXPECT_EQ(Drain(l2.content()), std::vector<size_t>{3});
    EXPECT_TRUE(Drain(l1.content()).empty()) << "A wait clears what it handed over";
}

TEST_F(IpcEventTest, NotifyWithoutListenersReachesNobody)
{
    auto notifier = events_->notifier(EventId(0));
    ASSERT_TRUE(notifier.is_ok());
    auto notified = notifier.content().notify();
    ASSERT_TRUE(notified.is_ok());
    EXPECT_EQ(notified.content(), 0u);
}

TEST_F(IpcEventTest, IdsArriveAscendingAndCoalesced)
{
    auto listener = events_->listener();
    auto notifier = events_->notifier(EventId(0));
    ASSERT_TRUE(listener.is_ok());
    ASSERT_TRUE(notifier.is_ok());

    for (size_t id : {42u, 7u, 13u, 7u, 63u, 0u})
        ASSERT_TRUE(notifier.content().notify_with_id(EventId(id)).is_ok());

    EXPECT_EQ(Drain(listener.content()), (std::vector<size_t>{0, 7, 13, 42, 63}));
}

TEST_F(IpcEventTest, IdOutOfBounds)
{
    auto notifier = events_->notifier(EventId(0));
    ASSERT_TRUE(notifier.is_ok());
    auto notified = notifier.content().notify_with_id(EventId(kMaxEventIds));
    ASSERT_TRUE(notified.is_error());
    EXPECT_EQ(notified.error(), NotifyError::EventIdOutOfBounds);
}

TEST_F(IpcEventTest, TimedWaitTimesOutWithoutCallback)
{
    auto listener = events_->listener();
    ASSERT_TRUE(listener.is_ok());

    int calls = 0;
    const auto start = std::chrono::steady_clock::now();
    auto waited = listener.content().timed_wait_all([&calls](EventId) { ++calls; }, 30ms);
    const auto elapsed = std::chrono::steady_clock::now() - start;
    ASSERT_TRUE(waited.is_ok());
    EXPECT_EQ(calls, 0);
    EXPECT_GE(elapsed, 25ms);
}

#if defined(SOLOHUB_PLATFORM_LINUX)
TEST_F(IpcEventTest, IdleTimedWaitSleepsInLongSteps)
{
    auto listener = events_->listener();
    ASSERT_TRUE(listener.is_ok());

    struct rusage before{};
    ASSERT_EQ(getrusage(RUSAGE_THREAD, &before), 0);
    const auto start = std::chrono::steady_clock::now();
    auto waited = listener.content().timed_wait_all([](EventId) {}, 500ms);
    const auto elapsed = std::chrono::steady_clock::now() - start;
    struct rusage after{};
    ASSERT_EQ(getrusage(RUSAGE_THREAD, &after), 0);
    ASSERT_TRUE(waited.is_ok());

    // Once the sleep reaches 5ms an idle wait wakes about 100 times in 500ms.
    const long wakeups = after.ru_nvcsw - before.ru_nvcsw;
    EXPECT_LT(wakeups, 200) << "idle wait woke " << wakeups << " times";
    EXPECT_GE(elapsed, 500ms);
    EXPECT_LT(elapsed, 500ms + 50ms) << "the last sleep is cut at the deadline";
}
#endif

TEST_F(IpcEventTest, TimedWaitWakesOnNotify)
{
    auto listener = events_->listener();
    auto notifier = events_->notifier(EventId(11));
    ASSERT_TRUE(listener.is_ok());
    ASSERT_TRUE(notifier.is_ok());

    std::thread firer(
        [&notifier]()
        {
            std::this_thread::sleep_for(20ms);
            EXPECT_TRUE(notifier.content().notify().is_ok());
        });

    std::vector<size_t> ids;
    const auto start = std::chrono::steady_clock::now();
    auto waited = listener.content().timed_wait_all(
        [&ids](EventId id) { ids.push_back(id.as_value()); }, 5s);
    const auto elapsed = std::chrono::steady_clock::now() - start;
    firer.join();

    ASSERT_TRUE(waited.is_ok());
    EXPECT_EQ(ids, std::vector<size_t>{11});
    EXPECT_LT(elapsed, 4s) << "The wait should end on the event, not on the timeout";
}

TEST_F(IpcEventTest, CallbackExceptionPropagates)
{
    auto listener = events_->listener();
    auto notifier = events_->notifier(EventId(5));
    ASSERT_TRUE(listener.is_ok());
    ASSERT_TRUE(notifier.is_ok());
    ASSERT_TRUE(notifier.content().notify().is_ok());

    EXPECT_THROW((void)listener.content().try_wait_all([](EventId) { throw std::runtime_error("boom"); }),
                 std::runtime_error);
}

TEST_F(IpcEventTest, ListenerLimit)
{
    TransportConfig small = config_;
    small.max_listeners = 1;
    auto node = Node::create(NodeName::create("small").content(), small);
    ASSERT_TRUE(node.is_ok());
    auto svc = EventService::open_or_create(node.content(), ServiceName::create("few").content());
    ASSERT_TRUE(svc.is_ok());

    auto first = svc.content().listener();
    ASSERT_TRUE(first.is_ok());
    auto second = svc.content().listener();
    ASSERT_TRUE(second.is_error());
    EXPECT_EQ(second.error(), ListenerCreateError::ExceedsMaxSupportedListeners);
}

TEST_F(IpcEventTest, DroppedListenerIsNotCounted)
{
    auto notifier = events_->notifier(EventId(1));
    ASSERT_TRUE(notifier.is_ok());
    {
        auto listener = events_->listener();
        ASSERT_TRUE(listener.is_ok());
        EXPECT_EQ(notifier.content().notify().content(), 1u);
    }
    EXPECT_EQ(notifier.content().notify().content(), 0u);
}

TEST(IpcEventIdTest, FormatsAsNumber)
{
    EXPECT_EQ(fmt::format("{}", EventId(13)), "13");
    EXPECT_LT(EventId(2), EventId(3));
}
