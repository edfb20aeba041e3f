/**
 * @file test_shared_memory_spinlock.cpp
 * @brief Tests for SharedSpinLock (utils/shared_memory_spinlock.hpp).
 *
 * The registry and every service segment guard their tables with this lock, so
 * it is tested on its own: try_lock_for, lock, unlock, timeout, recursion, RAII
 * guards; multi-process contention and reclaim from a dead holder.
 */
#include "solo_service.hpp"
#include "utils/shared_memory_spinlock.hpp"
#include "shared_test_helpers.h"
#include "test_patterns.h"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <thread>

using namespace solohub::hub;
using namespace solohub::tests::helper;
using namespace std::chrono_literals;

namespace
{
std::string unique_shm_name_spinlock()
{
    static std::atomic<uint64_t> counter{0};
    return fmt::format("/solohub_test_spinlock_{}_{}", solohub::platform::get_pid(),
                       counter.fetch_add(1, std::memory_order_relaxed));
}

/// Same layout as in workers/spinlock_workers.cpp.
struct SpinlockSegment
{
    SharedSpinLockState state;
    uint64_t counter;
};

/// Creates a fresh segment for the test and unlinks it on scope exit.
class ScopedSpinlockSegment
{
  public:
    ScopedSpinlockSegment() : name_(unique_shm_name_spinlock())
    {
        handle_ = solohub::platform::shm_create(name_.c_str(), sizeof(SpinlockSegment),
                                                solohub::platform::SHM_CREATE_UNLINK_FIRST);
    }
    ~ScopedSpinlockSegment()
    {
        if (handle_.base != nullptr)
            solohub::platform::shm_close(&handle_);
        solohub::platform::shm_unlink(name_.c_str());
    }
    ScopedSpinlockSegment(const ScopedSpinlockSegment &) = delete;
    ScopedSpinlockSegment &operator=(const ScopedSpinlockSegment &) = delete;

    bool valid() const { return handle_.base != nullptr; }
    const std::string &name() const { return name_; }
    SpinlockSegment *segment() const { return static_cast<SpinlockSegment *>(handle_.base); }

  private:
    std::string name_;
    solohub::platform::ShmHandle handle_{};
};
} // namespace

// ============================================================================
// Fixture: state in process memory (single-process tests)
// ============================================================================

class SharedSpinLockTest : public ::testing::Test
{
  protected:
    void SetUp() override { init_spinlock_state(&state_); }

    SharedSpinLockState state_{};
    const std::string name_{"test_spinlock"};
};

TEST_F(SharedSpinLockTest, NullState_Throws)
{
    EXPECT_THROW(SharedSpinLock(nullptr, "null"), std::invalid_argument);
}

TEST_F(SharedSpinLockTest, TryLockFor_WhenFree_Succeeds)
{
    SharedSpinLock lock(&state_, name_);
    EXPECT_TRUE(lock.try_lock_for(100));
    EXPECT_TRUE(lock.is_locked_by_current_thread());
    EXPECT_EQ(state_.owner_pid.load(), solohub::platform::get_pid());
    lock.unlock();
    EXPECT_EQ(state_.owner_pid.load(), 0u);
}

TEST_F(SharedSpinLockTest, TryLockFor_SameThread_IsRecursive)
{
    SharedSpinLock lock(&state_, name_);
    EXPECT_TRUE(lock.try_lock_for(0));
    EXPECT_TRUE(lock.try_lock_for(0)) << "Recursive lock by the owning thread should succeed";
    EXPECT_EQ(state_.recursion_count.load(), 2u);
    lock.unlock();
    EXPECT_TRUE(lock.is_locked_by_current_thread()) << "One unlock releases one level";
    lock.unlock();
    EXPECT_FALSE(lock.is_locked_by_current_thread());
}

TEST_F(SharedSpinLockTest, Unlock_WhenNotOwner_Throws)
{
    SharedSpinLock lock(&state_, name_);
    lock.lock();
    std::thread other(
        [this]()
        {
            SharedSpinLock l(&state_, name_ + "_other");
            EXPECT_THROW(l.unlock(), std::runtime_error);
        });
    other.join();
    lock.unlock();
}

TEST_F(SharedSpinLockTest, TryLockFor_WhenHeldByOtherThread_TimesOut)
{
    SharedSpinLock lock(&state_, name_);
    lock.lock();

    std::atomic<bool> try_result{true};
    std::thread contender(
        [this, &try_result]()
        {
            SharedSpinLock l(&state_, name_ + "_contender");
            try_result = l.try_lock_for(50);
        });

    contender.join();
    EXPECT_FALSE(try_result.load()) << "try_lock_for should time out while another thread holds it";
    lock.unlock();
}

TEST_F(SharedSpinLockTest, TryLockFor_AfterRelease_Succeeds)
{
    SharedSpinLock lock(&state_, name_);
    lock.lock();
    std::atomic<bool> acquired{false};
    std::thread contender(
        [this, &acquired]()
        {
            SharedSpinLock l(&state_, name_ + "_contender");
            acquired = l.try_lock_for(2000);
            if (acquired)
                l.unlock();
        });

    std::this_thread::sleep_for(10ms);
    lock.unlock();
    contender.join();
    EXPECT_TRUE(acquired.load()) << "Contender should acquire after the owner releases";
}

TEST_F(SharedSpinLockTest, Unlock_BumpsGeneration)
{
    SharedSpinLock lock(&state_, name_);
    const uint64_t before = state_.generation.load();
    lock.lock();
    lock.unlock();
    EXPECT_EQ(state_.generation.load(), before + 1);
}

TEST_F(SharedSpinLockTest, Guard_LocksOnConstruction_UnlocksOnDestruction)
{
    SharedSpinLock lock(&state_, name_);
    {
        SharedSpinLockGuard guard(lock);
        EXPECT_TRUE(lock.is_locked_by_current_thread());
    }
    EXPECT_FALSE(lock.is_locked_by_current_thread());
}

TEST_F(SharedSpinLockTest, GuardOwning_HoldsAndReleases)
{
    {
        SharedSpinLockGuardOwning guard(&state_, name_);
        SharedSpinLock view(&state_, name_);
        EXPECT_TRUE(view.is_locked_by_current_thread());
    }
    SharedSpinLock lock(&state_, name_);
    EXPECT_TRUE(lock.try_lock_for(0)) << "Lock should be free after guard destruction";
    lock.unlock();
}

TEST_F(SharedSpinLockTest, ThreadRace_MutualExclusion)
{
    uint64_t counter = 0;
    const int iterations = 200;
    ThreadRacer racer(4);
    ASSERT_TRUE(racer.race(
        [&](int)
        {
            SharedSpinLock lock(&state_, name_);
            for (int i = 0; i < iterations; ++i)
            {
                SharedSpinLockGuard guard(lock);
                const uint64_t v = counter;
                std::this_thread::yield();
                counter = v + 1;
            }
        }));
    EXPECT_EQ(counter, 4u * iterations);
}

// ============================================================================
// Multi-process tests (workers attach to the segment and use the same state)
// ============================================================================

class SharedSpinLockMultiProcessTest : public solohub::tests::IsolatedProcessTest
{
};

TEST_F(SharedSpinLockMultiProcessTest, AcquireRelease)
{
    ScopedSpinlockSegment seg;
    ASSERT_TRUE(seg.valid());

    auto proc = SpawnWorker("spinlock.multiprocess_acquire_release", {seg.name()});
    ExpectWorkerOk(*proc);

    SharedSpinLock lock(&seg.segment()->state, "main_after_worker");
    EXPECT_TRUE(lock.try_lock_for(1000)) << "Main should acquire after the worker released";
    lock.unlock();
}

TEST_F(SharedSpinLockMultiProcessTest, DeadHolderIsReclaimed)
{
    ScopedSpinlockSegment seg;
    ASSERT_TRUE(seg.valid());

    auto proc = SpawnWorker("spinlock.zombie_hold_lock", {seg.name()});
    ExpectWorkerOk(*proc);
    ASSERT_EQ(seg.segment()->state.owner_pid.load(), proc->pid())
        << "Worker exited holding the lock";

    SharedSpinLock lock(&seg.segment()->state, "main_reclaim");
    const uint64_t generation = seg.segment()->state.generation.load();
    EXPECT_TRUE(lock.try_lock_for(5000)) << "Main should reclaim the lock of a dead holder";
    EXPECT_GT(seg.segment()->state.generation.load(), generation);
    lock.unlock();
}

TEST_F(SharedSpinLockMultiProcessTest, ContendedCounterIsExact)
{
    ScopedSpinlockSegment seg;
    ASSERT_TRUE(seg.valid());

    const int iterations = scaled_value(2000, 200);
    const std::string iters = std::to_string(iterations);
    auto workers = SpawnWorkers({
        {"spinlock.contend_increment", {seg.name(), iters}},
        {"spinlock.contend_increment", {seg.name(), iters}},
        {"spinlock.contend_increment", {seg.name(), iters}},
    });
    ExpectAllWorkersOk(workers);

    EXPECT_EQ(seg.segment()->counter, 3u * static_cast<uint64_t>(iterations));
}
