/**
 * @file spinlock_workers.cpp
 * @brief Worker functions for SharedSpinLock multi-process tests.
 */
#include "spinlock_workers.h"
#include "shared_test_helpers.h"
#include "solo_service.hpp"
#include "test_entrypoint.h"
#include "utils/shared_memory_spinlock.hpp"
#include "gtest/gtest.h"
#include <chrono>
#include <thread>

using namespace solohub::tests::helper;
using namespace std::chrono_literals;

namespace solohub::tests::worker
{
namespace spinlock
{

namespace
{
/// Layout shared with test_shared_memory_spinlock.cpp: the state, then a plain counter.
struct SpinlockSegment
{
    hub::SharedSpinLockState state;
    uint64_t counter;
};
} // namespace

int multiprocess_acquire_release(const std::string &shm_name)
{
    return run_gtest_worker(
        [shm_name]()
        {
            platform::ShmHandle h = platform::shm_attach(shm_name.c_str());
            ASSERT_NE(h.base, nullptr) << "Worker: shm_attach failed for " << shm_name;
            ASSERT_GE(h.size, sizeof(hub::SharedSpinLockState));
            auto *state = static_cast<hub::SharedSpinLockState *>(h.base);
            hub::SharedSpinLock lock(state, "worker_acquire_release");
            ASSERT_TRUE(lock.try_lock_for(2000)) << "Worker: try_lock_for failed";
            std::this_thread::sleep_for(20ms);
            lock.unlock();
            platform::shm_close(&h);
        },
        "spinlock::multiprocess_acquire_release");
}

int zombie_hold_lock(const std::string &shm_name)
{
    return run_gtest_worker(
        [shm_name]()
        {
            platform::ShmHandle h = platform::shm_attach(shm_name.c_str());
            ASSERT_NE(h.base, nullptr) << "Worker: shm_attach failed for " << shm_name;
            auto *state = static_cast<hub::SharedSpinLockState *>(h.base);
            hub::SharedSpinLock lock(state, "worker_zombie");
            ASSERT_TRUE(lock.try_lock_for(2000)) << "Worker: try_lock_for failed";
            // No unlock: the state keeps naming this PID after the process is gone.
            platform::shm_close(&h);
        },
        "spinlock::zombie_hold_lock");
}

int contend_increment(const std::string &shm_name, int iterations)
{
    return run_gtest_worker(
        [shm_name, iterations]()
        {
            platform::ShmHandle h = platform::shm_attach(shm_name.c_str());
            ASSERT_NE(h.base, nullptr) << "Worker: shm_attach failed for " << shm_name;
            ASSERT_GE(h.size, sizeof(SpinlockSegment));
            auto *seg = static_cast<SpinlockSegment *>(h.base);
            hub::SharedSpinLock lock(&seg->state, "worker_contend");
            for (int i = 0; i < iterations; ++i)
            {
                hub::SharedSpinLockGuard guard(lock);
                // Non-atomic read-modify-write: only the lock keeps it exact.
                const uint64_t v = seg->counter;
                std::this_thread::yield();
                seg->counter = v + 1;
            }
            platform::shm_close(&h);
        },
        "spinlock::contend_increment");
}

} // namespace spinlock
} // namespace solohub::tests::worker

namespace
{
struct SpinlockWorkerRegistrar
{
    SpinlockWorkerRegistrar()
    {
        register_worker_dispatcher(
            [](int argc, char **argv) -> int
            {
                if (argc < 2)
                    return -1;
                std::string_view mode = argv[1];
                auto dot = mode.find('.');
                if (dot == std::string_view::npos || mode.substr(0, dot) != "spinlock")
                    return -1;
                std::string scenario(mode.substr(dot + 1));
                using namespace solohub::tests::worker::spinlock;
                if (scenario == "multiprocess_acquire_release" && argc > 2)
                    return multiprocess_acquire_release(argv[2]);
                if (scenario == "zombie_hold_lock" && argc > 2)
                    return zombie_hold_lock(argv[2]);
                if (scenario == "contend_increment" && argc > 3)
                    return contend_increment(argv[2], std::stoi(argv[3]));
                fmt::print(stderr, "ERROR: Unknown spinlock scenario '{}'\n", scenario);
                return 1;
            });
    }
};
static SpinlockWorkerRegistrar g_spinlock_registrar;
} // namespace
