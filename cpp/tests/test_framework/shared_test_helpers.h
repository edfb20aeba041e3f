// tests/test_framework/shared_test_helpers.h
#pragma once

// Must be first: defines SOLOHUB_IS_POSIX before any platform-conditional includes.
#include "solo_platform.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
namespace fs = std::filesystem;

/**
 * @file shared_test_helpers.h
 * @brief Provides common helper functions and utilities for test cases.
 *
 * This includes file helpers, test scaling utilities, unique transport
 * domains, and a generic wrapper for running test logic within a worker process.
 */

#include "gtest/gtest.h"

// Logger, SOLOHUB_DEBUG, print_stack_trace
#include "solo_service.hpp"

// Required for ThreadRacer
#include <algorithm>
#include <atomic>
#include <exception>
#include <thread>

namespace solohub::tests::helper
{

/**
 * @brief Reads the entire contents of a file into a string.
 * @return True if the file was read successfully, false otherwise.
 */
bool read_file_contents(const std::string &path, std::string &out);

/**
 * @brief Counts lines of `text`, optionally only those containing `must_include`
 *        and not containing `must_exclude`.
 */
size_t count_lines(std::string_view text,
                   std::optional<std::string_view> must_include = std::nullopt,
                   std::optional<std::string_view> must_exclude = std::nullopt);

/**
 * @brief Polls `condition` every `poll` until it holds or `timeout` passes.
 * @return The last value of `condition()`.
 */
template <typename Pred>
bool wait_until(Pred condition, std::chrono::milliseconds timeout,
                std::chrono::milliseconds poll = std::chrono::milliseconds(5))
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (condition())
            return true;
        std::this_thread::sleep_for(poll);
    }
    return condition();
}

/**
 * @brief Retrieves the test scale factor from the environment.
 *
 * Set the `SOLOHUB_TEST_SCALE` environment variable to "small" for lighter runs.
 */
std::string test_scale();

/**
 * @brief Returns `small_value` if test_scale() is "small", otherwise `original`.
 */
int scaled_value(int original, int small_value);

/**
 * @brief Wraps test logic for execution in a worker process.
 *
 * Makes GTest assertions throw, runs `test_logic`, and shuts the Logger down
 * so every queued line reaches stderr before the process exits.
 *
 * @return 0 on success, 1 on GTest assertion failure, 2 on standard exception.
 */
template <typename Fn> int run_gtest_worker(Fn test_logic, const char *test_name)
{
    // Without throw_on_failure, ASSERT_* only returns from the lambda and
    // EXPECT_* only prints: both would let a failing worker exit 0.
    GTEST_FLAG_SET(throw_on_failure, true);

    int rc = 0;
    try
    {
        test_logic();
    }
    catch (const ::testing::internal::GoogleTestFailureException &e)
    {
        fmt::print(stderr, "[WORKER FAILURE] GTest assertion failed in {}: \n{}\n", test_name,
                   e.what());
        solohub::debug::print_stack_trace();
        rc = 1;
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "[WORKER FAILURE] {} threw an exception: {}\n", test_name, e.what());
        solohub::debug::print_stack_trace();
        rc = 2;
    }
    solohub::utils::Logger::instance().shutdown();
    return rc;
}

/**
 * @brief Wraps worker logic without shutting the Logger down afterwards.
 *
 * Use this when the worker itself controls logger shutdown or leaves the
 * process in a deliberately unclean state.
 */
template <typename Fn> int run_worker_bare(Fn test_logic, const char *test_name)
{
    GTEST_FLAG_SET(throw_on_failure, true);

    try
    {
        test_logic();
    }
    catch (const ::testing::internal::GoogleTestFailureException &e)
    {
        fmt::print(stderr, "[WORKER FAILURE] GTest assertion failed in {}: \n{}\n", test_name,
                   e.what());
        return 1;
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "[WORKER FAILURE] {} threw an exception: {}\n", test_name, e.what());
        return 2;
    }
    return 0;
}

// ============================================================================
// ThreadRacer: concurrent test execution
// ============================================================================

/**
 * @brief Runs N threads simultaneously to test concurrent behavior.
 *
 * All threads start at the same time (synchronized via a barrier).
 * Any exception thrown by a thread is captured and available from exceptions().
 */
class ThreadRacer
{
  public:
    explicit ThreadRacer(int n_threads) : n_threads_(n_threads) {}

    /**
     * @brief Runs fn(thread_index) on n_threads simultaneously.
     * @return true if all threads completed without throwing, false otherwise.
     */
    template <typename F> bool race(F fn)
    {
        exceptions_.clear();
        exceptions_.resize(static_cast<size_t>(n_threads_));

        std::atomic<int> ready_count{0};
        std::atomic<bool> start_flag{false};

        std::vector<std::thread> threads;
        threads.reserve(static_cast<size_t>(n_threads_));

        for (int i = 0; i < n_threads_; ++i)
        {
            threads.emplace_back(
                [&, i]()
                {
                    ready_count.fetch_add(1, std::memory_order_release);
                    while (!start_flag.load(std::memory_order_acquire))
                        std::this_thread::yield();
                    try
                    {
                        fn(i);
                    }
                    catch (const std::exception &)
                    {
                        exceptions_[static_cast<size_t>(i)] = std::current_exception();
                    }
                });
        }

        while (ready_count.load(std::memory_order_acquire) < n_threads_)
            std::this_thread::yield();

        start_flag.store(true, std::memory_order_release);

        for (auto &t : threads)
            t.join();

        return std::all_of(exceptions_.begin(), exceptions_.end(),
                           [](const std::exception_ptr &p) { return p == nullptr; });
    }

    const std::vector<std::exception_ptr> &exceptions() const { return exceptions_; }

  private:
    int n_threads_;
    std::vector<std::exception_ptr> exceptions_;
};

// ============================================================================
// Transport domain utilities
// ============================================================================

/**
 * @brief Unique transport domain for one test, e.g. "t_PubSub_4242_17".
 *
 * Every test works in its own domain so leftovers of a crashed run never
 * collide with another test's registry.
 */
std::string make_test_domain(const char *test_name);

/**
 * @brief Unlinks the registry of `domain` and the segments of `services`.
 * @return True if nothing that existed failed to unlink.
 */
bool cleanup_test_domain(const std::string &domain, const std::vector<std::string> &services = {});

/**
 * @brief RAII guard for a test transport domain.
 *
 * Usage:
 * @code
 *   DomainTestGuard guard("PubSubOverflow", {"svc"});
 *   TransportConfig config;
 *   config.domain = guard.domain();
 *   // ~DomainTestGuard() unlinks whatever the test left behind
 * @endcode
 */
class DomainTestGuard
{
  public:
    explicit DomainTestGuard(const char *test_name, std::vector<std::string> services = {})
        : domain_(make_test_domain(test_name)), services_(std::move(services))
    {
    }

    ~DomainTestGuard() { cleanup_test_domain(domain_, services_); }

    const std::string &domain() const { return domain_; }

    DomainTestGuard(const DomainTestGuard &) = delete;
    DomainTestGuard &operator=(const DomainTestGuard &) = delete;
    DomainTestGuard(DomainTestGuard &&) = delete;
    DomainTestGuard &operator=(DomainTestGuard &&) = delete;

  private:
    std::string domain_;
    std::vector<std::string> services_;
};

} // namespace solohub::tests::helper
