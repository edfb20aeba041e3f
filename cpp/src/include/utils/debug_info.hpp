/**
 * @file debug_info.hpp
 * @brief Stack trace printing, panic handling for fatal errors, and debug messages.
 *
 * Everything here writes straight to `stderr` and never goes through the Logger,
 * so it stays usable while the Logger is shutting down or was never started.
 * Format strings are checked at compile time through `fmt::format_string`.
 */
#pragma once

#include <cstdio>          // for fflush
#include <cstdlib>         // for std::abort
#include <fmt/format.h>    // for fmt::format_string, fmt::print, fmt::format
#include <source_location> // for std::source_location
#include <string>
#include <string_view>

#include "utils/format_tools.hpp" // for solohub::format_tools::filename_only

namespace solohub::debug
{

/**
 * @brief Prints the current call stack to `stderr`.
 *
 * POSIX uses `backtrace` + `dladdr` with C++ demangling; other platforms print a notice.
 */
SOLOHUB_UTILS_EXPORT void print_stack_trace() noexcept;

/** @brief "file:line:function" for a source location. */
inline std::string location_string(std::source_location loc)
{
    return fmt::format("{}:{}:{}", format_tools::filename_only(loc.file_name()), loc.line(),
                       loc.function_name());
}

/**
 * @brief Halts the program with a fatal error message and a stack trace.
 *
 * For broken invariants only. Expected failures are reported through Result.
 *
 * @param loc Where the panic was raised; captured by SOLOHUB_PANIC.
 * @param fmt_str Compile-time checked format string.
 */
template <typename... Args>
[[noreturn]] inline void panic(std::source_location loc, fmt::format_string<Args...> fmt_str,
                               Args &&...args) noexcept
{
    try
    {
        const auto body = fmt::format(fmt_str, std::forward<Args>(args)...);
        fmt::print(stderr, "[PANIC] {} -- {}\n", location_string(loc), body);
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "[PANIC] %s:%u -- format error while panicking: %s\n",
                     loc.file_name(), static_cast<unsigned>(loc.line()), e.what());
    }
    std::fflush(stderr);
    print_stack_trace();
    std::abort();
}

/**
 * @brief Prints a debug message to `stderr` with compile-time format string checking.
 */
template <typename... Args>
inline void debug_msg(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    try
    {
        const auto body = fmt::format(fmt_str, std::forward<Args>(args)...);
        fmt::print(stderr, "[DBG]  {}\n", body);
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "[DBG]  format error during debug_msg: %s\n", e.what());
    }
    std::fflush(stderr);
}

} // namespace solohub::debug

/**
 * @brief Calls `solohub::debug::panic` with the current source location.
 * @param fmt The `fmt`-style format string literal.
 */
#ifndef SOLOHUB_PANIC
#define SOLOHUB_PANIC(fmt, ...)                                                                    \
    ::solohub::debug::panic(std::source_location::current(),                                       \
                            FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#endif

/**
 * @brief Debug message to stderr, compiled in only when SOLOHUB_ENABLE_DEBUG_MESSAGES is set.
 * @param fmt The `fmt`-style format string literal.
 */
#ifndef SOLOHUB_DEBUG
#if defined(SOLOHUB_ENABLE_DEBUG_MESSAGES)
#define SOLOHUB_DEBUG(fmt, ...)                                                                    \
    ::solohub::debug::debug_msg(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#else
#define SOLOHUB_DEBUG(fmt, ...)                                                                    \
    do                                                                                             \
    {                                                                                              \
    } while (0)
#endif
#endif
