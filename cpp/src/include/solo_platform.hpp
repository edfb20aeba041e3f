#pragma once
/**
 * @file solo_platform.hpp
 * @brief Layer 0: Platform detection and platform utility declarations.
 *
 * Foundation for everything else in solohub. Every file that needs the platform
 * macros (SOLOHUB_PLATFORM_LINUX, SOLOHUB_IS_POSIX, ...) or the OS wrappers for
 * shared memory, process liveness and monotonic time includes this header.
 *
 * Build-system macros (PLATFORM_LINUX, ...) win; compiler predefined macros are the fallback.
 */
#include <cstddef>
#include <cstdint>
#include <string>

#if defined(PLATFORM_WIN64) || (!defined(PLATFORM_APPLE) && !defined(PLATFORM_FREEBSD) &&         \
                                !defined(PLATFORM_LINUX) && defined(_WIN64))
#define SOLOHUB_PLATFORM_WIN64 1
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#elif defined(PLATFORM_APPLE) || (defined(__APPLE__) && defined(__MACH__))
#define SOLOHUB_PLATFORM_APPLE 1
#elif defined(PLATFORM_FREEBSD) || defined(__FreeBSD__)
#define SOLOHUB_PLATFORM_FREEBSD 1
#elif defined(PLATFORM_LINUX) || defined(__linux__)
#define SOLOHUB_PLATFORM_LINUX 1
#else
#define SOLOHUB_PLATFORM_UNKNOWN 1
#endif

#if defined(SOLOHUB_PLATFORM_WIN64)
#define SOLOHUB_IS_WINDOWS 1
#elif defined(SOLOHUB_PLATFORM_APPLE) || defined(SOLOHUB_PLATFORM_FREEBSD) ||                     \
    defined(SOLOHUB_PLATFORM_LINUX)
#define SOLOHUB_IS_POSIX 1
#endif

// --- Require C++20 or later --------------------------------------------------
// MSVC only reports the real standard through _MSVC_LANG unless /Zc:__cplusplus is set.
#if defined(_MSC_VER)
#if !defined(_MSVC_LANG) || (_MSVC_LANG < 202002L)
#error "solohub requires C++20 or later. Please compile with /std:c++20 or newer (MSVC)."
#endif
#else
#if __cplusplus < 202002L
#error "solohub requires C++20 or later. Please compile with -std=c++20 or newer."
#endif
#endif

#include "solohub_utils_export.h"

namespace solohub::platform
{

// ============================================================================
// Shared Memory (cross-platform abstraction)
// ============================================================================

/**
 * @brief Opaque handle for a mapped shared memory segment.
 * @details Use shm_create() or shm_attach() to obtain; shm_close() to release.
 *          base is the mapped address; size is the segment size in bytes;
 *          opaque holds platform-specific data (do not use directly).
 */
struct ShmHandle
{
    void *base = nullptr;   ///< Mapped address (nullptr if invalid)
    size_t size = 0;        ///< Segment size in bytes
    void *opaque = nullptr; ///< Platform handle (HANDLE on Windows, fd + 1 on POSIX)
};

/** Flags for shm_create(). Combine with bitwise OR. */
enum ShmCreateFlags : unsigned
{
    SHM_CREATE_NONE = 0,
    /** Create only if segment does not exist; fail if it exists (POSIX O_EXCL; Windows: check). */
    SHM_CREATE_EXCLUSIVE = 1,
    /** POSIX: unlink name before create (clean slate). Windows: no-op. */
    SHM_CREATE_UNLINK_FIRST = 2,
};

/**
 * @brief Creates a new shared memory segment and maps it.
 * @param name Segment name ("/name" on POSIX, "Local\\name" on Windows).
 * @param size Size in bytes. The new segment is zero-filled.
 * @param flags Optional flags: SHM_CREATE_EXCLUSIVE, SHM_CREATE_UNLINK_FIRST.
 * @return ShmHandle with base != nullptr on success. On failure base is nullptr and
 *         errno (POSIX) / GetLastError() (Windows) describes the cause.
 */
SOLOHUB_UTILS_EXPORT ShmHandle shm_create(const char *name, size_t size,
                                          unsigned flags = SHM_CREATE_NONE);

/**
 * @brief Attaches to an existing shared memory segment.
 * @param name Segment name (must match the name used by the creator).
 * @return ShmHandle with base != nullptr on success. Size is populated from the segment.
 *         A segment whose creator has not sized it yet fails to attach.
 */
SOLOHUB_UTILS_EXPORT ShmHandle shm_attach(const char *name);

/**
 * @brief Unmaps and closes a shared memory handle.
 * @param h Handle to close. After return, h->base is invalid.
 */
SOLOHUB_UTILS_EXPORT void shm_close(ShmHandle *h);

/**
 * @brief Removes the shared memory name (POSIX: shm_unlink; Windows: no-op).
 * @details Existing mappings stay valid until unmapped.
 */
SOLOHUB_UTILS_EXPORT void shm_unlink(const char *name);

// ============================================================================
// Process / thread identity
// ============================================================================

/** @brief Native thread ID of the calling thread (used in log lines and lock ownership). */
SOLOHUB_UTILS_EXPORT uint64_t get_native_thread_id() noexcept;

/** @brief Process ID of the current process. */
SOLOHUB_UTILS_EXPORT uint64_t get_pid() noexcept;

/**
 * @brief Name of the current executable.
 * @param include_path If `true`, returns the full absolute path.
 * @return The executable name, or "unknown" on failure.
 */
SOLOHUB_UTILS_EXPORT std::string get_executable_name(bool include_path = false) noexcept;

/**
 * @brief Names the calling thread for debuggers and `top -H`.
 * @details Best effort. Linux truncates names to 15 characters; failures are ignored.
 */
SOLOHUB_UTILS_EXPORT void set_current_thread_name(const std::string &name) noexcept;

/** @brief Name last given to the calling thread by set_current_thread_name(); empty if none. */
SOLOHUB_UTILS_EXPORT const std::string &get_current_thread_name() noexcept;

/**
 * @brief Checks if a process with the given PID is currently alive.
 * @details POSIX: kill(pid, 0); EPERM counts as alive. Windows: OpenProcess + exit code.
 * @note PID 0 always returns false. A zombie (exited, not yet reaped) still counts as alive.
 */
SOLOHUB_UTILS_EXPORT bool is_process_alive(uint64_t pid) noexcept;

// ============================================================================
// Time
// ============================================================================

/**
 * @brief Monotonic timestamp in nanoseconds (steady_clock).
 * @note Only differences are meaningful. All timeouts in solohub are computed from it.
 */
SOLOHUB_UTILS_EXPORT uint64_t monotonic_time_ns() noexcept;

/**
 * @brief Nanoseconds elapsed since a monotonic_time_ns() timestamp; 0 if start_ns is in the future.
 */
SOLOHUB_UTILS_EXPORT uint64_t elapsed_time_ns(uint64_t start_ns) noexcept;

// ============================================================================
// Version
// ============================================================================

SOLOHUB_UTILS_EXPORT int get_version_major() noexcept;
SOLOHUB_UTILS_EXPORT int get_version_minor() noexcept;
SOLOHUB_UTILS_EXPORT int get_version_rolling() noexcept;
/** @brief Full version string, "major.minor.rolling". */
SOLOHUB_UTILS_EXPORT const char *get_version_string() noexcept;

} // namespace solohub::platform
