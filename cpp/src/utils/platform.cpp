/**
 * @file platform.cpp
 * @brief Cross-platform implementations for the OS wrappers in `solohub::platform`.
 *
 * Process and thread identity, process liveness, monotonic time, thread naming,
 * package version and the shared memory primitives the IPC transport is built on.
 */
#include "solo_base.hpp"
#include "solohub_version.h"

#include <cerrno>
#include <chrono>
#include <thread>
#include <vector>

#if defined(SOLOHUB_IS_POSIX)
#include <climits>
#include <fcntl.h>    // O_CREAT, O_RDWR
#include <pthread.h>  // pthread_setname_np
#include <signal.h>   // kill
#include <sys/mman.h> // mmap, munmap, shm_open
#include <sys/stat.h> // fstat
#include <sys/syscall.h>
#include <sys/types.h>
#include <unistd.h>
#endif

#if defined(SOLOHUB_PLATFORM_FREEBSD)
#include <pthread_np.h>
#include <sys/sysctl.h>
#endif

#if defined(SOLOHUB_PLATFORM_APPLE)
#include <mach-o/dyld.h> // _NSGetExecutablePath
#endif

namespace solohub::platform
{

uint64_t get_pid() noexcept
{
#if defined(SOLOHUB_PLATFORM_WIN64)
    return static_cast<uint64_t>(GetCurrentProcessId());
#else
    return static_cast<uint64_t>(getpid());
#endif
}

/**
 * @details Uses the cheapest OS-specific call available (`GetCurrentThreadId`,
 *          `pthread_threadid_np`, `syscall(SYS_gettid)`).
 */
uint64_t get_native_thread_id() noexcept
{
#if defined(SOLOHUB_PLATFORM_WIN64)
    return static_cast<uint64_t>(::GetCurrentThreadId());
#elif defined(SOLOHUB_PLATFORM_APPLE)
    uint64_t tid = 0;
    pthread_threadid_np(nullptr, &tid);
    return tid;
#elif defined(SOLOHUB_PLATFORM_LINUX)
    return static_cast<uint64_t>(syscall(SYS_gettid));
#else
    return std::hash<std::thread::id>()(std::this_thread::get_id());
#endif
}

std::string get_executable_name(bool include_path) noexcept
{
    try
    {
        std::string full_path;
#if defined(SOLOHUB_PLATFORM_WIN64)
        std::vector<char> buf(MAX_PATH);
        for (;;)
        {
            DWORD len = GetModuleFileNameA(nullptr, buf.data(), static_cast<DWORD>(buf.size()));
            if (len == 0)
                return "unknown_win";
            if (len < buf.size() - 1)
            {
                full_path.assign(buf.data(), len);
                break;
            }
            buf.resize(buf.size() * 2);
        }
#elif defined(SOLOHUB_PLATFORM_LINUX)
        std::vector<char> buf(PATH_MAX);
        ssize_t count = readlink("/proc/self/exe", buf.data(), buf.size());
        if (count == -1)
            return "unknown_linux";
        full_path.assign(buf.data(), static_cast<size_t>(count));
#elif defined(SOLOHUB_PLATFORM_APPLE)
        uint32_t size = 0;
        _NSGetExecutablePath(nullptr, &size);
        std::vector<char> buf(size + 1);
        if (_NSGetExecutablePath(buf.data(), &size) != 0)
            return "unknown_macos";
        full_path = buf.data();
#elif defined(SOLOHUB_PLATFORM_FREEBSD)
        int mib[4] = {CTL_KERN, KERN_PROC, KERN_PROC_PATHNAME, -1};
        size_t buffer_size = 0;
        if (sysctl(mib, 4, nullptr, &buffer_size, nullptr, 0) == -1)
            return "unknown_freebsd";
        std::vector<char> buf(buffer_size);
        if (sysctl(mib, 4, buf.data(), &buffer_size, nullptr, 0) == -1)
            return "unknown_freebsd";
        full_path.assign(buf.data(), buffer_size - 1);
#else
        return "unknown";
#endif
        if (include_path)
            return full_path;
        return std::filesystem::path(full_path).filename().string();
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "Warning: get_executable_name failed: {}.\n", e.what());
    }
    return "unknown";
}

namespace
{
// Full name as requested; the OS copy may be truncated.
thread_local std::string t_thread_name;
} // namespace

void set_current_thread_name(const std::string &name) noexcept
{
    try
    {
        t_thread_name = name;
    }
    catch (const std::bad_alloc &)
    {
        t_thread_name.clear();
    }
#if defined(SOLOHUB_PLATFORM_LINUX)
    // Kernel limit is 16 bytes including the terminator.
    char truncated[16] = {};
    name.copy(truncated, sizeof(truncated) - 1);
    (void)pthread_setname_np(pthread_self(), truncated);
#elif defined(SOLOHUB_PLATFORM_APPLE)
    (void)pthread_setname_np(name.c_str());
#elif defined(SOLOHUB_PLATFORM_FREEBSD)
    pthread_set_name_np(pthread_self(), name.c_str());
#else
    (void)name;
#endif
}

const std::string &get_current_thread_name() noexcept
{
    return t_thread_name;
}

// --- Version information (from solohub_version.h, generated at configure time) ---

int get_version_major() noexcept
{
    return SOLOHUB_VERSION_MAJOR;
}

int get_version_minor() noexcept
{
    return SOLOHUB_VERSION_MINOR;
}

int get_version_rolling() noexcept
{
    return SOLOHUB_VERSION_ROLLING;
}

const char *get_version_string() noexcept
{
    return SOLOHUB_VERSION_STRING;
}

/**
 * @details Dead-node detection in the IPC registry and zombie reclaim in
 *          SharedSpinLock both rely on this.
 *
 * POSIX: kill(pid, 0) checks existence without sending a signal.
 *  - ESRCH: no such process -> dead
 *  - EPERM: exists but belongs to someone else -> alive
 */
bool is_process_alive(uint64_t pid) noexcept
{
    if (pid == 0)
        return false;

#if defined(SOLOHUB_PLATFORM_WIN64)
    HANDLE process = OpenProcess(PROCESS_QUERY_LIMITED_INFORMATION, FALSE, static_cast<DWORD>(pid));
    if (process == NULL)
        return GetLastError() != ERROR_INVALID_PARAMETER;

    DWORD exit_code = 0;
    BOOL ok = GetExitCodeProcess(process, &exit_code);
    CloseHandle(process);
    return ok && exit_code == STILL_ACTIVE;
#else
    if (kill(static_cast<pid_t>(pid), 0) == 0)
        return true;
    return errno != ESRCH;
#endif
}

uint64_t monotonic_time_ns() noexcept
{
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
                                     std::chrono::steady_clock::now().time_since_epoch())
                                     .count());
}

uint64_t elapsed_time_ns(uint64_t start_ns) noexcept
{
    uint64_t now = monotonic_time_ns();
    if (now < start_ns)
        return 0;
    return now - start_ns;
}

// ============================================================================
// Shared Memory
// ============================================================================

#if defined(SOLOHUB_PLATFORM_WIN64)

ShmHandle shm_create(const char *name, size_t size, unsigned flags)
{
    ShmHandle h{};
    if (!name || size == 0)
        return h;
    const auto size64 = static_cast<unsigned long long>(size);
    HANDLE mapping = CreateFileMappingA(INVALID_HANDLE_VALUE, NULL, PAGE_READWRITE,
                                        static_cast<DWORD>(size64 >> 32),
                                        static_cast<DWORD>(size64 & 0xFFFFFFFFull), name);
    if (mapping == NULL)
        return h;
    if ((flags & SHM_CREATE_EXCLUSIVE) != 0 && GetLastError() == ERROR_ALREADY_EXISTS)
    {
        CloseHandle(mapping);
        SetLastError(ERROR_ALREADY_EXISTS);
        return h;
    }
    void *base = MapViewOfFile(mapping, FILE_MAP_ALL_ACCESS, 0, 0, size);
    if (base == NULL)
    {
        CloseHandle(mapping);
        return h;
    }
    h.base = base;
    h.size = size;
    h.opaque = mapping;
    return h;
}

ShmHandle shm_attach(const char *name)
{
    ShmHandle h{};
    if (!name)
        return h;
    HANDLE mapping = OpenFileMappingA(FILE_MAP_READ | FILE_MAP_WRITE, FALSE, name);
    if (mapping == NULL)
        return h;
    void *base = MapViewOfFile(mapping, FILE_MAP_READ | FILE_MAP_WRITE, 0, 0, 0);
    if (base == NULL)
    {
        CloseHandle(mapping);
        return h;
    }
    MEMORY_BASIC_INFORMATION mbi;
    if (VirtualQuery(base, &mbi, sizeof(mbi)) == 0)
    {
        UnmapViewOfFile(base);
        CloseHandle(mapping);
        return h;
    }
    h.base = base;
    h.size = mbi.RegionSize;
    h.opaque = mapping;
    return h;
}

void shm_close(ShmHandle *handle)
{
    if (!handle)
        return;
    if (handle->base)
    {
        UnmapViewOfFile(handle->base);
        handle->base = nullptr;
    }
    if (handle->opaque)
    {
        CloseHandle(static_cast<HANDLE>(handle->opaque));
        handle->opaque = nullptr;
    }
    handle->size = 0;
}

void shm_unlink(const char * /*name*/)
{
    // Windows releases the name when the last handle closes.
}

#else // POSIX

namespace
{
// fd is stored +1 so that descriptor 0 does not read as "no handle".
void *fd_to_opaque(int fd)
{
    return reinterpret_cast<void *>(static_cast<intptr_t>(fd) + 1);
}

int opaque_to_fd(void *opaque)
{
    return static_cast<int>(reinterpret_cast<intptr_t>(opaque) - 1);
}
} // namespace

ShmHandle shm_create(const char *name, size_t size, unsigned flags)
{
    ShmHandle h{};
    if (!name || size == 0)
    {
        errno = EINVAL;
        return h;
    }
    if ((flags & SHM_CREATE_UNLINK_FIRST) != 0)
        ::shm_unlink(name);
    int open_flags = O_CREAT | O_RDWR;
    if ((flags & SHM_CREATE_EXCLUSIVE) != 0)
        open_flags |= O_EXCL;
    int fd = shm_open(name, open_flags, 0666);
    if (fd == -1)
        return h;
    if (ftruncate(fd, static_cast<off_t>(size)) == -1)
    {
        const int saved = errno;
        close(fd);
        ::shm_unlink(name);
        errno = saved;
        return h;
    }
    void *base = mmap(nullptr, size, PROT_READ | PROT_WRITE, MAP_SHARED, fd, 0);
    if (base == MAP_FAILED)
    {
        const int saved = errno;
        close(fd);
        ::shm_unlink(name);
        errno = saved;
        return h;
    }
    h.base = base;
    h.size = size;
    h.opaque = fd_to_opaque(fd);
    return h;
}

ShmHandle shm_attach(const char *name)
{
    ShmHandle h{};
    if (!name)
    {
        errno = EINVAL;
        return h;
    }
    int fd = shm_open(name, O_RDWR, 0666);
    if (fd == -1)
        return h;
    struct stat st;
    if (fstat(fd, &st) == -1)
    {
        const int saved = errno;
        close(fd);
        errno = saved;
        return h;
    }
    if (st.st_size <= 0)
    {
        // Creator has not sized the segment yet.
        close(fd);
        errno = EAGAIN;
        return h;
    }
    auto size = static_cast<size_t>(st.st_size);
    void *base = mmap(nullptr, size, PROT_READ | PROT_WRITE, MAP_SHARED, fd, 0);
    if (base == MAP_FAILED)
    {
        const int saved = errno;
        close(fd);
        errno = saved;
        return h;
    }
    h.base = base;
    h.size = size;
    h.opaque = fd_to_opaque(fd);
    return h;
}

void shm_close(ShmHandle *handle)
{
    if (!handle)
        return;
    if (handle->base && handle->size > 0)
    {
        munmap(handle->base, handle->size);
        handle->base = nullptr;
    }
    if (handle->opaque)
    {
        close(opaque_to_fd(handle->opaque));
        handle->opaque = nullptr;
    }
    handle->size = 0;
}

void shm_unlink(const char *name)
{
    if (name)
        ::shm_unlink(name);
}

#endif

} // namespace solohub::platform
