/**
 * @file debug_info.cpp
 * @brief Stack trace printing for solohub::debug::print_stack_trace().
 *
 * POSIX: `backtrace` collects frames, `dladdr` maps each frame to its module and
 * nearest exported symbol, `__cxa_demangle` makes C++ names readable.
 * Windows: `CaptureStackBackTrace` with raw addresses only.
 */
#include "solo_base.hpp"

#include <array>
#include <cstdio>
#include <cstdlib>
#include <memory>

#if defined(SOLOHUB_IS_POSIX)
#include <cxxabi.h>   // __cxa_demangle
#include <dlfcn.h>    // dladdr
#include <execinfo.h> // backtrace
#endif

namespace solohub::debug
{

namespace
{
constexpr int kMaxFrames = 64;
// print_stack_trace itself is not worth printing.
constexpr int kSkipFrames = 1;

#if defined(SOLOHUB_IS_POSIX)
std::string demangle(const char *symbol)
{
    if (symbol == nullptr)
        return "??";
    int status = 0;
    std::unique_ptr<char, decltype(&std::free)> demangled(
        abi::__cxa_demangle(symbol, nullptr, nullptr, &status), &std::free);
    if (status == 0 && demangled)
        return demangled.get();
    return symbol;
}
#endif
} // namespace

void print_stack_trace() noexcept
{
    try
    {
#if defined(SOLOHUB_IS_POSIX)
        std::array<void *, kMaxFrames> frames{};
        const int count = backtrace(frames.data(), kMaxFrames);
        fmt::print(stderr, "Stack trace ({} frames):\n", count > kSkipFrames ? count - kSkipFrames : 0);
        for (int i = kSkipFrames; i < count; ++i)
        {
            Dl_info info{};
            if (dladdr(frames[static_cast<size_t>(i)], &info) != 0)
            {
                const auto module = format_tools::filename_only(info.dli_fname ? info.dli_fname : "??");
                const auto offset = reinterpret_cast<uintptr_t>(frames[static_cast<size_t>(i)]) -
                                    reinterpret_cast<uintptr_t>(info.dli_saddr);
                fmt::print(stderr, "  #{:<2} {} in {} +0x{:x}\n", i - kSkipFrames,
                           demangle(info.dli_sname), module,
                           info.dli_saddr ? offset : 0);
            }
            else
            {
                fmt::print(stderr, "  #{:<2} {}\n", i - kSkipFrames, frames[static_cast<size_t>(i)]);
            }
        }
#elif defined(SOLOHUB_PLATFORM_WIN64)
        std::array<void *, kMaxFrames> frames{};
        const USHORT count = CaptureStackBackTrace(kSkipFrames, kMaxFrames, frames.data(), nullptr);
        fmt::print(stderr, "Stack trace ({} frames):\n", count);
        for (USHORT i = 0; i < count; ++i)
            fmt::print(stderr, "  #{:<2} {}\n", i, frames[i]);
#else
        fmt::print(stderr, "Stack trace not available on this platform.\n");
#endif
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "print_stack_trace failed: %s\n", e.what());
    }
    std::fflush(stderr);
}

} // namespace solohub::debug
