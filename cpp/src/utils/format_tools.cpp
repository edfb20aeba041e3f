// format_tools.cpp
#include "solo_base.hpp"

#include <ctime>

namespace solohub::format_tools
{

// Local time with sub-second resolution. fmt's chrono support for sub-seconds varies
// between releases, so the fractional part is appended manually.
std::string formatted_time(std::chrono::system_clock::time_point timestamp)
{
    auto tp_us = std::chrono::time_point_cast<std::chrono::microseconds>(timestamp);
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp_us);
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(tp_us - secs).count();
    // normalize to 0..999999 even for negative timestamps
    int fractional_us = static_cast<int>(us % 1000000);
    if (fractional_us < 0)
        fractional_us += 1000000;

    std::time_t tt = std::chrono::system_clock::to_time_t(secs);
    std::tm local_tm{};
#if defined(SOLOHUB_PLATFORM_WIN64)
    localtime_s(&local_tm, &tt);
#else
    localtime_r(&tt, &local_tm);
#endif
    return fmt::format("{:%Y-%m-%d %H:%M:%S}.{:06d}", local_tm, fractional_us);
}

std::string formatted_seconds(std::chrono::nanoseconds duration, int decimals)
{
    const double seconds = std::chrono::duration<double>(duration).count();
    return fmt::format("{:.{}f}s", seconds, decimals);
}

} // namespace solohub::format_tools
