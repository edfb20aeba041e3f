#include "utils/static_path.hpp"

#include <iterator>

namespace solohub::ipc
{

std::string FromPathError::what() const
{
    switch (kind)
    {
    case Kind::TooLong:
        return fmt::format("cannot create StaticPath<{}> from a path of length {}", at_most, len);
    case Kind::NotUtf8:
        return "path is required to be utf-8 on windows";
    }
    return "unknown path error";
}

namespace detail
{

namespace
{
// Length of the well-formed UTF-8 sequence starting at bytes[0], or 0.
size_t utf8_sequence_length(std::span<const uint8_t> bytes) noexcept
{
    const uint8_t lead = bytes[0];
    if (lead < 0x80)
        return 1;

    size_t len = 0;
    uint8_t lo = 0x80;
    uint8_t hi = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF)
        len = 2;
    else if (lead == 0xE0)
    {
        len = 3;
        lo = 0xA0;
    }
    else if ((lead >= 0xE1 && lead <= 0xEC) || lead == 0xEE || lead == 0xEF)
        len = 3;
    else if (lead == 0xED)
    {
        len = 3;
        hi = 0x9F; // no surrogates
    }
    else if (lead == 0xF0)
    {
        len = 4;
        lo = 0x90;
    }
    else if (lead >= 0xF1 && lead <= 0xF3)
        len = 4;
    else if (lead == 0xF4)
    {
        len = 4;
        hi = 0x8F;
    }
    else
        return 0;

    if (bytes.size() < len)
        return 0;
    if (bytes[1] < lo || bytes[1] > hi)
        return 0;
    for (size_t i = 2; i < len; ++i)
    {
        if (bytes[i] < 0x80 || bytes[i] > 0xBF)
            return 0;
    }
    return len;
}
} // namespace

bool is_valid_utf8(std::span<const uint8_t> bytes) noexcept
{
    while (!bytes.empty())
    {
        const size_t len = utf8_sequence_length(bytes);
        if (len == 0)
            return false;
        bytes = bytes.subspan(len);
    }
    return true;
}

std::string quote_path_bytes(std::span<const uint8_t> bytes)
{
    std::string out;
    out.reserve(bytes.size() + 2);
    out.push_back('"');
    while (!bytes.empty())
    {
        const size_t len = utf8_sequence_length(bytes);
        if (len == 0)
        {
            fmt::format_to(std::back_inserter(out), "\\x{:02X}", bytes[0]);
            bytes = bytes.subspan(1);
            continue;
        }
        out.append(reinterpret_cast<const char *>(bytes.data()), len);
        bytes = bytes.subspan(len);
    }
    out.push_back('"');
    return out;
}

} // namespace detail

} // namespace solohub::ipc
