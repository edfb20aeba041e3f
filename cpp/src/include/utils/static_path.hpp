#pragma once
/**
 * @file static_path.hpp
 * @brief Fixed-capacity filesystem path, trivially copyable for transport payloads.
 *
 * StaticPath<N> stores the native byte form of a path (at most N bytes) inline,
 * so a message struct holding one can be sent through a PubSubService. POSIX
 * paths are arbitrary bytes; on Windows the bytes are UTF-8 and conversion in
 * either direction fails for anything else.
 */
#include "solohub_utils_export.h"
#include "utils/result.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

#include <fmt/format.h>

namespace solohub::ipc
{

struct SOLOHUB_UTILS_EXPORT FromPathError
{
    enum class Kind : uint8_t
    {
        /// The path needs `len` bytes; at most `at_most` fit.
        TooLong,
        /// Windows only: the path has no UTF-8 form.
        NotUtf8,
    };

    Kind kind = Kind::TooLong;
    size_t at_most = 0;
    size_t len = 0;

    [[nodiscard]] static FromPathError too_long(size_t at_most, size_t len) noexcept
    {
        return FromPathError{Kind::TooLong, at_most, len};
    }
    [[nodiscard]] static FromPathError not_utf8() noexcept { return FromPathError{Kind::NotUtf8, 0, 0}; }

    friend bool operator==(const FromPathError &, const FromPathError &) = default;

    [[nodiscard]] std::string what() const;
};

enum class IntoPathError : uint8_t
{
    /// Windows only: the stored bytes are not valid UTF-8.
    NotUtf8,
};

namespace detail
{
/// True if `bytes` is well-formed UTF-8 (no overlongs, no surrogates, <= U+10FFFF).
[[nodiscard]] SOLOHUB_UTILS_EXPORT bool is_valid_utf8(std::span<const uint8_t> bytes) noexcept;

/// `"..."` with valid UTF-8 copied and every other byte as `\xNN`.
[[nodiscard]] SOLOHUB_UTILS_EXPORT std::string quote_path_bytes(std::span<const uint8_t> bytes);
} // namespace detail

template <size_t N> class StaticPath
{
    static_assert(N > 0, "StaticPath needs room for at least one byte");

  public:
    StaticPath() = default;

    [[nodiscard]] static utils::Result<StaticPath, FromPathError> from_path(const std::filesystem::path &path)
    {
        using R = utils::Result<StaticPath, FromPathError>;
#if defined(_WIN32)
        std::u8string utf8;
        try
        {
            utf8 = path.u8string();
        }
        catch (const std::system_error &)
        {
            return R::error(FromPathError::not_utf8());
        }
        const auto *bytes = reinterpret_cast<const uint8_t *>(utf8.data());
        const size_t len = utf8.size();
#else
        const std::string &native = path.native();
        const auto *bytes = reinterpret_cast<const uint8_t *>(native.data());
        const size_t len = native.size();
#endif
        if (len > N)
            return R::error(FromPathError::too_long(N, len));

        StaticPath result;
        result.m_length = len;
        std::memcpy(result.m_data, bytes, len);
        return R::ok(result);
    }

    [[nodiscard]] utils::Result<std::filesystem::path, IntoPathError> to_path() const
    {
        using R = utils::Result<std::filesystem::path, IntoPathError>;
#if defined(_WIN32)
        if (!detail::is_valid_utf8(bytes()))
            return R::error(IntoPathError::NotUtf8);
        return R::ok(std::filesystem::path(
            std::u8string(reinterpret_cast<const char8_t *>(m_data), size())));
#else
        return R::ok(std::filesystem::path(std::string(reinterpret_cast<const char *>(m_data), size())));
#endif
    }

    [[nodiscard]] std::span<const uint8_t> bytes() const noexcept { return {m_data, size()}; }
    [[nodiscard]] size_t size() const noexcept { return static_cast<size_t>(m_length); }
    [[nodiscard]] bool empty() const noexcept { return m_length == 0; }
    [[nodiscard]] static constexpr size_t capacity() noexcept { return N; }

    friend bool operator==(const StaticPath &a, const StaticPath &b) noexcept
    {
        return a.m_length == b.m_length && std::equal(a.m_data, a.m_data + a.size(), b.m_data);
    }

  private:
    uint64_t m_length = 0;
    uint8_t m_data[N]{};
};

} // namespace solohub::ipc

template <size_t N> struct fmt::formatter<solohub::ipc::StaticPath<N>> : fmt::formatter<std::string_view>
{
    template <typename FormatContext>
    auto format(const solohub::ipc::StaticPath<N> &path, FormatContext &ctx) const
    {
        const std::string quoted = solohub::ipc::detail::quote_path_bytes(path.bytes());
        return fmt::formatter<std::string_view>::format(quoted, ctx);
    }
};
