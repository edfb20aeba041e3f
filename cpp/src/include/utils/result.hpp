/**
 * @file result.hpp
 * @brief Generic Result<T, E> type for error handling without exceptions
 *
 * Every fallible operation in the IPC transport and the coordination layer
 * returns a Result. Expected failures (a taken subscriber slot, a name that does
 * not validate, a timeout) are values; exceptions are reserved for programmer
 * errors such as reading the content of an error Result.
 *
 * - Distinguishes between success (T) and expected failures (E)
 * - Forces explicit error handling at call sites
 * - No implicit conversions to bool
 * - [[nodiscard]] prevents ignoring errors
 */

#pragma once

#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace solohub::utils
{

/**
 * @class Result
 * @brief Generic Result<T, E> type for operations that can fail in expected ways
 *
 * @tparam T Success value type (may be move-only)
 * @tparam E Error type: an enum, or a default-constructible error struct
 *
 * Usage:
 * @code
 * Result<int, ErrorCode> compute() {
 *     if (condition) {
 *         return Result<int, ErrorCode>::ok(42);
 *     }
 *     return Result<int, ErrorCode>::error(ErrorCode::InvalidInput, errno);
 * }
 *
 * auto result = compute();
 * if (result.is_ok()) {
 *     int value = result.content();
 * } else {
 *     ErrorCode err = result.error();
 * }
 * @endcode
 *
 * Thread Safety: Result objects are not thread-safe.
 */
template <typename T, typename E>
class Result
{
  public:
    using value_type = T;
    using error_type = E;

    static_assert(std::is_default_constructible_v<E>, "Result error type must be default constructible");

    // ====================================================================
    // Construction - Use static factory methods for clarity
    // ====================================================================

    /**
     * @brief Create a successful Result containing a value
     * @param value The success value (moved into Result)
     */
    [[nodiscard]] static Result ok(T value)
    {
        Result result;
        result.m_data.template emplace<T>(std::move(value));
        return result;
    }

    /**
     * @brief Create a successful value-less Result (VoidResult only)
     */
    [[nodiscard]] static Result ok()
    requires std::is_same_v<T, std::monostate>
    {
        return ok(std::monostate{});
    }

    /**
     * @brief Create a failed Result containing an error
     * @param err The error value
     * @param code Optional detailed error code, typically errno (default 0)
     */
    [[nodiscard]] static Result error(E err, int code = 0)
    {
        Result result;
        result.m_data = ErrorData{std::move(err), code};
        return result;
    }

    // Default constructible (starts in error state with default error)
    Result() : m_data(ErrorData{E{}, 0}) {}

    // Movable but not copyable
    Result(Result &&) noexcept = default;
    Result &operator=(Result &&) noexcept = default;
    Result(const Result &) = delete;
    Result &operator=(const Result &) = delete;

    // ====================================================================
    // State Queries
    // ====================================================================

    [[nodiscard]] bool is_ok() const noexcept { return std::holds_alternative<T>(m_data); }

    [[nodiscard]] bool is_error() const noexcept { return !is_ok(); }

    // ====================================================================
    // Value Access
    // ====================================================================

    /**
     * @brief Get the success content
     * @throws std::logic_error if Result is in error state
     */
    [[nodiscard]] T &content() &
    {
        if (!is_ok())
        {
            throw std::logic_error("Result::content() called on error state");
        }
        return std::get<T>(m_data);
    }

    [[nodiscard]] const T &content() const &
    {
        if (!is_ok())
        {
            throw std::logic_error("Result::content() called on error state");
        }
        return std::get<T>(m_data);
    }

    /**
     * @brief Move the success content out of Result
     * @throws std::logic_error if Result is in error state
     */
    [[nodiscard]] T &&content() &&
    {
        if (!is_ok())
        {
            throw std::logic_error("Result::content() called on error state");
        }
        return std::get<T>(std::move(m_data));
    }

    [[nodiscard]] T value_or(T default_value) const &
    requires std::is_copy_constructible_v<T>
    {
        return is_ok() ? std::get<T>(m_data) : std::move(default_value);
    }

    // ====================================================================
    // Error Access
    // ====================================================================

    /**
     * @brief Get the error value
     * @throws std::logic_error if Result is in success state
     */
    [[nodiscard]] const E &error() const
    {
        if (is_ok())
        {
            throw std::logic_error("Result::error() called on success state");
        }
        return std::get<ErrorData>(m_data).error_value;
    }

    /**
     * @brief Get the detailed error code (0 if not set)
     * @throws std::logic_error if Result is in success state
     */
    [[nodiscard]] int error_code() const
    {
        if (is_ok())
        {
            throw std::logic_error("Result::error_code() called on success state");
        }
        return std::get<ErrorData>(m_data).error_code;
    }

  private:
    struct ErrorData
    {
        E error_value;
        int error_code;
    };

    std::variant<T, ErrorData> m_data;
};

/// Result of an operation that produces nothing on success.
template <typename E> using VoidResult = Result<std::monostate, E>;

} // namespace solohub::utils
