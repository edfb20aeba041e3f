#pragma once
/**
 * @file ipc_names.hpp
 * @brief Validated names for nodes and services of the shared-memory transport.
 *
 * Names end up inside shared-memory object names, so they are restricted to
 * 1..64 characters of [A-Za-z0-9_.-]. Construction goes through create(), which
 * reports a NameError instead of throwing.
 */
#include "solohub_utils_export.h"
#include "utils/ipc_errors.hpp"
#include "utils/result.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

namespace solohub::hub
{

inline constexpr size_t kMaxNameLength = 64;

/// Checks the character set and length rules shared by all transport names.
SOLOHUB_UTILS_EXPORT utils::VoidResult<NameError> validate_name(std::string_view name) noexcept;

class SOLOHUB_UTILS_EXPORT NodeName
{
  public:
    [[nodiscard]] static utils::Result<NodeName, NameError> create(std::string_view name);

    [[nodiscard]] const std::string &as_string() const noexcept { return m_value; }

    friend bool operator==(const NodeName &, const NodeName &) = default;

  private:
    explicit NodeName(std::string value) : m_value(std::move(value)) {}
    std::string m_value;
};

class SOLOHUB_UTILS_EXPORT ServiceName
{
  public:
    [[nodiscard]] static utils::Result<ServiceName, NameError> create(std::string_view name);

    [[nodiscard]] const std::string &as_string() const noexcept { return m_value; }

    friend bool operator==(const ServiceName &, const ServiceName &) = default;

  private:
    explicit ServiceName(std::string value) : m_value(std::move(value)) {}
    std::string m_value;
};

} // namespace solohub::hub
