#pragma once
/**
 * @file ipc_config.hpp
 * @brief JSON configuration for the coordination layer.
 *
 * Loading order (low to high priority):
 *  1. Built-in defaults (the field initializers below).
 *  2. The JSON file passed to load_ipc_config(), if it exists.
 *  3. SOLOHUB_DOMAIN / SOLOHUB_NODE_NAME / SOLOHUB_SERVICE_NAME environment variables.
 *
 * File layout (every key optional):
 * @code{.json}
 * {
 *   "ipc":       { "node_name": "viewer", "service_name": "single_process",
 *                  "thread_name": "single_process_subscriber", "replace_timeout_ms": 200 },
 *   "transport": { "domain": "solohub", "subscriber_buffer_size": 8, "max_publishers": 16,
 *                  "max_listeners": 16, "max_notifiers": 16,
 *                  "cleanup_dead_nodes_on_creation": true },
 *   "logging":   { "level": "info", "file": "/tmp/viewer.log", "use_flock": true }
 * }
 * @endcode
 */
#include "solohub_utils_export.h"
#include "utils/single_process.hpp"

#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251 4275)
#endif

namespace solohub::ipc
{

/// Malformed JSON, wrong value types or out-of-range values.
class SOLOHUB_UTILS_EXPORT ConfigError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

struct LoggingConfig
{
    /// Empty keeps the logger's current level.
    std::string level;
    /// Empty keeps the console sink.
    std::string file;
    bool use_flock = true;
};

struct SOLOHUB_UTILS_EXPORT IpcConfig
{
    std::string node_name;
    std::string service_name{kDefaultServiceName};
    std::string thread_name{kDefaultThreadName};
    std::chrono::milliseconds replace_timeout{kDefaultReplaceTimeout};
    hub::TransportConfig transport{};
    LoggingConfig logging{};

    [[nodiscard]] SingleProcessConfig single_process_config() const;
    [[nodiscard]] SubscribeOnlyConfig subscribe_only_config() const;
};

/// Fills an IpcConfig from `j`; absent keys keep their defaults. Throws ConfigError.
[[nodiscard]] SOLOHUB_UTILS_EXPORT IpcConfig parse_ipc_config(const nlohmann::json &j);

/**
 * @brief Reads `path` (a missing file means defaults) and applies the environment overrides.
 * @throws ConfigError if the file exists but cannot be read or parsed.
 */
[[nodiscard]] SOLOHUB_UTILS_EXPORT IpcConfig load_ipc_config(const std::filesystem::path &path);

/// Applies SOLOHUB_DOMAIN, SOLOHUB_NODE_NAME and SOLOHUB_SERVICE_NAME if set and non-empty.
SOLOHUB_UTILS_EXPORT void apply_env_overrides(IpcConfig &config);

/**
 * @brief Applies the logging section to the Logger.
 * @return false if the level is unknown or the log file could not be opened.
 */
SOLOHUB_UTILS_EXPORT bool apply_logging_config(const LoggingConfig &logging);

} // namespace solohub::ipc

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
