#include "utils/ipc_config.hpp"

#include <cstdlib>
#include <fstream>
#include <system_error>

namespace solohub::ipc
{

namespace fs = std::filesystem;

namespace
{

/// `j[key]` as T if present; ConfigError naming `section.key` on a type mismatch.
template <typename T>
void read_key(const nlohmann::json &section, const char *section_name, const char *key, T &out)
{
    if (!section.contains(key) || section.at(key).is_null())
        return;
    try
    {
        out = section.at(key).get<T>();
    }
    catch (const nlohmann::json::exception &e)
    {
        throw ConfigError(fmt::format("config: '{}.{}' has the wrong type: {}", section_name, key,
                                      e.what()));
    }
}

const nlohmann::json *section_of(const nlohmann::json &j, const char *name)
{
    if (!j.contains(name))
        return nullptr;
    const nlohmann::json &section = j.at(name);
    if (!section.is_object())
        throw ConfigError(fmt::format("config: '{}' must be an object", name));
    return &section;
}

void read_limit(const nlohmann::json &section, const char *key, size_t &out)
{
    int64_t value = static_cast<int64_t>(out);
    read_key(section, "transport", key, value);
    if (value <= 0)
        throw ConfigError(fmt::format("config: 'transport.{}' must be positive, got {}", key, value));
    out = static_cast<size_t>(value);
}

} // namespace

SingleProcessConfig IpcConfig::single_process_config() const
{
    SingleProcessConfig config;
    config.node_name = node_name;
    config.service_name = service_name;
    config.thread_name = thread_name;
    config.transport = transport;
    return config;
}

SubscribeOnlyConfig IpcConfig::subscribe_only_config() const
{
    SubscribeOnlyConfig config;
    config.node_name = node_name;
    config.service_name = service_name;
    config.thread_name = thread_name;
    config.timeout = replace_timeout;
    config.transport = transport;
    return config;
}

IpcConfig parse_ipc_config(const nlohmann::json &j)
{
    IpcConfig config;
    if (j.is_null())
        return config;
    if (!j.is_object())
        throw ConfigError("config: top level must be an object");

    if (const auto *ipc = section_of(j, "ipc"))
    {
        read_key(*ipc, "ipc", "node_name", config.node_name);
        read_key(*ipc, "ipc", "service_name", config.service_name);
        read_key(*ipc, "ipc", "thread_name", config.thread_name);
        int64_t timeout_ms = config.replace_timeout.count();
        read_key(*ipc, "ipc", "replace_timeout_ms", timeout_ms);
        if (timeout_ms < 0)
            throw ConfigError(
                fmt::format("config: 'ipc.replace_timeout_ms' must not be negative, got {}", timeout_ms));
        config.replace_timeout = std::chrono::milliseconds(timeout_ms);
    }

    if (const auto *transport = section_of(j, "transport"))
    {
        read_key(*transport, "transport", "domain", config.transport.domain);
        read_limit(*transport, "subscriber_buffer_size", config.transport.subscriber_buffer_size);
        read_limit(*transport, "max_publishers", config.transport.max_publishers);
        read_limit(*transport, "max_listeners", config.transport.max_listeners);
        read_limit(*transport, "max_notifiers", config.transport.max_notifiers);
        read_key(*transport, "transport", "cleanup_dead_nodes_on_creation",
                 config.transport.cleanup_dead_nodes_on_creation);
    }

    if (const auto *logging = section_of(j, "logging"))
    {
        read_key(*logging, "logging", "level", config.logging.level);
        read_key(*logging, "logging", "file", config.logging.file);
        read_key(*logging, "logging", "use_flock", config.logging.use_flock);
        if (!config.logging.level.empty() &&
            !utils::Logger::level_from_string(config.logging.level).has_value())
            throw ConfigError(fmt::format("config: unknown log level '{}'", config.logging.level));
    }
    return config;
}

IpcConfig load_ipc_config(const fs::path &path)
{
    IpcConfig config;
    std::error_code ec;
    if (!path.empty() && fs::exists(path, ec))
    {
        std::ifstream in(path);
        if (!in.is_open())
            throw ConfigError(fmt::format("config: cannot open '{}'", path.string()));
        nlohmann::json j;
        try
        {
            in >> j;
        }
        catch (const nlohmann::json::parse_error &e)
        {
            throw ConfigError(fmt::format("config: '{}' is not valid JSON: {}", path.string(), e.what()));
        }
        config = parse_ipc_config(j);
        LOGGER_DEBUG("config: loaded '{}'", path.string());
    }
    else
    {
        LOGGER_DEBUG("config: '{}' not found, using defaults", path.string());
    }
    apply_env_overrides(config);
    return config;
}

void apply_env_overrides(IpcConfig &config)
{
    const auto override_from = [](const char *name, std::string &field) {
        const char *value = std::getenv(name);
        if (value != nullptr && *value != '\0')
        {
            LOGGER_DEBUG("config: {} overrides '{}' with '{}'", name, field, value);
            field = value;
        }
    };
    override_from("SOLOHUB_DOMAIN", config.transport.domain);
    override_from("SOLOHUB_NODE_NAME", config.node_name);
    override_from("SOLOHUB_SERVICE_NAME", config.service_name);
}

bool apply_logging_config(const LoggingConfig &logging)
{
    auto &logger = utils::Logger::instance();
    bool ok = true;
    if (!logging.level.empty())
    {
        if (const auto level = utils::Logger::level_from_string(logging.level))
        {
            logger.set_level(*level);
        }
        else
        {
            LOGGER_WARN("config: unknown log level '{}', level unchanged", logging.level);
            ok = false;
        }
    }
    if (!logging.file.empty() && !logger.set_logfile(logging.file, logging.use_flock))
    {
        LOGGER_WARN("config: cannot log to '{}', keeping the current sink", logging.file);
        ok = false;
    }
    return ok;
}

} // namespace solohub::ipc
