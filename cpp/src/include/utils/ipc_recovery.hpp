#pragma once
/**
 * @file ipc_recovery.hpp
 * @brief Diagnostics and manual recovery for pub/sub services.
 *
 * Works by name on a service some other process opened; the caller needs no
 * handle on it. The subscriber slot is the one resource whose loss blocks the
 * whole coordination protocol, so it is the one that can be forcibly released.
 * A subscriber whose slot is released sees ReceiveError::ConnectionLost on its
 * next receive().
 *
 * Dead-node cleanup (NodeState::remove_stale_resources) is the normal path;
 * these functions are for operators and tests.
 */
#include "solohub_utils_export.h"
#include "utils/ipc_names.hpp"
#include "utils/ipc_node.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>

namespace solohub::hub
{

enum class RecoveryResult : uint8_t
{
    Success,     ///< Operation completed.
    Failed,      ///< Internal error (registry or segment unusable).
    Unsafe,      ///< A live process holds the resource and `force` was not set.
    NotFound,    ///< No such service in the domain.
    NothingToDo, ///< The resource was not held.
};

SOLOHUB_UTILS_EXPORT const char *to_string(RecoveryResult r) noexcept;

/// Snapshot of a pub/sub service segment.
struct PubSubDiagnostic
{
    uint64_t subscriber_port_id = 0; ///< 0 if the slot is free
    uint64_t subscriber_node_id = 0;
    uint64_t subscriber_pid = 0;
    bool subscriber_alive = false;
    size_t publisher_count = 0;
    size_t queued_samples = 0;
    uint64_t overwritten_samples = 0;
    size_t open_handles = 0;
};

/**
 * @brief Reads the state of pub/sub service `service` in the domain of `config`.
 * @return nullopt if the domain or the service does not exist.
 */
[[nodiscard]] SOLOHUB_UTILS_EXPORT std::optional<PubSubDiagnostic>
diagnose_pubsub_service(const TransportConfig &config, const ServiceName &service);

/**
 * @brief Frees the subscriber slot of `service`.
 * @param force Release even if the holding process is alive.
 * @return Unsafe when the holder is alive and `force` is false.
 */
[[nodiscard]] SOLOHUB_UTILS_EXPORT RecoveryResult force_release_subscriber(const TransportConfig &config,
                                                                          const ServiceName &service,
                                                                          bool force);

} // namespace solohub::hub
