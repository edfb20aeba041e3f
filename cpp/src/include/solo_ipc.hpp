#pragma once
/**
 * @file solo_ipc.hpp
 * @brief Layer 3: Shared-memory transport and single-instance coordination.
 *
 * Provides nodes and the dead-node sweep, the one-subscriber pub/sub service,
 * the event service, recovery helpers, StaticPath for path payloads, and the
 * single_process() / subscribe_only() entry points with their JSON config.
 */
#include "solo_service.hpp"

#include "utils/ipc_config.hpp"
#include "utils/ipc_errors.hpp"
#include "utils/ipc_event.hpp"
#include "utils/ipc_names.hpp"
#include "utils/ipc_node.hpp"
#include "utils/ipc_pubsub.hpp"
#include "utils/ipc_recovery.hpp"
#include "utils/single_process.hpp"
#include "utils/static_path.hpp"
#include "utils/subscriber_handle.hpp"
