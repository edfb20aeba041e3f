#pragma once

#include <string>

/**
 * @file node_workers.h
 * @brief Workers that leave transport state behind for the node and recovery tests.
 *
 * Each one ends with std::_Exit so no destructor releases what it claimed, which
 * is what a crashed process looks like to the rest of the domain.
 */
namespace solohub::tests::worker
{
namespace node
{
/// Registers node `node_name` in `domain` and exits without removing it.
int exit_without_cleanup(const std::string &domain, const std::string &node_name);

/// Claims the subscriber slot of TestMessage service `service` and exits holding it.
int hold_subscriber_and_die(const std::string &domain, const std::string &service);

/// Registers TestMessage service `service`, swaps its segment for an uninitialized
/// one and exits, as if the creator had died before finishing it.
int leave_half_initialized_service(const std::string &domain, const std::string &service);
} // namespace node
} // namespace solohub::tests::worker
