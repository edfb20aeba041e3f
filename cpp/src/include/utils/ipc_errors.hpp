#pragma once
/**
 * @file ipc_errors.hpp
 * @brief Error enums of the shared-memory transport, one per operation.
 *
 * Every fallible transport call returns a utils::Result with one of these enums
 * as error type. The enum's first enumerator is what a default-constructed
 * Result carries; it is never produced by the transport itself on success.
 * to_string() gives the enumerator name for log messages.
 */
#include "solohub_utils_export.h"

#include <cstdint>

namespace solohub::hub
{

/// Validation failure of a NodeName, ServiceName or transport domain.
enum class NameError : uint8_t
{
    Empty,
    TooLong,
    InvalidCharacter,
};

enum class NodeCreationFailure : uint8_t
{
    InternalError,
    InsufficientPermissions,
    ExceedsMaxNumberOfNodes,
    RegistryCorrupted,
    InvalidConfiguration,
};

enum class NodeListFailure : uint8_t
{
    InternalError,
    InsufficientPermissions,
    RegistryCorrupted,
};

enum class NodeCleanupFailure : uint8_t
{
    InternalError,
    NodeStillAlive,
    InsufficientPermissions,
    RegistryCorrupted,
};

enum class NodeWaitFailure : uint8_t
{
    Interrupt,
};

enum class ServiceOpenError : uint8_t
{
    InternalError,
    InsufficientPermissions,
    /// A segment exists but its creator died before finishing initialization.
    ServiceInCorruptedState,
    /// The service exists with the other messaging pattern (pub/sub vs event).
    IncompatibleMessagingPattern,
    /// The service exists with a different payload type, size or alignment.
    IncompatibleTypes,
    /// The service exists with smaller limits than requested.
    IncompatibleAttributes,
    ExceedsMaxNumberOfServices,
    /// Every handle slot of the service segment is taken.
    ExceedsMaxNumberOfNodes,
    RegistryCorrupted,
};

enum class SubscriberCreateError : uint8_t
{
    /// The single subscriber slot is taken.
    ExceedsMaxSupportedSubscribers,
};

enum class PublisherCreateError : uint8_t
{
    ExceedsMaxSupportedPublishers,
};

enum class ListenerCreateError : uint8_t
{
    ExceedsMaxSupportedListeners,
};

enum class NotifierCreateError : uint8_t
{
    ExceedsMaxSupportedNotifiers,
};

enum class LoanError : uint8_t
{
    ExceedsMaxLoans,
    ConnectionLost,
};

enum class SendError : uint8_t
{
    ConnectionLost,
};

enum class ReceiveError : uint8_t
{
    ConnectionLost,
};

enum class NotifyError : uint8_t
{
    EventIdOutOfBounds,
    ConnectionLost,
};

enum class ListenerWaitError : uint8_t
{
    ConnectionLost,
};

SOLOHUB_UTILS_EXPORT const char *to_string(NameError e) noexcept;
SOLOHUB_UTILS_EXPORT const char *to_string(NodeCreationFailure e) noexcept;
SOLOHUB_UTILS_EXPORT const char *to_string(NodeListFailure e) noexcept;
SOLOHUB_UTILS_EXPORT const char *to_string(NodeCleanupFailure e) noexcept;
SOLOHUB_UTILS_EXPORT const char *to_string(NodeWaitFailure e) noexcept;
SOLOHUB_UTILS_EXPORT const char *to_string(ServiceOpenError e) noexcept;
SOLOHUB_UTILS_EXPORT const char *to_string(SubscriberCreateError e) noexcept;
SOLOHUB_UTILS_EXPORT const char *to_string(PublisherCreateError e) noexcept;
SOLOHUB_UTILS_EXPORT const char *to_string(ListenerCreateError e) noexcept;
SOLOHUB_UTILS_EXPORT const char *to_string(NotifierCreateError e) noexcept;
SOLOHUB_UTILS_EXPORT const char *to_string(LoanError e) noexcept;
SOLOHUB_UTILS_EXPORT const char *to_string(SendError e) noexcept;
SOLOHUB_UTILS_EXPORT const char *to_string(ReceiveError e) noexcept;
SOLOHUB_UTILS_EXPORT const char *to_string(NotifyError e) noexcept;
SOLOHUB_UTILS_EXPORT const char *to_string(ListenerWaitError e) noexcept;

} // namespace solohub::hub
