#include "utils/ipc_errors.hpp"

namespace solohub::hub
{

const char *to_string(NameError e) noexcept
{
    switch (e)
    {
    case NameError::Empty:
        return "Empty";
    case NameError::TooLong:
        return "TooLong";
    case NameError::InvalidCharacter:
        return "InvalidCharacter";
    }
    return "Unknown";
}

const char *to_string(NodeCreationFailure e) noexcept
{
    switch (e)
    {
    case NodeCreationFailure::InternalError:
        return "InternalError";
    case NodeCreationFailure::InsufficientPermissions:
        return "InsufficientPermissions";
    case NodeCreationFailure::ExceedsMaxNumberOfNodes:
        return "ExceedsMaxNumberOfNodes";
    case NodeCreationFailure::RegistryCorrupted:
        return "RegistryCorrupted";
    case NodeCreationFailure::InvalidConfiguration:
        return "InvalidConfiguration";
    }
    return "Unknown";
}

const char *to_string(NodeListFailure e) noexcept
{
    switch (e)
    {
    case NodeListFailure::InternalError:
        return "InternalError";
    case NodeListFailure::InsufficientPermissions:
        return "InsufficientPermissions";
    case NodeListFailure::RegistryCorrupted:
        return "RegistryCorrupted";
    }
    return "Unknown";
}

const char *to_string(NodeCleanupFailure e) noexcept
{
    switch (e)
    {
    case NodeCleanupFailure::InternalError:
        return "InternalError";
    case NodeCleanupFailure::NodeStillAlive:
        return "NodeStillAlive";
    case NodeCleanupFailure::InsufficientPermissions:
        return "InsufficientPermissions";
    case NodeCleanupFailure::RegistryCorrupted:
        return "RegistryCorrupted";
    }
    return "Unknown";
}

const char *to_string(NodeWaitFailure e) noexcept
{
    switch (e)
    {
    case NodeWaitFailure::Interrupt:
        return "Interrupt";
    }
    return "Unknown";
}

const char *to_string(ServiceOpenError e) noexcept
{
    switch (e)
    {
    case ServiceOpenError::InternalError:
        return "InternalError";
    case ServiceOpenError::InsufficientPermissions:
        return "InsufficientPermissions";
    case ServiceOpenError::ServiceInCorruptedState:
        return "ServiceInCorruptedState";
    case ServiceOpenError::IncompatibleMessagingPattern:
        return "IncompatibleMessagingPattern";
    case ServiceOpenError::IncompatibleTypes:
        return "IncompatibleTypes";
    case ServiceOpenError::IncompatibleAttributes:
        return "IncompatibleAttributes";
    case ServiceOpenError::ExceedsMaxNumberOfServices:
        return "ExceedsMaxNumberOfServices";
    case ServiceOpenError::ExceedsMaxNumberOfNodes:
        return "ExceedsMaxNumberOfNodes";
    case ServiceOpenError::RegistryCorrupted:
        return "RegistryCorrupted";
    }
    return "Unknown";
}

const char *to_string(SubscriberCreateError e) noexcept
{
    switch (e)
    {
    case SubscriberCreateError::ExceedsMaxSupportedSubscribers:
        return "ExceedsMaxSupportedSubscribers";
    }
    return "Unknown";
}

const char *to_string(PublisherCreateError e) noexcept
{
    switch (e)
    {
    case PublisherCreateError::ExceedsMaxSupportedPublishers:
        return "ExceedsMaxSupportedPublishers";
    }
    return "Unknown";
}

const char *to_string(ListenerCreateError e) noexcept
{
    switch (e)
    {
    case ListenerCreateError::ExceedsMaxSupportedListeners:
        return "ExceedsMaxSupportedListeners";
    }
    return "Unknown";
}

const char *to_string(NotifierCreateError e) noexcept
{
    switch (e)
    {
    case NotifierCreateError::ExceedsMaxSupportedNotifiers:
        return "ExceedsMaxSupportedNotifiers";
    }
    return "Unknown";
}

const char *to_string(LoanError e) noexcept
{
    switch (e)
    {
    case LoanError::ExceedsMaxLoans:
        return "ExceedsMaxLoans";
    case LoanError::ConnectionLost:
        return "ConnectionLost";
    }
    return "Unknown";
}

const char *to_string(SendError e) noexcept
{
    switch (e)
    {
    case SendError::ConnectionLost:
        return "ConnectionLost";
    }
    return "Unknown";
}

const char *to_string(ReceiveError e) noexcept
{
    switch (e)
    {
    case ReceiveError::ConnectionLost:
        return "ConnectionLost";
    }
    return "Unknown";
}

const char *to_string(NotifyError e) noexcept
{
    switch (e)
    {
    case NotifyError::EventIdOutOfBounds:
        return "EventIdOutOfBounds";
    case NotifyError::ConnectionLost:
        return "ConnectionLost";
    }
    return "Unknown";
}

const char *to_string(ListenerWaitError e) noexcept
{
    switch (e)
    {
    case ListenerWaitError::ConnectionLost:
        return "ConnectionLost";
    }
    return "Unknown";
}

} // namespace solohub::hub
