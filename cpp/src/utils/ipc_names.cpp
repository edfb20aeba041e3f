#include "utils/ipc_names.hpp"

namespace solohub::hub
{

namespace
{
constexpr bool is_name_char(char c) noexcept
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
           c == '_' || c == '.' || c == '-';
}
} // namespace

utils::VoidResult<NameError> validate_name(std::string_view name) noexcept
{
    using R = utils::VoidResult<NameError>;
    if (name.empty())
        return R::error(NameError::Empty);
    if (name.size() > kMaxNameLength)
        return R::error(NameError::TooLong);
    for (char c : name)
    {
        if (!is_name_char(c))
            return R::error(NameError::InvalidCharacter);
    }
    return R::ok();
}

utils::Result<NodeName, NameError> NodeName::create(std::string_view name)
{
    using R = utils::Result<NodeName, NameError>;
    auto valid = validate_name(name);
    if (valid.is_error())
        return R::error(valid.error());
    return R::ok(NodeName(std::string(name)));
}

utils::Result<ServiceName, NameError> ServiceName::create(std::string_view name)
{
    using R = utils::Result<ServiceName, NameError>;
    auto valid = validate_name(name);
    if (valid.is_error())
        return R::error(valid.error());
    return R::ok(ServiceName(std::string(name)));
}

} // namespace solohub::hub
