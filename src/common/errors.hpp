#pragma once

#include <stdexcept>
#include <string>

namespace sysmend {

class SysmendError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

class DuplicateActionError : public SysmendError
{
public:
    explicit DuplicateActionError(const std::string &actionId)
        : SysmendError("action already registered: " + actionId)
        , m_actionId(actionId)
    {
    }

    const std::string &actionId() const { return m_actionId; }

private:
    std::string m_actionId;
};

class UnknownActionError : public SysmendError
{
public:
    explicit UnknownActionError(const std::string &actionId)
        : SysmendError("unknown action: " + actionId)
        , m_actionId(actionId)
    {
    }

    const std::string &actionId() const { return m_actionId; }

private:
    std::string m_actionId;
};

// Malformed configuration or action catalog.
class ConfigError : public SysmendError
{
public:
    using SysmendError::SysmendError;
};

} // namespace sysmend
