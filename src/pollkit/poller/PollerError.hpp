#pragma once

#include <stdexcept>
#include <string>

namespace pollkit
{

// Raised when a poller is given an invalid configuration. Always thrown
// before the first attempt runs.
class PollerConfigError : public std::invalid_argument
{
public:
    explicit PollerConfigError(const std::string& message)
        : std::invalid_argument(message)
    {
    }
};

} // namespace pollkit
