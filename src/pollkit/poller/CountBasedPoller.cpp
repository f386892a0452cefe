#include "CountBasedPoller.hpp"

#include <string>
#include <utility>

namespace pollkit
{

namespace
{

int ValidatedAttempts(int max_attempts)
{
    if (max_attempts <= 0)
    {
        throw PollerConfigError("The maximum number of polling attempts must be greater than 0. Provided value: " +
                                std::to_string(max_attempts));
    }
    return max_attempts;
}

} // namespace

CountBasedPoller::CountBasedPoller(CountBasedPollerCreateInfo create_info)
    : Poller(std::move(create_info.ignored_exceptions), std::move(create_info.logger))
    , max_attempts_(ValidatedAttempts(create_info.max_attempts))
{
}

std::size_t CountBasedPoller::RunAttempts(const Attempt& attempt) const
{
    const auto budget = static_cast<std::size_t>(max_attempts_);
    std::size_t attempts = 0;
    while (attempts < budget)
    {
        ++attempts;
        if (attempt())
            break;
    }
    return attempts;
}

} // namespace pollkit
