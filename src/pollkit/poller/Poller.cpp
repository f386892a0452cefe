#include "Poller.hpp"

#include <string>

namespace pollkit
{

Poller::Poller(std::vector<ExceptionMatcher> ignored_exceptions, Logger logger)
    : ignored_exceptions_(std::move(ignored_exceptions))
    , logger_(logger.Empty() ? MakePlogLogger() : std::move(logger))
{
    for (const auto& matcher : ignored_exceptions_)
    {
        if (!matcher.matches)
        {
            throw PollerConfigError("Ignored exception entry '" + matcher.kind + "' has no matcher");
        }
    }
}

bool Poller::IsIgnored(const std::exception& error) const
{
    for (const auto& matcher : ignored_exceptions_)
    {
        if (matcher.Matches(error))
        {
            if (logger_.warn)
                logger_.warn("Poller is ignoring the exception: " + DescribeException(error));
            return true;
        }
    }
    return false;
}

void Poller::ThrowEmptyCallable(const char* what)
{
    throw PollerConfigError(std::string("The ") + what + " cannot be empty");
}

} // namespace pollkit
