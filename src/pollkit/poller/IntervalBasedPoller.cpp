#include "IntervalBasedPoller.hpp"

#include <string>
#include <utility>

namespace pollkit
{

IntervalBasedPoller::IntervalBasedPoller(IntervalBasedPollerCreateInfo create_info)
    : Poller(std::move(create_info.ignored_exceptions), std::move(create_info.logger))
    , duration_(create_info.duration)
    , interval_(create_info.interval)
    , clock_(std::move(create_info.clock))
    , sleeper_(std::move(create_info.sleeper))
    , on_timeout_(std::move(create_info.on_timeout))
{
    if (!clock_)
        throw PollerConfigError("The clock must not be null");
    if (!sleeper_)
        throw PollerConfigError("The sleeper must not be null");
    if (!on_timeout_)
        throw PollerConfigError("The timeout action must not be empty");
    if (duration_.count() < 0)
        throw PollerConfigError("The duration must not be negative. Provided value: " +
                                std::to_string(duration_.count()) + "ns");
    if (interval_.count() < 0)
        throw PollerConfigError("The interval must not be negative. Provided value: " +
                                std::to_string(interval_.count()) + "ns");
}

std::size_t IntervalBasedPoller::RunAttempts(const Attempt& attempt) const
{
    const auto deadline = Deadline(clock_->Now());
    std::size_t attempts = 0;
    while (true)
    {
        ++attempts;
        if (attempt())
            return attempts;

        if (TimedOut(deadline))
        {
            on_timeout_();
            return attempts;
        }

        sleeper_->Sleep(interval_);
    }
}

IClock::TimePoint IntervalBasedPoller::Deadline(IClock::TimePoint start) const
{
    // Saturate so that nanoseconds::max() means "no time limit".
    if (start >= IClock::TimePoint{} && duration_ > IClock::TimePoint::max() - start)
        return IClock::TimePoint::max();
    return start + duration_;
}

bool IntervalBasedPoller::TimedOut(IClock::TimePoint deadline) const
{
    const auto now = clock_->Now();
    // now >= deadline only matters for a zero interval, which would
    // otherwise spin forever on a clock that does not move.
    return now >= deadline || deadline - now < interval_;
}

} // namespace pollkit
