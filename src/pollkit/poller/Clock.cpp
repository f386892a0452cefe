#include "Clock.hpp"

namespace pollkit
{

ManualClock::ManualClock(TimePoint start)
    : now_(start)
{
}

IClock::TimePoint ManualClock::Now() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return now_;
}

void ManualClock::Advance(std::chrono::nanoseconds delta)
{
    std::lock_guard<std::mutex> lock(mutex_);
    now_ += delta;
}

void ManualClock::Set(TimePoint now)
{
    std::lock_guard<std::mutex> lock(mutex_);
    now_ = now;
}

std::shared_ptr<IClock> SystemClock()
{
    static const std::shared_ptr<IClock> clock = std::make_shared<SteadyClock>();
    return clock;
}

} // namespace pollkit
