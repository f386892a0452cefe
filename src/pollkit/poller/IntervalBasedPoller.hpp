#pragma once

#include "Poller.hpp"
#include "PollerCreateInfo.hpp"

#include <chrono>
#include <functional>
#include <memory>

namespace pollkit
{

/**
 * @brief Polls at a fixed interval within a wall-clock budget
 *
 * After every unsuccessful attempt the poller looks one interval ahead: if
 * sleeping would carry it past start + duration it stops there, runs
 * on_timeout and returns. It never sleeps past the deadline, so it may give
 * up slightly before it.
 */
class IntervalBasedPoller final : public Poller
{
public:
    // Throws PollerConfigError on a missing clock, sleeper or timeout
    // callback, or on a negative duration or interval.
    explicit IntervalBasedPoller(IntervalBasedPollerCreateInfo create_info);

    std::chrono::nanoseconds Duration() const { return duration_; }
    std::chrono::nanoseconds Interval() const { return interval_; }

protected:
    std::size_t RunAttempts(const Attempt& attempt) const override;

private:
    IClock::TimePoint Deadline(IClock::TimePoint start) const;
    bool TimedOut(IClock::TimePoint deadline) const;

    std::chrono::nanoseconds duration_;
    std::chrono::nanoseconds interval_;
    std::shared_ptr<IClock> clock_;
    std::shared_ptr<ISleeper> sleeper_;
    std::function<void()> on_timeout_;
};

} // namespace pollkit
