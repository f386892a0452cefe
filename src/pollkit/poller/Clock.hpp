#pragma once

#include <chrono>
#include <memory>
#include <mutex>

namespace pollkit
{

class IClock
{
public:
    using TimePoint = std::chrono::steady_clock::time_point;

    virtual ~IClock() = default;

    virtual TimePoint Now() const = 0;
};

class SteadyClock : public IClock
{
public:
    TimePoint Now() const override { return std::chrono::steady_clock::now(); }
};

/**
 * @brief Clock that only moves when told to
 *
 * Lets interval-based polling run deterministically in tests. Safe to share
 * between threads.
 */
class ManualClock : public IClock
{
public:
    ManualClock() = default;
    explicit ManualClock(TimePoint start);

    TimePoint Now() const override;

    void Advance(std::chrono::nanoseconds delta);
    void Set(TimePoint now);

private:
    mutable std::mutex mutex_;
    TimePoint now_{};
};

// Shared steady clock used when no clock is configured.
std::shared_ptr<IClock> SystemClock();

} // namespace pollkit
