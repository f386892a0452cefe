#pragma once

#include "Clock.hpp"
#include "ExceptionMatcher.hpp"
#include "Sleeper.hpp"
#include "../api/Logger.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <vector>

namespace pollkit
{

struct CountBasedPollerCreateInfo
{
    // Must be greater than 0.
    int max_attempts = 1;

    std::vector<ExceptionMatcher> ignored_exceptions = {};

    // Left empty, diagnostics go to plog instance 0.
    Logger logger = {};
};

struct IntervalBasedPollerCreateInfo
{
    // Total budget, measured from the start of each Poll call.
    std::chrono::nanoseconds duration{ 0 };
    // Pause between attempts.
    std::chrono::nanoseconds interval{ 0 };

    std::shared_ptr<IClock> clock = SystemClock();
    std::shared_ptr<ISleeper> sleeper = DefaultSleeper();

    // Runs once when the budget runs out; may throw to fail the Poll call.
    std::function<void()> on_timeout = [] {};

    std::vector<ExceptionMatcher> ignored_exceptions = {};
    Logger logger = {};
};

} // namespace pollkit
