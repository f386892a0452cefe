#include <catch2/catch_test_macros.hpp>
#include "pollkit/poller/IntervalBasedPoller.hpp"
#include "poller/FakeTime.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>

using namespace std::chrono_literals;
using pollkit::IntervalBasedPoller;
using pollkit::IntervalBasedPollerCreateInfo;
using pollkit::PollerConfigError;

namespace
{

struct FakeTimeFixture
{
    std::shared_ptr<pollkit::ManualClock> clock = std::make_shared<pollkit::ManualClock>();
    std::shared_ptr<AdvancingSleeper> sleeper = std::make_shared<AdvancingSleeper>(clock);
    int timeouts = 0;

    IntervalBasedPollerCreateInfo Info(std::chrono::nanoseconds duration, std::chrono::nanoseconds interval)
    {
        IntervalBasedPollerCreateInfo info{};
        info.duration = duration;
        info.interval = interval;
        info.clock = clock;
        info.sleeper = sleeper;
        info.on_timeout = [this] { ++timeouts; };
        return info;
    }
};

} // namespace

TEST_CASE("IntervalBasedPoller - Configuration", "[poller][interval]")
{
    FakeTimeFixture fx;

    SECTION("Rejects a missing clock")
    {
        auto info = fx.Info(1s, 100ms);
        info.clock = nullptr;
        REQUIRE_THROWS_AS(IntervalBasedPoller(info), PollerConfigError);
    }

    SECTION("Rejects a missing sleeper")
    {
        auto info = fx.Info(1s, 100ms);
        info.sleeper = nullptr;
        REQUIRE_THROWS_AS(IntervalBasedPoller(info), PollerConfigError);
    }

    SECTION("Rejects an empty timeout action")
    {
        auto info = fx.Info(1s, 100ms);
        info.on_timeout = nullptr;
        REQUIRE_THROWS_AS(IntervalBasedPoller(info), PollerConfigError);
    }

    SECTION("Rejects negative timing")
    {
        REQUIRE_THROWS_AS(IntervalBasedPoller(fx.Info(-1ms, 100ms)), PollerConfigError);
        REQUIRE_THROWS_AS(IntervalBasedPoller(fx.Info(1s, -100ms)), PollerConfigError);
    }

    SECTION("Defaults produce a usable poller")
    {
        IntervalBasedPoller poller(IntervalBasedPollerCreateInfo{});
        REQUIRE(poller.Duration() == 0ns);
        REQUIRE(poller.Interval() == 0ns);
    }
}

TEST_CASE("IntervalBasedPoller - Success", "[poller][interval]")
{
    FakeTimeFixture fx;
    IntervalBasedPoller poller(fx.Info(3s, 300ms));
    std::atomic<int> counter{ 0 };

    auto result = poller.Poll([&]() -> std::atomic<int>& { return counter; },
                              [](std::atomic<int>& c) { return ++c; },
                              [](int value) { return value == 6; });

    REQUIRE(result.count == 6);
    REQUIRE(result.Get() == 6);
    REQUIRE(fx.sleeper->sleeps == 5);
    REQUIRE(fx.sleeper->slept == 1500ms);
    REQUIRE(fx.timeouts == 0);
}

TEST_CASE("IntervalBasedPoller - Timeout", "[poller][interval]")
{
    FakeTimeFixture fx;

    SECTION("Attempts are floor(duration / interval) + 1 when never satisfied")
    {
        IntervalBasedPoller poller(fx.Info(3s, 300ms));
        int calls = 0;

        auto result = poller.Poll([] { return 0; }, [&](int) { return ++calls; }, [](int) { return false; });

        REQUIRE(result.count == 11);
        REQUIRE(result.Get() == 11);
        REQUIRE(fx.timeouts == 1);
        REQUIRE(fx.sleeper->slept == 3s);
    }

    SECTION("Never sleeps past the deadline")
    {
        IntervalBasedPoller poller(fx.Info(1000ms, 300ms));

        auto result = poller.Poll([] { return 0; }, [](int v) { return v; }, [](int) { return false; });

        // 0, 300, 600, 900: a fifth attempt would need a sleep ending at 1200ms.
        REQUIRE(result.count == 4);
        REQUIRE(fx.sleeper->slept == 900ms);
        REQUIRE(fx.timeouts == 1);
    }

    SECTION("Zero duration and zero interval try exactly once")
    {
        IntervalBasedPoller poller(fx.Info(0ns, 0ns));
        int calls = 0;

        auto result = poller.Poll([] { return 0; }, [&](int) { return ++calls; }, [](int) { return false; });

        REQUIRE(calls == 1);
        REQUIRE(result.count == 1);
        REQUIRE(result.Get() == 1);
        REQUIRE(fx.timeouts == 1);
        REQUIRE(fx.sleeper->sleeps == 0);
    }

    SECTION("Zero duration and zero interval on the real clock try exactly once")
    {
        int timeouts = 0;
        IntervalBasedPollerCreateInfo info{};
        info.on_timeout = [&] { ++timeouts; };
        IntervalBasedPoller poller(info);
        int calls = 0;

        auto result = poller.Poll([] { return 0; }, [&](int) { return ++calls; }, [](int) { return false; });

        REQUIRE(calls == 1);
        REQUIRE(result.count == 1);
        REQUIRE(timeouts == 1);
    }

    SECTION("A throwing timeout action turns exhaustion into an error")
    {
        auto info = fx.Info(500ms, 100ms);
        info.on_timeout = [] { throw std::runtime_error("timeout"); };
        IntervalBasedPoller poller(info);

        REQUIRE_THROWS_AS(poller.Poll([] { return 0; }, [](int v) { return v; }, [](int) { return false; }),
                          std::runtime_error);
    }

    SECTION("Suppressed exceptions count as attempts until the deadline")
    {
        auto info = fx.Info(1s, 250ms);
        info.ignored_exceptions.push_back(pollkit::IgnoreException<std::runtime_error>());
        CapturedLog log;
        info.logger = log.MakeLogger();
        IntervalBasedPoller poller(info);

        auto result = poller.Poll([] { return 0; },
                                  [](int) -> int { throw std::runtime_error("busy"); },
                                  [](int) { return true; });

        REQUIRE(result.count == 5);
        REQUIRE_FALSE(result.HasResult());
        REQUIRE(log.warnings.size() == 5);
        REQUIRE(fx.timeouts == 1);
    }

    SECTION("Maximum duration means no time limit")
    {
        fx.clock->Set(pollkit::IClock::TimePoint{} + 1h);
        IntervalBasedPoller poller(fx.Info(std::chrono::nanoseconds::max(), 1ms));
        int calls = 0;

        auto result = poller.Poll([] { return 0; }, [&](int) { return ++calls; }, [](int value) { return value == 3; });

        REQUIRE(result.count == 3);
        REQUIRE(result.Get() == 3);
        REQUIRE(fx.timeouts == 0);
        REQUIRE(fx.sleeper->slept == 2ms);
    }

    SECTION("An interval longer than the duration tries once")
    {
        fx.clock->Set(pollkit::IClock::TimePoint{} + 1h);
        IntervalBasedPoller poller(fx.Info(1s, std::chrono::nanoseconds::max()));

        auto result = poller.Poll([] { return 0; }, [](int v) { return v; }, [](int) { return false; });

        REQUIRE(result.count == 1);
        REQUIRE(fx.timeouts == 1);
        REQUIRE(fx.sleeper->sleeps == 0);
    }

    SECTION("Each Poll call measures its own deadline")
    {
        IntervalBasedPoller poller(fx.Info(1s, 500ms));

        auto first = poller.Poll([] { return 0; }, [](int v) { return v; }, [](int) { return false; });
        fx.clock->Advance(10s);
        auto second = poller.Poll([] { return 0; }, [](int v) { return v; }, [](int) { return false; });

        REQUIRE(first.count == 3);
        REQUIRE(second.count == 3);
        REQUIRE(fx.timeouts == 2);
    }
}

TEST_CASE("IntervalBasedPoller - Action polling", "[poller][interval]")
{
    FakeTimeFixture fx;
    IntervalBasedPoller poller(fx.Info(10s, 500ms));
    int value = 1;

    auto attempts = poller.Poll([&] { ++value; }, [&] { return value == 12; });

    REQUIRE(attempts == 11);
    REQUIRE(value == 12);
    REQUIRE(fx.timeouts == 0);
}

TEST_CASE("IntervalBasedPoller - Real sleeper", "[poller][interval][slow]")
{
    IntervalBasedPollerCreateInfo info{};
    info.duration = 3s;
    info.interval = 300ms;
    IntervalBasedPoller poller(info);
    std::atomic<int> counter{ 0 };

    const auto start = std::chrono::steady_clock::now();
    auto result = poller.Poll([&]() -> std::atomic<int>& { return counter; },
                              [](std::atomic<int>& c) { return ++c; },
                              [](int value) { return value == 6; });
    const auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(result.count == 6);
    REQUIRE(result.Get() == 6);
    REQUIRE(elapsed >= 1500ms);
    REQUIRE(elapsed < 3s);
}
