#include <catch2/catch_test_macros.hpp>
#include "pollkit/poller/ExceptionMatcher.hpp"

#include <filesystem>
#include <stdexcept>
#include <system_error>

namespace
{

struct DeviceBusy : std::runtime_error
{
    DeviceBusy()
        : std::runtime_error("device busy")
    {
    }
};

} // namespace

TEST_CASE("ExceptionMatcher - Type matching", "[poller][matcher]")
{
    auto matcher = pollkit::IgnoreException<std::runtime_error>("runtime_error");

    SECTION("Matches the exact type")
    {
        REQUIRE(matcher.Matches(std::runtime_error("x")));
    }

    SECTION("Matches derived types")
    {
        REQUIRE(matcher.Matches(DeviceBusy{}));
        REQUIRE(matcher.Matches(std::system_error(std::make_error_code(std::errc::timed_out))));
    }

    SECTION("Does not match unrelated types")
    {
        REQUIRE_FALSE(matcher.Matches(std::logic_error("x")));
        REQUIRE_FALSE(matcher.Matches(std::exception{}));
    }

    SECTION("Default kind is the type name")
    {
        auto unnamed = pollkit::IgnoreException<DeviceBusy>();
        REQUIRE(unnamed.kind.find("DeviceBusy") != std::string::npos);
    }
}

TEST_CASE("ExceptionMatcher - Predicate matching", "[poller][matcher]")
{
    auto timed_out = pollkit::IgnoreWhen("timed_out", [](const std::exception& error) {
        const auto* sys = dynamic_cast<const std::system_error*>(&error);
        return sys && sys->code() == std::errc::timed_out;
    });

    REQUIRE(timed_out.kind == "timed_out");
    REQUIRE(timed_out.Matches(std::system_error(std::make_error_code(std::errc::timed_out))));
    REQUIRE_FALSE(timed_out.Matches(std::system_error(std::make_error_code(std::errc::permission_denied))));
    REQUIRE_FALSE(timed_out.Matches(std::runtime_error("timed out")));

    SECTION("An entry without a predicate matches nothing")
    {
        pollkit::ExceptionMatcher empty{ "empty", nullptr };
        REQUIRE_FALSE(empty.Matches(std::runtime_error("x")));
    }
}

TEST_CASE("ExceptionMatcher - Standard kinds", "[poller][matcher]")
{
    const auto& kinds = pollkit::StandardExceptionKinds();

    REQUIRE(kinds.count("exception") == 1);
    REQUIRE(kinds.count("runtime_error") == 1);
    REQUIRE(kinds.count("filesystem_error") == 1);
    REQUIRE(kinds.at("runtime_error").kind == "runtime_error");

    const std::filesystem::filesystem_error fs_error("missing", std::make_error_code(std::errc::no_such_file_or_directory));
    REQUIRE(kinds.at("filesystem_error").Matches(fs_error));
    REQUIRE(kinds.at("system_error").Matches(fs_error));
    REQUIRE(kinds.at("exception").Matches(fs_error));
    REQUIRE_FALSE(kinds.at("logic_error").Matches(fs_error));
}

TEST_CASE("ExceptionMatcher - Describing exceptions", "[poller][matcher]")
{
    const auto text = pollkit::DescribeException(DeviceBusy{});
    REQUIRE(text.find("DeviceBusy") != std::string::npos);
    REQUIRE(text.find("device busy") != std::string::npos);
}
