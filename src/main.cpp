#include "pollkit/config/PollerConfigLoader.hpp"
#include "pollkit/poller/IntervalBasedPoller.hpp"
#include "pollkit/poller/PollerError.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/LogManager.hpp"

#include <chrono>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include <plog/Log.h>

namespace
{

constexpr int kExitFound = 0;
constexpr int kExitGaveUp = 1;
constexpr int kExitUsage = 2;

struct Options
{
    std::string config_path = "pollkit.toml";
    std::string poller_name = "default";
    std::string target;
};

void PrintUsage(const char* argv0)
{
    std::cerr << "usage: " << argv0 << " [--config <file>] [--poller <name>] <path>\n"
              << "Waits until <path> exists, using the named poller profile.\n";
}

bool ParseArgs(int argc, char** argv, Options& out)
{
    for (int i = 1; i < argc; ++i)
    {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc)
        {
            out.config_path = argv[++i];
        }
        else if (std::strcmp(argv[i], "--poller") == 0 && i + 1 < argc)
        {
            out.poller_name = argv[++i];
        }
        else if (argv[i][0] == '-' && argv[i][1] == '-')
        {
            return false;
        }
        else if (out.target.empty())
        {
            out.target = argv[i];
        }
        else
        {
            return false;
        }
    }
    return !out.target.empty();
}

std::unique_ptr<pollkit::Poller> MakePoller(const Options& options, pollkit::PollerBindings bindings)
{
    pollkit::PollerConfigLoader loader;
    std::error_code ec;
    if (std::filesystem::exists(options.config_path, ec) && !loader.LoadFile(options.config_path))
    {
        throw pollkit::PollerConfigError(loader.LastError());
    }

    if (!loader.HasPoller(options.poller_name) && options.poller_name == "default")
    {
        pollkit::IntervalBasedPollerCreateInfo info{};
        info.duration = std::chrono::seconds(30);
        info.interval = std::chrono::milliseconds(500);
        info.on_timeout = std::move(bindings.on_timeout);
        info.ignored_exceptions = std::move(bindings.extra_ignored_exceptions);
        return std::make_unique<pollkit::IntervalBasedPoller>(std::move(info));
    }
    return loader.Create(options.poller_name, std::move(bindings));
}

void FlushReportsToConsole()
{
    for (const auto& report : utils::ErrorReporter::GetPendingErrors())
    {
        std::cerr << "[" << utils::ErrorReporter::SeverityToString(report.severity) << "] " << report.message;
        if (!report.details.empty())
            std::cerr << ": " << report.details;
        std::cerr << "\n";
    }
}

} // namespace

int main(int argc, char** argv)
{
    Options options;
    if (!ParseArgs(argc, argv, options))
    {
        PrintUsage(argv[0]);
        return kExitUsage;
    }

    if (!utils::LogManager::Initialize(options.config_path) ||
        !utils::LogManager::RegisterLogger({ "pollkit-wait" }))
    {
        FlushReportsToConsole();
        return kExitUsage;
    }

    const std::filesystem::path target(options.target);

    pollkit::PollerBindings bindings{};
    bindings.on_timeout = [&target] { PLOG_ERROR << "Gave up waiting for " << target.string(); };
    bindings.extra_ignored_exceptions.push_back(
        pollkit::IgnoreException<std::filesystem::filesystem_error>("filesystem_error"));

    int exit_code = kExitGaveUp;
    try
    {
        auto poller = MakePoller(options, std::move(bindings));
        PLOG_INFO << "Waiting for " << target.string() << " with profile '" << options.poller_name << "'";

        auto result = poller->Poll([&target]() -> const std::filesystem::path& { return target; },
                                   [](const std::filesystem::path& p) { return std::filesystem::exists(p); },
                                   [](bool exists) { return exists; });

        if (result.ValueOr(false))
        {
            PLOG_INFO << target.string() << " appeared after " << result.count << " attempt(s)";
            exit_code = kExitFound;
        }
        else
        {
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Polling, "Path did not appear",
                                              target.string() + " after " + std::to_string(result.count) +
                                                  " attempt(s)");
        }
    }
    catch (const pollkit::PollerConfigError& ex)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Invalid poller configuration",
                                          ex.what());
        exit_code = kExitUsage;
    }
    catch (const std::exception& ex)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Polling, "Polling failed", ex.what());
        exit_code = kExitGaveUp;
    }

    FlushReportsToConsole();
    utils::LogManager::Shutdown();
    return exit_code;
}
