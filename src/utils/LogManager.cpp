#include "LogManager.hpp"
#include "ErrorReporter.hpp"

#include <filesystem>
#include <fstream>
#include <mutex>

#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/IAppender.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <toml++/toml.h>

namespace utils
{

namespace
{

constexpr bool kDefaultAppend = true;
constexpr bool kDefaultConsole = false;
constexpr plog::Severity kDefaultLevel = plog::info;
constexpr const char* kDefaultFile = "logs/pollkit.log";

} // namespace

// plog keeps one static logger per instance for the life of the process and
// holds raw appender pointers. Each instance gets a single router attached
// once; the appenders LogManager owns are plugged into and out of it.
class LogManager::RoutingAppender : public plog::IAppender
{
public:
    void write(const plog::Record& record) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto* target : targets_)
        {
            target->write(record);
        }
    }

    void AddTarget(plog::IAppender* target)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        targets_.push_back(target);
    }

    void ClearTargets()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        targets_.clear();
    }

private:
    std::mutex mutex_;
    std::vector<plog::IAppender*> targets_;
};

bool LogManager::s_initialized = false;
bool LogManager::s_append_logs = kDefaultAppend;
bool LogManager::s_console = kDefaultConsole;
plog::Severity LogManager::s_default_level = kDefaultLevel;
std::string LogManager::s_default_file = kDefaultFile;
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;
std::vector<std::function<void()>> LogManager::s_silencers;
std::vector<LogManager::RoutingAppender*> LogManager::s_routers;

bool LogManager::Initialize(const std::string& config_path)
{
    if (s_initialized)
        return true;

    if (!ReadConfig(config_path))
        return false;

    s_initialized = true;
    return true;
}

template <int InstanceId>
LogManager::RoutingAppender& LogManager::InstanceRouter()
{
    static RoutingAppender router;
    static const bool attached = [] {
        plog::init<InstanceId>(plog::none, &router);
        s_routers.push_back(&router);
        return true;
    }();
    (void)attached;
    return router;
}

template <int InstanceId>
bool LogManager::RegisterLogger(const LoggerConfig& config)
{
    if (!s_initialized)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization,
                                   "LogManager not initialized before registering logger", config.name);
        return false;
    }

    try
    {
        const std::string filepath = config.filepath_override.value_or(s_default_file);
        PrepareLogDirectory(filepath);

        bool append = config.append_override.value_or(s_append_logs);
        if (!append)
        {
            std::ofstream(filepath, std::ios::trunc).close();
        }

        auto file_appender = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
            filepath.c_str(), config.max_file_size, config.backup_count);

        plog::Severity level = config.level_override.value_or(s_default_level);

        auto& router = InstanceRouter<InstanceId>();
        router.AddTarget(file_appender.get());
        s_appenders.push_back(std::move(file_appender));

        if (config.console_override.value_or(s_console))
        {
            auto console_appender = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>();
            router.AddTarget(console_appender.get());
            s_appenders.push_back(std::move(console_appender));
        }

        plog::get<InstanceId>()->setMaxSeverity(level);

        s_silencers.push_back([] {
            if (auto* instance = plog::get<InstanceId>())
                instance->setMaxSeverity(plog::none);
        });
        return true;
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Failed to register logger: " + config.name,
                                   ex.what());
        return false;
    }
}

template bool LogManager::RegisterLogger<0>(const LoggerConfig&);

void LogManager::Shutdown()
{
    for (const auto& silence : s_silencers)
    {
        silence();
    }
    s_silencers.clear();

    for (auto* router : s_routers)
    {
        router->ClearTargets();
    }
    s_appenders.clear();

    ResetDefaults();
    s_initialized = false;
}

void LogManager::ResetDefaults()
{
    s_append_logs = kDefaultAppend;
    s_console = kDefaultConsole;
    s_default_level = kDefaultLevel;
    s_default_file = kDefaultFile;
}

bool LogManager::IsInitialized() { return s_initialized; }

bool LogManager::IsAppendMode() { return s_append_logs; }

bool LogManager::IsConsoleEnabled() { return s_console; }

plog::Severity LogManager::GetDefaultLogLevel() { return s_default_level; }

const std::string& LogManager::GetDefaultLogFile() { return s_default_file; }

void LogManager::PrepareLogDirectory(const std::string& filepath)
{
    const auto dir = std::filesystem::path(filepath).parent_path();
    if (dir.empty())
        return;

    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec)
    {
        ErrorReporter::ReportWarning(ErrorCategory::Initialization, "Unable to prepare log directory", ec.message());
    }
}

bool LogManager::ReadConfig(const std::string& config_path)
{
    ResetDefaults();

    std::error_code ec;
    if (!std::filesystem::exists(config_path, ec))
    {
        // No file: keep defaults.
        return true;
    }

    try
    {
        auto cfg = toml::parse_file(config_path);
        if (auto logging = cfg["logging"].as_table())
        {
            if (auto append = (*logging)["append"].value<bool>())
            {
                s_append_logs = *append;
            }
            if (auto console = (*logging)["console"].value<bool>())
            {
                s_console = *console;
            }
            if (auto file = (*logging)["file"].value<std::string>())
            {
                s_default_file = *file;
            }
            if (auto level = (*logging)["level"].value<int64_t>())
            {
                int level_int = static_cast<int>(*level);
                if (level_int >= plog::none && level_int <= plog::verbose)
                {
                    s_default_level = static_cast<plog::Severity>(level_int);
                }
                else
                {
                    ErrorReporter::ReportWarning(ErrorCategory::Configuration, "Ignoring out of range logging level",
                                                 std::to_string(level_int));
                }
            }
        }
        return true;
    }
    catch (const toml::parse_error& pe)
    {
        ErrorReporter::ReportError(ErrorCategory::Configuration, "Failed to parse logging configuration",
                                   std::string(pe.description()) + "\nFile: " + config_path);
        return false;
    }
}

} // namespace utils
