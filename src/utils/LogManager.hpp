#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <plog/Severity.h>

namespace plog
{
class IAppender;
}

namespace utils
{

/**
 * @brief Process-wide plog setup
 *
 * Defaults come from the [logging] table of a TOML file:
 *
 *   [logging]
 *   level = 4            # plog severity, 0 (none) .. 6 (verbose)
 *   append = true
 *   file = "logs/pollkit.log"
 *   console = false
 */
class LogManager
{
public:
    struct LoggerConfig
    {
        std::string name;
        std::optional<std::string> filepath_override;
        std::optional<bool> append_override;
        std::optional<plog::Severity> level_override;
        std::optional<bool> console_override;
        size_t max_file_size = 10 * 1024 * 1024;
        size_t backup_count = 3;
    };

    static bool Initialize(const std::string& config_path);

    template <int InstanceId = 0>
    static bool RegisterLogger(const LoggerConfig& config);

    // Detaches and destroys every registered appender and silences the
    // instances. A later Initialize starts again from the defaults.
    static void Shutdown();

    static bool IsInitialized();
    static bool IsAppendMode();
    static bool IsConsoleEnabled();
    static plog::Severity GetDefaultLogLevel();
    static const std::string& GetDefaultLogFile();

private:
    class RoutingAppender;

    LogManager() = default;

    template <int InstanceId>
    static RoutingAppender& InstanceRouter();

    static void ResetDefaults();
    static bool ReadConfig(const std::string& config_path);
    static void PrepareLogDirectory(const std::string& filepath);

    static bool s_initialized;
    static bool s_append_logs;
    static bool s_console;
    static plog::Severity s_default_level;
    static std::string s_default_file;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
    static std::vector<std::function<void()>> s_silencers;
    static std::vector<RoutingAppender*> s_routers;
};

} // namespace utils
