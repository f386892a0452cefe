#pragma once

#include "../poller/Clock.hpp"
#include "../poller/ExceptionMatcher.hpp"
#include "../poller/Poller.hpp"
#include "../poller/PollerCreateInfo.hpp"
#include "../poller/Sleeper.hpp"
#include "../api/Logger.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <toml++/toml.h>

namespace pollkit
{

enum class PollerStrategy
{
    Count,
    Interval
};

// Collaborators a TOML profile cannot express. Unset members fall back to
// the profile or the poller defaults.
struct PollerBindings
{
    Logger logger = {};
    std::shared_ptr<IClock> clock;
    std::shared_ptr<ISleeper> sleeper;
    std::function<void()> on_timeout;
    std::vector<ExceptionMatcher> extra_ignored_exceptions = {};
};

/**
 * @brief Reads named poller profiles from TOML
 *
 * Each table under [pollers] is one profile:
 *
 *   [pollers.file_ready]
 *   strategy = "interval"        # or "count"
 *   duration_ms = 3000
 *   interval_ms = 300
 *   sleeper = "thread"           # "thread", "noop" or "log"
 *   ignore = ["filesystem_error"]
 *
 *   [pollers.quick]
 *   strategy = "count"
 *   max_attempts = 10
 *
 * Load* report parse failures through the return value and LastError();
 * Create* throw PollerConfigError for anything wrong with a profile.
 */
class PollerConfigLoader
{
public:
    PollerConfigLoader();

    // Makes `name` usable in `ignore` lists. Replaces an existing kind.
    void RegisterExceptionKind(const std::string& name, ExceptionMatcher matcher);
    bool HasExceptionKind(const std::string& name) const;

    bool LoadFile(const std::string& path);
    bool LoadString(std::string_view document, std::string_view source = "<memory>");

    const std::string& LastError() const { return last_error_; }

    std::vector<std::string> PollerNames() const;
    bool HasPoller(const std::string& name) const;
    PollerStrategy StrategyOf(const std::string& name) const;

    CountBasedPollerCreateInfo CountBasedInfo(const std::string& name, PollerBindings bindings = {}) const;
    IntervalBasedPollerCreateInfo IntervalBasedInfo(const std::string& name, PollerBindings bindings = {}) const;

    std::unique_ptr<Poller> Create(const std::string& name, PollerBindings bindings = {}) const;

private:
    const toml::table& Profile(const std::string& name) const;
    std::vector<ExceptionMatcher> IgnoredExceptions(const std::string& name, const toml::table& profile,
                                                    std::vector<ExceptionMatcher> extra) const;
    std::shared_ptr<ISleeper> MakeSleeper(const std::string& name, const toml::table& profile,
                                          const Logger& logger) const;

    std::unique_ptr<toml::table> root_;
    std::map<std::string, ExceptionMatcher> kinds_;
    std::string last_error_;
};

} // namespace pollkit
