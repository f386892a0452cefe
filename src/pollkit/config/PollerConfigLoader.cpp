#include "PollerConfigLoader.hpp"

#include "../poller/CountBasedPoller.hpp"
#include "../poller/IntervalBasedPoller.hpp"
#include "../poller/PollerError.hpp"

#include <chrono>
#include <cstdint>
#include <limits>
#include <optional>
#include <utility>

#include <plog/Log.h>

namespace pollkit
{

namespace
{

[[noreturn]] void Fail(const std::string& name, const std::string& message)
{
    throw PollerConfigError("Poller profile '" + name + "': " + message);
}

std::optional<int64_t> ReadInteger(const std::string& name, const toml::table& profile, std::string_view key)
{
    const toml::node* node = profile.get(key);
    if (!node)
        return std::nullopt;
    if (const auto* integer = node->as_integer())
        return integer->get();
    Fail(name, "'" + std::string(key) + "' must be an integer");
}

std::optional<std::string> ReadString(const std::string& name, const toml::table& profile, std::string_view key)
{
    const toml::node* node = profile.get(key);
    if (!node)
        return std::nullopt;
    if (const auto* str = node->as_string())
        return str->get();
    Fail(name, "'" + std::string(key) + "' must be a string");
}

std::chrono::milliseconds ReadMillis(const std::string& name, const toml::table& profile, std::string_view key)
{
    auto value = ReadInteger(name, profile, key);
    if (!value)
        Fail(name, "missing '" + std::string(key) + "'");

    // Pollers work in nanoseconds; larger values would overflow the conversion.
    constexpr auto kMaxMillis =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::nanoseconds::max());
    if (*value < 0)
        Fail(name, "'" + std::string(key) + "' must not be negative");
    if (*value > kMaxMillis.count())
        Fail(name, "'" + std::string(key) + "' is out of range");
    return std::chrono::milliseconds(*value);
}

} // namespace

PollerConfigLoader::PollerConfigLoader()
    : root_(std::make_unique<toml::table>())
    , kinds_(StandardExceptionKinds())
{
}

void PollerConfigLoader::RegisterExceptionKind(const std::string& name, ExceptionMatcher matcher)
{
    if (!matcher.matches)
        throw PollerConfigError("Exception kind '" + name + "' has no matcher");
    matcher.kind = name;
    kinds_[name] = std::move(matcher);
}

bool PollerConfigLoader::HasExceptionKind(const std::string& name) const
{
    return kinds_.find(name) != kinds_.end();
}

bool PollerConfigLoader::LoadFile(const std::string& path)
{
    last_error_.clear();
    try
    {
        root_ = std::make_unique<toml::table>(toml::parse_file(path));
        return true;
    }
    catch (const toml::parse_error& pe)
    {
        last_error_ = std::string("config parse error: ") + std::string(pe.description());
        if (pe.source().begin.line > 0)
        {
            last_error_ += " (line " + std::to_string(pe.source().begin.line) + ")";
        }
        PLOG_WARNING << last_error_ << " in " << path;
        return false;
    }
}

bool PollerConfigLoader::LoadString(std::string_view document, std::string_view source)
{
    last_error_.clear();
    try
    {
        root_ = std::make_unique<toml::table>(toml::parse(document, source));
        return true;
    }
    catch (const toml::parse_error& pe)
    {
        last_error_ = std::string("config parse error: ") + std::string(pe.description());
        if (pe.source().begin.line > 0)
        {
            last_error_ += " (line " + std::to_string(pe.source().begin.line) + ")";
        }
        PLOG_WARNING << last_error_ << " in " << source;
        return false;
    }
}

std::vector<std::string> PollerConfigLoader::PollerNames() const
{
    std::vector<std::string> names;
    if (const auto* pollers = (*root_)["pollers"].as_table())
    {
        for (auto&& [key, node] : *pollers)
        {
            if (node.is_table())
                names.emplace_back(key.str());
        }
    }
    return names;
}

bool PollerConfigLoader::HasPoller(const std::string& name) const
{
    return (*root_)["pollers"][name].as_table() != nullptr;
}

const toml::table& PollerConfigLoader::Profile(const std::string& name) const
{
    const auto* profile = (*root_)["pollers"][name].as_table();
    if (!profile)
        Fail(name, "not defined");
    return *profile;
}

PollerStrategy PollerConfigLoader::StrategyOf(const std::string& name) const
{
    const auto& profile = Profile(name);
    auto strategy = ReadString(name, profile, "strategy");
    if (!strategy)
        Fail(name, "missing 'strategy'");
    if (*strategy == "count")
        return PollerStrategy::Count;
    if (*strategy == "interval")
        return PollerStrategy::Interval;
    Fail(name, "unknown strategy '" + *strategy + "'");
}

std::vector<ExceptionMatcher> PollerConfigLoader::IgnoredExceptions(const std::string& name,
                                                                    const toml::table& profile,
                                                                    std::vector<ExceptionMatcher> extra) const
{
    std::vector<ExceptionMatcher> matchers;
    if (const toml::node* node = profile.get("ignore"))
    {
        const auto* list = node->as_array();
        if (!list)
            Fail(name, "'ignore' must be an array of exception kinds");

        for (const auto& entry : *list)
        {
            auto kind = entry.value<std::string>();
            if (!kind)
                Fail(name, "'ignore' entries must be strings");

            auto it = kinds_.find(*kind);
            if (it == kinds_.end())
                Fail(name, "unknown exception kind '" + *kind + "'");
            matchers.push_back(it->second);
        }
    }

    for (auto& matcher : extra)
    {
        matchers.push_back(std::move(matcher));
    }
    return matchers;
}

std::shared_ptr<ISleeper> PollerConfigLoader::MakeSleeper(const std::string& name, const toml::table& profile,
                                                          const Logger& logger) const
{
    auto sleeper = ReadString(name, profile, "sleeper").value_or("thread");
    if (sleeper == "thread")
        return DefaultSleeper();
    if (sleeper == "noop")
        return std::make_shared<NoopSleeper>();
    if (sleeper == "log")
        return std::make_shared<LoggingSleeper>(logger.Empty() ? MakePlogLogger() : logger);
    Fail(name, "unknown sleeper '" + sleeper + "'");
}

CountBasedPollerCreateInfo PollerConfigLoader::CountBasedInfo(const std::string& name,
                                                              PollerBindings bindings) const
{
    if (StrategyOf(name) != PollerStrategy::Count)
        Fail(name, "not a count-based profile");

    const auto& profile = Profile(name);
    auto max_attempts = ReadInteger(name, profile, "max_attempts");
    if (!max_attempts)
        Fail(name, "missing 'max_attempts'");
    if (*max_attempts > std::numeric_limits<int>::max() || *max_attempts < std::numeric_limits<int>::min())
        Fail(name, "'max_attempts' is out of range");

    CountBasedPollerCreateInfo info{};
    info.max_attempts = static_cast<int>(*max_attempts);
    info.ignored_exceptions = IgnoredExceptions(name, profile, std::move(bindings.extra_ignored_exceptions));
    info.logger = std::move(bindings.logger);
    return info;
}

IntervalBasedPollerCreateInfo PollerConfigLoader::IntervalBasedInfo(const std::string& name,
                                                                    PollerBindings bindings) const
{
    if (StrategyOf(name) != PollerStrategy::Interval)
        Fail(name, "not an interval-based profile");

    const auto& profile = Profile(name);

    IntervalBasedPollerCreateInfo info{};
    info.duration = ReadMillis(name, profile, "duration_ms");
    info.interval = ReadMillis(name, profile, "interval_ms");
    info.sleeper = bindings.sleeper ? std::move(bindings.sleeper) : MakeSleeper(name, profile, bindings.logger);
    if (bindings.clock)
        info.clock = std::move(bindings.clock);
    if (bindings.on_timeout)
        info.on_timeout = std::move(bindings.on_timeout);
    info.ignored_exceptions = IgnoredExceptions(name, profile, std::move(bindings.extra_ignored_exceptions));
    info.logger = std::move(bindings.logger);
    return info;
}

std::unique_ptr<Poller> PollerConfigLoader::Create(const std::string& name, PollerBindings bindings) const
{
    switch (StrategyOf(name))
    {
    case PollerStrategy::Count:
        return std::make_unique<CountBasedPoller>(CountBasedInfo(name, std::move(bindings)));
    case PollerStrategy::Interval:
        return std::make_unique<IntervalBasedPoller>(IntervalBasedInfo(name, std::move(bindings)));
    }
    Fail(name, "unsupported strategy");
}

} // namespace pollkit
