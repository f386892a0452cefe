#pragma once

#include <functional>
#include <string>

#include <plog/Log.h>

namespace pollkit
{

// Leveled diagnostic sink. Unset callbacks are skipped.
struct Logger
{
    std::function<void(const std::string&)> info;
    std::function<void(const std::string&)> debug;
    std::function<void(const std::string&)> warn;
    std::function<void(const std::string&)> error;

    bool Empty() const { return !info && !debug && !warn && !error; }
};

// Logger that forwards to a plog instance. Writes are dropped while the
// instance has no appender registered.
template <int InstanceId = 0>
Logger MakePlogLogger()
{
    Logger log{};
    log.info = [](const std::string& m) { PLOG_INFO_(InstanceId) << m; };
    log.debug = [](const std::string& m) { PLOG_DEBUG_(InstanceId) << m; };
    log.warn = [](const std::string& m) { PLOG_WARNING_(InstanceId) << m; };
    log.error = [](const std::string& m) { PLOG_ERROR_(InstanceId) << m; };
    return log;
}

} // namespace pollkit
