#include "Sleeper.hpp"

#include <string>
#include <thread>
#include <utility>

namespace pollkit
{

void ThreadSleeper::Sleep(std::chrono::nanoseconds duration)
{
    if (duration.count() > 0)
    {
        std::this_thread::sleep_for(duration);
    }
}

LoggingSleeper::LoggingSleeper(Logger logger)
    : logger_(std::move(logger))
{
}

void LoggingSleeper::Sleep(std::chrono::nanoseconds duration)
{
    if (logger_.debug)
    {
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(duration);
        logger_.debug("Poller would sleep for " + std::to_string(ms.count()) + "ms");
    }
}

std::shared_ptr<ISleeper> DefaultSleeper()
{
    static const std::shared_ptr<ISleeper> sleeper = std::make_shared<ThreadSleeper>();
    return sleeper;
}

} // namespace pollkit
