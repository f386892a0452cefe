#pragma once

#include "../api/Logger.hpp"

#include <chrono>
#include <memory>

namespace pollkit
{

// Pause primitive used between interval-based attempts. Implementations
// shared across threads must be stateless or synchronized.
class ISleeper
{
public:
    virtual ~ISleeper() = default;

    virtual void Sleep(std::chrono::nanoseconds duration) = 0;
};

class ThreadSleeper : public ISleeper
{
public:
    void Sleep(std::chrono::nanoseconds duration) override;
};

class NoopSleeper : public ISleeper
{
public:
    void Sleep(std::chrono::nanoseconds) override {}
};

// Records the requested pause at debug level without blocking.
class LoggingSleeper : public ISleeper
{
public:
    explicit LoggingSleeper(Logger logger = MakePlogLogger());

    void Sleep(std::chrono::nanoseconds duration) override;

private:
    Logger logger_;
};

std::shared_ptr<ISleeper> DefaultSleeper();

} // namespace pollkit
