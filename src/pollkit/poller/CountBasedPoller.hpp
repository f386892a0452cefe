#pragma once

#include "Poller.hpp"
#include "PollerCreateInfo.hpp"

namespace pollkit
{

// Stops after max_attempts back-to-back attempts or on the first success.
class CountBasedPoller final : public Poller
{
public:
    // Throws PollerConfigError if max_attempts is not positive.
    explicit CountBasedPoller(CountBasedPollerCreateInfo create_info);

    int MaxAttempts() const { return max_attempts_; }

protected:
    std::size_t RunAttempts(const Attempt& attempt) const override;

private:
    int max_attempts_;
};

} // namespace pollkit
