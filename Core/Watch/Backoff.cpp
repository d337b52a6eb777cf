#include "Backoff.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

Backoff::Backoff(const BackoffPolicy &policy)
        : policy_(policy)
        , next_delay_(policy.initial)
{
    if (policy_.initial.count() <= 0)
        throw std::invalid_argument("Backoff: initial delay must be positive");
    if (policy_.ceiling < policy_.initial)
        throw std::invalid_argument("Backoff: ceiling below initial delay");
    if (policy_.factor < 1.0)
        throw std::invalid_argument("Backoff: factor below 1");
}

void Backoff::Reset()
{
    attempt_    = 0;
    next_delay_ = policy_.initial;
}

std::chrono::milliseconds Backoff::OnSessionEnded(std::chrono::milliseconds uptime,
                                                  std::chrono::milliseconds sustain_threshold)
{
    if (sustain_threshold.count() > 0 && uptime >= sustain_threshold)
    {
        Reset();
    }

    const std::chrono::milliseconds delay = next_delay_;
    ++attempt_;

    const double grown = std::ceil(static_cast<double>(delay.count()) * policy_.factor);
    const double cap   = static_cast<double>(policy_.ceiling.count());
    next_delay_ = std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(std::min(grown, cap)));
    return delay;
}
