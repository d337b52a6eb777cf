#include "Core/Clock.hpp"

#include <condition_variable>
#include <mutex>

Clock::time_point SteadyClock::Now() const
{
    return std::chrono::steady_clock::now();
}

bool SteadyClock::SleepUntil(time_point deadline, std::stop_token st)
{
    if (st.stop_requested()) return false;

    std::mutex                  mu;
    std::condition_variable_any cv;
    std::unique_lock<std::mutex> lock(mu);

    // Предикат ложен всегда: выходим по таймауту или по stop_token.
    cv.wait_until(lock, st, deadline, [] { return false; });
    return !st.stop_requested();
}
