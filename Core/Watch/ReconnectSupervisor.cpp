#include "ReconnectSupervisor.hpp"
#include "Core/Errors.hpp"
#include "Core/Logger.hpp"

ReconnectSupervisor::ReconnectSupervisor(Clock &clock, const BackoffPolicy &policy)
        : clock_(clock)
        , backoff_(policy)
{
}

void ReconnectSupervisor::Supervise(const SessionFn &session, std::stop_token st)
{
    LOGI("supervisor") << "Started";

    while (!st.stop_requested())
    {
        const Clock::time_point started = clock_.Now();
        std::chrono::milliseconds sustain{0};

        try
        {
            session(st);
            if (st.stop_requested()) break;
            LOGW("supervisor") << "Connection lost reason=session_returned";
        }
        catch (const ConnectionLost &e)
        {
            if (st.stop_requested()) break;
            sustain = e.HeartbeatInterval();
            LOGW("supervisor") << "Connection lost reason=" << ToString(e.Why()) << " detail=" << e.what();
        }
        catch (const std::exception &e)
        {
            if (st.stop_requested()) break;
            LOGE("supervisor") << "Connection lost reason=" << ToString(ConnectionLost::Reason::ProtocolError)
                               << " detail=unexpected: " << e.what();
        }

        losses_.fetch_add(1, std::memory_order_relaxed);

        const auto uptime = std::chrono::duration_cast<std::chrono::milliseconds>(clock_.Now() - started);
        const std::chrono::milliseconds delay = backoff_.OnSessionEnded(uptime, sustain);
        attempt_.store(backoff_.Attempt(), std::memory_order_relaxed);

        LOGI("supervisor") << "Reconnect attempt=" << backoff_.Attempt() << " in " << delay.count()
                           << "ms (uptime=" << uptime.count() << "ms)";

        if (!clock_.SleepFor(delay, st)) break;
    }

    LOGI("supervisor") << "Stopped";
}
