#include "PollClient.hpp"
#include "Core/Errors.hpp"
#include "Core/Logger.hpp"

PollClient::PollClient(ChannelFetcher &fetcher, Clock &clock, std::chrono::milliseconds interval, ObservedFn observed)
        : fetcher_(fetcher)
        , clock_(clock)
        , interval_(interval)
        , observed_(std::move(observed))
{
    if (interval_.count() <= 0)
        throw std::invalid_argument("PollClient: interval must be positive");
}

void PollClient::Run(std::stop_token st)
{
    const Clock::time_point start = clock_.Now();
    std::int64_t            k     = 0;

    LOGI("poll") << "Started interval=" << interval_.count() << "ms";

    while (!st.stop_requested())
    {
        ++k;
        Clock::time_point tick = start + k * interval_;

        // Проспали целые тики: пропускаем их, опоздавший выполняем один раз.
        const Clock::time_point now = clock_.Now();
        if (now - tick >= interval_)
        {
            const std::int64_t behind = (now - tick) / interval_;
            k   += behind;
            tick = start + k * interval_;
            LOGD("poll") << "Skipped ticks=" << behind;
        }

        if (!clock_.SleepUntil(tick, st)) break;

        Cycle_(st);
    }

    LOGI("poll") << "Stopped cycles=" << Cycles();
}

void PollClient::Cycle_(std::stop_token st)
{
    const std::uint64_t n = cycles_.fetch_add(1, std::memory_order_relaxed) + 1;
    try
    {
        std::optional<std::string> name = fetcher_.FetchName(st);
        if (name)
        {
            LOGI("poll") << "Poll cycle executed n=" << n << " name='" << *name << "'";
            observed_(ObservedName{ std::move(*name), Source::Poll, clock_.Now() });
        }
        else
        {
            LOGI("poll") << "Poll cycle executed n=" << n << " name=<none>";
        }
    }
    catch (const FetchFailed &e)
    {
        if (st.stop_requested())
        {
            LOGD("poll") << "Fetch cancelled by stop n=" << n;
            return;
        }
        failures_.fetch_add(1, std::memory_order_relaxed);
        LOGW("poll") << "Poll cycle executed n=" << n << " fetch failed status=" << e.Status()
                     << ": " << e.what();
    }
    catch (const std::exception &e)
    {
        // Цикл не должен умирать: следующий тик пробуем заново.
        failures_.fetch_add(1, std::memory_order_relaxed);
        LOGE("poll") << "Poll cycle executed n=" << n << " failed unexpectedly: " << e.what();
    }
}
