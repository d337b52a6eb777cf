#include "ChannelWatcher.hpp"
#include "Core/Errors.hpp"
#include "Core/Logger.hpp"

ChannelWatcher::ChannelWatcher(const Params     &p,
                               GatewayTransport &transport,
                               ChannelFetcher   &fetcher,
                               Clock            &clock,
                               NotificationSink &sink)
        : fetcher_(fetcher)
        , clock_(clock)
        , detector_(sink)
        , gateway_(transport, clock, p.gateway,
                   [this](const ObservedName &e) { detector_.Apply(e); })
        , poll_(fetcher, clock, p.poll_interval,
                [this](const ObservedName &e) { detector_.Apply(e); })
        , supervisor_(clock, p.backoff)
{
}

ChannelWatcher::~ChannelWatcher()
{
    Stop();
}

bool ChannelWatcher::IsRunning() const
{
    return push_thread_.joinable() || poll_thread_.joinable();
}

void ChannelWatcher::FetchInitial()
{
    try
    {
        std::optional<std::string> name = fetcher_.FetchName(std::stop_token{});
        if (name)
            detector_.Seed(*name, clock_.Now());
        else
            LOGW("watcher") << "Channel has no name, waiting for events";
    }
    catch (const FetchFailed &e)
    {
        if (e.Status() == 404)
            throw ConfigError("channel not found (check CHANNEL_ID)");
        if (e.Status() == 401)
            throw ConfigError("credential rejected (check DISCORD_TOKEN)");
        LOGW("watcher") << "Initial fetch failed, starting unseeded: " << e.what();
    }
}

void ChannelWatcher::Start()
{
    if (IsRunning()) return;

    push_thread_ = std::jthread([this](std::stop_token st) { PushThread_(st); });
    poll_thread_ = std::jthread([this](std::stop_token st) { PollThread_(st); });

    LOGI("watcher") << "Monitoring started";
}

void ChannelWatcher::PushThread_(std::stop_token st)
{
    try
    {
        supervisor_.Supervise([this](std::stop_token s) { gateway_.Run(s); }, st);
    }
    catch (const std::exception &e)
    {
        LOGE("watcher") << "Push thread failed: " << e.what();
    }
}

void ChannelWatcher::PollThread_(std::stop_token st)
{
    try
    {
        poll_.Run(st);
    }
    catch (const std::exception &e)
    {
        LOGE("watcher") << "Poll thread failed: " << e.what();
    }
}

void ChannelWatcher::Stop()
{
    if (!IsRunning()) return;

    // Сначала закрываем детектор: с этого момента ни одной тревоги.
    detector_.Close();

    push_thread_.request_stop();
    poll_thread_.request_stop();
    if (push_thread_.joinable()) push_thread_.join();
    if (poll_thread_.joinable()) poll_thread_.join();

    LOGI("watcher") << "Shutdown complete";
}
