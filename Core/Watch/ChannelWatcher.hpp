#pragma once

// ChannelWatcher.hpp: сборка монитора: начальное чтение имени, два фоновых
// потока (push-сеанс под ReconnectSupervisor и опрос) и их остановка.

#include "Core/Clock.hpp"
#include "Core/Gateway/GatewayClient.hpp"
#include "Core/Gateway/GatewayTransport.hpp"
#include "Core/Watch/Backoff.hpp"
#include "Core/Watch/ChangeDetector.hpp"
#include "Core/Watch/ChannelFetcher.hpp"
#include "Core/Watch/NotificationSink.hpp"
#include "Core/Watch/PollClient.hpp"
#include "Core/Watch/ReconnectSupervisor.hpp"

#include <chrono>
#include <cstdint>
#include <thread>

class ChannelWatcher
{
public:
    struct Params
    {
        GatewayClient::Params     gateway;
        std::chrono::milliseconds poll_interval{1500};
        BackoffPolicy             backoff;
    };

    ChannelWatcher(const Params     &p,
                   GatewayTransport &transport,
                   ChannelFetcher   &fetcher,
                   Clock            &clock,
                   NotificationSink &sink);

    ~ChannelWatcher();

    ChannelWatcher(const ChannelWatcher&)            = delete;
    ChannelWatcher& operator=(const ChannelWatcher&) = delete;
    ChannelWatcher(ChannelWatcher&&)                 = delete;
    ChannelWatcher& operator=(ChannelWatcher&&)      = delete;

    /**
     * @brief Разовое чтение имени до старта потоков; успех засевает состояние.
     * @throws ConfigError на 404 (канала нет) и 401 (токен отвергнут).
     *         Прочие ошибки логируются, мониторинг стартует незасеянным.
     */
    void FetchInitial();

    void Start();

    // Остановить оба потока и дождаться их. Повторный вызов безопасен.
    void Stop();

    bool IsRunning() const;

    ChannelState  Snapshot() const { return detector_.Snapshot(); }
    std::size_t   Notifications() const { return detector_.Notifications(); }
    std::uint64_t PollCycles() const { return poll_.Cycles(); }
    std::uint64_t HeartbeatAcks() const { return gateway_.Acks(); }
    std::uint64_t ConnectionLosses() const { return supervisor_.Losses(); }

private:
    void PushThread_(std::stop_token st);
    void PollThread_(std::stop_token st);

private:
    ChannelFetcher     &fetcher_;
    Clock              &clock_;
    ChangeDetector      detector_;
    GatewayClient       gateway_;
    PollClient          poll_;
    ReconnectSupervisor supervisor_;

    std::jthread push_thread_;
    std::jthread poll_thread_;
};
