#pragma once

// Clock.hpp: источник времени и прерываемое ожидание.
// Все циклы (heartbeat, poll, backoff) ждут через Clock, чтобы тесты
// могли подменить время, а stop_token будил ожидание сразу.

#include <chrono>
#include <stop_token>

class Clock
{
public:
    using time_point = std::chrono::steady_clock::time_point;
    using duration   = std::chrono::milliseconds;

    virtual ~Clock() = default;

    virtual time_point Now() const = 0;

    /**
     * @brief Ждать до deadline либо до запроса остановки.
     * @return false, если ожидание прервано остановкой.
     */
    virtual bool SleepUntil(time_point deadline, std::stop_token st) = 0;

    bool SleepFor(duration d, std::stop_token st)
    {
        return SleepUntil(Now() + d, std::move(st));
    }
};

class SteadyClock final : public Clock
{
public:
    time_point Now() const override;
    bool SleepUntil(time_point deadline, std::stop_token st) override;
};
