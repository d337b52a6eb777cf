#pragma once

// HeartbeatScheduler.hpp: контракт heartbeat/ack как явный автомат:
//   Idle --(дедлайн, отправка)--> AwaitingAck --(ack)--> Idle
//   AwaitingAck --(следующий дедлайн без ack)--> TimedOut
// Сам таймер не держит: время приходит параметром, ожидание: у GatewayClient.

#include "Core/Clock.hpp"

#include <chrono>
#include <optional>

class HeartbeatScheduler
{
public:
    enum class State
    {
        Disarmed,
        Idle,
        AwaitingAck,
        TimedOut,
    };

    enum class Action
    {
        None,
        SendHeartbeat,
        TimedOut,
    };

    /**
     * @brief Завести контракт (после Hello).
     * @param jitter_fraction Доля интервала до первого удара, [0,1).
     */
    void Arm(Clock::time_point now, std::chrono::milliseconds interval, double jitter_fraction);

    // Разорвать контракт (конец сеанса).
    void Disarm();

    /**
     * @brief Проверить дедлайн.
     * @return SendHeartbeat: пора слать (состояние уже AwaitingAck);
     *         TimedOut: дедлайн наступил, а предыдущий ack так и не пришёл.
     */
    Action Poll(Clock::time_point now);

    /**
     * @brief Сервер попросил heartbeat (op 1).
     * @return true, если надо слать сейчас; при ожидании ack второй не шлём.
     */
    bool RequestImmediate(Clock::time_point now);

    // Пришёл ack (op 11). false: ack без отправленного heartbeat.
    bool OnAck(Clock::time_point now);

    State                     CurrentState() const { return state_; }
    bool                      Armed() const { return state_ != State::Disarmed; }
    Clock::time_point         NextDeadline() const { return deadline_; }
    std::chrono::milliseconds Interval() const { return interval_; }

    // Задержка последнего ack относительно отправки.
    std::optional<std::chrono::milliseconds> LastLatency() const { return last_latency_; }

private:
    State                     state_ = State::Disarmed;
    std::chrono::milliseconds interval_{0};
    Clock::time_point         deadline_{};
    Clock::time_point         sent_at_{};
    std::optional<std::chrono::milliseconds> last_latency_;
};

const char *ToString(HeartbeatScheduler::State state);
