#pragma once

// Backoff.hpp: экспоненциальная задержка переподключения.
// Чистая логика без ожиданий: время приходит параметрами.

#include <chrono>

struct BackoffPolicy
{
    std::chrono::milliseconds initial{1000};
    std::chrono::milliseconds ceiling{60000};
    double                    factor = 2.0;
};

class Backoff
{
public:
    explicit Backoff(const BackoffPolicy &policy);

    /**
     * @brief Учесть завершившийся сеанс и выдать задержку перед следующей попыткой.
     * @param uptime            Сколько прожил сеанс.
     * @param sustain_threshold Интервал heartbeat сеанса; прожил не меньше: счёт с нуля.
     *                          Ноль: сеанс до Hello не дошёл, сброса нет.
     */
    std::chrono::milliseconds OnSessionEnded(std::chrono::milliseconds uptime,
                                             std::chrono::milliseconds sustain_threshold);

    void Reset();

    int                       Attempt() const { return attempt_; }
    std::chrono::milliseconds NextDelay() const { return next_delay_; }

private:
    BackoffPolicy             policy_;
    int                       attempt_ = 0;
    std::chrono::milliseconds next_delay_;
};
