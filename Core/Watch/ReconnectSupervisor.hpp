#pragma once

// ReconnectSupervisor.hpp: бесконечный перезапуск push-сеанса с backoff.

#include "Core/Clock.hpp"
#include "Core/Watch/Backoff.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <stop_token>

class ReconnectSupervisor
{
public:
    // Сеанс: возвращается только по остановке, иначе бросает ConnectionLost.
    using SessionFn = std::function<void(std::stop_token)>;

    ReconnectSupervisor(Clock &clock, const BackoffPolicy &policy);

    ReconnectSupervisor(const ReconnectSupervisor&)            = delete;
    ReconnectSupervisor& operator=(const ReconnectSupervisor&) = delete;

    // Крутится до запроса остановки; ожидание backoff прерывается сразу.
    void Supervise(const SessionFn &session, std::stop_token st);

    std::uint64_t Losses() const { return losses_.load(std::memory_order_relaxed); }
    int           Attempt() const { return attempt_.load(std::memory_order_relaxed); }

private:
    Clock                     &clock_;
    Backoff                    backoff_;
    std::atomic<std::uint64_t> losses_{0};
    std::atomic<int>           attempt_{0};
};
