#pragma once

// PollClient.hpp: периодический опрос имени канала.
// Тики строго по сетке start + k*interval: ошибки и долгие запросы
// не сдвигают расписание, пропущенные тики не догоняются.

#include "Core/Clock.hpp"
#include "Core/Watch/ChannelFetcher.hpp"
#include "Core/Watch/ChannelState.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <stop_token>

class PollClient
{
public:
    using ObservedFn = std::function<void(const ObservedName &)>;

    PollClient(ChannelFetcher &fetcher, Clock &clock, std::chrono::milliseconds interval, ObservedFn observed);

    PollClient(const PollClient&)            = delete;
    PollClient& operator=(const PollClient&) = delete;

    // Крутится до запроса остановки. Первый опрос: через один интервал.
    void Run(std::stop_token st);

    std::uint64_t Cycles() const   { return cycles_.load(std::memory_order_relaxed); }
    std::uint64_t Failures() const { return failures_.load(std::memory_order_relaxed); }

private:
    void Cycle_(std::stop_token st);

private:
    ChannelFetcher           &fetcher_;
    Clock                    &clock_;
    std::chrono::milliseconds interval_;
    ObservedFn                observed_;

    std::atomic<std::uint64_t> cycles_{0};
    std::atomic<std::uint64_t> failures_{0};
};
