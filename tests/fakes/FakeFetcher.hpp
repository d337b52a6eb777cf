#pragma once

// FakeFetcher.hpp: сценарный pull-канал: ответы по очереди,
// после исчерпания сценария повторяется последний.
// Hang висит до остановки, как запрос к молчащему серверу.

#include "Core/Errors.hpp"
#include "Core/Watch/ChannelFetcher.hpp"
#include "tests/fakes/FakeClock.hpp"

#include <condition_variable>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <variant>

namespace Fakes
{
    class FakeFetcher final : public ChannelFetcher
    {
    public:
        struct Fail
        {
            int status = 0;
        };
        struct NoName
        {
        };
        // Исключение не из таксономии (ошибка программы, а не сети).
        struct Crash
        {
        };
        struct Hang
        {
        };

        using Reply = std::variant<std::string, Fail, NoName, Crash, Hang>;

        explicit FakeFetcher(FakeClock *clock = nullptr, std::chrono::milliseconds latency = {})
                : clock_(clock)
                , latency_(latency)
        {
        }

        void Push(Reply r)
        {
            std::lock_guard<std::mutex> lk(mtx_);
            replies_.push_back(std::move(r));
        }

        std::optional<std::string> FetchName(std::stop_token st) override
        {
            Reply r = NoName{};
            {
                std::lock_guard<std::mutex> lk(mtx_);
                ++calls_;
                if (!replies_.empty())
                {
                    r = replies_.front();
                    if (replies_.size() > 1) replies_.pop_front();
                }
            }

            if (std::holds_alternative<Hang>(r))
            {
                std::unique_lock<std::mutex> lk(mtx_);
                ++hanging_;
                cv_.wait(lk, st, [] { return false; });
                --hanging_;
                throw FetchFailed("cancelled");
            }

            if (clock_ != nullptr && latency_.count() > 0) clock_->Advance(latency_);

            if (std::holds_alternative<Crash>(r))
                throw std::runtime_error("scripted crash");
            if (const Fail *f = std::get_if<Fail>(&r))
                throw FetchFailed("scripted failure", f->status);
            if (std::holds_alternative<NoName>(r))
                return std::nullopt;
            return std::get<std::string>(r);
        }

        int Calls() const
        {
            std::lock_guard<std::mutex> lk(mtx_);
            return calls_;
        }

        // Сколько вызовов сейчас висят в Hang.
        int Hanging() const
        {
            std::lock_guard<std::mutex> lk(mtx_);
            return hanging_;
        }

    private:
        FakeClock                *clock_;
        std::chrono::milliseconds latency_;
        mutable std::mutex        mtx_;
        std::condition_variable_any cv_;
        std::deque<Reply>         replies_;
        int                       calls_   = 0;
        int                       hanging_ = 0;
    };
}
