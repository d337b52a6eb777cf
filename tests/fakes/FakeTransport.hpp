#pragma once

// FakeTransport.hpp: сценарный транспорт Gateway.
// Входящие фреймы берутся из очереди; пустая очередь «ждёт» timeout,
// двигая FakeClock. Исходящие сохраняются для проверок.

#include "Core/Errors.hpp"
#include "Core/Gateway/GatewayTransport.hpp"
#include "tests/fakes/FakeClock.hpp"

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <variant>
#include <vector>

namespace Fakes
{
    class FakeTransport final : public GatewayTransport
    {
    public:
        // Закрытие удалённой стороной с кодом.
        struct CloseFrame
        {
            int code;
        };

        using Inbound = std::variant<std::string, CloseFrame>;

        explicit FakeTransport(Clock *clock = nullptr)
                : clock_(clock)
        {
        }

        // Вызывается на каждый Send (под замком не держим).
        std::function<void(FakeTransport &, const std::string &)> on_send;
        // Вызывается, когда очередь пуста.
        std::function<void(FakeTransport &)> on_idle;

        bool fail_connect = false;
        bool hang_connect = false;    // Connect висит до остановки
        bool ack_heartbeats = false;  // отвечать op 11 на каждый op 1

        void Push(std::string frame)
        {
            std::lock_guard<std::mutex> lk(mtx_);
            inbound_.emplace_back(std::move(frame));
        }

        void PushClose(int code)
        {
            std::lock_guard<std::mutex> lk(mtx_);
            inbound_.emplace_back(CloseFrame{code});
        }

        void Connect(const std::string &url, std::stop_token st) override
        {
            std::unique_lock<std::mutex> lk(mtx_);
            ++connects_;
            last_url_ = url;
            if (fail_connect) throw TransportError("connection refused");
            if (hang_connect)
            {
                cv_.wait(lk, st, [] { return false; });
                throw TransportError("connect cancelled");
            }
            open_ = true;
        }

        void Send(const std::string &text) override
        {
            {
                std::lock_guard<std::mutex> lk(mtx_);
                if (!open_) throw TransportError("send on closed transport");
                sent_.push_back(text);
                if (ack_heartbeats && text.find("\"op\":1") != std::string::npos)
                    inbound_.emplace_back(std::string(R"({"op":11})"));
            }
            if (on_send) on_send(*this, text);
        }

        std::optional<std::string> Receive(std::chrono::milliseconds timeout) override
        {
            std::optional<Inbound> next;
            {
                std::lock_guard<std::mutex> lk(mtx_);
                if (!open_) throw TransportError("receive on closed transport");
                if (!inbound_.empty())
                {
                    next = std::move(inbound_.front());
                    inbound_.pop_front();
                }
            }

            if (!next)
            {
                if (on_idle) on_idle(*this);
                if (auto *fake = dynamic_cast<FakeClock *>(clock_))
                    fake->Advance(timeout);
                else if (clock_ != nullptr)
                    std::this_thread::sleep_for(timeout);
                return std::nullopt;
            }

            if (const CloseFrame *c = std::get_if<CloseFrame>(&*next))
            {
                std::lock_guard<std::mutex> lk(mtx_);
                open_ = false;
                throw TransportError("closed by remote code=" + std::to_string(c->code), c->code);
            }
            return std::get<std::string>(std::move(*next));
        }

        void Close() noexcept override
        {
            std::lock_guard<std::mutex> lk(mtx_);
            if (open_) ++closes_;
            open_ = false;
        }

        std::vector<std::string> Sent() const
        {
            std::lock_guard<std::mutex> lk(mtx_);
            return sent_;
        }

        int  Connects() const { std::lock_guard<std::mutex> lk(mtx_); return connects_; }
        int  Closes() const   { std::lock_guard<std::mutex> lk(mtx_); return closes_; }
        bool IsOpen() const   { std::lock_guard<std::mutex> lk(mtx_); return open_; }

    private:
        Clock                      *clock_;
        mutable std::mutex          mtx_;
        std::condition_variable_any cv_;
        std::deque<Inbound>         inbound_;
        std::vector<std::string>    sent_;
        std::string                 last_url_;
        int                         connects_ = 0;
        int                         closes_   = 0;
        bool                        open_     = false;
    };
}
