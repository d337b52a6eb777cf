#pragma once

// GatewayClient.hpp: один сеанс push-соединения:
// Connecting -> Identifying (Hello, Identify, ждём READY) -> Dispatching.
// Повторов внутри нет: любой обрыв выходит наружу как ConnectionLost.
// Heartbeat ведётся в том же потоке: ожидание Receive ограничено ближайшим
// дедлайном heartbeat, поэтому отдельный поток отправки не нужен.

#include "Core/Clock.hpp"
#include "Core/Gateway/GatewayProtocol.hpp"
#include "Core/Gateway/GatewayTransport.hpp"
#include "Core/Gateway/HeartbeatScheduler.hpp"
#include "Core/Errors.hpp"
#include "Core/Watch/ChannelState.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <stop_token>
#include <string>

class GatewayClient
{
public:
    struct Params
    {
        std::string url = "wss://gateway.discord.gg/?v=9&encoding=json";
        std::string token;
        std::string channel_id;

        std::chrono::milliseconds default_heartbeat{41250};  // если Hello без интервала
        std::chrono::milliseconds handshake_timeout{15000};  // окно Hello + READY
        std::chrono::milliseconds receive_slice{200};        // шаг проверки остановки

        Gateway::IdentifyProperties properties;
    };

    using ObservedFn = std::function<void(const ObservedName &)>;
    using JitterFn   = std::function<double()>;

    GatewayClient(GatewayTransport &transport,
                  Clock            &clock,
                  const Params     &p,
                  ObservedFn        observed,
                  JitterFn          jitter = RandomJitter());

    GatewayClient(const GatewayClient&)            = delete;
    GatewayClient& operator=(const GatewayClient&) = delete;

    /**
     * @brief Провести сеанс.
     * Возвращается только по запросу остановки.
     * @throws ConnectionLost при любом обрыве, отказе или таймауте.
     */
    void Run(std::stop_token st);

    std::uint64_t Acks() const { return acks_.load(std::memory_order_relaxed); }

    // Равномерное [0,1) для смещения первого heartbeat.
    static JitterFn RandomJitter();

private:
    enum class Phase
    {
        Connecting,
        Identifying,
        Dispatching,
    };

    struct GatewayConnection
    {
        Phase                       phase = Phase::Connecting;
        std::optional<std::int64_t> last_sequence;
        bool                        session_alive = false;
        Clock::time_point           handshake_deadline{};
        HeartbeatScheduler          heartbeat;
    };

    [[noreturn]] void Lose_(ConnectionLost::Reason reason, const std::string &detail) const;

    void Handle_(const Gateway::Message &msg);
    void HandleDispatch_(const Gateway::Message &msg);
    void OnHello_(const Gateway::Message &msg);
    void PumpHeartbeat_();
    void SendHeartbeat_();
    void Send_(const std::string &text, const char *what);
    void Emit_(const std::string &name, const char *event);
    std::chrono::milliseconds ReceiveTimeout_() const;

private:
    GatewayTransport &transport_;
    Clock            &clock_;
    Params            p_;
    ObservedFn        observed_;
    JitterFn          jitter_;

    GatewayConnection conn_;

    std::atomic<std::uint64_t> acks_{0};
};
