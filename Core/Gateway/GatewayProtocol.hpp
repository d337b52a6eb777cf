#pragma once

// GatewayProtocol.hpp: кодек сообщений Discord Gateway v9 (encoding=json).
// Формат внешний и фиксированный: {"op":int,"s":int|null,"t":string|null,"d":any}.

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include <boost/json.hpp>

namespace Gateway
{
    enum class Opcode : int
    {
        Dispatch       = 0,
        Heartbeat      = 1,
        Identify       = 2,
        Reconnect      = 7,
        InvalidSession = 9,
        Hello          = 10,
        HeartbeatAck   = 11,
    };

    // Коды закрытия, означающие отказ в рукопожатии.
    constexpr int kCloseAuthenticationFailed = 4004;
    constexpr int kCloseInvalidIntents       = 4013;
    constexpr int kCloseDisallowedIntents    = 4014;

    struct Message
    {
        int                         op = -1;
        std::optional<std::int64_t> seq;   // "s"
        std::optional<std::string>  type;  // "t"
        boost::json::value          data;  // "d"

        bool Is(Opcode code) const { return op == static_cast<int>(code); }
    };

    struct IdentifyProperties
    {
        std::string os      = "linux";
        std::string browser = "Chrome";
        std::string device  = "Chrome";
    };

    /**
     * @brief Разобрать входящий фрейм.
     * @throws std::invalid_argument если это не JSON-объект с целым "op".
     */
    Message Parse(const std::string &text);

    std::string BuildIdentify(const std::string &token, const IdentifyProperties &props);

    // op 1; d: последний sequence или null.
    std::string BuildHeartbeat(std::optional<std::int64_t> seq);

    // heartbeat_interval из Hello (op 10).
    std::optional<std::chrono::milliseconds> HelloInterval(const Message &msg);

    // Имя из CHANNEL_UPDATE, если событие про наш канал и имя задано.
    std::optional<std::string> ChannelUpdateName(const boost::json::value &d,
                                                 const std::string        &channel_id);

    // Поиск канала в READY (private_channels, guilds[].channels) и GUILD_CREATE (channels).
    std::optional<std::string> FindChannelName(const boost::json::value &d,
                                               const std::string        &channel_id);

    // session_id из READY: только для логов.
    std::optional<std::string> SessionId(const boost::json::value &d);
}
