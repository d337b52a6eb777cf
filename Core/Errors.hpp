#pragma once

// Errors.hpp: таксономия ошибок монитора.
// ConnectionLost лечит ReconnectSupervisor, FetchFailed и NotifyError только
// логируются, ConfigError фатален на старте.

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>

class ConnectionLost : public std::runtime_error
{
public:
    enum class Reason
    {
        ConnectFailed,       // транспорт не открылся
        HandshakeRejected,   // Invalid Session / 4004 во время identify
        HandshakeTimeout,    // нет Hello/READY за окно рукопожатия
        TransportClosed,     // удалённая сторона закрыла соединение
        ProtocolError,       // битое сообщение, неожиданный opcode
        HeartbeatTimeout,    // ack не пришёл до следующего дедлайна
        ReconnectRequested,  // op 7 / op 9 в рабочем режиме
    };

    ConnectionLost(Reason reason,
                   const std::string &detail,
                   std::chrono::milliseconds heartbeat_interval = std::chrono::milliseconds::zero())
            : std::runtime_error(detail)
            , reason_(reason)
            , heartbeat_interval_(heartbeat_interval)
    {
    }

    Reason Why() const { return reason_; }

    // Интервал heartbeat потерянного сеанса; ноль, если Hello не было.
    std::chrono::milliseconds HeartbeatInterval() const { return heartbeat_interval_; }

private:
    Reason reason_;
    std::chrono::milliseconds heartbeat_interval_;
};

const char *ToString(ConnectionLost::Reason reason);

class TransportError : public std::runtime_error
{
public:
    explicit TransportError(const std::string &what,
                            std::optional<int> close_code = std::nullopt)
            : std::runtime_error(what)
            , close_code_(close_code)
    {
    }

    // Код закрытия WebSocket, если соединение закрыто штатным close-фреймом.
    std::optional<int> CloseCode() const { return close_code_; }

private:
    std::optional<int> close_code_;
};

class FetchFailed : public std::runtime_error
{
public:
    explicit FetchFailed(const std::string &what, int status = 0)
            : std::runtime_error(what)
            , status_(status)
    {
    }

    // HTTP-статус; 0: до ответа дело не дошло (сеть, TLS, таймаут).
    int Status() const { return status_; }

private:
    int status_;
};

class NotifyError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

class ConfigError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};
