#pragma once

// GatewayTransport.hpp: канал push-соединения, как его видит GatewayClient.
// Все методы вызываются из одного потока (потока сеанса).

#include <chrono>
#include <optional>
#include <stop_token>
#include <string>

class GatewayTransport
{
public:
    virtual ~GatewayTransport() = default;

    // Открыть соединение. Ошибка или остановка (st): TransportError.
    virtual void Connect(const std::string &url, std::stop_token st) = 0;

    // Отправить текстовый фрейм. Ошибка: TransportError.
    virtual void Send(const std::string &text) = 0;

    /**
     * @brief Дождаться входящего текстового сообщения.
     * @return std::nullopt, если за timeout ничего не пришло.
     * @throws TransportError при закрытии соединения или ошибке чтения.
     */
    virtual std::optional<std::string> Receive(std::chrono::milliseconds timeout) = 0;

    // Закрыть соединение; повторный вызов безопасен.
    virtual void Close() noexcept = 0;
};
