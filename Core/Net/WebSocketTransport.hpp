#pragma once

// WebSocketTransport.hpp: wss:// транспорт шлюза на Boost.Beast.
// Чтение асинхронное: незавершённый async_read переживает таймаут Receive()
// и подхватывается следующим вызовом, поэтому сообщения не теряются.

#include "Core/Gateway/GatewayTransport.hpp"

#include <chrono>
#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <boost/beast/websocket/stream.hpp>

class WebSocketTransport final : public GatewayTransport
{
public:
    WebSocketTransport(std::chrono::milliseconds connect_timeout,
                       std::string               user_agent);
    ~WebSocketTransport() override;

    WebSocketTransport(const WebSocketTransport&)            = delete;
    WebSocketTransport& operator=(const WebSocketTransport&) = delete;

    void Connect(const std::string &url, std::stop_token st) override;
    void Send(const std::string &text) override;
    std::optional<std::string> Receive(std::chrono::milliseconds timeout) override;
    void Close() noexcept override;

private:
    using Stream = boost::beast::websocket::stream<
            boost::beast::ssl_stream<boost::beast::tcp_stream>>;

    void StartRead_();
    void Abort_() noexcept;

private:
    std::chrono::milliseconds connect_timeout_;
    std::string               user_agent_;

    boost::asio::io_context   ioc_;
    boost::asio::ssl::context tls_;
    std::unique_ptr<Stream>   ws_;

    boost::beast::flat_buffer buffer_;
    bool                      read_pending_ = false;
    bool                      read_done_    = false;
    boost::beast::error_code  read_ec_;
};
