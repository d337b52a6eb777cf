#include "Core/Net/WebSocketTransport.hpp"
#include "Core/Net/Tls.hpp"
#include "Core/Net/Url.hpp"
#include "Core/Errors.hpp"
#include "Core/Logger.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

namespace asio      = boost::asio;
namespace beast     = boost::beast;
namespace websocket = boost::beast::websocket;
using tcp           = boost::asio::ip::tcp;

namespace
{
    // READY у пользовательских аккаунтов бывает на несколько мегабайт.
    constexpr std::size_t kReadMessageMax = 64u * 1024u * 1024u;

    // Сколько ждать отмены операций после закрытия сокета.
    constexpr std::chrono::milliseconds kDrainLimit{1000};
}

WebSocketTransport::WebSocketTransport(std::chrono::milliseconds connect_timeout,
                                       std::string               user_agent)
        : connect_timeout_(connect_timeout)
        , user_agent_(std::move(user_agent))
        , tls_(Net::MakeClientTlsContext())
{
}

WebSocketTransport::~WebSocketTransport()
{
    Close();
}

void WebSocketTransport::Connect(const std::string &url, std::stop_token st)
{
    Close();

    Net::Url u;
    try
    {
        u = Net::ParseUrl(url);
    }
    catch (const std::invalid_argument &e)
    {
        throw TransportError(e.what());
    }

    ws_ = std::make_unique<Stream>(ioc_, tls_);
    try
    {
        Net::PrepareTls(ws_->next_layer(), u.host);
    }
    catch (const beast::system_error &e)
    {
        ws_.reset();
        throw TransportError("sni: " + e.code().message());
    }

    auto cancel = [this]
    {
        beast::error_code ignored;
        beast::get_lowest_layer(*ws_).socket().close(ignored);
    };
    auto phase_deadline = [this] { return std::chrono::steady_clock::now() + connect_timeout_; };

    tcp::resolver::results_type endpoints;
    beast::error_code ec = Net::Resolve(ioc_, u.host, u.port, st, phase_deadline(), endpoints);
    if (ec)
    {
        // На сокете ещё ничего не запущено; брошенный resolve ждать незачем.
        ws_.reset();
        throw TransportError("resolve " + u.host + ": " + ec.message());
    }

    ec = Net::RunToCompletion(ioc_, st, phase_deadline(), [&](auto handler)
    {
        beast::get_lowest_layer(*ws_).async_connect(endpoints, handler);
    }, cancel);
    if (ec)
    {
        Abort_();
        throw TransportError("connect " + u.host + ":" + u.port + ": " + ec.message());
    }

    ec = Net::RunToCompletion(ioc_, st, phase_deadline(), [&](auto handler)
    {
        ws_->next_layer().async_handshake(asio::ssl::stream_base::client, handler);
    }, cancel);
    if (ec)
    {
        Abort_();
        throw TransportError("tls handshake " + u.host + ": " + ec.message());
    }

    // Дальше таймауты простоя ведёт сам websocket::stream.
    websocket::stream_base::timeout opt = websocket::stream_base::timeout::suggested(beast::role_type::client);
    opt.handshake_timeout = connect_timeout_;
    ws_->set_option(opt);
    ws_->set_option(websocket::stream_base::decorator(
            [ua = user_agent_](websocket::request_type &req)
            {
                req.set(beast::http::field::user_agent, ua);
            }));
    ws_->read_message_max(kReadMessageMax);

    ec = Net::RunToCompletion(ioc_, st, phase_deadline(), [&](auto handler)
    {
        ws_->async_handshake(u.host, u.target, handler);
    }, cancel);
    if (ec)
    {
        Abort_();
        throw TransportError("websocket handshake " + u.host + u.target + ": " + ec.message());
    }

    ws_->text(true);
    LOGT("transport") << "Open: host=" << u.host << " target=" << u.target;
}

void WebSocketTransport::Send(const std::string &text)
{
    if (!ws_ || !ws_->is_open())
        throw TransportError("send on closed transport");

    bool              done = false;
    beast::error_code ec;
    ws_->async_write(asio::buffer(text),
                     [&done, &ec](beast::error_code wec, std::size_t)
                     {
                         ec   = wec;
                         done = true;
                     });

    // run_one может попутно завершить ожидающее чтение, его результат
    // сохраняется в read_done_/read_ec_ и будет выдан следующим Receive().
    ioc_.restart();
    const auto deadline = std::chrono::steady_clock::now() + connect_timeout_;
    while (!done && std::chrono::steady_clock::now() < deadline)
    {
        if (ioc_.run_one_until(deadline) == 0) break;
    }

    if (!done)
    {
        // Хэндлер держит ссылки на стек: рвём сокет и ждём его завершения.
        Abort_();
        throw TransportError("send timed out");
    }
    if (ec)
        throw TransportError("send: " + ec.message());
}

void WebSocketTransport::StartRead_()
{
    read_pending_ = true;
    ws_->async_read(buffer_,
                    [this](beast::error_code ec, std::size_t)
                    {
                        read_pending_ = false;
                        read_done_    = true;
                        read_ec_      = ec;
                    });
}

std::optional<std::string> WebSocketTransport::Receive(std::chrono::milliseconds timeout)
{
    if (!ws_)
        throw TransportError("receive on closed transport");

    if (!read_pending_ && !read_done_)
    {
        StartRead_();
    }

    if (!read_done_)
    {
        // run_for() ждал бы весь timeout: у websocket-стрима живёт свой таймер простоя.
        ioc_.restart();
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (!read_done_ && ioc_.run_one_until(deadline) > 0)
        {
        }
    }

    if (!read_done_)
    {
        return std::nullopt;
    }

    read_done_ = false;
    if (read_ec_)
    {
        if (read_ec_ == websocket::error::closed)
        {
            const websocket::close_reason cr = ws_->reason();
            throw TransportError("closed by remote code=" + std::to_string(cr.code) +
                                 " reason=" + std::string(cr.reason.data(), cr.reason.size()),
                                 static_cast<int>(cr.code));
        }
        throw TransportError("read: " + read_ec_.message());
    }

    std::string text = beast::buffers_to_string(buffer_.data());
    buffer_.consume(buffer_.size());
    return text;
}

void WebSocketTransport::Abort_() noexcept
{
    if (ws_)
    {
        beast::error_code ignored;
        beast::get_lowest_layer(*ws_).socket().close(ignored);

        // Добиваем оставшиеся хэндлеры: они ссылаются на члены объекта.
        ioc_.restart();
        const auto deadline = std::chrono::steady_clock::now() + kDrainLimit;
        while (ioc_.run_one_until(deadline) > 0)
        {
        }
        ws_.reset();
    }
    buffer_.consume(buffer_.size());
    read_pending_ = false;
    read_done_    = false;
    read_ec_      = {};
}

void WebSocketTransport::Close() noexcept
{
    if (!ws_) return;

    if (ws_->is_open())
    {
        bool closed = false;
        ws_->async_close(websocket::close_code::normal,
                         [&closed](beast::error_code)
                         {
                             closed = true;
                         });
        ioc_.restart();
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(1);
        while (!closed && ioc_.run_one_until(deadline) > 0)
        {
        }
    }

    Abort_();
    LOGT("transport") << "Closed";
}
