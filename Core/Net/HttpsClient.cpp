#include "Core/Net/HttpsClient.hpp"
#include "Core/Net/Tls.hpp"
#include "Core/Errors.hpp"
#include "Core/Logger.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

namespace asio  = boost::asio;
namespace beast = boost::beast;
namespace http  = boost::beast::http;
using tcp       = boost::asio::ip::tcp;

namespace
{
    [[noreturn]] void Fail(const char *phase, const Net::Url &url, const beast::error_code &ec)
    {
        throw FetchFailed(std::string(phase) + " " + url.host + url.target + ": " + ec.message());
    }
}

namespace Net
{
    HttpsClient::HttpsClient(std::chrono::milliseconds timeout)
            : timeout_(timeout)
            , tls_(MakeClientTlsContext())
    {
    }

    HttpResponse HttpsClient::Get(const Url &url, const HeaderList &headers, std::stop_token st)
    {
        beast::ssl_stream<beast::tcp_stream> stream(ioc_, tls_);

        try
        {
            PrepareTls(stream, url.host);
        }
        catch (const beast::system_error &e)
        {
            Fail("sni", url, e.code());
        }

        // Остановка рвёт сокет: незавершённая фаза возвращает operation_aborted.
        auto cancel = [&stream]
        {
            beast::error_code ignored;
            beast::get_lowest_layer(stream).socket().close(ignored);
        };
        auto phase_deadline = [this] { return std::chrono::steady_clock::now() + timeout_; };

        tcp::resolver::results_type endpoints;
        beast::error_code ec = Resolve(ioc_, url.host, url.port, st, phase_deadline(), endpoints);
        if (ec) Fail("resolve", url, ec);

        ec = RunToCompletion(ioc_, st, phase_deadline(), [&](auto handler)
        {
            beast::get_lowest_layer(stream).async_connect(endpoints, handler);
        }, cancel);
        if (ec) Fail("connect", url, ec);

        ec = RunToCompletion(ioc_, st, phase_deadline(), [&](auto handler)
        {
            stream.async_handshake(asio::ssl::stream_base::client, handler);
        }, cancel);
        if (ec) Fail("tls handshake", url, ec);

        http::request<http::empty_body> req{http::verb::get, url.target, 11};
        req.set(http::field::host, url.host);
        for (const auto &h : headers)
        {
            req.set(h.first, h.second);
        }

        ec = RunToCompletion(ioc_, st, phase_deadline(), [&](auto handler)
        {
            http::async_write(stream, req, handler);
        }, cancel);
        if (ec) Fail("write", url, ec);

        beast::flat_buffer                 buffer;
        http::response<http::string_body> res;
        ec = RunToCompletion(ioc_, st, phase_deadline(), [&](auto handler)
        {
            http::async_read(stream, buffer, res, handler);
        }, cancel);
        if (ec) Fail("read", url, ec);

        // Закрытие TLS: многие серверы рвут соединение без close_notify, это не ошибка.
        ec = RunToCompletion(ioc_, st, phase_deadline(), [&](auto handler)
        {
            stream.async_shutdown(handler);
        }, cancel);
        if (ec && ec != asio::error::eof && ec != asio::ssl::error::stream_truncated)
        {
            LOGT("http") << "TLS shutdown: " << ec.message();
        }

        HttpResponse out;
        out.status = static_cast<int>(res.result_int());
        out.body   = std::move(res.body());
        LOGT("http") << "GET " << url.host << url.target << " status=" << out.status
                     << " bytes=" << out.body.size();
        return out;
    }
}
