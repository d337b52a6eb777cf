#include "Core/Errors.hpp"
#include "Core/Net/HttpsClient.hpp"
#include "Core/Net/WebSocketTransport.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <stop_token>
#include <string>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

using namespace std::chrono_literals;
using tcp = boost::asio::ip::tcp;

namespace
{
    // Принимает TCP (ядро завершает рукопожатие из backlog), но молчит:
    // TLS-рукопожатие клиента повисает.
    class SilentListener
    {
    public:
        SilentListener()
                : acceptor_(ioc_, tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0))
        {
        }

        std::string Port() const { return std::to_string(acceptor_.local_endpoint().port()); }

    private:
        boost::asio::io_context ioc_;
        tcp::acceptor           acceptor_;
    };

    Net::Url LocalUrl(const SilentListener &l)
    {
        Net::Url u;
        u.scheme = "https";
        u.host   = "127.0.0.1";
        u.port   = l.Port();
        u.target = "/api/v9/channels/100";
        return u;
    }
}

TEST(https_client, stop_interrupts_tls_handshake)
{
    SilentListener   listener;
    Net::HttpsClient http(5000ms);

    std::stop_source stop;
    std::jthread     stopper([&]
    {
        std::this_thread::sleep_for(300ms);
        stop.request_stop();
    });

    const auto t0 = std::chrono::steady_clock::now();
    EXPECT_THROW(http.Get(LocalUrl(listener), {}, stop.get_token()), FetchFailed);
    const auto took = std::chrono::steady_clock::now() - t0;

    EXPECT_GE(took, 250ms);
    EXPECT_LT(took, 1500ms);
}

TEST(https_client, phase_timeout_without_stop)
{
    SilentListener   listener;
    Net::HttpsClient http(200ms);

    const auto t0 = std::chrono::steady_clock::now();
    EXPECT_THROW(http.Get(LocalUrl(listener), {}, std::stop_token{}), FetchFailed);
    EXPECT_LT(std::chrono::steady_clock::now() - t0, 2000ms);
}

TEST(https_client, stopped_before_start_fails_fast)
{
    SilentListener   listener;
    Net::HttpsClient http(5000ms);

    std::stop_source stop;
    stop.request_stop();

    const auto t0 = std::chrono::steady_clock::now();
    EXPECT_THROW(http.Get(LocalUrl(listener), {}, stop.get_token()), FetchFailed);
    EXPECT_LT(std::chrono::steady_clock::now() - t0, 500ms);
}

TEST(websocket_transport, stop_interrupts_connect)
{
    SilentListener     listener;
    WebSocketTransport ws(5000ms, "channelwatch-test");

    std::stop_source stop;
    std::jthread     stopper([&]
    {
        std::this_thread::sleep_for(300ms);
        stop.request_stop();
    });

    const auto t0 = std::chrono::steady_clock::now();
    EXPECT_THROW(ws.Connect("wss://127.0.0.1:" + listener.Port() + "/?v=9", stop.get_token()), TransportError);
    EXPECT_LT(std::chrono::steady_clock::now() - t0, 1500ms);
}
