#pragma once

// HttpsClient.hpp: минимальный HTTPS GET поверх Boost.Beast + OpenSSL.
// Одно соединение на запрос; таймаут на каждую фазу (resolve, connect, TLS, I/O),
// stop_token прерывает любую фазу в пределах kCancelSlice.

#include "Core/Net/Url.hpp"

#include <chrono>
#include <stop_token>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>

namespace Net
{
    struct HttpResponse
    {
        int         status = 0;
        std::string body;
    };

    using HeaderList = std::vector<std::pair<std::string, std::string>>;

    class HttpsClient
    {
    public:
        explicit HttpsClient(std::chrono::milliseconds timeout);

        HttpsClient(const HttpsClient&)            = delete;
        HttpsClient& operator=(const HttpsClient&) = delete;

        /**
         * @brief Выполнить GET.
         * @return Ответ с любым статусом; решать, что считать ошибкой, вызывающему.
         * @throws FetchFailed (status 0) при ошибке сети, TLS, таймауте или остановке.
         */
        HttpResponse Get(const Url &url, const HeaderList &headers, std::stop_token st);

    private:
        std::chrono::milliseconds timeout_;
        // Живёт дольше запроса: брошенный resolve добегает на нём позже.
        boost::asio::io_context   ioc_;
        boost::asio::ssl::context tls_;
    };
}
