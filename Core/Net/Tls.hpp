#pragma once

// Tls.hpp: общие кусочки Asio/Beast для HTTPS и WSS.
// Асинхронные операции Beast запускаются на собственном io_context
// и «прокручиваются» до завершения короткими шагами: между шагами
// проверяются stop_token и дедлайн фазы.

#include <chrono>
#include <stop_token>
#include <string>

#include <boost/asio/error.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core/error.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

namespace Net
{
    // TLS-контекст клиента: TLS 1.2+, системные корни, проверка пира.
    boost::asio::ssl::context MakeClientTlsContext();

    // Включить SNI и проверку имени хоста на SSL-потоке.
    template <class SslStream>
    void PrepareTls(SslStream &stream, const std::string &host)
    {
        if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str()))
        {
            throw boost::beast::system_error(
                    boost::beast::error_code(static_cast<int>(::ERR_get_error()),
                                             boost::asio::error::get_ssl_category()));
        }
        stream.set_verify_callback(boost::asio::ssl::host_name_verification(host));
    }

    // Шаг, с которым ожидание проверяет stop_token и дедлайн.
    constexpr std::chrono::milliseconds kCancelSlice{50};

    /**
     * @brief Запустить одну асинхронную операцию и крутить io_context до её завершения.
     * Остановка или дедлайн вызывают cancel(); после этого ждём, пока операция
     * отдаст свой хэндлер (он ссылается на стек вызывающего).
     * @param start  Функтор, принимающий completion handler.
     * @param cancel Прерывает операцию (закрытие сокета и т.п.).
     * @return Код ошибки операции; operation_aborted при остановке, timed_out по дедлайну.
     */
    template <class Start, class Cancel>
    boost::beast::error_code RunToCompletion(boost::asio::io_context              &ioc,
                                             const std::stop_token                &st,
                                             std::chrono::steady_clock::time_point deadline,
                                             Start                               &&start,
                                             Cancel                              &&cancel)
    {
        boost::beast::error_code result = boost::asio::error::would_block;
        bool done = false;
        start([&result, &done](boost::beast::error_code ec, auto &&...)
              {
                  result = ec;
                  done   = true;
              });

        boost::beast::error_code why;
        ioc.restart();
        while (!done)
        {
            if (!why)
            {
                if (st.stop_requested())
                    why = boost::asio::error::operation_aborted;
                else if (std::chrono::steady_clock::now() >= deadline)
                    why = boost::asio::error::timed_out;
                if (why) cancel();
            }
            if (ioc.run_one_for(kCancelSlice) == 0 && ioc.stopped()) break;
        }
        return why ? why : result;
    }

    /**
     * @brief Разрешить имя хоста с учётом остановки и дедлайна.
     * getaddrinfo не прерывается: брошенный запрос дописывает результат в своё
     * разделяемое состояние и тихо завершается на следующем прогоне ioc.
     * ioc должен пережить сам запрос.
     */
    boost::beast::error_code Resolve(boost::asio::io_context                         &ioc,
                                     const std::string                               &host,
                                     const std::string                               &port,
                                     const std::stop_token                           &st,
                                     std::chrono::steady_clock::time_point            deadline,
                                     boost::asio::ip::tcp::resolver::results_type    &out);
}
