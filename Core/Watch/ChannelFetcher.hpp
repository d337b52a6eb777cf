#pragma once

// ChannelFetcher.hpp: pull-канал: разовое чтение имени канала.

#include "Core/Net/HttpsClient.hpp"
#include "Core/Net/Url.hpp"

#include <optional>
#include <stop_token>
#include <string>

class ChannelFetcher
{
public:
    virtual ~ChannelFetcher() = default;

    /**
     * @brief Прочитать текущее имя.
     * @param st Остановка прерывает запрос на любой фазе (FetchFailed).
     * @return std::nullopt для канала без имени (например, DM).
     * @throws FetchFailed при сетевой ошибке или статусе вне 2xx.
     */
    virtual std::optional<std::string> FetchName(std::stop_token st) = 0;
};

// GET {api_base}/channels/{id} с Authorization и браузерным User-Agent.
class RestChannelFetcher final : public ChannelFetcher
{
public:
    struct Params
    {
        std::string api_base;
        std::string token;
        std::string channel_id;
        std::string user_agent;
    };

    RestChannelFetcher(Net::HttpsClient &http, const Params &p);

    std::optional<std::string> FetchName(std::stop_token st) override;

    // Имя из тела ответа; FetchFailed, если тело не JSON-объект.
    static std::optional<std::string> ParseName(const std::string &body);

private:
    Net::HttpsClient &http_;
    Params            p_;
    Net::Url          url_;
    Net::HeaderList   headers_;
};
