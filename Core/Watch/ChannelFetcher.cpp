#include "ChannelFetcher.hpp"
#include "Core/Errors.hpp"
#include "Core/Logger.hpp"

#include <boost/json.hpp>

RestChannelFetcher::RestChannelFetcher(Net::HttpsClient &http, const Params &p)
        : http_(http)
        , p_(p)
{
    std::string base = p_.api_base;
    while (!base.empty() && base.back() == '/') base.pop_back();

    // Кривой api_base: ошибка конфигурации, а не сети.
    try
    {
        url_ = Net::ParseUrl(base + "/channels/" + p_.channel_id);
    }
    catch (const std::invalid_argument &e)
    {
        throw ConfigError(std::string("api_base: ") + e.what());
    }

    headers_ = {
        { "Authorization", p_.token },
        { "User-Agent",    p_.user_agent },
        { "Accept",        "application/json" },
    };
}

std::optional<std::string> RestChannelFetcher::FetchName(std::stop_token st)
{
    const Net::HttpResponse rsp = http_.Get(url_, headers_, std::move(st));
    if (rsp.status < 200 || rsp.status >= 300)
    {
        throw FetchFailed("GET " + url_.target + " status=" + std::to_string(rsp.status), rsp.status);
    }
    return ParseName(rsp.body);
}

std::optional<std::string> RestChannelFetcher::ParseName(const std::string &body)
{
    boost::system::error_code ec;
    boost::json::value jv = boost::json::parse(body, ec);
    if (ec)
        throw FetchFailed("channel body is not JSON: " + ec.message());
    if (!jv.is_object())
        throw FetchFailed("channel body is not an object");

    const boost::json::value *name = jv.as_object().if_contains("name");
    if (name == nullptr || !name->is_string())
        return std::nullopt;
    return boost::json::value_to<std::string>(*name);
}
