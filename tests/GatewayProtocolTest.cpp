#include "Core/Gateway/GatewayProtocol.hpp"
#include "Core/Net/Url.hpp"
#include "Core/Watch/ChannelFetcher.hpp"
#include "Core/Errors.hpp"

#include <gtest/gtest.h>

using namespace std::chrono_literals;

TEST(gateway_protocol, parses_dispatch_frame)
{
    auto msg = Gateway::Parse(R"({"op":0,"s":42,"t":"CHANNEL_UPDATE","d":{"id":"1","name":"x"}})");

    EXPECT_TRUE(msg.Is(Gateway::Opcode::Dispatch));
    ASSERT_TRUE(msg.seq);
    EXPECT_EQ(*msg.seq, 42);
    ASSERT_TRUE(msg.type);
    EXPECT_EQ(*msg.type, "CHANNEL_UPDATE");
    EXPECT_TRUE(msg.data.is_object());
}

TEST(gateway_protocol, null_sequence_and_type_are_absent)
{
    auto msg = Gateway::Parse(R"({"op":11,"s":null,"t":null,"d":null})");

    EXPECT_TRUE(msg.Is(Gateway::Opcode::HeartbeatAck));
    EXPECT_FALSE(msg.seq);
    EXPECT_FALSE(msg.type);
}

TEST(gateway_protocol, rejects_garbage)
{
    EXPECT_THROW(Gateway::Parse("not json"), std::invalid_argument);
    EXPECT_THROW(Gateway::Parse("[1,2]"), std::invalid_argument);
    EXPECT_THROW(Gateway::Parse(R"({"op":"ten"})"), std::invalid_argument);
}

TEST(gateway_protocol, heartbeat_carries_sequence_or_null)
{
    EXPECT_EQ(boost::json::parse(Gateway::BuildHeartbeat(7)),
              boost::json::parse(R"({"op":1,"d":7})"));
    EXPECT_EQ(boost::json::parse(Gateway::BuildHeartbeat(std::nullopt)),
              boost::json::parse(R"({"op":1,"d":null})"));
}

TEST(gateway_protocol, identify_has_token_and_properties)
{
    Gateway::IdentifyProperties props;
    auto jv = boost::json::parse(Gateway::BuildIdentify("secret", props));
    const boost::json::object &o = jv.as_object();
    const boost::json::object &d = o.at("d").as_object();
    const boost::json::object &p = d.at("properties").as_object();

    EXPECT_EQ(o.at("op").as_int64(), 2);
    EXPECT_EQ(d.at("token").as_string(), "secret");
    EXPECT_EQ(p.at("os").as_string(), "linux");
    EXPECT_EQ(p.at("browser").as_string(), "Chrome");
}

TEST(gateway_protocol, hello_interval)
{
    EXPECT_EQ(Gateway::HelloInterval(Gateway::Parse(R"({"op":10,"d":{"heartbeat_interval":41250}})")), 41250ms);
    EXPECT_FALSE(Gateway::HelloInterval(Gateway::Parse(R"({"op":10,"d":{}})")));
    EXPECT_FALSE(Gateway::HelloInterval(Gateway::Parse(R"({"op":10,"d":{"heartbeat_interval":0}})")));
    EXPECT_FALSE(Gateway::HelloInterval(Gateway::Parse(R"({"op":11,"d":{"heartbeat_interval":100}})")));
}

TEST(gateway_protocol, channel_update_matches_only_watched_id)
{
    auto d = boost::json::parse(R"({"id":"100","name":"open"})");

    EXPECT_EQ(Gateway::ChannelUpdateName(d, "100"), "open");
    EXPECT_FALSE(Gateway::ChannelUpdateName(d, "200"));
    EXPECT_FALSE(Gateway::ChannelUpdateName(boost::json::parse(R"({"id":"100"})"), "100"));
}

TEST(gateway_protocol, finds_channel_in_ready_and_guild_create)
{
    auto ready = boost::json::parse(R"({
        "session_id":"abc",
        "private_channels":[{"id":"1","name":null}],
        "guilds":[{"id":"9","channels":[{"id":"5","name":"lobby"},{"id":"100","name":"general"}]}]
    })");
    EXPECT_EQ(Gateway::FindChannelName(ready, "100"), "general");
    EXPECT_EQ(Gateway::SessionId(ready), "abc");
    EXPECT_FALSE(Gateway::FindChannelName(ready, "1"));
    EXPECT_FALSE(Gateway::FindChannelName(ready, "404"));

    auto guild = boost::json::parse(R"({"id":"9","channels":[{"id":"100","name":"general"}]})");
    EXPECT_EQ(Gateway::FindChannelName(guild, "100"), "general");
}

TEST(net_url, parses_gateway_and_api_urls)
{
    auto ws = Net::ParseUrl("wss://gateway.discord.gg/?v=9&encoding=json");
    EXPECT_EQ(ws.host, "gateway.discord.gg");
    EXPECT_EQ(ws.port, "443");
    EXPECT_EQ(ws.target, "/?v=9&encoding=json");

    auto api = Net::ParseUrl("https://localhost:8443/api/v9/channels/1");
    EXPECT_EQ(api.host, "localhost");
    EXPECT_EQ(api.port, "8443");
    EXPECT_EQ(api.target, "/api/v9/channels/1");

    EXPECT_EQ(Net::ParseUrl("wss://gateway.discord.gg?v=9").target, "/?v=9");
    EXPECT_THROW(Net::ParseUrl("http://discord.com/"), std::invalid_argument);
    EXPECT_THROW(Net::ParseUrl("discord.com"), std::invalid_argument);
}

TEST(rest_fetcher, parses_channel_body)
{
    EXPECT_EQ(RestChannelFetcher::ParseName(R"({"id":"1","name":"general"})"), "general");
    EXPECT_FALSE(RestChannelFetcher::ParseName(R"({"id":"1","type":1})"));
    EXPECT_THROW(RestChannelFetcher::ParseName("<html>"), FetchFailed);
}
