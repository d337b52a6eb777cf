#include "Core/Config.hpp"
#include "Core/Errors.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>

using namespace std::chrono_literals;

namespace
{
    Config::EnvLookup FakeEnv(std::map<std::string, std::string> vars)
    {
        return [vars = std::move(vars)](const std::string &name) -> std::optional<std::string>
        {
            auto it = vars.find(name);
            if (it == vars.end()) return std::nullopt;
            return it->second;
        };
    }

    Config::Settings Valid()
    {
        Config::Settings s;
        s.token      = "token";
        s.channel_id = "1234567890";
        return s;
    }
}

TEST(config, defaults)
{
    Config::Settings s;
    EXPECT_EQ(s.poll_interval, 1500ms);
    EXPECT_EQ(s.heartbeat_default_interval, 41250ms);
    EXPECT_EQ(s.backoff_initial, 1000ms);
    EXPECT_EQ(s.backoff_ceiling, 60000ms);
    EXPECT_DOUBLE_EQ(s.backoff_factor, 2.0);
    EXPECT_EQ(s.gateway_url, "wss://gateway.discord.gg/?v=9&encoding=json");
}

TEST(config, json_overrides_defaults)
{
    Config::Settings s;
    Config::ApplyJson(s, R"({
        "token": "from-file",
        "channel_id": "42",
        "poll_interval_ms": 2500,
        "backoff": {"initial_ms": 500, "ceiling_ms": 30000, "factor": 1.5}
    })");

    EXPECT_EQ(s.token, "from-file");
    EXPECT_EQ(s.channel_id, "42");
    EXPECT_EQ(s.poll_interval, 2500ms);
    EXPECT_EQ(s.backoff_initial, 500ms);
    EXPECT_EQ(s.backoff_ceiling, 30000ms);
    EXPECT_DOUBLE_EQ(s.backoff_factor, 1.5);
    EXPECT_EQ(s.heartbeat_default_interval, 41250ms);
}

TEST(config, json_type_errors)
{
    Config::Settings s;
    EXPECT_THROW(Config::ApplyJson(s, "[]"), ConfigError);
    EXPECT_THROW(Config::ApplyJson(s, "{bad"), ConfigError);
    EXPECT_THROW(Config::ApplyJson(s, R"({"poll_interval_ms":"fast"})"), ConfigError);
    EXPECT_THROW(Config::ApplyJson(s, R"({"backoff":{"initial_ms":500}})"), ConfigError);
}

TEST(config, environment_wins_over_file)
{
    Config::Settings s;
    Config::ApplyJson(s, R"({"token":"file","channel_id":"1","poll_interval_ms":9000})");
    Config::ApplyEnvironment(s, FakeEnv({
        {"DISCORD_TOKEN", " env-token \n"},
        {"POLL_INTERVAL_MS", "750"},
        {"SOUND_PATH", "/tmp/alarm.mp3"},
    }));

    EXPECT_EQ(s.token, "env-token");
    EXPECT_EQ(s.channel_id, "1");
    EXPECT_EQ(s.poll_interval, 750ms);
    EXPECT_EQ(s.sound_path, "/tmp/alarm.mp3");
}

TEST(config, non_numeric_interval_is_rejected)
{
    Config::Settings s;
    EXPECT_THROW(Config::ApplyEnvironment(s, FakeEnv({{"HEARTBEAT_DEFAULT_MS", "41s"}})), ConfigError);
}

TEST(config, validation)
{
    EXPECT_NO_THROW(Config::Validate(Valid()));

    Config::Settings s = Valid();
    s.token.clear();
    EXPECT_THROW(Config::Validate(s), ConfigError);

    s = Valid();
    s.channel_id = "general";
    EXPECT_THROW(Config::Validate(s), ConfigError);

    s = Valid();
    s.poll_interval = 0ms;
    EXPECT_THROW(Config::Validate(s), ConfigError);

    s = Valid();
    s.backoff_ceiling = 10ms;
    EXPECT_THROW(Config::Validate(s), ConfigError);

    s = Valid();
    s.backoff_factor = 0.9;
    EXPECT_THROW(Config::Validate(s), ConfigError);
}

TEST(config, dotenv_does_not_override_process_environment)
{
    const std::filesystem::path path = std::filesystem::temp_directory_path() / "channelwatch_test.env";
    {
        std::ofstream out(path);
        out << "# comment\n"
            << "CW_TEST_DOTENV_NEW=\"quoted value\"\n"
            << "export CW_TEST_DOTENV_EXISTING=from-file\n"
            << "garbage line\n";
    }
    ::unsetenv("CW_TEST_DOTENV_NEW");
    ::setenv("CW_TEST_DOTENV_EXISTING", "from-env", 1);

    Config::LoadDotEnv(path.string());

    EXPECT_STREQ(std::getenv("CW_TEST_DOTENV_NEW"), "quoted value");
    EXPECT_STREQ(std::getenv("CW_TEST_DOTENV_EXISTING"), "from-env");
    EXPECT_EQ(Config::LoadDotEnv("/nonexistent/.env"), 0u);

    std::filesystem::remove(path);
}
