#include "Core/Config.hpp"
#include "Core/Errors.hpp"
#include "Core/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace
{
    std::string Trim(const std::string &s)
    {
        size_t b = s.find_first_not_of(" \t\r\n");
        if (b == std::string::npos) return std::string();
        size_t e = s.find_last_not_of(" \t\r\n");
        return s.substr(b, e - b + 1);
    }

    std::int64_t ParseMillis(const std::string &name, const std::string &value)
    {
        std::int64_t out = 0;
        const char *first = value.data();
        const char *last  = value.data() + value.size();
        auto [ptr, ec] = std::from_chars(first, last, out);
        if (ec != std::errc() || ptr != last)
        {
            throw ConfigError(name + " must be an integer number of milliseconds, got '" + value + "'");
        }
        return out;
    }

    const boost::json::value *Field(const boost::json::object &o, const char *key)
    {
        const boost::json::value *v = o.if_contains(key);
        if (v == nullptr || v->is_null()) return nullptr;
        return v;
    }
}

namespace Config
{
    std::string RequireString(const boost::json::object &o, const char *key)
    {
        const boost::json::value *v = Field(o, key);
        if (v == nullptr)
            throw ConfigError(std::string("missing required field '") + key + "'");
        if (!v->is_string())
            throw ConfigError(std::string("field '") + key + "' must be a string");
        return boost::json::value_to<std::string>(*v);
    }

    int RequireInt(const boost::json::object &o, const char *key)
    {
        const boost::json::value *v = Field(o, key);
        if (v == nullptr)
            throw ConfigError(std::string("missing required field '") + key + "'");
        if (v->is_int64())  return static_cast<int>(v->as_int64());
        if (v->is_uint64()) return static_cast<int>(v->as_uint64());
        throw ConfigError(std::string("field '") + key + "' must be an integer");
    }

    bool RequireBool(const boost::json::object &o, const char *key)
    {
        const boost::json::value *v = Field(o, key);
        if (v == nullptr)
            throw ConfigError(std::string("missing required field '") + key + "'");
        if (!v->is_bool())
            throw ConfigError(std::string("field '") + key + "' must be a boolean");
        return v->as_bool();
    }

    std::optional<std::string> OptionalString(const boost::json::object &o, const char *key)
    {
        if (Field(o, key) == nullptr) return std::nullopt;
        return RequireString(o, key);
    }

    std::optional<std::int64_t> OptionalInt(const boost::json::object &o, const char *key)
    {
        const boost::json::value *v = Field(o, key);
        if (v == nullptr) return std::nullopt;
        if (v->is_int64())  return v->as_int64();
        if (v->is_uint64()) return static_cast<std::int64_t>(v->as_uint64());
        throw ConfigError(std::string("field '") + key + "' must be an integer");
    }

    std::optional<double> OptionalDouble(const boost::json::object &o, const char *key)
    {
        const boost::json::value *v = Field(o, key);
        if (v == nullptr) return std::nullopt;
        if (v->is_double()) return v->as_double();
        if (v->is_int64())  return static_cast<double>(v->as_int64());
        if (v->is_uint64()) return static_cast<double>(v->as_uint64());
        throw ConfigError(std::string("field '") + key + "' must be a number");
    }

    EnvLookup ProcessEnvironment()
    {
        return [](const std::string &name) -> std::optional<std::string>
        {
            const char *v = std::getenv(name.c_str());
            if (v == nullptr) return std::nullopt;
            return std::string(v);
        };
    }

    std::size_t LoadDotEnv(const std::string &path)
    {
        std::ifstream in(path);
        if (!in) return 0;

        std::size_t applied = 0;
        std::string line;
        while (std::getline(in, line))
        {
            line = Trim(line);
            if (line.empty() || line.front() == '#') continue;
            if (line.rfind("export ", 0) == 0) line = Trim(line.substr(7));

            const size_t eq = line.find('=');
            if (eq == std::string::npos || eq == 0) continue;

            std::string key   = Trim(line.substr(0, eq));
            std::string value = Trim(line.substr(eq + 1));
            if (value.size() >= 2 &&
                ((value.front() == '"' && value.back() == '"') ||
                 (value.front() == '\'' && value.back() == '\'')))
            {
                value = value.substr(1, value.size() - 2);
            }

            // overwrite=0: окружение процесса главнее .env
            if (::setenv(key.c_str(), value.c_str(), 0) == 0) ++applied;
        }
        return applied;
    }

    void ApplyJson(Settings &s, const std::string &json_text)
    {
        boost::system::error_code ec;
        boost::json::value jv = boost::json::parse(json_text, ec);
        if (ec)
            throw ConfigError("config is not valid JSON: " + ec.message());
        if (!jv.is_object())
            throw ConfigError("config root must be an object");

        const boost::json::object &o = jv.as_object();

        if (auto v = OptionalString(o, "token"))       s.token       = *v;
        if (auto v = OptionalString(o, "channel_id"))  s.channel_id  = *v;
        if (auto v = OptionalString(o, "sound_path"))  s.sound_path  = *v;
        if (auto v = OptionalString(o, "gateway_url")) s.gateway_url = *v;
        if (auto v = OptionalString(o, "api_base"))    s.api_base    = *v;
        if (auto v = OptionalString(o, "user_agent"))  s.user_agent  = *v;
        if (auto v = OptionalString(o, "log_dir"))     s.log_dir     = *v;

        if (auto v = OptionalInt(o, "poll_interval_ms"))     s.poll_interval              = std::chrono::milliseconds(*v);
        if (auto v = OptionalInt(o, "heartbeat_default_ms")) s.heartbeat_default_interval = std::chrono::milliseconds(*v);
        if (auto v = OptionalInt(o, "handshake_timeout_ms")) s.handshake_timeout          = std::chrono::milliseconds(*v);
        if (auto v = OptionalInt(o, "http_timeout_ms"))      s.http_timeout               = std::chrono::milliseconds(*v);

        // backoff: если блок есть, границы обязательны
        if (const boost::json::value *bv = Field(o, "backoff"))
        {
            if (!bv->is_object())
                throw ConfigError("field 'backoff' must be an object");
            const boost::json::object &b = bv->as_object();
            s.backoff_initial = std::chrono::milliseconds(RequireInt(b, "initial_ms"));
            s.backoff_ceiling = std::chrono::milliseconds(RequireInt(b, "ceiling_ms"));
            if (auto f = OptionalDouble(b, "factor")) s.backoff_factor = *f;
        }
    }

    void ApplyEnvironment(Settings &s, const EnvLookup &env)
    {
        if (auto v = env("DISCORD_TOKEN")) s.token      = Trim(*v);
        if (auto v = env("CHANNEL_ID"))    s.channel_id = Trim(*v);
        if (auto v = env("SOUND_PATH"))    s.sound_path = *v;
        if (auto v = env("LOG_DIR"))       s.log_dir    = *v;

        if (auto v = env("POLL_INTERVAL_MS"))
            s.poll_interval = std::chrono::milliseconds(ParseMillis("POLL_INTERVAL_MS", Trim(*v)));
        if (auto v = env("HEARTBEAT_DEFAULT_MS"))
            s.heartbeat_default_interval = std::chrono::milliseconds(ParseMillis("HEARTBEAT_DEFAULT_MS", Trim(*v)));
    }

    void Validate(const Settings &s)
    {
        if (s.token.empty())
            throw ConfigError("DISCORD_TOKEN is not set");
        if (s.channel_id.empty())
            throw ConfigError("CHANNEL_ID is not set");
        if (!std::all_of(s.channel_id.begin(), s.channel_id.end(),
                         [](unsigned char c) { return std::isdigit(c) != 0; }))
            throw ConfigError("CHANNEL_ID must be a numeric snowflake, got '" + s.channel_id + "'");

        if (s.poll_interval.count() <= 0)
            throw ConfigError("poll interval must be positive");
        if (s.heartbeat_default_interval.count() <= 0)
            throw ConfigError("default heartbeat interval must be positive");
        if (s.handshake_timeout.count() <= 0)
            throw ConfigError("handshake timeout must be positive");
        if (s.http_timeout.count() <= 0)
            throw ConfigError("http timeout must be positive");
        if (s.backoff_initial.count() <= 0)
            throw ConfigError("backoff initial delay must be positive");
        if (s.backoff_ceiling < s.backoff_initial)
            throw ConfigError("backoff ceiling must not be below the initial delay");
        if (s.backoff_factor < 1.0)
            throw ConfigError("backoff factor must be >= 1");
    }

    Settings Load(const std::optional<std::string> &config_path)
    {
        Settings s;
        s.sound_path = DefaultSoundPath();

        const std::size_t from_dotenv = LoadDotEnv(".env");

        if (config_path)
        {
            std::ifstream in(*config_path);
            if (!in)
                throw ConfigError("cannot open config file " + *config_path);
            std::ostringstream buf;
            buf << in.rdbuf();
            ApplyJson(s, buf.str());
        }

        ApplyEnvironment(s, ProcessEnvironment());
        Validate(s);

        LOGD("config") << "Loaded: file=" << (config_path ? *config_path : std::string("-"))
                       << " dotenv_vars=" << from_dotenv
                       << " channel=" << s.channel_id
                       << " poll_ms=" << s.poll_interval.count()
                       << " heartbeat_default_ms=" << s.heartbeat_default_interval.count()
                       << " sound=" << s.sound_path;
        return s;
    }

    std::string DefaultSoundPath()
    {
        std::error_code ec;
        const fs::path exe = fs::read_symlink("/proc/self/exe", ec);
        if (!ec)
        {
            const fs::path dir = exe.parent_path();
            if (fs::exists(dir / "boom.mp3", ec))
                return (dir / "boom.mp3").string();

            const fs::path up2 = dir.parent_path().parent_path();
            if (!up2.empty() && fs::exists(up2 / "boom.mp3", ec))
                return (up2 / "boom.mp3").string();
        }
        return "boom.mp3";
    }
}
