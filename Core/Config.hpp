#pragma once

// Config.hpp: конфигурация монитора.
// Источники по возрастанию приоритета: значения по умолчанию, JSON-файл
// (--config), файл .env, переменные окружения. Ошибки: ConfigError.

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include <boost/json.hpp>

namespace Config
{
    // Доступ к полям JSON-объекта. Отсутствие/неверный тип: ConfigError.
    std::string  RequireString(const boost::json::object &o, const char *key);
    int          RequireInt(const boost::json::object &o, const char *key);
    bool         RequireBool(const boost::json::object &o, const char *key);

    std::optional<std::string>  OptionalString(const boost::json::object &o, const char *key);
    std::optional<std::int64_t> OptionalInt(const boost::json::object &o, const char *key);
    std::optional<double>       OptionalDouble(const boost::json::object &o, const char *key);

    struct Settings
    {
        std::string token;        // DISCORD_TOKEN
        std::string channel_id;   // CHANNEL_ID
        std::string sound_path;   // SOUND_PATH, по умолчанию boom.mp3 рядом с бинарником

        std::chrono::milliseconds poll_interval{1500};
        std::chrono::milliseconds heartbeat_default_interval{41250};
        std::chrono::milliseconds handshake_timeout{15000};
        std::chrono::milliseconds http_timeout{5000};

        std::chrono::milliseconds backoff_initial{1000};
        std::chrono::milliseconds backoff_ceiling{60000};
        double                    backoff_factor = 2.0;

        std::string gateway_url = "wss://gateway.discord.gg/?v=9&encoding=json";
        std::string api_base    = "https://discord.com/api/v9";
        std::string user_agent  = "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 "
                                  "(KHTML, like Gecko) Chrome/120.0.0.0 Safari/537.36";

        std::string log_dir = "logs";
    };

    // Поиск переменной окружения; подменяется в тестах.
    using EnvLookup = std::function<std::optional<std::string>(const std::string &)>;

    EnvLookup ProcessEnvironment();

    /**
     * @brief Загрузить .env (строки KEY=VALUE, # начинает комментарий, кавычки снимаются).
     *        Уже заданные переменные окружения не перетираются.
     * @return Число установленных переменных; 0, если файла нет.
     */
    std::size_t LoadDotEnv(const std::string &path);

    // Наложить поля JSON-документа на settings.
    void ApplyJson(Settings &settings, const std::string &json_text);

    void ApplyEnvironment(Settings &settings, const EnvLookup &env);

    void Validate(const Settings &settings);

    // Полная загрузка: .env, файл (если задан), окружение, проверка.
    Settings Load(const std::optional<std::string> &config_path);

    // boom.mp3 рядом с исполняемым файлом, двумя уровнями выше, иначе в CWD.
    std::string DefaultSoundPath();
}
