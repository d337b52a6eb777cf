#pragma once

// Logger.hpp: логирование через Boost.Log.
// Консольный и файловый синк ставятся RAII-объектом Logger::Guard,
// записи пишутся макросами LOGT/LOGD/LOGI/LOGW/LOGE("канал") << ...

#include <memory>
#include <string>

#include <boost/log/trivial.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_channel_logger.hpp>

namespace Logger
{
    using Severity = boost::log::trivial::severity_level;
    using Source   = boost::log::sources::severity_channel_logger_mt<Severity, std::string>;

    struct Options
    {
        std::string app_name      = "ChannelWatch";
        std::string directory     = "logs";
        std::string base_filename = "channelwatch";

        Severity file_min_severity    = boost::log::trivial::info;
        Severity console_min_severity = boost::log::trivial::debug;

        bool console = true;  // в режиме демона консоль отключаем
        bool file    = true;
    };

    // Путь файла лога для заданных опций: <directory>/<base_filename>.log
    std::string FilePath(const Options &opts);

    // Общий потокобезопасный источник записей.
    Source &Get();

    class Guard
    {
    public:
        explicit Guard(const Options &opts);
        ~Guard();

        Guard(const Guard&)            = delete;
        Guard& operator=(const Guard&) = delete;

    private:
        struct Sinks;
        std::unique_ptr<Sinks> sinks_;
    };
}

#define CW_LOG_(sev, chan) BOOST_LOG_CHANNEL_SEV(::Logger::Get(), std::string(chan), ::boost::log::trivial::sev)

#define LOGT(chan) CW_LOG_(trace,   chan)
#define LOGD(chan) CW_LOG_(debug,   chan)
#define LOGI(chan) CW_LOG_(info,    chan)
#define LOGW(chan) CW_LOG_(warning, chan)
#define LOGE(chan) CW_LOG_(error,   chan)
