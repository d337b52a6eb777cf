#include "Core/Logger.hpp"

#include <filesystem>
#include <iostream>
#include <ios>

#include <boost/core/null_deleter.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>

namespace logging  = boost::log;
namespace sinks    = boost::log::sinks;
namespace expr     = boost::log::expressions;
namespace keywords = boost::log::keywords;

BOOST_LOG_ATTRIBUTE_KEYWORD(a_severity,  "Severity",  Logger::Severity)
BOOST_LOG_ATTRIBUTE_KEYWORD(a_channel,   "Channel",   std::string)
BOOST_LOG_ATTRIBUTE_KEYWORD(a_timestamp, "TimeStamp", boost::posix_time::ptime)

namespace
{
    using ConsoleSink = sinks::synchronous_sink<sinks::text_ostream_backend>;
    using FileSink    = sinks::synchronous_sink<sinks::text_file_backend>;

    // timestamp [severity] [channel] message
    auto MakeFormatter()
    {
        return expr::stream
               << expr::format_date_time(a_timestamp, "%Y-%m-%d %H:%M:%S.%f")
               << " [" << a_severity << "]"
               << " [" << a_channel << "] "
               << expr::smessage;
    }
}

namespace Logger
{
    struct Guard::Sinks
    {
        boost::shared_ptr<ConsoleSink> console;
        boost::shared_ptr<FileSink>    file;
    };

    std::string FilePath(const Options &opts)
    {
        return (std::filesystem::path(opts.directory) / (opts.base_filename + ".log")).string();
    }

    Source &Get()
    {
        static Source source;
        return source;
    }

    Guard::Guard(const Options &opts)
            : sinks_(std::make_unique<Sinks>())
    {
        logging::add_common_attributes();
        auto core = logging::core::get();

        if (opts.console)
        {
            auto backend = boost::make_shared<sinks::text_ostream_backend>();
            backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
            backend->auto_flush(true);

            sinks_->console = boost::make_shared<ConsoleSink>(backend);
            sinks_->console->set_formatter(MakeFormatter());
            sinks_->console->set_filter(a_severity >= opts.console_min_severity);
            core->add_sink(sinks_->console);
        }

        if (opts.file)
        {
            std::error_code ec;
            std::filesystem::create_directories(opts.directory, ec);
            if (ec)
            {
                std::cerr << "Logger: cannot create directory " << opts.directory
                          << ": " << ec.message() << "\n";
            }

            auto backend = boost::make_shared<sinks::text_file_backend>(
                    keywords::file_name = FilePath(opts),
                    keywords::open_mode = std::ios_base::out | std::ios_base::app);
            backend->auto_flush(true);

            sinks_->file = boost::make_shared<FileSink>(backend);
            sinks_->file->set_formatter(MakeFormatter());
            sinks_->file->set_filter(a_severity >= opts.file_min_severity);
            core->add_sink(sinks_->file);
        }

        LOGD("logger") << opts.app_name << " logging armed file="
                       << (opts.file ? FilePath(opts) : std::string("-"))
                       << " console=" << (opts.console ? "1" : "0");
    }

    Guard::~Guard()
    {
        auto core = logging::core::get();
        if (sinks_->file)
        {
            sinks_->file->flush();
            core->remove_sink(sinks_->file);
        }
        if (sinks_->console)
        {
            sinks_->console->flush();
            core->remove_sink(sinks_->console);
        }
    }
}
