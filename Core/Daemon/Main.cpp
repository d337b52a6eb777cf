// Main.cpp: channelwatch: монитор имени канала Discord.
// Команды: run [--daemon] [--config path], stop, status, test.
// Логирование через Boost.Log макросы LOG*.

#include "Core/Logger.hpp"
#include "Core/Config.hpp"
#include "Core/Clock.hpp"
#include "Core/Errors.hpp"
#include "Core/Net/HttpsClient.hpp"
#include "Core/Net/WebSocketTransport.hpp"
#include "Core/Watch/ChannelFetcher.hpp"
#include "Core/Watch/ChannelWatcher.hpp"
#include "Core/Watch/Notifier.hpp"
#include "PidFile.hpp"
#include "StatusReport.hpp"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <signal.h>
#include <spawn.h>
#include <unistd.h>

#include <boost/program_options.hpp>

extern char **environ;

namespace fs = std::filesystem;
namespace po = boost::program_options;

static volatile sig_atomic_t g_working = 1;

static void OnSignal(int)
{
    g_working = 0;
}

// Относительный каталог логов считаем от каталога бинарника:
// status и фоновый процесс должны видеть один и тот же файл.
static std::string ResolveLogDir(const std::string &dir)
{
    fs::path p(dir);
    if (p.is_relative()) p = Daemon::ExecutableDir() / p;
    return p.string();
}

static Logger::Options MakeLogOptions(const std::string &log_dir, bool detached)
{
    Logger::Options log_opts;
    log_opts.app_name             = "ChannelWatch";
    log_opts.directory            = ResolveLogDir(log_dir);
    log_opts.base_filename        = "channelwatch";
    log_opts.file_min_severity    = boost::log::trivial::info;
    log_opts.console_min_severity = boost::log::trivial::debug;
    log_opts.console              = !detached;
    return log_opts;
}

static void PrintConfigHelp(const ConfigError &e)
{
    std::cerr << "Configuration error: " << e.what() << "\n\n"
              << "Please set the following environment variables:\n"
              << "  DISCORD_TOKEN - Your Discord user token\n"
              << "  CHANNEL_ID    - The channel ID to monitor\n"
              << "  SOUND_PATH    - (optional) Path to alarm sound file\n";
}

static int RunMonitor(const Config::Settings &s, bool detached)
{
    Logger::Guard lg(MakeLogOptions(s.log_dir, detached));
    LOGI("main") << "Starting ChannelWatch channel=" << s.channel_id << " pid=" << ::getpid();
    LOGI("main") << "Sound path: " << s.sound_path;

    std::signal(SIGINT,  OnSignal);
    std::signal(SIGTERM, OnSignal);

    SteadyClock      clock;
    Net::HttpsClient http(s.http_timeout);

    RestChannelFetcher::Params fp;
    fp.api_base   = s.api_base;
    fp.token      = s.token;
    fp.channel_id = s.channel_id;
    fp.user_agent = s.user_agent;
    RestChannelFetcher fetcher(http, fp);

    WebSocketTransport transport(s.handshake_timeout, s.user_agent);

    CommandNotifier::Params np;
    np.sound_path = s.sound_path;
    CommandNotifier notifier(np);

    ChannelWatcher::Params wp;
    wp.gateway.url               = s.gateway_url;
    wp.gateway.token             = s.token;
    wp.gateway.channel_id        = s.channel_id;
    wp.gateway.default_heartbeat = s.heartbeat_default_interval;
    wp.gateway.handshake_timeout = s.handshake_timeout;
    wp.poll_interval             = s.poll_interval;
    wp.backoff.initial           = s.backoff_initial;
    wp.backoff.ceiling           = s.backoff_ceiling;
    wp.backoff.factor            = s.backoff_factor;

    ChannelWatcher watcher(wp, transport, fetcher, clock, notifier);
    try
    {
        watcher.FetchInitial();
    }
    catch (const ConfigError &e)
    {
        LOGE("main") << "Initial fetch: " << e.what();
        throw;
    }

    watcher.Start();

    while (g_working)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    LOGI("main") << "Stop requested";
    watcher.Stop();
    return 0;
}

static int CmdRun(const std::optional<std::string> &config_path, bool detached)
{
    if (detached)
    {
        // Свой PID-файл убираем при любом выходе, в том числе по ConfigError.
        const Daemon::OwnPidFileGuard own_pid(Daemon::PidFile::Default(), ::getpid());
        return RunMonitor(Config::Load(config_path), true);
    }

    const Config::Settings s = Config::Load(config_path);
    std::cout << "Starting channelwatch in foreground mode...\n"
              << "Channel ID: " << s.channel_id << "\n"
              << "Press Ctrl+C to stop.\n";
    return RunMonitor(s, false);
}

static int CmdDaemon(const std::optional<std::string> &config_path)
{
    const Daemon::PidFile pid_file = Daemon::PidFile::Default();
    if (std::optional<pid_t> pid = pid_file.Read(); pid && Daemon::IsProcessRunning(*pid))
    {
        std::cerr << "Error: daemon already running with PID " << *pid << "\n";
        return 1;
    }

    // Ошибки конфигурации показываем здесь, пока есть терминал.
    (void)Config::Load(config_path);

    std::error_code ec;
    fs::path exe = fs::read_symlink("/proc/self/exe", ec);
    if (ec) exe = "/proc/self/exe";

    std::vector<std::string> args = { exe.string(), "run", "--detached" };
    if (config_path)
    {
        args.emplace_back("--config");
        args.emplace_back(fs::absolute(*config_path).string());
    }
    std::vector<char *> argv;
    for (std::string &a : args) argv.push_back(a.data());
    argv.push_back(nullptr);

    posix_spawn_file_actions_t fa;
    posix_spawnattr_t          attr;
    posix_spawn_file_actions_init(&fa);
    posix_spawnattr_init(&attr);
    posix_spawn_file_actions_addopen(&fa, STDIN_FILENO,  "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_addopen(&fa, STDOUT_FILENO, "/dev/null", O_WRONLY, 0);
    posix_spawn_file_actions_addopen(&fa, STDERR_FILENO, "/dev/null", O_WRONLY, 0);
    posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETSID);

    pid_t child = -1;
    const int rc = ::posix_spawn(&child, argv[0], &fa, &attr, argv.data(), environ);

    posix_spawnattr_destroy(&attr);
    posix_spawn_file_actions_destroy(&fa);

    if (rc != 0)
    {
        std::cerr << "Error: failed to spawn daemon: " << std::strerror(rc) << "\n";
        return 1;
    }

    try
    {
        pid_file.Write(child);
    }
    catch (const std::runtime_error &e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        ::kill(child, SIGTERM);
        return 1;
    }

    std::cout << "Daemon started with PID " << child << "\n"
              << "PID file: " << pid_file.Path().string() << "\n";
    return 0;
}

static int CmdStop()
{
    const Daemon::PidFile pid_file = Daemon::PidFile::Default();
    const std::optional<pid_t> pid = pid_file.Read();
    if (!pid)
    {
        std::cerr << "Error: no PID file found. Is the daemon running?\n";
        return 1;
    }

    if (!Daemon::IsProcessRunning(*pid))
    {
        pid_file.Remove();
        std::cerr << "Error: process " << *pid << " is not running. Cleaned up stale PID file.\n";
        return 1;
    }

    if (::kill(*pid, SIGTERM) != 0)
    {
        std::cerr << "Error: failed to stop process " << *pid << ": " << std::strerror(errno) << "\n";
        return 1;
    }

    pid_file.Remove();
    std::cout << "Stopped daemon (PID " << *pid << ")\n";
    return 0;
}

static int CmdStatus()
{
    Config::LoadDotEnv(".env");
    const Config::EnvLookup env = Config::ProcessEnvironment();

    std::cout << "=== channelwatch status ===\n\n";

    const Daemon::PidFile pid_file = Daemon::PidFile::Default();
    if (std::optional<pid_t> pid = pid_file.Read())
    {
        if (Daemon::IsProcessRunning(*pid))
        {
            std::cout << "STATUS: running\n"
                      << "PID:    " << *pid << "\n";
            if (auto up = Daemon::ProcessUptime(*pid))
                std::cout << "UPTIME: " << Daemon::FormatUptime(*up) << "\n";
            if (auto rss = Daemon::ProcessRssKb(*pid))
                std::cout << "MEMORY: " << (*rss / 1024) << "." << (*rss % 1024) * 10 / 1024 << " MB\n";
        }
        else
        {
            std::cout << "STATUS: stopped (stale PID file)\n"
                      << "PID:    " << *pid << " (not running)\n\n"
                      << "Run 'channelwatch stop' to clean up the stale PID file.\n";
        }
    }
    else
    {
        std::cout << "STATUS: stopped\n"
                  << "PID:    -\n";
    }

    Logger::Options log_opts = MakeLogOptions(env("LOG_DIR").value_or("logs"), true);
    const std::string log_path = Logger::FilePath(log_opts);

    std::cout << "\n--- channel ---\n";
    const std::optional<Daemon::LogSummary> summary = Daemon::SummarizeLogFile(log_path);
    if (!summary)
    {
        std::cout << "No log file found at " << log_path << "\n";
        return 0;
    }

    std::cout << "CHANNEL:           " << summary->channel_name.value_or("-") << "\n"
              << "Name changes:      " << summary->name_changes << "\n"
              << "Poll cycles:       " << summary->poll_cycles << "\n"
              << "Heartbeat acks:    " << summary->heartbeat_acks << "\n"
              << "Connection losses: " << summary->connection_losses << "\n"
              << "\n--- last " << summary->tail.size() << " log entries ---\n";
    for (const std::string &line : summary->tail)
        std::cout << line << "\n";
    return 0;
}

static int CmdTest()
{
    Config::LoadDotEnv(".env");
    const Config::EnvLookup env = Config::ProcessEnvironment();

    CommandNotifier::Params np;
    np.sound_path = env("SOUND_PATH").value_or(Config::DefaultSoundPath());
    CommandNotifier notifier(np);

    std::cout << "Testing notification system...\n\n";

    std::cout << "Sending test notification...\n";
    try
    {
        notifier.SendNotification("TEST-CHANNEL");
        std::cout << "  Notification sent successfully\n";
    }
    catch (const NotifyError &e)
    {
        std::cerr << "  Failed to send notification: " << e.what() << "\n";
    }

    std::cout << "Playing test sound: " << np.sound_path << "\n";
    try
    {
        notifier.PlaySound();
        notifier.WaitForSound();
        std::cout << "  Sound played successfully\n";
    }
    catch (const NotifyError &e)
    {
        std::cerr << "  Failed to play sound: " << e.what() << "\n";
    }

    std::cout << "\nTest complete.\n";
    return 0;
}

int main(int argc, char **argv)
{
    po::options_description visible("Options");
    visible.add_options()
            ("help,h",   "show this help")
            ("daemon",   "run: detach into the background")
            ("config",   po::value<std::string>(), "JSON config file");

    po::options_description hidden;
    hidden.add_options()
            ("detached", "internal: this process is the daemon")
            ("command",  po::value<std::string>(), "run | stop | status | test");

    po::options_description all;
    all.add(visible).add(hidden);

    po::positional_options_description pos;
    pos.add("command", 1);

    po::variables_map vm;
    try
    {
        po::store(po::command_line_parser(argc, argv).options(all).positional(pos).run(), vm);
        po::notify(vm);
    }
    catch (const po::error &e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }

    if (vm.count("help") || !vm.count("command"))
    {
        std::cout << "Usage: channelwatch <run|stop|status|test> [options]\n" << visible;
        return vm.count("help") ? 0 : 2;
    }

    const std::string command = vm["command"].as<std::string>();
    std::optional<std::string> config_path;
    if (vm.count("config")) config_path = vm["config"].as<std::string>();

    try
    {
        if (command == "run")
        {
            if (vm.count("daemon")) return CmdDaemon(config_path);
            return CmdRun(config_path, vm.count("detached") > 0);
        }
        if (command == "stop")   return CmdStop();
        if (command == "status") return CmdStatus();
        if (command == "test")   return CmdTest();
    }
    catch (const ConfigError &e)
    {
        PrintConfigHelp(e);
        return 1;
    }
    catch (const std::exception &e)
    {
        std::cerr << "Fatal: " << e.what() << "\n";
        return 1;
    }

    std::cerr << "Unknown command: " << command << "\n";
    return 2;
}
