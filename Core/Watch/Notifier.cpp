#include "Notifier.hpp"
#include "Core/Errors.hpp"
#include "Core/Logger.hpp"

#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <thread>

extern char **environ;

namespace fs = std::filesystem;

namespace
{
    constexpr std::chrono::milliseconds kReapStep{10};

    // waitpid без блокировки. 0: ещё работает, иначе pid или -1.
    pid_t TryReap(pid_t pid, int &status)
    {
        while (true)
        {
            const pid_t rc = ::waitpid(pid, &status, WNOHANG);
            if (rc < 0 && errno == EINTR) continue;
            return rc;
        }
    }
}

CommandNotifier::CommandNotifier(const Params &p)
        : p_(p)
{
    if (p_.notify_command.empty())
        throw std::invalid_argument("CommandNotifier: notify_command is empty");
    if (p_.notify_wait.count() < 0)
        throw std::invalid_argument("CommandNotifier: notify_wait is negative");
}

CommandNotifier::~CommandNotifier()
{
    ReapNotifiers_(true);
    ReapPlayers_(true);
}

std::vector<std::string> CommandNotifier::NotificationArgs(const std::string &new_name) const
{
    return { p_.notify_command, "-u", "critical", p_.title, "Channel is now: " + new_name };
}

std::vector<std::string> CommandNotifier::SoundArgs() const
{
    return { p_.player_command, "--no-video", "--really-quiet", p_.sound_path };
}

pid_t CommandNotifier::Spawn(const std::vector<std::string> &argv)
{
    std::vector<char *> cargv;
    cargv.reserve(argv.size() + 1);
    for (const std::string &a : argv)
        cargv.push_back(const_cast<char *>(a.c_str()));
    cargv.push_back(nullptr);

    pid_t pid = -1;
    int rc = ::posix_spawnp(&pid, cargv[0], nullptr, nullptr, cargv.data(), environ);
    if (rc != 0)
        throw NotifyError("spawn " + argv[0] + ": " + std::strerror(rc));
    return pid;
}

void CommandNotifier::SendNotification(const std::string &new_name)
{
    ReapNotifiers_(false);

    const pid_t pid = Spawn(NotificationArgs(new_name));

    int status = 0;
    const auto deadline = std::chrono::steady_clock::now() + p_.notify_wait;
    while (true)
    {
        const pid_t rc = TryReap(pid, status);
        if (rc < 0)
            throw NotifyError(std::string("waitpid notify-send: ") + std::strerror(errno));
        if (rc == pid) break;

        if (std::chrono::steady_clock::now() >= deadline)
        {
            notifiers_.push_back(pid);
            LOGW("notifier") << p_.notify_command << " still running after "
                             << p_.notify_wait.count() << "ms, left in background pid=" << pid;
            return;
        }
        std::this_thread::sleep_for(kReapStep);
    }

    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0)
    {
        // posix_spawnp сообщает об отсутствии бинарника кодом 127 у потомка
        throw NotifyError(p_.notify_command + " failed status=" + std::to_string(status));
    }
    LOGD("notifier") << "Notification sent";
}

void CommandNotifier::PlaySound()
{
    ReapPlayers_(false);

    if (p_.sound_path.empty())
        throw NotifyError("sound path is not set");

    std::error_code ec;
    const bool found = fs::exists(p_.sound_path, ec);
    if (ec)
        throw NotifyError("sound file " + p_.sound_path + ": " + ec.message());
    if (!found)
        throw NotifyError("sound file not found: " + p_.sound_path);

    players_.push_back(Spawn(SoundArgs()));
    LOGD("notifier") << "Sound started pid=" << players_.back();
}

void CommandNotifier::WaitForSound()
{
    ReapPlayers_(true);
}

void CommandNotifier::Notify(const std::string &new_name)
{
    std::string failure;
    try
    {
        SendNotification(new_name);
    }
    catch (const NotifyError &e)
    {
        failure = e.what();
    }

    if (p_.play_sound)
    {
        try
        {
            PlaySound();
        }
        catch (const NotifyError &e)
        {
            if (!failure.empty()) failure += "; ";
            failure += e.what();
        }
    }

    if (!failure.empty())
        throw NotifyError(failure);
}

void CommandNotifier::ReapPlayers_(bool block)
{
    auto done = [block](pid_t pid)
    {
        int status = 0;
        while (true)
        {
            const pid_t rc = ::waitpid(pid, &status, block ? 0 : WNOHANG);
            if (rc == 0) return false;               // ещё играет
            if (rc < 0 && errno == EINTR) continue;
            return true;                             // завершён или уже не наш
        }
    };

    players_.erase(std::remove_if(players_.begin(), players_.end(), done), players_.end());
}

void CommandNotifier::ReapNotifiers_(bool terminate)
{
    auto done = [this, terminate](pid_t pid)
    {
        if (terminate) ::kill(pid, SIGTERM);

        int status = 0;
        pid_t rc = TryReap(pid, status);
        if (terminate)
        {
            while (rc == 0)
            {
                std::this_thread::sleep_for(kReapStep);
                rc = TryReap(pid, status);
            }
        }
        if (rc == 0) return false;

        if (rc == pid && !terminate && (!WIFEXITED(status) || WEXITSTATUS(status) != 0))
            LOGW("notifier") << p_.notify_command << " pid=" << pid << " finished late with status=" << status;
        return true;
    };

    notifiers_.erase(std::remove_if(notifiers_.begin(), notifiers_.end(), done), notifiers_.end());
}
