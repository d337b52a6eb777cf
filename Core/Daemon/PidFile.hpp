#pragma once

// PidFile.hpp: учёт фонового процесса: PID-файл и сведения из /proc.

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

#include <sys/types.h>

namespace Daemon
{
    // Каталог исполняемого файла (/proc/self/exe); при ошибке: текущий.
    std::filesystem::path ExecutableDir();

    class PidFile
    {
    public:
        explicit PidFile(std::filesystem::path path);

        // channelwatch.pid рядом с исполняемым файлом.
        static PidFile Default();

        const std::filesystem::path &Path() const { return path_; }

        // nullopt: файла нет или в нём не число.
        std::optional<pid_t> Read() const;

        // Ошибка записи: std::runtime_error.
        void Write(pid_t pid) const;

        // true, если файл был и удалён.
        bool Remove() const;

    private:
        std::filesystem::path path_;
    };

    // Снимает PID-файл при выходе из области, если в нём всё ещё наш PID.
    // Фоновый процесс держит его на всё время работы, включая выход по исключению.
    class OwnPidFileGuard
    {
    public:
        OwnPidFileGuard(PidFile file, pid_t self);
        ~OwnPidFileGuard();

        OwnPidFileGuard(const OwnPidFileGuard&)            = delete;
        OwnPidFileGuard& operator=(const OwnPidFileGuard&) = delete;

    private:
        PidFile file_;
        pid_t   self_;
    };

    bool IsProcessRunning(pid_t pid);

    // Время жизни процесса: starttime из /proc/<pid>/stat против /proc/uptime.
    std::optional<std::chrono::seconds> ProcessUptime(pid_t pid);

    // VmRSS из /proc/<pid>/status, КБ.
    std::optional<long> ProcessRssKb(pid_t pid);

    // "1h 2m 3s"
    std::string FormatUptime(std::chrono::seconds s);
}
