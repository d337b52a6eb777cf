#include "PidFile.hpp"

#include <signal.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace Daemon
{
    fs::path ExecutableDir()
    {
        std::error_code ec;
        fs::path exe = fs::read_symlink("/proc/self/exe", ec);
        if (ec || !exe.has_parent_path())
            return fs::current_path();
        return exe.parent_path();
    }

    PidFile::PidFile(fs::path path)
            : path_(std::move(path))
    {
    }

    PidFile PidFile::Default()
    {
        return PidFile(ExecutableDir() / "channelwatch.pid");
    }

    std::optional<pid_t> PidFile::Read() const
    {
        std::ifstream in(path_);
        if (!in) return std::nullopt;

        long pid = 0;
        if (!(in >> pid) || pid <= 0) return std::nullopt;
        return static_cast<pid_t>(pid);
    }

    void PidFile::Write(pid_t pid) const
    {
        std::ofstream out(path_, std::ios::trunc);
        if (!out)
            throw std::runtime_error("cannot open PID file " + path_.string() + ": " + std::strerror(errno));
        out << pid << '\n';
        out.flush();
        if (!out)
            throw std::runtime_error("cannot write PID file " + path_.string());
    }

    bool PidFile::Remove() const
    {
        std::error_code ec;
        return fs::remove(path_, ec);
    }

    OwnPidFileGuard::OwnPidFileGuard(PidFile file, pid_t self)
            : file_(std::move(file))
            , self_(self)
    {
    }

    OwnPidFileGuard::~OwnPidFileGuard()
    {
        // Чужой файл (уже перезапущенный демон) не трогаем.
        if (file_.Read() == self_) file_.Remove();
    }

    bool IsProcessRunning(pid_t pid)
    {
        if (pid <= 0) return false;
        if (::kill(pid, 0) == 0) return true;
        return errno == EPERM;  // жив, но чужой
    }

    std::optional<std::chrono::seconds> ProcessUptime(pid_t pid)
    {
        std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
        std::string line;
        if (!stat || !std::getline(stat, line)) return std::nullopt;

        // comm в скобках может содержать пробелы: поля считаем после ')'
        const std::size_t rparen = line.rfind(')');
        if (rparen == std::string::npos) return std::nullopt;

        std::istringstream fields(line.substr(rparen + 1));
        std::string field;
        unsigned long long starttime = 0;
        // после ')' идут поля с 3-го; starttime: 22-е
        for (int i = 3; i <= 22; ++i)
        {
            if (!(fields >> field)) return std::nullopt;
        }
        try
        {
            starttime = std::stoull(field);
        }
        catch (const std::exception &)
        {
            return std::nullopt;
        }

        std::ifstream up("/proc/uptime");
        double uptime_s = 0.0;
        if (!up || !(up >> uptime_s)) return std::nullopt;

        const long ticks = ::sysconf(_SC_CLK_TCK);
        if (ticks <= 0) return std::nullopt;

        const double started_s = static_cast<double>(starttime) / static_cast<double>(ticks);
        if (uptime_s < started_s) return std::chrono::seconds(0);
        return std::chrono::seconds(static_cast<long long>(uptime_s - started_s));
    }

    std::optional<long> ProcessRssKb(pid_t pid)
    {
        std::ifstream status("/proc/" + std::to_string(pid) + "/status");
        std::string line;
        while (std::getline(status, line))
        {
            if (line.rfind("VmRSS:", 0) != 0) continue;

            std::istringstream is(line.substr(6));
            long kb = 0;
            if (is >> kb) return kb;
            return std::nullopt;
        }
        return std::nullopt;
    }

    std::string FormatUptime(std::chrono::seconds s)
    {
        const long long total = s.count();
        std::ostringstream os;
        os << total / 3600 << "h " << (total % 3600) / 60 << "m " << total % 60 << "s";
        return os.str();
    }
}
