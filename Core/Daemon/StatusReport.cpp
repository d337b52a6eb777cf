#include "StatusReport.hpp"

#include <deque>
#include <fstream>

namespace
{
    // Значение в кавычках после маркера: marker + "value'".
    // Значение последнее в строке в кавычках, поэтому закрывающая кавычка
    // ищется с конца: апострофы внутри имени не обрезают его.
    std::optional<std::string> QuotedAfter(const std::string &line, const std::string &marker)
    {
        const std::size_t at = line.find(marker);
        if (at == std::string::npos) return std::nullopt;

        const std::size_t begin = at + marker.size();
        const std::size_t end   = line.rfind('\'');
        if (end == std::string::npos || end < begin) return std::nullopt;
        return line.substr(begin, end - begin);
    }

    bool Contains(const std::string &line, const char *needle)
    {
        return line.find(needle) != std::string::npos;
    }
}

namespace Daemon
{
    LogSummary SummarizeLog(std::istream &in, std::size_t tail_lines)
    {
        LogSummary              s;
        std::deque<std::string> tail;
        std::string             line;

        while (std::getline(in, line))
        {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (line.empty()) continue;

            if (Contains(line, "Name change detected"))
            {
                ++s.name_changes;
                if (auto name = QuotedAfter(line, "new='")) s.channel_name = std::move(name);
            }
            else if (Contains(line, "Current channel name:"))
            {
                if (auto name = QuotedAfter(line, "Current channel name: '")) s.channel_name = std::move(name);
            }

            if (Contains(line, "Poll cycle executed"))    ++s.poll_cycles;
            if (Contains(line, "Heartbeat acknowledged")) ++s.heartbeat_acks;
            if (Contains(line, "Connection lost reason=")) ++s.connection_losses;

            if (tail_lines > 0)
            {
                tail.push_back(line);
                if (tail.size() > tail_lines) tail.pop_front();
            }
        }

        s.tail.assign(tail.begin(), tail.end());
        return s;
    }

    std::optional<LogSummary> SummarizeLogFile(const std::filesystem::path &path, std::size_t tail_lines)
    {
        std::ifstream in(path);
        if (!in) return std::nullopt;
        return SummarizeLog(in, tail_lines);
    }
}
