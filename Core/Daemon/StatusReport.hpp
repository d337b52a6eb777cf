#pragma once

// StatusReport.hpp: сводка по файлу лога для команды status.

#include <cstddef>
#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace Daemon
{
    struct LogSummary
    {
        std::optional<std::string> channel_name;  // последнее известное имя
        std::size_t name_changes      = 0;
        std::size_t poll_cycles       = 0;
        std::size_t heartbeat_acks    = 0;
        std::size_t connection_losses = 0;
        std::vector<std::string> tail;            // последние строки
    };

    LogSummary SummarizeLog(std::istream &in, std::size_t tail_lines = 5);

    // nullopt: файла лога нет.
    std::optional<LogSummary> SummarizeLogFile(const std::filesystem::path &path, std::size_t tail_lines = 5);
}
