#pragma once
// Notifier.hpp: Linux: тревога через внешние утилиты.
// 1) notify-send -u critical: ждём не дольше notify_wait, код возврата проверяем;
//    зависший (нет демона уведомлений) уходит в фон и добирается позже;
// 2) mpv со звуком в фоне; дочерние процессы добираем waitpid(WNOHANG).

#include "Core/Watch/NotificationSink.hpp"

#include <chrono>
#include <string>
#include <vector>

#include <sys/types.h>

class CommandNotifier final : public NotificationSink
{
public:
    struct Params
    {
        std::string sound_path;                     // пусто: без звука
        std::string notify_command = "notify-send";
        std::string player_command = "mpv";
        std::string title          = "CHANNEL OPEN";
        bool        play_sound     = true;

        // Сколько держать вызывающего в ожидании notify-send.
        std::chrono::milliseconds notify_wait{500};
    };

public:
    explicit CommandNotifier(const Params &p);
    ~CommandNotifier() override;

    CommandNotifier(const CommandNotifier&)            = delete;
    CommandNotifier& operator=(const CommandNotifier&) = delete;
    CommandNotifier(CommandNotifier&&)                 = delete;
    CommandNotifier& operator=(CommandNotifier&&)      = delete;

    // Уведомление + звук. Ошибка уведомления: NotifyError (звук всё равно пробуем).
    void Notify(const std::string &new_name) override;

    void SendNotification(const std::string &new_name);

    // Запустить плеер в фоне. Файла нет или spawn не удался: NotifyError.
    void PlaySound();

    // Дождаться окончания звука (для команды test).
    void WaitForSound();

    std::vector<std::string> NotificationArgs(const std::string &new_name) const;
    std::vector<std::string> SoundArgs() const;

private:
    static pid_t Spawn(const std::vector<std::string> &argv);
    void ReapPlayers_(bool block);
    void ReapNotifiers_(bool terminate);

private:
    Params             p_;
    std::vector<pid_t> players_;
    std::vector<pid_t> notifiers_;  // notify-send, не уложившиеся в notify_wait
};
