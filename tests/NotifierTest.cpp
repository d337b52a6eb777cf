#include "Core/Watch/Notifier.hpp"
#include "Core/Errors.hpp"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "Core/Watch/ChangeDetector.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

using namespace std::chrono_literals;
using ::testing::ElementsAre;

namespace fs = std::filesystem;

namespace
{
    fs::path TempSound()
    {
        const fs::path p = fs::temp_directory_path() / "channelwatch_test_boom.mp3";
        std::ofstream(p) << "ID3";
        return p;
    }

    // notify-send, которому некому ответить: висит, пока не убьют.
    fs::path StuckNotifyCommand()
    {
        const fs::path p = fs::temp_directory_path() / "channelwatch_stuck_notify.sh";
        std::ofstream(p) << "#!/bin/sh\nexec sleep 30\n";
        fs::permissions(p, fs::perms::owner_all);
        return p;
    }
}

TEST(command_notifier, builds_commands)
{
    CommandNotifier::Params p;
    p.sound_path = "/opt/boom.mp3";
    CommandNotifier n(p);

    EXPECT_THAT(n.NotificationArgs("open"),
                ElementsAre("notify-send", "-u", "critical", "CHANNEL OPEN", "Channel is now: open"));
    EXPECT_THAT(n.SoundArgs(),
                ElementsAre("mpv", "--no-video", "--really-quiet", "/opt/boom.mp3"));
}

TEST(command_notifier, notification_exit_status_is_checked)
{
    CommandNotifier::Params p;
    p.play_sound     = false;
    p.notify_command = "true";
    EXPECT_NO_THROW(CommandNotifier(p).Notify("x"));

    p.notify_command = "false";
    EXPECT_THROW(CommandNotifier(p).Notify("x"), NotifyError);

    p.notify_command = "channelwatch-no-such-binary";
    EXPECT_THROW(CommandNotifier(p).Notify("x"), NotifyError);
}

TEST(command_notifier, missing_sound_file_is_notify_error)
{
    CommandNotifier::Params p;
    p.notify_command = "true";
    p.sound_path     = "/nonexistent/boom.mp3";
    CommandNotifier n(p);

    EXPECT_THROW(n.PlaySound(), NotifyError);
    EXPECT_THROW(n.Notify("x"), NotifyError);
}

TEST(command_notifier, player_runs_in_background_and_is_reaped)
{
    const fs::path sound = TempSound();

    CommandNotifier::Params p;
    p.notify_command = "true";
    p.player_command = "true";
    p.sound_path     = sound.string();
    CommandNotifier n(p);

    EXPECT_NO_THROW(n.Notify("x"));
    EXPECT_NO_THROW(n.PlaySound());
    n.WaitForSound();

    fs::remove(sound);
}

TEST(command_notifier, unreadable_sound_path_is_notify_error)
{
    CommandNotifier::Params p;
    p.notify_command = "true";
    p.sound_path     = "/tmp/" + std::string(300, 'x') + ".mp3";
    CommandNotifier n(p);

    EXPECT_THROW(n.PlaySound(), NotifyError);
    EXPECT_THROW(n.Notify("x"), NotifyError);
}

TEST(command_notifier, stuck_notification_does_not_hold_the_detector)
{
    const fs::path cmd = StuckNotifyCommand();

    CommandNotifier::Params p;
    p.notify_command = cmd.string();
    p.play_sound     = false;
    p.notify_wait    = 100ms;
    CommandNotifier n(p);

    ChangeDetector det(n);
    det.Apply(ObservedName{ "closed", Source::Push, Clock::time_point{} });

    const auto t0 = std::chrono::steady_clock::now();
    EXPECT_TRUE(det.Apply(ObservedName{ "open", Source::Push, Clock::time_point{} }));
    EXPECT_FALSE(det.Apply(ObservedName{ "open", Source::Poll, Clock::time_point{} }));
    EXPECT_TRUE(det.Apply(ObservedName{ "closed", Source::Poll, Clock::time_point{} }));
    EXPECT_LT(std::chrono::steady_clock::now() - t0, 2s);

    fs::remove(cmd);
}
