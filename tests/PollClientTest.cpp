#include "Core/Watch/PollClient.hpp"
#include "tests/fakes/FakeClock.hpp"
#include "tests/fakes/FakeFetcher.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using Fakes::FakeFetcher;

TEST(poll_client, failures_do_not_shift_schedule)
{
    Fakes::FakeClock clock;
    FakeFetcher      fetcher(&clock, 120ms);
    fetcher.Push(FakeFetcher::Fail{503});
    fetcher.Push(FakeFetcher::Fail{0});
    fetcher.Push(FakeFetcher::Fail{502});
    fetcher.Push(std::string("general"));

    std::stop_source          stop;
    std::vector<ObservedName> seen;
    PollClient poll(fetcher, clock, 1500ms, [&](const ObservedName &e)
    {
        seen.push_back(e);
        stop.request_stop();
    });

    const Clock::time_point start = clock.Now();
    poll.Run(stop.get_token());

    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0].name, "general");
    EXPECT_EQ(seen[0].source, Source::Poll);
    // 4-й тик по исходной сетке плюс время самого запроса
    EXPECT_EQ(seen[0].observed_at, start + 4 * 1500ms + 120ms);
    EXPECT_EQ(fetcher.Calls(), 4);
    EXPECT_EQ(poll.Cycles(), 4u);
    EXPECT_EQ(poll.Failures(), 3u);

    const std::vector<Clock::duration> expected = { 1500ms, 1380ms, 1380ms, 1380ms };
    EXPECT_EQ(clock.Sleeps(), expected);
}

TEST(poll_client, unexpected_errors_do_not_end_the_loop)
{
    Fakes::FakeClock clock;
    FakeFetcher      fetcher;
    fetcher.Push(FakeFetcher::Crash{});
    fetcher.Push(std::string("name0"));
    fetcher.Push(std::string("name1"));

    std::stop_source         stop;
    std::vector<std::string> seen;
    PollClient poll(fetcher, clock, 20ms, [&](const ObservedName &e)
    {
        seen.push_back(e.name);
        if (seen.size() == 1) throw std::runtime_error("observer blew up");
        stop.request_stop();
    });

    EXPECT_NO_THROW(poll.Run(stop.get_token()));

    EXPECT_EQ(seen, (std::vector<std::string>{ "name0", "name1" }));
    EXPECT_EQ(poll.Cycles(), 3u);
    EXPECT_EQ(poll.Failures(), 2u);
}

TEST(poll_client, stop_cancels_fetch_in_flight)
{
    SteadyClock clock;
    FakeFetcher fetcher;
    fetcher.Push(FakeFetcher::Hang{});

    std::stop_source stop;
    PollClient poll(fetcher, clock, 10ms, [](const ObservedName &) {});

    std::jthread runner([&] { poll.Run(stop.get_token()); });
    while (fetcher.Hanging() == 0) std::this_thread::sleep_for(1ms);

    const auto t0 = std::chrono::steady_clock::now();
    stop.request_stop();
    runner.join();

    EXPECT_LT(std::chrono::steady_clock::now() - t0, 500ms);
    EXPECT_EQ(poll.Failures(), 0u);
}

TEST(poll_client, emits_every_tick_regardless_of_change)
{
    Fakes::FakeClock clock;
    FakeFetcher      fetcher;
    fetcher.Push(std::string("same"));

    std::stop_source stop;
    int              events = 0;
    PollClient poll(fetcher, clock, 1000ms, [&](const ObservedName &)
    {
        if (++events == 3) stop.request_stop();
    });

    poll.Run(stop.get_token());
    EXPECT_EQ(events, 3);
}

TEST(poll_client, nameless_channel_yields_no_event)
{
    Fakes::FakeClock clock;
    FakeFetcher      fetcher;
    fetcher.Push(FakeFetcher::NoName{});

    std::stop_source stop;
    int              events = 0;
    PollClient poll(fetcher, clock, 1000ms, [&](const ObservedName &) { ++events; });

    std::jthread stopper([&]
    {
        while (fetcher.Calls() < 3) std::this_thread::yield();
        stop.request_stop();
    });
    poll.Run(stop.get_token());
    stopper.join();

    EXPECT_EQ(events, 0);
    EXPECT_GE(poll.Cycles(), 3u);
}

TEST(poll_client, slow_fetch_skips_missed_ticks)
{
    Fakes::FakeClock clock;
    FakeFetcher      fetcher(&clock, 3500ms);
    fetcher.Push(std::string("x"));

    std::stop_source               stop;
    std::vector<Clock::time_point> calls;
    PollClient poll(fetcher, clock, 1000ms, [&](const ObservedName &e)
    {
        calls.push_back(e.observed_at);
        if (calls.size() == 2) stop.request_stop();
    });

    const Clock::time_point start = clock.Now();
    poll.Run(stop.get_token());

    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[0], start + 1000ms + 3500ms);
    // тики 2 и 3 пропущены, 4-й выполнен сразу с опозданием 500 мс
    EXPECT_EQ(calls[1], start + 4500ms + 3500ms);
}

TEST(poll_client, stop_before_first_tick)
{
    Fakes::FakeClock clock(false);
    FakeFetcher      fetcher;

    std::stop_source stop;
    PollClient poll(fetcher, clock, 1000ms, [](const ObservedName &) {});

    std::jthread runner([&] { poll.Run(stop.get_token()); });
    stop.request_stop();
    runner.join();

    EXPECT_EQ(fetcher.Calls(), 0);
}
