#pragma once

// ChannelState.hpp: последнее известное имя канала и событие наблюдения.

#include "Core/Clock.hpp"

#include <string>

enum class Source
{
    Push,
    Poll,
};

inline const char *ToString(Source source)
{
    return source == Source::Push ? "push" : "poll";
}

struct ObservedName
{
    std::string       name;
    Source            source = Source::Poll;
    Clock::time_point observed_at{};
};

// Владелец: ChangeDetector; снаружи видна только копия (Snapshot).
struct ChannelState
{
    std::string       name;
    Clock::time_point last_updated{};
    bool              seeded = false;
};
