#include "Core/Gateway/HeartbeatScheduler.hpp"

#include <algorithm>

void HeartbeatScheduler::Arm(Clock::time_point now, std::chrono::milliseconds interval, double jitter_fraction)
{
    jitter_fraction = std::clamp(jitter_fraction, 0.0, 1.0);

    interval_ = interval;
    deadline_ = now + std::chrono::duration_cast<std::chrono::milliseconds>(interval * jitter_fraction);
    state_    = State::Idle;
    last_latency_.reset();
}

void HeartbeatScheduler::Disarm()
{
    state_ = State::Disarmed;
}

HeartbeatScheduler::Action HeartbeatScheduler::Poll(Clock::time_point now)
{
    switch (state_)
    {
        case State::Disarmed:
            return Action::None;
        case State::TimedOut:
            return Action::TimedOut;
        case State::Idle:
        case State::AwaitingAck:
            break;
    }

    if (now < deadline_) return Action::None;

    if (state_ == State::AwaitingAck)
    {
        state_ = State::TimedOut;
        return Action::TimedOut;
    }

    state_   = State::AwaitingAck;
    sent_at_ = now;
    deadline_ += interval_;
    // Сильно опоздали (поток стоял): сетку не догоняем, считаем от текущего удара.
    if (deadline_ <= now) deadline_ = now + interval_;
    return Action::SendHeartbeat;
}

bool HeartbeatScheduler::RequestImmediate(Clock::time_point now)
{
    if (state_ != State::Idle) return false;

    state_    = State::AwaitingAck;
    sent_at_  = now;
    deadline_ = now + interval_;
    return true;
}

bool HeartbeatScheduler::OnAck(Clock::time_point now)
{
    if (state_ != State::AwaitingAck) return false;

    state_        = State::Idle;
    last_latency_ = std::chrono::duration_cast<std::chrono::milliseconds>(now - sent_at_);
    return true;
}

const char *ToString(HeartbeatScheduler::State state)
{
    switch (state)
    {
        case HeartbeatScheduler::State::Disarmed:    return "disarmed";
        case HeartbeatScheduler::State::Idle:        return "idle";
        case HeartbeatScheduler::State::AwaitingAck: return "awaiting_ack";
        case HeartbeatScheduler::State::TimedOut:    return "timed_out";
    }
    return "unknown";
}
