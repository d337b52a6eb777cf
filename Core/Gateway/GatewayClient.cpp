#include "Core/Gateway/GatewayClient.hpp"
#include "Core/Logger.hpp"

#include <algorithm>
#include <memory>
#include <random>

namespace
{
    // Закрывает транспорт при любом выходе из сеанса.
    class TransportGuard
    {
    public:
        explicit TransportGuard(GatewayTransport &t) : t_(t) {}
        ~TransportGuard() { t_.Close(); }

        TransportGuard(const TransportGuard&)            = delete;
        TransportGuard& operator=(const TransportGuard&) = delete;

    private:
        GatewayTransport &t_;
    };

    bool IsHandshakeRejectCode(int code)
    {
        return code == Gateway::kCloseAuthenticationFailed
            || code == Gateway::kCloseInvalidIntents
            || code == Gateway::kCloseDisallowedIntents;
    }

    std::chrono::milliseconds Until(Clock::time_point deadline, Clock::time_point now)
    {
        if (deadline <= now) return std::chrono::milliseconds(0);
        return std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    }
}

GatewayClient::GatewayClient(GatewayTransport &transport,
                             Clock            &clock,
                             const Params     &p,
                             ObservedFn        observed,
                             JitterFn          jitter)
        : transport_(transport)
        , clock_(clock)
        , p_(p)
        , observed_(std::move(observed))
        , jitter_(std::move(jitter))
{
    if (p_.channel_id.empty())
        throw std::invalid_argument("GatewayClient: channel_id is empty");
    if (p_.default_heartbeat.count() <= 0 || p_.handshake_timeout.count() <= 0 || p_.receive_slice.count() <= 0)
        throw std::invalid_argument("GatewayClient: timeouts must be positive");
    if (!jitter_)
        jitter_ = RandomJitter();
}

GatewayClient::JitterFn GatewayClient::RandomJitter()
{
    // Вызывается только из потока сеанса.
    struct Source
    {
        std::mt19937_64                        rng{std::random_device{}()};
        std::uniform_real_distribution<double> dist{0.0, 1.0};
    };
    auto src = std::make_shared<Source>();

    return [src]()
    {
        return src->dist(src->rng);
    };
}

void GatewayClient::Lose_(ConnectionLost::Reason reason, const std::string &detail) const
{
    const std::chrono::milliseconds interval =
            conn_.heartbeat.Armed() ? conn_.heartbeat.Interval() : std::chrono::milliseconds::zero();
    throw ConnectionLost(reason, detail, interval);
}

void GatewayClient::Run(std::stop_token st)
{
    conn_ = GatewayConnection{};

    LOGD("gateway") << "Connecting url=" << p_.url;
    try
    {
        transport_.Connect(p_.url, st);
    }
    catch (const TransportError &e)
    {
        Lose_(ConnectionLost::Reason::ConnectFailed, e.what());
    }

    TransportGuard guard(transport_);

    conn_.session_alive      = true;
    conn_.phase              = Phase::Identifying;
    conn_.handshake_deadline = clock_.Now() + p_.handshake_timeout;
    LOGI("gateway") << "Connection established";

    while (!st.stop_requested())
    {
        PumpHeartbeat_();

        if (conn_.phase == Phase::Identifying && clock_.Now() >= conn_.handshake_deadline)
        {
            Lose_(ConnectionLost::Reason::HandshakeTimeout,
                  conn_.heartbeat.Armed() ? "no READY within handshake window"
                                          : "no Hello within handshake window");
        }

        std::optional<std::string> frame;
        try
        {
            frame = transport_.Receive(ReceiveTimeout_());
        }
        catch (const TransportError &e)
        {
            const std::optional<int> code = e.CloseCode();
            if (conn_.phase == Phase::Identifying && code && IsHandshakeRejectCode(*code))
            {
                Lose_(ConnectionLost::Reason::HandshakeRejected, e.what());
            }
            Lose_(ConnectionLost::Reason::TransportClosed, e.what());
        }

        if (!frame) continue;

        Gateway::Message msg;
        try
        {
            msg = Gateway::Parse(*frame);
        }
        catch (const std::invalid_argument &e)
        {
            Lose_(ConnectionLost::Reason::ProtocolError, e.what());
        }

        Handle_(msg);
    }

    conn_.session_alive = false;
    conn_.heartbeat.Disarm();
    LOGI("gateway") << "Session stopped";
}

std::chrono::milliseconds GatewayClient::ReceiveTimeout_() const
{
    const Clock::time_point now = clock_.Now();
    std::chrono::milliseconds timeout = p_.receive_slice;

    if (conn_.heartbeat.Armed())
        timeout = std::min(timeout, Until(conn_.heartbeat.NextDeadline(), now));
    if (conn_.phase == Phase::Identifying)
        timeout = std::min(timeout, Until(conn_.handshake_deadline, now));

    return std::max(timeout, std::chrono::milliseconds(1));
}

void GatewayClient::PumpHeartbeat_()
{
    switch (conn_.heartbeat.Poll(clock_.Now()))
    {
        case HeartbeatScheduler::Action::None:
            return;
        case HeartbeatScheduler::Action::SendHeartbeat:
            SendHeartbeat_();
            return;
        case HeartbeatScheduler::Action::TimedOut:
            LOGW("heartbeat") << "Ack missing for a full interval=" << conn_.heartbeat.Interval().count() << "ms";
            Lose_(ConnectionLost::Reason::HeartbeatTimeout, "heartbeat ack timed out");
    }
}

void GatewayClient::Send_(const std::string &text, const char *what)
{
    try
    {
        transport_.Send(text);
    }
    catch (const TransportError &e)
    {
        Lose_(ConnectionLost::Reason::TransportClosed, std::string(what) + ": " + e.what());
    }
}

void GatewayClient::SendHeartbeat_()
{
    Send_(Gateway::BuildHeartbeat(conn_.last_sequence), "heartbeat");

    if (conn_.last_sequence)
        LOGD("heartbeat") << "Heartbeat sent seq=" << *conn_.last_sequence;
    else
        LOGD("heartbeat") << "Heartbeat sent seq=null";
}

void GatewayClient::Emit_(const std::string &name, const char *event)
{
    LOGD("gateway") << event << " name='" << name << "'";
    observed_(ObservedName{ name, Source::Push, clock_.Now() });
}

void GatewayClient::OnHello_(const Gateway::Message &msg)
{
    if (conn_.heartbeat.Armed())
    {
        LOGD("gateway") << "Repeated Hello ignored";
        return;
    }

    std::chrono::milliseconds interval = p_.default_heartbeat;
    if (std::optional<std::chrono::milliseconds> announced = Gateway::HelloInterval(msg))
    {
        interval = *announced;
    }
    else
    {
        LOGW("gateway") << "Hello without heartbeat_interval, default=" << interval.count() << "ms";
    }

    const double jitter = jitter_();
    conn_.heartbeat.Arm(clock_.Now(), interval, jitter);
    LOGI("heartbeat") << "Armed interval=" << interval.count() << "ms first_in="
                      << Until(conn_.heartbeat.NextDeadline(), clock_.Now()).count() << "ms";

    Send_(Gateway::BuildIdentify(p_.token, p_.properties), "identify");
    LOGD("gateway") << "Identify sent";
}

void GatewayClient::Handle_(const Gateway::Message &msg)
{
    if (msg.seq) conn_.last_sequence = msg.seq;

    switch (static_cast<Gateway::Opcode>(msg.op))
    {
        case Gateway::Opcode::Hello:
            OnHello_(msg);
            return;

        case Gateway::Opcode::HeartbeatAck:
            if (conn_.heartbeat.OnAck(clock_.Now()))
            {
                acks_.fetch_add(1, std::memory_order_relaxed);
                LOGI("heartbeat") << "Heartbeat acknowledged latency="
                                  << conn_.heartbeat.LastLatency().value_or(std::chrono::milliseconds(0)).count()
                                  << "ms";
            }
            else
            {
                LOGD("heartbeat") << "Unsolicited ack";
            }
            return;

        case Gateway::Opcode::Heartbeat:
            if (conn_.heartbeat.RequestImmediate(clock_.Now()))
            {
                LOGD("heartbeat") << "Heartbeat requested by remote";
                SendHeartbeat_();
            }
            else
            {
                LOGD("heartbeat") << "Heartbeat request skipped state=" << ToString(conn_.heartbeat.CurrentState());
            }
            return;

        case Gateway::Opcode::Reconnect:
            Lose_(ConnectionLost::Reason::ReconnectRequested, "remote requested reconnect");

        case Gateway::Opcode::InvalidSession:
            if (conn_.phase == Phase::Identifying)
                Lose_(ConnectionLost::Reason::HandshakeRejected, "invalid session during identify");
            Lose_(ConnectionLost::Reason::ReconnectRequested, "session invalidated");

        case Gateway::Opcode::Dispatch:
            HandleDispatch_(msg);
            return;

        case Gateway::Opcode::Identify:
            break;
    }

    LOGT("gateway") << "Ignored op=" << msg.op;
}

void GatewayClient::HandleDispatch_(const Gateway::Message &msg)
{
    if (!msg.type) return;
    const std::string &type = *msg.type;

    if (type == "READY")
    {
        conn_.phase = Phase::Dispatching;
        LOGI("gateway") << "Handshake accepted session=" << Gateway::SessionId(msg.data).value_or("?");

        if (std::optional<std::string> name = Gateway::FindChannelName(msg.data, p_.channel_id))
            Emit_(*name, "READY");
        else
            LOGD("gateway") << "Channel " << p_.channel_id << " not in READY payload";
        return;
    }

    if (type == "CHANNEL_UPDATE")
    {
        if (std::optional<std::string> name = Gateway::ChannelUpdateName(msg.data, p_.channel_id))
            Emit_(*name, "CHANNEL_UPDATE");
        return;
    }

    if (type == "GUILD_CREATE")
    {
        if (std::optional<std::string> name = Gateway::FindChannelName(msg.data, p_.channel_id))
            Emit_(*name, "GUILD_CREATE");
        return;
    }

    LOGT("gateway") << "Ignored dispatch t=" << type;
}
