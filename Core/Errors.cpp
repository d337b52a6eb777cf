#include "Core/Errors.hpp"

const char *ToString(ConnectionLost::Reason reason)
{
    switch (reason)
    {
        case ConnectionLost::Reason::ConnectFailed:      return "connect_failed";
        case ConnectionLost::Reason::HandshakeRejected:  return "handshake_rejected";
        case ConnectionLost::Reason::HandshakeTimeout:   return "handshake_timeout";
        case ConnectionLost::Reason::TransportClosed:    return "transport_closed";
        case ConnectionLost::Reason::ProtocolError:      return "protocol_error";
        case ConnectionLost::Reason::HeartbeatTimeout:   return "heartbeat_timeout";
        case ConnectionLost::Reason::ReconnectRequested: return "reconnect_requested";
    }
    return "unknown";
}
