#pragma once

namespace ocast {

enum class SessionState {
    Idle,
    Connecting,
    TlsHandshake,
    Connected,
    Disconnected
};

enum class DisconnectReason {
    Normal,
    PingTimeout,
    TransportError,
    HandshakeFailed,
    Timeout,
    UserRequested
};

} // namespace ocast
