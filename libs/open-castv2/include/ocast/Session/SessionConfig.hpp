#pragma once

namespace ocast {

struct SessionConfig {
    bool useTls = true;

    // Timeouts (ms)
    int connectTimeout = 10000;
    int handshakeTimeout = 10000;
    int pingInterval = 5000;

    // Heartbeats sent without a PONG before the link is considered dead
    int maxMissedPongs = 3;
};

} // namespace ocast
