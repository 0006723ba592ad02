#pragma once
#include <cstdint>

namespace ocast {

constexpr uint16_t CAST_PORT = 8009;
constexpr uint16_t EUREKA_PORT = 8008;

// 4-byte big-endian length prefix ahead of every serialized CastMessage
constexpr int FRAME_HEADER_SIZE = 4;
constexpr uint32_t FRAME_MAX_PAYLOAD = 65536;

constexpr int BIO_BUFFER_SIZE = 20480;

constexpr char SENDER_ID[] = "sender-0";
constexpr char RECEIVER_ID[] = "receiver-0";

namespace ns {
constexpr char CONNECTION[] = "urn:x-cast:com.google.cast.tp.connection";
constexpr char HEARTBEAT[]  = "urn:x-cast:com.google.cast.tp.heartbeat";
constexpr char RECEIVER[]   = "urn:x-cast:com.google.cast.receiver";
constexpr char MEDIA[]      = "urn:x-cast:com.google.cast.media";
constexpr char YOUTUBE[]    = "urn:x-cast:com.google.youtube.mdx";
} // namespace ns

namespace app {
constexpr char DEFAULT_MEDIA_RECEIVER[] = "CC1AD845";
constexpr char YOUTUBE[] = "233637DE";
} // namespace app

} // namespace ocast
