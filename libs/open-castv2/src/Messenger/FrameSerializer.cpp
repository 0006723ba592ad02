#include <ocast/Messenger/FrameSerializer.hpp>
#include <ocast/Version.hpp>
#include <QtEndian>

namespace ocast {

QByteArray FrameSerializer::serialize(const QByteArray& message)
{
    QByteArray frame;
    frame.reserve(FRAME_HEADER_SIZE + message.size());

    uint32_t sizeBE = qToBigEndian(static_cast<uint32_t>(message.size()));
    frame.append(reinterpret_cast<const char*>(&sizeBE), FRAME_HEADER_SIZE);
    frame.append(message);
    return frame;
}

} // namespace ocast
