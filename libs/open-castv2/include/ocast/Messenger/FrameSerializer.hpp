#pragma once

#include <QByteArray>

namespace ocast {

class FrameSerializer {
public:
    /// Prefix a serialized CastMessage with its big-endian length.
    static QByteArray serialize(const QByteArray& message);
};

} // namespace ocast
