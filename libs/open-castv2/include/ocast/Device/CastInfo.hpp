#pragma once

#include <ocast/Version.hpp>

#include <QString>

namespace ocast {

struct CastInfo {
    QString uuid;
    QString friendlyName;
    QString host;
    quint16 port = CAST_PORT;
    QString modelName;

    bool isValid() const { return !host.isEmpty(); }
};

} // namespace ocast
