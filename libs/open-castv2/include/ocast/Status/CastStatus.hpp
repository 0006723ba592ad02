#pragma once

#include <QJsonObject>
#include <QString>
#include <QStringList>

namespace ocast {

/// Receiver-level state from RECEIVER_STATUS.
struct CastStatus {
    bool valid = false;

    double volumeLevel = 0.0;
    bool volumeMuted = false;

    // Running application, empty when the receiver is idle
    QString appId;
    QString displayName;
    QString iconUrl;
    QString sessionId;
    QString transportId;
    QString statusText;
    QStringList namespaces;

    bool isActiveInput = false;
    bool isStandBy = false;

    bool isValid() const { return valid; }

    /// Parses the `status` object of a RECEIVER_STATUS payload.
    static CastStatus fromJson(const QJsonObject& status);
};

} // namespace ocast
