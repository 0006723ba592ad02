#pragma once

#include "core/Constants.hpp"
#include <QString>

namespace cctl {

/// What to look for. Discovery precedence is host, uuid, name, then any device.
struct DeviceQuery {
    QString name;
    QString host;
    QString uuid;
    double retryWait = DEFAULT_RETRY_WAIT;

    bool hasIdentifiers() const { return !name.isEmpty() || !host.isEmpty() || !uuid.isEmpty(); }

    /// Label used in logs and session file names: name, host, uuid or "Device".
    QString identifier() const;
};

QString identifierFor(const QString& name, const QString& host, const QString& uuid);

/// Timer interval for a delay in seconds, clamped to what QTimer accepts.
int secondsToMs(double seconds);

} // namespace cctl
