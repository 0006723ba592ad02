#pragma once

#include "core/Constants.hpp"
#include "core/session/DeviceQuery.hpp"

#include <QString>
#include <QStringList>

namespace cctl {

/// Arguments a background session was started with.
struct DaemonArgs {
    QString name;
    QString host;
    QString uuid;
    double wait = DEFAULT_WAIT;
    double retryWait = DEFAULT_RETRY_WAIT;
    bool lightIcon = false;
    QString logLevel = QString::fromLatin1(DEFAULT_LOG_LEVEL);

    /// False for a record that could not be loaded.
    bool valid = true;

    bool isValid() const { return valid; }
    QString identifier() const { return identifierFor(name, host, uuid); }
    DeviceQuery query() const;

    /// Command line that runs this session in the foreground.
    QStringList toArguments() const;
};

} // namespace cctl
