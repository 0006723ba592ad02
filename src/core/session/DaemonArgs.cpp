#include "core/session/DaemonArgs.hpp"

namespace cctl {

DeviceQuery DaemonArgs::query() const
{
    DeviceQuery q;
    q.name = name;
    q.host = host;
    q.uuid = uuid;
    q.retryWait = retryWait;
    return q;
}

QStringList DaemonArgs::toArguments() const
{
    QStringList args{QStringLiteral("connect")};

    if (!name.isEmpty()) args << QStringLiteral("--name") << name;
    if (!host.isEmpty()) args << QStringLiteral("--host") << host;
    if (!uuid.isEmpty()) args << QStringLiteral("--uuid") << uuid;

    args << QStringLiteral("--retry-wait") << QString::number(retryWait);
    if (wait < 0)
        args << QStringLiteral("--no-wait");
    else
        args << QStringLiteral("--wait") << QString::number(wait);

    if (lightIcon)
        args << QStringLiteral("--icon");
    args << QStringLiteral("--log-level") << logLevel;
    return args;
}

} // namespace cctl
