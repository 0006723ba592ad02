#include "core/session/DeviceQuery.hpp"

#include <limits>

namespace cctl {

QString identifierFor(const QString& name, const QString& host, const QString& uuid)
{
    if (!name.isEmpty()) return name;
    if (!host.isEmpty()) return host;
    if (!uuid.isEmpty()) return uuid;
    return QString::fromLatin1(NO_DEVICE);
}

int secondsToMs(double seconds)
{
    constexpr int maxMs = std::numeric_limits<int>::max();
    if (!(seconds > 0))
        return 0;
    const double ms = seconds * 1000.0;
    return ms >= static_cast<double>(maxMs) ? maxMs : static_cast<int>(ms);
}

QString DeviceQuery::identifier() const
{
    return identifierFor(name, host, uuid);
}

} // namespace cctl
