#include "core/adapter/TrackMetadata.hpp"

namespace cctl {

QString dbusSafeName(const QString& name, int maxLength)
{
    QString safe;
    safe.reserve(name.size());
    for (const QChar c : name) {
        const ushort u = c.unicode();
        const bool alnum = (u >= 'a' && u <= 'z') || (u >= 'A' && u <= 'Z') || (u >= '0' && u <= '9');
        safe.append(alnum ? c : QLatin1Char('_'));
    }
    safe.truncate(maxLength);
    return safe;
}

QString trackIdFor(const QString& title)
{
    if (title.isEmpty())
        return QString::fromLatin1(NO_TRACK);

    const QString prefix = QStringLiteral("/track/");
    return prefix + dbusSafeName(title, 255 - prefix.size());
}

} // namespace cctl
