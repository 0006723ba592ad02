#include "core/adapter/ContentIdentifier.hpp"

namespace cctl {

namespace {
const QString kLong = QStringLiteral("youtube.com/");
const QString kShort = QStringLiteral("youtu.be/");
const QString kWatchUrl = QStringLiteral("https://youtube.com/watch?v=");
}

bool isYouTube(const QString& uri)
{
    return uri.contains(kLong, Qt::CaseInsensitive)
        || uri.contains(kShort, Qt::CaseInsensitive);
}

QString youTubeVideoId(const QString& uri)
{
    if (!isYouTube(uri))
        return QString();

    QString videoId;
    if (uri.contains(kLong, Qt::CaseInsensitive)) {
        int pos = uri.indexOf(QStringLiteral("v="), 0, Qt::CaseInsensitive);
        if (pos < 0)
            return QString();
        videoId = uri.mid(pos + 2);
    } else {
        videoId = uri.mid(uri.lastIndexOf(QLatin1Char('/')) + 1);
    }

    int amp = videoId.indexOf(QLatin1Char('&'));
    if (amp >= 0)
        videoId.truncate(amp);
    int query = videoId.indexOf(QLatin1Char('?'));
    if (query >= 0)
        videoId.truncate(query);

    return videoId;
}

QString youTubeWatchUrl(const QString& videoId)
{
    return kWatchUrl + videoId;
}

} // namespace cctl
