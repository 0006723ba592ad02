#include "core/adapter/Titles.hpp"
#include "core/Constants.hpp"
#include <QStringList>

namespace cctl {

Titles aggregateTitles(const QString& mediaTitle, const ocast::MediaStatus& status,
                       const QString& appName)
{
    QStringList found;
    auto add = [&found](const QString& s) {
        if (!s.isEmpty())
            found.append(s);
    };

    add(mediaTitle);
    if (status.isValid()) {
        add(status.subtitle);
        add(status.artist);
        add(status.albumName);
    }
    add(appName);

    found = found.mid(0, MAX_TITLES);

    Titles titles;
    titles.title = found.value(0);
    titles.artist = found.value(1);
    titles.album = found.value(2);
    return titles;
}

} // namespace cctl
