#pragma once

#include <ocast/Status/MediaStatus.hpp>
#include <QString>

namespace cctl {

struct Titles {
    QString title;
    QString artist;
    QString album;
};

/// Up to three non-empty strings, in order: media title, subtitle, artist,
/// album name, app display name. Missing sources are skipped.
Titles aggregateTitles(const QString& mediaTitle, const ocast::MediaStatus& status,
                       const QString& appName);

} // namespace cctl
