#pragma once

#include "core/Constants.hpp"
#include <QString>
#include <QStringList>

namespace cctl {

/// Fixed MPRIS metadata schema. A length of NO_DURATION and a track number
/// of 0 mean unknown.
struct TrackMetadata {
    QString trackId;
    qint64 length = NO_DURATION;
    QString artUrl;
    QString url;
    QString title;
    QStringList artists;
    QString album;
    QStringList albumArtists;
    int discNumber = DEFAULT_DISC_NO;
    int trackNumber = 0;
    QStringList comments;
};

/// Replace anything outside [A-Za-z0-9] with '_' and cap the length.
QString dbusSafeName(const QString& name, int maxLength = 255);

/// "/track/<safe title>", or the MPRIS NoTrack path for an empty title.
QString trackIdFor(const QString& title);

} // namespace cctl
