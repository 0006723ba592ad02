#pragma once

#include <QString>

namespace cctl {

/// Case-insensitive match on youtube.com/ and youtu.be/ links.
bool isYouTube(const QString& uri);

/// Video id of a YouTube link, empty for anything else.
QString youTubeVideoId(const QString& uri);

QString youTubeWatchUrl(const QString& videoId);

} // namespace cctl
