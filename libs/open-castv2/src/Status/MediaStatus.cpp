#include <ocast/Status/MediaStatus.hpp>
#include <QDateTime>
#include <QJsonArray>

namespace ocast {

QString MediaStatus::thumbnail() const
{
    return images.isEmpty() ? QString() : images.first();
}

double MediaStatus::adjustedCurrentTime(qint64 nowMs) const
{
    if (!hasCurrentTime)
        return 0.0;
    if (!isPlaying())
        return currentTime;

    double elapsed = static_cast<double>(nowMs - lastUpdatedMs) / 1000.0;
    if (elapsed < 0.0) elapsed = 0.0;
    return currentTime + elapsed * playbackRate;
}

double MediaStatus::adjustedCurrentTime() const
{
    return adjustedCurrentTime(QDateTime::currentMSecsSinceEpoch());
}

MediaStatus MediaStatus::fromJson(const QJsonObject& status, const MediaStatus& previous,
                                  qint64 receivedMs)
{
    MediaStatus result;
    result.valid = true;
    result.lastUpdatedMs = receivedMs;

    result.mediaSessionId = status.value("mediaSessionId").toInt(previous.mediaSessionId);
    result.playerState = status.value("playerState").toString();
    result.idleReason = status.value("idleReason").toString();
    result.playbackRate = status.value("playbackRate").toDouble(1.0);
    result.supportedMediaCommands = status.value("supportedMediaCommands").toInt(0);

    QJsonValue time = status.value("currentTime");
    if (time.isDouble()) {
        result.hasCurrentTime = true;
        result.currentTime = time.toDouble();
    }

    QJsonObject volume = status.value("volume").toObject();
    result.volumeLevel = volume.value("level").toDouble(0.0);
    result.volumeMuted = volume.value("muted").toBool(false);

    if (!status.contains("media")) {
        // Partial update; the media block only arrives on change
        result.contentId = previous.contentId;
        result.contentType = previous.contentType;
        result.streamType = previous.streamType;
        result.duration = previous.duration;
        result.metadataType = previous.metadataType;
        result.title = previous.title;
        result.subtitle = previous.subtitle;
        result.artist = previous.artist;
        result.albumName = previous.albumName;
        result.albumArtist = previous.albumArtist;
        result.seriesTitle = previous.seriesTitle;
        result.trackNumber = previous.trackNumber;
        result.discNumber = previous.discNumber;
        result.images = previous.images;
        return result;
    }

    QJsonObject media = status.value("media").toObject();
    result.contentId = media.value("contentId").toString();
    result.contentType = media.value("contentType").toString();
    result.streamType = media.value("streamType").toString();
    result.duration = media.value("duration").toDouble(0.0);

    QJsonObject meta = media.value("metadata").toObject();
    int type = meta.value("metadataType").toInt(0);
    if (type < 0 || type > static_cast<int>(MetadataType::Photo))
        type = 0;
    result.metadataType = static_cast<MetadataType>(type);
    result.title = meta.value("title").toString();
    result.subtitle = meta.value("subtitle").toString();
    result.artist = meta.value("artist").toString();
    result.albumName = meta.value("albumName").toString();
    result.albumArtist = meta.value("albumArtist").toString();
    result.seriesTitle = meta.value("seriesTitle").toString();
    result.trackNumber = meta.value("trackNumber").toInt(0);
    result.discNumber = meta.value("discNumber").toInt(0);
    for (const auto& image : meta.value("images").toArray()) {
        QString url = image.toObject().value("url").toString();
        if (!url.isEmpty())
            result.images.append(url);
    }

    return result;
}

} // namespace ocast
