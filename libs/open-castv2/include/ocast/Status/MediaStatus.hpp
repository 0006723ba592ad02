#pragma once

#include <QJsonObject>
#include <QString>
#include <QStringList>

namespace ocast {

namespace MediaCommand {
constexpr int Pause = 1;
constexpr int Seek = 2;
constexpr int StreamVolume = 4;
constexpr int StreamMute = 8;
constexpr int SkipForward = 16;
constexpr int SkipBackward = 32;
constexpr int QueueNext = 64;
constexpr int QueuePrev = 128;
} // namespace MediaCommand

enum class MetadataType {
    Generic = 0,
    Movie = 1,
    TvShow = 2,
    MusicTrack = 3,
    Photo = 4
};

/// Media session state from MEDIA_STATUS.
struct MediaStatus {
    bool valid = false;

    int mediaSessionId = 0;
    QString playerState;          // IDLE, BUFFERING, PLAYING, PAUSED
    QString idleReason;
    bool hasCurrentTime = false;
    double currentTime = 0.0;     // seconds
    qint64 lastUpdatedMs = 0;     // epoch ms at receipt
    double playbackRate = 1.0;
    int supportedMediaCommands = 0;

    double volumeLevel = 0.0;
    bool volumeMuted = false;

    QString contentId;
    QString contentType;
    QString streamType;
    double duration = 0.0;        // seconds, 0 when unknown

    MetadataType metadataType = MetadataType::Generic;
    QString title;
    QString subtitle;
    QString artist;
    QString albumName;
    QString albumArtist;
    QString seriesTitle;
    int trackNumber = 0;
    int discNumber = 0;
    QStringList images;

    bool isValid() const { return valid; }

    bool isPlaying() const { return playerState == QLatin1String("PLAYING"); }
    bool isPaused() const { return playerState == QLatin1String("PAUSED"); }
    bool isIdle() const { return playerState == QLatin1String("IDLE"); }

    bool supportsPause() const { return supportedMediaCommands & MediaCommand::Pause; }
    bool supportsSeek() const { return supportedMediaCommands & MediaCommand::Seek; }
    bool supportsQueueNext() const { return supportedMediaCommands & MediaCommand::QueueNext; }
    bool supportsQueuePrev() const { return supportedMediaCommands & MediaCommand::QueuePrev; }

    bool mediaIsMovie() const { return metadataType == MetadataType::Movie; }
    bool mediaIsTvShow() const { return metadataType == MetadataType::TvShow; }
    bool mediaIsMusicTrack() const { return metadataType == MetadataType::MusicTrack; }

    /// First image url, empty when none.
    QString thumbnail() const;

    /// currentTime extrapolated to `nowMs` while playing.
    double adjustedCurrentTime(qint64 nowMs) const;
    double adjustedCurrentTime() const;

    /// Parses one entry of the `status` array of a MEDIA_STATUS payload.
    /// `previous` supplies the media block when the update omits it.
    static MediaStatus fromJson(const QJsonObject& status, const MediaStatus& previous,
                                qint64 receivedMs);
};

} // namespace ocast
