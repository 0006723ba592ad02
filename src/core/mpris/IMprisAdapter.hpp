#pragma once

#include "core/adapter/TrackMetadata.hpp"

#include <QString>
#include <QStringList>
#include <QVariant>

namespace cctl {

/// Everything the MPRIS server asks of a player. Times are microseconds.
class IMprisAdapter {
public:
    virtual ~IMprisAdapter() = default;

    // --- org.mpris.MediaPlayer2 ---
    virtual QString name() const = 0;
    virtual QString desktopEntry() = 0;
    virtual void quit() = 0;
    virtual QStringList supportedUriSchemes() const = 0;
    virtual QStringList supportedMimeTypes() const = 0;

    // --- org.mpris.MediaPlayer2.Player ---
    virtual QString playbackStatus() const = 0;
    virtual QString loopStatus() const = 0;
    virtual void setLoopStatus(const QString& status) = 0;
    virtual double rate() const = 0;
    virtual void setRate(double rate) = 0;
    virtual double minimumRate() const = 0;
    virtual double maximumRate() const = 0;
    virtual bool shuffle() const = 0;
    virtual void setShuffle(bool shuffle) = 0;
    virtual TrackMetadata metadata() = 0;

    /// Invalid when the volume is unknown.
    virtual QVariant volume() const = 0;
    virtual void setVolume(double volume) = 0;
    virtual bool isMuted() const = 0;
    virtual void setMuted(bool muted) = 0;
    virtual qint64 position() const = 0;

    virtual bool canGoNext() const = 0;
    virtual bool canGoPrevious() const = 0;
    virtual bool canPlay() const = 0;
    virtual bool canPause() const = 0;
    virtual bool canSeek() const = 0;
    virtual bool canControl() const = 0;
    virtual bool canQuit() const = 0;

    virtual void next() = 0;
    virtual void previous() = 0;
    virtual void pause() = 0;
    virtual void stop() = 0;
    virtual void play() = 0;
    virtual void resume() = 0;
    /// Absolute position.
    virtual void seek(qint64 position) = 0;
    virtual void openUri(const QString& uri) = 0;

    // --- org.mpris.MediaPlayer2.TrackList ---
    virtual void addTrack(const QString& uri, const QString& afterTrack, bool setAsCurrent) = 0;
    virtual QStringList tracks() = 0;
    virtual bool canEditTracks() const = 0;
};

} // namespace cctl
