#pragma once

#include <ocast/Status/MediaStatus.hpp>

#include <QString>

namespace ocast {

class IMediaController {
public:
    virtual ~IMediaController() = default;

    /// Latest media status; invalid when no media session exists.
    virtual MediaStatus status() const = 0;

    virtual QString title() const = 0;
    virtual QString thumbnail() const = 0;
    virtual bool isPlaying() const = 0;
    virtual bool isPaused() const = 0;

    virtual void play() = 0;
    virtual void pause() = 0;
    virtual void stop() = 0;
    virtual void seek(double seconds) = 0;
    virtual void queueNext() = 0;
    virtual void queuePrev() = 0;

    /// Load `url` on the running media app, launching the default receiver if needed.
    virtual void playMedia(const QString& url, const QString& contentType) = 0;
    virtual void queueInsert(const QString& url, const QString& contentType) = 0;
};

} // namespace ocast
