#pragma once

#include <ocast/Controller/BaseController.hpp>
#include <ocast/Controller/IMediaController.hpp>
#include <ocast/Version.hpp>

namespace ocast {

/// Drives the YouTube receiver app by video id.
class YouTubeController : public BaseController {
    Q_OBJECT
public:
    explicit YouTubeController(IMediaController* media, QObject* parent = nullptr);

    bool receiveMessage(const QJsonObject& message) override;

    /// Plays now when the app runs, otherwise launches it and plays once active.
    void playVideo(const QString& videoId);
    void addToQueue(const QString& videoId);

private:
    void onActiveChanged(bool active);
    void flingVideo(const QString& videoId);

    IMediaController* media_;
    QString pendingVideo_;
};

} // namespace ocast
