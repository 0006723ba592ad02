#include <ocast/Controller/YouTubeController.hpp>
#include <QDebug>

namespace ocast {

YouTubeController::YouTubeController(IMediaController* media, QObject* parent)
    : BaseController(QString::fromLatin1(ns::YOUTUBE), QString::fromLatin1(app::YOUTUBE), parent)
    , media_(media)
{
    connect(this, &BaseController::activeChanged, this, &YouTubeController::onActiveChanged);
}

bool YouTubeController::receiveMessage(const QJsonObject& message)
{
    // mdxSessionStatus and friends carry nothing we track
    qDebug() << "[YouTube] message" << message.value("type").toString();
    return true;
}

void YouTubeController::playVideo(const QString& videoId)
{
    if (isActive()) {
        flingVideo(videoId);
        return;
    }
    pendingVideo_ = videoId;
    launch();
}

void YouTubeController::addToQueue(const QString& videoId)
{
    if (!media_) {
        qWarning() << "[YouTube] no media controller to queue" << videoId;
        return;
    }
    media_->queueInsert(videoId, QStringLiteral("x-youtube/video"));
}

void YouTubeController::onActiveChanged(bool active)
{
    if (active && !pendingVideo_.isEmpty()) {
        QString videoId = pendingVideo_;
        pendingVideo_.clear();
        flingVideo(videoId);
    }
}

void YouTubeController::flingVideo(const QString& videoId)
{
    qInfo() << "[YouTube] playing" << videoId;
    send(QJsonObject{
        {"type", "flingVideo"},
        {"data", QJsonObject{{"currentTime", 0}, {"videoId", videoId}}},
    });
}

} // namespace ocast
