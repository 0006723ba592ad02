#include <ocast/Controller/MediaController.hpp>
#include <QDateTime>
#include <QDebug>
#include <QJsonArray>

namespace ocast {

MediaController::MediaController(QObject* parent)
    : BaseController(QString::fromLatin1(ns::MEDIA), QString(), parent)
{
    connect(this, &BaseController::activeChanged, this, &MediaController::onActiveChanged);
}

bool MediaController::receiveMessage(const QJsonObject& message)
{
    const QString type = message.value("type").toString();

    if (type == QLatin1String("MEDIA_STATUS")) {
        QJsonArray entries = message.value("status").toArray();
        if (entries.isEmpty()) {
            status_ = MediaStatus();
        } else {
            status_ = MediaStatus::fromJson(entries.first().toObject(), status_,
                                            QDateTime::currentMSecsSinceEpoch());
        }
        qDebug() << "[Media] status state:" << status_.playerState
                 << "time:" << status_.currentTime << "title:" << status_.title;
        emit statusChanged(status_);
        return true;
    }

    if (type == QLatin1String("LOAD_FAILED") || type == QLatin1String("LOAD_CANCELLED")
        || type == QLatin1String("INVALID_REQUEST")) {
        qWarning() << "[Media]" << type << message.value("reason").toString();
        return true;
    }

    return false;
}

void MediaController::onReceiverStatus(const CastStatus& status)
{
    BaseController::onReceiverStatus(status);
    if (!isActive() && status_.isValid()) {
        status_ = MediaStatus();
        emit statusChanged(status_);
    }
}

void MediaController::updateStatus()
{
    send(QJsonObject{{"type", "GET_STATUS"}});
}

void MediaController::play()
{
    sendSessionCommand("PLAY");
}

void MediaController::pause()
{
    sendSessionCommand("PAUSE");
}

void MediaController::stop()
{
    sendSessionCommand("STOP");
}

void MediaController::seek(double seconds)
{
    sendSessionCommand("SEEK", QJsonObject{{"currentTime", seconds},
                                           {"resumeState", "PLAYBACK_START"}});
}

void MediaController::queueNext()
{
    sendSessionCommand("QUEUE_UPDATE", QJsonObject{{"jump", 1}});
}

void MediaController::queuePrev()
{
    sendSessionCommand("QUEUE_UPDATE", QJsonObject{{"jump", -1}});
}

void MediaController::playMedia(const QString& url, const QString& contentType)
{
    QJsonObject load{
        {"type", "LOAD"},
        {"media", mediaInfo(url, contentType)},
        {"autoplay", true},
        {"currentTime", 0},
    };

    if (isActive()) {
        send(load);
        return;
    }

    pendingLoad_ = load;
    emit launchRequested(QString::fromLatin1(app::DEFAULT_MEDIA_RECEIVER));
}

void MediaController::queueInsert(const QString& url, const QString& contentType)
{
    QJsonObject item{
        {"media", mediaInfo(url, contentType)},
        {"autoplay", true},
        {"startTime", 0},
        {"preloadTime", 0},
    };
    sendSessionCommand("QUEUE_INSERT", QJsonObject{{"items", QJsonArray{item}}});
}

QJsonObject MediaController::mediaInfo(const QString& url, const QString& contentType)
{
    return QJsonObject{
        {"contentId", url},
        {"contentType", contentType},
        {"streamType", "BUFFERED"},
    };
}

bool MediaController::sendSessionCommand(const QString& type, QJsonObject message)
{
    if (!status_.isValid()) {
        qWarning() << "[Media]" << type << "without a media session";
        return false;
    }
    message.insert("type", type);
    message.insert("mediaSessionId", status_.mediaSessionId);
    return send(message);
}

void MediaController::onActiveChanged(bool active)
{
    if (!active)
        return;

    if (!pendingLoad_.isEmpty()) {
        QJsonObject load = pendingLoad_;
        pendingLoad_ = QJsonObject();
        send(load);
    } else {
        updateStatus();
    }
}

} // namespace ocast
