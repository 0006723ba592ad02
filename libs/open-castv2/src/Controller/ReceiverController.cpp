#include <ocast/Controller/ReceiverController.hpp>
#include <QDebug>

namespace ocast {

ReceiverController::ReceiverController(QObject* parent)
    : BaseController(QString::fromLatin1(ns::RECEIVER), QString(), parent)
{
}

bool ReceiverController::receiveMessage(const QJsonObject& message)
{
    const QString type = message.value("type").toString();

    if (type == QLatin1String("RECEIVER_STATUS")) {
        status_ = CastStatus::fromJson(message.value("status").toObject());
        qDebug() << "[Receiver] status app:" << status_.appId
                 << "volume:" << status_.volumeLevel << "muted:" << status_.volumeMuted;
        emit statusChanged(status_);
        return true;
    }

    if (type == QLatin1String("LAUNCH_ERROR")) {
        QString reason = message.value("reason").toString();
        qWarning() << "[Receiver] launch failed:" << reason;
        emit launchFailed(reason);
        return true;
    }

    return false;
}

void ReceiverController::clearStatus()
{
    status_ = CastStatus();
}

void ReceiverController::getStatus()
{
    send(QJsonObject{{"type", "GET_STATUS"}});
}

void ReceiverController::launchApp(const QString& appId)
{
    qInfo() << "[Receiver] launching" << appId;
    send(QJsonObject{{"type", "LAUNCH"}, {"appId", appId}});
}

void ReceiverController::stopApp()
{
    if (status_.sessionId.isEmpty()) {
        qDebug() << "[Receiver] no app session to stop";
        return;
    }
    send(QJsonObject{{"type", "STOP"}, {"sessionId", status_.sessionId}});
}

void ReceiverController::setVolume(double level)
{
    level = qBound(0.0, level, 1.0);
    send(QJsonObject{{"type", "SET_VOLUME"}, {"volume", QJsonObject{{"level", level}}}});
}

void ReceiverController::setVolumeMuted(bool muted)
{
    send(QJsonObject{{"type", "SET_VOLUME"}, {"volume", QJsonObject{{"muted", muted}}}});
}

} // namespace ocast
