#include <ocast/Controller/HeartbeatController.hpp>

namespace ocast {

HeartbeatController::HeartbeatController(QObject* parent)
    : BaseController(QString::fromLatin1(ns::HEARTBEAT), QString(), parent)
{
}

bool HeartbeatController::receiveMessage(const QJsonObject& message)
{
    const QString type = message.value("type").toString();
    if (type == QLatin1String("PING")) {
        send(QJsonObject{{"type", "PONG"}});
        return true;
    }
    if (type == QLatin1String("PONG")) {
        emit pongReceived();
        return true;
    }
    return false;
}

void HeartbeatController::ping()
{
    send(QJsonObject{{"type", "PING"}});
}

} // namespace ocast
