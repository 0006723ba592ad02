#include <ocast/Controller/BaseController.hpp>
#include <QDebug>
#include <QJsonDocument>

namespace ocast {

BaseController::BaseController(const QString& nameSpace, const QString& appId, QObject* parent)
    : QObject(parent)
    , nameSpace_(nameSpace)
    , appId_(appId)
{
}

BaseController::~BaseController() = default;

void BaseController::onReceiverStatus(const CastStatus& status)
{
    bool running = appId_.isEmpty()
        ? status.namespaces.contains(nameSpace_)
        : status.appId == appId_;

    setTransportId(running ? status.transportId : QString());
}

void BaseController::launch()
{
    if (appId_.isEmpty()) {
        qWarning() << "[Controller]" << nameSpace_ << "has no app to launch";
        return;
    }
    emit launchRequested(appId_);
}

void BaseController::reset()
{
    setTransportId(QString());
}

bool BaseController::send(QJsonObject message)
{
    return sendTo(nameSpace_, std::move(message));
}

bool BaseController::sendTo(const QString& nameSpace, QJsonObject message)
{
    QString dest = destination();
    if (dest.isEmpty()) {
        qWarning() << "[Controller]" << nameSpace << "not active, dropped"
                   << message.value("type").toString();
        return false;
    }

    if (!message.contains("requestId"))
        message.insert("requestId", ++requestId_);

    emit sendRequested(nameSpace, dest,
                       QString::fromUtf8(QJsonDocument(message).toJson(QJsonDocument::Compact)));
    return true;
}

void BaseController::setTransportId(const QString& transportId)
{
    if (transportId == transportId_)
        return;

    bool wasActive = isActive();
    transportId_ = transportId;
    if (wasActive != isActive())
        emit activeChanged(isActive());
}

} // namespace ocast
