#include <ocast/Session/CastSession.hpp>
#include <ocast/Version.hpp>
#include <QDebug>
#include <QJsonDocument>
#include <QJsonObject>

namespace ocast {

CastSession::CastSession(ITransport* transport, const SessionConfig& config,
                         QObject* parent)
    : QObject(parent)
    , config_(config)
    , transport_(transport)
    , messenger_(new Messenger(transport, this))
    , heartbeat_(new HeartbeatController(this))
    , receiver_(new ReceiverController(this))
{
    messenger_->setTlsEnabled(config_.useTls);

    stateTimer_.setSingleShot(true);
    connect(&stateTimer_, &QTimer::timeout, this, &CastSession::onStateTimeout);
    connect(&pingTimer_, &QTimer::timeout, this, &CastSession::onPingTick);

    // Transport signals
    connect(transport_, &ITransport::connected,
            this, &CastSession::onTransportConnected);
    connect(transport_, &ITransport::disconnected,
            this, &CastSession::onTransportDisconnected);
    connect(transport_, &ITransport::error,
            this, &CastSession::onTransportError);

    // Messenger signals
    connect(messenger_, &Messenger::messageReceived,
            this, &CastSession::onMessage);
    connect(messenger_, &Messenger::handshakeComplete,
            this, &CastSession::onHandshakeComplete);
    connect(messenger_, &Messenger::handshakeFailed,
            this, &CastSession::onHandshakeFailed);

    connect(heartbeat_, &HeartbeatController::pongReceived,
            this, [this]() { missedPongs_ = 0; });
    connect(receiver_, &ReceiverController::statusChanged,
            this, &CastSession::onReceiverStatus);

    registerController(heartbeat_);
    registerController(receiver_);
}

CastSession::~CastSession()
{
    stop();
}

void CastSession::start()
{
    if (state_ != SessionState::Idle && state_ != SessionState::Disconnected)
        return;

    messenger_->setTlsEnabled(config_.useTls);
    messenger_->start();
    transport_->start();
    setState(SessionState::Connecting);
    startStateTimer(config_.connectTimeout);

    if (transport_->isConnected()) {
        // Already connected, advance immediately
        onTransportConnected();
    }
}

void CastSession::stop()
{
    if (state_ == SessionState::Disconnected || state_ == SessionState::Idle)
        return;

    if (state_ == SessionState::Connected) {
        qInfo() << "[CastSession] closing connection";
        for (const auto& dest : virtualConnections_) {
            messenger_->sendMessage(QString::fromLatin1(SENDER_ID), dest,
                                    QString::fromLatin1(ns::CONNECTION),
                                    QStringLiteral("{\"type\":\"CLOSE\"}"));
        }
    }

    disconnectWith(DisconnectReason::UserRequested);
}

void CastSession::setConfig(const SessionConfig& config)
{
    config_ = config;
}

void CastSession::registerController(BaseController* controller)
{
    const QString nameSpace = controller->nameSpace();
    controllers_[nameSpace] = controller;
    connect(controller, &QObject::destroyed, this, [this, nameSpace, controller]() {
        if (controllers_.value(nameSpace) == controller)
            controllers_.remove(nameSpace);
    });
    connect(controller, &BaseController::sendRequested,
            this, &CastSession::onControllerSend);
    if (controller != receiver_) {
        connect(controller, &BaseController::launchRequested,
                receiver_, &ReceiverController::launchApp);
    }

    // Late registration still learns which app is running
    if (receiver_->status().isValid())
        controller->onReceiverStatus(receiver_->status());
}

SessionState CastSession::state() const { return state_; }
Messenger* CastSession::messenger() const { return messenger_; }
ReceiverController* CastSession::receiver() const { return receiver_; }

void CastSession::setState(SessionState newState)
{
    if (state_ == newState) return;
    state_ = newState;
    qDebug() << "[CastSession] State:" << static_cast<int>(newState);
    emit stateChanged(newState);

    if (newState == SessionState::Disconnected) {
        stopStateTimer();
        pingTimer_.stop();
        messenger_->stop();
        virtualConnections_.clear();
        receiver_->clearStatus();
        for (auto* controller : controllers_)
            controller->reset();
    }
}

void CastSession::disconnectWith(DisconnectReason reason)
{
    if (state_ == SessionState::Disconnected) return;
    setState(SessionState::Disconnected);
    transport_->stop();
    emit disconnected(reason);
}

void CastSession::startStateTimer(int timeoutMs)
{
    stateTimer_.start(timeoutMs);
}

void CastSession::stopStateTimer()
{
    stateTimer_.stop();
}

void CastSession::onTransportConnected()
{
    if (state_ != SessionState::Connecting)
        return;

    qDebug() << "[CastSession] Transport connected, starting TLS";
    setState(SessionState::TlsHandshake);
    startStateTimer(config_.handshakeTimeout);
    messenger_->startHandshake();
}

void CastSession::onTransportDisconnected()
{
    disconnectWith(DisconnectReason::TransportError);
}

void CastSession::onTransportError(const QString& message)
{
    qWarning() << "[CastSession] Transport error:" << message;
    disconnectWith(DisconnectReason::TransportError);
}

void CastSession::onHandshakeComplete()
{
    if (state_ != SessionState::TlsHandshake) return;
    stopStateTimer();

    qDebug() << "[CastSession] Handshake complete, connecting to receiver";
    openVirtualConnection(QString::fromLatin1(RECEIVER_ID));
    setState(SessionState::Connected);

    missedPongs_ = 0;
    pingTimer_.start(config_.pingInterval);
    receiver_->getStatus();
    emit connected();
}

void CastSession::onHandshakeFailed()
{
    qWarning() << "[CastSession] TLS handshake failed";
    disconnectWith(DisconnectReason::HandshakeFailed);
}

void CastSession::onMessage(const QString& sourceId, const QString& destinationId,
                            const QString& nameSpace, const QString& payload)
{
    Q_UNUSED(destinationId)

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(payload.toUtf8(), &parseError);
    if (!doc.isObject()) {
        qWarning() << "[CastSession] bad payload on" << nameSpace << parseError.errorString();
        return;
    }
    QJsonObject message = doc.object();
    const QString type = message.value("type").toString();

    qDebug() << "[CastSession] RX" << nameSpace << type << "from" << sourceId;

    if (nameSpace == QLatin1String(ns::CONNECTION)) {
        if (type == QLatin1String("CLOSE")) {
            if (sourceId == QLatin1String(RECEIVER_ID)) {
                qInfo() << "[CastSession] receiver closed the connection";
                disconnectWith(DisconnectReason::Normal);
            } else {
                virtualConnections_.remove(sourceId);
            }
        }
        return;
    }

    auto it = controllers_.find(nameSpace);
    if (it == controllers_.end()) {
        qDebug() << "[CastSession] no controller for" << nameSpace;
        return;
    }

    if (!it.value()->receiveMessage(message))
        qDebug() << "[CastSession] unhandled" << nameSpace << type;
}

void CastSession::onControllerSend(const QString& nameSpace, const QString& destinationId,
                                   const QString& payload)
{
    if (state_ != SessionState::Connected) {
        qWarning() << "[CastSession] not connected, dropped message on" << nameSpace;
        return;
    }

    openVirtualConnection(destinationId);
    messenger_->sendMessage(QString::fromLatin1(SENDER_ID), destinationId, nameSpace, payload);
}

void CastSession::onReceiverStatus(const CastStatus& status)
{
    if (!status.transportId.isEmpty())
        openVirtualConnection(status.transportId);

    for (auto* controller : controllers_) {
        if (controller != receiver_ && controller != heartbeat_)
            controller->onReceiverStatus(status);
    }
}

void CastSession::onPingTick()
{
    if (state_ != SessionState::Connected) return;

    missedPongs_++;
    if (missedPongs_ > config_.maxMissedPongs) {
        qWarning() << "[CastSession] Heartbeat timeout, missed" << (missedPongs_ - 1) << "pongs";
        disconnectWith(DisconnectReason::PingTimeout);
        return;
    }

    heartbeat_->ping();
}

void CastSession::onStateTimeout()
{
    qWarning() << "[CastSession] State timeout in state" << static_cast<int>(state_);
    disconnectWith(DisconnectReason::Timeout);
}

void CastSession::openVirtualConnection(const QString& destinationId)
{
    if (virtualConnections_.contains(destinationId))
        return;

    virtualConnections_.insert(destinationId);
    messenger_->sendMessage(QString::fromLatin1(SENDER_ID), destinationId,
                            QString::fromLatin1(ns::CONNECTION),
                            QStringLiteral("{\"type\":\"CONNECT\",\"origin\":{}}"));
}

} // namespace ocast
