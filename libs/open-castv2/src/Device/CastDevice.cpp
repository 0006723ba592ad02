#include <ocast/Device/CastDevice.hpp>
#include <QDebug>

namespace ocast {

CastDevice::CastDevice(const CastInfo& info, QObject* parent)
    : ICastDevice(parent)
    , info_(info)
    , transport_(new TCPTransport(this))
    , session_(new CastSession(transport_, SessionConfig{}, this))
    , media_(new MediaController(this))
{
    session_->registerController(media_);

    reconnectTimer_.setSingleShot(true);
    reconnectTimer_.setInterval(RECONNECT_INTERVAL_MS);
    connect(&reconnectTimer_, &QTimer::timeout, this, &CastDevice::openSession);

    connect(session_, &CastSession::connected,
            this, &CastDevice::onSessionConnected);
    connect(session_, &CastSession::disconnected,
            this, &CastDevice::onSessionDisconnected);
    connect(session_->receiver(), &ReceiverController::statusChanged,
            this, &ICastDevice::statusChanged);
    connect(media_, &MediaController::statusChanged,
            this, &ICastDevice::mediaStatusChanged);
}

CastDevice::~CastDevice()
{
    // Session holds a raw transport pointer; stop it while both are alive.
    // Nothing is reported to listeners from here on.
    userStopped_ = true;
    reconnectTimer_.stop();
    session_->disconnect(this);
    session_->stop();
}

void CastDevice::connectToDevice(int timeoutMs)
{
    connectTimeoutMs_ = timeoutMs;
    userStopped_ = false;
    openSession();
}

void CastDevice::disconnectFromDevice()
{
    userStopped_ = true;
    reconnectTimer_.stop();
    session_->stop();
}

QString CastDevice::name() const
{
    return info_.friendlyName;
}

bool CastDevice::isConnected() const
{
    return session_->state() == SessionState::Connected;
}

CastStatus CastDevice::status() const
{
    return session_->receiver()->status();
}

void CastDevice::registerHandler(BaseController* controller)
{
    session_->registerController(controller);
}

void CastDevice::quitApp()
{
    session_->receiver()->stopApp();
}

void CastDevice::volumeUp(double delta)
{
    adjustVolume(delta);
}

void CastDevice::volumeDown(double delta)
{
    adjustVolume(-delta);
}

void CastDevice::setVolumeMuted(bool muted)
{
    session_->receiver()->setVolumeMuted(muted);
}

void CastDevice::openSession()
{
    qInfo() << "[CastDevice] connecting to" << info_.friendlyName
            << info_.host << info_.port;

    SessionConfig config;
    config.connectTimeout = connectTimeoutMs_;
    config.handshakeTimeout = connectTimeoutMs_;
    session_->setConfig(config);

    session_->start();
    transport_->connectToHost(info_.host, info_.port);
}

void CastDevice::onSessionConnected()
{
    qInfo() << "[CastDevice] connected to" << info_.friendlyName;
    bool first = !everConnected_;
    everConnected_ = true;
    emit connectionChanged(true);
    if (first)
        emit connected();
}

void CastDevice::onSessionDisconnected(DisconnectReason reason)
{
    if (userStopped_) {
        if (everConnected_)
            emit connectionChanged(false);
        return;
    }

    if (!everConnected_) {
        qWarning() << "[CastDevice] could not connect to" << info_.host
                   << "reason:" << static_cast<int>(reason);
        emit connectFailed(QStringLiteral("connection to %1 failed").arg(info_.host));
        return;
    }

    emit connectionChanged(false);

    qWarning() << "[CastDevice] lost" << info_.friendlyName << "reason:"
               << static_cast<int>(reason) << "- reconnecting in"
               << RECONNECT_INTERVAL_MS / 1000 << "s";
    reconnectTimer_.start();
}

void CastDevice::adjustVolume(double delta)
{
    CastStatus current = status();
    if (!current.isValid()) {
        qWarning() << "[CastDevice] volume change without receiver status";
        return;
    }
    session_->receiver()->setVolume(qBound(0.0, current.volumeLevel + delta, 1.0));
}

} // namespace ocast
