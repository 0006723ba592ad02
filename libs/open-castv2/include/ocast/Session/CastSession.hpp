#pragma once

#include <QObject>
#include <QTimer>
#include <QHash>
#include <QSet>

#include <ocast/Transport/ITransport.hpp>
#include <ocast/Messenger/Messenger.hpp>
#include <ocast/Controller/BaseController.hpp>
#include <ocast/Controller/HeartbeatController.hpp>
#include <ocast/Controller/ReceiverController.hpp>
#include <ocast/Session/SessionState.hpp>
#include <ocast/Session/SessionConfig.hpp>

namespace ocast {

class CastSession : public QObject {
    Q_OBJECT
public:
    CastSession(ITransport* transport, const SessionConfig& config,
                QObject* parent = nullptr);
    ~CastSession() override;

    void start();
    void stop();

    /// Takes effect on the next start().
    void setConfig(const SessionConfig& config);

    /// Route a namespace to `controller` and carry its sends.
    void registerController(BaseController* controller);

    SessionState state() const;
    Messenger* messenger() const;
    ReceiverController* receiver() const;

signals:
    void stateChanged(ocast::SessionState newState);
    void connected();
    void disconnected(ocast::DisconnectReason reason);

private:
    void setState(SessionState newState);
    void disconnectWith(DisconnectReason reason);
    void startStateTimer(int timeoutMs);
    void stopStateTimer();

    void onTransportConnected();
    void onTransportDisconnected();
    void onTransportError(const QString& message);
    void onHandshakeComplete();
    void onHandshakeFailed();
    void onMessage(const QString& sourceId, const QString& destinationId,
                   const QString& nameSpace, const QString& payload);
    void onControllerSend(const QString& nameSpace, const QString& destinationId,
                          const QString& payload);
    void onReceiverStatus(const CastStatus& status);
    void onPingTick();
    void onStateTimeout();

    void openVirtualConnection(const QString& destinationId);

    SessionConfig config_;
    ITransport* transport_;
    Messenger* messenger_;
    HeartbeatController* heartbeat_;
    ReceiverController* receiver_;
    QHash<QString, BaseController*> controllers_;
    QSet<QString> virtualConnections_;
    SessionState state_ = SessionState::Idle;

    QTimer stateTimer_;
    QTimer pingTimer_;
    int missedPongs_ = 0;
};

} // namespace ocast
