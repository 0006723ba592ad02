#pragma once

#include <ocast/Device/ICastDevice.hpp>
#include <ocast/Controller/MediaController.hpp>
#include <ocast/Session/CastSession.hpp>
#include <ocast/Transport/TCPTransport.hpp>

#include <QTimer>

namespace ocast {

class CastDevice : public ICastDevice {
    Q_OBJECT
public:
    explicit CastDevice(const CastInfo& info, QObject* parent = nullptr);
    ~CastDevice() override;

    static constexpr int RECONNECT_INTERVAL_MS = 5000;

    /// Open the session; emits connected() or connectFailed() within `timeoutMs`.
    void connectToDevice(int timeoutMs);
    void disconnectFromDevice();

    QString name() const override;
    CastInfo info() const override { return info_; }
    bool isConnected() const override;

    CastStatus status() const override;
    IMediaController* mediaController() const override { return media_; }

    void registerHandler(BaseController* controller) override;

    void quitApp() override;
    void volumeUp(double delta) override;
    void volumeDown(double delta) override;
    void setVolumeMuted(bool muted) override;

signals:
    void connected();
    void connectFailed(const QString& reason);

private:
    void openSession();
    void onSessionConnected();
    void onSessionDisconnected(DisconnectReason reason);
    void adjustVolume(double delta);

    CastInfo info_;
    TCPTransport* transport_;
    CastSession* session_;
    MediaController* media_;
    QTimer reconnectTimer_;
    int connectTimeoutMs_ = 10000;
    bool everConnected_ = false;
    bool userStopped_ = false;
};

} // namespace ocast
