#pragma once

#include "core/adapter/DeviceAdapter.hpp"
#include "core/mpris/MprisServer.hpp"
#include "core/session/IDeviceLocator.hpp"

#include <QObject>
#include <QTimer>
#include <functional>

namespace cctl {

/// Locates the device, retrying every `wait` seconds, then binds it to a
/// published MPRIS server.
class RetryLoop : public QObject {
    Q_OBJECT
public:
    struct Options {
        DeviceQuery query;
        double wait = DEFAULT_WAIT;           // NO_WAIT: a single attempt
        DeviceAdapter::Options adapter;
    };

    using ServerFactory = std::function<MprisServer*(const QString& name, DeviceAdapter* adapter,
                                                     QObject* parent)>;

    RetryLoop(IDeviceLocator* locator, const Options& options, QObject* parent = nullptr);

    /// Replace how the MPRIS server is built (tests use a private bus).
    void setServerFactory(ServerFactory factory) { serverFactory_ = std::move(factory); }

    void start();

    QString identifier() const { return options_.query.identifier(); }
    int attempts() const { return attempts_; }
    bool isWaiting() const { return retryTimer_.isActive(); }
    int retryIntervalMs() const { return retryTimer_.interval(); }

    DeviceAdapter* adapter() const { return adapter_; }
    MprisServer* server() const { return server_; }

signals:
    void serverReady(cctl::MprisServer* server);
    void deviceNotFound(const QString& identifier);

private:
    void attempt();
    void onLocated(ocast::ICastDevice* device);
    void onNotFound();

    IDeviceLocator* locator_;
    Options options_;
    ServerFactory serverFactory_;
    QTimer retryTimer_;
    int attempts_ = 0;
    DeviceAdapter* adapter_ = nullptr;
    MprisServer* server_ = nullptr;
};

} // namespace cctl
