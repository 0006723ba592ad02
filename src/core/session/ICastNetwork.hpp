#pragma once

#include <ocast/Device/CastInfo.hpp>
#include <ocast/Device/ICastDevice.hpp>

#include <QList>
#include <QObject>

namespace cctl {

/// The network operations a device lookup needs: mDNS browsing, the
/// host info endpoint, and opening a session to a receiver.
class ICastNetwork : public QObject {
    Q_OBJECT
public:
    using QObject::QObject;
    ~ICastNetwork() override = default;

    /// False when browsing is unavailable.
    virtual bool startBrowsing() = 0;
    virtual void stopBrowsing() = 0;
    virtual bool isBrowsing() const = 0;
    virtual QList<ocast::CastInfo> knownDevices() const = 0;

    /// Answers with hostInfo(), which carries only the host on failure.
    virtual void fetchHostInfo(const QString& host) = 0;

    /// One connection attempt at a time; answers with deviceConnected() or
    /// connectFailed().
    virtual void connectTo(const ocast::CastInfo& info, int timeoutMs) = 0;
    virtual void cancelConnect() = 0;
    virtual bool isConnecting() const = 0;

signals:
    void deviceFound(const ocast::CastInfo& info);
    void hostInfo(const ocast::CastInfo& info);
    /// Ownership of `device` passes to the receiver.
    void deviceConnected(ocast::ICastDevice* device);
    void connectFailed(const ocast::CastInfo& info, const QString& reason);
};

} // namespace cctl
