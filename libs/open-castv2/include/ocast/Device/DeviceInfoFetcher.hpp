#pragma once

#include <ocast/Device/CastInfo.hpp>

#include <QObject>
#include <QNetworkAccessManager>

namespace ocast {

/// Reads the receiver's setup endpoint to name a device known only by host.
class DeviceInfoFetcher : public QObject {
    Q_OBJECT
public:
    explicit DeviceInfoFetcher(QObject* parent = nullptr);

    static constexpr int TIMEOUT_MS = 2000;

    void fetch(const QString& host);

    /// Fill name and uuid of `info` from an eureka_info JSON body.
    static bool parseEurekaInfo(const QByteArray& body, CastInfo& info);

signals:
    /// Always emitted; `info` carries only the host when the lookup failed.
    void finished(const ocast::CastInfo& info);

private:
    QNetworkAccessManager network_;
};

} // namespace ocast
