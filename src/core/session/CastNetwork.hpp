#pragma once

#include "core/session/ICastNetwork.hpp"

#include <ocast/Device/CastDevice.hpp>
#include <ocast/Device/DeviceInfoFetcher.hpp>
#include <ocast/Discovery/ServiceBrowser.hpp>

namespace cctl {

/// ICastNetwork over avahi, the eureka_info endpoint and CastDevice.
class CastNetwork : public ICastNetwork {
    Q_OBJECT
public:
    explicit CastNetwork(QObject* parent = nullptr);
    ~CastNetwork() override;

    bool startBrowsing() override;
    void stopBrowsing() override;
    bool isBrowsing() const override;
    QList<ocast::CastInfo> knownDevices() const override;

    void fetchHostInfo(const QString& host) override;

    void connectTo(const ocast::CastInfo& info, int timeoutMs) override;
    void cancelConnect() override;
    bool isConnecting() const override { return pending_ != nullptr; }

private:
    ocast::ServiceBrowser* browser_;
    ocast::DeviceInfoFetcher* fetcher_;
    ocast::CastDevice* pending_ = nullptr;
};

} // namespace cctl
