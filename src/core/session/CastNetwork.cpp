#include "core/session/CastNetwork.hpp"

namespace cctl {

CastNetwork::CastNetwork(QObject* parent)
    : ICastNetwork(parent)
    , browser_(new ocast::ServiceBrowser(this))
    , fetcher_(new ocast::DeviceInfoFetcher(this))
{
    connect(browser_, &ocast::ServiceBrowser::deviceFound, this, &ICastNetwork::deviceFound);
    connect(fetcher_, &ocast::DeviceInfoFetcher::finished, this, &ICastNetwork::hostInfo);
}

CastNetwork::~CastNetwork()
{
    cancelConnect();
    browser_->stop();
}

bool CastNetwork::startBrowsing()
{
    return browser_->start();
}

void CastNetwork::stopBrowsing()
{
    browser_->stop();
}

bool CastNetwork::isBrowsing() const
{
    return browser_->isBrowsing();
}

QList<ocast::CastInfo> CastNetwork::knownDevices() const
{
    return browser_->devices();
}

void CastNetwork::fetchHostInfo(const QString& host)
{
    fetcher_->fetch(host);
}

void CastNetwork::connectTo(const ocast::CastInfo& info, int timeoutMs)
{
    cancelConnect();

    pending_ = new ocast::CastDevice(info);
    connect(pending_, &ocast::CastDevice::connected, this, [this]() {
        ocast::CastDevice* device = pending_;
        pending_ = nullptr;
        device->disconnect(this);
        emit deviceConnected(device);
    });
    connect(pending_, &ocast::CastDevice::connectFailed, this, [this](const QString& reason) {
        ocast::CastDevice* device = pending_;
        pending_ = nullptr;
        device->disconnect(this);
        device->deleteLater();
        emit connectFailed(device->info(), reason);
    });
    pending_->connectToDevice(timeoutMs);
}

void CastNetwork::cancelConnect()
{
    if (!pending_) return;
    pending_->disconnect(this);
    delete pending_;
    pending_ = nullptr;
}

} // namespace cctl
