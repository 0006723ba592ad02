#include "core/session/CastDeviceLocator.hpp"

#include <ocast/Discovery/ServiceBrowser.hpp>

#include <boost/log/trivial.hpp>

namespace cctl {

CastDeviceLocator::CastDeviceLocator(ICastNetwork* network, QObject* parent)
    : IDeviceLocator(parent)
    , network_(network)
{
    if (!network_->parent())
        network_->setParent(this);

    stepTimer_.setSingleShot(true);
    connect(&stepTimer_, &QTimer::timeout, this, &CastDeviceLocator::onStepTimeout);
    connect(network_, &ICastNetwork::deviceFound, this, &CastDeviceLocator::onDeviceFound);
    connect(network_, &ICastNetwork::hostInfo, this, &CastDeviceLocator::onHostInfo);
    connect(network_, &ICastNetwork::deviceConnected, this, &CastDeviceLocator::onConnected);
    connect(network_, &ICastNetwork::connectFailed, this, &CastDeviceLocator::onConnectFailed);
}

CastDeviceLocator::~CastDeviceLocator()
{
    network_->disconnect(this);
    network_->cancelConnect();
    network_->stopBrowsing();
}

void CastDeviceLocator::locate(const DeviceQuery& query)
{
    if (step_ != Step::Done) {
        BOOST_LOG_TRIVIAL(warning) << "[Locator] lookup already running";
        return;
    }

    query_ = query;
    for (Step s : {Step::Host, Step::Uuid, Step::Name, Step::Any}) {
        if (stepApplies(s)) {
            runStep(s);
            return;
        }
    }
}

bool CastDeviceLocator::stepApplies(Step step) const
{
    switch (step) {
    case Step::Host: return !query_.host.isEmpty();
    case Step::Uuid: return !query_.uuid.isEmpty();
    case Step::Name: return !query_.name.isEmpty();
    case Step::Any:  return !query_.hasIdentifiers();
    case Step::Done: return false;
    }
    return false;
}

int CastDeviceLocator::stepTimeoutMs(double retryWait)
{
    return secondsToMs(retryWait > 0 ? retryWait : DEFAULT_RETRY_WAIT);
}

void CastDeviceLocator::runStep(Step step)
{
    step_ = step;

    if (step == Step::Host) {
        BOOST_LOG_TRIVIAL(info) << "[Locator] connecting to host " << query_.host.toStdString();
        network_->fetchHostInfo(query_.host);
        return;
    }

    if (!network_->isBrowsing() && !network_->startBrowsing()) {
        BOOST_LOG_TRIVIAL(warning) << "[Locator] mDNS browsing unavailable";
        nextStep();
        return;
    }

    stepTimer_.start(stepTimeoutMs(query_.retryWait));

    // Devices seen during an earlier step of this lookup are still candidates
    for (const ocast::CastInfo& info : network_->knownDevices()) {
        if (matches(info)) {
            connectTo(info);
            return;
        }
    }
}

void CastDeviceLocator::nextStep()
{
    stepTimer_.stop();

    Step next = Step::Done;
    switch (step_) {
    case Step::Host: next = Step::Uuid; break;
    case Step::Uuid: next = Step::Name; break;
    default: break;
    }

    while (next != Step::Done && !stepApplies(next))
        next = (next == Step::Uuid) ? Step::Name : Step::Done;

    if (next == Step::Done) {
        finish(nullptr);
        return;
    }
    runStep(next);
}

bool CastDeviceLocator::matches(const ocast::CastInfo& info) const
{
    switch (step_) {
    case Step::Uuid:
        return ocast::ServiceBrowser::normalizeUuid(info.uuid)
            == ocast::ServiceBrowser::normalizeUuid(query_.uuid);
    case Step::Name:
        return info.friendlyName == query_.name;
    case Step::Any:
        return true;
    default:
        return false;
    }
}

void CastDeviceLocator::onHostInfo(const ocast::CastInfo& info)
{
    if (step_ != Step::Host)
        return;
    connectTo(info);
}

void CastDeviceLocator::onDeviceFound(const ocast::CastInfo& info)
{
    if (network_->isConnecting() || !stepTimer_.isActive() || !matches(info))
        return;
    connectTo(info);
}

void CastDeviceLocator::onConnected(ocast::ICastDevice* device)
{
    if (step_ == Step::Done) {
        delete device;
        return;
    }
    finish(device);
}

void CastDeviceLocator::onConnectFailed(const ocast::CastInfo& info, const QString& reason)
{
    if (step_ == Step::Done)
        return;
    BOOST_LOG_TRIVIAL(info) << "[Locator] " << info.host.toStdString()
                            << " unreachable: " << reason.toStdString();
    nextStep();
}

void CastDeviceLocator::onStepTimeout()
{
    if (network_->isConnecting())
        return;
    BOOST_LOG_TRIVIAL(debug) << "[Locator] no match within "
                             << stepTimeoutMs(query_.retryWait) << " ms";
    nextStep();
}

void CastDeviceLocator::connectTo(const ocast::CastInfo& info)
{
    stepTimer_.stop();
    network_->connectTo(info, stepTimeoutMs(query_.retryWait));
}

void CastDeviceLocator::finish(ocast::ICastDevice* device)
{
    step_ = Step::Done;
    stepTimer_.stop();
    network_->stopBrowsing();

    if (device) {
        BOOST_LOG_TRIVIAL(info) << "[Locator] found " << device->name().toStdString()
                                << " at " << device->info().host.toStdString();
        emit located(device);
    } else {
        emit notFound();
    }
}

} // namespace cctl
