#include "core/session/RetryLoop.hpp"
#include "core/session/StatusListener.hpp"

#include <boost/log/trivial.hpp>

namespace cctl {

RetryLoop::RetryLoop(IDeviceLocator* locator, const Options& options, QObject* parent)
    : QObject(parent)
    , locator_(locator)
    , options_(options)
{
    serverFactory_ = [](const QString& name, DeviceAdapter* adapter, QObject* owner) {
        return new MprisServer(name, adapter, owner);
    };

    retryTimer_.setSingleShot(true);
    connect(&retryTimer_, &QTimer::timeout, this, &RetryLoop::attempt);
    connect(locator_, &IDeviceLocator::located, this, &RetryLoop::onLocated);
    connect(locator_, &IDeviceLocator::notFound, this, &RetryLoop::onNotFound);
}

void RetryLoop::start()
{
    attempts_ = 0;
    attempt();
}

void RetryLoop::attempt()
{
    ++attempts_;
    BOOST_LOG_TRIVIAL(debug) << "[RetryLoop] looking for " << identifier().toStdString()
                             << " (attempt " << attempts_ << ")";
    locator_->locate(options_.query);
}

void RetryLoop::onLocated(ocast::ICastDevice* device)
{
    retryTimer_.stop();

    adapter_ = new DeviceAdapter(device, options_.adapter, this);
    server_ = serverFactory_(adapter_->name(), adapter_, this);

    if (!server_->publish())
        BOOST_LOG_TRIVIAL(warning) << "[RetryLoop] MPRIS server for " << adapter_->name().toStdString()
                                   << " is not on the bus";

    registerStatusListeners(device, adapter_, server_);
    emit serverReady(server_);
}

void RetryLoop::onNotFound()
{
    if (options_.wait < 0) {
        emit deviceNotFound(identifier());
        return;
    }

    BOOST_LOG_TRIVIAL(info) << identifier().toStdString() << " not found. Waiting "
                            << options_.wait << " seconds before retrying.";
    retryTimer_.start(secondsToMs(options_.wait));
}

} // namespace cctl
