#include <QtTest>
#include <QSignalSpy>
#include "FakeCastDevice.hpp"
#include "core/session/CastDeviceLocator.hpp"

#include <limits>
#include <memory>

using cctl::testing::FakeCastDevice;

namespace {

/// Network whose answers are scripted; every request is logged in order.
class FakeCastNetwork : public cctl::ICastNetwork {
    Q_OBJECT
public:
    using cctl::ICastNetwork::ICastNetwork;

    bool browseAvailable = true;
    QList<ocast::CastInfo> devices;
    QStringList reachableHosts;
    QStringList log;

    bool startBrowsing() override {
        log << "browse";
        browsing_ = browseAvailable;
        return browsing_;
    }
    void stopBrowsing() override { browsing_ = false; }
    bool isBrowsing() const override { return browsing_; }
    QList<ocast::CastInfo> knownDevices() const override { return devices; }

    void fetchHostInfo(const QString& host) override {
        log << "fetch " + host;
        ocast::CastInfo info;
        info.host = host;
        emit hostInfo(info);
    }

    void connectTo(const ocast::CastInfo& info, int timeoutMs) override {
        Q_UNUSED(timeoutMs)
        log << "connect " + info.host;
        if (reachableHosts.contains(info.host))
            emit deviceConnected(new FakeCastDevice(info.friendlyName));
        else
            emit connectFailed(info, "refused");
    }
    void cancelConnect() override {}
    bool isConnecting() const override { return false; }

    void announce(const ocast::CastInfo& info) {
        devices << info;
        emit deviceFound(info);
    }

private:
    bool browsing_ = false;
};

ocast::CastInfo device(const QString& name, const QString& host, const QString& uuid = QString())
{
    ocast::CastInfo info;
    info.friendlyName = name;
    info.host = host;
    info.uuid = uuid;
    return info;
}

} // namespace

class TestDeviceLocator : public QObject {
    Q_OBJECT
private:
    std::unique_ptr<ocast::ICastDevice> found_;

    void track(cctl::CastDeviceLocator& locator) {
        connect(&locator, &cctl::IDeviceLocator::located, this,
                [this](ocast::ICastDevice* d) { found_.reset(d); });
    }

private slots:
    void cleanup() { found_.reset(); }

    void testHostFailureFallsThroughToUuidThenName();
    void testNoIdentifiersTriesAnyDevice();
    void testAnySkippedWhenIdentified();
    void testUuidMatchIgnoresCaseAndDashes();
    void testDeviceFoundDuringStep();
    void testBrowsingUnavailable();
    void testStepTimeout();
};

void TestDeviceLocator::testHostFailureFallsThroughToUuidThenName()
{
    auto* network = new FakeCastNetwork;
    network->devices << device("Bedroom", "10.0.0.5", "01234567-89ab-cdef-0123-456789abcdef")
                     << device("Kitchen", "10.0.0.6");
    network->reachableHosts << "10.0.0.6";
    cctl::CastDeviceLocator locator(network);
    track(locator);
    QSignalSpy notFound(&locator, &cctl::IDeviceLocator::notFound);

    cctl::DeviceQuery query;
    query.host = "10.0.0.9";
    query.uuid = "01234567-89ab-cdef-0123-456789abcdef";
    query.name = "Kitchen";
    locator.locate(query);

    QCOMPARE(network->log, QStringList({"fetch 10.0.0.9", "connect 10.0.0.9", "browse",
                                        "connect 10.0.0.5", "connect 10.0.0.6"}));
    QVERIFY(found_);
    QCOMPARE(found_->name(), QString("Kitchen"));
    QCOMPARE(notFound.count(), 0);
    QVERIFY(!network->isBrowsing());
}

void TestDeviceLocator::testNoIdentifiersTriesAnyDevice()
{
    auto* network = new FakeCastNetwork;
    network->devices << device("Kitchen", "10.0.0.6");
    network->reachableHosts << "10.0.0.6";
    cctl::CastDeviceLocator locator(network);
    track(locator);

    locator.locate(cctl::DeviceQuery());

    QCOMPARE(network->log, QStringList({"browse", "connect 10.0.0.6"}));
    QVERIFY(found_);
    QCOMPARE(found_->name(), QString("Kitchen"));
}

void TestDeviceLocator::testAnySkippedWhenIdentified()
{
    auto* network = new FakeCastNetwork;
    network->devices << device("Kitchen", "10.0.0.6");
    network->reachableHosts << "10.0.0.6";
    cctl::CastDeviceLocator locator(network);
    track(locator);
    QSignalSpy notFound(&locator, &cctl::IDeviceLocator::notFound);

    cctl::DeviceQuery query;
    query.name = "Bedroom";
    query.retryWait = 0.02;
    locator.locate(query);

    QTRY_COMPARE(notFound.count(), 1);
    QVERIFY(!found_);
    QCOMPARE(network->log, QStringList({"browse"}));
}

void TestDeviceLocator::testUuidMatchIgnoresCaseAndDashes()
{
    auto* network = new FakeCastNetwork;
    network->devices << device("Kitchen", "10.0.0.6")
                     << device("Bedroom", "10.0.0.5", "01234567-89ab-cdef-0123-456789abcdef");
    network->reachableHosts << "10.0.0.5" << "10.0.0.6";
    cctl::CastDeviceLocator locator(network);
    track(locator);

    cctl::DeviceQuery query;
    query.uuid = "0123456789ABCDEF0123456789ABCDEF";
    locator.locate(query);

    QVERIFY(found_);
    QCOMPARE(found_->name(), QString("Bedroom"));
    QCOMPARE(network->log, QStringList({"browse", "connect 10.0.0.5"}));
}

void TestDeviceLocator::testDeviceFoundDuringStep()
{
    auto* network = new FakeCastNetwork;
    network->reachableHosts << "10.0.0.6";
    cctl::CastDeviceLocator locator(network);
    track(locator);

    cctl::DeviceQuery query;
    query.name = "Kitchen";
    query.retryWait = 10.0;
    locator.locate(query);
    QVERIFY(!found_);

    network->announce(device("Bedroom", "10.0.0.5"));
    QVERIFY(!found_);
    network->announce(device("Kitchen", "10.0.0.6"));

    QVERIFY(found_);
    QCOMPARE(found_->name(), QString("Kitchen"));
}

void TestDeviceLocator::testBrowsingUnavailable()
{
    auto* network = new FakeCastNetwork;
    network->browseAvailable = false;
    cctl::CastDeviceLocator locator(network);
    QSignalSpy notFound(&locator, &cctl::IDeviceLocator::notFound);

    cctl::DeviceQuery query;
    query.uuid = "abcd";
    query.name = "Kitchen";
    locator.locate(query);

    QCOMPARE(notFound.count(), 1);
    QCOMPARE(network->log, QStringList({"browse", "browse"}));
}

void TestDeviceLocator::testStepTimeout()
{
    QCOMPARE(cctl::CastDeviceLocator::stepTimeoutMs(2.0), 2000);
    QCOMPARE(cctl::CastDeviceLocator::stepTimeoutMs(0.0),
             static_cast<int>(cctl::DEFAULT_RETRY_WAIT * 1000));
    QCOMPARE(cctl::CastDeviceLocator::stepTimeoutMs(1e12), std::numeric_limits<int>::max());
}

QTEST_MAIN(TestDeviceLocator)
#include "test_device_locator.moc"
