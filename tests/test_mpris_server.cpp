#include <QtTest>
#include <QSignalSpy>
#include <QDBusObjectPath>
#include "FakeCastDevice.hpp"
#include "core/adapter/DeviceAdapter.hpp"
#include "core/mpris/MprisAdaptors.hpp"
#include "core/mpris/MprisServer.hpp"

using cctl::testing::FakeCastDevice;

class TestMprisServer : public QObject {
    Q_OBJECT
private:
    static cctl::DeviceAdapter::Options options() {
        cctl::DeviceAdapter::Options opts;
        opts.assetDir = "/opt/assets";
        return opts;
    }

    static QDBusConnection noBus() {
        return QDBusConnection(QStringLiteral("cctl-test-unconnected"));
    }

private slots:
    void testServiceName();
    void testMetadataMap();
    void testMetadataMapOmitsUnknowns();
    void testPlayerProperties();
    void testPublishWithoutBus();
    void testAdaptorsAttached();
    void testRelativeSeek();
    void testSetPositionChecksTrack();
    void testPlayPause();
};

void TestMprisServer::testServiceName()
{
    QCOMPARE(cctl::MprisServer::serviceNameFor("Living Room TV"),
             QString("org.mpris.MediaPlayer2.cast_control_Living_Room_TV"));
    QVERIFY(cctl::MprisServer::serviceNameFor(QString(300, QChar('x'))).size() <= 255);
}

void TestMprisServer::testMetadataMap()
{
    cctl::TrackMetadata m;
    m.trackId = "/track/Song";
    m.length = 5 * cctl::US_IN_SEC;
    m.artUrl = "http://host/cover.jpg";
    m.url = "http://host/song.mp3";
    m.title = "Song";
    m.artists = QStringList{"Band"};
    m.album = "Album";
    m.albumArtists = m.artists;
    m.trackNumber = 7;

    QVariantMap map = cctl::MprisServer::metadataToVariantMap(m);
    QCOMPARE(map.value("mpris:trackid").value<QDBusObjectPath>().path(), QString("/track/Song"));
    QCOMPARE(map.value("mpris:length").toLongLong(), 5 * cctl::US_IN_SEC);
    QCOMPARE(map.value("mpris:artUrl").toString(), QString("http://host/cover.jpg"));
    QCOMPARE(map.value("xesam:url").toString(), QString("http://host/song.mp3"));
    QCOMPARE(map.value("xesam:title").toString(), QString("Song"));
    QCOMPARE(map.value("xesam:artist").toStringList(), QStringList{"Band"});
    QCOMPARE(map.value("xesam:albumArtist").toStringList(), QStringList{"Band"});
    QCOMPARE(map.value("xesam:album").toString(), QString("Album"));
    QCOMPARE(map.value("xesam:discNumber").toInt(), cctl::DEFAULT_DISC_NO);
    QCOMPARE(map.value("xesam:trackNumber").toInt(), 7);
    QVERIFY(map.value("xesam:comment").toStringList().isEmpty());
}

void TestMprisServer::testMetadataMapOmitsUnknowns()
{
    cctl::TrackMetadata m;
    QVariantMap map = cctl::MprisServer::metadataToVariantMap(m);

    QVERIFY(!map.contains("mpris:length"));
    QVERIFY(!map.contains("xesam:trackNumber"));
    QCOMPARE(map.value("mpris:trackid").value<QDBusObjectPath>().path(), QString(cctl::NO_TRACK));
}

void TestMprisServer::testPlayerProperties()
{
    auto* device = new FakeCastDevice("Kitchen");
    cctl::DeviceAdapter adapter(device, options());

    QVariantMap props = cctl::MprisServer::playerProperties(&adapter);
    QCOMPARE(props.value("PlaybackStatus").toString(), QString("Stopped"));
    QCOMPARE(props.value("Volume").toDouble(), 0.0);
    QCOMPARE(props.value("CanControl").toBool(), true);
    QVERIFY(!props.contains("Position"));
    QVERIFY(props.value("Metadata").toMap().contains("mpris:trackid"));
}

void TestMprisServer::testPublishWithoutBus()
{
    cctl::DeviceAdapter adapter(new FakeCastDevice("Kitchen"), options());
    cctl::MprisServer server(adapter.name(), &adapter, noBus());

    QVERIFY(!server.publish());
    QVERIFY(!server.isPublished());
    server.emitChanges();
    server.unpublish();
}

void TestMprisServer::testAdaptorsAttached()
{
    cctl::DeviceAdapter adapter(new FakeCastDevice("Kitchen"), options());
    cctl::MprisServer server(adapter.name(), &adapter, noBus());

    auto* root = server.findChild<cctl::MprisRootAdaptor*>();
    QVERIFY(root);
    QVERIFY(server.findChild<cctl::MprisPlayerAdaptor*>());
    QVERIFY(server.findChild<cctl::MprisTrackListAdaptor*>());

    QCOMPARE(root->identity(), QString("Kitchen"));
    QVERIFY(root->canQuit());
    QCOMPARE(root->supportedUriSchemes(), (QStringList{"http", "https"}));
}

void TestMprisServer::testRelativeSeek()
{
    auto* device = new FakeCastDevice("Kitchen");
    cctl::DeviceAdapter adapter(device, options());
    cctl::MprisServer server(adapter.name(), &adapter, noBus());
    auto* player = server.findChild<cctl::MprisPlayerAdaptor*>();
    QSignalSpy seeked(player, &cctl::MprisPlayerAdaptor::Seeked);

    // Cannot seek without media
    player->Seek(10 * cctl::US_IN_SEC);
    QVERIFY(device->media.commands.isEmpty());

    ocast::MediaStatus s;
    s.valid = true;
    s.playerState = "PAUSED";
    s.supportedMediaCommands = ocast::MediaCommand::Seek;
    s.hasCurrentTime = true;
    s.currentTime = 20.0;
    device->media.mediaStatus = s;

    player->Seek(10 * cctl::US_IN_SEC);
    player->Seek(-60 * cctl::US_IN_SEC);
    QCOMPARE(device->media.commands, (QStringList{"seek 30", "seek 0"}));
    QCOMPARE(seeked.count(), 2);
    QCOMPARE(seeked[0][0].toLongLong(), 30 * cctl::US_IN_SEC);
}

void TestMprisServer::testSetPositionChecksTrack()
{
    auto* device = new FakeCastDevice("Kitchen");
    cctl::DeviceAdapter adapter(device, options());
    cctl::MprisServer server(adapter.name(), &adapter, noBus());
    auto* player = server.findChild<cctl::MprisPlayerAdaptor*>();

    ocast::MediaStatus s;
    s.valid = true;
    s.playerState = "PAUSED";
    s.supportedMediaCommands = ocast::MediaCommand::Seek;
    s.title = "Song";
    s.duration = 100.0;
    device->media.mediaStatus = s;

    player->SetPosition(QDBusObjectPath("/track/Other"), 5 * cctl::US_IN_SEC);
    player->SetPosition(QDBusObjectPath("/track/Song"), 500 * cctl::US_IN_SEC);
    player->SetPosition(QDBusObjectPath("/track/Song"), 5 * cctl::US_IN_SEC);
    QCOMPARE(device->media.commands, QStringList{"seek 5"});
}

void TestMprisServer::testPlayPause()
{
    auto* device = new FakeCastDevice("Kitchen");
    cctl::DeviceAdapter adapter(device, options());
    cctl::MprisServer server(adapter.name(), &adapter, noBus());
    auto* player = server.findChild<cctl::MprisPlayerAdaptor*>();

    player->PlayPause();

    ocast::MediaStatus s;
    s.valid = true;
    s.playerState = "PLAYING";
    device->media.mediaStatus = s;
    player->PlayPause();

    QCOMPARE(device->media.commands, (QStringList{"play", "pause"}));
}

QTEST_MAIN(TestMprisServer)
#include "test_mpris_server.moc"
