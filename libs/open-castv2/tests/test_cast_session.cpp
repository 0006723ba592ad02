#include <QtTest/QtTest>
#include <QSignalSpy>
#include <QJsonDocument>
#include <ocast/Transport/LoopbackTransport.hpp>
#include <ocast/Session/CastSession.hpp>
#include <ocast/Controller/MediaController.hpp>
#include <ocast/Version.hpp>

class TestCastSession : public QObject {
    Q_OBJECT

private:
    static ocast::SessionConfig plainConfig() {
        ocast::SessionConfig config;
        config.useTls = false;
        return config;
    }

    static QString typeOf(const ocast::CastEnvelope& envelope) {
        return QJsonDocument::fromJson(envelope.payload.toUtf8()).object().value("type").toString();
    }

private slots:
    void testInitialState() {
        ocast::LoopbackTransport transport;
        ocast::CastSession session(&transport, plainConfig());

        QCOMPARE(session.state(), ocast::SessionState::Idle);
    }

    void testConnectSendsConnectAndGetStatus() {
        ocast::LoopbackTransport transport;
        ocast::CastSession session(&transport, plainConfig());
        QSignalSpy connectedSpy(&session, &ocast::CastSession::connected);

        session.start();
        QCOMPARE(session.state(), ocast::SessionState::Connecting);

        transport.acceptConnection();
        QCOMPARE(session.state(), ocast::SessionState::Connected);
        QCOMPARE(connectedSpy.count(), 1);

        auto messages = transport.sentMessages();
        QCOMPARE(messages.size(), 2);
        QCOMPARE(messages[0].nameSpace, QString(ocast::ns::CONNECTION));
        QCOMPARE(typeOf(messages[0]), QString("CONNECT"));
        QCOMPARE(messages[0].destinationId, QString("receiver-0"));
        QCOMPARE(messages[1].nameSpace, QString(ocast::ns::RECEIVER));
        QCOMPARE(typeOf(messages[1]), QString("GET_STATUS"));
    }

    void testStartWhenAlreadyConnected() {
        ocast::LoopbackTransport transport;
        ocast::CastSession session(&transport, plainConfig());

        transport.acceptConnection();
        session.start();
        QCOMPARE(session.state(), ocast::SessionState::Connected);
    }

    void testAppTransportGetsVirtualConnection() {
        ocast::LoopbackTransport transport;
        ocast::CastSession session(&transport, plainConfig());
        ocast::MediaController media;
        session.registerController(&media);

        transport.acceptConnection();
        session.start();
        transport.clearSent();

        transport.receiveFromReceiver(ocast::ns::RECEIVER, R"({"type":"RECEIVER_STATUS","status":{
            "applications":[{"appId":"CC1AD845","transportId":"web-3",
                             "namespaces":[{"name":"urn:x-cast:com.google.cast.media"}]}],
            "volume":{"level":0.5,"muted":false}}})");

        QVERIFY(media.isActive());
        auto messages = transport.sentMessages();
        QCOMPARE(messages.size(), 2);
        QCOMPARE(messages[0].destinationId, QString("web-3"));
        QCOMPARE(typeOf(messages[0]), QString("CONNECT"));
        QCOMPARE(messages[1].destinationId, QString("web-3"));
        QCOMPARE(messages[1].nameSpace, QString(ocast::ns::MEDIA));
        QCOMPARE(typeOf(messages[1]), QString("GET_STATUS"));
    }

    void testMediaStatusRouted() {
        ocast::LoopbackTransport transport;
        ocast::CastSession session(&transport, plainConfig());
        ocast::MediaController media;
        session.registerController(&media);
        QSignalSpy spy(&media, &ocast::MediaController::statusChanged);

        transport.acceptConnection();
        session.start();
        transport.receiveFromReceiver(ocast::ns::MEDIA,
            R"({"type":"MEDIA_STATUS","status":[{"mediaSessionId":2,"playerState":"PAUSED"}]})",
            "web-3");

        QCOMPARE(spy.count(), 1);
        QVERIFY(media.isPaused());
    }

    void testHeartbeatPingAnswered() {
        ocast::LoopbackTransport transport;
        ocast::CastSession session(&transport, plainConfig());
        transport.acceptConnection();
        session.start();
        transport.clearSent();

        transport.receiveFromReceiver(ocast::ns::HEARTBEAT, R"({"type":"PING"})");

        auto messages = transport.sentMessages();
        QCOMPARE(messages.size(), 1);
        QCOMPARE(typeOf(messages[0]), QString("PONG"));
    }

    void testReceiverCloseDisconnects() {
        ocast::LoopbackTransport transport;
        ocast::CastSession session(&transport, plainConfig());
        QSignalSpy disconnectSpy(&session, &ocast::CastSession::disconnected);
        transport.acceptConnection();
        session.start();

        transport.receiveFromReceiver(ocast::ns::CONNECTION, R"({"type":"CLOSE"})");

        QCOMPARE(session.state(), ocast::SessionState::Disconnected);
        QCOMPARE(disconnectSpy.count(), 1);
        QCOMPARE(disconnectSpy[0][0].value<ocast::DisconnectReason>(),
                 ocast::DisconnectReason::Normal);
    }

    void testMissedPongsDisconnect() {
        ocast::LoopbackTransport transport;
        auto config = plainConfig();
        config.pingInterval = 10;
        config.maxMissedPongs = 2;
        ocast::CastSession session(&transport, config);
        QSignalSpy disconnectSpy(&session, &ocast::CastSession::disconnected);

        transport.acceptConnection();
        session.start();

        QTRY_COMPARE(session.state(), ocast::SessionState::Disconnected);
        QCOMPARE(disconnectSpy[0][0].value<ocast::DisconnectReason>(),
                 ocast::DisconnectReason::PingTimeout);
    }

    void testConnectTimeout() {
        ocast::LoopbackTransport transport;
        auto config = plainConfig();
        config.connectTimeout = 10;
        ocast::CastSession session(&transport, config);
        QSignalSpy disconnectSpy(&session, &ocast::CastSession::disconnected);

        session.start();

        QTRY_COMPARE(disconnectSpy.count(), 1);
        QCOMPARE(disconnectSpy[0][0].value<ocast::DisconnectReason>(),
                 ocast::DisconnectReason::Timeout);
    }

    void testTransportDisconnect() {
        ocast::LoopbackTransport transport;
        ocast::CastSession session(&transport, plainConfig());
        QSignalSpy disconnectSpy(&session, &ocast::CastSession::disconnected);
        transport.acceptConnection();
        session.start();

        transport.dropConnection();

        QCOMPARE(session.state(), ocast::SessionState::Disconnected);
        QCOMPARE(disconnectSpy[0][0].value<ocast::DisconnectReason>(),
                 ocast::DisconnectReason::TransportError);
        QVERIFY(!session.receiver()->status().isValid());
    }

    void testStopSendsClose() {
        ocast::LoopbackTransport transport;
        ocast::CastSession session(&transport, plainConfig());
        transport.acceptConnection();
        session.start();
        transport.clearSent();

        session.stop();

        auto messages = transport.sentMessages();
        QCOMPARE(messages.size(), 1);
        QCOMPARE(typeOf(messages[0]), QString("CLOSE"));
        QCOMPARE(session.state(), ocast::SessionState::Disconnected);
        QVERIFY(!transport.isStarted());
    }

    void testTimeoutReleasesTransport() {
        ocast::LoopbackTransport transport;
        auto config = plainConfig();
        config.pingInterval = 10;
        config.maxMissedPongs = 1;
        ocast::CastSession session(&transport, config);

        transport.acceptConnection();
        session.start();
        QVERIFY(transport.isStarted());

        QTRY_COMPARE(session.state(), ocast::SessionState::Disconnected);
        QVERIFY(!transport.isStarted());
        QVERIFY(transport.sentTypes().contains(QStringLiteral("PING")));
    }
};

QTEST_MAIN(TestCastSession)
#include "test_cast_session.moc"
