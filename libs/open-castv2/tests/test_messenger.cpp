#include <QtTest/QtTest>
#include <QSignalSpy>
#include <ocast/Messenger/Messenger.hpp>
#include <ocast/Transport/LoopbackTransport.hpp>
#include <ocast/Version.hpp>

class TestMessenger : public QObject {
    Q_OBJECT

private slots:
    void testSendQueuedUntilHandshake() {
        ocast::LoopbackTransport transport;
        ocast::Messenger messenger(&transport);
        messenger.setTlsEnabled(false);
        messenger.start();

        messenger.sendMessage("sender-0", "receiver-0", ocast::ns::RECEIVER,
                              "{\"type\":\"GET_STATUS\"}");
        QVERIFY(transport.rawWrites().isEmpty());

        QSignalSpy spy(&messenger, &ocast::Messenger::handshakeComplete);
        messenger.startHandshake();
        QCOMPARE(spy.count(), 1);
        QCOMPARE(transport.rawWrites().size(), 1);

        QCOMPARE(transport.sentMessages().size(), 1);
        auto envelope = transport.sentMessages().first();
        QCOMPARE(envelope.sourceId, QString("sender-0"));
        QCOMPARE(envelope.destinationId, QString("receiver-0"));
        QCOMPARE(envelope.nameSpace, QString(ocast::ns::RECEIVER));
        QCOMPARE(envelope.payload, QString("{\"type\":\"GET_STATUS\"}"));
    }

    void testReceiveSplitFrame() {
        ocast::LoopbackTransport transport;
        ocast::Messenger messenger(&transport);
        messenger.setTlsEnabled(false);
        messenger.start();
        messenger.startHandshake();

        QSignalSpy spy(&messenger, &ocast::Messenger::messageReceived);
        QByteArray frame = ocast::Messenger::encodeFrame(
            {"receiver-0", "sender-0", ocast::ns::HEARTBEAT, "{\"type\":\"PONG\"}"});

        transport.receiveBytes(frame.left(3));
        QCOMPARE(spy.count(), 0);
        transport.receiveBytes(frame.mid(3));

        QCOMPARE(spy.count(), 1);
        QCOMPARE(spy[0][0].toString(), QString("receiver-0"));
        QCOMPARE(spy[0][2].toString(), QString(ocast::ns::HEARTBEAT));
        QCOMPARE(spy[0][3].toString(), QString("{\"type\":\"PONG\"}"));
    }

    void testUndecodableFrameIgnored() {
        ocast::LoopbackTransport transport;
        ocast::Messenger messenger(&transport);
        messenger.setTlsEnabled(false);
        messenger.start();
        messenger.startHandshake();

        QSignalSpy spy(&messenger, &ocast::Messenger::messageReceived);
        QByteArray junk("\x00\x00\x00\x03\xff\xff\xff", 7);
        transport.receiveBytes(junk);

        QCOMPARE(spy.count(), 0);
    }

    void testStopDisconnectsTransport() {
        ocast::LoopbackTransport transport;
        ocast::Messenger messenger(&transport);
        messenger.setTlsEnabled(false);
        messenger.start();
        messenger.startHandshake();
        messenger.stop();

        QSignalSpy spy(&messenger, &ocast::Messenger::messageReceived);
        transport.receiveBytes(ocast::Messenger::encodeFrame(
            {"receiver-0", "sender-0", ocast::ns::HEARTBEAT, "{}"}));
        QCOMPARE(spy.count(), 0);
    }

    void testTlsHandshakeWritesClientHello() {
        ocast::LoopbackTransport transport;
        ocast::Messenger messenger(&transport);
        messenger.start();
        messenger.startHandshake();

        QCOMPARE(transport.rawWrites().size(), 1);
        QCOMPARE(static_cast<uint8_t>(transport.rawWrites().first()[0]), uint8_t(0x16));
        QVERIFY(!messenger.isEncrypted());
    }
};

QTEST_MAIN(TestMessenger)
#include "test_messenger.moc"
