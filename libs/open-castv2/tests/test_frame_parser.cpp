#include <QtTest/QtTest>
#include <QSignalSpy>
#include <ocast/Messenger/FrameParser.hpp>
#include <ocast/Messenger/FrameSerializer.hpp>
#include <ocast/Version.hpp>

class TestFrameParser : public QObject {
    Q_OBJECT

private slots:
    void testSerializePrefixesBigEndianLength() {
        QByteArray frame = ocast::FrameSerializer::serialize(QByteArray(300, 'x'));
        QCOMPARE(frame.size(), 304);
        QCOMPARE(static_cast<uint8_t>(frame[0]), uint8_t(0x00));
        QCOMPARE(static_cast<uint8_t>(frame[1]), uint8_t(0x00));
        QCOMPARE(static_cast<uint8_t>(frame[2]), uint8_t(0x01));
        QCOMPARE(static_cast<uint8_t>(frame[3]), uint8_t(0x2C));
    }

    void testCompleteFrame() {
        ocast::FrameParser parser;
        QSignalSpy spy(&parser, &ocast::FrameParser::frameParsed);

        parser.onData(ocast::FrameSerializer::serialize("hello"));

        QCOMPARE(spy.count(), 1);
        QCOMPARE(spy[0][0].toByteArray(), QByteArray("hello"));
    }

    void testByteByByte() {
        ocast::FrameParser parser;
        QSignalSpy spy(&parser, &ocast::FrameParser::frameParsed);

        QByteArray frame = ocast::FrameSerializer::serialize("test");
        for (int i = 0; i < frame.size(); ++i) {
            parser.onData(frame.mid(i, 1));
        }

        QCOMPARE(spy.count(), 1);
        QCOMPARE(spy[0][0].toByteArray(), QByteArray("test"));
    }

    void testMultipleFramesInOneChunk() {
        ocast::FrameParser parser;
        QSignalSpy spy(&parser, &ocast::FrameParser::frameParsed);

        QByteArray data = ocast::FrameSerializer::serialize("one")
                        + ocast::FrameSerializer::serialize("two")
                        + ocast::FrameSerializer::serialize("three").left(5);
        parser.onData(data);

        QCOMPARE(spy.count(), 2);
        QCOMPARE(spy[1][0].toByteArray(), QByteArray("two"));

        parser.onData(ocast::FrameSerializer::serialize("three").mid(5));
        QCOMPARE(spy.count(), 3);
        QCOMPARE(spy[2][0].toByteArray(), QByteArray("three"));
    }

    void testEmptyPayload() {
        ocast::FrameParser parser;
        QSignalSpy spy(&parser, &ocast::FrameParser::frameParsed);

        parser.onData(ocast::FrameSerializer::serialize(QByteArray()));

        QCOMPARE(spy.count(), 1);
        QVERIFY(spy[0][0].toByteArray().isEmpty());
    }

    void testOversizedFrameRejected() {
        ocast::FrameParser parser;
        QSignalSpy parsed(&parser, &ocast::FrameParser::frameParsed);
        QSignalSpy rejected(&parser, &ocast::FrameParser::frameRejected);

        QByteArray header(4, '\0');
        qToBigEndian<quint32>(ocast::FRAME_MAX_PAYLOAD + 1,
                              reinterpret_cast<uchar*>(header.data()));
        parser.onData(header);

        QCOMPARE(parsed.count(), 0);
        QCOMPARE(rejected.count(), 1);
        QCOMPARE(rejected[0][0].toUInt(), ocast::FRAME_MAX_PAYLOAD + 1);

        // Parser is usable again after the reset
        parser.onData(ocast::FrameSerializer::serialize("ok"));
        QCOMPARE(parsed.count(), 1);
    }
};

QTEST_MAIN(TestFrameParser)
#include "test_frame_parser.moc"
