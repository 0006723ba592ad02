#pragma once

#include <ocast/Messenger/FrameParser.hpp>
#include <ocast/Messenger/Cryptor.hpp>
#include <ocast/Transport/ITransport.hpp>

#include <QObject>
#include <QByteArray>
#include <QQueue>
#include <QString>

namespace ocast {

/// Routing fields and UTF-8 payload of one CastMessage.
struct CastEnvelope {
    QString sourceId;
    QString destinationId;
    QString nameSpace;
    QString payload;
};

class Messenger : public QObject {
    Q_OBJECT

public:
    explicit Messenger(ITransport* transport, QObject* parent = nullptr);

    /// Plain framing without TLS, used against LoopbackTransport in tests.
    void setTlsEnabled(bool enabled);
    bool isTlsEnabled() const;

    void start();
    void stop();

    void startHandshake();
    bool isEncrypted() const;

    void sendMessage(const QString& sourceId, const QString& destinationId,
                     const QString& nameSpace, const QString& payload);

    // Length-prefixed protobuf encoding, independent of TLS
    static QByteArray encodeFrame(const CastEnvelope& envelope);
    static bool decodeMessage(const QByteArray& message, CastEnvelope& envelope);

signals:
    void messageReceived(const QString& sourceId, const QString& destinationId,
                         const QString& nameSpace, const QString& payload);
    void handshakeComplete();
    void handshakeFailed();
    void transportError(const QString& message);

private:
    void onTransportData(const QByteArray& data);
    void onFrameParsed(const QByteArray& message);
    void onFrameRejected(quint32 declaredSize);
    void driveHandshake();
    void processSendQueue();

    ITransport* transport_;
    FrameParser parser_;
    Cryptor cryptor_;
    bool tlsEnabled_ = true;
    bool ready_ = false;

    QQueue<QByteArray> sendQueue_;
};

} // namespace ocast
