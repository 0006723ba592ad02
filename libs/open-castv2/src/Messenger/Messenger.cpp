#include <ocast/Messenger/Messenger.hpp>
#include <ocast/Messenger/FrameSerializer.hpp>
#include "cast_channel.pb.h"
#include <QDebug>

namespace ocast {

Messenger::Messenger(ITransport* transport, QObject* parent)
    : QObject(parent)
    , transport_(transport)
    , parser_(this)
{
}

void Messenger::setTlsEnabled(bool enabled)
{
    tlsEnabled_ = enabled;
}

bool Messenger::isTlsEnabled() const
{
    return tlsEnabled_;
}

void Messenger::start()
{
    connect(transport_, &ITransport::dataReceived,
            this, &Messenger::onTransportData);
    connect(&parser_, &FrameParser::frameParsed,
            this, &Messenger::onFrameParsed);
    connect(&parser_, &FrameParser::frameRejected,
            this, &Messenger::onFrameRejected);
    connect(transport_, &ITransport::error,
            this, &Messenger::transportError);
}

void Messenger::stop()
{
    disconnect(transport_, &ITransport::dataReceived,
               this, &Messenger::onTransportData);
    disconnect(&parser_, &FrameParser::frameParsed,
               this, &Messenger::onFrameParsed);
    disconnect(&parser_, &FrameParser::frameRejected,
               this, &Messenger::onFrameRejected);
    disconnect(transport_, &ITransport::error,
               this, &Messenger::transportError);

    cryptor_.deinit();
    parser_.reset();
    sendQueue_.clear();
    ready_ = false;
}

void Messenger::startHandshake()
{
    if (!tlsEnabled_) {
        ready_ = true;
        emit handshakeComplete();
        processSendQueue();
        return;
    }

    if (!cryptor_.init()) {
        emit handshakeFailed();
        return;
    }
    driveHandshake();
}

bool Messenger::isEncrypted() const
{
    return cryptor_.isActive();
}

void Messenger::sendMessage(const QString& sourceId, const QString& destinationId,
                            const QString& nameSpace, const QString& payload)
{
    sendQueue_.enqueue(encodeFrame({sourceId, destinationId, nameSpace, payload}));
    processSendQueue();
}

QByteArray Messenger::encodeFrame(const CastEnvelope& envelope)
{
    proto::CastMessage msg;
    msg.set_protocol_version(proto::CastMessage::CASTV2_1_0);
    msg.set_source_id(envelope.sourceId.toStdString());
    msg.set_destination_id(envelope.destinationId.toStdString());
    msg.set_namespace_(envelope.nameSpace.toStdString());
    msg.set_payload_type(proto::CastMessage::STRING);
    msg.set_payload_utf8(envelope.payload.toStdString());

    std::string serialized;
    msg.SerializeToString(&serialized);
    return FrameSerializer::serialize(
        QByteArray(serialized.data(), static_cast<int>(serialized.size())));
}

bool Messenger::decodeMessage(const QByteArray& message, CastEnvelope& envelope)
{
    proto::CastMessage msg;
    if (!msg.ParseFromArray(message.constData(), message.size()))
        return false;

    envelope.sourceId = QString::fromStdString(msg.source_id());
    envelope.destinationId = QString::fromStdString(msg.destination_id());
    envelope.nameSpace = QString::fromStdString(msg.namespace_());
    if (msg.payload_type() == proto::CastMessage::STRING) {
        envelope.payload = QString::fromStdString(msg.payload_utf8());
    } else {
        envelope.payload.clear();
    }
    return true;
}

void Messenger::onTransportData(const QByteArray& data)
{
    if (!tlsEnabled_) {
        parser_.onData(data);
        return;
    }

    if (!cryptor_.isActive()) {
        cryptor_.writeHandshakeBuffer(data);
        driveHandshake();
        return;
    }

    QByteArray plaintext = cryptor_.decrypt(data);
    if (!plaintext.isEmpty())
        parser_.onData(plaintext);
}

void Messenger::onFrameParsed(const QByteArray& message)
{
    CastEnvelope envelope;
    if (!decodeMessage(message, envelope)) {
        qWarning() << "[Messenger] undecodable CastMessage," << message.size() << "bytes";
        return;
    }
    emit messageReceived(envelope.sourceId, envelope.destinationId,
                         envelope.nameSpace, envelope.payload);
}

void Messenger::onFrameRejected(quint32 declaredSize)
{
    emit transportError(QStringLiteral("frame of %1 bytes exceeds limit").arg(declaredSize));
}

void Messenger::driveHandshake()
{
    bool complete = cryptor_.doHandshake();

    QByteArray outgoing = cryptor_.readHandshakeBuffer();
    if (!outgoing.isEmpty())
        transport_->write(outgoing);

    if (cryptor_.hasFailed()) {
        emit handshakeFailed();
        return;
    }

    if (complete && !ready_) {
        ready_ = true;
        emit handshakeComplete();

        // Application data may have arrived with the last handshake record
        QByteArray pending = cryptor_.decrypt(QByteArray());
        if (!pending.isEmpty())
            parser_.onData(pending);

        processSendQueue();
    }
}

void Messenger::processSendQueue()
{
    if (!ready_) return;

    while (!sendQueue_.isEmpty()) {
        QByteArray frame = sendQueue_.dequeue();
        if (tlsEnabled_) {
            frame = cryptor_.encrypt(frame);
            if (frame.isEmpty()) continue;
        }
        transport_->write(frame);
    }
}

} // namespace ocast
