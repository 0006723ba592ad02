#include <ocast/Transport/LoopbackTransport.hpp>
#include <ocast/Version.hpp>
#include <QJsonDocument>
#include <QJsonObject>

namespace ocast {

LoopbackTransport::LoopbackTransport(QObject* parent)
    : ITransport(parent)
{
}

void LoopbackTransport::start()
{
    started_ = true;
}

void LoopbackTransport::stop()
{
    started_ = false;
}

void LoopbackTransport::write(const QByteArray& data)
{
    writes_.append(data);
}

bool LoopbackTransport::isConnected() const
{
    return connected_;
}

void LoopbackTransport::acceptConnection()
{
    connected_ = true;
    emit connected();
}

void LoopbackTransport::dropConnection()
{
    if (!connected_) return;
    connected_ = false;
    emit disconnected();
}

void LoopbackTransport::receiveBytes(const QByteArray& data)
{
    emit dataReceived(data);
}

void LoopbackTransport::receive(const CastEnvelope& envelope)
{
    emit dataReceived(Messenger::encodeFrame(envelope));
}

void LoopbackTransport::receiveFromReceiver(const QString& nameSpace, const QString& payload,
                                            const QString& sourceId)
{
    const QString source = sourceId.isEmpty() ? QString::fromLatin1(RECEIVER_ID) : sourceId;
    receive({source, QString::fromLatin1(SENDER_ID), nameSpace, payload});
}

QList<CastEnvelope> LoopbackTransport::sentMessages() const
{
    QList<CastEnvelope> messages;
    for (const auto& chunk : writes_) {
        if (chunk.size() <= FRAME_HEADER_SIZE)
            continue;
        CastEnvelope envelope;
        if (Messenger::decodeMessage(chunk.mid(FRAME_HEADER_SIZE), envelope))
            messages.append(envelope);
    }
    return messages;
}

QStringList LoopbackTransport::sentTypes() const
{
    QStringList types;
    for (const auto& message : sentMessages()) {
        const auto payload = QJsonDocument::fromJson(message.payload.toUtf8()).object();
        types.append(payload.value(QStringLiteral("type")).toString());
    }
    return types;
}

void LoopbackTransport::clearSent()
{
    writes_.clear();
}

} // namespace ocast
