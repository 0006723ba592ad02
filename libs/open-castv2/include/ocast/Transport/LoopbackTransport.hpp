#pragma once

#include <ocast/Messenger/Messenger.hpp>
#include <ocast/Transport/ITransport.hpp>
#include <QList>
#include <QStringList>

namespace ocast {

/// Stands in for a receiver on the other end of the socket. Outgoing bytes
/// are kept so tests can read back the CastMessages a sender produced, and
/// receiver traffic is framed the way the wire carries it.
class LoopbackTransport : public ITransport {
    Q_OBJECT
public:
    explicit LoopbackTransport(QObject* parent = nullptr);

    void start() override;
    void stop() override;
    void write(const QByteArray& data) override;
    bool isConnected() const override;

    bool isStarted() const { return started_; }

    void acceptConnection();
    void dropConnection();

    void receiveBytes(const QByteArray& data);
    void receive(const CastEnvelope& envelope);
    void receiveFromReceiver(const QString& nameSpace, const QString& payload,
                             const QString& sourceId = QString());

    // Raw chunks as written, TLS records included
    QList<QByteArray> rawWrites() const { return writes_; }
    // Every plaintext frame that decodes as a CastMessage
    QList<CastEnvelope> sentMessages() const;
    // The "type" field of each sent message's JSON payload
    QStringList sentTypes() const;
    void clearSent();

private:
    bool started_ = false;
    bool connected_ = false;
    QList<QByteArray> writes_;
};

} // namespace ocast
