#pragma once

#include <ocast/Transport/ITransport.hpp>
#include <QTcpSocket>

namespace ocast {

class TCPTransport : public ITransport {
    Q_OBJECT
public:
    explicit TCPTransport(QObject* parent = nullptr);
    ~TCPTransport() override;

    void connectToHost(const QString& host, quint16 port);

    void start() override;
    void stop() override;
    void write(const QByteArray& data) override;
    bool isConnected() const override;

private:
    void connectSocketSignals();
    void disconnectSocketSignals();

    QTcpSocket* socket_ = nullptr;
};

} // namespace ocast
