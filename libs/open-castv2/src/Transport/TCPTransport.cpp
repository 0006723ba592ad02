#include <ocast/Transport/TCPTransport.hpp>
#include <QDebug>

namespace ocast {

TCPTransport::TCPTransport(QObject* parent)
    : ITransport(parent)
    , socket_(new QTcpSocket(this))
{
}

TCPTransport::~TCPTransport()
{
    stop();
}

void TCPTransport::connectToHost(const QString& host, quint16 port)
{
    qDebug() << "[TCPTransport] connecting to" << host << port;
    if (socket_->state() != QAbstractSocket::UnconnectedState)
        socket_->abort();
    socket_->connectToHost(host, port);
}

void TCPTransport::start()
{
    disconnectSocketSignals();
    connectSocketSignals();
}

void TCPTransport::stop()
{
    disconnectSocketSignals();
    // A connected socket gets to flush queued writes (CLOSE messages) first
    if (socket_->state() == QAbstractSocket::ConnectedState)
        socket_->disconnectFromHost();
    else if (socket_->state() != QAbstractSocket::UnconnectedState)
        socket_->abort();
}

void TCPTransport::write(const QByteArray& data)
{
    if (socket_->state() == QAbstractSocket::ConnectedState) {
        socket_->write(data);
    } else {
        qWarning() << "[TCPTransport] write DROPPED:" << data.size()
                    << "bytes (socket state:" << static_cast<int>(socket_->state()) << ")";
    }
}

bool TCPTransport::isConnected() const
{
    return socket_->state() == QAbstractSocket::ConnectedState;
}

void TCPTransport::connectSocketSignals()
{
    connect(socket_, &QTcpSocket::readyRead, this, [this]() {
        emit dataReceived(socket_->readAll());
    });
    connect(socket_, &QTcpSocket::connected, this, &TCPTransport::connected);
    connect(socket_, &QTcpSocket::disconnected, this, &TCPTransport::disconnected);
    connect(socket_, &QAbstractSocket::errorOccurred, this, [this](QAbstractSocket::SocketError) {
        emit error(socket_->errorString());
    });
}

void TCPTransport::disconnectSocketSignals()
{
    disconnect(socket_, nullptr, this, nullptr);
}

} // namespace ocast
