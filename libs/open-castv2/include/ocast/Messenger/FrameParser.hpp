#pragma once

#include <QObject>
#include <QByteArray>

namespace ocast {

class FrameParser : public QObject {
    Q_OBJECT

public:
    explicit FrameParser(QObject* parent = nullptr);

    void reset();

public slots:
    void onData(const QByteArray& data);

signals:
    void frameParsed(const QByteArray& payload);
    void frameRejected(quint32 declaredSize);

private:
    enum class State {
        ReadSize,
        ReadPayload
    };

    void process();

    State m_state = State::ReadSize;
    QByteArray m_buffer;
    quint32 m_payloadSize = 0;
};

} // namespace ocast
