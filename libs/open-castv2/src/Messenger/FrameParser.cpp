#include <ocast/Messenger/FrameParser.hpp>
#include <ocast/Version.hpp>
#include <QtEndian>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(lcFrameParser, "ocast.messenger.frameparser")

namespace ocast {

FrameParser::FrameParser(QObject* parent)
    : QObject(parent)
{
}

void FrameParser::reset()
{
    m_buffer.clear();
    m_state = State::ReadSize;
    m_payloadSize = 0;
}

void FrameParser::onData(const QByteArray& data)
{
    m_buffer.append(data);
    process();
}

void FrameParser::process()
{
    while (true) {
        switch (m_state) {
        case State::ReadSize:
            if (m_buffer.size() < FRAME_HEADER_SIZE)
                return;
            m_payloadSize = qFromBigEndian<quint32>(
                reinterpret_cast<const uchar*>(m_buffer.constData()));
            if (m_payloadSize > FRAME_MAX_PAYLOAD) {
                qCWarning(lcFrameParser) << "frame too large:" << m_payloadSize;
                quint32 rejected = m_payloadSize;
                reset();
                emit frameRejected(rejected);
                return;
            }
            m_buffer.remove(0, FRAME_HEADER_SIZE);
            m_state = State::ReadPayload;
            break;

        case State::ReadPayload:
            if (static_cast<quint32>(m_buffer.size()) < m_payloadSize)
                return;
            {
                QByteArray payload = m_buffer.left(static_cast<int>(m_payloadSize));
                m_buffer.remove(0, static_cast<int>(m_payloadSize));
                m_state = State::ReadSize;
                emit frameParsed(payload);
            }
            break;
        }
    }
}

} // namespace ocast
