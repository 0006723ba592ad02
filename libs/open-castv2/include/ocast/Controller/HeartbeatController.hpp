#pragma once

#include <ocast/Controller/BaseController.hpp>
#include <ocast/Version.hpp>

namespace ocast {

class HeartbeatController : public BaseController {
    Q_OBJECT
public:
    explicit HeartbeatController(QObject* parent = nullptr);

    QString destination() const override { return QString::fromLatin1(RECEIVER_ID); }
    bool receiveMessage(const QJsonObject& message) override;

    void ping();

signals:
    void pongReceived();
};

} // namespace ocast
