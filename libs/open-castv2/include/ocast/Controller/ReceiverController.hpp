#pragma once

#include <ocast/Controller/BaseController.hpp>
#include <ocast/Status/CastStatus.hpp>
#include <ocast/Version.hpp>

namespace ocast {

class ReceiverController : public BaseController {
    Q_OBJECT
public:
    explicit ReceiverController(QObject* parent = nullptr);

    QString destination() const override { return QString::fromLatin1(RECEIVER_ID); }
    bool receiveMessage(const QJsonObject& message) override;

    CastStatus status() const { return status_; }
    void clearStatus();

    void getStatus();
    void launchApp(const QString& appId);
    void stopApp();
    void setVolume(double level);
    void setVolumeMuted(bool muted);

signals:
    void statusChanged(const ocast::CastStatus& status);
    void launchFailed(const QString& reason);

private:
    CastStatus status_;
};

} // namespace ocast
