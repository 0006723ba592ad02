#pragma once

#include <ocast/Status/CastStatus.hpp>

#include <QObject>
#include <QJsonObject>
#include <QString>

namespace ocast {

/// One Cast namespace. Bound to an app id, or to any running app that
/// announces the namespace when the app id is empty.
class BaseController : public QObject {
    Q_OBJECT
public:
    BaseController(const QString& nameSpace, const QString& appId, QObject* parent = nullptr);
    ~BaseController() override;

    QString nameSpace() const { return nameSpace_; }
    QString appId() const { return appId_; }
    bool isActive() const { return !transportId_.isEmpty(); }

    /// Where messages on this namespace are addressed.
    virtual QString destination() const { return transportId_; }

    /// Returns false when the message type is not handled.
    virtual bool receiveMessage(const QJsonObject& message) = 0;

    /// Track whether our app is running, from a RECEIVER_STATUS update.
    virtual void onReceiverStatus(const CastStatus& status);

    /// Ask the receiver to start this controller's app.
    void launch();

    /// Drop the app binding when the connection goes away.
    void reset();

signals:
    void sendRequested(const QString& nameSpace, const QString& destinationId,
                       const QString& payload);
    void launchRequested(const QString& appId);
    void activeChanged(bool active);

protected:
    bool send(QJsonObject message);
    bool sendTo(const QString& nameSpace, QJsonObject message);

private:
    void setTransportId(const QString& transportId);

    QString nameSpace_;
    QString appId_;
    QString transportId_;
    int requestId_ = 0;
};

} // namespace ocast
