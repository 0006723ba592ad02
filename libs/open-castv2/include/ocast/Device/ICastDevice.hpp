#pragma once

#include <ocast/Controller/BaseController.hpp>
#include <ocast/Controller/IMediaController.hpp>
#include <ocast/Device/CastInfo.hpp>
#include <ocast/Status/CastStatus.hpp>
#include <ocast/Status/MediaStatus.hpp>

#include <QObject>

namespace ocast {

/// A receiver as seen by the application. Only the transport mutates its
/// state; callers read snapshots and issue commands.
class ICastDevice : public QObject {
    Q_OBJECT
public:
    using QObject::QObject;
    ~ICastDevice() override = default;

    virtual QString name() const = 0;
    virtual CastInfo info() const = 0;
    virtual bool isConnected() const = 0;

    /// Latest receiver status; invalid before the first RECEIVER_STATUS.
    virtual CastStatus status() const = 0;
    virtual IMediaController* mediaController() const = 0;

    /// Attach an app controller (YouTube etc.) to this device's session.
    virtual void registerHandler(BaseController* controller) = 0;

    virtual void quitApp() = 0;
    virtual void volumeUp(double delta) = 0;
    virtual void volumeDown(double delta) = 0;
    virtual void setVolumeMuted(bool muted) = 0;

signals:
    void statusChanged(const ocast::CastStatus& status);
    void mediaStatusChanged(const ocast::MediaStatus& status);
    void connectionChanged(bool connected);
};

} // namespace ocast
