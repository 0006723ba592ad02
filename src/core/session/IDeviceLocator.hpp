#pragma once

#include "core/session/DeviceQuery.hpp"

#include <ocast/Device/ICastDevice.hpp>

#include <QObject>

namespace cctl {

/// One asynchronous lookup at a time. Emits exactly one of located() or
/// notFound() per locate() call.
class IDeviceLocator : public QObject {
    Q_OBJECT
public:
    using QObject::QObject;
    ~IDeviceLocator() override = default;

    virtual void locate(const DeviceQuery& query) = 0;

signals:
    /// Ownership of `device` passes to the receiver.
    void located(ocast::ICastDevice* device);
    void notFound();
};

} // namespace cctl
