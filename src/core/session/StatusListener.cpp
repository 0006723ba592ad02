#include "core/session/StatusListener.hpp"
#include "core/adapter/DeviceAdapter.hpp"
#include "core/mpris/MprisServer.hpp"

namespace cctl {

void registerStatusListeners(ocast::ICastDevice* device, DeviceAdapter* adapter,
                             MprisServer* server)
{
    auto onStatus = [adapter, server]() {
        adapter->onNewStatus();
        server->emitChanges();
    };

    QObject::connect(device, &ocast::ICastDevice::statusChanged, server, onStatus);
    QObject::connect(device, &ocast::ICastDevice::mediaStatusChanged, server, onStatus);
    QObject::connect(device, &ocast::ICastDevice::connectionChanged, server, onStatus);
}

} // namespace cctl
