#pragma once

#include <ocast/Device/ICastDevice.hpp>

namespace cctl {

class DeviceAdapter;
class MprisServer;

/// Route device and media status updates through the adapter to MPRIS
/// PropertiesChanged. The connections live as long as `server`.
void registerStatusListeners(ocast::ICastDevice* device, DeviceAdapter* adapter,
                             MprisServer* server);

} // namespace cctl
