/**
 * @file transports_unavailable.cpp
 * @brief Transport factories for builds without D-Bus
 */

#include "pdrop/transports.h"

namespace pdrop {

Result<std::unique_ptr<Backend>>
create_ble_backend(const BleBackendConfig &config) {
  return Error(ErrorCode::NotSupported,
               "BLE backend requires a Linux build with D-Bus")
      .at(config.name);
}

bool is_bluetooth_available() { return false; }

Result<std::unique_ptr<Backend>>
create_wifi_direct_backend(const WifiDirectBackendConfig &config) {
  return Error(ErrorCode::NotSupported,
               "Wi-Fi Direct backend requires a Linux build with D-Bus")
      .at(config.name);
}

bool is_wifi_direct_available() { return false; }

} // namespace pdrop
