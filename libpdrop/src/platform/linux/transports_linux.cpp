/**
 * @file transports_linux.cpp
 * @brief Transport factories backed by BlueZ and wpa_supplicant
 */

#include "bluez_ble.h"
#include "pdrop/transports.h"
#include "wpa_supplicant.h"

namespace pdrop {

Result<std::unique_ptr<Backend>>
create_ble_backend(const BleBackendConfig &config) {
  auto backend = platform::BlueZBackend::create(config);
  if (backend.is_error()) {
    return backend.error();
  }
  return std::unique_ptr<Backend>(std::move(backend.value()));
}

bool is_bluetooth_available() { return platform::bluetooth_available(); }

Result<std::unique_ptr<Backend>>
create_wifi_direct_backend(const WifiDirectBackendConfig &config) {
  auto backend = platform::WifiDirectBackend::create(config);
  if (backend.is_error()) {
    return backend.error();
  }
  return std::unique_ptr<Backend>(std::move(backend.value()));
}

bool is_wifi_direct_available() { return platform::wifi_direct_available(); }

} // namespace pdrop
