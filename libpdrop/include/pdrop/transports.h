/**
 * @file transports.h
 * @brief Factories for the platform transport backends
 *
 * On Linux builds with D-Bus the BLE backend talks to BlueZ and the
 * Wi-Fi Direct backend to wpa_supplicant. Without D-Bus both factories
 * fail with NotSupported.
 */

#ifndef PDROP_TRANSPORTS_H
#define PDROP_TRANSPORTS_H

#include "backend.h"
#include "error.h"
#include "platform.h"
#include <cstdint>
#include <memory>
#include <string>

namespace pdrop {

/// pdrop BLE service UUID (advertised, and optionally used as scan filter)
constexpr const char *PDROP_SERVICE_UUID =
    "5ea0d0d0-0001-1000-8000-00805f9b34fb";

// ============================================================================
// BLE
// ============================================================================

struct BleBackendConfig {
  /// Registration name
  std::string name = "ble";

  /// Adapter name ("hci0"); empty selects the first adapter
  std::string adapter;

  /// Only report devices advertising this service UUID; empty = all
  std::string service_uuid_filter;

  /// Identity carried as service data in our own advertisement
  std::string local_peer_id;

  /// Ignore sightings weaker than this (dBm); 0 disables the threshold
  int16_t rssi_threshold = 0;
};

/**
 * @brief Open a BLE backend on a private system-bus connection
 * @return InitializationError if BlueZ or the adapter is unavailable
 */
PDROP_API Result<std::unique_ptr<Backend>>
create_ble_backend(const BleBackendConfig &config = {});

/// True if a BlueZ adapter can be found on the system bus
PDROP_API bool is_bluetooth_available();

// ============================================================================
// Wi-Fi Direct
// ============================================================================

struct WifiDirectBackendConfig {
  /// Registration name
  std::string name = "wifi-direct";

  /// Wireless interface ("wlan0"); empty selects the first P2P-capable one
  std::string interface;

  /// Seconds each P2P Find runs before it is re-issued; 0 = one unbounded Find
  int32_t find_timeout_seconds = 0;
};

/**
 * @brief Open a Wi-Fi Direct backend against wpa_supplicant
 * @return InitializationError if wpa_supplicant or the interface is missing
 */
PDROP_API Result<std::unique_ptr<Backend>>
create_wifi_direct_backend(const WifiDirectBackendConfig &config = {});

/// True if wpa_supplicant exposes a P2P-capable interface
PDROP_API bool is_wifi_direct_available();

} // namespace pdrop

#endif // PDROP_TRANSPORTS_H
