/**
 * @file bluez_ble.h
 * @brief BlueZ BLE backend
 *
 * Internal header. Scans with the adapter's LE discovery and advertises by
 * exporting an LEAdvertisement1 object on the backend's own connection.
 */

#ifndef PDROP_PLATFORM_LINUX_BLUEZ_BLE_H
#define PDROP_PLATFORM_LINUX_BLUEZ_BLE_H

#include "dbus_helpers.h"
#include "pdrop/backend.h"
#include "pdrop/transports.h"
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>

namespace pdrop {
namespace platform {

// BlueZ D-Bus constants
constexpr const char *BLUEZ_SERVICE = "org.bluez";
constexpr const char *BLUEZ_ADAPTER_IFACE = "org.bluez.Adapter1";
constexpr const char *BLUEZ_DEVICE_IFACE = "org.bluez.Device1";
constexpr const char *BLUEZ_LE_ADV_MANAGER_IFACE =
    "org.bluez.LEAdvertisingManager1";
constexpr const char *BLUEZ_LE_ADV_IFACE = "org.bluez.LEAdvertisement1";

/// Where our advertisement object lives on the connection
constexpr const char *PDROP_ADVERTISEMENT_PATH = "/org/pdrop/advertisement0";

/**
 * @brief BlueZ adapter state
 */
struct BlueZAdapter {
  std::string object_path; // e.g., "/org/bluez/hci0"
  std::string address;     // MAC address
  std::string name;        // Adapter name
  bool powered = false;
  bool can_advertise = false; // LEAdvertisingManager1 present
};

/**
 * @brief What we know about one org.bluez.Device1 object
 */
struct BlueZDevice {
  std::string address;
  std::string name;
  std::optional<int16_t> rssi;
  std::set<std::string> uuids; // advertised service and service-data UUIDs
  Bytes pdrop_service_data;     // service data under PDROP_SERVICE_UUID
  bool reported = false;        // a PeerDiscovered went out for it
  PeerId reported_as;
};

/**
 * @brief Find a BlueZ adapter
 * @param name Adapter name such as "hci0"; empty picks the first one
 */
Result<BlueZAdapter> find_adapter(DBusConnection *conn,
                                  const std::string &name = {});

/**
 * @brief Power on/off the adapter
 */
Result<void> set_adapter_powered(DBusConnection *conn,
                                 const std::string &adapter_path, bool powered);

/**
 * @brief Restrict discovery to LE, optionally to one service UUID and RSSI
 */
Result<void> set_discovery_filter(DBusConnection *conn,
                                  const std::string &adapter_path,
                                  const BleBackendConfig &config);

/**
 * @brief Start BLE discovery (scanning)
 */
Result<void> start_discovery(DBusConnection *conn,
                             const std::string &adapter_path);

/**
 * @brief Stop BLE discovery
 */
Result<void> stop_discovery(DBusConnection *conn,
                            const std::string &adapter_path);

/**
 * @brief Identity a device is reported under
 *
 * The pdrop peer id carried in its service data when present, otherwise
 * its BLE address.
 */
PeerId resolve_peer_id(const BlueZDevice &device);

/// True if the system bus is reachable and BlueZ has an adapter
bool bluetooth_available();

/**
 * @brief BLE backend on a private system-bus connection
 */
class BlueZBackend final : public Backend,
                           public Discovery,
                           public Advertiser {
public:
  static Result<std::unique_ptr<BlueZBackend>>
  create(const BleBackendConfig &config);

  ~BlueZBackend() override;

  BlueZBackend(const BlueZBackend &) = delete;
  BlueZBackend &operator=(const BlueZBackend &) = delete;

  // Backend
  std::string name() const override { return config_.name; }
  TransportKind transport() const override { return TransportKind::Ble; }
  Capabilities capabilities() const override;
  Discovery *discovery() override { return this; }
  Advertiser *advertiser() override;

  // Discovery
  Result<void> start_scan() override;
  Result<void> stop_scan() override;
  EventStream poll_events() override;

  // Advertiser
  Result<void> broadcast() override;
  Result<void> stop_broadcast() override;

private:
  BlueZBackend(BleBackendConfig config, DBusConnectionWrapper conn,
               BlueZAdapter adapter);

  Result<void> install_handlers();
  void bus_loop();

  static DBusHandlerResult on_signal(DBusConnection *conn, DBusMessage *msg,
                                     void *user_data);
  static DBusHandlerResult on_advertisement_call(DBusConnection *conn,
                                                 DBusMessage *msg,
                                                 void *user_data);

  void handle_interfaces_added(DBusMessage *msg);
  void handle_interfaces_removed(DBusMessage *msg);
  void handle_properties_changed(DBusMessage *msg);

  /// Merge Device1 properties into the cache entry for path; mutex_ held
  BlueZDevice &update_device_locked(const std::string &path,
                                    DBusMessageIter *props);

  /// Emit a sighting for the device if it qualifies; mutex_ held
  void report_locked(BlueZDevice &device);

  /// Fill the device cache from GetManagedObjects without reporting
  Result<void> load_known_devices();

  void append_advertisement_properties(DBusMessageIter *iter) const;

  BleBackendConfig config_;
  DBusConnectionWrapper conn_;
  BlueZAdapter adapter_;

  /// Serializes lifecycle calls
  std::mutex lifecycle_mutex_;

  /// Guards stream_ and devices_ (touched by the bus thread)
  std::mutex mutex_;
  EventStream stream_;
  std::map<std::string, BlueZDevice> devices_;

  bool scanning_ = false; // guarded by mutex_
  std::atomic<bool> advertising_{false};
  bool object_registered_ = false;

  std::atomic<bool> stop_requested_{false};
  std::thread bus_thread_;
};

} // namespace platform
} // namespace pdrop

#endif // PDROP_PLATFORM_LINUX_BLUEZ_BLE_H
