/**
 * @file wpa_supplicant.h
 * @brief wpa_supplicant Wi-Fi Direct backend
 *
 * Internal header. Peer discovery is P2PDevice.Find; sightings arrive as
 * DeviceFound / DeviceFoundProperties signals and losses as DeviceLost.
 * A Find that wpa_supplicant ends on its own (FindStopped) is re-issued.
 * Advertising is P2PDevice.Listen, which keeps the device discoverable.
 */

#ifndef PDROP_PLATFORM_LINUX_WPA_SUPPLICANT_H
#define PDROP_PLATFORM_LINUX_WPA_SUPPLICANT_H

#include "dbus_helpers.h"
#include "pdrop/backend.h"
#include "pdrop/transports.h"
#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace pdrop {
namespace platform {

// wpa_supplicant D-Bus constants
constexpr const char *WPA_SERVICE = "fi.w1.wpa_supplicant1";
constexpr const char *WPA_PATH = "/fi/w1/wpa_supplicant1";
constexpr const char *WPA_IFACE = "fi.w1.wpa_supplicant1";
constexpr const char *WPA_IFACE_IFACE = "fi.w1.wpa_supplicant1.Interface";
constexpr const char *WPA_P2P_IFACE =
    "fi.w1.wpa_supplicant1.Interface.P2PDevice";

/**
 * @brief Wi-Fi Direct peer as seen through wpa_supplicant
 */
struct P2PPeer {
  std::string object_path;    // wpa_supplicant peer object path
  std::string device_address; // P2P device address
  std::string device_name;    // Device name
  bool reported = false;
};

/**
 * @brief Find the wpa_supplicant interface object to drive
 * @param ifname Interface name; empty picks the first non-group interface
 */
Result<std::string> find_wifi_interface(DBusConnection *conn,
                                        const std::string &ifname = {});

/**
 * @brief P2P device address from a peer object path
 *
 * wpa_supplicant names peers .../Peers/aabbccddeeff; returns
 * "aa:bb:cc:dd:ee:ff", or empty if the last component is not 12 hex digits.
 */
std::string address_from_peer_path(const std::string &peer_path);

/**
 * @brief Start P2P discovery (find peers)
 * @param timeout_seconds 0 searches until StopFind
 */
Result<void> p2p_find(DBusConnection *conn, const std::string &iface_path,
                      int32_t timeout_seconds = 0);

/**
 * @brief Stop P2P discovery
 */
Result<void> p2p_stop_find(DBusConnection *conn, const std::string &iface_path);

/**
 * @brief Stay discoverable without searching
 */
Result<void> p2p_listen(DBusConnection *conn, const std::string &iface_path);

/**
 * @brief React to a FindStopped we did not ask for
 *
 * While scanning, refind re-issues the Find. If that fails the scan is
 * over: scanning is cleared and the stream closed, which the orchestrator
 * sees as StreamClosed.
 * @return true if the scan continues
 */
bool resume_find(const std::string &backend, bool &scanning,
                 const EventStream &stream,
                 const std::function<Result<void>()> &refind);

/// True if wpa_supplicant is on the system bus with a usable interface
bool wifi_direct_available();

/**
 * @brief Wi-Fi Direct backend on a private system-bus connection
 */
class WifiDirectBackend final : public Backend,
                                public Discovery,
                                public Advertiser {
public:
  static Result<std::unique_ptr<WifiDirectBackend>>
  create(const WifiDirectBackendConfig &config);

  ~WifiDirectBackend() override;

  WifiDirectBackend(const WifiDirectBackend &) = delete;
  WifiDirectBackend &operator=(const WifiDirectBackend &) = delete;

  // Backend
  std::string name() const override { return config_.name; }
  TransportKind transport() const override {
    return TransportKind::WifiDirect;
  }
  Capabilities capabilities() const override { return Capabilities::both(); }
  Discovery *discovery() override { return this; }
  Advertiser *advertiser() override { return this; }

  // Discovery
  Result<void> start_scan() override;
  Result<void> stop_scan() override;
  EventStream poll_events() override;

  // Advertiser
  Result<void> broadcast() override;
  Result<void> stop_broadcast() override;

private:
  WifiDirectBackend(WifiDirectBackendConfig config, DBusConnectionWrapper conn,
                    std::string iface_path);

  Result<void> install_handlers();
  void bus_loop();

  static DBusHandlerResult on_signal(DBusConnection *conn, DBusMessage *msg,
                                     void *user_data);

  void handle_device_found(DBusMessage *msg, bool with_properties);
  void handle_device_lost(DBusMessage *msg);

  /// Emit a sighting for peer; mutex_ held
  void report_locked(P2PPeer &peer);

  WifiDirectBackendConfig config_;
  DBusConnectionWrapper conn_;
  std::string iface_path_;

  /// Serializes lifecycle calls
  std::mutex lifecycle_mutex_;

  /// Guards stream_, peers_ and scanning_ (touched by the bus thread)
  std::mutex mutex_;
  EventStream stream_;
  std::map<std::string, P2PPeer> peers_; // keyed by object path
  bool scanning_ = false;

  std::atomic<bool> listening_{false};
  std::atomic<bool> find_stopped_{false}; // set by on_signal
  std::atomic<bool> stop_requested_{false};
  std::thread bus_thread_;
};

} // namespace platform
} // namespace pdrop

#endif // PDROP_PLATFORM_LINUX_WPA_SUPPLICANT_H
