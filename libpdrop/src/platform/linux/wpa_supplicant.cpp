/**
 * @file wpa_supplicant.cpp
 * @brief wpa_supplicant Wi-Fi Direct backend implementation
 */

#include "wpa_supplicant.h"
#include "pdrop/log.h"
#include <cctype>

namespace pdrop {
namespace platform {

// ============================================================================
// Interface Discovery
// ============================================================================

Result<std::string> find_wifi_interface(DBusConnection *conn,
                                        const std::string &ifname) {
  if (!ifname.empty()) {
    DBusMessageWrapper msg(dbus_message_new_method_call(
        WPA_SERVICE, WPA_PATH, WPA_IFACE, "GetInterface"));
    if (!msg) {
      return Error(ErrorCode::PlatformError, "Failed to create D-Bus message");
    }

    const char *name = ifname.c_str();
    dbus_message_append_args(msg.get(), DBUS_TYPE_STRING, &name,
                             DBUS_TYPE_INVALID);

    auto reply = send_and_wait(conn, msg.get());
    if (reply.is_error()) {
      return Error(ErrorCode::NotFound, "wpa_supplicant does not manage " +
                                            ifname,
                   reply.error().message);
    }

    const char *path = nullptr;
    if (!dbus_message_get_args(reply.value().get(), nullptr,
                               DBUS_TYPE_OBJECT_PATH, &path,
                               DBUS_TYPE_INVALID)) {
      return Error(ErrorCode::PlatformError, "Failed to parse interface path");
    }
    return std::string(path);
  }

  auto interfaces = get_path_array_property(conn, WPA_SERVICE, WPA_PATH,
                                            WPA_IFACE, "Interfaces");
  if (interfaces.is_error()) {
    return interfaces.error();
  }

  for (const auto &path : interfaces.value()) {
    auto name = get_string_property(conn, WPA_SERVICE, path.c_str(),
                                    WPA_IFACE_IFACE, "Ifname");
    if (name.is_error()) {
      continue;
    }
    // Group interfaces come and go with connections
    if (name.value().compare(0, 4, "p2p-") == 0) {
      continue;
    }
    return path;
  }

  return Error(ErrorCode::NotFound, "No WiFi interface found");
}

std::string address_from_peer_path(const std::string &peer_path) {
  auto slash = peer_path.rfind('/');
  std::string hex =
      slash == std::string::npos ? peer_path : peer_path.substr(slash + 1);
  if (hex.size() != 12) {
    return {};
  }

  std::string address;
  for (size_t i = 0; i < hex.size(); ++i) {
    if (!std::isxdigit(static_cast<unsigned char>(hex[i]))) {
      return {};
    }
    if (i > 0 && i % 2 == 0) {
      address += ':';
    }
    address += static_cast<char>(
        std::tolower(static_cast<unsigned char>(hex[i])));
  }
  return address;
}

// ============================================================================
// P2P Operations
// ============================================================================

Result<void> p2p_find(DBusConnection *conn, const std::string &iface_path,
                      int32_t timeout_seconds) {
  DBusMessageWrapper msg(dbus_message_new_method_call(
      WPA_SERVICE, iface_path.c_str(), WPA_P2P_IFACE, "Find"));

  if (!msg) {
    return Error(ErrorCode::PlatformError, "Failed to create D-Bus message");
  }

  DBusMessageIter iter, dict_iter;
  dbus_message_iter_init_append(msg.get(), &iter);
  dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, "{sv}", &dict_iter);
  if (timeout_seconds > 0) {
    append_dict_int32(&dict_iter, "Timeout", timeout_seconds);
  }
  dbus_message_iter_close_container(&iter, &dict_iter);

  auto reply = send_and_wait(conn, msg.get());
  if (reply.is_error()) {
    return reply.error();
  }
  return Result<void>::ok();
}

Result<void> p2p_stop_find(DBusConnection *conn,
                           const std::string &iface_path) {
  auto result = call_method(conn, WPA_SERVICE, iface_path.c_str(),
                            WPA_P2P_IFACE, "StopFind");
  if (result.is_error()) {
    return result.error();
  }
  return Result<void>::ok();
}

Result<void> p2p_listen(DBusConnection *conn, const std::string &iface_path) {
  DBusMessageWrapper msg(dbus_message_new_method_call(
      WPA_SERVICE, iface_path.c_str(), WPA_P2P_IFACE, "Listen"));

  if (!msg) {
    return Error(ErrorCode::PlatformError, "Failed to create D-Bus message");
  }

  // 0 = listen until told otherwise
  dbus_int32_t period = 0;
  dbus_message_append_args(msg.get(), DBUS_TYPE_INT32, &period,
                           DBUS_TYPE_INVALID);

  auto reply = send_and_wait(conn, msg.get());
  if (reply.is_error()) {
    return reply.error();
  }
  return Result<void>::ok();
}

bool wifi_direct_available() {
  auto conn = open_private_system_bus();
  if (conn.is_error()) {
    return false;
  }
  return find_wifi_interface(conn.value().get()).is_ok();
}

bool resume_find(const std::string &backend, bool &scanning,
                 const EventStream &stream,
                 const std::function<Result<void>()> &refind) {
  if (!scanning) {
    return false;
  }

  auto found = refind();
  if (found.is_ok()) {
    PDROP_LOG_DEBUG("'%s' Find ended, searching again", backend.c_str());
    return true;
  }

  PDROP_LOG_ERROR("'%s' cannot resume P2P Find: %s", backend.c_str(),
                  found.error().to_string().c_str());
  scanning = false;
  if (stream) {
    stream->close();
  }
  return false;
}

// ============================================================================
// WifiDirectBackend Construction
// ============================================================================

Result<std::unique_ptr<WifiDirectBackend>>
WifiDirectBackend::create(const WifiDirectBackendConfig &config) {
  if (config.name.empty()) {
    return Error(ErrorCode::InitializationError,
                 "Wi-Fi Direct backend needs a name");
  }

  auto conn = open_private_system_bus();
  if (conn.is_error()) {
    return Error(ErrorCode::InitializationError, "System bus unavailable",
                 conn.error().message)
        .at(config.name);
  }

  auto iface = find_wifi_interface(conn.value().get(), config.interface);
  if (iface.is_error()) {
    return Error(ErrorCode::InitializationError, iface.error().message,
                 iface.error().details)
        .at(config.name);
  }

  std::unique_ptr<WifiDirectBackend> backend(new WifiDirectBackend(
      config, std::move(conn.value()), std::move(iface.value())));

  auto installed = backend->install_handlers();
  if (installed.is_error()) {
    return Error(ErrorCode::InitializationError,
                 "Cannot subscribe to wpa_supplicant signals",
                 installed.error().message)
        .at(config.name);
  }

  backend->bus_thread_ =
      std::thread([raw = backend.get()] { raw->bus_loop(); });

  PDROP_LOG_INFO("Wi-Fi Direct backend '%s' on %s", config.name.c_str(),
                 backend->iface_path_.c_str());
  return std::move(backend);
}

WifiDirectBackend::WifiDirectBackend(WifiDirectBackendConfig config,
                                     DBusConnectionWrapper conn,
                                     std::string iface_path)
    : config_(std::move(config)), conn_(std::move(conn)),
      iface_path_(std::move(iface_path)) {}

WifiDirectBackend::~WifiDirectBackend() {
  {
    std::lock_guard<std::mutex> life(lifecycle_mutex_);
    bool finding = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      finding = scanning_;
      scanning_ = false;
      if (stream_) {
        stream_->close();
      }
    }
    if (finding || listening_.load()) {
      auto r = p2p_stop_find(conn_.get(), iface_path_);
      if (r.is_error()) {
        PDROP_LOG_WARN("'%s' StopFind on teardown: %s", config_.name.c_str(),
                       r.error().message.c_str());
      }
      listening_ = false;
    }
  }

  stop_requested_ = true;
  if (bus_thread_.joinable()) {
    bus_thread_.join();
  }

  if (conn_) {
    dbus_connection_remove_filter(conn_.get(), &WifiDirectBackend::on_signal,
                                  this);
  }
}

Result<void> WifiDirectBackend::install_handlers() {
  if (!dbus_connection_add_filter(conn_.get(), &WifiDirectBackend::on_signal,
                                  this, nullptr)) {
    return Error(ErrorCode::PlatformError, "Out of memory adding filter");
  }

  std::string rule = "type='signal',interface='";
  rule += WPA_P2P_IFACE;
  rule += "',path='" + iface_path_ + "'";
  return add_match(conn_.get(), rule);
}

// ============================================================================
// Bus Thread
// ============================================================================

void WifiDirectBackend::bus_loop() {
  while (!stop_requested_.load()) {
    if (!dbus_connection_read_write_dispatch(conn_.get(), 100)) {
      PDROP_LOG_ERROR("'%s' lost its system bus connection",
                      config_.name.c_str());
      std::lock_guard<std::mutex> lock(mutex_);
      scanning_ = false;
      if (stream_) {
        stream_->close();
      }
      return;
    }

    // Re-issue outside the filter; lifecycle_mutex_ keeps stop_scan out
    if (find_stopped_.exchange(false)) {
      std::lock_guard<std::mutex> life(lifecycle_mutex_);
      std::lock_guard<std::mutex> lock(mutex_);
      resume_find(config_.name, scanning_, stream_, [this] {
        return p2p_find(conn_.get(), iface_path_,
                        config_.find_timeout_seconds);
      });
    }
  }
}

DBusHandlerResult WifiDirectBackend::on_signal(DBusConnection *conn,
                                               DBusMessage *msg,
                                               void *user_data) {
  PDROP_UNUSED(conn);
  auto *self = static_cast<WifiDirectBackend *>(user_data);

  if (dbus_message_is_signal(msg, WPA_P2P_IFACE, "DeviceFoundProperties")) {
    self->handle_device_found(msg, true);
  } else if (dbus_message_is_signal(msg, WPA_P2P_IFACE, "DeviceFound")) {
    self->handle_device_found(msg, false);
  } else if (dbus_message_is_signal(msg, WPA_P2P_IFACE, "DeviceLost")) {
    self->handle_device_lost(msg);
  } else if (dbus_message_is_signal(msg, WPA_P2P_IFACE, "FindStopped")) {
    self->find_stopped_ = true;
  }

  return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
}

// ============================================================================
// Peer Tracking
// ============================================================================

void WifiDirectBackend::report_locked(P2PPeer &peer) {
  if (!scanning_ || !stream_ || peer.device_address.empty()) {
    return;
  }

  PeerInfo info;
  info.id = PeerId(peer.device_address);
  info.metadata["address"] = peer.device_address;
  if (!peer.device_name.empty()) {
    info.metadata["name"] = peer.device_name;
  }
  stream_->send(DiscoveryEvent::discovered(std::move(info)));
  peer.reported = true;
}

void WifiDirectBackend::handle_device_found(DBusMessage *msg,
                                            bool with_properties) {
  DBusMessageIter iter;
  if (!dbus_message_iter_init(msg, &iter)) {
    return;
  }

  std::string path;
  if (!read_string(&iter, path)) {
    return;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  P2PPeer &peer = peers_[path];
  peer.object_path = path;
  if (peer.device_address.empty()) {
    peer.device_address = address_from_peer_path(path);
  }

  if (with_properties) {
    dbus_message_iter_next(&iter);
    for_each_dict_entry(&iter, [&](const std::string &key,
                                   DBusMessageIter *value) {
      if (key == "DeviceName") {
        read_string(value, peer.device_name);
      }
    });
  }

  report_locked(peer);
}

void WifiDirectBackend::handle_device_lost(DBusMessage *msg) {
  DBusMessageIter iter;
  if (!dbus_message_iter_init(msg, &iter)) {
    return;
  }

  std::string path;
  if (!read_string(&iter, path)) {
    return;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  auto it = peers_.find(path);
  if (it == peers_.end()) {
    return;
  }
  if (it->second.reported && scanning_ && stream_) {
    PeerInfo gone;
    gone.id = PeerId(it->second.device_address);
    stream_->send(DiscoveryEvent::lost(std::move(gone)));
  }
  peers_.erase(it);
}

// ============================================================================
// Discovery
// ============================================================================

Result<void> WifiDirectBackend::start_scan() {
  std::lock_guard<std::mutex> life(lifecycle_mutex_);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (scanning_) {
      return Result<void>::ok();
    }
  }

  auto found = p2p_find(conn_.get(), iface_path_, config_.find_timeout_seconds);
  if (found.is_error()) {
    return operation_failed(config_.name, "P2P Find failed", found.error());
  }

  std::lock_guard<std::mutex> lock(mutex_);
  stream_ = make_event_stream();
  for (auto &[path, peer] : peers_) {
    peer.reported = false;
  }
  scanning_ = true;
  PDROP_LOG_DEBUG("'%s' finding peers", config_.name.c_str());
  return Result<void>::ok();
}

Result<void> WifiDirectBackend::stop_scan() {
  std::lock_guard<std::mutex> life(lifecycle_mutex_);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!scanning_) {
      return Result<void>::ok();
    }
    scanning_ = false;
    stream_->close();
  }

  auto stopped = p2p_stop_find(conn_.get(), iface_path_);
  if (stopped.is_error()) {
    return Error(ErrorCode::OperationError, "P2P StopFind failed",
                 stopped.error().message)
        .at(config_.name);
  }

  // StopFind also ends Listen
  if (listening_.load()) {
    auto relisten = p2p_listen(conn_.get(), iface_path_);
    if (relisten.is_error()) {
      PDROP_LOG_WARN("'%s' could not resume listening: %s",
                     config_.name.c_str(), relisten.error().message.c_str());
      listening_ = false;
    }
  }
  return Result<void>::ok();
}

EventStream WifiDirectBackend::poll_events() {
  std::lock_guard<std::mutex> lock(mutex_);
  return stream_ ? stream_ : make_closed_event_stream();
}

// ============================================================================
// Advertising
// ============================================================================

Result<void> WifiDirectBackend::broadcast() {
  std::lock_guard<std::mutex> life(lifecycle_mutex_);
  if (listening_.load()) {
    return Result<void>::ok();
  }

  {
    // Find already alternates search and listen states
    std::lock_guard<std::mutex> lock(mutex_);
    if (scanning_) {
      listening_ = true;
      return Result<void>::ok();
    }
  }

  auto listened = p2p_listen(conn_.get(), iface_path_);
  if (listened.is_error()) {
    return operation_failed(config_.name, "P2P Listen failed",
                            listened.error());
  }
  listening_ = true;
  return Result<void>::ok();
}

Result<void> WifiDirectBackend::stop_broadcast() {
  std::lock_guard<std::mutex> life(lifecycle_mutex_);
  if (!listening_.load()) {
    return Result<void>::ok();
  }
  listening_ = false;

  bool scanning = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    scanning = scanning_;
  }
  // Leave an active Find alone; it owns the radio state
  if (scanning) {
    return Result<void>::ok();
  }

  auto stopped = p2p_stop_find(conn_.get(), iface_path_);
  if (stopped.is_error()) {
    return Error(ErrorCode::OperationError, "P2P StopFind failed",
                 stopped.error().message)
        .at(config_.name);
  }
  return Result<void>::ok();
}

} // namespace platform
} // namespace pdrop
