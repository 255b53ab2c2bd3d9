/**
 * @file bluez_ble.cpp
 * @brief BlueZ BLE backend implementation
 *
 * Scanning: Adapter1.SetDiscoveryFilter + StartDiscovery, with sightings
 * taken from ObjectManager.InterfacesAdded and Device1 PropertiesChanged
 * (RSSI), and losses from InterfacesRemoved.
 *
 * Advertising: an LEAdvertisement1 object exported at
 * PDROP_ADVERTISEMENT_PATH and registered with LEAdvertisingManager1.
 */

#include "bluez_ble.h"
#include "pdrop/log.h"
#include <algorithm>
#include <cctype>
#include <cstring>

namespace pdrop {
namespace platform {

namespace {

constexpr const char *OBJECT_MANAGER_IFACE =
    "org.freedesktop.DBus.ObjectManager";
constexpr const char *PROPERTIES_IFACE = "org.freedesktop.DBus.Properties";

std::string lowercase(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

/**
 * @brief Walk a GetManagedObjects / InterfacesAdded interface map
 *
 * iter points at an a{sa{sv}}; fn(interface, props_iter) is called for each
 * interface of the object.
 */
template <typename Fn> void for_each_interface(DBusMessageIter *iter, Fn fn) {
  if (dbus_message_iter_get_arg_type(iter) != DBUS_TYPE_ARRAY) {
    return;
  }
  DBusMessageIter ifaces;
  dbus_message_iter_recurse(iter, &ifaces);

  while (dbus_message_iter_get_arg_type(&ifaces) == DBUS_TYPE_DICT_ENTRY) {
    DBusMessageIter entry;
    dbus_message_iter_recurse(&ifaces, &entry);

    std::string iface;
    read_string(&entry, iface);
    dbus_message_iter_next(&entry);
    fn(iface, &entry);

    dbus_message_iter_next(&ifaces);
  }
}

/// Walk a{oa{sa{sv}}}: fn(path, interface, props_iter)
template <typename Fn>
void for_each_managed_object(DBusMessage *reply, Fn fn) {
  DBusMessageIter iter, objects;
  if (!dbus_message_iter_init(reply, &iter) ||
      dbus_message_iter_get_arg_type(&iter) != DBUS_TYPE_ARRAY) {
    return;
  }
  dbus_message_iter_recurse(&iter, &objects);

  while (dbus_message_iter_get_arg_type(&objects) == DBUS_TYPE_DICT_ENTRY) {
    DBusMessageIter entry;
    dbus_message_iter_recurse(&objects, &entry);

    std::string path;
    read_string(&entry, path);
    dbus_message_iter_next(&entry);

    for_each_interface(&entry, [&](const std::string &iface,
                                   DBusMessageIter *props) {
      fn(path, iface, props);
    });

    dbus_message_iter_next(&objects);
  }
}

bool under_adapter(const std::string &path, const std::string &adapter_path) {
  return path.size() > adapter_path.size() &&
         path.compare(0, adapter_path.size(), adapter_path) == 0 &&
         path[adapter_path.size()] == '/';
}

bool is_printable(const Bytes &bytes) {
  return !bytes.empty() &&
         std::all_of(bytes.begin(), bytes.end(), [](Byte b) {
           return std::isprint(static_cast<unsigned char>(b)) != 0;
         });
}

} // namespace

// ============================================================================
// BlueZ Adapter Discovery
// ============================================================================

Result<BlueZAdapter> find_adapter(DBusConnection *conn,
                                  const std::string &name) {
  auto reply = call_method(conn, BLUEZ_SERVICE, "/", OBJECT_MANAGER_IFACE,
                           "GetManagedObjects");
  if (reply.is_error()) {
    return reply.error();
  }

  std::map<std::string, BlueZAdapter> adapters;
  std::set<std::string> advertising_managers;

  for_each_managed_object(
      reply.value().get(), [&](const std::string &path,
                               const std::string &iface,
                               DBusMessageIter *props) {
        if (iface == BLUEZ_LE_ADV_MANAGER_IFACE) {
          advertising_managers.insert(path);
          return;
        }
        if (iface != BLUEZ_ADAPTER_IFACE) {
          return;
        }

        BlueZAdapter &adapter = adapters[path];
        adapter.object_path = path;
        for_each_dict_entry(props, [&](const std::string &key,
                                       DBusMessageIter *value) {
          if (key == "Address") {
            read_string(value, adapter.address);
          } else if (key == "Name") {
            read_string(value, adapter.name);
          } else if (key == "Powered" &&
                     dbus_message_iter_get_arg_type(value) ==
                         DBUS_TYPE_BOOLEAN) {
            dbus_bool_t powered = FALSE;
            dbus_message_iter_get_basic(value, &powered);
            adapter.powered = powered != FALSE;
          }
        });
      });

  for (auto &[path, adapter] : adapters) {
    auto slash = path.rfind('/');
    std::string short_name =
        slash == std::string::npos ? path : path.substr(slash + 1);
    if (!name.empty() && short_name != name) {
      continue;
    }
    adapter.can_advertise = advertising_managers.count(path) != 0;
    return adapter;
  }

  if (!name.empty()) {
    return Error(ErrorCode::NotFound, "Bluetooth adapter not found", name);
  }
  return Error(ErrorCode::NotFound, "No Bluetooth adapter found");
}

// ============================================================================
// Adapter Control
// ============================================================================

Result<void> set_adapter_powered(DBusConnection *conn,
                                 const std::string &adapter_path,
                                 bool powered) {
  dbus_bool_t value = powered ? TRUE : FALSE;
  return set_property(conn, BLUEZ_SERVICE, adapter_path.c_str(),
                      BLUEZ_ADAPTER_IFACE, "Powered", DBUS_TYPE_BOOLEAN,
                      &value);
}

Result<void> set_discovery_filter(DBusConnection *conn,
                                  const std::string &adapter_path,
                                  const BleBackendConfig &config) {
  DBusMessageWrapper msg(dbus_message_new_method_call(
      BLUEZ_SERVICE, adapter_path.c_str(), BLUEZ_ADAPTER_IFACE,
      "SetDiscoveryFilter"));
  if (!msg) {
    return Error(ErrorCode::PlatformError, "Failed to create D-Bus message");
  }

  DBusMessageIter iter, dict;
  dbus_message_iter_init_append(msg.get(), &iter);
  dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, "{sv}", &dict);

  append_dict_string(&dict, "Transport", "le");
  if (!config.service_uuid_filter.empty()) {
    append_dict_strings(&dict, "UUIDs", {config.service_uuid_filter});
  }
  if (config.rssi_threshold != 0) {
    append_dict_int16(&dict, "RSSI", config.rssi_threshold);
  }

  // Keep RSSI updates flowing for devices already seen
  {
    DBusMessageIter entry, variant;
    open_dict_entry(&dict, "DuplicateData", "b", &entry, &variant);
    dbus_bool_t duplicates = TRUE;
    dbus_message_iter_append_basic(&variant, DBUS_TYPE_BOOLEAN, &duplicates);
    close_dict_entry(&dict, &entry, &variant);
  }

  dbus_message_iter_close_container(&iter, &dict);

  auto reply = send_and_wait(conn, msg.get());
  if (reply.is_error()) {
    return reply.error();
  }
  return Result<void>::ok();
}

Result<void> start_discovery(DBusConnection *conn,
                             const std::string &adapter_path) {
  auto result = call_method(conn, BLUEZ_SERVICE, adapter_path.c_str(),
                            BLUEZ_ADAPTER_IFACE, "StartDiscovery");

  if (result.is_error()) {
    // Already discovering is not an error
    if (error_name_ends_with(result.error(), "InProgress")) {
      return Result<void>::ok();
    }
    return result.error();
  }

  return Result<void>::ok();
}

Result<void> stop_discovery(DBusConnection *conn,
                            const std::string &adapter_path) {
  auto result = call_method(conn, BLUEZ_SERVICE, adapter_path.c_str(),
                            BLUEZ_ADAPTER_IFACE, "StopDiscovery");

  if (result.is_error()) {
    // Not discovering is not an error
    if (result.error().message.find("No discovery started") !=
        std::string::npos) {
      return Result<void>::ok();
    }
    return result.error();
  }

  return Result<void>::ok();
}

PeerId resolve_peer_id(const BlueZDevice &device) {
  if (!device.pdrop_service_data.empty()) {
    if (is_printable(device.pdrop_service_data)) {
      return PeerId(std::string(device.pdrop_service_data.begin(),
                                device.pdrop_service_data.end()));
    }
    return PeerId::from_bytes(device.pdrop_service_data);
  }
  return PeerId(device.address);
}

// ============================================================================
// BlueZBackend Construction
// ============================================================================

Result<std::unique_ptr<BlueZBackend>>
BlueZBackend::create(const BleBackendConfig &config) {
  if (config.name.empty()) {
    return Error(ErrorCode::InitializationError, "BLE backend needs a name");
  }

  auto conn = open_private_system_bus();
  if (conn.is_error()) {
    return Error(ErrorCode::InitializationError, "System bus unavailable",
                 conn.error().message)
        .at(config.name);
  }

  auto adapter = find_adapter(conn.value().get(), config.adapter);
  if (adapter.is_error()) {
    return Error(ErrorCode::InitializationError, adapter.error().message,
                 adapter.error().details)
        .at(config.name);
  }

  std::unique_ptr<BlueZBackend> backend(new BlueZBackend(
      config, std::move(conn.value()), std::move(adapter.value())));

  auto installed = backend->install_handlers();
  if (installed.is_error()) {
    return Error(ErrorCode::InitializationError,
                 "Cannot subscribe to BlueZ signals",
                 installed.error().message)
        .at(config.name);
  }

  backend->bus_thread_ = std::thread([raw = backend.get()] { raw->bus_loop(); });

  PDROP_LOG_INFO("BLE backend '%s' on %s (%s), advertising %s",
                 config.name.c_str(), backend->adapter_.object_path.c_str(),
                 backend->adapter_.address.c_str(),
                 backend->adapter_.can_advertise ? "supported"
                                                 : "unsupported");
  return std::move(backend);
}

BlueZBackend::BlueZBackend(BleBackendConfig config, DBusConnectionWrapper conn,
                           BlueZAdapter adapter)
    : config_(std::move(config)), conn_(std::move(conn)),
      adapter_(std::move(adapter)) {}

BlueZBackend::~BlueZBackend() {
  {
    std::lock_guard<std::mutex> life(lifecycle_mutex_);
    if (advertising_.load()) {
      DBusMessageWrapper msg(dbus_message_new_method_call(
          BLUEZ_SERVICE, adapter_.object_path.c_str(),
          BLUEZ_LE_ADV_MANAGER_IFACE, "UnregisterAdvertisement"));
      if (msg) {
        const char *path = PDROP_ADVERTISEMENT_PATH;
        dbus_message_append_args(msg.get(), DBUS_TYPE_OBJECT_PATH, &path,
                                 DBUS_TYPE_INVALID);
        auto reply = send_and_wait(conn_.get(), msg.get());
        if (reply.is_error()) {
          PDROP_LOG_WARN("unregistering advertisement: %s",
                         reply.error().message.c_str());
        }
      }
    }

    bool scanning = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      scanning = scanning_;
      scanning_ = false;
      if (stream_) {
        stream_->close();
      }
    }
    if (scanning) {
      auto r = stop_discovery(conn_.get(), adapter_.object_path);
      if (r.is_error()) {
        PDROP_LOG_WARN("stopping discovery: %s", r.error().message.c_str());
      }
    }
  }

  stop_requested_ = true;
  if (bus_thread_.joinable()) {
    bus_thread_.join();
  }

  if (conn_) {
    if (object_registered_) {
      dbus_connection_unregister_object_path(conn_.get(),
                                             PDROP_ADVERTISEMENT_PATH);
    }
    dbus_connection_remove_filter(conn_.get(), &BlueZBackend::on_signal, this);
  }
}

Capabilities BlueZBackend::capabilities() const {
  return Capabilities{true, adapter_.can_advertise};
}

Advertiser *BlueZBackend::advertiser() {
  return adapter_.can_advertise ? this : nullptr;
}

Result<void> BlueZBackend::install_handlers() {
  DBusConnection *conn = conn_.get();

  if (!dbus_connection_add_filter(conn, &BlueZBackend::on_signal, this,
                                  nullptr)) {
    return Error(ErrorCode::PlatformError, "Out of memory adding filter");
  }

  PDROP_TRY(add_match(conn, "type='signal',sender='org.bluez',"
                            "interface='org.freedesktop.DBus.ObjectManager'"));
  PDROP_TRY(add_match(conn, "type='signal',sender='org.bluez',"
                            "interface='org.freedesktop.DBus.Properties',"
                            "member='PropertiesChanged',"
                            "arg0='org.bluez.Device1'"));

  if (adapter_.can_advertise) {
    static const DBusObjectPathVTable vtable = {
        nullptr, &BlueZBackend::on_advertisement_call, nullptr,
        nullptr, nullptr,                              nullptr};
    if (!dbus_connection_register_object_path(conn, PDROP_ADVERTISEMENT_PATH,
                                              &vtable, this)) {
      return Error(ErrorCode::PlatformError,
                   "Cannot export advertisement object");
    }
    object_registered_ = true;
  }

  return Result<void>::ok();
}

// ============================================================================
// Bus Thread
// ============================================================================

void BlueZBackend::bus_loop() {
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
  }
}

DBusHandlerResult BlueZBackend::on_signal(DBusConnection *conn,
                                          DBusMessage *msg, void *user_data) {
  PDROP_UNUSED(conn);
  auto *self = static_cast<BlueZBackend *>(user_data);

  if (dbus_message_is_signal(msg, OBJECT_MANAGER_IFACE, "InterfacesAdded")) {
    self->handle_interfaces_added(msg);
  } else if (dbus_message_is_signal(msg, OBJECT_MANAGER_IFACE,
                                    "InterfacesRemoved")) {
    self->handle_interfaces_removed(msg);
  } else if (dbus_message_is_signal(msg, PROPERTIES_IFACE,
                                    "PropertiesChanged")) {
    self->handle_properties_changed(msg);
  }

  return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
}

// ============================================================================
// Device Tracking
// ============================================================================

BlueZDevice &BlueZBackend::update_device_locked(const std::string &path,
                                                DBusMessageIter *props) {
  BlueZDevice &device = devices_[path];

  for_each_dict_entry(props, [&](const std::string &key,
                                 DBusMessageIter *value) {
    if (key == "Address") {
      read_string(value, device.address);
    } else if (key == "Alias" || (key == "Name" && device.name.empty())) {
      read_string(value, device.name);
    } else if (key == "RSSI") {
      int16_t rssi = 0;
      if (read_int16(value, rssi)) {
        device.rssi = rssi;
      }
    } else if (key == "UUIDs") {
      std::vector<std::string> uuids;
      read_strings(value, uuids);
      for (auto &u : uuids) {
        device.uuids.insert(lowercase(u));
      }
    } else if (key == "ServiceData") {
      for_each_dict_entry(value, [&](const std::string &uuid,
                                     DBusMessageIter *data) {
        std::string lower = lowercase(uuid);
        device.uuids.insert(lower);
        if (lower == PDROP_SERVICE_UUID) {
          read_bytes(data, device.pdrop_service_data);
        }
      });
    }
  });

  return device;
}

void BlueZBackend::report_locked(BlueZDevice &device) {
  if (!scanning_ || !stream_ || !device.rssi || device.address.empty()) {
    return;
  }
  if (!config_.service_uuid_filter.empty() &&
      device.uuids.count(lowercase(config_.service_uuid_filter)) == 0) {
    return;
  }
  if (config_.rssi_threshold != 0 && *device.rssi < config_.rssi_threshold) {
    return;
  }

  PeerId id = resolve_peer_id(device);

  // Identity can change once service data shows up after the address
  if (device.reported && device.reported_as != id) {
    PeerInfo gone;
    gone.id = device.reported_as;
    stream_->send(DiscoveryEvent::lost(std::move(gone)));
  }

  PeerInfo info;
  info.id = id;
  info.signal_dbm = *device.rssi;
  info.metadata["address"] = device.address;
  if (!device.name.empty()) {
    info.metadata["name"] = device.name;
  }
  stream_->send(DiscoveryEvent::discovered(std::move(info)));

  device.reported = true;
  device.reported_as = id;
}

void BlueZBackend::handle_interfaces_added(DBusMessage *msg) {
  DBusMessageIter iter;
  if (!dbus_message_iter_init(msg, &iter)) {
    return;
  }

  std::string path;
  if (!read_string(&iter, path) ||
      !under_adapter(path, adapter_.object_path)) {
    return;
  }
  dbus_message_iter_next(&iter);

  for_each_interface(&iter, [&](const std::string &iface,
                                DBusMessageIter *props) {
    if (iface != BLUEZ_DEVICE_IFACE) {
      return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    report_locked(update_device_locked(path, props));
  });
}

void BlueZBackend::handle_interfaces_removed(DBusMessage *msg) {
  DBusMessageIter iter;
  if (!dbus_message_iter_init(msg, &iter)) {
    return;
  }

  std::string path;
  if (!read_string(&iter, path)) {
    return;
  }
  dbus_message_iter_next(&iter);

  std::vector<std::string> ifaces;
  read_strings(&iter, ifaces);
  if (std::find(ifaces.begin(), ifaces.end(), BLUEZ_DEVICE_IFACE) ==
      ifaces.end()) {
    return;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  auto it = devices_.find(path);
  if (it == devices_.end()) {
    return;
  }
  if (it->second.reported && scanning_ && stream_) {
    PeerInfo gone;
    gone.id = it->second.reported_as;
    gone.metadata["address"] = it->second.address;
    stream_->send(DiscoveryEvent::lost(std::move(gone)));
  }
  devices_.erase(it);
}

void BlueZBackend::handle_properties_changed(DBusMessage *msg) {
  const char *raw_path = dbus_message_get_path(msg);
  if (!raw_path || !under_adapter(raw_path, adapter_.object_path)) {
    return;
  }

  DBusMessageIter iter;
  if (!dbus_message_iter_init(msg, &iter)) {
    return;
  }
  std::string iface;
  if (!read_string(&iter, iface) || iface != BLUEZ_DEVICE_IFACE) {
    return;
  }
  dbus_message_iter_next(&iter);

  bool sighting = false;
  for_each_dict_entry(&iter, [&](const std::string &key, DBusMessageIter *) {
    if (key == "RSSI" || key == "ServiceData") {
      sighting = true;
    }
  });

  std::lock_guard<std::mutex> lock(mutex_);
  BlueZDevice &device = update_device_locked(raw_path, &iter);
  if (sighting) {
    report_locked(device);
  }
}

Result<void> BlueZBackend::load_known_devices() {
  auto reply = call_method(conn_.get(), BLUEZ_SERVICE, "/",
                           OBJECT_MANAGER_IFACE, "GetManagedObjects");
  if (reply.is_error()) {
    return reply.error();
  }

  std::lock_guard<std::mutex> lock(mutex_);
  for_each_managed_object(
      reply.value().get(), [&](const std::string &path,
                               const std::string &iface,
                               DBusMessageIter *props) {
        if (iface == BLUEZ_DEVICE_IFACE &&
            under_adapter(path, adapter_.object_path)) {
          BlueZDevice &device = update_device_locked(path, props);
          // Cached RSSI is not a current sighting
          device.rssi.reset();
        }
      });
  return Result<void>::ok();
}

// ============================================================================
// Discovery
// ============================================================================

Result<void> BlueZBackend::start_scan() {
  std::lock_guard<std::mutex> life(lifecycle_mutex_);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (scanning_) {
      return Result<void>::ok();
    }
  }

  if (!adapter_.powered) {
    auto powered = set_adapter_powered(conn_.get(), adapter_.object_path, true);
    if (powered.is_error()) {
      return operation_failed(config_.name, "Adapter is powered off",
                              powered.error());
    }
    adapter_.powered = true;
  }

  auto known = load_known_devices();
  if (known.is_error()) {
    PDROP_LOG_WARN("'%s': cannot list known devices: %s",
                   config_.name.c_str(), known.error().message.c_str());
  }

  auto filter = set_discovery_filter(conn_.get(), adapter_.object_path, config_);
  if (filter.is_error()) {
    return operation_failed(config_.name, "SetDiscoveryFilter failed",
                            filter.error());
  }

  auto started = start_discovery(conn_.get(), adapter_.object_path);
  if (started.is_error()) {
    return operation_failed(config_.name, "StartDiscovery failed",
                            started.error());
  }

  std::lock_guard<std::mutex> lock(mutex_);
  stream_ = make_event_stream();
  for (auto &[path, device] : devices_) {
    device.reported = false;
  }
  scanning_ = true;
  PDROP_LOG_DEBUG("'%s' discovering on %s", config_.name.c_str(),
                  adapter_.object_path.c_str());
  return Result<void>::ok();
}

Result<void> BlueZBackend::stop_scan() {
  std::lock_guard<std::mutex> life(lifecycle_mutex_);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!scanning_) {
      return Result<void>::ok();
    }
    scanning_ = false;
    stream_->close();
  }

  auto stopped = stop_discovery(conn_.get(), adapter_.object_path);
  if (stopped.is_error()) {
    return Error(ErrorCode::OperationError, "StopDiscovery failed",
                 stopped.error().message)
        .at(config_.name);
  }
  return Result<void>::ok();
}

EventStream BlueZBackend::poll_events() {
  std::lock_guard<std::mutex> lock(mutex_);
  return stream_ ? stream_ : make_closed_event_stream();
}

// ============================================================================
// Advertising
// ============================================================================

void BlueZBackend::append_advertisement_properties(DBusMessageIter *dict) const {
  append_dict_string(dict, "Type", "peripheral");
  append_dict_strings(dict, "ServiceUUIDs", {PDROP_SERVICE_UUID});

  if (!config_.local_peer_id.empty()) {
    DBusMessageIter entry, variant, data_dict, data_entry, data_variant;
    open_dict_entry(dict, "ServiceData", "a{sv}", &entry, &variant);
    dbus_message_iter_open_container(&variant, DBUS_TYPE_ARRAY, "{sv}",
                                     &data_dict);
    open_dict_entry(&data_dict, PDROP_SERVICE_UUID, "ay", &data_entry,
                    &data_variant);
    append_byte_array(&data_variant, Bytes(config_.local_peer_id.begin(),
                                           config_.local_peer_id.end()));
    close_dict_entry(&data_dict, &data_entry, &data_variant);
    dbus_message_iter_close_container(&variant, &data_dict);
    close_dict_entry(dict, &entry, &variant);
  }
}

DBusHandlerResult BlueZBackend::on_advertisement_call(DBusConnection *conn,
                                                      DBusMessage *msg,
                                                      void *user_data) {
  auto *self = static_cast<BlueZBackend *>(user_data);
  DBusMessageWrapper reply;

  if (dbus_message_is_method_call(msg, PROPERTIES_IFACE, "GetAll")) {
    reply = DBusMessageWrapper(dbus_message_new_method_return(msg));
    if (!reply) {
      return DBUS_HANDLER_RESULT_NEED_MEMORY;
    }
    DBusMessageIter iter, dict;
    dbus_message_iter_init_append(reply.get(), &iter);
    dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, "{sv}", &dict);
    self->append_advertisement_properties(&dict);
    dbus_message_iter_close_container(&iter, &dict);
  } else if (dbus_message_is_method_call(msg, BLUEZ_LE_ADV_IFACE,
                                         "Release")) {
    PDROP_LOG_INFO("'%s' advertisement released by BlueZ",
                   self->config_.name.c_str());
    self->advertising_ = false;
    reply = DBusMessageWrapper(dbus_message_new_method_return(msg));
  } else {
    reply = DBusMessageWrapper(dbus_message_new_error(
        msg, DBUS_ERROR_UNKNOWN_METHOD, "Unsupported call"));
  }

  if (reply) {
    dbus_connection_send(conn, reply.get(), nullptr);
  }
  return DBUS_HANDLER_RESULT_HANDLED;
}

Result<void> BlueZBackend::broadcast() {
  std::lock_guard<std::mutex> life(lifecycle_mutex_);
  if (!adapter_.can_advertise) {
    return Error(ErrorCode::CapabilityUnsupported,
                 "Adapter has no LE advertising manager")
        .at(config_.name);
  }
  if (advertising_.load()) {
    return Result<void>::ok();
  }

  DBusMessageWrapper msg(dbus_message_new_method_call(
      BLUEZ_SERVICE, adapter_.object_path.c_str(), BLUEZ_LE_ADV_MANAGER_IFACE,
      "RegisterAdvertisement"));
  if (!msg) {
    return Error(ErrorCode::PlatformError, "Failed to create D-Bus message");
  }

  DBusMessageIter iter, options;
  dbus_message_iter_init_append(msg.get(), &iter);
  const char *path = PDROP_ADVERTISEMENT_PATH;
  dbus_message_iter_append_basic(&iter, DBUS_TYPE_OBJECT_PATH, &path);
  dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, "{sv}", &options);
  dbus_message_iter_close_container(&iter, &options);

  auto reply = send_and_wait(conn_.get(), msg.get());
  if (reply.is_error()) {
    return operation_failed(config_.name, "RegisterAdvertisement failed",
                            reply.error());
  }

  advertising_ = true;
  PDROP_LOG_DEBUG("'%s' advertising", config_.name.c_str());
  return Result<void>::ok();
}

Result<void> BlueZBackend::stop_broadcast() {
  std::lock_guard<std::mutex> life(lifecycle_mutex_);
  if (!adapter_.can_advertise) {
    return Error(ErrorCode::CapabilityUnsupported,
                 "Adapter has no LE advertising manager")
        .at(config_.name);
  }
  if (!advertising_.load()) {
    return Result<void>::ok();
  }

  DBusMessageWrapper msg(dbus_message_new_method_call(
      BLUEZ_SERVICE, adapter_.object_path.c_str(), BLUEZ_LE_ADV_MANAGER_IFACE,
      "UnregisterAdvertisement"));
  if (!msg) {
    return Error(ErrorCode::PlatformError, "Failed to create D-Bus message");
  }
  const char *path = PDROP_ADVERTISEMENT_PATH;
  dbus_message_append_args(msg.get(), DBUS_TYPE_OBJECT_PATH, &path,
                           DBUS_TYPE_INVALID);

  auto reply = send_and_wait(conn_.get(), msg.get());
  advertising_ = false;
  if (reply.is_error() && !error_name_ends_with(reply.error(), "DoesNotExist")) {
    return Error(ErrorCode::OperationError, "UnregisterAdvertisement failed",
                 reply.error().message)
        .at(config_.name);
  }
  return Result<void>::ok();
}

// ============================================================================
// Availability
// ============================================================================

bool bluetooth_available() {
  auto conn = open_private_system_bus();
  if (conn.is_error()) {
    return false;
  }
  return find_adapter(conn.value().get()).is_ok();
}

} // namespace platform
} // namespace pdrop
