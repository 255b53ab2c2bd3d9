/**
 * @file dbus_helpers.h
 * @brief D-Bus utility functions for Linux platform layer
 *
 * Provides RAII wrappers and message helpers for working with libdbus,
 * used by both the BlueZ and wpa_supplicant backends.
 */

#ifndef PDROP_PLATFORM_LINUX_DBUS_HELPERS_H
#define PDROP_PLATFORM_LINUX_DBUS_HELPERS_H

#include "pdrop/error.h"
#include "pdrop/types.h"
#include <dbus/dbus.h>
#include <map>
#include <string>
#include <vector>

namespace pdrop {
namespace platform {

/// Timeout for ordinary method calls to platform daemons
constexpr int DBUS_CALL_TIMEOUT_MS = 5000;

// ============================================================================
// D-Bus Connection RAII Wrapper
// ============================================================================

/**
 * @brief RAII wrapper for DBusConnection
 *
 * A private connection is closed before its last reference is dropped.
 */
class DBusConnectionWrapper {
public:
  DBusConnectionWrapper() = default;

  explicit DBusConnectionWrapper(DBusConnection *conn, bool is_private = false)
      : conn_(conn), private_(is_private) {}

  ~DBusConnectionWrapper() { reset(); }

  // Move-only
  DBusConnectionWrapper(DBusConnectionWrapper &&other) noexcept
      : conn_(other.conn_), private_(other.private_) {
    other.conn_ = nullptr;
  }

  DBusConnectionWrapper &operator=(DBusConnectionWrapper &&other) noexcept {
    if (this != &other) {
      reset();
      conn_ = other.conn_;
      private_ = other.private_;
      other.conn_ = nullptr;
    }
    return *this;
  }

  DBusConnectionWrapper(const DBusConnectionWrapper &) = delete;
  DBusConnectionWrapper &operator=(const DBusConnectionWrapper &) = delete;

  DBusConnection *get() const { return conn_; }
  explicit operator bool() const { return conn_ != nullptr; }

  void reset() {
    if (conn_) {
      if (private_) {
        dbus_connection_close(conn_);
      }
      dbus_connection_unref(conn_);
      conn_ = nullptr;
    }
  }

private:
  DBusConnection *conn_ = nullptr;
  bool private_ = false;
};

// ============================================================================
// D-Bus Message RAII Wrapper
// ============================================================================

/**
 * @brief RAII wrapper for DBusMessage
 */
class DBusMessageWrapper {
public:
  DBusMessageWrapper() = default;

  explicit DBusMessageWrapper(DBusMessage *msg) : msg_(msg) {}

  ~DBusMessageWrapper() {
    if (msg_) {
      dbus_message_unref(msg_);
    }
  }

  // Move-only
  DBusMessageWrapper(DBusMessageWrapper &&other) noexcept : msg_(other.msg_) {
    other.msg_ = nullptr;
  }

  DBusMessageWrapper &operator=(DBusMessageWrapper &&other) noexcept {
    if (this != &other) {
      if (msg_) {
        dbus_message_unref(msg_);
      }
      msg_ = other.msg_;
      other.msg_ = nullptr;
    }
    return *this;
  }

  DBusMessageWrapper(const DBusMessageWrapper &) = delete;
  DBusMessageWrapper &operator=(const DBusMessageWrapper &) = delete;

  DBusMessage *get() const { return msg_; }
  explicit operator bool() const { return msg_ != nullptr; }

private:
  DBusMessage *msg_ = nullptr;
};

// ============================================================================
// D-Bus Error Helper
// ============================================================================

/**
 * @brief Convert DBusError to pdrop Error
 */
inline Error dbus_error_to_pdrop(const DBusError &err,
                                 ErrorCode code = ErrorCode::PlatformError) {
  if (!dbus_error_is_set(&err)) {
    return Error(code, "D-Bus call failed");
  }

  std::string message = err.name ? std::string(err.name) : "D-Bus error";
  if (err.message) {
    message += ": ";
    message += err.message;
  }

  return Error(code, message);
}

/**
 * @brief RAII wrapper for DBusError
 */
class DBusErrorWrapper {
public:
  DBusErrorWrapper() { dbus_error_init(&err_); }
  ~DBusErrorWrapper() { dbus_error_free(&err_); }

  DBusErrorWrapper(const DBusErrorWrapper &) = delete;
  DBusErrorWrapper &operator=(const DBusErrorWrapper &) = delete;

  DBusError *get() { return &err_; }
  bool is_set() const { return dbus_error_is_set(&err_); }
  Error to_error(ErrorCode code = ErrorCode::PlatformError) const {
    return dbus_error_to_pdrop(err_, code);
  }

  bool has_name(const char *name) const {
    return is_set() && dbus_error_has_name(&err_, name);
  }

private:
  DBusError err_;
};

/// True if a D-Bus error name ends with suffix (e.g. "InProgress")
inline bool error_name_ends_with(const Error &err, const std::string &suffix) {
  auto colon = err.message.find(':');
  std::string name = err.message.substr(0, colon);
  return name.size() >= suffix.size() &&
         name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
}

/**
 * @brief A failed platform call inside a backend lifecycle operation
 *
 * Lifecycle failures are always OperationError; the daemon's own error
 * ("org.bluez.Error.NotReady: ...") goes into details.
 */
inline Error operation_failed(const std::string &backend,
                              const std::string &what, const Error &cause) {
  Error err(ErrorCode::OperationError, what, cause.message);
  err.at(backend);
  return err;
}

// ============================================================================
// Connections and Calls
// ============================================================================

/**
 * @brief Open a private system bus connection
 *
 * The caller owns the connection exclusively; it is closed when the
 * wrapper is destroyed.
 */
inline Result<DBusConnectionWrapper> open_private_system_bus() {
  dbus_threads_init_default();

  DBusErrorWrapper error;
  DBusConnection *conn = dbus_bus_get_private(DBUS_BUS_SYSTEM, error.get());
  if (!conn || error.is_set()) {
    return error.to_error(ErrorCode::ServiceUnavailable);
  }

  dbus_connection_set_exit_on_disconnect(conn, FALSE);
  return DBusConnectionWrapper(conn, true);
}

/**
 * @brief Send a prepared method call and wait for its reply
 */
inline Result<DBusMessageWrapper>
send_and_wait(DBusConnection *conn, DBusMessage *msg,
              int timeout_ms = DBUS_CALL_TIMEOUT_MS) {
  DBusErrorWrapper error;
  DBusMessage *reply =
      dbus_connection_send_with_reply_and_block(conn, msg, timeout_ms,
                                                error.get());

  if (!reply || error.is_set()) {
    if (reply) {
      dbus_message_unref(reply);
    }
    return error.to_error();
  }

  return DBusMessageWrapper(reply);
}

/**
 * @brief Call a D-Bus method without arguments and get reply
 * @param conn D-Bus connection
 * @param dest Destination service name
 * @param path Object path
 * @param iface Interface name
 * @param method Method name
 * @param timeout_ms Timeout in milliseconds
 * @return Reply message or error
 */
inline Result<DBusMessageWrapper>
call_method(DBusConnection *conn, const char *dest, const char *path,
            const char *iface, const char *method,
            int timeout_ms = DBUS_CALL_TIMEOUT_MS) {

  DBusMessageWrapper msg(
      dbus_message_new_method_call(dest, path, iface, method));

  if (!msg) {
    return Error(ErrorCode::PlatformError, "Failed to create D-Bus message");
  }

  return send_and_wait(conn, msg.get(), timeout_ms);
}

/**
 * @brief Get a property as a variant from a D-Bus object
 *
 * On success variant_iter points at the value inside the variant; reply
 * keeps the underlying message alive.
 */
inline Result<void> get_property(DBusConnection *conn, const char *dest,
                                 const char *path, const char *iface,
                                 const char *property,
                                 DBusMessageWrapper &reply,
                                 DBusMessageIter &variant_iter) {
  DBusMessageWrapper msg(dbus_message_new_method_call(
      dest, path, "org.freedesktop.DBus.Properties", "Get"));

  if (!msg) {
    return Error(ErrorCode::PlatformError, "Failed to create D-Bus message");
  }

  dbus_message_append_args(msg.get(), DBUS_TYPE_STRING, &iface,
                           DBUS_TYPE_STRING, &property, DBUS_TYPE_INVALID);

  auto result = send_and_wait(conn, msg.get());
  if (result.is_error()) {
    return result.error();
  }
  reply = std::move(result.value());

  DBusMessageIter iter;
  if (!dbus_message_iter_init(reply.get(), &iter) ||
      dbus_message_iter_get_arg_type(&iter) != DBUS_TYPE_VARIANT) {
    return Error(ErrorCode::PlatformError, "Expected variant type");
  }

  dbus_message_iter_recurse(&iter, &variant_iter);
  return Result<void>::ok();
}

/**
 * @brief Get a string property from a D-Bus object
 */
inline Result<std::string>
get_string_property(DBusConnection *conn, const char *dest, const char *path,
                    const char *iface, const char *property) {
  DBusMessageWrapper reply;
  DBusMessageIter variant_iter;
  PDROP_TRY(get_property(conn, dest, path, iface, property, reply,
                         variant_iter));

  if (dbus_message_iter_get_arg_type(&variant_iter) != DBUS_TYPE_STRING) {
    return Error(ErrorCode::PlatformError, "Expected string in variant");
  }

  const char *value = nullptr;
  dbus_message_iter_get_basic(&variant_iter, &value);

  return std::string(value ? value : "");
}

/**
 * @brief Get an object-path array property (type "ao")
 */
inline Result<std::vector<std::string>>
get_path_array_property(DBusConnection *conn, const char *dest,
                        const char *path, const char *iface,
                        const char *property) {
  DBusMessageWrapper reply;
  DBusMessageIter variant_iter;
  PDROP_TRY(get_property(conn, dest, path, iface, property, reply,
                         variant_iter));

  if (dbus_message_iter_get_arg_type(&variant_iter) != DBUS_TYPE_ARRAY) {
    return Error(ErrorCode::PlatformError, "Expected array in variant");
  }

  std::vector<std::string> paths;
  DBusMessageIter array_iter;
  dbus_message_iter_recurse(&variant_iter, &array_iter);
  while (dbus_message_iter_get_arg_type(&array_iter) ==
         DBUS_TYPE_OBJECT_PATH) {
    const char *p = nullptr;
    dbus_message_iter_get_basic(&array_iter, &p);
    if (p) {
      paths.emplace_back(p);
    }
    dbus_message_iter_next(&array_iter);
  }
  return paths;
}

/**
 * @brief Set a property on a D-Bus object
 */
inline Result<void> set_property(DBusConnection *conn, const char *dest,
                                 const char *path, const char *iface,
                                 const char *property, int type,
                                 const void *value) {
  DBusMessageWrapper msg(dbus_message_new_method_call(
      dest, path, "org.freedesktop.DBus.Properties", "Set"));

  if (!msg) {
    return Error(ErrorCode::PlatformError, "Failed to create D-Bus message");
  }

  DBusMessageIter iter, variant_iter;
  dbus_message_iter_init_append(msg.get(), &iter);

  dbus_message_iter_append_basic(&iter, DBUS_TYPE_STRING, &iface);
  dbus_message_iter_append_basic(&iter, DBUS_TYPE_STRING, &property);

  // Create variant with the value
  char type_sig[2] = {static_cast<char>(type), '\0'};
  dbus_message_iter_open_container(&iter, DBUS_TYPE_VARIANT, type_sig,
                                   &variant_iter);
  dbus_message_iter_append_basic(&variant_iter, type, value);
  dbus_message_iter_close_container(&iter, &variant_iter);

  auto reply = send_and_wait(conn, msg.get());
  if (reply.is_error()) {
    return reply.error();
  }
  return Result<void>::ok();
}

/**
 * @brief Add a match rule for signals
 */
inline Result<void> add_match(DBusConnection *conn, const std::string &rule) {
  DBusErrorWrapper error;
  dbus_bus_add_match(conn, rule.c_str(), error.get());
  if (error.is_set()) {
    return error.to_error();
  }
  return Result<void>::ok();
}

// ============================================================================
// Dictionary Builders (a{sv})
// ============================================================================

/// Open "{sv}" entry with key and a variant of the given signature
inline void open_dict_entry(DBusMessageIter *dict, const char *key,
                            const char *signature, DBusMessageIter *entry,
                            DBusMessageIter *variant) {
  dbus_message_iter_open_container(dict, DBUS_TYPE_DICT_ENTRY, nullptr, entry);
  dbus_message_iter_append_basic(entry, DBUS_TYPE_STRING, &key);
  dbus_message_iter_open_container(entry, DBUS_TYPE_VARIANT, signature,
                                   variant);
}

inline void close_dict_entry(DBusMessageIter *dict, DBusMessageIter *entry,
                             DBusMessageIter *variant) {
  dbus_message_iter_close_container(entry, variant);
  dbus_message_iter_close_container(dict, entry);
}

inline void append_dict_string(DBusMessageIter *dict, const char *key,
                               const std::string &value) {
  DBusMessageIter entry, variant;
  open_dict_entry(dict, key, "s", &entry, &variant);
  const char *v = value.c_str();
  dbus_message_iter_append_basic(&variant, DBUS_TYPE_STRING, &v);
  close_dict_entry(dict, &entry, &variant);
}

inline void append_dict_int16(DBusMessageIter *dict, const char *key,
                              int16_t value) {
  DBusMessageIter entry, variant;
  open_dict_entry(dict, key, "n", &entry, &variant);
  dbus_int16_t v = value;
  dbus_message_iter_append_basic(&variant, DBUS_TYPE_INT16, &v);
  close_dict_entry(dict, &entry, &variant);
}

inline void append_dict_int32(DBusMessageIter *dict, const char *key,
                              int32_t value) {
  DBusMessageIter entry, variant;
  open_dict_entry(dict, key, "i", &entry, &variant);
  dbus_int32_t v = value;
  dbus_message_iter_append_basic(&variant, DBUS_TYPE_INT32, &v);
  close_dict_entry(dict, &entry, &variant);
}

inline void append_string_array(DBusMessageIter *iter,
                                const std::vector<std::string> &values) {
  DBusMessageIter array;
  dbus_message_iter_open_container(iter, DBUS_TYPE_ARRAY,
                                   DBUS_TYPE_STRING_AS_STRING, &array);
  for (const auto &s : values) {
    const char *v = s.c_str();
    dbus_message_iter_append_basic(&array, DBUS_TYPE_STRING, &v);
  }
  dbus_message_iter_close_container(iter, &array);
}

inline void append_dict_strings(DBusMessageIter *dict, const char *key,
                                const std::vector<std::string> &values) {
  DBusMessageIter entry, variant;
  open_dict_entry(dict, key, "as", &entry, &variant);
  append_string_array(&variant, values);
  close_dict_entry(dict, &entry, &variant);
}

inline void append_byte_array(DBusMessageIter *iter, const Bytes &bytes) {
  DBusMessageIter array;
  dbus_message_iter_open_container(iter, DBUS_TYPE_ARRAY,
                                   DBUS_TYPE_BYTE_AS_STRING, &array);
  const Byte *data = bytes.data();
  dbus_message_iter_append_fixed_array(&array, DBUS_TYPE_BYTE, &data,
                                       static_cast<int>(bytes.size()));
  dbus_message_iter_close_container(iter, &array);
}

// ============================================================================
// Variant Readers
// ============================================================================

inline bool read_string(DBusMessageIter *iter, std::string &out) {
  int type = dbus_message_iter_get_arg_type(iter);
  if (type != DBUS_TYPE_STRING && type != DBUS_TYPE_OBJECT_PATH) {
    return false;
  }
  const char *v = nullptr;
  dbus_message_iter_get_basic(iter, &v);
  out = v ? v : "";
  return true;
}

inline bool read_int16(DBusMessageIter *iter, int16_t &out) {
  if (dbus_message_iter_get_arg_type(iter) != DBUS_TYPE_INT16) {
    return false;
  }
  dbus_int16_t v = 0;
  dbus_message_iter_get_basic(iter, &v);
  out = v;
  return true;
}

inline bool read_bytes(DBusMessageIter *iter, Bytes &out) {
  if (dbus_message_iter_get_arg_type(iter) != DBUS_TYPE_ARRAY ||
      dbus_message_iter_get_element_type(iter) != DBUS_TYPE_BYTE) {
    return false;
  }
  DBusMessageIter array;
  dbus_message_iter_recurse(iter, &array);
  const Byte *data = nullptr;
  int len = 0;
  dbus_message_iter_get_fixed_array(&array, &data, &len);
  out.assign(data, data + len);
  return true;
}

inline bool read_strings(DBusMessageIter *iter, std::vector<std::string> &out) {
  if (dbus_message_iter_get_arg_type(iter) != DBUS_TYPE_ARRAY) {
    return false;
  }
  DBusMessageIter array;
  dbus_message_iter_recurse(iter, &array);
  while (dbus_message_iter_get_arg_type(&array) == DBUS_TYPE_STRING) {
    std::string s;
    read_string(&array, s);
    out.push_back(std::move(s));
    dbus_message_iter_next(&array);
  }
  return true;
}

/**
 * @brief Walk an a{sv} dictionary
 * @param fn Called with each key and an iterator positioned inside the
 *           variant value
 */
template <typename Fn> void for_each_dict_entry(DBusMessageIter *dict, Fn fn) {
  if (dbus_message_iter_get_arg_type(dict) != DBUS_TYPE_ARRAY) {
    return;
  }
  DBusMessageIter array;
  dbus_message_iter_recurse(dict, &array);

  while (dbus_message_iter_get_arg_type(&array) == DBUS_TYPE_DICT_ENTRY) {
    DBusMessageIter entry, value;
    dbus_message_iter_recurse(&array, &entry);

    std::string key;
    read_string(&entry, key);
    dbus_message_iter_next(&entry);

    if (dbus_message_iter_get_arg_type(&entry) == DBUS_TYPE_VARIANT) {
      dbus_message_iter_recurse(&entry, &value);
      fn(key, &value);
    }
    dbus_message_iter_next(&array);
  }
}

} // namespace platform
} // namespace pdrop

#endif // PDROP_PLATFORM_LINUX_DBUS_HELPERS_H
