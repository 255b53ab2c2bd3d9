/**
 * @file config.cpp
 * @brief Configuration management implementation
 */

// Standard library includes FIRST, before any project headers
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>

#include <pwd.h>
#include <unistd.h>

#include <nlohmann/json.hpp>

// Project includes LAST
#include "pdrop/config.h"
#include "pdrop/log.h"

namespace fs = ::std::filesystem;

using json = nlohmann::json;

namespace pdrop {

namespace {

void require_object(const json &j, const char *what) {
  if (!j.is_object()) {
    throw std::invalid_argument(std::string(what) + " must be an object");
  }
}

template <typename T> void read_field(const json &j, const char *key, T &out) {
  auto it = j.find(key);
  if (it != j.end()) {
    it->get_to(out);
  }
}

/// get<int64_t>() alone would accept true, 1.5 and wrap huge values
int64_t read_integer(const json &value, const char *key, int64_t min,
                     int64_t max) {
  if (!value.is_number()) {
    throw std::invalid_argument(std::string(key) + " must be a number");
  }
  if (value.is_number_float()) {
    throw std::out_of_range(std::string(key) + " must be an integer");
  }
  if (value.is_number_unsigned() &&
      value.get<uint64_t>() > static_cast<uint64_t>(max)) {
    throw std::out_of_range(std::string(key) + " is out of range");
  }
  int64_t v = value.get<int64_t>();
  if (v < min || v > max) {
    throw std::out_of_range(std::string(key) + " is out of range");
  }
  return v;
}

template <typename T>
void read_bounded(const json &j, const char *key, T &out, int64_t min,
                  int64_t max) {
  auto it = j.find(key);
  if (it != j.end()) {
    out = static_cast<T>(read_integer(*it, key, min, max));
  }
}

void read_u32(const json &j, const char *key, uint32_t &out) {
  read_bounded(j, key, out, 0, std::numeric_limits<uint32_t>::max());
}

/// Every key of input must exist in reference, recursively
Result<void> check_known_keys(const json &input, const json &reference,
                              const std::string &pointer) {
  if (!input.is_object() || !reference.is_object()) {
    return Result<void>::ok();
  }
  for (auto it = input.begin(); it != input.end(); ++it) {
    std::string child = pointer + "/" + it.key();
    auto ref = reference.find(it.key());
    if (ref == reference.end()) {
      return Error(ErrorCode::ConfigParseError,
                   "Unknown key '" + it.key() + "'", child);
    }
    PDROP_TRY(check_known_keys(it.value(), *ref, child));
  }
  return Result<void>::ok();
}

/// Environment variable -> JSON pointer into the serialized config
const std::map<std::string, std::string> &env_keys() {
  static const std::map<std::string, std::string> table = {
      {"PDROP_SCAN_TTL_SECONDS", "/orchestrator/scan_ttl_seconds"},
      {"PDROP_BACKEND_START_TIMEOUT_MS",
       "/orchestrator/backend_start_timeout_ms"},
      {"PDROP_BACKEND_STOP_TIMEOUT_MS",
       "/orchestrator/backend_stop_timeout_ms"},
      {"PDROP_DEDUPE_WINDOW", "/orchestrator/dedupe_window"},
      {"PDROP_SWEEP_INTERVAL_MS", "/orchestrator/sweep_interval_ms"},
      {"PDROP_LOG_LEVEL", "/log_level"},
      {"PDROP_BLE_ADAPTER", "/ble/adapter"},
      {"PDROP_WIFI_DIRECT_INTERFACE", "/wifi_direct/interface"},
  };
  return table;
}

} // namespace

// ============================================================================
// OrchestratorConfig Methods
// ============================================================================

void OrchestratorConfig::load_defaults() { *this = OrchestratorConfig(); }

Result<void> OrchestratorConfig::validate() const {
  if (scan_ttl_seconds == 0) {
    return Error(ErrorCode::InvalidArgument, "scan_ttl_seconds must be > 0");
  }
  if (backend_start_timeout_ms == 0 || backend_stop_timeout_ms == 0) {
    return Error(ErrorCode::InvalidArgument,
                 "Backend timeouts must be > 0");
  }
  if (sweep_interval_ms == 0 || event_poll_interval_ms == 0) {
    return Error(ErrorCode::InvalidArgument, "Intervals must be > 0");
  }
  if (std::chrono::milliseconds(sweep_interval_ms) > scan_ttl()) {
    return Error(ErrorCode::InvalidArgument,
                 "sweep_interval_ms must not exceed the scan TTL");
  }
  return Result<void>::ok();
}

// ============================================================================
// PdropConfig Methods
// ============================================================================

void PdropConfig::load_defaults() { *this = PdropConfig(); }

Result<void> PdropConfig::validate() const {
  PDROP_TRY(orchestrator.validate());

  log::Level ignored;
  if (!log::parse_level(log_level, ignored)) {
    return Error(ErrorCode::InvalidArgument,
                 "Unknown log level: " + log_level);
  }
  if (enable_ble && ble.name.empty()) {
    return Error(ErrorCode::InvalidArgument, "BLE backend name is empty");
  }
  if (enable_wifi_direct && wifi_direct.name.empty()) {
    return Error(ErrorCode::InvalidArgument,
                 "Wi-Fi Direct backend name is empty");
  }
  if (enable_ble && enable_wifi_direct && ble.name == wifi_direct.name) {
    return Error(ErrorCode::InvalidArgument,
                 "Backend names must be distinct");
  }
  return Result<void>::ok();
}

fs::path PdropConfig::get_default_config_dir() {
  // Linux: Use XDG_CONFIG_HOME or ~/.config
  const char *xdg_config = std::getenv("XDG_CONFIG_HOME");
  if (xdg_config && *xdg_config) {
    return fs::path(xdg_config) / "pdrop";
  }

  const char *home = std::getenv("HOME");
  if (!home) {
    struct passwd *pw = getpwuid(getuid());
    if (pw) {
      home = pw->pw_dir;
    }
  }
  if (home) {
    return fs::path(home) / ".config" / "pdrop";
  }

  return fs::path("/tmp/pdrop");
}

fs::path PdropConfig::get_default_config_path() {
  return get_default_config_dir() / "pdrop.json";
}

// ============================================================================
// JSON Mapping
// ============================================================================

void to_json(json &j, const OrchestratorConfig &config) {
  j = json{{"scan_ttl_seconds", config.scan_ttl_seconds},
           {"backend_start_timeout_ms", config.backend_start_timeout_ms},
           {"backend_stop_timeout_ms", config.backend_stop_timeout_ms},
           {"dedupe_window", config.dedupe_window},
           {"sweep_interval_ms", config.sweep_interval_ms},
           {"event_poll_interval_ms", config.event_poll_interval_ms},
           {"subscriber_queue_capacity", config.subscriber_queue_capacity}};
}

void from_json(const json &j, OrchestratorConfig &config) {
  require_object(j, "orchestrator");
  read_u32(j, "scan_ttl_seconds", config.scan_ttl_seconds);
  read_u32(j, "backend_start_timeout_ms", config.backend_start_timeout_ms);
  read_u32(j, "backend_stop_timeout_ms", config.backend_stop_timeout_ms);
  read_field(j, "dedupe_window", config.dedupe_window);
  read_u32(j, "sweep_interval_ms", config.sweep_interval_ms);
  read_u32(j, "event_poll_interval_ms", config.event_poll_interval_ms);
  read_u32(j, "subscriber_queue_capacity", config.subscriber_queue_capacity);
}

void to_json(json &j, const BleBackendConfig &config) {
  j = json{{"name", config.name},
           {"adapter", config.adapter},
           {"service_uuid_filter", config.service_uuid_filter},
           {"local_peer_id", config.local_peer_id},
           {"rssi_threshold", config.rssi_threshold}};
}

void from_json(const json &j, BleBackendConfig &config) {
  require_object(j, "ble");
  read_field(j, "name", config.name);
  read_field(j, "adapter", config.adapter);
  read_field(j, "service_uuid_filter", config.service_uuid_filter);
  read_field(j, "local_peer_id", config.local_peer_id);
  read_bounded(j, "rssi_threshold", config.rssi_threshold, -127, 0);
}

void to_json(json &j, const WifiDirectBackendConfig &config) {
  j = json{{"name", config.name},
           {"interface", config.interface},
           {"find_timeout_seconds", config.find_timeout_seconds}};
}

void from_json(const json &j, WifiDirectBackendConfig &config) {
  require_object(j, "wifi_direct");
  read_field(j, "name", config.name);
  read_field(j, "interface", config.interface);
  read_bounded(j, "find_timeout_seconds", config.find_timeout_seconds, 0,
               std::numeric_limits<int32_t>::max());
}

void to_json(json &j, const PdropConfig &config) {
  json ble = config.ble;
  ble["enabled"] = config.enable_ble;
  ble["advertise"] = config.ble_advertise;

  json wifi = config.wifi_direct;
  wifi["enabled"] = config.enable_wifi_direct;
  wifi["advertise"] = config.wifi_direct_advertise;

  j = json{{"orchestrator", config.orchestrator},
           {"log_level", config.log_level},
           {"ble", std::move(ble)},
           {"wifi_direct", std::move(wifi)}};
}

void from_json(const json &j, PdropConfig &config) {
  require_object(j, "config");

  auto orch = j.find("orchestrator");
  if (orch != j.end()) {
    orch->get_to(config.orchestrator);
  }

  auto level = j.find("log_level");
  if (level != j.end()) {
    std::string name = level->get<std::string>();
    log::Level ignored;
    if (!log::parse_level(name, ignored)) {
      throw std::invalid_argument("Unknown log level: " + name);
    }
    config.log_level = name;
  }

  auto ble = j.find("ble");
  if (ble != j.end()) {
    ble->get_to(config.ble);
    read_field(*ble, "enabled", config.enable_ble);
    read_field(*ble, "advertise", config.ble_advertise);
  }

  auto wifi = j.find("wifi_direct");
  if (wifi != j.end()) {
    wifi->get_to(config.wifi_direct);
    read_field(*wifi, "enabled", config.enable_wifi_direct);
    read_field(*wifi, "advertise", config.wifi_direct_advertise);
  }
}

// ============================================================================
// Parsing
// ============================================================================

Result<void> parse_config(std::istream &in, PdropConfig &config) {
  json doc;
  try {
    doc = json::parse(in);
  } catch (const json::parse_error &e) {
    return Error(ErrorCode::ConfigParseError, "Malformed JSON", e.what());
  }

  if (!doc.is_object()) {
    return Error(ErrorCode::ConfigParseError,
                 "Config must be a JSON object");
  }
  PDROP_TRY(check_known_keys(doc, json(PdropConfig{}), ""));

  // Apply to a copy so a bad value leaves config untouched
  PdropConfig parsed = config;
  try {
    doc.get_to(parsed);
  } catch (const json::exception &e) {
    return Error(ErrorCode::ConfigParseError, "Invalid value", e.what());
  } catch (const std::logic_error &e) {
    return Error(ErrorCode::ConfigParseError, "Invalid value", e.what());
  }

  config = std::move(parsed);
  return Result<void>::ok();
}

void write_config(std::ostream &out, const PdropConfig &config) {
  out << json(config).dump(2) << "\n";
}

Result<void> apply_env_overrides(PdropConfig &config) {
  json doc = config;

  for (const auto &[var, pointer] : env_keys()) {
    const char *value = std::getenv(var.c_str());
    if (!value) {
      continue;
    }

    // String fields take the raw text, everything else is a JSON literal
    json &slot = doc.at(json::json_pointer(pointer));
    if (slot.is_string()) {
      slot = value;
    } else {
      try {
        slot = json::parse(value);
      } catch (const json::parse_error &) {
        return Error(ErrorCode::ConfigParseError,
                     "Invalid value in environment", var + "=" + value);
      }
    }

    PdropConfig candidate = config;
    try {
      doc.get_to(candidate);
    } catch (const json::exception &) {
      return Error(ErrorCode::ConfigParseError,
                   "Invalid value in environment", var + "=" + value);
    } catch (const std::logic_error &) {
      return Error(ErrorCode::ConfigParseError,
                   "Invalid value in environment", var + "=" + value);
    }
    config = std::move(candidate);
    PDROP_LOG_DEBUG("%s overridden by %s", pointer.c_str(), var.c_str());
  }
  return Result<void>::ok();
}

// ============================================================================
// ConfigManager Implementation
// ============================================================================

class ConfigManager::Impl {
public:
  PdropConfig config;
  fs::path config_path;
  std::mutex mutex;
  bool initialized = false;

  Result<void> load_locked() {
    std::ifstream in(config_path);
    if (!in) {
      return Error(ErrorCode::ConfigIoError, "Cannot open config file",
                   config_path.string());
    }

    PdropConfig parsed;
    auto result = parse_config(in, parsed);
    if (result.is_error()) {
      result.error().at(config_path.string());
      return result;
    }

    auto validation = parsed.validate();
    if (validation.is_error()) {
      return Error(ErrorCode::ConfigError, validation.error().message,
                   config_path.string());
    }

    config = parsed;
    return Result<void>::ok();
  }
};

ConfigManager::ConfigManager() : impl_(std::make_unique<Impl>()) {
  impl_->config.load_defaults();
  impl_->config_path = PdropConfig::get_default_config_path();
}

ConfigManager::~ConfigManager() = default;

Result<void> ConfigManager::init(const fs::path &config_path) {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  impl_->config_path =
      config_path.empty() ? PdropConfig::get_default_config_path()
                          : config_path;
  impl_->initialized = true;

  std::error_code ec;
  if (!fs::exists(impl_->config_path, ec)) {
    PDROP_LOG_DEBUG("no config at %s, using defaults",
                    impl_->config_path.c_str());
    return Result<void>::ok();
  }

  auto result = impl_->load_locked();
  if (result.is_error()) {
    PDROP_LOG_WARN("config %s: %s", impl_->config_path.c_str(),
                   result.error().to_string().c_str());
  }
  return result;
}

const PdropConfig &ConfigManager::get() const { return impl_->config; }

PdropConfig &ConfigManager::get_mutable() { return impl_->config; }

Result<void> ConfigManager::set(const PdropConfig &config) {
  auto validation = config.validate();
  if (validation.is_error()) {
    return validation;
  }

  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->config = config;
  return Result<void>::ok();
}

const fs::path &ConfigManager::path() const { return impl_->config_path; }

Result<void> ConfigManager::load() {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->load_locked();
}

Result<void> ConfigManager::save() {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  auto dir = impl_->config_path.parent_path();
  if (!dir.empty()) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
      return Error(ErrorCode::ConfigIoError,
                   "Cannot create config directory", ec.message());
    }
  }

  std::ofstream out(impl_->config_path, std::ios::trunc);
  if (!out) {
    return Error(ErrorCode::ConfigIoError, "Cannot write config file",
                 impl_->config_path.string());
  }
  write_config(out, impl_->config);
  out.flush();
  if (!out) {
    return Error(ErrorCode::ConfigIoError, "Write failed",
                 impl_->config_path.string());
  }
  return Result<void>::ok();
}

void ConfigManager::reset_defaults() {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->config.load_defaults();
}

Result<void> ConfigManager::apply_env_overrides() {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  PdropConfig updated = impl_->config;
  PDROP_TRY(pdrop::apply_env_overrides(updated));
  PDROP_TRY(updated.validate());
  impl_->config = updated;
  return Result<void>::ok();
}

} // namespace pdrop
