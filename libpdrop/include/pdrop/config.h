/**
 * @file config.h
 * @brief Orchestrator options and persisted settings for pdrop
 */

#ifndef PDROP_CONFIG_H
#define PDROP_CONFIG_H

#include "error.h"
#include "platform.h"
#include "transports.h"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <memory>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace pdrop {

// ============================================================================
// Orchestrator Options
// ============================================================================

/**
 * @brief Timing and merge options of one Orchestrator
 */
struct OrchestratorConfig {
  /// A peer unseen for this long is reported lost
  uint32_t scan_ttl_seconds = 30;

  /// Bound on one backend's start_scan/broadcast
  uint32_t backend_start_timeout_ms = 5000;

  /// Bound on one backend's stop_scan/stop_broadcast
  uint32_t backend_stop_timeout_ms = 2000;

  /// Merge sightings of the same peer across backends
  bool dedupe_window = true;

  /// How often the merge loop looks for expired peers
  uint32_t sweep_interval_ms = 1000;

  /// How long a pump waits on its stream before checking for shutdown
  uint32_t event_poll_interval_ms = 100;

  /// Per-subscriber queue bound; the oldest item goes first. 0 = unbounded
  uint32_t subscriber_queue_capacity = 4096;

  void load_defaults();

  /// InvalidArgument on zero values or a sweep interval longer than the TTL
  Result<void> validate() const;

  std::chrono::milliseconds scan_ttl() const {
    return std::chrono::seconds(scan_ttl_seconds);
  }
  std::chrono::milliseconds start_timeout() const {
    return std::chrono::milliseconds(backend_start_timeout_ms);
  }
  std::chrono::milliseconds stop_timeout() const {
    return std::chrono::milliseconds(backend_stop_timeout_ms);
  }
  std::chrono::milliseconds sweep_interval() const {
    return std::chrono::milliseconds(sweep_interval_ms);
  }
  std::chrono::milliseconds poll_interval() const {
    return std::chrono::milliseconds(event_poll_interval_ms);
  }
};

// ============================================================================
// Complete Configuration
// ============================================================================

/**
 * @brief Everything the pdrop-scan tool and embedders read from disk
 */
struct PdropConfig {
  // ========================================================================
  // Orchestrator
  // ========================================================================

  OrchestratorConfig orchestrator;

  /// "debug", "info", "warn", "error" or "off"
  std::string log_level = "info";

  // ========================================================================
  // BLE
  // ========================================================================

  bool enable_ble = true;

  /// Also advertise ourselves over BLE
  bool ble_advertise = false;

  BleBackendConfig ble;

  // ========================================================================
  // Wi-Fi Direct
  // ========================================================================

  bool enable_wifi_direct = true;

  /// Stay discoverable (P2P Listen) while scanning
  bool wifi_direct_advertise = false;

  WifiDirectBackendConfig wifi_direct;

  // ========================================================================
  // Methods
  // ========================================================================

  void load_defaults();

  Result<void> validate() const;

  /// $XDG_CONFIG_HOME/pdrop or ~/.config/pdrop
  static std::filesystem::path get_default_config_dir();

  /// get_default_config_dir() / "pdrop.json"
  static std::filesystem::path get_default_config_path();
};

// ============================================================================
// JSON Mapping
// ============================================================================

// from_json leaves fields whose key is absent untouched and ignores keys it
// does not know. Besides nlohmann::json::exception for wrong types it throws
// std::out_of_range for numbers outside a field's range and
// std::invalid_argument for a non-object section or unknown log level.

PDROP_API void to_json(nlohmann::json &j, const OrchestratorConfig &config);
PDROP_API void from_json(const nlohmann::json &j, OrchestratorConfig &config);

PDROP_API void to_json(nlohmann::json &j, const BleBackendConfig &config);
PDROP_API void from_json(const nlohmann::json &j, BleBackendConfig &config);

PDROP_API void to_json(nlohmann::json &j,
                       const WifiDirectBackendConfig &config);
PDROP_API void from_json(const nlohmann::json &j,
                         WifiDirectBackendConfig &config);

/// Enable and advertise flags live inside the "ble" / "wifi_direct" objects
PDROP_API void to_json(nlohmann::json &j, const PdropConfig &config);
PDROP_API void from_json(const nlohmann::json &j, PdropConfig &config);

/**
 * @brief Parse a JSON document into config
 *
 * Keys not present in the input keep their current value.
 * @return ConfigParseError for malformed JSON, a wrong type, a value out of
 *         range or an unknown key (details holds the key's JSON pointer)
 */
PDROP_API Result<void> parse_config(std::istream &in, PdropConfig &config);

/// Write config as indented JSON
PDROP_API void write_config(std::ostream &out, const PdropConfig &config);

/**
 * @brief Apply PDROP_* environment variables on top of config
 * @return ConfigParseError naming the variable with a malformed value
 */
PDROP_API Result<void> apply_env_overrides(PdropConfig &config);

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * @brief Manages loading, saving, and validating configuration
 */
class PDROP_API ConfigManager {
public:
  ConfigManager();
  ~ConfigManager();

  // Non-copyable
  ConfigManager(const ConfigManager &) = delete;
  ConfigManager &operator=(const ConfigManager &) = delete;

  /**
   * @brief Initialize with config file path
   * @param config_path Path to config file; empty selects the default
   *
   * A missing file leaves the defaults in place. An existing file that
   * fails to parse is reported.
   */
  Result<void> init(const std::filesystem::path &config_path = {});

  const PdropConfig &get() const;

  /**
   * @brief Get mutable configuration reference
   *
   * After modifying, call save() to persist changes.
   */
  PdropConfig &get_mutable();

  /// Replace the configuration after validating it
  Result<void> set(const PdropConfig &config);

  const std::filesystem::path &path() const;

  /// Re-read the file (defaults first, then file values)
  Result<void> load();

  /// Write the current configuration, creating the directory if needed
  Result<void> save();

  void reset_defaults();

  /// Apply PDROP_* environment variables and re-validate
  Result<void> apply_env_overrides();

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace pdrop

#endif // PDROP_CONFIG_H
