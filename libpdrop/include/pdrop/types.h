/**
 * @file types.h
 * @brief Core type definitions for pdrop
 *
 * The shared vocabulary of the discovery subsystem: peer identity, the
 * PeerInfo record, the DiscoveryEvent tagged union and capability flags.
 */

#ifndef PDROP_TYPES_H
#define PDROP_TYPES_H

#include "platform.h"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace pdrop {

// ============================================================================
// Basic Types
// ============================================================================

using Byte = uint8_t;
using Bytes = std::vector<Byte>;

/// Monotonic clock used for every sighting timestamp
using SteadyClock = std::chrono::steady_clock;
using TimePoint = SteadyClock::time_point;

/// Source of "now"; injectable so expiry can be driven deterministically
using Clock = std::function<TimePoint()>;

/// Name a backend is registered under (unique per orchestrator)
using BackendId = std::string;

// ============================================================================
// Identifiers
// ============================================================================

/**
 * @brief Opaque, stable peer identity
 *
 * Two sightings with equal PeerId refer to the same physical peer. Backends
 * resolve identity before reporting; the merge engine only compares.
 */
struct PeerId {
  std::string value;

  PeerId() = default;
  explicit PeerId(std::string v) : value(std::move(v)) {}

  bool operator==(const PeerId &other) const { return value == other.value; }
  bool operator!=(const PeerId &other) const { return value != other.value; }
  bool operator<(const PeerId &other) const { return value < other.value; }

  bool empty() const { return value.empty(); }
  const std::string &str() const { return value; }

  /// Hex rendering of raw identity bytes (e.g. advertised device ids)
  static PeerId from_bytes(const Bytes &bytes);
};

// ============================================================================
// Transport
// ============================================================================

/// Physical transport a backend drives
enum class TransportKind : uint8_t {
  Unknown = 0,
  Ble = 1,
  WifiDirect = 2,
  Mdns = 3,
  Loopback = 4
};

PDROP_API const char *transport_kind_name(TransportKind kind);

/**
 * @brief Capability flags declared by a backend at registration
 */
struct Capabilities {
  bool can_scan = false;
  bool can_advertise = false;

  bool operator==(const Capabilities &other) const {
    return can_scan == other.can_scan && can_advertise == other.can_advertise;
  }

  static Capabilities scan_only() { return {true, false}; }
  static Capabilities advertise_only() { return {false, true}; }
  static Capabilities both() { return {true, true}; }
};

/**
 * @brief Roles the application asks a backend to perform
 */
struct Roles {
  bool scan = true;
  bool advertise = false;

  bool any() const { return scan || advertise; }

  static Roles scanner() { return {true, false}; }
  static Roles advertiser() { return {false, true}; }
  static Roles both() { return {true, true}; }
};

// ============================================================================
// Peer Information
// ============================================================================

/**
 * @brief A sighting of a peer, raw or merged
 *
 * Raw backend events fill id, signal and metadata; the orchestrator stamps
 * last_seen on arrival and maintains the transports set in merged events.
 */
struct PeerInfo {
  PeerId id;

  /// Backends that currently attribute a sighting to this peer
  std::set<BackendId> transports;

  TimePoint last_seen{};

  /// Signal strength in dBm, when the transport reports one
  std::optional<int> signal_dbm;

  /// Transport-specific details (address, name, ...)
  std::map<std::string, std::string> metadata;

  bool has_transport(const BackendId &backend) const {
    return transports.count(backend) != 0;
  }

  /// Convenience lookup, empty string when absent
  std::string metadata_value(const std::string &key) const;
};

// ============================================================================
// Discovery Events
// ============================================================================

enum class DiscoveryEventType : uint8_t { PeerDiscovered = 0, PeerLost = 1 };

PDROP_API const char *discovery_event_type_name(DiscoveryEventType type);

/**
 * @brief Tagged union: PeerDiscovered(PeerInfo) | PeerLost(PeerInfo)
 */
struct DiscoveryEvent {
  DiscoveryEventType type = DiscoveryEventType::PeerDiscovered;
  PeerInfo peer;

  bool is_discovered() const {
    return type == DiscoveryEventType::PeerDiscovered;
  }
  bool is_lost() const { return type == DiscoveryEventType::PeerLost; }

  static DiscoveryEvent discovered(PeerInfo info) {
    return DiscoveryEvent{DiscoveryEventType::PeerDiscovered, std::move(info)};
  }
  static DiscoveryEvent lost(PeerInfo info) {
    return DiscoveryEvent{DiscoveryEventType::PeerLost, std::move(info)};
  }
};

/// Short "PeerDiscovered(id)" rendering for logs and CLI output
PDROP_API std::string to_string(const DiscoveryEvent &event);

} // namespace pdrop

namespace std {
template <> struct hash<pdrop::PeerId> {
  size_t operator()(const pdrop::PeerId &id) const noexcept {
    return hash<string>()(id.value);
  }
};
} // namespace std

#endif // PDROP_TYPES_H
