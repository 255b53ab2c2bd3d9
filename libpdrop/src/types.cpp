/**
 * @file types.cpp
 * @brief Core type implementations
 */

#include "pdrop/types.h"
#include <iomanip>
#include <sstream>

namespace pdrop {

// ============================================================================
// PeerId
// ============================================================================

PeerId PeerId::from_bytes(const Bytes &bytes) {
  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (Byte b : bytes) {
    oss << std::setw(2) << static_cast<int>(b);
  }
  return PeerId(oss.str());
}

// ============================================================================
// PeerInfo
// ============================================================================

std::string PeerInfo::metadata_value(const std::string &key) const {
  auto it = metadata.find(key);
  return it != metadata.end() ? it->second : std::string();
}

// ============================================================================
// Names
// ============================================================================

const char *transport_kind_name(TransportKind kind) {
  switch (kind) {
  case TransportKind::Unknown:
    return "Unknown";
  case TransportKind::Ble:
    return "BLE";
  case TransportKind::WifiDirect:
    return "WiFiDirect";
  case TransportKind::Mdns:
    return "mDNS";
  case TransportKind::Loopback:
    return "Loopback";
  default:
    return "Unknown";
  }
}

const char *discovery_event_type_name(DiscoveryEventType type) {
  switch (type) {
  case DiscoveryEventType::PeerDiscovered:
    return "PeerDiscovered";
  case DiscoveryEventType::PeerLost:
    return "PeerLost";
  default:
    return "Unknown";
  }
}

std::string to_string(const DiscoveryEvent &event) {
  std::ostringstream oss;
  oss << discovery_event_type_name(event.type) << "(" << event.peer.id.str()
      << ")";
  if (!event.peer.transports.empty()) {
    oss << " via";
    for (const auto &backend : event.peer.transports) {
      oss << " " << backend;
    }
  }
  if (event.peer.signal_dbm) {
    oss << " " << *event.peer.signal_dbm << "dBm";
  }
  return oss.str();
}

} // namespace pdrop
