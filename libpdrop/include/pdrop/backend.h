/**
 * @file backend.h
 * @brief Transport backend contract: Discovery and Advertiser capabilities
 *
 * A backend drives one physical transport (BLE, Wi-Fi Direct, ...). It
 * implements Discovery, Advertiser, or both, and declares which through
 * explicit capability flags. Callers never inspect a backend's type: they
 * read capabilities() and go through the checked entry points below,
 * which refuse undeclared operations with CapabilityUnsupported.
 *
 * Lifecycle calls may block (they talk to platform daemons); the
 * orchestrator runs them on bounded worker tasks.
 */

#ifndef PDROP_BACKEND_H
#define PDROP_BACKEND_H

#include "channel.h"
#include "error.h"
#include "platform.h"
#include "types.h"
#include <memory>
#include <string>

namespace pdrop {

// ============================================================================
// Event Stream
// ============================================================================

/**
 * @brief Single-consumer sequence of raw discovery events
 *
 * Ends (closes) only when the backend stops scanning or fails
 * irrecoverably.
 */
using EventStream = std::shared_ptr<Channel<DiscoveryEvent>>;

/// A fresh open stream
PDROP_API EventStream make_event_stream();

/// An already-ended stream (returned by backends that are not scanning)
PDROP_API EventStream make_closed_event_stream();

// ============================================================================
// Capability Interfaces
// ============================================================================

/**
 * @brief Scan lifecycle and event production
 */
class PDROP_API Discovery {
public:
  virtual ~Discovery() = default;

  /**
   * @brief Begin producing discovery events
   *
   * Idempotent: while already scanning returns success without restarting
   * or duplicating the event source.
   */
  virtual Result<void> start_scan() = 0;

  /**
   * @brief Stop scanning and end the current event stream
   *
   * Idempotent; safe to call when not scanning.
   */
  virtual Result<void> stop_scan() = 0;

  /**
   * @brief The current event stream
   *
   * Repeated calls during one scan session return the same stream.
   */
  virtual EventStream poll_events() = 0;
};

/**
 * @brief Broadcast (peripheral role) lifecycle
 *
 * Implementations without advertising hardware fail broadcast() with
 * CapabilityUnsupported. Returning success without advertising is not
 * allowed.
 */
class PDROP_API Advertiser {
public:
  virtual ~Advertiser() = default;

  virtual Result<void> broadcast() = 0;
  virtual Result<void> stop_broadcast() = 0;
};

// ============================================================================
// Backend
// ============================================================================

/**
 * @brief A transport plugin
 *
 * Owns its platform handle exclusively: acquired at construction,
 * released deterministically in its destructor.
 */
class PDROP_API Backend {
public:
  virtual ~Backend() = default;

  /// Registration name, unique per orchestrator (e.g. "ble", "wifi-direct")
  virtual std::string name() const = 0;

  virtual TransportKind transport() const = 0;

  /// Declared capability flags
  virtual Capabilities capabilities() const = 0;

  /// Discovery interface, or nullptr when the backend cannot scan
  virtual Discovery *discovery() { return nullptr; }

  /// Advertiser interface, or nullptr when the backend cannot advertise
  virtual Advertiser *advertiser() { return nullptr; }
};

// ============================================================================
// Backend Lifecycle State
// ============================================================================

/**
 * @brief Orchestrator-side lifecycle state of a registered backend
 */
enum class BackendState : uint8_t {
  Idle = 0,
  Starting = 1,
  Scanning = 2,
  Broadcasting = 3, // advertise-only role active
  Stopping = 4,
  Failed = 5,       // start failed, terminal until reset
  Disabled = 6      // timeout or stream closure, terminal until reset
};

PDROP_API const char *backend_state_name(BackendState state);

// ============================================================================
// Checked Entry Points
// ============================================================================

/**
 * @brief Verify that declared flags match the exposed interfaces
 * @return InvalidArgument when a declared capability has no interface
 */
PDROP_API Result<void> validate_backend(Backend &backend);

/// start_scan if CanScan is declared, CapabilityUnsupported otherwise
PDROP_API Result<void> start_scan(Backend &backend);
PDROP_API Result<void> stop_scan(Backend &backend);
PDROP_API Result<EventStream> poll_events(Backend &backend);

/// broadcast if CanAdvertise is declared, CapabilityUnsupported otherwise
PDROP_API Result<void> broadcast(Backend &backend);
PDROP_API Result<void> stop_broadcast(Backend &backend);

} // namespace pdrop

#endif // PDROP_BACKEND_H
