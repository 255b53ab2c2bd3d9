/**
 * @file orchestrator.h
 * @brief Multi-backend discovery orchestrator for pdrop
 *
 * The Orchestrator owns every registered backend, drives their lifecycles
 * with bounded timeouts, and merges their raw event streams into one
 * deduplicated view of nearby peers.
 *
 * Threads:
 *   - one pump per scanning backend, forwarding its events to the inbox
 *   - one merge loop, the only writer of the peer table
 *   - short-lived workers for start/stop calls, abandoned on timeout
 *
 * A backend that fails, times out or loses its stream is isolated: the
 * others keep running and the failure is reported against its name.
 */

#ifndef PDROP_ORCHESTRATOR_H
#define PDROP_ORCHESTRATOR_H

#include "backend.h"
#include "channel.h"
#include "config.h"
#include "error.h"
#include "platform.h"
#include "types.h"
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <vector>

namespace pdrop {

// ============================================================================
// Start Report
// ============================================================================

/**
 * @brief How one backend's start attempt ended
 */
struct BackendOutcome {
  BackendId backend;
  Result<void> result;
  BackendState state = BackendState::Idle;

  /// Time until the attempt resolved or was abandoned
  std::chrono::milliseconds elapsed{0};

  bool ok() const { return result.is_ok(); }
};

/**
 * @brief Per-backend outcome of Orchestrator::start()
 */
struct PDROP_API BackendFailureReport {
  std::map<BackendId, BackendOutcome> outcomes;

  bool all_succeeded() const;
  size_t failure_count() const;

  /// Names of the backends whose attempt failed
  std::vector<BackendId> failed() const;

  const BackendOutcome *find(const BackendId &backend) const;

  bool empty() const { return outcomes.empty(); }
};

// ============================================================================
// Notifications and Status
// ============================================================================

/**
 * @brief Asynchronous failure notification
 *
 * Published when a backend fails to start, times out, fails to stop, or
 * loses its event stream while running.
 */
struct BackendFailure {
  BackendId backend;
  Error error;
  BackendState state = BackendState::Failed;
  TimePoint at{};
};

struct BackendStatus {
  BackendId id;
  TransportKind transport = TransportKind::Unknown;
  Capabilities capabilities;
  Roles roles;
  BackendState state = BackendState::Idle;
  std::optional<Error> last_error;

  /// A lifecycle call was abandoned while still running
  bool leaked = false;
};

// ============================================================================
// Subscription
// ============================================================================

/**
 * @brief One subscriber's view of the merged stream
 *
 * Starts with a PeerDiscovered for every peer already known, then follows
 * the live stream. Ends when the orchestrator stops or the subscription is
 * destroyed.
 *
 * Each queue holds at most OrchestratorConfig::subscriber_queue_capacity
 * items. A holder that stops reading loses the oldest ones; dropped()
 * says how many.
 */
class PDROP_API Subscription {
public:
  Subscription() = default;
  ~Subscription();

  Subscription(Subscription &&other) noexcept = default;
  Subscription &operator=(Subscription &&other) noexcept;

  Subscription(const Subscription &) = delete;
  Subscription &operator=(const Subscription &) = delete;

  /// Wait up to timeout for the next merged event
  ChannelStatus next(DiscoveryEvent &out, std::chrono::milliseconds timeout);

  std::optional<DiscoveryEvent> try_next();

  /// Wait up to timeout for the next failure notification
  ChannelStatus next_failure(BackendFailure &out,
                             std::chrono::milliseconds timeout);

  std::optional<BackendFailure> try_next_failure();

  /// Events and failures discarded because this subscriber fell behind
  size_t dropped() const;

  /// The event stream has ended and been drained
  bool is_closed() const;

  bool valid() const { return events_ != nullptr; }

  /// Detach from the orchestrator; further events are dropped
  void cancel();

private:
  friend class Orchestrator;

  Subscription(std::shared_ptr<Channel<DiscoveryEvent>> events,
               std::shared_ptr<Channel<BackendFailure>> failures)
      : events_(std::move(events)), failures_(std::move(failures)) {}

  std::shared_ptr<Channel<DiscoveryEvent>> events_;
  std::shared_ptr<Channel<BackendFailure>> failures_;
};

// ============================================================================
// Orchestrator
// ============================================================================

/**
 * @brief Registers backends, runs them, and merges what they see
 *
 * @code
 *   Orchestrator orch(config);
 *   orch.register_backend(std::move(ble), Roles::both());
 *   orch.register_backend(std::move(wifi));
 *
 *   auto sub = orch.subscribe();
 *   auto report = orch.start();
 *   for (const auto &id : report.failed()) { ... }
 *
 *   DiscoveryEvent ev;
 *   while (sub.next(ev, std::chrono::seconds(1)) != ChannelStatus::Closed) {
 *       ...
 *   }
 * @endcode
 */
class PDROP_API Orchestrator {
public:
  /**
   * @param config Timing and merge options (validated by the caller)
   * @param clock Source of arrival times and TTL judgement; defaults to
   *              the steady clock
   */
  explicit Orchestrator(OrchestratorConfig config = {}, Clock clock = {});

  /// Stops if running
  ~Orchestrator();

  // Non-copyable
  Orchestrator(const Orchestrator &) = delete;
  Orchestrator &operator=(const Orchestrator &) = delete;

  // ========================================================================
  // Registration
  // ========================================================================

  /**
   * @brief Register a backend for the requested roles
   *
   * Backends registered while running stay Idle until the next start().
   *
   * @return The backend id (its name), or:
   *         InvalidArgument for a null/unnamed backend or empty roles,
   *         CapabilityUnsupported for a role the backend does not declare,
   *         AlreadyExists for a duplicate name
   */
  Result<BackendId> register_backend(std::shared_ptr<Backend> backend,
                                     Roles roles = Roles::scanner());

  /// InvalidState while the backend is starting, active or stopping
  Result<void> unregister_backend(const BackendId &id);

  /// Return a Failed or Disabled backend to Idle
  Result<void> reset_backend(const BackendId &id);

  // ========================================================================
  // Lifecycle
  // ========================================================================

  /**
   * @brief Start every Idle backend concurrently
   *
   * Each attempt is bounded by backend_start_timeout_ms. Returns once all
   * attempts have resolved or timed out; one backend's failure never stops
   * the others. May be called again while running to start backends
   * registered or reset since.
   */
  BackendFailureReport start();

  /**
   * @brief Stop every active backend and end all subscriptions
   *
   * Bounded by backend_stop_timeout_ms. Backends that do not stop in time
   * are abandoned and Disabled. A no-op when not running.
   */
  Result<void> stop();

  bool is_running() const;

  // ========================================================================
  // Observation
  // ========================================================================

  Subscription subscribe();

  /// Snapshot of the merged peer table
  std::vector<PeerInfo> query_peers() const;

  std::optional<PeerInfo> find_peer(const PeerId &id) const;

  std::vector<BackendStatus> backend_status() const;
  std::optional<BackendStatus> backend_status(const BackendId &id) const;

  const OrchestratorConfig &config() const;

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace pdrop

#endif // PDROP_ORCHESTRATOR_H
