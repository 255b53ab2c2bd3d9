/**
 * @file state_machine.h
 * @brief Backend lifecycle state machine for pdrop
 *
 * Enforces the per-backend lifecycle with validated transitions:
 *
 *   Idle -> Starting -> Scanning | Broadcasting -> Stopping -> Idle
 *   Starting -> Failed            (terminal until reset)
 *   any non-terminal -> Disabled  (terminal until reset)
 */

#ifndef PDROP_STATE_MACHINE_H
#define PDROP_STATE_MACHINE_H

#include "pdrop/backend.h"
#include "pdrop/error.h"
#include <functional>
#include <map>
#include <mutex>
#include <set>

namespace pdrop {

/**
 * @brief Manages state transitions for one registered backend
 *
 * Thread-safe. Callbacks run after the state is updated and outside the
 * internal lock, so they may query the machine.
 *
 * @code
 *   BackendStateMachine sm;
 *
 *   sm.on_state_changed([](BackendState from, BackendState to) {
 *       PDROP_LOG_INFO("%s -> %s", backend_state_name(from),
 *                      backend_state_name(to));
 *   });
 *
 *   sm.transition(BackendState::Starting);
 *   sm.transition(BackendState::Scanning);
 * @endcode
 */
class PDROP_API BackendStateMachine {
public:
  BackendStateMachine();
  explicit BackendStateMachine(BackendState initial);

  BackendState current() const;

  /**
   * @brief Attempt to transition to a new state
   * @return InvalidState if the transition is not in the table
   */
  Result<void> transition(BackendState to);

  bool can_transition(BackendState to) const;

  std::set<BackendState> valid_transitions() const;

  /// Scanning or Broadcasting
  bool is_active() const;

  /// Failed or Disabled
  bool is_terminal() const;

  /**
   * @brief Return to Idle from a terminal state
   * @return InvalidState unless current state is Failed, Disabled or Idle
   */
  Result<void> reset();

  using StateChangedCallback =
      std::function<void(BackendState from, BackendState to)>;

  void on_state_changed(StateChangedCallback callback);

private:
  mutable std::mutex mutex_;
  BackendState state_;
  StateChangedCallback state_changed_cb_;

  static const std::map<BackendState, std::set<BackendState>>
      valid_transitions_;
};

} // namespace pdrop

#endif // PDROP_STATE_MACHINE_H
