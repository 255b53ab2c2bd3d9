/**
 * @file state_machine.cpp
 * @brief Backend lifecycle state machine implementation
 */

#include "pdrop/state_machine.h"

namespace pdrop {

const std::map<BackendState, std::set<BackendState>>
    BackendStateMachine::valid_transitions_ = {
        // Idle -> Starting, Disabled
        {BackendState::Idle, {BackendState::Starting, BackendState::Disabled}},

        // Starting -> Scanning, Broadcasting, Failed, Disabled
        {BackendState::Starting,
         {BackendState::Scanning, BackendState::Broadcasting,
          BackendState::Failed, BackendState::Disabled}},

        // Scanning -> Stopping, Disabled
        {BackendState::Scanning,
         {BackendState::Stopping, BackendState::Disabled}},

        // Broadcasting -> Stopping, Disabled
        {BackendState::Broadcasting,
         {BackendState::Stopping, BackendState::Disabled}},

        // Stopping -> Idle, Disabled
        {BackendState::Stopping, {BackendState::Idle, BackendState::Disabled}},

        // Terminal until reset()
        {BackendState::Failed, {}},
        {BackendState::Disabled, {}}};

BackendStateMachine::BackendStateMachine() : state_(BackendState::Idle) {}

BackendStateMachine::BackendStateMachine(BackendState initial)
    : state_(initial) {}

BackendState BackendStateMachine::current() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

Result<void> BackendStateMachine::transition(BackendState to) {
  BackendState from = BackendState::Idle;
  StateChangedCallback cb;
  {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = valid_transitions_.find(state_);
    if (it == valid_transitions_.end() ||
        it->second.find(to) == it->second.end()) {
      return Error(ErrorCode::InvalidState,
                   std::string("Invalid backend transition: ") +
                       backend_state_name(state_) + " -> " +
                       backend_state_name(to));
    }

    from = state_;
    state_ = to;
    cb = state_changed_cb_;
  }

  if (cb) {
    cb(from, to);
  }
  return Result<void>::ok();
}

bool BackendStateMachine::can_transition(BackendState to) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = valid_transitions_.find(state_);
  if (it == valid_transitions_.end()) {
    return false;
  }
  return it->second.find(to) != it->second.end();
}

std::set<BackendState> BackendStateMachine::valid_transitions() const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = valid_transitions_.find(state_);
  if (it == valid_transitions_.end()) {
    return {};
  }
  return it->second;
}

bool BackendStateMachine::is_active() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_ == BackendState::Scanning ||
         state_ == BackendState::Broadcasting;
}

bool BackendStateMachine::is_terminal() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_ == BackendState::Failed || state_ == BackendState::Disabled;
}

Result<void> BackendStateMachine::reset() {
  BackendState from = BackendState::Idle;
  StateChangedCallback cb;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == BackendState::Idle) {
      return Result<void>::ok();
    }
    if (state_ != BackendState::Failed && state_ != BackendState::Disabled) {
      return Error(ErrorCode::InvalidState,
                   std::string("Cannot reset backend while ") +
                       backend_state_name(state_));
    }
    from = state_;
    state_ = BackendState::Idle;
    cb = state_changed_cb_;
  }

  if (cb) {
    cb(from, BackendState::Idle);
  }
  return Result<void>::ok();
}

void BackendStateMachine::on_state_changed(StateChangedCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  state_changed_cb_ = std::move(callback);
}

} // namespace pdrop
