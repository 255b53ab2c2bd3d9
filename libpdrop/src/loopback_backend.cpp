/**
 * @file loopback_backend.cpp
 * @brief Loopback backend implementation
 */

#include "pdrop/loopback_backend.h"
#include "pdrop/log.h"
#include <thread>

namespace pdrop {

Result<std::unique_ptr<LoopbackBackend>>
LoopbackBackend::create(const LoopbackConfig &config) {
  if (config.name.empty()) {
    return Error(ErrorCode::InitializationError,
                 "Loopback backend needs a name");
  }
  if (!config.capabilities.can_scan && !config.capabilities.can_advertise) {
    return Error(ErrorCode::InitializationError,
                 "Loopback backend needs at least one capability")
        .at(config.name);
  }
  return std::unique_ptr<LoopbackBackend>(new LoopbackBackend(config));
}

LoopbackBackend::LoopbackBackend(LoopbackConfig config)
    : config_(std::move(config)) {}

LoopbackBackend::~LoopbackBackend() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (stream_) {
    stream_->close();
  }
}

Discovery *LoopbackBackend::discovery() {
  return config_.capabilities.can_scan ? this : nullptr;
}

Advertiser *LoopbackBackend::advertiser() {
  return config_.capabilities.can_advertise ? this : nullptr;
}

Result<void> LoopbackBackend::enter(LoopbackOp op) {
  std::chrono::milliseconds delay{0};
  {
    std::lock_guard<std::mutex> lock(mutex_);
    switch (op) {
    case LoopbackOp::StartScan:
      ++stats_.start_scan_calls;
      break;
    case LoopbackOp::StopScan:
      ++stats_.stop_scan_calls;
      break;
    case LoopbackOp::Broadcast:
      ++stats_.broadcast_calls;
      break;
    case LoopbackOp::StopBroadcast:
      ++stats_.stop_broadcast_calls;
      break;
    }
    auto it = delays_.find(op);
    if (it != delays_.end()) {
      delay = it->second;
    }
  }

  if (delay.count() > 0) {
    std::this_thread::sleep_for(delay);
  }

  std::unique_lock<std::mutex> lock(mutex_);
  unblocked_cv_.wait(lock, [this, op] {
    auto it = blocked_.find(op);
    return it == blocked_.end() || !it->second;
  });

  auto failure = pending_failures_.find(op);
  if (failure != pending_failures_.end()) {
    Error err = failure->second;
    pending_failures_.erase(failure);
    return err.at(config_.name);
  }
  return Result<void>::ok();
}

// ============================================================================
// Discovery
// ============================================================================

Result<void> LoopbackBackend::start_scan() {
  PDROP_TRY(enter(LoopbackOp::StartScan));

  std::lock_guard<std::mutex> lock(mutex_);
  if (scanning_) {
    return Result<void>::ok();
  }
  stream_ = make_event_stream();
  ++stats_.streams_created;
  scanning_ = true;
  PDROP_LOG_DEBUG("'%s' scanning", config_.name.c_str());
  return Result<void>::ok();
}

Result<void> LoopbackBackend::stop_scan() {
  PDROP_TRY(enter(LoopbackOp::StopScan));

  std::lock_guard<std::mutex> lock(mutex_);
  if (scanning_ && stream_) {
    stream_->close();
  }
  scanning_ = false;
  return Result<void>::ok();
}

EventStream LoopbackBackend::poll_events() {
  std::lock_guard<std::mutex> lock(mutex_);
  ++stats_.poll_calls;
  if (!stream_) {
    return make_closed_event_stream();
  }
  return stream_;
}

// ============================================================================
// Advertiser
// ============================================================================

Result<void> LoopbackBackend::broadcast() {
  if (!config_.capabilities.can_advertise) {
    return Error(ErrorCode::CapabilityUnsupported,
                 "Backend has no advertising capability")
        .at(config_.name);
  }
  PDROP_TRY(enter(LoopbackOp::Broadcast));

  std::lock_guard<std::mutex> lock(mutex_);
  broadcasting_ = true;
  return Result<void>::ok();
}

Result<void> LoopbackBackend::stop_broadcast() {
  if (!config_.capabilities.can_advertise) {
    return Error(ErrorCode::CapabilityUnsupported,
                 "Backend has no advertising capability")
        .at(config_.name);
  }
  PDROP_TRY(enter(LoopbackOp::StopBroadcast));

  std::lock_guard<std::mutex> lock(mutex_);
  broadcasting_ = false;
  return Result<void>::ok();
}

// ============================================================================
// Scripting
// ============================================================================

bool LoopbackBackend::inject(DiscoveryEvent event) {
  EventStream stream;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!scanning_ || !stream_) {
      return false;
    }
    stream = stream_;
  }
  return stream->send(std::move(event));
}

bool LoopbackBackend::inject_discovered(
    const std::string &peer, std::optional<int> signal_dbm,
    std::map<std::string, std::string> metadata) {
  PeerInfo info;
  info.id = PeerId(peer);
  info.signal_dbm = signal_dbm;
  info.metadata = std::move(metadata);
  return inject(DiscoveryEvent::discovered(std::move(info)));
}

bool LoopbackBackend::inject_lost(const std::string &peer) {
  PeerInfo info;
  info.id = PeerId(peer);
  return inject(DiscoveryEvent::lost(std::move(info)));
}

void LoopbackBackend::close_stream() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (stream_) {
    stream_->close();
  }
  scanning_ = false;
}

void LoopbackBackend::fail_next(LoopbackOp op, Error error) {
  std::lock_guard<std::mutex> lock(mutex_);
  pending_failures_[op] = std::move(error);
}

void LoopbackBackend::set_delay(LoopbackOp op,
                                std::chrono::milliseconds delay) {
  std::lock_guard<std::mutex> lock(mutex_);
  delays_[op] = delay;
}

void LoopbackBackend::block(LoopbackOp op) {
  std::lock_guard<std::mutex> lock(mutex_);
  blocked_[op] = true;
}

void LoopbackBackend::unblock_all() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    blocked_.clear();
  }
  unblocked_cv_.notify_all();
}

LoopbackStats LoopbackBackend::stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}

bool LoopbackBackend::is_scanning() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return scanning_;
}

bool LoopbackBackend::is_broadcasting() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return broadcasting_;
}

} // namespace pdrop
