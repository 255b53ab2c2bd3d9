/**
 * @file loopback_backend.h
 * @brief In-process backend for tests and dry runs
 *
 * The loopback backend has no radio. Sightings are injected by the caller,
 * and every lifecycle operation can be scripted to fail, to take a while,
 * or to hang until released.
 */

#ifndef PDROP_LOOPBACK_BACKEND_H
#define PDROP_LOOPBACK_BACKEND_H

#include "backend.h"
#include "error.h"
#include "platform.h"
#include "types.h"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace pdrop {

struct LoopbackConfig {
  std::string name = "loopback";
  TransportKind transport = TransportKind::Loopback;
  Capabilities capabilities = Capabilities::scan_only();
};

/// Lifecycle operations that can be scripted
enum class LoopbackOp : uint8_t {
  StartScan = 0,
  StopScan = 1,
  Broadcast = 2,
  StopBroadcast = 3
};

struct LoopbackStats {
  uint32_t start_scan_calls = 0;
  uint32_t stop_scan_calls = 0;
  uint32_t broadcast_calls = 0;
  uint32_t stop_broadcast_calls = 0;
  uint32_t poll_calls = 0;

  /// Distinct event streams handed out
  uint32_t streams_created = 0;
};

class PDROP_API LoopbackBackend final : public Backend,
                                        public Discovery,
                                        public Advertiser {
public:
  /**
   * @return InitializationError for an empty name or no capability
   */
  static Result<std::unique_ptr<LoopbackBackend>>
  create(const LoopbackConfig &config = {});

  ~LoopbackBackend() override;

  // Backend
  std::string name() const override { return config_.name; }
  TransportKind transport() const override { return config_.transport; }
  Capabilities capabilities() const override { return config_.capabilities; }
  Discovery *discovery() override;
  Advertiser *advertiser() override;

  // Discovery
  Result<void> start_scan() override;
  Result<void> stop_scan() override;
  EventStream poll_events() override;

  // Advertiser
  Result<void> broadcast() override;
  Result<void> stop_broadcast() override;

  // ========================================================================
  // Scripting
  // ========================================================================

  /// Push a raw event into the current stream; false when not scanning
  bool inject(DiscoveryEvent event);

  bool inject_discovered(const std::string &peer,
                         std::optional<int> signal_dbm = std::nullopt,
                         std::map<std::string, std::string> metadata = {});

  bool inject_lost(const std::string &peer);

  /// End the current stream as if the transport died
  void close_stream();

  /// Make the next call of op fail with error
  void fail_next(LoopbackOp op, Error error);

  /// Make every call of op sleep first
  void set_delay(LoopbackOp op, std::chrono::milliseconds delay);

  /// Make calls of op hang until unblock_all()
  void block(LoopbackOp op);
  void unblock_all();

  LoopbackStats stats() const;
  bool is_scanning() const;
  bool is_broadcasting() const;

private:
  explicit LoopbackBackend(LoopbackConfig config);

  /// Count, delay, block and inject failure for one call of op
  Result<void> enter(LoopbackOp op);

  LoopbackConfig config_;

  mutable std::mutex mutex_;
  std::condition_variable unblocked_cv_;

  EventStream stream_;
  bool scanning_ = false;
  bool broadcasting_ = false;

  LoopbackStats stats_;
  std::map<LoopbackOp, Error> pending_failures_;
  std::map<LoopbackOp, std::chrono::milliseconds> delays_;
  std::map<LoopbackOp, bool> blocked_;
};

} // namespace pdrop

#endif // PDROP_LOOPBACK_BACKEND_H
