/**
 * @file test_util.h
 * @brief Shared helpers for pdrop tests
 */

#ifndef PDROP_TESTS_COMMON_TEST_UTIL_H
#define PDROP_TESTS_COMMON_TEST_UTIL_H

#include <pdrop/loopback_backend.h>
#include <pdrop/orchestrator.h>
#include <pdrop/types.h>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace pdrop {
namespace test {

using namespace std::chrono_literals;

/**
 * @brief Clock that only moves when told to
 *
 * Safe to read from pump and merge threads while the test advances it.
 */
class ManualClock {
public:
  ManualClock() : ticks_(SteadyClock::now().time_since_epoch().count()) {}

  TimePoint now() const {
    return TimePoint(SteadyClock::duration(ticks_.load()));
  }

  void advance(SteadyClock::duration d) { ticks_ += d.count(); }

  /// Clock function bound to this instance (which must outlive its users)
  Clock fn() {
    return [this] { return now(); };
  }

private:
  std::atomic<SteadyClock::rep> ticks_;
};

/// Poll pred until it holds or timeout passes
inline bool wait_for(const std::function<bool()> &pred,
                     std::chrono::milliseconds timeout = 2000ms) {
  auto deadline = SteadyClock::now() + timeout;
  while (SteadyClock::now() < deadline) {
    if (pred()) {
      return true;
    }
    std::this_thread::sleep_for(2ms);
  }
  return pred();
}

/// Next event from a subscription, or nullopt after timeout
inline std::optional<DiscoveryEvent>
next_event(Subscription &sub, std::chrono::milliseconds timeout = 2000ms) {
  DiscoveryEvent ev;
  if (sub.next(ev, timeout) == ChannelStatus::Ok) {
    return ev;
  }
  return std::nullopt;
}

/// Every event that arrives within window
inline std::vector<DiscoveryEvent> drain(Subscription &sub,
                                         std::chrono::milliseconds window) {
  std::vector<DiscoveryEvent> events;
  auto deadline = SteadyClock::now() + window;
  DiscoveryEvent ev;
  while (sub.next(ev, std::chrono::duration_cast<std::chrono::milliseconds>(
                          deadline - SteadyClock::now())) ==
         ChannelStatus::Ok) {
    events.push_back(ev);
    if (SteadyClock::now() >= deadline) {
      break;
    }
  }
  return events;
}

/// Loopback backend that must exist; the test fails loudly otherwise
inline std::shared_ptr<LoopbackBackend>
make_loopback(const std::string &name,
              Capabilities caps = Capabilities::scan_only(),
              TransportKind transport = TransportKind::Loopback) {
  LoopbackConfig cfg;
  cfg.name = name;
  cfg.capabilities = caps;
  cfg.transport = transport;
  auto created = LoopbackBackend::create(cfg);
  if (created.is_error()) {
    return nullptr;
  }
  return std::shared_ptr<LoopbackBackend>(std::move(created.value()));
}

/// Orchestrator timings short enough for tests
inline OrchestratorConfig fast_config() {
  OrchestratorConfig cfg;
  cfg.scan_ttl_seconds = 30;
  cfg.backend_start_timeout_ms = 500;
  cfg.backend_stop_timeout_ms = 500;
  cfg.sweep_interval_ms = 10;
  cfg.event_poll_interval_ms = 5;
  return cfg;
}

/**
 * @brief Set an environment variable for one scope
 */
class EnvGuard {
public:
  EnvGuard(const char *name, const char *value) : name_(name) {
    if (const char *old = std::getenv(name)) {
      old_ = std::string(old);
    }
    if (value) {
      ::setenv(name, value, 1);
    } else {
      ::unsetenv(name);
    }
  }

  ~EnvGuard() {
    if (old_) {
      ::setenv(name_.c_str(), old_->c_str(), 1);
    } else {
      ::unsetenv(name_.c_str());
    }
  }

  EnvGuard(const EnvGuard &) = delete;
  EnvGuard &operator=(const EnvGuard &) = delete;

private:
  std::string name_;
  std::optional<std::string> old_;
};

} // namespace test
} // namespace pdrop

#endif // PDROP_TESTS_COMMON_TEST_UTIL_H
