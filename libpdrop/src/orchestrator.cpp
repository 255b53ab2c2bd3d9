/**
 * @file orchestrator.cpp
 * @brief Orchestrator implementation
 */

#include "pdrop/orchestrator.h"
#include "pdrop/log.h"
#include "pdrop/merge_engine.h"
#include "pdrop/state_machine.h"
#include "task.h"
#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <string>
#include <thread>

namespace pdrop {

namespace {

using std::chrono::duration_cast;
using std::chrono::milliseconds;

/// Message from a pump (or from stop()) to the merge loop
struct Inbound {
  enum class Kind : uint8_t { Event, StreamEnded, Detach };

  Kind kind = Kind::Event;
  BackendId backend;
  DiscoveryEvent event;
  TimePoint at{};
};

using Inbox = Channel<Inbound>;

/// What a start worker achieved before handing back
struct StartOutcome {
  Result<void> result;
  EventStream stream;
  bool scanning = false;
  bool broadcasting = false;
};

Error attributed(Error err, const BackendId &id) {
  if (err.location.empty()) {
    err.location = id;
  }
  return err;
}

/// Run one backend call; an exception becomes an OperationError for id
template <typename F>
Result<void> guarded(const BackendId &id, const char *op, F &&call) {
  try {
    return call();
  } catch (const std::exception &e) {
    PDROP_LOG_ERROR("'%s' threw from %s: %s", id.c_str(), op, e.what());
    return Error(ErrorCode::OperationError,
                 std::string(op) + " threw: " + e.what())
        .at(id);
  }
}

void roll_back(Backend &backend, const BackendId &id, bool scanning,
               bool broadcasting) {
  if (broadcasting) {
    auto r = guarded(id, "stop_broadcast",
                     [&] { return stop_broadcast(backend); });
    if (r.is_error()) {
      PDROP_LOG_WARN("rollback of '%s' broadcast failed: %s", id.c_str(),
                     r.error().to_string().c_str());
    }
  }
  if (scanning) {
    auto r = guarded(id, "stop_scan", [&] { return stop_scan(backend); });
    if (r.is_error()) {
      PDROP_LOG_WARN("rollback of '%s' scan failed: %s", id.c_str(),
                     r.error().to_string().c_str());
    }
  }
}

/// Body of a start worker; runs on a detached thread
StartOutcome run_start(const std::shared_ptr<Backend> &backend, BackendId id,
                       Roles roles,
                       const std::shared_ptr<detail::Handoff> &handoff) {
  StartOutcome out;

  auto attempt = [&]() -> Result<void> {
    if (roles.scan) {
      PDROP_TRY(start_scan(*backend));
      auto stream = poll_events(*backend);
      if (stream.is_error()) {
        roll_back(*backend, id, true, false);
        return stream.error();
      }
      out.stream = stream.value();
      out.scanning = true;
    }
    if (roles.advertise) {
      auto r = broadcast(*backend);
      if (r.is_error()) {
        roll_back(*backend, id, out.scanning, false);
        out.scanning = false;
        out.stream.reset();
        return r;
      }
      out.broadcasting = true;
    }
    return Result<void>::ok();
  };

  out.result = guarded(id, "start", attempt);
  if (out.result.is_error() && out.scanning) {
    // broadcast() threw with the scan already up
    roll_back(*backend, id, true, false);
    out.scanning = false;
    out.stream.reset();
  }
  if (out.result.is_error()) {
    out.result = attributed(out.result.error(), id);
  }

  if (!handoff->complete()) {
    // The orchestrator gave up on us; undo what we started
    PDROP_LOG_WARN("abandoned start of '%s' returned late, rolling back",
                   id.c_str());
    roll_back(*backend, id, out.scanning, out.broadcasting);
  }
  return out;
}

/// Body of a stop worker; runs on a detached thread
Result<void> run_stop(const std::shared_ptr<Backend> &backend,
                      const BackendId &id, bool scanning, bool broadcasting) {
  Result<void> first;
  if (broadcasting) {
    auto r = guarded(id, "stop_broadcast",
                     [&] { return stop_broadcast(*backend); });
    if (r.is_error()) {
      first = attributed(r.error(), id);
    }
  }
  if (scanning) {
    auto r = guarded(id, "stop_scan", [&] { return stop_scan(*backend); });
    if (r.is_error() && first.is_ok()) {
      first = attributed(r.error(), id);
    }
  }
  return first;
}

void pump_loop(BackendId id, EventStream stream, std::shared_ptr<Inbox> inbox,
               std::shared_ptr<std::atomic<bool>> stop_flag, Clock clock,
               milliseconds poll) {
  DiscoveryEvent event;
  while (!stop_flag->load()) {
    auto status = stream->receive(event, poll);
    if (status == ChannelStatus::Ok) {
      inbox->send(Inbound{Inbound::Kind::Event, id, std::move(event), clock()});
    } else if (status == ChannelStatus::Closed) {
      inbox->send(Inbound{Inbound::Kind::StreamEnded, id, {}, clock()});
      return;
    }
  }
}

} // namespace

// ============================================================================
// Report
// ============================================================================

bool BackendFailureReport::all_succeeded() const {
  return failure_count() == 0;
}

size_t BackendFailureReport::failure_count() const {
  return static_cast<size_t>(
      std::count_if(outcomes.begin(), outcomes.end(),
                    [](const auto &kv) { return !kv.second.ok(); }));
}

std::vector<BackendId> BackendFailureReport::failed() const {
  std::vector<BackendId> ids;
  for (const auto &[id, outcome] : outcomes) {
    if (!outcome.ok()) {
      ids.push_back(id);
    }
  }
  return ids;
}

const BackendOutcome *
BackendFailureReport::find(const BackendId &backend) const {
  auto it = outcomes.find(backend);
  return it == outcomes.end() ? nullptr : &it->second;
}

// ============================================================================
// Subscription
// ============================================================================

Subscription::~Subscription() { cancel(); }

Subscription &Subscription::operator=(Subscription &&other) noexcept {
  if (this != &other) {
    cancel();
    events_ = std::move(other.events_);
    failures_ = std::move(other.failures_);
  }
  return *this;
}

ChannelStatus Subscription::next(DiscoveryEvent &out,
                                 std::chrono::milliseconds timeout) {
  if (!events_) {
    return ChannelStatus::Closed;
  }
  return events_->receive(out, timeout);
}

std::optional<DiscoveryEvent> Subscription::try_next() {
  if (!events_) {
    return std::nullopt;
  }
  return events_->try_receive();
}

ChannelStatus Subscription::next_failure(BackendFailure &out,
                                         std::chrono::milliseconds timeout) {
  if (!failures_) {
    return ChannelStatus::Closed;
  }
  return failures_->receive(out, timeout);
}

std::optional<BackendFailure> Subscription::try_next_failure() {
  if (!failures_) {
    return std::nullopt;
  }
  return failures_->try_receive();
}

size_t Subscription::dropped() const {
  return (events_ ? events_->dropped() : 0) +
         (failures_ ? failures_->dropped() : 0);
}

bool Subscription::is_closed() const {
  return !events_ || events_->is_finished();
}

void Subscription::cancel() {
  if (events_) {
    events_->close();
  }
  if (failures_) {
    failures_->close();
  }
}

// ============================================================================
// Orchestrator Implementation
// ============================================================================

struct BackendRecord {
  BackendId id;
  std::shared_ptr<Backend> backend;
  TransportKind transport = TransportKind::Unknown;
  Capabilities caps;
  Roles roles;
  BackendStateMachine sm;

  bool scan_active = false;
  bool broadcast_active = false;
  std::optional<Error> last_error;
  bool leaked = false;

  std::thread pump;
  std::shared_ptr<std::atomic<bool>> pump_stop;

  void join_pump() {
    if (pump_stop) {
      pump_stop->store(true);
    }
    if (pump.joinable()) {
      pump.join();
    }
  }

  BackendStatus status() const {
    BackendStatus s;
    s.id = id;
    s.transport = transport;
    s.capabilities = caps;
    s.roles = roles;
    s.state = sm.current();
    s.last_error = last_error;
    s.leaked = leaked;
    return s;
  }
};

class Orchestrator::Impl {
public:
  Impl(OrchestratorConfig cfg, Clock clk)
      : config(cfg), clock(std::move(clk)),
        engine(MergeOptions{cfg.scan_ttl(), cfg.dedupe_window}) {
    if (!clock) {
      clock = [] { return SteadyClock::now(); };
    }
  }

  OrchestratorConfig config;
  Clock clock;

  /// Serializes start/stop/register/unregister/reset
  std::mutex lifecycle_mutex;

  /// Guards records and running
  mutable std::mutex mutex;
  std::map<BackendId, std::unique_ptr<BackendRecord>> records;
  bool running = false;

  // Merge loop (engine is touched only by the merge thread)
  MergeEngine engine;
  std::shared_ptr<Inbox> inbox;
  std::thread merge_thread;

  struct Subscriber {
    std::shared_ptr<Channel<DiscoveryEvent>> events;
    std::shared_ptr<Channel<BackendFailure>> failures;
  };

  /// Guards snapshot and subscribers
  mutable std::mutex publish_mutex;
  std::vector<PeerInfo> snapshot;
  std::vector<Subscriber> subscribers;

  // ========================================================================
  // Publication
  // ========================================================================

  void publish(const std::vector<DiscoveryEvent> &events) {
    std::lock_guard<std::mutex> lock(publish_mutex);
    snapshot = engine.snapshot();

    for (const auto &event : events) {
      PDROP_LOG_DEBUG("%s", to_string(event).c_str());
      for (auto &sub : subscribers) {
        sub.events->send(event);
      }
    }

    subscribers.erase(std::remove_if(subscribers.begin(), subscribers.end(),
                                     [](const Subscriber &s) {
                                       return s.events->is_closed();
                                     }),
                      subscribers.end());
  }

  void publish_failure(const BackendFailure &failure) {
    std::lock_guard<std::mutex> lock(publish_mutex);
    for (auto &sub : subscribers) {
      sub.failures->send(failure);
    }
  }

  // ========================================================================
  // Merge Loop
  // ========================================================================

  void handle(Inbound &msg) {
    switch (msg.kind) {
    case Inbound::Kind::Event:
      publish(engine.apply(msg.backend, msg.event, msg.at));
      break;

    case Inbound::Kind::StreamEnded:
      on_stream_ended(msg.backend, msg.at);
      break;

    case Inbound::Kind::Detach:
      publish(engine.remove_backend(msg.backend));
      break;
    }
  }

  void on_stream_ended(const BackendId &id, TimePoint at) {
    std::optional<BackendFailure> failure;
    {
      std::lock_guard<std::mutex> lock(mutex);
      auto it = records.find(id);
      if (it != records.end() && it->second->sm.is_active()) {
        BackendRecord &rec = *it->second;
        Error err(ErrorCode::StreamClosed,
                  "Event stream ended while scanning");
        err.at(id);

        auto t = rec.sm.transition(BackendState::Disabled);
        if (t.is_error()) {
          PDROP_LOG_ERROR("%s", t.error().to_string().c_str());
        }
        rec.scan_active = false;
        rec.last_error = err;
        PDROP_LOG_WARN("backend '%s' lost its event stream, disabling",
                       id.c_str());

        if (rec.broadcast_active) {
          rec.broadcast_active = false;
          auto backend = rec.backend;
          BackendId bid = id;
          // Fire and forget; the future's destructor does not wait
          detail::launch_detached([backend, bid]() {
            auto r = run_stop(backend, bid, false, true);
            if (r.is_error()) {
              PDROP_LOG_WARN("stop_broadcast after stream loss failed: %s",
                             r.error().to_string().c_str());
            }
          });
        }

        failure = BackendFailure{id, err, BackendState::Disabled, at};
      }
    }

    publish(engine.remove_backend(id));
    if (failure) {
      publish_failure(*failure);
    }
  }

  void merge_loop() {
    const auto interval = config.sweep_interval();
    auto next_sweep = SteadyClock::now() + interval;
    Inbound msg;

    for (;;) {
      auto status = inbox->receive_until(msg, next_sweep);
      if (status == ChannelStatus::Closed) {
        break;
      }
      if (status == ChannelStatus::Ok) {
        handle(msg);
      }

      if (SteadyClock::now() >= next_sweep) {
        auto expired = engine.sweep(clock());
        if (!expired.empty()) {
          publish(expired);
        }
        next_sweep = SteadyClock::now() + interval;
      }
    }
  }

  void start_merge_loop() {
    engine = MergeEngine(MergeOptions{config.scan_ttl(), config.dedupe_window});
    inbox = std::make_shared<Inbox>();
    merge_thread = std::thread([this] { merge_loop(); });
  }

  // ========================================================================
  // Helpers
  // ========================================================================

  BackendRecord *find_record(const BackendId &id) {
    auto it = records.find(id);
    return it == records.end() ? nullptr : it->second.get();
  }

  void set_state(BackendRecord &rec, BackendState to) {
    auto r = rec.sm.transition(to);
    if (r.is_error()) {
      PDROP_LOG_ERROR("backend '%s': %s", rec.id.c_str(),
                      r.error().to_string().c_str());
    }
  }
};

Orchestrator::Orchestrator(OrchestratorConfig config, Clock clock)
    : impl_(std::make_unique<Impl>(config, std::move(clock))) {}

Orchestrator::~Orchestrator() {
  auto result = stop();
  if (result.is_error()) {
    PDROP_LOG_ERROR("stop during destruction failed: %s",
                    result.error().to_string().c_str());
  }

  // Pumps of backends disabled outside of stop() may still be joinable
  std::lock_guard<std::mutex> lock(impl_->mutex);
  for (auto &[id, rec] : impl_->records) {
    rec->join_pump();
  }
}

// ============================================================================
// Registration
// ============================================================================

Result<BackendId> Orchestrator::register_backend(std::shared_ptr<Backend> backend,
                                                 Roles roles) {
  PDROP_REQUIRE(backend != nullptr, ErrorCode::InvalidArgument,
                "Backend is null");
  PDROP_REQUIRE(roles.any(), ErrorCode::InvalidArgument,
                "No role requested");
  PDROP_TRY(validate_backend(*backend));

  BackendId id = backend->name();
  Capabilities caps = backend->capabilities();

  if (roles.scan && !caps.can_scan) {
    return Error(ErrorCode::CapabilityUnsupported,
                 "Scan role requested but backend cannot scan")
        .at(id);
  }
  if (roles.advertise && !caps.can_advertise) {
    return Error(ErrorCode::CapabilityUnsupported,
                 "Advertise role requested but backend cannot advertise")
        .at(id);
  }

  std::lock_guard<std::mutex> life(impl_->lifecycle_mutex);
  std::lock_guard<std::mutex> lock(impl_->mutex);

  if (impl_->records.count(id) != 0) {
    return Error(ErrorCode::AlreadyExists, "Backend name already registered")
        .at(id);
  }

  auto rec = std::make_unique<BackendRecord>();
  rec->id = id;
  rec->transport = backend->transport();
  rec->caps = caps;
  rec->roles = roles;
  rec->backend = std::move(backend);
  rec->sm.on_state_changed([id](BackendState from, BackendState to) {
    PDROP_LOG_DEBUG("backend '%s': %s -> %s", id.c_str(),
                    backend_state_name(from), backend_state_name(to));
  });

  PDROP_LOG_INFO("registered backend '%s' (%s, scan=%d advertise=%d)",
                 id.c_str(), transport_kind_name(rec->transport), roles.scan,
                 roles.advertise);
  impl_->records.emplace(id, std::move(rec));
  return id;
}

Result<void> Orchestrator::unregister_backend(const BackendId &id) {
  std::lock_guard<std::mutex> life(impl_->lifecycle_mutex);

  std::unique_ptr<BackendRecord> rec;
  bool running = false;
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto it = impl_->records.find(id);
    if (it == impl_->records.end()) {
      return Error(ErrorCode::NotFound, "No such backend").at(id);
    }

    BackendState state = it->second->sm.current();
    if (state == BackendState::Starting || state == BackendState::Stopping ||
        it->second->sm.is_active()) {
      return Error(ErrorCode::InvalidState,
                   std::string("Cannot unregister a backend while ") +
                       backend_state_name(state))
          .at(id);
    }

    rec = std::move(it->second);
    impl_->records.erase(it);
    running = impl_->running;
  }

  rec->join_pump();
  if (running) {
    impl_->inbox->send(Inbound{Inbound::Kind::Detach, id, {}, impl_->clock()});
  }

  PDROP_LOG_INFO("unregistered backend '%s'", id.c_str());
  return Result<void>::ok();
}

Result<void> Orchestrator::reset_backend(const BackendId &id) {
  std::lock_guard<std::mutex> life(impl_->lifecycle_mutex);
  std::lock_guard<std::mutex> lock(impl_->mutex);

  BackendRecord *rec = impl_->find_record(id);
  if (!rec) {
    return Error(ErrorCode::NotFound, "No such backend").at(id);
  }

  auto result = rec->sm.reset();
  if (result.is_error()) {
    return result.error().at(id);
  }

  rec->join_pump();
  rec->pump_stop.reset();
  if (rec->leaked) {
    PDROP_LOG_WARN("resetting '%s' while an abandoned call may still be "
                   "running inside it",
                   id.c_str());
  }
  rec->leaked = false;
  rec->last_error.reset();
  rec->scan_active = false;
  rec->broadcast_active = false;
  return Result<void>::ok();
}

// ============================================================================
// Lifecycle
// ============================================================================

BackendFailureReport Orchestrator::start() {
  std::lock_guard<std::mutex> life(impl_->lifecycle_mutex);

  struct Pending {
    BackendRecord *rec;
    std::future<StartOutcome> future;
    std::shared_ptr<detail::Handoff> handoff;
  };

  BackendFailureReport report;
  std::vector<Pending> pending;
  const auto began = SteadyClock::now();

  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (!impl_->running) {
      impl_->start_merge_loop();
      impl_->running = true;
    }

    for (auto &[id, rec] : impl_->records) {
      BackendState state = rec->sm.current();

      if (state == BackendState::Idle) {
        impl_->set_state(*rec, BackendState::Starting);
        auto handoff = std::make_shared<detail::Handoff>();
        auto backend = rec->backend;
        BackendId bid = id;
        Roles roles = rec->roles;
        pending.push_back(
            Pending{rec.get(), detail::launch_detached([backend, bid, roles,
                                                        handoff]() {
                      return run_start(backend, bid, roles, handoff);
                    }),
                    handoff});
        continue;
      }

      BackendOutcome outcome;
      outcome.backend = id;
      outcome.state = state;
      if (!rec->sm.is_active()) {
        outcome.result =
            Error(ErrorCode::InvalidState,
                  std::string("Backend is ") + backend_state_name(state) +
                      "; reset_backend() before starting it again")
                .at(id);
      }
      report.outcomes.emplace(id, std::move(outcome));
    }
  }

  const auto deadline = began + impl_->config.start_timeout();
  std::vector<BackendFailure> failures;

  for (auto &p : pending) {
    BackendRecord &rec = *p.rec;
    BackendOutcome outcome;
    outcome.backend = rec.id;

    bool ready =
        p.future.wait_until(deadline) == std::future_status::ready;
    if (!ready && !p.handoff->abandon()) {
      // Completed between the deadline and the abandon attempt
      ready = true;
    }

    std::lock_guard<std::mutex> lock(impl_->mutex);
    outcome.elapsed = duration_cast<milliseconds>(SteadyClock::now() - began);

    if (!ready) {
      Error err(ErrorCode::Timeout,
                "Start did not complete within " +
                    std::to_string(impl_->config.backend_start_timeout_ms) +
                    " ms");
      err.at(rec.id);
      impl_->set_state(rec, BackendState::Disabled);
      rec.leaked = true;
      rec.last_error = err;
      outcome.result = err;
      PDROP_LOG_WARN("backend '%s' start timed out, disabling", rec.id.c_str());
    } else {
      StartOutcome started = p.future.get();
      if (started.result.is_error()) {
        impl_->set_state(rec, BackendState::Failed);
        rec.last_error = started.result.error();
        outcome.result = started.result;
        PDROP_LOG_WARN("backend '%s' failed to start: %s", rec.id.c_str(),
                       started.result.error().to_string().c_str());
      } else {
        rec.scan_active = started.scanning;
        rec.broadcast_active = started.broadcasting;
        rec.last_error.reset();
        impl_->set_state(rec, started.scanning ? BackendState::Scanning
                                               : BackendState::Broadcasting);

        if (started.scanning) {
          rec.pump_stop = std::make_shared<std::atomic<bool>>(false);
          rec.pump = std::thread(pump_loop, rec.id, started.stream,
                                 impl_->inbox, rec.pump_stop, impl_->clock,
                                 impl_->config.poll_interval());
        }
      }
    }

    outcome.state = rec.sm.current();
    if (outcome.result.is_error()) {
      failures.push_back(BackendFailure{rec.id, outcome.result.error(),
                                        outcome.state, impl_->clock()});
    }
    report.outcomes.emplace(rec.id, std::move(outcome));
  }

  for (const auto &f : failures) {
    impl_->publish_failure(f);
  }

  PDROP_LOG_INFO("start: %zu backend(s), %zu failed", report.outcomes.size(),
                 report.failure_count());
  return report;
}

Result<void> Orchestrator::stop() {
  std::lock_guard<std::mutex> life(impl_->lifecycle_mutex);

  struct Pending {
    BackendRecord *rec;
    std::future<Result<void>> future;
  };
  std::vector<Pending> pending;

  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (!impl_->running) {
      return Result<void>::ok();
    }

    for (auto &[id, rec] : impl_->records) {
      if (!rec->sm.is_active()) {
        continue;
      }
      impl_->set_state(*rec, BackendState::Stopping);
      auto backend = rec->backend;
      BackendId bid = id;
      bool scanning = rec->scan_active;
      bool broadcasting = rec->broadcast_active;
      pending.push_back(
          Pending{rec.get(), detail::launch_detached([backend, bid, scanning,
                                                      broadcasting]() {
                    return run_stop(backend, bid, scanning, broadcasting);
                  })});
    }
  }

  const auto deadline =
      SteadyClock::now() + impl_->config.stop_timeout();
  std::vector<BackendFailure> failures;

  for (auto &p : pending) {
    BackendRecord &rec = *p.rec;
    bool ready =
        p.future.wait_until(deadline) == std::future_status::ready;

    std::lock_guard<std::mutex> lock(impl_->mutex);
    rec.scan_active = false;
    rec.broadcast_active = false;

    if (!ready) {
      Error err(ErrorCode::Timeout,
                "Stop did not complete within " +
                    std::to_string(impl_->config.backend_stop_timeout_ms) +
                    " ms");
      err.at(rec.id);
      impl_->set_state(rec, BackendState::Disabled);
      rec.leaked = true;
      rec.last_error = err;
      PDROP_LOG_WARN("backend '%s' did not stop in time; abandoning it, its "
                     "platform resources may leak",
                     rec.id.c_str());
      failures.push_back(
          BackendFailure{rec.id, err, BackendState::Disabled, impl_->clock()});
      continue;
    }

    Result<void> result = p.future.get();
    if (result.is_error()) {
      impl_->set_state(rec, BackendState::Disabled);
      rec.last_error = result.error();
      PDROP_LOG_WARN("backend '%s' failed to stop: %s", rec.id.c_str(),
                     result.error().to_string().c_str());
      failures.push_back(BackendFailure{rec.id, result.error(),
                                        BackendState::Disabled,
                                        impl_->clock()});
    } else {
      impl_->set_state(rec, BackendState::Idle);
    }
  }

  for (const auto &f : failures) {
    impl_->publish_failure(f);
  }

  // Pumps end within one poll interval once flagged
  std::vector<BackendId> ids;
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    for (auto &[id, rec] : impl_->records) {
      rec->join_pump();
      ids.push_back(id);
    }
  }

  for (const auto &id : ids) {
    impl_->inbox->send(Inbound{Inbound::Kind::Detach, id, {}, impl_->clock()});
  }
  impl_->inbox->close();
  if (impl_->merge_thread.joinable()) {
    impl_->merge_thread.join();
  }

  {
    std::lock_guard<std::mutex> lock(impl_->publish_mutex);
    for (auto &sub : impl_->subscribers) {
      sub.events->close();
      sub.failures->close();
    }
    impl_->subscribers.clear();
    impl_->snapshot.clear();
  }

  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->running = false;
  }

  PDROP_LOG_INFO("stopped (%zu backend(s) failed to stop cleanly)",
                 failures.size());
  return Result<void>::ok();
}

bool Orchestrator::is_running() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->running;
}

// ============================================================================
// Observation
// ============================================================================

Subscription Orchestrator::subscribe() {
  const size_t capacity = impl_->config.subscriber_queue_capacity;
  auto events = std::make_shared<Channel<DiscoveryEvent>>(capacity);
  auto failures = std::make_shared<Channel<BackendFailure>>(capacity);

  std::lock_guard<std::mutex> lock(impl_->publish_mutex);
  for (const auto &peer : impl_->snapshot) {
    events->send(DiscoveryEvent::discovered(peer));
  }
  impl_->subscribers.push_back(Impl::Subscriber{events, failures});
  return Subscription(events, failures);
}

std::vector<PeerInfo> Orchestrator::query_peers() const {
  std::lock_guard<std::mutex> lock(impl_->publish_mutex);
  return impl_->snapshot;
}

std::optional<PeerInfo> Orchestrator::find_peer(const PeerId &id) const {
  std::lock_guard<std::mutex> lock(impl_->publish_mutex);
  for (const auto &peer : impl_->snapshot) {
    if (peer.id == id) {
      return peer;
    }
  }
  return std::nullopt;
}

std::vector<BackendStatus> Orchestrator::backend_status() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  std::vector<BackendStatus> result;
  result.reserve(impl_->records.size());
  for (const auto &[id, rec] : impl_->records) {
    result.push_back(rec->status());
  }
  return result;
}

std::optional<BackendStatus>
Orchestrator::backend_status(const BackendId &id) const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  auto it = impl_->records.find(id);
  if (it == impl_->records.end()) {
    return std::nullopt;
  }
  return it->second->status();
}

const OrchestratorConfig &Orchestrator::config() const {
  return impl_->config;
}

} // namespace pdrop
