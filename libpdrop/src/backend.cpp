/**
 * @file backend.cpp
 * @brief Backend contract helpers
 */

#include "pdrop/backend.h"

namespace pdrop {

namespace {

Error unsupported(const Backend &backend, const char *operation) {
  Error err(ErrorCode::CapabilityUnsupported,
            std::string(operation) + " not declared by backend");
  return err.at(backend.name());
}

} // namespace

EventStream make_event_stream() {
  return std::make_shared<Channel<DiscoveryEvent>>();
}

EventStream make_closed_event_stream() {
  auto stream = make_event_stream();
  stream->close();
  return stream;
}

const char *backend_state_name(BackendState state) {
  switch (state) {
  case BackendState::Idle:
    return "Idle";
  case BackendState::Starting:
    return "Starting";
  case BackendState::Scanning:
    return "Scanning";
  case BackendState::Broadcasting:
    return "Broadcasting";
  case BackendState::Stopping:
    return "Stopping";
  case BackendState::Failed:
    return "Failed";
  case BackendState::Disabled:
    return "Disabled";
  default:
    return "Unknown";
  }
}

Result<void> validate_backend(Backend &backend) {
  auto caps = backend.capabilities();

  if (backend.name().empty()) {
    return Error(ErrorCode::InvalidArgument, "Backend name is empty");
  }
  if (!caps.can_scan && !caps.can_advertise) {
    return Error(ErrorCode::InvalidArgument, "Backend declares no capability")
        .at(backend.name());
  }
  if (caps.can_scan && backend.discovery() == nullptr) {
    return Error(ErrorCode::InvalidArgument,
                 "CanScan declared without a Discovery interface")
        .at(backend.name());
  }
  if (caps.can_advertise && backend.advertiser() == nullptr) {
    return Error(ErrorCode::InvalidArgument,
                 "CanAdvertise declared without an Advertiser interface")
        .at(backend.name());
  }
  return Result<void>::ok();
}

Result<void> start_scan(Backend &backend) {
  Discovery *d = backend.discovery();
  if (!backend.capabilities().can_scan || d == nullptr) {
    return unsupported(backend, "start_scan");
  }
  return d->start_scan();
}

Result<void> stop_scan(Backend &backend) {
  Discovery *d = backend.discovery();
  if (!backend.capabilities().can_scan || d == nullptr) {
    return unsupported(backend, "stop_scan");
  }
  return d->stop_scan();
}

Result<EventStream> poll_events(Backend &backend) {
  Discovery *d = backend.discovery();
  if (!backend.capabilities().can_scan || d == nullptr) {
    return unsupported(backend, "poll_events");
  }
  EventStream stream = d->poll_events();
  if (!stream) {
    return Error(ErrorCode::OperationError, "Backend returned no event stream")
        .at(backend.name());
  }
  return stream;
}

Result<void> broadcast(Backend &backend) {
  Advertiser *a = backend.advertiser();
  if (!backend.capabilities().can_advertise || a == nullptr) {
    return unsupported(backend, "broadcast");
  }
  return a->broadcast();
}

Result<void> stop_broadcast(Backend &backend) {
  Advertiser *a = backend.advertiser();
  if (!backend.capabilities().can_advertise || a == nullptr) {
    return unsupported(backend, "stop_broadcast");
  }
  return a->stop_broadcast();
}

} // namespace pdrop
