/**
 * @file pdrop.h
 * @brief Main pdrop API header
 *
 * pdrop finds nearby peers over several radios at once. Each radio is a
 * Backend; the Orchestrator runs them side by side and merges what they see
 * into one deduplicated, expiring view of the neighbourhood.
 *
 * Quick Start:
 * @code
 *   #include <pdrop/pdrop.h>
 *
 *   pdrop::Orchestrator orch;
 *   auto ble = pdrop::create_ble_backend();
 *   if (ble) {
 *       orch.register_backend(std::move(ble.value()));
 *   }
 *
 *   auto sub = orch.subscribe();
 *   auto report = orch.start();
 *
 *   pdrop::DiscoveryEvent ev;
 *   while (sub.next(ev, std::chrono::seconds(1)) == pdrop::ChannelStatus::Ok) {
 *       std::cout << pdrop::to_string(ev) << std::endl;
 *   }
 * @endcode
 */

#ifndef PDROP_PDROP_H
#define PDROP_PDROP_H

// Core headers (in dependency order)
#include "error.h"
#include "platform.h"
#include "types.h"

// Feature modules
#include "backend.h"
#include "channel.h"
#include "config.h"
#include "log.h"
#include "loopback_backend.h"
#include "merge_engine.h"
#include "orchestrator.h"
#include "state_machine.h"
#include "transports.h"

namespace pdrop {

// ============================================================================
// Version Information
// ============================================================================

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 3;
constexpr int VERSION_PATCH = 0;
constexpr const char *VERSION_STRING = "0.3.0";

struct VersionInfo {
  int major = VERSION_MAJOR;
  int minor = VERSION_MINOR;
  int patch = VERSION_PATCH;
  const char *version_string = VERSION_STRING;
  const char *build_date = __DATE__;
};

PDROP_API VersionInfo get_version();

/// "Linux" or "Android"
PDROP_API const char *get_platform_name();

} // namespace pdrop

#endif // PDROP_PDROP_H
