/**
 * @file main.cpp
 * @brief pdrop-scan: print nearby peers seen over BLE and Wi-Fi Direct
 *
 * Usage:
 *   pdrop-scan [--config PATH] [--duration SECONDS] [--log-level LEVEL]
 *              [--write-config PATH] [--version] [--help]
 *
 * The config file defaults to $PDROP_CONFIG, then the per-user location.
 * PDROP_* environment variables override values from the file.
 */

#include <pdrop/pdrop.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <memory>
#include <string>

namespace {

std::atomic<bool> g_interrupted{false};

void on_signal(int) { g_interrupted = true; }

struct Options {
  std::string config_path;
  std::string write_config_path;
  std::string log_level;
  long duration_seconds = 0; // 0 = until interrupted
};

void print_usage(const char *argv0) {
  std::printf(
      "Usage: %s [options]\n"
      "  --config PATH         read settings from PATH\n"
      "  --duration SECONDS    stop after SECONDS (default: until Ctrl-C)\n"
      "  --log-level LEVEL     debug, info, warn, error or off\n"
      "  --write-config PATH   write the effective settings to PATH and exit\n"
      "  --version             print version and exit\n"
      "  --help                show this help\n",
      argv0);
}

/// 0 to continue, otherwise process exit code + 1
int parse_args(int argc, char **argv, Options &opts) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    auto needs_value = [&](const char *flag) -> const char * {
      if (i + 1 >= argc) {
        std::fprintf(stderr, "%s requires a value\n", flag);
        return nullptr;
      }
      return argv[++i];
    };

    if (arg == "--help" || arg == "-h") {
      print_usage(argv[0]);
      return 1;
    } else if (arg == "--version") {
      std::printf("pdrop-scan %s (%s)\n", pdrop::VERSION_STRING,
                  pdrop::get_platform_name());
      return 1;
    } else if (arg == "--config") {
      const char *v = needs_value("--config");
      if (!v) {
        return 3;
      }
      opts.config_path = v;
    } else if (arg == "--write-config") {
      const char *v = needs_value("--write-config");
      if (!v) {
        return 3;
      }
      opts.write_config_path = v;
    } else if (arg == "--log-level") {
      const char *v = needs_value("--log-level");
      if (!v) {
        return 3;
      }
      opts.log_level = v;
    } else if (arg == "--duration") {
      const char *v = needs_value("--duration");
      if (!v) {
        return 3;
      }
      char *end = nullptr;
      opts.duration_seconds = std::strtol(v, &end, 10);
      if (end == v || *end != '\0' || opts.duration_seconds < 0) {
        std::fprintf(stderr, "invalid --duration '%s'\n", v);
        return 3;
      }
    } else {
      std::fprintf(stderr, "unknown option '%s'\n", arg.c_str());
      print_usage(argv[0]);
      return 3;
    }
  }
  return 0;
}

void print_event(const pdrop::DiscoveryEvent &ev) {
  std::string via;
  for (const auto &t : ev.peer.transports) {
    via += via.empty() ? t : "," + t;
  }
  std::string name = ev.peer.metadata_value("name");

  if (ev.is_discovered()) {
    if (ev.peer.signal_dbm) {
      std::printf("+ %-24s via %-16s %4d dBm  %s\n", ev.peer.id.str().c_str(),
                  via.c_str(), *ev.peer.signal_dbm, name.c_str());
    } else {
      std::printf("+ %-24s via %-16s           %s\n", ev.peer.id.str().c_str(),
                  via.c_str(), name.c_str());
    }
  } else {
    std::printf("- %-24s via %s\n", ev.peer.id.str().c_str(), via.c_str());
  }
  std::fflush(stdout);
}

/// Create and register one backend; a backend that cannot be opened is
/// skipped so the others still run
void add_backend(pdrop::Orchestrator &orch,
                 pdrop::Result<std::unique_ptr<pdrop::Backend>> created,
                 pdrop::Roles roles) {
  if (created.is_error()) {
    PDROP_LOG_WARN("skipping backend: %s", created.error().to_string().c_str());
    return;
  }
  auto id = orch.register_backend(std::move(created.value()), roles);
  if (id.is_error()) {
    PDROP_LOG_WARN("cannot register backend: %s",
                   id.error().to_string().c_str());
  }
}

} // namespace

int main(int argc, char **argv) {
  Options opts;
  if (int rc = parse_args(argc, argv, opts)) {
    return rc - 1;
  }

  // Configuration
  if (opts.config_path.empty()) {
    if (const char *env = std::getenv("PDROP_CONFIG")) {
      opts.config_path = env;
    }
  }

  pdrop::ConfigManager config;
  auto loaded = config.init(opts.config_path);
  if (loaded.is_error()) {
    std::fprintf(stderr, "config: %s\n", loaded.error().to_string().c_str());
    return 2;
  }
  auto overridden = config.apply_env_overrides();
  if (overridden.is_error()) {
    std::fprintf(stderr, "environment: %s\n",
                 overridden.error().to_string().c_str());
    return 2;
  }

  const pdrop::PdropConfig &cfg = config.get();
  std::string level = opts.log_level.empty() ? cfg.log_level : opts.log_level;
  if (!pdrop::log::set_level_by_name(level)) {
    std::fprintf(stderr, "unknown log level '%s'\n", level.c_str());
    return 2;
  }

  if (!opts.write_config_path.empty()) {
    std::ofstream out(opts.write_config_path);
    if (!out) {
      std::fprintf(stderr, "cannot write %s\n",
                   opts.write_config_path.c_str());
      return 2;
    }
    pdrop::write_config(out, cfg);
    return 0;
  }

  // Backends
  pdrop::Orchestrator orch(cfg.orchestrator);

  if (cfg.enable_ble) {
    add_backend(orch, pdrop::create_ble_backend(cfg.ble),
                cfg.ble_advertise ? pdrop::Roles::both()
                                  : pdrop::Roles::scanner());
  }
  if (cfg.enable_wifi_direct) {
    add_backend(orch, pdrop::create_wifi_direct_backend(cfg.wifi_direct),
                cfg.wifi_direct_advertise ? pdrop::Roles::both()
                                          : pdrop::Roles::scanner());
  }

  if (orch.backend_status().empty()) {
    std::fprintf(stderr, "no discovery backend available\n");
    return 1;
  }

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  auto sub = orch.subscribe();
  auto report = orch.start();

  for (const auto &[id, outcome] : report.outcomes) {
    if (outcome.ok()) {
      PDROP_LOG_INFO("%s: %s (%lld ms)", id.c_str(),
                     pdrop::backend_state_name(outcome.state),
                     static_cast<long long>(outcome.elapsed.count()));
    } else {
      PDROP_LOG_WARN("%s: %s", id.c_str(),
                     outcome.result.error().to_string().c_str());
    }
  }
  if (report.failure_count() == report.outcomes.size()) {
    std::fprintf(stderr, "every backend failed to start\n");
    auto stopped = orch.stop();
    if (stopped.is_error()) {
      PDROP_LOG_WARN("stop: %s", stopped.error().to_string().c_str());
    }
    return 1;
  }

  // Event loop
  auto deadline = std::chrono::steady_clock::now() +
                  std::chrono::seconds(opts.duration_seconds);
  while (!g_interrupted.load()) {
    if (opts.duration_seconds > 0 &&
        std::chrono::steady_clock::now() >= deadline) {
      break;
    }

    pdrop::DiscoveryEvent ev;
    auto status = sub.next(ev, std::chrono::milliseconds(250));
    if (status == pdrop::ChannelStatus::Closed) {
      break;
    }
    if (status == pdrop::ChannelStatus::Ok) {
      print_event(ev);
    }

    while (auto failure = sub.try_next_failure()) {
      PDROP_LOG_WARN("%s is now %s: %s", failure->backend.c_str(),
                     pdrop::backend_state_name(failure->state),
                     failure->error.to_string().c_str());
    }
  }

  auto peers = orch.query_peers();
  std::printf("%zu peer(s) in view\n", peers.size());

  auto stopped = orch.stop();
  if (stopped.is_error()) {
    PDROP_LOG_WARN("stop: %s", stopped.error().to_string().c_str());
    return 1;
  }
  return 0;
}
