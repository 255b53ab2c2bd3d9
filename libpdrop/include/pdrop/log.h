/**
 * @file log.h
 * @brief Leveled logging for pdrop
 *
 * printf-style logging with a global level. Lines go to stderr as
 *   HH:MM:SS.mmm [LEVEL] function: message
 * unless a sink is installed (embedders, tests).
 */

#ifndef PDROP_LOG_H
#define PDROP_LOG_H

#include "platform.h"
#include <cstdint>
#include <functional>
#include <string>

namespace pdrop {
namespace log {

enum class Level : uint8_t {
  Debug = 0,
  Info = 1,
  Warning = 2,
  Error = 3,
  Off = 4
};

/// Receives every line that passes the level filter
using Sink =
    std::function<void(Level level, const char *func, const std::string &msg)>;

PDROP_API void set_level(Level level);
PDROP_API Level level();

/**
 * @brief Set level from a name ("debug", "info", "warn", "error", "off")
 * @return false (and level left unchanged) for an unrecognized name
 */
PDROP_API bool set_level_by_name(const std::string &name);

/// Parse a level name without applying it
PDROP_API bool parse_level(const std::string &name, Level &out);

PDROP_API const char *level_name(Level level);

/// Replace the output sink; an empty function restores stderr output
PDROP_API void set_sink(Sink sink);

PDROP_API bool enabled(Level level);

PDROP_API void logf(Level level, const char *func, const char *fmt, ...)
    PDROP_PRINTF_FORMAT(3, 4);

} // namespace log
} // namespace pdrop

#define PDROP_LOG_DEBUG(...)                                                   \
  ::pdrop::log::logf(::pdrop::log::Level::Debug, __func__, __VA_ARGS__)
#define PDROP_LOG_INFO(...)                                                    \
  ::pdrop::log::logf(::pdrop::log::Level::Info, __func__, __VA_ARGS__)
#define PDROP_LOG_WARN(...)                                                    \
  ::pdrop::log::logf(::pdrop::log::Level::Warning, __func__, __VA_ARGS__)
#define PDROP_LOG_ERROR(...)                                                   \
  ::pdrop::log::logf(::pdrop::log::Level::Error, __func__, __VA_ARGS__)

#endif // PDROP_LOG_H
