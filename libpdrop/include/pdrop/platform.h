/**
 * @file platform.h
 * @brief Platform detection and abstraction macros for pdrop
 *
 * Compile-time platform detection plus the export and utility macros
 * shared by every pdrop header. Transport availability is decided by the
 * build: the D-Bus based transports (BlueZ BLE, wpa_supplicant Wi-Fi
 * Direct) are compiled only when PDROP_HAS_DBUS is defined.
 */

#ifndef PDROP_PLATFORM_H
#define PDROP_PLATFORM_H

// ============================================================================
// Platform Detection (Linux and Android only)
// ============================================================================

#if defined(__ANDROID__)
#define PDROP_PLATFORM_ANDROID 1
#define PDROP_PLATFORM_LINUX 1
#define PDROP_PLATFORM_NAME "Android"
#elif defined(__linux__)
#define PDROP_PLATFORM_LINUX 1
#define PDROP_PLATFORM_NAME "Linux"
#else
#error "Unsupported platform. pdrop only supports Linux and Android."
#endif

// ============================================================================
// Export/Import Macros
// ============================================================================

#ifdef PDROP_BUILDING_SHARED
#define PDROP_API __attribute__((visibility("default")))
#else
#define PDROP_API
#endif

#define PDROP_LOCAL __attribute__((visibility("hidden")))

// ============================================================================
// Utility Macros
// ============================================================================

#define PDROP_UNUSED(x) (void)(x)

#define PDROP_LIKELY(x) __builtin_expect(!!(x), 1)
#define PDROP_UNLIKELY(x) __builtin_expect(!!(x), 0)

/// printf-style format checking for logging helpers
#define PDROP_PRINTF_FORMAT(fmt_index, args_index)                             \
  __attribute__((format(printf, fmt_index, args_index)))

// ============================================================================
// Debug/Release Detection
// ============================================================================

#if defined(DEBUG) || defined(_DEBUG) || !defined(NDEBUG)
#define PDROP_DEBUG 1
#else
#define PDROP_RELEASE 1
#endif

// ============================================================================
// Transport Availability
// ============================================================================

// BlueZ (BLE) and wpa_supplicant (Wi-Fi Direct) both speak D-Bus
#if defined(PDROP_PLATFORM_LINUX) && defined(PDROP_HAS_DBUS)
#define PDROP_HAS_BLUEZ 1
#define PDROP_HAS_WIFI_DIRECT 1
#endif

#endif // PDROP_PLATFORM_H
