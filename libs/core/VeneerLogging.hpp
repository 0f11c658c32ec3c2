#pragma once

#include <QLoggingCategory>
#include <QDebug>
#include <atomic>
#include <cstdint>
#include <cstdlib>

// =============================================================================
// VENEER LOGGING CATEGORIES
// =============================================================================
// Four categories, each call site throttled by its own atomic counter

Q_DECLARE_LOGGING_CATEGORY(logApp)      // Application: startup, settings, theme switches
Q_DECLARE_LOGGING_CATEGORY(logStyle)    // Style: parsing, serialization, validation
Q_DECLARE_LOGGING_CATEGORY(logAssets)   // Assets: placeholder substitution, icon lookup
Q_DECLARE_LOGGING_CATEGORY(logDebug)    // Debug: detailed diagnostics (disabled by default)

// =============================================================================
// ATOMIC THROTTLING
// =============================================================================

namespace veneer::log_throttle {
    // Compile-time defaults (overridden by env vars)
    inline constexpr int kApp    = 1;    // Theme events are rare
    inline constexpr int kStyle  = 1;    // One line per parsed sheet
    inline constexpr int kAssets = 10;   // Icon lookups repeat per url()
    inline constexpr int kDebug  = 10;
}

#define VLOG_THROTTLED(cat, defaultInterval, ...)                                   \
    do {                                                                             \
        static std::atomic<uint32_t> _counter{0};                                    \
        static int _interval = []() {                                                \
            const char* env = std::getenv("VENEER_LOG_" #cat "_INTERVAL");           \
            const int parsed = env ? std::atoi(env) : (defaultInterval);             \
            return parsed > 0 ? parsed : 1;                                          \
        }();                                                                         \
        if ((++_counter % _interval) == 1 || _interval == 1) {                       \
            qCDebug(log##cat) << __VA_ARGS__;                                        \
        }                                                                            \
    } while(false)

#define vLog_App(...)     VLOG_THROTTLED(App, veneer::log_throttle::kApp, __VA_ARGS__)
#define vLog_Style(...)   VLOG_THROTTLED(Style, veneer::log_throttle::kStyle, __VA_ARGS__)
#define vLog_Assets(...)  VLOG_THROTTLED(Assets, veneer::log_throttle::kAssets, __VA_ARGS__)
#define vLog_Debug(...)   VLOG_THROTTLED(Debug, veneer::log_throttle::kDebug, __VA_ARGS__)

#define vLog_AppN(n, ...)     VLOG_THROTTLED(App, n, __VA_ARGS__)
#define vLog_AssetsN(n, ...)  VLOG_THROTTLED(Assets, n, __VA_ARGS__)

// Always-on macros (no throttling)
#define vLog_Warning(...)  qCWarning(logApp) << __VA_ARGS__
#define vLog_Error(...)    qCCritical(logApp) << __VA_ARGS__

// =============================================================================
// RUNTIME CONTROL
// =============================================================================
//   export VENEER_LOG_Assets_INTERVAL=1          # every icon lookup
//   export QT_LOGGING_RULES="veneer.*.debug=true" # enable all categories
