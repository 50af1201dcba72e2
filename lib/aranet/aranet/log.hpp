/*
 * ARANET Logging - compile-time configurable logging
 *
 * The imu-streamer firmware's log.h carried over under the ARANET_ prefix,
 * with a stderr sink added for host builds.
 *
 * Logging can be completely removed from production builds to save code
 * space. Disabled levels expand to ((void)0).
 *
 * Usage:
 *   ARANET_LOG_INFO("Scanning for %s\n", prefix);
 *   ARANET_LOG_ERROR("Connect failed: %s\n", err.describe().c_str());
 *
 * Build Configuration:
 *   -DARANET_DISABLE_LOGGING                       - Disable all logging
 *   -DARANET_LOG_LEVEL=ARANET_LOG_LEVEL_ERROR      - Set minimum log level
 *   -DARANET_LOG_PRINTF=my_printf                  - Redirect the sink
 */

#ifndef ARANET_LOG_HPP_
#define ARANET_LOG_HPP_

// Log levels
#define ARANET_LOG_LEVEL_NONE  0
#define ARANET_LOG_LEVEL_ERROR 1
#define ARANET_LOG_LEVEL_WARN  2
#define ARANET_LOG_LEVEL_INFO  3
#define ARANET_LOG_LEVEL_DEBUG 4

// Default log level (can be overridden by build flags)
#ifndef ARANET_LOG_LEVEL
  #ifdef ARANET_DISABLE_LOGGING
    #define ARANET_LOG_LEVEL ARANET_LOG_LEVEL_NONE
  #else
    #define ARANET_LOG_LEVEL ARANET_LOG_LEVEL_INFO  // Default: INFO and above
  #endif
#endif

// Sink: serial console on Arduino targets, stderr on hosts
#ifndef ARANET_LOG_PRINTF
  #if defined(ARDUINO)
    #include <Arduino.h>
    #define ARANET_LOG_PRINTF(...) Serial.printf(__VA_ARGS__)
  #else
    #include <cstdio>
    #define ARANET_LOG_PRINTF(...) std::fprintf(stderr, __VA_ARGS__)
  #endif
#endif

#if ARANET_LOG_LEVEL >= ARANET_LOG_LEVEL_ERROR
  #define ARANET_LOG_ERROR(...) ARANET_LOG_PRINTF("❌ " __VA_ARGS__)
#else
  #define ARANET_LOG_ERROR(...) ((void)0)
#endif

#if ARANET_LOG_LEVEL >= ARANET_LOG_LEVEL_WARN
  #define ARANET_LOG_WARN(...) ARANET_LOG_PRINTF("⚠️  " __VA_ARGS__)
#else
  #define ARANET_LOG_WARN(...) ((void)0)
#endif

#if ARANET_LOG_LEVEL >= ARANET_LOG_LEVEL_INFO
  #define ARANET_LOG_INFO(...) ARANET_LOG_PRINTF(__VA_ARGS__)
  #define ARANET_LOG_DONE(...) ARANET_LOG_PRINTF("✅ " __VA_ARGS__)
#else
  #define ARANET_LOG_INFO(...) ((void)0)
  #define ARANET_LOG_DONE(...) ((void)0)
#endif

#if ARANET_LOG_LEVEL >= ARANET_LOG_LEVEL_DEBUG
  #define ARANET_LOG_DEBUG(...) ARANET_LOG_PRINTF("🔍 " __VA_ARGS__)
#else
  #define ARANET_LOG_DEBUG(...) ((void)0)
#endif

#endif // ARANET_LOG_HPP_
