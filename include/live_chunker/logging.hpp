/**
 * @file logging.hpp
 * @brief Logging macros shared by every component
 *
 * @details Provides:
 *          - Compile-time controlled logging macros (LOG_INFO, LOG_WARN, etc.)
 *
 *          - LOG_DEBUG, additionally gated at runtime by LOG_LEVEL=debug
 *
 * @note All logs use fmt::print for type-safe formatting and are flushed
 *       immediately to ensure visibility in Docker container logs.
 *
 *       Component prefixes follow a bracket convention: "[Stream <id>]",
 *       "[Queue]", "[Health]", "[Scheduler]", "[Retention]".
 */

#ifndef LIVE_CHUNKER_LOGGING_HPP
#define LIVE_CHUNKER_LOGGING_HPP

#include <cstdio>
#include <mutex>

#include <fmt/color.h>
#include <fmt/core.h>

namespace live_chunker {

// **----- LOGGING CONFIGURATION -----**

/**
 * @brief Logging is controlled by ENABLE_LOGGING at compile time.
 */
#ifndef ENABLE_LOGGING
#define ENABLE_LOGGING 1
#endif

/// Global log mutex (defined in logging.cpp)
extern std::mutex log_mutex;

/// True when LOG_LEVEL=debug (read once)
bool debug_logging_enabled();

// **----- LOGGING MACROS -----**

#if ENABLE_LOGGING
#define LOG_INFO(format_str, ...)                                              \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(live_chunker::log_mutex);                 \
    fmt::print("[INFO] " format_str "\n", ##__VA_ARGS__);                      \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_DEBUG(format_str, ...)                                             \
  do {                                                                         \
    if (live_chunker::debug_logging_enabled()) {                               \
      std::lock_guard<std::mutex> lock(live_chunker::log_mutex);               \
      fmt::print(fg(fmt::color::gray), "[DEBUG] " format_str "\n",             \
                 ##__VA_ARGS__);                                               \
      std::fflush(stdout);                                                     \
    }                                                                          \
  } while (0)

#define LOG_WARN(format_str, ...)                                              \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(live_chunker::log_mutex);                 \
    fmt::print(fg(fmt::color::yellow), "[WARN] " format_str "\n",              \
               ##__VA_ARGS__);                                                 \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_ERROR(format_str, ...)                                             \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(live_chunker::log_mutex);                 \
    fmt::print(fg(fmt::color::red), "[ERROR] " format_str "\n",                \
               ##__VA_ARGS__);                                                 \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_PHASE(format_str, ...)                                             \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(live_chunker::log_mutex);                 \
    fmt::print(fg(fmt::color::cyan), format_str "\n", ##__VA_ARGS__);          \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_SUCCESS(format_str, ...)                                           \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(live_chunker::log_mutex);                 \
    fmt::print(fg(fmt::color::green), format_str "\n", ##__VA_ARGS__);         \
    std::fflush(stdout);                                                       \
  } while (0)
#else
#define LOG_INFO(...) ((void)0)
#define LOG_DEBUG(...) ((void)0)
#define LOG_WARN(...) ((void)0)
#define LOG_ERROR(...) ((void)0)
#define LOG_PHASE(...) ((void)0)
#define LOG_SUCCESS(...) ((void)0)
#endif

} // namespace live_chunker

#endif // LIVE_CHUNKER_LOGGING_HPP
