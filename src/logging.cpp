/**
 * @file logging.cpp
 * @brief Logging globals
 *
 * @details Provides definitions for:
 *          - Global log mutex
 *
 *          - Runtime debug switch read from LOG_LEVEL
 */

#include "live_chunker/logging.hpp"

#include "live_chunker/config.hpp"

namespace live_chunker {

// **----- GLOBAL LOG MUTEX -----**

std::mutex log_mutex;

// **----- RUNTIME LEVEL -----**

bool debug_logging_enabled() {
  static const bool enabled = Config::log_level() == "debug";
  return enabled;
}

} // namespace live_chunker
