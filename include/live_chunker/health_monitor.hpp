/**
 * @file health_monitor.hpp
 * @brief Periodic self-healing of supervised streams
 *
 * @details On every check, for each stream not manually stopped:
 *
 *          - desired active (per catalog) but stopped/error: restart counter
 *            reset and restart
 *
 *          - active past the startup grace with a stale or empty playlist:
 *            forced restart, counter untouched
 */

#ifndef LIVE_CHUNKER_HEALTH_MONITOR_HPP
#define LIVE_CHUNKER_HEALTH_MONITOR_HPP

#include <chrono>

#include "event_loop.hpp"
#include "process_supervisor.hpp"
#include "segment_publisher.hpp"
#include "stream_catalog.hpp"

namespace live_chunker {

struct HealthOptions {
  std::chrono::milliseconds interval{30000};
  std::chrono::milliseconds freshness_threshold{10000};
  std::chrono::milliseconds startup_grace{15000};

  static HealthOptions from_env();
};

class HealthMonitor {
public:
  HealthMonitor(HealthOptions opts, ProcessSupervisor &supervisor,
                const StreamCatalog &catalog, EventLoop &loop);

  /// Begin periodic checks on the event loop
  void start();
  void stop();

  /**
   * @brief Run one pass synchronously.
   * @return Number of restarts issued
   */
  int check_once();

  /// Playlist health of one stream's output directory
  PlaylistHealth playlist_health(const StreamSnapshot &stream) const;

private:
  HealthOptions opts_;
  ProcessSupervisor &supervisor_;
  const StreamCatalog &catalog_;
  RecurringTimer timer_;
};

} // namespace live_chunker

#endif // LIVE_CHUNKER_HEALTH_MONITOR_HPP
