/**
 * @file health_monitor.cpp
 * @brief Stream health checks
 */

#include "live_chunker/health_monitor.hpp"

#include "live_chunker/config.hpp"
#include "live_chunker/logging.hpp"
#include "live_chunker/system.hpp"

namespace live_chunker {

HealthOptions HealthOptions::from_env() {
  HealthOptions opts;
  opts.interval = std::chrono::milliseconds(Config::health_check_interval_ms());
  opts.freshness_threshold =
      std::chrono::milliseconds(Config::freshness_threshold_ms());
  opts.startup_grace =
      std::chrono::milliseconds(Config::health_startup_grace_ms());
  return opts;
}

HealthMonitor::HealthMonitor(HealthOptions opts, ProcessSupervisor &supervisor,
                             const StreamCatalog &catalog, EventLoop &loop)
    : opts_(opts), supervisor_(supervisor), catalog_(catalog), timer_(loop) {}

void HealthMonitor::start() {
  LOG_INFO("[Health] Checking streams every {}ms", opts_.interval.count());
  timer_.start(opts_.interval, [this] { check_once(); }, opts_.interval);
}

void HealthMonitor::stop() { timer_.stop(); }

PlaylistHealth HealthMonitor::playlist_health(const StreamSnapshot &stream) const {
  return inspect_playlist(stream.output_dir, opts_.freshness_threshold);
}

int HealthMonitor::check_once() {
  int restarts = 0;
  const int64_t now = now_ms();

  for (const auto &stream : supervisor_.list()) {
    if (stream.manually_stopped)
      continue;

    bool down = stream.status == StreamStatus::Stopped ||
                stream.status == StreamStatus::Error;
    if (down) {
      std::optional<bool> desired = catalog_.desired_active(stream.id);
      if (desired.value_or(false)) {
        LOG_WARN("[Health] Stream {} should be active but is {}, restarting",
                 stream.id, to_string(stream.status));
        if (supervisor_.restart(stream.id, RestartCause::HealthRecovery))
          ++restarts;
      }
      continue;
    }

    if (stream.status != StreamStatus::Active)
      continue;
    if (now - stream.start_time_ms < opts_.startup_grace.count())
      continue;

    PlaylistHealth health = playlist_health(stream);
    if (health.healthy) {
      LOG_DEBUG("[Health] Stream {} ok ({} segments, {}ms old)", stream.id,
                health.segment_count, health.last_write_age_ms);
      continue;
    }

    LOG_WARN("[Health] Stream {} unhealthy (playlist {}, {} segments, age "
             "{}ms), restarting",
             stream.id, health.playlist_exists ? "present" : "missing",
             health.segment_count, health.last_write_age_ms);
    if (supervisor_.restart(stream.id, RestartCause::Stale))
      ++restarts;
  }

  return restarts;
}

} // namespace live_chunker
