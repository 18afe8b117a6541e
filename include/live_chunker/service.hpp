/**
 * @file service.hpp
 * @brief Wiring of every component into the running daemon
 *
 * @details The Service owns the event loop, both registries and all
 *          components, and connects the two data paths:
 *
 *          - playback: catalog -> ProcessSupervisor -> HLS output directory
 *
 *          - analysis: HLS playlist -> ChunkScheduler -> ChunkExtractor ->
 *            ProcessingQueue -> DetectionClient
 *
 *          HealthMonitor and RetentionSweeper run on the same event loop.
 */

#ifndef LIVE_CHUNKER_SERVICE_HPP
#define LIVE_CHUNKER_SERVICE_HPP

#include <optional>
#include <string>
#include <vector>

#include "chunk_extractor.hpp"
#include "chunk_scheduler.hpp"
#include "detection_client.hpp"
#include "event_loop.hpp"
#include "health_monitor.hpp"
#include "job_registry.hpp"
#include "metrics_aggregator.hpp"
#include "process_supervisor.hpp"
#include "processing_queue.hpp"
#include "retention_sweeper.hpp"
#include "stream_catalog.hpp"
#include "stream_registry.hpp"

namespace live_chunker {

struct ServiceOptions {
  SupervisorOptions supervisor;
  HealthOptions health;
  SchedulerOptions scheduler;
  ExtractorOptions extractor;
  QueueOptions queue;
  RetentionOptions retention;
  HealthThresholds thresholds;

  static ServiceOptions from_env();
};

/**
 * @struct StreamReport
 * @brief Everything known about one stream.
 */
struct StreamReport {
  StreamSnapshot stream;
  PlaylistHealth playlist;
  std::optional<ScheduleStats> schedule;
};

class Service {
public:
  Service(ServiceOptions opts, StreamCatalog &catalog,
          ProcessLauncher &launcher, DetectionClient &detector);
  ~Service();

  Service(const Service &) = delete;
  Service &operator=(const Service &) = delete;

  /**
   * @brief Start the loops and activate every desired-active stream.
   * @return Number of streams activated
   */
  int start();

  /// Stop schedulers, transcoders, extractions and workers (idempotent)
  void shutdown();

  /**
   * @brief Supervise a catalog stream and schedule its chunking.
   */
  StartResult activate(const std::string &id);

  /// @return false if the stream was never started
  bool deactivate(const std::string &id);

  bool restart(const std::string &id);

  std::optional<StreamReport> stream_report(const std::string &id) const;
  std::vector<StreamReport> stream_reports() const;

  PipelineMetrics metrics() const;
  HealthReport health() const;
  SweepReport sweep();

  StreamCatalog &catalog() { return catalog_; }
  ProcessingQueue &queue() { return queue_; }
  const ProcessingQueue &queue() const { return queue_; }
  ProcessSupervisor &supervisor() { return supervisor_; }

private:
  StreamReport build_report(const StreamSnapshot &stream) const;
  void on_chunk(const ChunkDescriptor &chunk);

  ServiceOptions opts_;
  StreamCatalog &catalog_;

  EventLoop loop_;
  StreamRegistry streams_;
  JobRegistry jobs_;
  MetricsAggregator metrics_;
  ProcessSupervisor supervisor_;
  ChunkExtractor extractor_;
  ProcessingQueue queue_;
  ChunkScheduler scheduler_;
  HealthMonitor health_;
  RetentionSweeper sweeper_;
  bool started_ = false;
  bool stopped_ = false;
};

} // namespace live_chunker

#endif // LIVE_CHUNKER_SERVICE_HPP
