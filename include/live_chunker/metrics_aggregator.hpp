/**
 * @file metrics_aggregator.hpp
 * @brief Pipeline counters, moving averages and aggregate health
 */

#ifndef LIVE_CHUNKER_METRICS_AGGREGATOR_HPP
#define LIVE_CHUNKER_METRICS_AGGREGATOR_HPP

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "types.hpp"

namespace live_chunker {

/// Smoothing factor of the duration averages
constexpr double EMA_ALPHA = 0.1;

/**
 * @class MetricsAggregator
 * @brief Thread-safe sink for extraction and job outcomes.
 *
 * @note Averages are exponential moving averages; the first sample seeds
 *       the average directly.
 */
class MetricsAggregator {
public:
  explicit MetricsAggregator(double alpha = EMA_ALPHA);

  void record_extraction(double duration_ms, bool ok);

  /// Feed a job that reached a terminal state
  void record_job(const ProcessingJob &job);

  /**
   * @brief Combine the counters with live queue and extractor state.
   */
  PipelineMetrics snapshot(const QueueStats &queue,
                           int active_extractions) const;

private:
  static void fold(double &avg, bool &seeded, double sample, double alpha);

  const double alpha_;
  mutable std::mutex mutex_;
  uint64_t extracted_ = 0;
  uint64_t extraction_failed_ = 0;
  uint64_t processed_ = 0;
  uint64_t jobs_failed_ = 0;
  double avg_extraction_ms_ = 0.0;
  double avg_processing_ms_ = 0.0;
  bool extraction_seeded_ = false;
  bool processing_seeded_ = false;
};

// **----- Aggregate Health -----**

enum class AggregateHealth { Healthy, Degraded, Unhealthy };

const char *to_string(AggregateHealth health);

struct HealthThresholds {
  std::size_t max_queue_size = 1000;
  std::size_t degraded_queue_depth = 500;
  int degraded_extractions = 10;

  static HealthThresholds from_env();
};

struct HealthReport {
  AggregateHealth status = AggregateHealth::Healthy;
  std::vector<std::string> reasons;
};

/**
 * @brief Classify the pipeline.
 *
 * @details unhealthy: queue at its limit, or streams exist and none is active
 *
 *          degraded: queue depth or in-flight extractions past their
 *          thresholds, or any stream in error
 */
HealthReport evaluate_health(const PipelineMetrics &metrics,
                             const std::vector<StreamSnapshot> &streams,
                             const HealthThresholds &thresholds);

} // namespace live_chunker

#endif // LIVE_CHUNKER_METRICS_AGGREGATOR_HPP
