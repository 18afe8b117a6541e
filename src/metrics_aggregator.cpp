/**
 * @file metrics_aggregator.cpp
 * @brief Metrics and health classification
 */

#include "live_chunker/metrics_aggregator.hpp"

#include <fmt/core.h>

#include "live_chunker/config.hpp"

namespace live_chunker {

MetricsAggregator::MetricsAggregator(double alpha) : alpha_(alpha) {}

void MetricsAggregator::fold(double &avg, bool &seeded, double sample,
                             double alpha) {
  if (!seeded) {
    avg = sample;
    seeded = true;
    return;
  }
  avg = avg * (1.0 - alpha) + sample * alpha;
}

void MetricsAggregator::record_extraction(double duration_ms, bool ok) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!ok) {
    ++extraction_failed_;
    return;
  }
  ++extracted_;
  fold(avg_extraction_ms_, extraction_seeded_, duration_ms, alpha_);
}

void MetricsAggregator::record_job(const ProcessingJob &job) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (job.status == JobStatus::Completed) {
    ++processed_;
    if (job.completed_at_ms >= job.started_at_ms && job.started_at_ms > 0) {
      fold(avg_processing_ms_, processing_seeded_,
           static_cast<double>(job.completed_at_ms - job.started_at_ms),
           alpha_);
    }
  } else if (job.status == JobStatus::Failed) {
    ++jobs_failed_;
  }
}

PipelineMetrics MetricsAggregator::snapshot(const QueueStats &queue,
                                            int active_extractions) const {
  PipelineMetrics m;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    m.chunks_extracted = extracted_;
    m.chunks_failed = extraction_failed_;
    m.chunks_processed = processed_;
    m.jobs_failed = jobs_failed_;
    m.avg_extraction_ms = avg_extraction_ms_;
    m.avg_processing_ms = avg_processing_ms_;
  }
  m.queue_depth = queue.waiting;
  m.processing = queue.processing;
  m.active_extractions = active_extractions;
  return m;
}

// **----- Aggregate Health -----**

const char *to_string(AggregateHealth health) {
  switch (health) {
  case AggregateHealth::Healthy:
    return "healthy";
  case AggregateHealth::Degraded:
    return "degraded";
  case AggregateHealth::Unhealthy:
    return "unhealthy";
  }
  return "unknown";
}

HealthThresholds HealthThresholds::from_env() {
  HealthThresholds t;
  t.max_queue_size = static_cast<std::size_t>(Config::max_queue_size());
  t.degraded_queue_depth =
      static_cast<std::size_t>(Config::degraded_queue_depth());
  t.degraded_extractions = Config::degraded_extractions();
  return t;
}

HealthReport evaluate_health(const PipelineMetrics &metrics,
                             const std::vector<StreamSnapshot> &streams,
                             const HealthThresholds &thresholds) {
  HealthReport report;
  bool unhealthy = false;
  bool degraded = false;

  if (metrics.queue_depth >= thresholds.max_queue_size) {
    unhealthy = true;
    report.reasons.push_back(
        fmt::format("queue full ({} waiting)", metrics.queue_depth));
  } else if (metrics.queue_depth >= thresholds.degraded_queue_depth) {
    degraded = true;
    report.reasons.push_back(
        fmt::format("queue depth {}", metrics.queue_depth));
  }

  if (metrics.active_extractions >= thresholds.degraded_extractions) {
    degraded = true;
    report.reasons.push_back(
        fmt::format("{} extractions in flight", metrics.active_extractions));
  }

  int active = 0;
  int errored = 0;
  for (const auto &s : streams) {
    if (s.status == StreamStatus::Active)
      ++active;
    else if (s.status == StreamStatus::Error)
      ++errored;
  }
  if (!streams.empty() && active == 0) {
    unhealthy = true;
    report.reasons.push_back("no active streams");
  }
  if (errored > 0) {
    degraded = true;
    report.reasons.push_back(fmt::format("{} streams in error", errored));
  }

  if (unhealthy)
    report.status = AggregateHealth::Unhealthy;
  else if (degraded)
    report.status = AggregateHealth::Degraded;
  return report;
}

} // namespace live_chunker
