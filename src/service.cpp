/**
 * @file service.cpp
 * @brief Daemon wiring
 */

#include "live_chunker/service.hpp"

#include "live_chunker/logging.hpp"
#include "live_chunker/segment_publisher.hpp"

namespace live_chunker {

ServiceOptions ServiceOptions::from_env() {
  ServiceOptions opts;
  opts.supervisor = SupervisorOptions::from_env();
  opts.health = HealthOptions::from_env();
  opts.scheduler = SchedulerOptions::from_env();
  opts.extractor = ExtractorOptions::from_env();
  opts.queue = QueueOptions::from_env();
  opts.retention = RetentionOptions::from_env();
  opts.thresholds = HealthThresholds::from_env();
  return opts;
}

Service::Service(ServiceOptions opts, StreamCatalog &catalog,
                 ProcessLauncher &launcher, DetectionClient &detector)
    : opts_(std::move(opts)), catalog_(catalog),
      supervisor_(opts_.supervisor, streams_, launcher, loop_),
      extractor_(opts_.extractor, launcher),
      queue_(opts_.queue, jobs_, detector),
      scheduler_(opts_.scheduler, extractor_, loop_,
                 [this](const ChunkDescriptor &chunk) { on_chunk(chunk); },
                 &metrics_),
      health_(opts_.health, supervisor_, catalog_, loop_),
      sweeper_(opts_.retention, &supervisor_, loop_) {
  queue_.set_observer(
      [this](const ProcessingJob &job) { metrics_.record_job(job); });
}

Service::~Service() { shutdown(); }

int Service::start() {
  if (started_)
    return 0;
  started_ = true;

  loop_.start();
  queue_.start();
  health_.start();
  sweeper_.start();

  int activated = 0;
  for (const auto &desc : catalog_.all()) {
    if (!desc.desired_active)
      continue;
    StartResult result = activate(desc.id);
    if (result == StartResult::Started)
      ++activated;
    else
      LOG_WARN("[Stream {}] Not started: {}", desc.id, to_string(result));
  }
  LOG_SUCCESS("Service running with {} active streams", activated);
  return activated;
}

void Service::shutdown() {
  if (stopped_)
    return;
  stopped_ = true;

  LOG_PHASE("Shutting down");
  health_.stop();
  sweeper_.stop();
  scheduler_.shutdown();
  supervisor_.shutdown();
  queue_.shutdown();
  loop_.stop();
  LOG_SUCCESS("Shutdown complete");
}

// **----- Stream Control -----**

StartResult Service::activate(const std::string &id) {
  std::optional<StreamDescriptor> desc = catalog_.find(id);
  if (!desc)
    return StartResult::UnknownStream;

  StartResult result = supervisor_.start(*desc);
  if (result == StartResult::Started || result == StartResult::AlreadyRunning) {
    std::string dir = stream_output_dir(opts_.supervisor.output_root, id);
    scheduler_.start(id, playlist_path(dir));
  }
  return result;
}

bool Service::deactivate(const std::string &id) {
  scheduler_.stop(id);
  return supervisor_.stop(id);
}

bool Service::restart(const std::string &id) {
  if (!supervisor_.restart(id, RestartCause::Operator))
    return false;
  std::string dir = stream_output_dir(opts_.supervisor.output_root, id);
  scheduler_.start(id, playlist_path(dir));
  return true;
}

void Service::on_chunk(const ChunkDescriptor &chunk) {
  EnqueueResult result = queue_.enqueue(chunk);
  if (!result.accepted()) {
    LOG_WARN("[Stream {}] Chunk {} not queued: {}", chunk.stream_id, chunk.id,
             to_string(result.outcome));
  }
}

// **----- Queries -----**

StreamReport Service::build_report(const StreamSnapshot &stream) const {
  StreamReport report;
  report.stream = stream;
  report.playlist = health_.playlist_health(stream);
  report.schedule = scheduler_.stats(stream.id);
  return report;
}

std::optional<StreamReport>
Service::stream_report(const std::string &id) const {
  std::optional<StreamSnapshot> stream = supervisor_.status(id);
  if (!stream)
    return std::nullopt;
  return build_report(*stream);
}

std::vector<StreamReport> Service::stream_reports() const {
  std::vector<StreamReport> out;
  for (const auto &stream : supervisor_.list())
    out.push_back(build_report(stream));
  return out;
}

PipelineMetrics Service::metrics() const {
  return metrics_.snapshot(queue_.stats(), extractor_.active_extractions());
}

HealthReport Service::health() const {
  return evaluate_health(metrics(), supervisor_.list(), opts_.thresholds);
}

SweepReport Service::sweep() { return sweeper_.sweep_once(); }

} // namespace live_chunker
