/**
 * @file control_surface.cpp
 * @brief Control operations
 */

#include "live_chunker/control_surface.hpp"

#include <exception>

#include "live_chunker/logging.hpp"

namespace live_chunker {

namespace {

ControlResponse error_response(int status, const std::string &message) {
  return {status, {{"error", message}}};
}

nlohmann::json job_list(const std::vector<ProcessingJob> &jobs,
                        std::size_t limit) {
  nlohmann::json out = nlohmann::json::array();
  for (std::size_t i = 0; i < jobs.size() && i < limit; ++i)
    out.push_back(to_json(jobs[i]));
  return out;
}

} // anonymous namespace

// **----- JSON Mapping -----**

nlohmann::json to_json(const StreamSnapshot &stream) {
  return {{"id", stream.id},
          {"name", stream.name},
          {"source_kind", to_string(stream.source_kind)},
          {"status", to_string(stream.status)},
          {"pid", stream.pid},
          {"start_time", stream.start_time_ms},
          {"restart_count", stream.restart_count},
          {"last_error", stream.last_error},
          {"manually_stopped", stream.manually_stopped},
          {"output_dir", stream.output_dir},
          {"playlist_url", stream.playlist_url}};
}

nlohmann::json to_json(const StreamReport &report) {
  nlohmann::json out = to_json(report.stream);
  out["playlist"] = {{"exists", report.playlist.playlist_exists},
                     {"segment_count", report.playlist.segment_count},
                     {"last_write_age_ms", report.playlist.last_write_age_ms},
                     {"healthy", report.playlist.healthy}};
  if (report.schedule) {
    const ScheduleStats &s = *report.schedule;
    out["chunking"] = {{"next_offset", s.next_offset},
                       {"ticks", s.ticks},
                       {"extracted", s.extracted},
                       {"failed", s.failed},
                       {"dropped", s.dropped},
                       {"last_chunk_at", s.last_chunk_at_ms},
                       {"last_error", s.last_error}};
  } else {
    out["chunking"] = nullptr;
  }
  return out;
}

nlohmann::json to_json(const ProcessingJob &job) {
  nlohmann::json out = {{"id", job.id},
                        {"status", to_string(job.status)},
                        {"priority", job.priority},
                        {"attempts", job.attempts},
                        {"created_at", job.created_at_ms},
                        {"started_at", job.started_at_ms},
                        {"completed_at", job.completed_at_ms},
                        {"error", job.error},
                        {"chunk",
                         {{"id", job.chunk.id},
                          {"stream_id", job.chunk.stream_id},
                          {"start_offset", job.chunk.start_offset},
                          {"duration", job.chunk.duration},
                          {"path", job.chunk.path},
                          {"status", to_string(job.chunk.status)},
                          {"size_bytes", job.chunk.size_bytes},
                          {"extracted_at", job.chunk.extracted_at_ms}}}};
  if (job.result) {
    out["result"] = {{"output_video_path", job.result->output_video_path},
                     {"output_json_path", job.result->output_json_path},
                     {"detection_count", job.result->detection_count},
                     {"processing_time_ms", job.result->processing_time_ms}};
  }
  return out;
}

nlohmann::json to_json(const QueueStats &stats) {
  return {{"waiting", stats.waiting},
          {"delayed", stats.delayed},
          {"processing", stats.processing},
          {"completed", stats.completed_total},
          {"failed", stats.failed_total},
          {"evicted", stats.evicted_total},
          {"rejected", stats.rejected_total},
          {"retried", stats.retried_total}};
}

nlohmann::json to_json(const PipelineMetrics &metrics) {
  return {{"chunks_extracted", metrics.chunks_extracted},
          {"chunks_failed", metrics.chunks_failed},
          {"chunks_processed", metrics.chunks_processed},
          {"jobs_failed", metrics.jobs_failed},
          {"avg_extraction_ms", metrics.avg_extraction_ms},
          {"avg_processing_ms", metrics.avg_processing_ms},
          {"queue_depth", metrics.queue_depth},
          {"processing", metrics.processing},
          {"active_extractions", metrics.active_extractions}};
}

// **----- ControlSurface -----**

ControlSurface::ControlSurface(Service &service) : service_(service) {}

ControlResponse ControlSurface::start_stream(const std::string &id) {
  if (!service_.catalog().set_desired_active(id, true))
    return error_response(404, "unknown stream " + id);

  StartResult result = service_.activate(id);
  switch (result) {
  case StartResult::Started:
  case StartResult::AlreadyRunning: {
    auto report = service_.stream_report(id);
    nlohmann::json body = {{"result", to_string(result)}};
    if (report)
      body["stream"] = to_json(*report);
    return {200, body};
  }
  case StartResult::CapacityReached:
    return error_response(409, "maximum concurrent streams reached");
  case StartResult::UnknownStream:
    return error_response(404, "unknown stream " + id);
  case StartResult::OutputUnavailable:
    return error_response(500, "output directory unavailable");
  }
  return error_response(500, "unexpected start result");
}

ControlResponse ControlSurface::stop_stream(const std::string &id) {
  bool known = service_.catalog().set_desired_active(id, false);
  bool stopped = service_.deactivate(id);
  if (!known && !stopped)
    return error_response(404, "unknown stream " + id);
  return {200, {{"result", stopped ? "stopped" : "not_running"}}};
}

ControlResponse ControlSurface::restart_stream(const std::string &id) {
  if (!service_.restart(id))
    return error_response(409, "stream " + id + " could not be restarted");
  return {200, {{"result", "restarted"}}};
}

ControlResponse ControlSurface::stream_status(const std::string &id) const {
  auto report = service_.stream_report(id);
  if (!report)
    return error_response(404, "stream " + id + " is not supervised");
  return {200, to_json(*report)};
}

ControlResponse ControlSurface::list_streams() const {
  nlohmann::json streams = nlohmann::json::array();
  for (const auto &report : service_.stream_reports())
    streams.push_back(to_json(report));
  return {200, {{"streams", streams}}};
}

ControlResponse ControlSurface::queue_status() const {
  return {200,
          {{"queue", to_json(service_.queue().stats())},
           {"metrics", to_json(service_.metrics())}}};
}

ControlResponse ControlSurface::job_history(std::size_t limit) const {
  return {200,
          {{"completed", job_list(service_.queue().recent_completed(), limit)},
           {"failed", job_list(service_.queue().recent_failed(), limit)}}};
}

ControlResponse ControlSurface::job(const std::string &id) const {
  auto found = service_.queue().job(id);
  if (!found)
    return error_response(404, "unknown job " + id);
  return {200, to_json(*found)};
}

ControlResponse ControlSurface::sweep() {
  SweepReport report = service_.sweep();
  return {200,
          {{"chunks_deleted", report.chunks_deleted},
           {"outputs_deleted", report.outputs_deleted},
           {"segments_trimmed", report.segments_trimmed},
           {"errors", report.errors}}};
}

ControlResponse ControlSurface::reload_catalog() {
  try {
    std::size_t count = service_.catalog().reload();
    return {200, {{"streams", count}}};
  } catch (const std::exception &e) {
    LOG_ERROR("[Control] Catalog reload failed: {}", e.what());
    return error_response(400, e.what());
  }
}

ControlResponse ControlSurface::health() const {
  HealthReport report = service_.health();
  PipelineMetrics metrics = service_.metrics();
  nlohmann::json body = {{"status", to_string(report.status)},
                         {"reasons", report.reasons},
                         {"metrics", to_json(metrics)},
                         {"active_streams", service_.supervisor().active_count()}};
  int status = report.status == AggregateHealth::Unhealthy ? 503 : 200;
  return {status, body};
}

} // namespace live_chunker
