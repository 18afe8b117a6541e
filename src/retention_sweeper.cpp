/**
 * @file retention_sweeper.cpp
 * @brief Retention sweeping implementation
 */

#include "live_chunker/retention_sweeper.hpp"

#include <cmath>
#include <filesystem>
#include <system_error>

#include "live_chunker/config.hpp"
#include "live_chunker/logging.hpp"
#include "live_chunker/process_supervisor.hpp"
#include "live_chunker/segment_publisher.hpp"

namespace fs = std::filesystem;

namespace live_chunker {

namespace {

bool is_sweepable(const fs::path &path) {
  auto ext = path.extension();
  return ext == ".mp4" || ext == ".json" || ext == ".log";
}

} // anonymous namespace

RetentionOptions RetentionOptions::from_env() {
  RetentionOptions opts;
  opts.chunk_dir = Config::chunk_output_path();
  opts.extra_dirs = {Config::processed_output_path()};
  opts.retention = std::chrono::milliseconds(
      std::llround(Config::chunk_retention_hours() * 3600.0 * 1000.0));
  opts.interval = std::chrono::milliseconds(Config::retention_interval_ms());
  opts.playlist_size = Config::playlist_size();
  return opts;
}

RetentionSweeper::RetentionSweeper(RetentionOptions opts,
                                   const ProcessSupervisor *supervisor,
                                   EventLoop &loop)
    : opts_(std::move(opts)), supervisor_(supervisor), timer_(loop) {}

void RetentionSweeper::start() {
  LOG_INFO("[Retention] Sweeping every {}ms, keeping {}h of chunks",
           opts_.interval.count(),
           opts_.retention.count() / 3600000.0);
  timer_.start(opts_.interval, [this] { sweep_once(); }, opts_.interval);
}

void RetentionSweeper::stop() { timer_.stop(); }

int RetentionSweeper::sweep_dir(const std::string &dir, bool recursive,
                                int &errors) const {
  std::error_code ec;
  if (!fs::exists(dir, ec))
    return 0;

  const auto cutoff = fs::file_time_type::clock::now() - opts_.retention;
  std::vector<fs::path> expired;

  auto consider = [&](const fs::directory_entry &entry) {
    std::error_code stat_ec;
    if (!entry.is_regular_file(stat_ec) || !is_sweepable(entry.path()))
      return;
    auto mtime = entry.last_write_time(stat_ec);
    if (stat_ec) {
      ++errors;
      return;
    }
    if (mtime < cutoff)
      expired.push_back(entry.path());
  };

  if (recursive) {
    for (fs::recursive_directory_iterator it(dir, ec), end; !ec && it != end;
         it.increment(ec))
      consider(*it);
  } else {
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end;
         it.increment(ec))
      consider(*it);
  }
  if (ec) {
    LOG_WARN("[Retention] Scan of {} stopped early: {}", dir, ec.message());
    ++errors;
  }

  int deleted = 0;
  for (const auto &path : expired) {
    std::error_code rm_ec;
    if (fs::remove(path, rm_ec)) {
      ++deleted;
    } else if (rm_ec) {
      ++errors;
      LOG_WARN("[Retention] Failed to delete {}: {}", path.string(),
               rm_ec.message());
    }
  }
  return deleted;
}

SweepReport RetentionSweeper::sweep_once() {
  SweepReport report;
  report.chunks_deleted = sweep_dir(opts_.chunk_dir, false, report.errors);
  for (const auto &dir : opts_.extra_dirs)
    report.outputs_deleted += sweep_dir(dir, true, report.errors);

  if (supervisor_) {
    for (const auto &stream : supervisor_->list()) {
      if (stream.status == StreamStatus::Stopped)
        continue;
      report.segments_trimmed +=
          trim_segments(stream.output_dir, opts_.playlist_size);
    }
  }

  if (report.chunks_deleted || report.outputs_deleted ||
      report.segments_trimmed || report.errors) {
    LOG_INFO("[Retention] Deleted {} chunks, {} outputs, trimmed {} segments "
             "({} errors)",
             report.chunks_deleted, report.outputs_deleted,
             report.segments_trimmed, report.errors);
  }
  return report;
}

} // namespace live_chunker
