/**
 * @file chunk_extractor.cpp
 * @brief Chunk extraction implementation
 */

#include "live_chunker/chunk_extractor.hpp"

#include <filesystem>
#include <future>
#include <system_error>

#include <fmt/core.h>

#include "live_chunker/config.hpp"
#include "live_chunker/logging.hpp"
#include "live_chunker/media_probe.hpp"
#include "live_chunker/system.hpp"

namespace fs = std::filesystem;

namespace live_chunker {

namespace {

constexpr size_t STDERR_TAIL_BYTES = 300;

/// Removes a running extraction from the in-flight table on scope exit
class InFlightSlot {
public:
  InFlightSlot(std::mutex &mutex, std::map<uint64_t, ProcessHandle *> &table,
               uint64_t slot, ProcessHandle *process)
      : mutex_(mutex), table_(table), slot_(slot) {
    std::lock_guard<std::mutex> lock(mutex_);
    table_.emplace(slot_, process);
  }
  ~InFlightSlot() {
    std::lock_guard<std::mutex> lock(mutex_);
    table_.erase(slot_);
  }

private:
  std::mutex &mutex_;
  std::map<uint64_t, ProcessHandle *> &table_;
  uint64_t slot_;
};

void remove_quietly(const std::string &path) {
  std::error_code ec;
  fs::remove(path, ec);
}

} // anonymous namespace

// **----- Options & Errors -----**

ExtractorOptions ExtractorOptions::from_env() {
  ExtractorOptions opts;
  opts.ffmpeg_binary = Config::ffmpeg_binary();
  opts.output_dir = Config::chunk_output_path();
  opts.chunk_duration = Config::chunk_duration();
  opts.timeout = std::chrono::milliseconds(Config::extraction_timeout_ms());
  opts.kill_grace = std::chrono::milliseconds(Config::stop_grace_ms());
  opts.probe = Config::probe_chunks();
  return opts;
}

const char *to_string(ExtractionFailure kind) {
  switch (kind) {
  case ExtractionFailure::Timeout:
    return "timeout";
  case ExtractionFailure::SpawnFailed:
    return "spawn_failed";
  case ExtractionFailure::ProcessFailed:
    return "process_failed";
  case ExtractionFailure::EmptyOutput:
    return "empty_output";
  case ExtractionFailure::ProbeFailed:
    return "probe_failed";
  }
  return "unknown";
}

// **----- ChunkExtractor -----**

ChunkExtractor::ChunkExtractor(ExtractorOptions opts, ProcessLauncher &launcher)
    : opts_(std::move(opts)), launcher_(launcher) {}

ChunkExtractor::~ChunkExtractor() = default;

std::string ChunkExtractor::make_chunk_id() {
  return fmt::format("{}-{}", now_ms(), random_hex(8));
}

std::string ChunkExtractor::chunk_filename(const std::string &stream_id,
                                           const std::string &chunk_id,
                                           double offset) {
  return fmt::format("{}_{}_{:g}.mp4", stream_id, chunk_id, offset);
}

std::optional<ChunkFileName>
ChunkExtractor::parse_chunk_filename(const std::string &name) {
  const std::string ext = ".mp4";
  if (name.size() <= ext.size() ||
      name.compare(name.size() - ext.size(), ext.size(), ext) != 0)
    return std::nullopt;
  std::string stem = name.substr(0, name.size() - ext.size());

  size_t last = stem.rfind('_');
  if (last == std::string::npos || last == 0)
    return std::nullopt;
  size_t middle = stem.rfind('_', last - 1);
  if (middle == std::string::npos || middle == 0)
    return std::nullopt;

  ChunkFileName parsed;
  parsed.stream_id = stem.substr(0, middle);
  parsed.chunk_id = stem.substr(middle + 1, last - middle - 1);
  try {
    parsed.offset = std::stod(stem.substr(last + 1));
  } catch (const std::exception &) {
    return std::nullopt;
  }
  if (parsed.chunk_id.empty())
    return std::nullopt;
  return parsed;
}

std::vector<std::string>
ChunkExtractor::extraction_args(const std::string &locator, double offset,
                                const std::string &out) const {
  return {"-hide_banner",
          "-loglevel",
          "error",
          "-i",
          locator,
          "-ss",
          fmt::format("{:g}", offset),
          "-t",
          fmt::format("{:g}", opts_.chunk_duration),
          "-c",
          "copy",
          "-avoid_negative_ts",
          "make_zero",
          "-f",
          "mp4",
          "-y",
          out};
}

ChunkDescriptor ChunkExtractor::extract(const std::string &stream_id,
                                        const std::string &locator,
                                        double offset) {
  std::error_code ec;
  fs::create_directories(opts_.output_dir, ec);
  if (ec) {
    throw ExtractionError(
        ExtractionFailure::SpawnFailed,
        fmt::format("chunk directory {} unavailable: {}", opts_.output_dir,
                    ec.message()));
  }

  ChunkDescriptor chunk;
  chunk.id = make_chunk_id();
  chunk.stream_id = stream_id;
  chunk.start_offset = offset;
  chunk.duration = opts_.chunk_duration;
  chunk.path = (fs::path(opts_.output_dir) /
                chunk_filename(stream_id, chunk.id, offset))
                   .string();
  chunk.status = ChunkStatus::Extracting;

  CommandLine cmd;
  cmd.program = opts_.ffmpeg_binary;
  cmd.args = extraction_args(locator, offset, chunk.path);
  cmd.log_path = chunk.path + ".log";

  LOG_DEBUG("[Stream {}] Extracting chunk {} at {:g}s", stream_id, chunk.id,
            offset);

  std::unique_ptr<ProcessHandle> process;
  try {
    process = launcher_.launch(cmd);
  } catch (const std::system_error &e) {
    fail(ExtractionFailure::SpawnFailed,
         fmt::format("failed to start ffmpeg: {}", e.what()), chunk.path,
         cmd.log_path);
  }

  ExitStatus status;
  {
    uint64_t slot;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      slot = next_slot_++;
    }
    InFlightSlot in_flight(mutex_, in_flight_, slot, process.get());

    auto done = process->exited();
    if (done.wait_for(opts_.timeout) != std::future_status::ready) {
      process->kill();
      if (done.wait_for(opts_.kill_grace) != std::future_status::ready) {
        LOG_ERROR("[Stream {}] Extraction pid {} ignored SIGKILL", stream_id,
                  process->pid());
      }
      fail(ExtractionFailure::Timeout,
           fmt::format("chunk extraction timeout ({}s)",
                       opts_.timeout.count() / 1000.0),
           chunk.path, cmd.log_path);
    }
    status = done.get();
  }

  if (!status.success()) {
    std::string tail = read_tail(cmd.log_path, STDERR_TAIL_BYTES);
    fail(ExtractionFailure::ProcessFailed,
         tail.empty() ? fmt::format("ffmpeg {}", status.describe())
                      : fmt::format("ffmpeg {}: {}", status.describe(), tail),
         chunk.path, cmd.log_path);
  }

  uintmax_t size = fs::file_size(chunk.path, ec);
  if (ec || size == 0) {
    fail(ExtractionFailure::EmptyOutput,
         "chunk file was not created or is empty", chunk.path, cmd.log_path);
  }

  if (opts_.probe) {
    ProbeResult probe = probe_media(chunk.path);
    if (!probe.ok) {
      fail(ExtractionFailure::ProbeFailed,
           fmt::format("chunk is not decodable: {}", probe.error), chunk.path,
           cmd.log_path);
    }
    chunk.measured_duration = probe.duration;
  }

  remove_quietly(cmd.log_path);
  chunk.size_bytes = static_cast<uint64_t>(size);
  chunk.extracted_at_ms = now_ms();
  chunk.status = ChunkStatus::Ready;
  return chunk;
}

void ChunkExtractor::fail(ExtractionFailure kind, const std::string &message,
                          const std::string &out, const std::string &log) {
  remove_quietly(out);
  remove_quietly(log);
  throw ExtractionError(kind, message);
}

std::optional<ChunkDescriptor>
ChunkExtractor::locate(const std::string &chunk_id) const {
  std::error_code ec;
  const std::string needle = "_" + chunk_id + "_";
  for (fs::directory_iterator it(opts_.output_dir, ec), end; !ec && it != end;
       it.increment(ec)) {
    std::string name = it->path().filename().string();
    if (name.find(needle) == std::string::npos)
      continue;

    auto parsed = parse_chunk_filename(name);
    if (!parsed || parsed->chunk_id != chunk_id)
      continue;

    ChunkDescriptor chunk;
    chunk.id = parsed->chunk_id;
    chunk.stream_id = parsed->stream_id;
    chunk.start_offset = parsed->offset;
    chunk.duration = opts_.chunk_duration;
    chunk.path = it->path().string();
    chunk.status = ChunkStatus::Ready;

    std::error_code stat_ec;
    chunk.size_bytes = static_cast<uint64_t>(fs::file_size(it->path(), stat_ec));
    /// Chunk ids start with the extraction epoch ms
    try {
      chunk.extracted_at_ms = std::stoll(chunk.id.substr(0, chunk.id.find('-')));
    } catch (const std::exception &) {
      chunk.extracted_at_ms = 0;
    }
    return chunk;
  }
  return std::nullopt;
}

int ChunkExtractor::active_extractions() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<int>(in_flight_.size());
}

void ChunkExtractor::cancel_all() {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto &entry : in_flight_) {
    entry.second->kill();
  }
  if (!in_flight_.empty())
    LOG_WARN("[Extractor] Killed {} in-flight extractions", in_flight_.size());
}

} // namespace live_chunker
