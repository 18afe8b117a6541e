/**
 * @file types.hpp
 * @brief Core data types shared across live_chunker components
 *
 * @details Contains the data model used throughout the application:
 *          - Status enums for streams, chunks and jobs
 *
 *          - StreamDescriptor and the read-only StreamSnapshot
 *
 *          - ChunkDescriptor, DetectionResult and ProcessingJob
 *
 *          - QueueStats and PipelineMetrics
 */

#ifndef LIVE_CHUNKER_TYPES_HPP
#define LIVE_CHUNKER_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "source_adapter.hpp"

namespace live_chunker {

// **----- STATUS ENUMS -----**

/// Supervised transcoder lifecycle
enum class StreamStatus { Starting, Active, Error, Stopped };

enum class ChunkStatus { Extracting, Ready, Error };

enum class JobStatus { Waiting, Processing, Completed, Failed };

const char *to_string(StreamStatus status);
const char *to_string(ChunkStatus status);
const char *to_string(JobStatus status);

// **----- STREAMS -----**

/**
 * @struct StreamDescriptor
 * @brief Catalog entry for one camera.
 * @note desired_active is owned by the catalog, not by the supervisor.
 */
struct StreamDescriptor {
  std::string id;
  std::string name;
  SourceSpec source;
  bool desired_active = false;
};

/**
 * @struct StreamSnapshot
 * @brief Copy of a stream's runtime state, safe to hand out of the
 *        supervisor's lock.
 */
struct StreamSnapshot {
  std::string id;
  std::string name;
  SourceKind source_kind = SourceKind::LoopedFile;
  StreamStatus status = StreamStatus::Stopped;
  int pid = 0;                 //< 0 when no live process
  int64_t start_time_ms = 0;   //< Epoch ms of the last launch
  int restart_count = 0;       //< Spontaneous restarts since last reset
  std::string last_error;
  bool manually_stopped = false;
  std::string output_dir;
  std::string playlist_url;
};

// **----- CHUNKS -----**

/**
 * @struct ChunkDescriptor
 * @brief One extracted slice [start_offset, start_offset + duration).
 */
struct ChunkDescriptor {
  std::string id;               //< "<epoch ms>-<hex>", never contains '_'
  std::string stream_id;
  double start_offset = 0.0;    //< Seconds from scheduler start
  double duration = 0.0;        //< Nominal seconds
  std::string path;
  ChunkStatus status = ChunkStatus::Extracting;
  uint64_t size_bytes = 0;
  int64_t extracted_at_ms = 0;
  double measured_duration = 0.0; //< Probed seconds, 0 when not probed
  std::string error;
};

// **----- JOBS -----**

/**
 * @struct DetectionResult
 * @brief What the detection pipeline reported for one chunk.
 */
struct DetectionResult {
  std::string output_video_path;
  std::string output_json_path;
  int detection_count = 0;
  double processing_time_ms = 0.0;
  std::string body; //< Raw response, kept for history queries
};

/**
 * @struct ProcessingJob
 * @brief A chunk travelling through the processing queue.
 *
 * @note Lower priority value is served first; it is the chunk's extraction
 *       time so older chunks win.
 */
struct ProcessingJob {
  std::string id;
  ChunkDescriptor chunk;
  int64_t priority = 0;
  int attempts = 0;
  JobStatus status = JobStatus::Waiting;
  int64_t created_at_ms = 0;
  int64_t started_at_ms = 0;
  int64_t completed_at_ms = 0;
  std::optional<DetectionResult> result;
  std::string error;
};

// **----- METRICS -----**

/**
 * @struct QueueStats
 * @brief Point-in-time counters of the processing queue.
 */
struct QueueStats {
  std::size_t waiting = 0;       //< Includes jobs sitting out a backoff
  std::size_t delayed = 0;       //< Waiting jobs whose backoff has not elapsed
  std::size_t processing = 0;
  uint64_t completed_total = 0;
  uint64_t failed_total = 0;
  uint64_t evicted_total = 0;
  uint64_t rejected_total = 0;
  uint64_t retried_total = 0;
};

/**
 * @struct PipelineMetrics
 * @brief Derived view over extraction and queue activity.
 */
struct PipelineMetrics {
  uint64_t chunks_extracted = 0;
  uint64_t chunks_failed = 0;       //< Extraction failures
  uint64_t chunks_processed = 0;    //< Jobs completed
  uint64_t jobs_failed = 0;         //< Jobs terminally failed
  double avg_extraction_ms = 0.0;   //< EMA
  double avg_processing_ms = 0.0;   //< EMA
  std::size_t queue_depth = 0;
  std::size_t processing = 0;
  int active_extractions = 0;
};

} // namespace live_chunker

#endif // LIVE_CHUNKER_TYPES_HPP
