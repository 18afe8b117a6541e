/**
 * @file types.cpp
 * @brief String forms of the status enums
 */

#include "live_chunker/types.hpp"

namespace live_chunker {

const char *to_string(StreamStatus status) {
  switch (status) {
  case StreamStatus::Starting:
    return "starting";
  case StreamStatus::Active:
    return "active";
  case StreamStatus::Error:
    return "error";
  case StreamStatus::Stopped:
    return "stopped";
  }
  return "unknown";
}

const char *to_string(ChunkStatus status) {
  switch (status) {
  case ChunkStatus::Extracting:
    return "extracting";
  case ChunkStatus::Ready:
    return "ready";
  case ChunkStatus::Error:
    return "error";
  }
  return "unknown";
}

const char *to_string(JobStatus status) {
  switch (status) {
  case JobStatus::Waiting:
    return "waiting";
  case JobStatus::Processing:
    return "processing";
  case JobStatus::Completed:
    return "completed";
  case JobStatus::Failed:
    return "failed";
  }
  return "unknown";
}

} // namespace live_chunker
