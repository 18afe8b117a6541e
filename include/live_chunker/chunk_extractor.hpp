/**
 * @file chunk_extractor.hpp
 * @brief Bounded ffmpeg invocations cutting fixed-length chunks
 *
 * @details One call cuts [offset, offset + duration) from a stream's
 *          playlist with stream copy into
 *          <chunk_dir>/<stream_id>_<chunk_id>_<offset>.mp4.
 *
 *          Success requires exit code 0 and a non-empty output file (and,
 *          with probing enabled, a decodable video stream). Every failure
 *          deletes partial output and raises ExtractionError.
 */

#ifndef LIVE_CHUNKER_CHUNK_EXTRACTOR_HPP
#define LIVE_CHUNKER_CHUNK_EXTRACTOR_HPP

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "subprocess.hpp"
#include "types.hpp"

namespace live_chunker {

struct ExtractorOptions {
  std::string ffmpeg_binary = "ffmpeg";
  std::string output_dir = "/tmp/live_chunker/chunks";
  double chunk_duration = 10.0;
  std::chrono::milliseconds timeout{30000};
  std::chrono::milliseconds kill_grace{2000};
  bool probe = false;

  static ExtractorOptions from_env();
};

enum class ExtractionFailure {
  Timeout,
  SpawnFailed,
  ProcessFailed,
  EmptyOutput,
  ProbeFailed
};

const char *to_string(ExtractionFailure kind);

/**
 * @class ExtractionError
 * @brief Raised by ChunkExtractor::extract with the failure reason.
 */
class ExtractionError : public std::runtime_error {
public:
  ExtractionError(ExtractionFailure kind, const std::string &what)
      : std::runtime_error(what), kind_(kind) {}

  ExtractionFailure kind() const { return kind_; }

private:
  ExtractionFailure kind_;
};

/// Pieces of a chunk file name
struct ChunkFileName {
  std::string stream_id;
  std::string chunk_id;
  double offset = 0.0;
};

class ChunkExtractor {
public:
  ChunkExtractor(ExtractorOptions opts, ProcessLauncher &launcher);
  virtual ~ChunkExtractor();

  ChunkExtractor(const ChunkExtractor &) = delete;
  ChunkExtractor &operator=(const ChunkExtractor &) = delete;

  /**
   * @brief Cut one chunk.
   * @param stream_id Owning stream
   * @param locator Playlist path or URL ffmpeg reads from
   * @param offset Start offset in seconds
   * @return Descriptor with status Ready
   * @throws ExtractionError
   */
  virtual ChunkDescriptor extract(const std::string &stream_id,
                                  const std::string &locator, double offset);

  /**
   * @brief Find a chunk file by id with a directory scan.
   */
  std::optional<ChunkDescriptor> locate(const std::string &chunk_id) const;

  /// Extractions currently running
  int active_extractions() const;

  /// Kill every running extraction (shutdown)
  void cancel_all();

  const ExtractorOptions &options() const { return opts_; }

  /// ffmpeg arguments for one extraction
  std::vector<std::string> extraction_args(const std::string &locator,
                                           double offset,
                                           const std::string &out) const;

  static std::string make_chunk_id();
  static std::string chunk_filename(const std::string &stream_id,
                                    const std::string &chunk_id, double offset);
  static std::optional<ChunkFileName> parse_chunk_filename(const std::string &name);

private:
  [[noreturn]] void fail(ExtractionFailure kind, const std::string &message,
                         const std::string &out, const std::string &log);

  ExtractorOptions opts_;
  ProcessLauncher &launcher_;

  mutable std::mutex mutex_;
  uint64_t next_slot_ = 1;
  std::map<uint64_t, ProcessHandle *> in_flight_;
};

} // namespace live_chunker

#endif // LIVE_CHUNKER_CHUNK_EXTRACTOR_HPP
