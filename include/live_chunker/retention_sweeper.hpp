/**
 * @file retention_sweeper.hpp
 * @brief Periodic deletion of expired chunks and surplus HLS segments
 */

#ifndef LIVE_CHUNKER_RETENTION_SWEEPER_HPP
#define LIVE_CHUNKER_RETENTION_SWEEPER_HPP

#include <chrono>
#include <string>
#include <vector>

#include "event_loop.hpp"

namespace live_chunker {

class ProcessSupervisor;

struct RetentionOptions {
  std::string chunk_dir = "/tmp/live_chunker/chunks";
  std::vector<std::string> extra_dirs; //< Scanned recursively (detection outputs)
  std::chrono::milliseconds retention{24LL * 3600 * 1000};
  std::chrono::milliseconds interval{3600000};
  int playlist_size = 6; //< Segment overflow keeps this many

  static RetentionOptions from_env();
};

struct SweepReport {
  int chunks_deleted = 0;
  int outputs_deleted = 0;
  int segments_trimmed = 0;
  int errors = 0;
};

/**
 * @class RetentionSweeper
 * @brief Deletes chunk files past the retention window and trims segment
 *        overflow in the output directories of running streams.
 *
 * @note Only files whose mtime is older than now - retention are removed;
 *       anything younger is left alone.
 */
class RetentionSweeper {
public:
  /**
   * @param supervisor Source of stream directories for segment trimming,
   *        may be null
   */
  RetentionSweeper(RetentionOptions opts, const ProcessSupervisor *supervisor,
                   EventLoop &loop);

  void start();
  void stop();

  /// One synchronous pass
  SweepReport sweep_once();

private:
  int sweep_dir(const std::string &dir, bool recursive, int &errors) const;

  RetentionOptions opts_;
  const ProcessSupervisor *supervisor_;
  RecurringTimer timer_;
};

} // namespace live_chunker

#endif // LIVE_CHUNKER_RETENTION_SWEEPER_HPP
