/**
 * @file chunk_scheduler.hpp
 * @brief Offset-tracked periodic chunk extraction per stream
 *
 * @details Every active stream owns a ScheduleTicket firing every
 *          (chunk_duration - overlap) seconds. A tick hands the current
 *          offset to the extraction pool and advances the offset by the same
 *          step, whatever the extraction's outcome. Ready chunks go to the
 *          sink (the processing queue).
 *
 * @attention THREAD MODEL:
 *            - Ticks run on the event loop and never block on ffmpeg.
 *
 *            - A fixed pool of extraction workers pops from a TaskQueue.
 */

#ifndef LIVE_CHUNKER_CHUNK_SCHEDULER_HPP
#define LIVE_CHUNKER_CHUNK_SCHEDULER_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "chunk_extractor.hpp"
#include "event_loop.hpp"
#include "metrics_aggregator.hpp"
#include "task_queue.hpp"

namespace live_chunker {

struct SchedulerOptions {
  double chunk_duration = 10.0;
  double overlap = 1.0;
  std::chrono::milliseconds initial_delay{20000}; //< Before the first tick
  int extraction_workers = 4;
  std::size_t max_pending = 64; //< Queued + running extractions

  /// Offset advance per tick, also the tick period in seconds
  double step() const { return chunk_duration - overlap; }
  std::chrono::milliseconds period() const;

  static SchedulerOptions from_env();
};

/**
 * @struct ScheduleStats
 * @brief Per-stream scheduler counters.
 */
struct ScheduleStats {
  std::string stream_id;
  double next_offset = 0.0;
  uint64_t ticks = 0;
  uint64_t extracted = 0;
  uint64_t failed = 0;
  uint64_t dropped = 0;       //< Ticks skipped because the pool was saturated
  int64_t last_chunk_at_ms = 0;
  std::string last_error;
};

using ChunkSink = std::function<void(const ChunkDescriptor &)>;

class ChunkScheduler {
public:
  /**
   * @throws std::invalid_argument if overlap >= duration
   */
  ChunkScheduler(SchedulerOptions opts, ChunkExtractor &extractor,
                 EventLoop &loop, ChunkSink sink,
                 MetricsAggregator *metrics = nullptr);
  ~ChunkScheduler();

  ChunkScheduler(const ChunkScheduler &) = delete;
  ChunkScheduler &operator=(const ChunkScheduler &) = delete;

  /**
   * @brief Begin periodic extraction for a stream.
   * @param locator Playlist path or URL to cut from
   * @param seed_offset First offset (0 for a fresh run)
   * @return false if the stream is already scheduled
   */
  bool start(const std::string &stream_id, const std::string &locator,
             double seed_offset = 0.0);

  /**
   * @brief Cancel the stream's ticket and drop its queued extractions.
   * @note Once this returns, no further tick is dispatched for the stream.
   */
  bool stop(const std::string &stream_id);

  /**
   * @brief Dispatch one tick immediately.
   * @return The offset handed to the pool, nullopt if not scheduled
   */
  std::optional<double> tick(const std::string &stream_id);

  /// Stop every ticket, kill running extractions and join the workers
  void shutdown();

  /// Block until no extraction is queued or running
  void wait_idle();

  bool scheduled(const std::string &stream_id) const;
  std::optional<ScheduleStats> stats(const std::string &stream_id) const;
  std::vector<ScheduleStats> all_stats() const;
  std::size_t outstanding() const;

private:
  struct ScheduleTicket {
    explicit ScheduleTicket(EventLoop &loop) : timer(loop) {}

    uint64_t serial = 0;
    std::string locator;
    double next_offset = 0.0;
    RecurringTimer timer;
    ScheduleStats stats;
  };

  /// Tick only if the stream's ticket is still `serial` (0 accepts any)
  std::optional<double> tick_ticket(const std::string &stream_id,
                                    uint64_t serial);
  void worker_loop();
  void run_task(const ExtractionTask &task);
  void finish_task();

  SchedulerOptions opts_;
  ChunkExtractor &extractor_;
  EventLoop &loop_;
  ChunkSink sink_;
  MetricsAggregator *metrics_;

  mutable std::mutex mutex_;
  std::condition_variable idle_cv_;
  std::map<std::string, std::shared_ptr<ScheduleTicket>> tickets_;
  std::map<std::string, ScheduleStats> retired_; //< Stats of stopped streams
  uint64_t next_serial_ = 1;
  std::size_t outstanding_ = 0;
  bool shut_down_ = false;

  TaskQueue tasks_;
  std::vector<std::thread> workers_;
};

} // namespace live_chunker

#endif // LIVE_CHUNKER_CHUNK_SCHEDULER_HPP
