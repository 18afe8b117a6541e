/**
 * @file processing_queue.hpp
 * @brief Priority/retry queue dispatching chunks to the detection pipeline
 *
 * @details Producer-consumer queue between the chunk scheduler (producer)
 *          and a fixed pool of detection workers (consumers):
 *
 *          - enqueue() never blocks; a full queue evicts its newest waiting
 *            job when the incoming chunk is older, otherwise rejects
 *
 *          - older chunks are dispatched first
 *
 *          - a failed attempt returns the job to waiting after
 *            base * 2^(attempts - 1); at max_attempts it fails for good and
 *            lands in the bounded failure history (and optional journal)
 */

#ifndef LIVE_CHUNKER_PROCESSING_QUEUE_HPP
#define LIVE_CHUNKER_PROCESSING_QUEUE_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "detection_client.hpp"
#include "job_registry.hpp"
#include "types.hpp"

namespace live_chunker {

struct QueueOptions {
  int concurrency = 3; //< 0 means one worker per available CPU
  std::size_t max_waiting = 1000;
  int max_attempts = 3;
  std::chrono::milliseconds backoff_base{2000};
  std::size_t completed_history = 10;
  std::size_t failed_history = 25;
  std::string failed_journal; //< JSONL of terminal failures, empty disables

  static QueueOptions from_env();
};

enum class EnqueueOutcome { Accepted, AcceptedWithEviction, Rejected, Closed };

const char *to_string(EnqueueOutcome outcome);

struct EnqueueResult {
  EnqueueOutcome outcome = EnqueueOutcome::Rejected;
  std::string job_id;
  std::string evicted_job_id;

  bool accepted() const {
    return outcome == EnqueueOutcome::Accepted ||
           outcome == EnqueueOutcome::AcceptedWithEviction;
  }
};

/// Called once per job reaching completed or failed
using JobObserver = std::function<void(const ProcessingJob &)>;

class ProcessingQueue {
public:
  using Clock = std::chrono::steady_clock;

  ProcessingQueue(QueueOptions opts, JobRegistry &registry,
                  DetectionClient &client);
  ~ProcessingQueue();

  ProcessingQueue(const ProcessingQueue &) = delete;
  ProcessingQueue &operator=(const ProcessingQueue &) = delete;

  /// Register before start()
  void set_observer(JobObserver observer);

  /// Spawn the worker pool
  void start();

  /**
   * @brief Stop accepting work and join the workers.
   * @note Jobs being processed finish their current attempt; waiting jobs
   *       stay in the registry.
   */
  void shutdown();

  EnqueueResult enqueue(const ChunkDescriptor &chunk);

  QueueStats stats() const;
  std::optional<ProcessingJob> job(const std::string &id) const;
  std::vector<ProcessingJob> recent_completed() const;
  std::vector<ProcessingJob> recent_failed() const;

  /// Waiting jobs in dispatch order
  std::vector<ProcessingJob> waiting_jobs() const;

  /**
   * @brief Block until nothing is waiting or processing.
   * @return false on timeout
   */
  bool wait_idle(std::chrono::milliseconds timeout);

  int worker_count() const { return static_cast<int>(workers_.size()); }

  /// base * 2^(attempts - 1)
  static std::chrono::milliseconds backoff_delay(std::chrono::milliseconds base,
                                                 int attempts);

private:
  struct WaitingKey {
    int64_t priority;
    uint64_t seq;
    std::string id;

    bool operator<(const WaitingKey &other) const {
      if (priority != other.priority)
        return priority < other.priority;
      return seq < other.seq;
    }
  };

  void worker_loop(int worker_id);
  void finish_attempt(const std::string &id, std::optional<DetectionResult> result,
                      const std::string &error);
  ProcessingJob evict_newest_locked();
  void notify(const std::vector<ProcessingJob> &finished);
  void append_journal(const ProcessingJob &job);

  QueueOptions opts_;
  JobRegistry &registry_;
  DetectionClient &client_;
  JobObserver observer_;

  mutable std::mutex mutex_;
  std::condition_variable work_cv_;
  std::condition_variable idle_cv_;
  std::set<WaitingKey> waiting_;
  std::unordered_map<std::string, Clock::time_point> eligible_at_;
  std::size_t processing_ = 0;
  uint64_t next_seq_ = 1;
  bool accepting_ = true;
  bool stopping_ = false;
  QueueStats counters_;

  std::mutex journal_mutex_;
  std::vector<std::thread> workers_;
};

} // namespace live_chunker

#endif // LIVE_CHUNKER_PROCESSING_QUEUE_HPP
