/**
 * @file task_queue.hpp
 * @brief Thread-safe queue feeding the chunk extraction workers
 *
 * @details Provides:
 *          - ExtractionTask: one chunk to cut from a stream at an offset
 *
 *          - TaskQueue: shared queue that extraction workers pop from
 */

#ifndef LIVE_CHUNKER_TASK_QUEUE_HPP
#define LIVE_CHUNKER_TASK_QUEUE_HPP

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <queue>
#include <string>

namespace live_chunker {

/**
 * @struct ExtractionTask
 * @brief A work unit for the extraction pool.
 */
struct ExtractionTask {
  std::string stream_id; //< Owning stream
  std::string locator;   //< Playlist or URL to cut from
  double offset = 0.0;   //< Start offset in seconds
  uint64_t ticket = 0;   //< Schedule ticket serial that issued the task
};

/**
 * @class TaskQueue
 * @brief Thread-safe queue shared by a fixed pool of workers.
 *
 * @attention DESIGN:
 *
 * - Workers pop tasks from a shared queue
 *
 * - A slow extraction (network source stalling) only occupies one worker
 *
 * - finish() wakes everyone; remaining tasks are still drained
 */
class TaskQueue {
  std::queue<ExtractionTask> tasks;
  mutable std::mutex mutex;
  std::condition_variable cv;
  std::atomic<bool> done{false};

public:
  /**
   * @brief Add a task to the queue.
   * @note Thread-safe; notifies one waiting worker.
   * @return false if the queue was already finished
   */
  bool push(ExtractionTask task);

  /**
   * @brief Pop a task from the queue.
   * @note Blocks until a task is available or queue is finished.
   * @param task Output parameter for the task
   * @return true if a task was retrieved, false if queue is empty and done
   */
  bool pop(ExtractionTask &task);

  /**
   * @brief Drop every queued task for a stream.
   * @return Number of tasks removed
   */
  std::size_t discard(const std::string &stream_id);

  /// Tasks not yet picked up by a worker
  std::size_t size() const;

  /**
   * @brief Signal that no more tasks will be added.
   * @note Wakes all waiting workers so they can exit.
   */
  void finish();
};

} // namespace live_chunker

#endif // LIVE_CHUNKER_TASK_QUEUE_HPP
