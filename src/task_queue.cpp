/**
 * @file task_queue.cpp
 * @brief Extraction task queue implementation
 */

#include "live_chunker/task_queue.hpp"

#include <utility>

namespace live_chunker {

// **----- TaskQueue Implementation -----**

bool TaskQueue::push(ExtractionTask task) {
  std::lock_guard<std::mutex> lock(mutex);
  if (done.load())
    return false;
  tasks.push(std::move(task));
  cv.notify_one();
  return true;
}

bool TaskQueue::pop(ExtractionTask &task) {
  std::unique_lock<std::mutex> lock(mutex);
  cv.wait(lock, [this] { return !tasks.empty() || done.load(); });
  if (tasks.empty())
    return false;
  task = std::move(tasks.front());
  tasks.pop();
  return true;
}

std::size_t TaskQueue::discard(const std::string &stream_id) {
  std::lock_guard<std::mutex> lock(mutex);
  std::queue<ExtractionTask> kept;
  std::size_t removed = 0;
  while (!tasks.empty()) {
    if (tasks.front().stream_id == stream_id) {
      ++removed;
    } else {
      kept.push(std::move(tasks.front()));
    }
    tasks.pop();
  }
  tasks.swap(kept);
  return removed;
}

std::size_t TaskQueue::size() const {
  std::lock_guard<std::mutex> lock(mutex);
  return tasks.size();
}

void TaskQueue::finish() {
  {
    std::lock_guard<std::mutex> lock(mutex);
    done.store(true);
  }
  cv.notify_all();
}

} // namespace live_chunker
