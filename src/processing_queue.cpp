/**
 * @file processing_queue.cpp
 * @brief Processing queue implementation
 */

#include "live_chunker/processing_queue.hpp"

#include <algorithm>
#include <exception>
#include <fstream>
#include <iterator>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "live_chunker/config.hpp"
#include "live_chunker/logging.hpp"
#include "live_chunker/system.hpp"

namespace live_chunker {

QueueOptions QueueOptions::from_env() {
  QueueOptions opts;
  opts.concurrency = Config::queue_concurrency();
  opts.max_waiting = static_cast<std::size_t>(Config::max_queue_size());
  opts.max_attempts = Config::max_attempts();
  opts.backoff_base = std::chrono::milliseconds(Config::retry_backoff_ms());
  opts.completed_history = static_cast<std::size_t>(Config::completed_history());
  opts.failed_history = static_cast<std::size_t>(Config::failed_history());
  opts.failed_journal = Config::failed_jobs_file();
  return opts;
}

const char *to_string(EnqueueOutcome outcome) {
  switch (outcome) {
  case EnqueueOutcome::Accepted:
    return "accepted";
  case EnqueueOutcome::AcceptedWithEviction:
    return "accepted_with_eviction";
  case EnqueueOutcome::Rejected:
    return "rejected";
  case EnqueueOutcome::Closed:
    return "closed";
  }
  return "unknown";
}

std::chrono::milliseconds
ProcessingQueue::backoff_delay(std::chrono::milliseconds base, int attempts) {
  int exponent = std::max(0, std::min(attempts - 1, 20));
  return base * (int64_t{1} << exponent);
}

// **----- Lifecycle -----**

ProcessingQueue::ProcessingQueue(QueueOptions opts, JobRegistry &registry,
                                 DetectionClient &client)
    : opts_(std::move(opts)), registry_(registry), client_(client) {
  if (opts_.max_attempts < 1)
    opts_.max_attempts = 1;
  registry_.set_limits(opts_.completed_history, opts_.failed_history);
}

ProcessingQueue::~ProcessingQueue() { shutdown(); }

void ProcessingQueue::set_observer(JobObserver observer) {
  std::lock_guard<std::mutex> lock(mutex_);
  observer_ = std::move(observer);
}

void ProcessingQueue::start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!workers_.empty() || stopping_)
    return;

  int count = opts_.concurrency > 0 ? opts_.concurrency : detect_cpu_limit();
  workers_.reserve(count);
  for (int i = 0; i < count; ++i)
    workers_.emplace_back(&ProcessingQueue::worker_loop, this, i);
  LOG_INFO("[Queue] {} workers, max {} waiting, {} attempts, backoff {}ms",
           count, opts_.max_waiting, opts_.max_attempts,
           opts_.backoff_base.count());
}

void ProcessingQueue::shutdown() {
  std::vector<std::thread> workers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    accepting_ = false;
    stopping_ = true;
    workers.swap(workers_);
  }
  work_cv_.notify_all();
  for (auto &worker : workers) {
    if (worker.joinable())
      worker.join();
  }
  idle_cv_.notify_all();
}

// **----- Producer Side -----**

EnqueueResult ProcessingQueue::enqueue(const ChunkDescriptor &chunk) {
  EnqueueResult result;
  std::vector<ProcessingJob> finished;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!accepting_) {
      result.outcome = EnqueueOutcome::Closed;
      return result;
    }

    ProcessingJob job;
    job.id = fmt::format("job-{}-{}", now_ms(), random_hex(6));
    job.chunk = chunk;
    job.priority = chunk.extracted_at_ms > 0 ? chunk.extracted_at_ms : now_ms();
    job.created_at_ms = now_ms();
    job.status = JobStatus::Waiting;

    result.outcome = EnqueueOutcome::Accepted;
    if (waiting_.size() >= opts_.max_waiting) {
      if (waiting_.empty() || std::prev(waiting_.end())->priority <= job.priority) {
        ++counters_.rejected_total;
        LOG_WARN("[Queue] Full ({} waiting), rejected chunk {} of stream {}",
                 waiting_.size(), chunk.id, chunk.stream_id);
        result.outcome = EnqueueOutcome::Rejected;
        return result;
      }
      ProcessingJob evicted = evict_newest_locked();
      result.evicted_job_id = evicted.id;
      result.outcome = EnqueueOutcome::AcceptedWithEviction;
      finished.push_back(std::move(evicted));
    }

    WaitingKey key{job.priority, next_seq_++, job.id};
    result.job_id = job.id;
    eligible_at_[job.id] = Clock::now();
    registry_.insert(std::move(job));
    waiting_.insert(std::move(key));
  }
  work_cv_.notify_one();

  for (const auto &job : finished) {
    LOG_WARN("[Queue] Evicted job {} (chunk {}) for older chunk {}", job.id,
             job.chunk.id, chunk.id);
    append_journal(job);
  }
  notify(finished);
  return result;
}

ProcessingJob ProcessingQueue::evict_newest_locked() {
  auto newest = std::prev(waiting_.end());
  std::string id = newest->id;
  waiting_.erase(newest);
  eligible_at_.erase(id);

  ProcessingJob job = registry_.remove_live(id);
  job.status = JobStatus::Failed;
  job.error = "evicted: queue full";
  job.completed_at_ms = now_ms();
  ++counters_.evicted_total;
  registry_.retire(job);
  return job;
}

// **----- Consumer Side -----**

void ProcessingQueue::worker_loop(int worker_id) {
  std::unique_lock<std::mutex> lock(mutex_);
  while (!stopping_) {
    auto now = Clock::now();
    auto picked = waiting_.end();
    std::optional<Clock::time_point> earliest;

    for (auto it = waiting_.begin(); it != waiting_.end(); ++it) {
      Clock::time_point due = eligible_at_[it->id];
      if (due <= now) {
        picked = it;
        break;
      }
      if (!earliest || due < *earliest)
        earliest = due;
    }

    if (picked == waiting_.end()) {
      if (earliest) {
        work_cv_.wait_until(lock, *earliest);
      } else {
        work_cv_.wait(lock);
      }
      continue;
    }

    std::string id = picked->id;
    waiting_.erase(picked);
    eligible_at_.erase(id);

    ProcessingJob *job = registry_.find_live(id);
    if (!job)
      continue;
    job->status = JobStatus::Processing;
    job->attempts += 1;
    job->started_at_ms = now_ms();
    ++processing_;
    ChunkDescriptor chunk = job->chunk;
    int attempt = job->attempts;
    lock.unlock();

    LOG_DEBUG("[Queue] Worker {} processing {} (chunk {}, attempt {})",
              worker_id, id, chunk.id, attempt);

    std::optional<DetectionResult> result;
    std::string error;
    try {
      result = client_.process(chunk);
    } catch (const std::exception &e) {
      error = e.what();
    }

    finish_attempt(id, std::move(result), error);
    lock.lock();
  }
}

void ProcessingQueue::finish_attempt(const std::string &id,
                                     std::optional<DetectionResult> result,
                                     const std::string &error) {
  std::vector<ProcessingJob> finished;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    --processing_;
    ProcessingJob *job = registry_.find_live(id);
    if (!job) {
      idle_cv_.notify_all();
      return;
    }

    if (result) {
      job->status = JobStatus::Completed;
      job->result = std::move(result);
      job->error.clear();
      job->completed_at_ms = now_ms();
      ProcessingJob done = registry_.remove_live(id);
      ++counters_.completed_total;
      LOG_INFO("[Queue] Job {} completed (chunk {}, {} detections)", done.id,
               done.chunk.id, done.result->detection_count);
      registry_.retire(done);
      finished.push_back(std::move(done));
    } else if (job->attempts < opts_.max_attempts) {
      job->error = error;
      job->status = JobStatus::Waiting;
      auto delay = backoff_delay(opts_.backoff_base, job->attempts);
      eligible_at_[id] = Clock::now() + delay;
      waiting_.insert(WaitingKey{job->priority, next_seq_++, id});
      ++counters_.retried_total;
      LOG_WARN("[Queue] Job {} attempt {}/{} failed: {} (retry in {}ms)", id,
               job->attempts, opts_.max_attempts, error, delay.count());
      work_cv_.notify_one();
    } else {
      job->error = error;
      job->status = JobStatus::Failed;
      job->completed_at_ms = now_ms();
      ProcessingJob dead = registry_.remove_live(id);
      ++counters_.failed_total;
      LOG_ERROR("[Queue] Job {} failed after {} attempts: {}", dead.id,
                dead.attempts, error);
      registry_.retire(dead);
      finished.push_back(std::move(dead));
    }
  }
  idle_cv_.notify_all();

  for (const auto &job : finished) {
    if (job.status == JobStatus::Failed)
      append_journal(job);
  }
  notify(finished);
}

void ProcessingQueue::notify(const std::vector<ProcessingJob> &finished) {
  if (finished.empty())
    return;
  JobObserver observer;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    observer = observer_;
  }
  if (!observer)
    return;
  for (const auto &job : finished) {
    try {
      observer(job);
    } catch (const std::exception &e) {
      LOG_ERROR("[Queue] Observer failed for job {}: {}", job.id, e.what());
    }
  }
}

void ProcessingQueue::append_journal(const ProcessingJob &job) {
  if (opts_.failed_journal.empty())
    return;

  nlohmann::json line = {{"job_id", job.id},
                         {"chunk_id", job.chunk.id},
                         {"stream_id", job.chunk.stream_id},
                         {"chunk_path", job.chunk.path},
                         {"start_offset", job.chunk.start_offset},
                         {"attempts", job.attempts},
                         {"error", job.error},
                         {"failed_at", job.completed_at_ms}};

  std::lock_guard<std::mutex> lock(journal_mutex_);
  std::ofstream out(opts_.failed_journal, std::ios::app);
  if (!out) {
    LOG_ERROR("[Queue] Cannot append to failure journal {}",
              opts_.failed_journal);
    return;
  }
  out << line.dump() << '\n';
}

// **----- Queries -----**

QueueStats ProcessingQueue::stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  QueueStats s = counters_;
  s.waiting = waiting_.size();
  s.processing = processing_;
  auto now = Clock::now();
  s.delayed = 0;
  for (const auto &entry : eligible_at_) {
    if (entry.second > now)
      ++s.delayed;
  }
  return s;
}

std::optional<ProcessingJob> ProcessingQueue::job(const std::string &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return registry_.find(id);
}

std::vector<ProcessingJob> ProcessingQueue::recent_completed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return registry_.completed();
}

std::vector<ProcessingJob> ProcessingQueue::recent_failed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return registry_.failed();
}

std::vector<ProcessingJob> ProcessingQueue::waiting_jobs() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ProcessingJob> out;
  out.reserve(waiting_.size());
  for (const auto &key : waiting_) {
    auto job = registry_.find(key.id);
    if (job)
      out.push_back(std::move(*job));
  }
  return out;
}

bool ProcessingQueue::wait_idle(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  return idle_cv_.wait_for(lock, timeout, [this] {
    return waiting_.empty() && processing_ == 0;
  });
}

} // namespace live_chunker
