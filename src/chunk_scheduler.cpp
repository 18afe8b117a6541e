/**
 * @file chunk_scheduler.cpp
 * @brief Chunk scheduling and extraction pool
 */

#include "live_chunker/chunk_scheduler.hpp"

#include <cmath>
#include <exception>
#include <stdexcept>

#include <fmt/core.h>

#include "live_chunker/config.hpp"
#include "live_chunker/logging.hpp"
#include "live_chunker/system.hpp"

namespace live_chunker {

std::chrono::milliseconds SchedulerOptions::period() const {
  return std::chrono::milliseconds(std::llround(step() * 1000.0));
}

SchedulerOptions SchedulerOptions::from_env() {
  SchedulerOptions opts;
  opts.chunk_duration = Config::chunk_duration();
  opts.overlap = Config::chunk_overlap();
  opts.initial_delay = std::chrono::milliseconds(
      std::llround(Config::processing_delay() * 1000.0));
  opts.extraction_workers = Config::extraction_workers();
  return opts;
}

ChunkScheduler::ChunkScheduler(SchedulerOptions opts, ChunkExtractor &extractor,
                               EventLoop &loop, ChunkSink sink,
                               MetricsAggregator *metrics)
    : opts_(opts), extractor_(extractor), loop_(loop), sink_(std::move(sink)),
      metrics_(metrics) {
  if (opts_.overlap < 0.0 || opts_.step() <= 0.0) {
    throw std::invalid_argument(
        fmt::format("chunk overlap {} must be in [0, {})", opts_.overlap,
                    opts_.chunk_duration));
  }
  if (opts_.extraction_workers < 1)
    opts_.extraction_workers = 1;

  workers_.reserve(opts_.extraction_workers);
  for (int i = 0; i < opts_.extraction_workers; ++i)
    workers_.emplace_back(&ChunkScheduler::worker_loop, this);
}

ChunkScheduler::~ChunkScheduler() { shutdown(); }

// **----- Tickets -----**

bool ChunkScheduler::start(const std::string &stream_id,
                           const std::string &locator, double seed_offset) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (shut_down_ || tickets_.count(stream_id))
    return false;

  auto ticket = std::make_shared<ScheduleTicket>(loop_);
  ticket->serial = next_serial_++;
  ticket->locator = locator;
  ticket->next_offset = seed_offset;
  ticket->stats.stream_id = stream_id;
  ticket->stats.next_offset = seed_offset;
  retired_.erase(stream_id);

  const uint64_t serial = ticket->serial;
  ticket->timer.start(
      opts_.period(),
      [this, stream_id, serial] { tick_ticket(stream_id, serial); },
      opts_.initial_delay);
  tickets_.emplace(stream_id, std::move(ticket));

  LOG_INFO("[Scheduler] Stream {}: {:g}s chunks every {:g}s, first in {}ms",
           stream_id, opts_.chunk_duration, opts_.step(),
           opts_.initial_delay.count());
  return true;
}

bool ChunkScheduler::stop(const std::string &stream_id) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tickets_.find(stream_id);
    if (it == tickets_.end())
      return false;
    it->second->timer.stop();
    retired_[stream_id] = it->second->stats;
    tickets_.erase(it);
  }

  std::size_t dropped = tasks_.discard(stream_id);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    outstanding_ -= dropped;
  }
  idle_cv_.notify_all();
  LOG_INFO("[Scheduler] Stream {} unscheduled ({} queued extractions dropped)",
           stream_id, dropped);
  return true;
}

std::optional<double> ChunkScheduler::tick(const std::string &stream_id) {
  return tick_ticket(stream_id, 0);
}

std::optional<double> ChunkScheduler::tick_ticket(const std::string &stream_id,
                                                  uint64_t serial) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = tickets_.find(stream_id);
  if (it == tickets_.end())
    return std::nullopt;
  /// A timer from a stopped ticket must not advance its successor
  if (serial != 0 && it->second->serial != serial)
    return std::nullopt;

  ScheduleTicket &ticket = *it->second;
  const double offset = ticket.next_offset;
  ticket.next_offset += opts_.step();
  ticket.stats.next_offset = ticket.next_offset;
  ++ticket.stats.ticks;

  if (outstanding_ >= opts_.max_pending) {
    ++ticket.stats.dropped;
    LOG_WARN("[Scheduler] Stream {}: {} extractions pending, skipping {:g}s",
             stream_id, outstanding_, offset);
    return offset;
  }

  ++outstanding_;
  if (!tasks_.push(ExtractionTask{stream_id, ticket.locator, offset,
                                  ticket.serial})) {
    --outstanding_;
  }
  return offset;
}

void ChunkScheduler::shutdown() {
  std::vector<std::string> ids;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shut_down_)
      return;
    shut_down_ = true;
    for (auto &entry : tickets_) {
      entry.second->timer.stop();
      retired_[entry.first] = entry.second->stats;
      ids.push_back(entry.first);
    }
    tickets_.clear();
  }

  std::size_t dropped = 0;
  for (const auto &id : ids)
    dropped += tasks_.discard(id);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    outstanding_ -= dropped;
  }

  tasks_.finish();
  extractor_.cancel_all();
  for (auto &worker : workers_) {
    if (worker.joinable())
      worker.join();
  }
  idle_cv_.notify_all();
}

void ChunkScheduler::wait_idle() {
  std::unique_lock<std::mutex> lock(mutex_);
  idle_cv_.wait(lock, [this] { return outstanding_ == 0; });
}

// **----- Queries -----**

bool ChunkScheduler::scheduled(const std::string &stream_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tickets_.count(stream_id) > 0;
}

std::optional<ScheduleStats>
ChunkScheduler::stats(const std::string &stream_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = tickets_.find(stream_id);
  if (it != tickets_.end())
    return it->second->stats;
  auto retired = retired_.find(stream_id);
  if (retired != retired_.end())
    return retired->second;
  return std::nullopt;
}

std::vector<ScheduleStats> ChunkScheduler::all_stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ScheduleStats> out;
  out.reserve(tickets_.size());
  for (const auto &entry : tickets_)
    out.push_back(entry.second->stats);
  return out;
}

std::size_t ChunkScheduler::outstanding() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return outstanding_;
}

// **----- Extraction Pool -----**

void ChunkScheduler::worker_loop() {
  ExtractionTask task;
  while (tasks_.pop(task)) {
    run_task(task);
    finish_task();
  }
}

void ChunkScheduler::run_task(const ExtractionTask &task) {
  auto t0 = std::chrono::steady_clock::now();
  std::optional<ChunkDescriptor> chunk;
  std::string error;

  try {
    chunk = extractor_.extract(task.stream_id, task.locator, task.offset);
  } catch (const ExtractionError &e) {
    error = fmt::format("{}: {}", to_string(e.kind()), e.what());
  } catch (const std::exception &e) {
    error = e.what();
  }

  double elapsed_ms = std::chrono::duration<double, std::milli>(
                          std::chrono::steady_clock::now() - t0)
                          .count();
  if (metrics_)
    metrics_->record_extraction(elapsed_ms, chunk.has_value());

  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tickets_.find(task.stream_id);
    if (it != tickets_.end() && it->second->serial == task.ticket) {
      ScheduleStats &stats = it->second->stats;
      if (chunk) {
        ++stats.extracted;
        stats.last_chunk_at_ms = now_ms();
      } else {
        ++stats.failed;
        stats.last_error = error;
      }
    }
  }

  if (!chunk) {
    LOG_ERROR("[Stream {}] Chunk at {:g}s failed: {}", task.stream_id,
              task.offset, error);
    return;
  }

  LOG_INFO("[Stream {}] Chunk {} ready ({:g}s, {} bytes, {:.0f}ms)",
           task.stream_id, chunk->id, task.offset, chunk->size_bytes,
           elapsed_ms);
  if (sink_) {
    try {
      sink_(*chunk);
    } catch (const std::exception &e) {
      LOG_ERROR("[Stream {}] Chunk {} hand-off failed: {}", task.stream_id,
                chunk->id, e.what());
    }
  }
}

void ChunkScheduler::finish_task() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (outstanding_ > 0)
      --outstanding_;
  }
  idle_cv_.notify_all();
}

} // namespace live_chunker
