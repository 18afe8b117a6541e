/**
 * @file event_loop.cpp
 * @brief Timer loop implementation
 */

#include "live_chunker/event_loop.hpp"

#include <exception>

#include "live_chunker/logging.hpp"

namespace live_chunker {

EventLoop::~EventLoop() { stop(); }

void EventLoop::start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (started_)
    return;
  started_ = true;
  stopping_ = false;
  thread_ = std::thread(&EventLoop::run, this);
}

void EventLoop::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!started_ && timers_.empty())
      return;
    stopping_ = true;
    timers_.clear();
    index_.clear();
  }
  cv_.notify_all();

  if (thread_.joinable()) {
    if (thread_.get_id() == std::this_thread::get_id()) {
      thread_.detach();
    } else {
      thread_.join();
    }
  }

  std::lock_guard<std::mutex> lock(mutex_);
  started_ = false;
}

EventLoop::TimerId EventLoop::post(Task task) {
  return post_at(Clock::now(), std::move(task));
}

EventLoop::TimerId EventLoop::post_after(std::chrono::milliseconds delay,
                                         Task task) {
  return post_at(Clock::now() + delay, std::move(task));
}

EventLoop::TimerId EventLoop::post_at(Clock::time_point due, Task task) {
  TimerId id = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_)
      return 0;
    id = next_id_++;
    timers_.emplace(Key{due, id}, std::move(task));
    index_.emplace(id, due);
  }
  cv_.notify_one();
  return id;
}

bool EventLoop::cancel(TimerId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = index_.find(id);
  if (it == index_.end())
    return false;
  timers_.erase(Key{it->second, id});
  index_.erase(it);
  return true;
}

std::size_t EventLoop::pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return timers_.size();
}

bool EventLoop::running() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return started_ && !stopping_;
}

bool EventLoop::in_loop_thread() const {
  return thread_.get_id() == std::this_thread::get_id();
}

void EventLoop::run() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (!stopping_) {
    if (timers_.empty()) {
      cv_.wait(lock);
      continue;
    }

    auto first = timers_.begin();
    Clock::time_point due = first->first.first;
    if (Clock::now() < due) {
      cv_.wait_until(lock, due);
      continue;
    }

    Task task = std::move(first->second);
    index_.erase(first->first.second);
    timers_.erase(first);

    lock.unlock();
    try {
      task();
    } catch (const std::exception &e) {
      LOG_ERROR("[Loop] Task failed: {}", e.what());
    }
    lock.lock();
  }
}

// **----- RecurringTimer -----**

RecurringTimer::RecurringTimer(EventLoop &loop)
    : state_(std::make_shared<State>()) {
  state_->loop = &loop;
}

RecurringTimer::~RecurringTimer() { stop(); }

void RecurringTimer::start(std::chrono::milliseconds period,
                           EventLoop::Task task,
                           std::chrono::milliseconds initial_delay) {
  std::lock_guard<std::mutex> lock(state_->mutex);
  if (state_->active && state_->timer != 0)
    state_->loop->cancel(state_->timer);

  const uint64_t serial = ++state_->serial;
  state_->active = true;
  state_->period = period;
  state_->task = std::move(task);
  state_->next_due = EventLoop::Clock::now() + initial_delay;

  std::shared_ptr<State> state = state_;
  state_->timer = state_->loop->post_at(
      state_->next_due, [state, serial] { fire(state, serial); });
}

void RecurringTimer::stop() {
  std::lock_guard<std::mutex> lock(state_->mutex);
  if (!state_->active)
    return;
  state_->active = false;
  ++state_->serial;
  if (state_->timer != 0)
    state_->loop->cancel(state_->timer);
  state_->timer = 0;
}

bool RecurringTimer::active() const {
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->active;
}

void RecurringTimer::fire(const std::shared_ptr<State> &state,
                          uint64_t serial) {
  EventLoop::Task task;
  {
    std::lock_guard<std::mutex> lock(state->mutex);
    if (!state->active || state->serial != serial)
      return;
    state->timer = 0;
    task = state->task;
  }

  try {
    task();
  } catch (const std::exception &e) {
    LOG_ERROR("[Loop] Recurring task failed: {}", e.what());
  }

  std::lock_guard<std::mutex> lock(state->mutex);
  if (!state->active || state->serial != serial)
    return;

  auto now = EventLoop::Clock::now();
  state->next_due += state->period;
  while (state->next_due <= now && state->period.count() > 0)
    state->next_due += state->period;
  state->timer = state->loop->post_at(state->next_due,
                                      [state, serial] { fire(state, serial); });
}

} // namespace live_chunker
