/**
 * @file event_loop.hpp
 * @brief Single-threaded timer loop for control-plane work
 *
 * @details Every periodic or delayed action runs here: health checks,
 *          retention sweeps, chunk scheduler ticks, crash-restart backoff and
 *          start verification. Tasks run one at a time on the loop thread, so
 *          they must not block for long; subprocess waits belong elsewhere.
 */

#ifndef LIVE_CHUNKER_EVENT_LOOP_HPP
#define LIVE_CHUNKER_EVENT_LOOP_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <utility>

namespace live_chunker {

/**
 * @class EventLoop
 * @brief Timer min-heap drained by one dedicated thread.
 *
 * @note Timer id 0 is never issued; it is returned when the loop is stopped
 *       and the task was dropped.
 */
class EventLoop {
public:
  using Clock = std::chrono::steady_clock;
  using Task = std::function<void()>;
  using TimerId = uint64_t;

  EventLoop() = default;
  ~EventLoop();

  EventLoop(const EventLoop &) = delete;
  EventLoop &operator=(const EventLoop &) = delete;

  /// Spawn the loop thread (idempotent)
  void start();

  /**
   * @brief Stop the loop, drop pending timers and join the thread.
   * @note A task already running finishes first.
   */
  void stop();

  /// Run as soon as possible
  TimerId post(Task task);

  /// Run after a delay
  TimerId post_after(std::chrono::milliseconds delay, Task task);

  /// Run at a steady-clock deadline
  TimerId post_at(Clock::time_point due, Task task);

  /**
   * @brief Remove a pending timer.
   * @return true if the timer was pending and will not run
   */
  bool cancel(TimerId id);

  /// Timers not yet run
  std::size_t pending() const;

  bool running() const;

  bool in_loop_thread() const;

private:
  void run();

  using Key = std::pair<Clock::time_point, TimerId>;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::map<Key, Task> timers_;
  std::unordered_map<TimerId, Clock::time_point> index_;
  TimerId next_id_ = 1;
  bool started_ = false;
  bool stopping_ = false;
  std::thread thread_;
};

/**
 * @class RecurringTimer
 * @brief Fixed-rate repetition of one task on an EventLoop.
 *
 * @details The next run is scheduled from the previous due time, not from
 *          when the task finished; missed periods are skipped rather than
 *          replayed. stop() is atomic with respect to rescheduling: once it
 *          returns, no new run is started (a run already executing on the
 *          loop thread completes).
 */
class RecurringTimer {
public:
  explicit RecurringTimer(EventLoop &loop);
  ~RecurringTimer();

  RecurringTimer(const RecurringTimer &) = delete;
  RecurringTimer &operator=(const RecurringTimer &) = delete;

  void start(std::chrono::milliseconds period, EventLoop::Task task,
             std::chrono::milliseconds initial_delay);
  void stop();
  bool active() const;

private:
  struct State {
    EventLoop *loop = nullptr;
    mutable std::mutex mutex;
    bool active = false;
    uint64_t serial = 0;
    EventLoop::TimerId timer = 0;
    EventLoop::Clock::time_point next_due;
    std::chrono::milliseconds period{0};
    EventLoop::Task task;
  };

  static void fire(const std::shared_ptr<State> &state, uint64_t serial);

  std::shared_ptr<State> state_;
};

} // namespace live_chunker

#endif // LIVE_CHUNKER_EVENT_LOOP_HPP
