/**
 * @file process_supervisor.hpp
 * @brief Per-stream ffmpeg HLS transcoder supervision
 *
 * @details Lifecycle of each stream:
 *
 *          starting --(alive after verify delay)--> active
 *
 *          starting/active --(unexpected exit)--> error --(delay)--> starting
 *          while restart_count < max_restarts
 *
 *          any --(stop)--> stopped, which only start()/restart() leave
 *
 *          A clean exit (code 0) lands in stopped without a restart.
 */

#ifndef LIVE_CHUNKER_PROCESS_SUPERVISOR_HPP
#define LIVE_CHUNKER_PROCESS_SUPERVISOR_HPP

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "event_loop.hpp"
#include "segment_publisher.hpp"
#include "source_adapter.hpp"
#include "stream_registry.hpp"
#include "subprocess.hpp"
#include "types.hpp"

namespace live_chunker {

struct SupervisorOptions {
  std::string ffmpeg_binary = "ffmpeg";
  std::string output_root = "/tmp/live_chunker/streams";
  int max_streams = 10;
  int max_restarts = 3;
  std::chrono::milliseconds verify_delay{2000};
  std::chrono::milliseconds restart_delay{5000};
  std::chrono::milliseconds stop_grace{2000};
  PublisherOptions publisher;
  SourceAdapterOptions source;

  static SupervisorOptions from_env();
};

enum class StartResult {
  Started,
  AlreadyRunning,
  CapacityReached,
  OutputUnavailable,
  UnknownStream
};

/// Why a restart was requested; decides what happens to the restart counter
enum class RestartCause {
  Crash,          //< Scheduled after an unexpected exit, counter already bumped
  Operator,       //< Explicit request, clears the manual-stop flag
  HealthRecovery, //< Desired active but down, counter reset to zero
  Stale           //< Playlist went stale, counter untouched
};

const char *to_string(StartResult result);
const char *to_string(RestartCause cause);

/// Legal status changes
bool transition_allowed(StreamStatus from, StreamStatus to);

/**
 * @class ProcessSupervisor
 * @brief Owns one transcoder subprocess per stream through StreamRegistry.
 *
 * @note Exit and verification events are delivered on the event loop. stop()
 *       and restart() block the calling thread for up to twice the stop grace
 *       while the old process winds down. A restart issued on the loop thread
 *       instead hands the old process to a reaper thread and relaunches from
 *       the loop once it is gone, so other streams' timers keep running.
 */
class ProcessSupervisor {
public:
  ProcessSupervisor(SupervisorOptions opts, StreamRegistry &registry,
                    ProcessLauncher &launcher, EventLoop &loop);
  ~ProcessSupervisor();

  ProcessSupervisor(const ProcessSupervisor &) = delete;
  ProcessSupervisor &operator=(const ProcessSupervisor &) = delete;

  /**
   * @brief Begin supervising a stream.
   * @note A spawn failure still returns Started; the stream is then in error
   *       with a restart pending.
   */
  StartResult start(const StreamDescriptor &desc);

  /**
   * @brief Stop a stream and release its output directory.
   * @return false if the id is unknown
   */
  bool stop(const std::string &id);

  /**
   * @brief Kill (if running) and relaunch a stream.
   * @return false if unknown, manually stopped (non-operator causes), or
   *         preempted by a concurrent stop
   */
  bool restart(const std::string &id, RestartCause cause = RestartCause::Operator);

  /// Stop every stream
  void shutdown();

  std::optional<StreamSnapshot> status(const std::string &id) const;
  std::vector<StreamSnapshot> list() const;
  std::size_t active_count() const;

  const SupervisorOptions &options() const { return opts_; }

  /// Full argv for a stream, without the program name
  std::vector<std::string> transcoder_args(const StreamDescriptor &desc,
                                           const std::string &dir) const;

private:
  bool restart_impl(const std::string &id, RestartCause cause,
                    uint64_t expected_generation);
  bool relaunch(const std::string &id, uint64_t generation);
  void reap_then_relaunch(const std::string &id,
                          std::unique_ptr<ProcessHandle> previous,
                          uint64_t generation);
  void join_reapers(bool finished_only);
  void launch_locked(StreamRuntimeState &state);
  void schedule_crash_restart_locked(StreamRuntimeState &state);
  void transition_locked(StreamRuntimeState &state, StreamStatus to);
  void cancel_timers_locked(StreamRuntimeState &state);

  void on_exit(const std::string &id, uint64_t generation, ExitStatus status);
  void on_verify(const std::string &id, uint64_t generation);

  SupervisorOptions opts_;
  StreamRegistry &registry_;
  ProcessLauncher &launcher_;
  EventLoop &loop_;

  struct Reaper {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };
  std::mutex reaper_mutex_;
  std::vector<Reaper> reapers_;
};

} // namespace live_chunker

#endif // LIVE_CHUNKER_PROCESS_SUPERVISOR_HPP
