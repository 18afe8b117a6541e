/**
 * @file process_supervisor.cpp
 * @brief Transcoder supervision implementation
 */

#include "live_chunker/process_supervisor.hpp"

#include <exception>
#include <filesystem>
#include <future>
#include <memory>
#include <thread>
#include <utility>

#include "live_chunker/config.hpp"
#include "live_chunker/logging.hpp"
#include "live_chunker/system.hpp"

namespace live_chunker {

namespace {

constexpr const char *TRANSCODER_LOG = "ffmpeg.log";
constexpr size_t STDERR_TAIL_BYTES = 512;

} // anonymous namespace

// **----- Options & Enums -----**

SupervisorOptions SupervisorOptions::from_env() {
  SupervisorOptions opts;
  opts.ffmpeg_binary = Config::ffmpeg_binary();
  opts.output_root = Config::output_path();
  opts.max_streams = Config::max_streams();
  opts.max_restarts = Config::max_restarts();
  opts.verify_delay = std::chrono::milliseconds(Config::start_verify_ms());
  opts.restart_delay = std::chrono::milliseconds(Config::restart_delay_ms());
  opts.stop_grace = std::chrono::milliseconds(Config::stop_grace_ms());
  opts.publisher = PublisherOptions::from_env();
  opts.source = SourceAdapterOptions::from_env();
  return opts;
}

const char *to_string(StartResult result) {
  switch (result) {
  case StartResult::Started:
    return "started";
  case StartResult::AlreadyRunning:
    return "already_running";
  case StartResult::CapacityReached:
    return "capacity_reached";
  case StartResult::OutputUnavailable:
    return "output_unavailable";
  case StartResult::UnknownStream:
    return "unknown_stream";
  }
  return "unknown";
}

const char *to_string(RestartCause cause) {
  switch (cause) {
  case RestartCause::Crash:
    return "crash";
  case RestartCause::Operator:
    return "operator";
  case RestartCause::HealthRecovery:
    return "health_recovery";
  case RestartCause::Stale:
    return "stale_playlist";
  }
  return "unknown";
}

bool transition_allowed(StreamStatus from, StreamStatus to) {
  /// rows: from, columns: to (Starting, Active, Error, Stopped)
  static constexpr bool table[4][4] = {
      /* Starting */ {true, true, true, true},
      /* Active   */ {true, false, true, true},
      /* Error    */ {true, false, false, true},
      /* Stopped  */ {true, false, false, true},
  };
  return table[static_cast<int>(from)][static_cast<int>(to)];
}

// **----- Construction -----**

ProcessSupervisor::ProcessSupervisor(SupervisorOptions opts,
                                     StreamRegistry &registry,
                                     ProcessLauncher &launcher, EventLoop &loop)
    : opts_(std::move(opts)), registry_(registry), launcher_(launcher),
      loop_(loop) {}

ProcessSupervisor::~ProcessSupervisor() {
  shutdown();

  /// Drain exit events already posted for this instance
  if (loop_.running() && !loop_.in_loop_thread()) {
    auto drained = std::make_shared<std::promise<void>>();
    auto done = drained->get_future();
    if (loop_.post([drained] { drained->set_value(); }) != 0)
      done.wait();
  }
}

std::vector<std::string>
ProcessSupervisor::transcoder_args(const StreamDescriptor &desc,
                                   const std::string &dir) const {
  std::vector<std::string> args = {"-hide_banner", "-loglevel", "warning"};
  auto input = transcoder_input_args(desc.source, opts_.source);
  args.insert(args.end(), input.begin(), input.end());
  auto output = hls_output_args(dir, opts_.publisher);
  args.insert(args.end(), output.begin(), output.end());
  return args;
}

// **----- Public Operations -----**

StartResult ProcessSupervisor::start(const StreamDescriptor &desc) {
  auto lock = registry_.lock();

  if (StreamRuntimeState *existing = registry_.find(desc.id)) {
    if (existing->status != StreamStatus::Stopped) {
      LOG_DEBUG("[Stream {}] Start ignored, already {}", desc.id,
                to_string(existing->status));
      return StartResult::AlreadyRunning;
    }
    if (registry_.live_count() >= static_cast<size_t>(opts_.max_streams)) {
      LOG_WARN("[Stream {}] Maximum concurrent streams ({}) reached", desc.id,
               opts_.max_streams);
      return StartResult::CapacityReached;
    }
    if (!prepare_output_dir(existing->output_dir))
      return StartResult::OutputUnavailable;

    existing->descriptor = desc;
    existing->manual_stop = false;
    existing->restart_count = 0;
    existing->last_error.clear();
    launch_locked(*existing);
    return StartResult::Started;
  }

  if (registry_.live_count() >= static_cast<size_t>(opts_.max_streams)) {
    LOG_WARN("[Stream {}] Maximum concurrent streams ({}) reached", desc.id,
             opts_.max_streams);
    return StartResult::CapacityReached;
  }

  std::string dir = stream_output_dir(opts_.output_root, desc.id);
  if (!prepare_output_dir(dir))
    return StartResult::OutputUnavailable;

  StreamRuntimeState fresh(desc);
  fresh.output_dir = dir;
  fresh.playlist_url = playlist_locator(desc.id);
  StreamRuntimeState &state = registry_.insert(std::move(fresh));

  LOG_INFO("[Stream {}] Starting '{}' ({})", desc.id, desc.name,
           to_string(desc.source.kind()));
  launch_locked(state);
  return StartResult::Started;
}

bool ProcessSupervisor::stop(const std::string &id) {
  std::unique_ptr<ProcessHandle> process;
  std::string dir;
  uint64_t generation = 0;
  {
    auto lock = registry_.lock();
    StreamRuntimeState *state = registry_.find(id);
    if (!state)
      return false;
    if (state->manual_stop && state->status == StreamStatus::Stopped)
      return true;

    state->manual_stop = true;
    cancel_timers_locked(*state);
    generation = ++state->generation;
    process = std::move(state->process);
    dir = state->output_dir;
  }

  if (process) {
    LOG_INFO("[Stream {}] Stopping ffmpeg (pid {})", id, process->pid());
    if (!stop_process(*process, opts_.stop_grace)) {
      LOG_ERROR("[Stream {}] ffmpeg pid {} did not exit after SIGKILL", id,
                process->pid());
    }
    process.reset();
  }

  {
    auto lock = registry_.lock();
    StreamRuntimeState *state = registry_.find(id);
    if (!state || state->generation != generation)
      return true;
    transition_locked(*state, StreamStatus::Stopped);
  }

  release_output_dir(dir);
  LOG_INFO("[Stream {}] Stopped", id);
  return true;
}

bool ProcessSupervisor::restart(const std::string &id, RestartCause cause) {
  return restart_impl(id, cause, 0);
}

void ProcessSupervisor::shutdown() {
  std::vector<std::string> ids;
  {
    auto lock = registry_.lock();
    for (const auto &entry : registry_.entries())
      ids.push_back(entry.first);
  }
  for (const auto &id : ids)
    stop(id);
  join_reapers(false);
}

std::optional<StreamSnapshot>
ProcessSupervisor::status(const std::string &id) const {
  return registry_.snapshot(id);
}

std::vector<StreamSnapshot> ProcessSupervisor::list() const {
  return registry_.snapshot_all();
}

std::size_t ProcessSupervisor::active_count() const {
  std::size_t n = 0;
  for (const auto &s : registry_.snapshot_all()) {
    if (s.status == StreamStatus::Active)
      ++n;
  }
  return n;
}

// **----- Internals -----**

bool ProcessSupervisor::restart_impl(const std::string &id, RestartCause cause,
                                     uint64_t expected_generation) {
  std::unique_ptr<ProcessHandle> previous;
  uint64_t generation = 0;
  {
    auto lock = registry_.lock();
    StreamRuntimeState *state = registry_.find(id);
    if (!state)
      return false;
    if (expected_generation != 0 && state->generation != expected_generation)
      return false;

    if (cause != RestartCause::Operator && state->manual_stop)
      return false;
    if (state->status == StreamStatus::Stopped &&
        registry_.live_count() >= static_cast<size_t>(opts_.max_streams)) {
      LOG_WARN("[Stream {}] Restart refused, maximum concurrent streams ({})",
               id, opts_.max_streams);
      return false;
    }
    if (cause == RestartCause::Operator)
      state->manual_stop = false;

    if (cause == RestartCause::HealthRecovery)
      state->restart_count = 0;

    cancel_timers_locked(*state);
    generation = ++state->generation;
    previous = std::move(state->process);
    if (!prepare_output_dir(state->output_dir)) {
      state->last_error = "output directory unavailable";
      transition_locked(*state, StreamStatus::Error);
      return false;
    }
    transition_locked(*state, StreamStatus::Starting);
    state->start_time_ms = now_ms();
    LOG_INFO("[Stream {}] Restarting ({}, restart count {})", id,
             to_string(cause), state->restart_count);
  }

  if (previous && loop_.in_loop_thread()) {
    reap_then_relaunch(id, std::move(previous), generation);
    return true;
  }

  if (previous) {
    if (!stop_process(*previous, opts_.stop_grace)) {
      LOG_ERROR("[Stream {}] Previous ffmpeg pid {} did not exit", id,
                previous->pid());
    }
    previous.reset();
  }
  return relaunch(id, generation);
}

bool ProcessSupervisor::relaunch(const std::string &id, uint64_t generation) {
  auto lock = registry_.lock();
  StreamRuntimeState *state = registry_.find(id);
  if (!state || state->generation != generation || state->manual_stop)
    return false;
  launch_locked(*state);
  return true;
}

void ProcessSupervisor::reap_then_relaunch(
    const std::string &id, std::unique_ptr<ProcessHandle> previous,
    uint64_t generation) {
  auto done = std::make_shared<std::atomic<bool>>(false);
  std::shared_ptr<ProcessHandle> handle(std::move(previous));

  std::thread worker([this, id, handle, generation, done] {
    if (!stop_process(*handle, opts_.stop_grace)) {
      LOG_ERROR("[Stream {}] Previous ffmpeg pid {} did not exit", id,
                handle->pid());
    }
    loop_.post([this, id, generation] { relaunch(id, generation); });
    done->store(true);
  });

  join_reapers(true);
  std::lock_guard<std::mutex> lock(reaper_mutex_);
  reapers_.push_back(Reaper{std::move(worker), std::move(done)});
}

void ProcessSupervisor::join_reapers(bool finished_only) {
  std::vector<Reaper> joining;
  {
    std::lock_guard<std::mutex> lock(reaper_mutex_);
    auto it = reapers_.begin();
    while (it != reapers_.end()) {
      if (!finished_only || it->done->load()) {
        joining.push_back(std::move(*it));
        it = reapers_.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (auto &reaper : joining)
    reaper.thread.join();
}

void ProcessSupervisor::launch_locked(StreamRuntimeState &state) {
  const std::string id = state.descriptor.id;
  const uint64_t generation = ++state.generation;
  transition_locked(state, StreamStatus::Starting);

  CommandLine cmd;
  cmd.program = opts_.ffmpeg_binary;
  cmd.args = transcoder_args(state.descriptor, state.output_dir);
  cmd.log_path =
      (std::filesystem::path(state.output_dir) / TRANSCODER_LOG).string();
  LOG_DEBUG("[Stream {}] {}", id, render_command(cmd.program, cmd.args));

  try {
    state.process = launcher_.launch(
        cmd, [this, id, generation](const ExitStatus &status) {
          loop_.post([this, id, generation, status] {
            on_exit(id, generation, status);
          });
        });
  } catch (const std::exception &e) {
    state.last_error = e.what();
    LOG_ERROR("[Stream {}] Failed to spawn ffmpeg: {}", id, e.what());
    transition_locked(state, StreamStatus::Error);
    schedule_crash_restart_locked(state);
    return;
  }

  state.start_time_ms = now_ms();
  LOG_INFO("[Stream {}] ffmpeg launched (pid {})", id, state.process->pid());
  state.verify_timer = loop_.post_after(
      opts_.verify_delay, [this, id, generation] { on_verify(id, generation); });
}

void ProcessSupervisor::schedule_crash_restart_locked(
    StreamRuntimeState &state) {
  const std::string &id = state.descriptor.id;
  if (state.manual_stop)
    return;
  if (state.restart_count >= opts_.max_restarts) {
    LOG_ERROR("[Stream {}] Restart limit ({}) reached, staying in error", id,
              opts_.max_restarts);
    return;
  }

  ++state.restart_count;
  LOG_WARN("[Stream {}] Restarting in {}ms (attempt {}/{})", id,
           opts_.restart_delay.count(), state.restart_count,
           opts_.max_restarts);

  const std::string stream_id = id;
  const uint64_t generation = state.generation;
  state.restart_timer =
      loop_.post_after(opts_.restart_delay, [this, stream_id, generation] {
        restart_impl(stream_id, RestartCause::Crash, generation);
      });
}

void ProcessSupervisor::transition_locked(StreamRuntimeState &state,
                                          StreamStatus to) {
  if (!transition_allowed(state.status, to)) {
    LOG_ERROR("[Stream {}] Illegal transition {} -> {}", state.descriptor.id,
              to_string(state.status), to_string(to));
    return;
  }
  LOG_DEBUG("[Stream {}] {} -> {}", state.descriptor.id,
            to_string(state.status), to_string(to));
  state.status = to;
}

void ProcessSupervisor::cancel_timers_locked(StreamRuntimeState &state) {
  if (state.verify_timer != 0)
    loop_.cancel(state.verify_timer);
  if (state.restart_timer != 0)
    loop_.cancel(state.restart_timer);
  state.verify_timer = 0;
  state.restart_timer = 0;
}

void ProcessSupervisor::on_exit(const std::string &id, uint64_t generation,
                                ExitStatus status) {
  std::unique_ptr<ProcessHandle> finished;
  {
    auto lock = registry_.lock();
    StreamRuntimeState *state = registry_.find(id);
    if (!state || state->generation != generation)
      return;

    finished = std::move(state->process);
    cancel_timers_locked(*state);

    if (status.success()) {
      LOG_INFO("[Stream {}] ffmpeg exited cleanly", id);
      transition_locked(*state, StreamStatus::Stopped);
    } else {
      state->last_error = "ffmpeg " + status.describe();
      LOG_ERROR("[Stream {}] ffmpeg exited unexpectedly ({})", id,
                status.describe());
      std::string tail = read_tail(
          (std::filesystem::path(state->output_dir) / TRANSCODER_LOG).string(),
          STDERR_TAIL_BYTES);
      if (!tail.empty())
        LOG_WARN("[Stream {}] ffmpeg stderr: {}", id, tail);
      transition_locked(*state, StreamStatus::Error);
      schedule_crash_restart_locked(*state);
    }
  }
}

void ProcessSupervisor::on_verify(const std::string &id, uint64_t generation) {
  auto lock = registry_.lock();
  StreamRuntimeState *state = registry_.find(id);
  if (!state || state->generation != generation)
    return;
  state->verify_timer = 0;

  if (state->status == StreamStatus::Starting && state->process &&
      state->process->running()) {
    transition_locked(*state, StreamStatus::Active);
    LOG_SUCCESS("[Stream {}] ffmpeg running (pid {})", id,
                state->process->pid());
  }
}

} // namespace live_chunker
