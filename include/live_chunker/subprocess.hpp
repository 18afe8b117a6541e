/**
 * @file subprocess.hpp
 * @brief Child process launching for ffmpeg invocations
 *
 * @details Provides:
 *          - CommandLine: program, argv and the log file receiving stderr
 *
 *          - ProcessHandle: pid, signals and a single-resolution exit future
 *
 *          - ProcessLauncher: abstract seam so supervisors and extractors can
 *            be driven by a fake in tests
 *
 *          - PosixProcessLauncher: fork/execvp with a reaper thread per child
 */

#ifndef LIVE_CHUNKER_SUBPROCESS_HPP
#define LIVE_CHUNKER_SUBPROCESS_HPP

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <vector>

namespace live_chunker {

/**
 * @struct ExitStatus
 * @brief How a child process ended.
 */
struct ExitStatus {
  int code = -1;  //< Exit code, -1 when killed by a signal
  int signal = 0; //< Terminating signal, 0 when it exited normally

  bool success() const { return signal == 0 && code == 0; }

  /// "exit code 1" / "signal 9"
  std::string describe() const;
};

/**
 * @struct CommandLine
 * @brief Everything needed to spawn one process.
 */
struct CommandLine {
  std::string program;
  std::vector<std::string> args;
  std::string log_path; //< stdout/stderr target, empty means /dev/null
};

/**
 * @class ProcessHandle
 * @brief A running (or finished) child process.
 *
 * @note exited() resolves exactly once. Signals sent after the child has been
 *       reaped are ignored, so a recycled pid is never hit.
 */
class ProcessHandle {
public:
  virtual ~ProcessHandle() = default;

  virtual int pid() const = 0;
  virtual std::shared_future<ExitStatus> exited() const = 0;

  /// SIGTERM
  virtual void terminate() = 0;

  /// SIGKILL
  virtual void kill() = 0;

  bool running() const;
};

/**
 * @brief Terminate with escalation.
 *
 * @details SIGTERM, wait up to @p grace, then SIGKILL and wait up to @p grace
 *          again.
 *
 * @return true if the process is known to have exited
 */
bool stop_process(ProcessHandle &process, std::chrono::milliseconds grace);

/**
 * @class ProcessLauncher
 * @brief Factory for child processes.
 */
class ProcessLauncher {
public:
  using ExitCallback = std::function<void(const ExitStatus &)>;

  virtual ~ProcessLauncher() = default;

  /**
   * @brief Spawn a process.
   * @param cmd Program and arguments
   * @param on_exit Invoked once, from an arbitrary thread, after the child
   *        has been reaped. Must not destroy the handle.
   * @throws std::system_error when the process cannot be started
   */
  virtual std::unique_ptr<ProcessHandle> launch(const CommandLine &cmd,
                                                ExitCallback on_exit = {}) = 0;
};

/**
 * @class PosixProcessLauncher
 * @brief fork/execvp launcher.
 *
 * @note Exec failures are reported synchronously through a close-on-exec
 *       pipe, so a missing binary throws from launch() instead of surfacing
 *       as exit code 127.
 */
class PosixProcessLauncher : public ProcessLauncher {
public:
  std::unique_ptr<ProcessHandle> launch(const CommandLine &cmd,
                                        ExitCallback on_exit = {}) override;
};

} // namespace live_chunker

#endif // LIVE_CHUNKER_SUBPROCESS_HPP
