/**
 * @file subprocess.cpp
 * @brief fork/execvp process launcher
 */

#include "live_chunker/subprocess.hpp"

#include <cerrno>
#include <csignal>
#include <mutex>
#include <system_error>
#include <thread>

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/core.h>

namespace live_chunker {

// **----- ExitStatus / ProcessHandle -----**

std::string ExitStatus::describe() const {
  if (signal != 0)
    return fmt::format("signal {}", signal);
  return fmt::format("exit code {}", code);
}

bool ProcessHandle::running() const {
  return exited().wait_for(std::chrono::seconds(0)) !=
         std::future_status::ready;
}

bool stop_process(ProcessHandle &process, std::chrono::milliseconds grace) {
  auto done = process.exited();
  if (done.wait_for(std::chrono::seconds(0)) == std::future_status::ready)
    return true;

  process.terminate();
  if (done.wait_for(grace) == std::future_status::ready)
    return true;

  process.kill();
  return done.wait_for(grace) == std::future_status::ready;
}

// **----- POSIX Implementation -----**

namespace {

/**
 * @class PosixProcess
 * @brief Handle backed by a reaper thread.
 *
 * @details The reaper first waits with WNOWAIT so the child stays a zombie,
 *          marks the handle reaped under the mutex, then collects the status.
 *          signal() checks the flag under the same mutex, so it can only ever
 *          target our own (possibly zombie) child.
 */
class PosixProcess : public ProcessHandle {
public:
  PosixProcess(pid_t pid, ProcessLauncher::ExitCallback on_exit) : pid_(pid) {
    future_ = promise_.get_future().share();
    reaper_ = std::thread(&PosixProcess::reap, this, std::move(on_exit));
  }

  ~PosixProcess() override {
    if (!reaper_.joinable())
      return;
    if (reaper_.get_id() == std::this_thread::get_id()) {
      reaper_.detach();
      return;
    }
    if (running())
      send(SIGKILL);
    reaper_.join();
  }

  int pid() const override { return static_cast<int>(pid_); }

  std::shared_future<ExitStatus> exited() const override { return future_; }

  void terminate() override { send(SIGTERM); }

  void kill() override { send(SIGKILL); }

private:
  void send(int sig) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!reaped_)
      ::kill(pid_, sig);
  }

  void reap(ProcessLauncher::ExitCallback on_exit) {
    siginfo_t info{};
    while (::waitid(P_PID, static_cast<id_t>(pid_), &info,
                    WEXITED | WNOWAIT) == -1 &&
           errno == EINTR) {
    }

    ExitStatus status;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      reaped_ = true;
      int raw = 0;
      pid_t r;
      do {
        r = ::waitpid(pid_, &raw, 0);
      } while (r == -1 && errno == EINTR);

      if (r == pid_) {
        if (WIFEXITED(raw)) {
          status.code = WEXITSTATUS(raw);
        } else if (WIFSIGNALED(raw)) {
          status.signal = WTERMSIG(raw);
        }
      }
    }

    promise_.set_value(status);
    if (on_exit)
      on_exit(status);
  }

  pid_t pid_;
  std::mutex mutex_;
  bool reaped_ = false;
  std::promise<ExitStatus> promise_;
  std::shared_future<ExitStatus> future_;
  std::thread reaper_;
};

int open_or_throw(const char *path, int flags, const char *what) {
  int fd = ::open(path, flags | O_CLOEXEC, 0644);
  if (fd == -1)
    throw std::system_error(errno, std::generic_category(),
                            fmt::format("{} '{}'", what, path));
  return fd;
}

} // anonymous namespace

std::unique_ptr<ProcessHandle>
PosixProcessLauncher::launch(const CommandLine &cmd, ExitCallback on_exit) {
  /// Everything the child touches is prepared before fork()
  std::vector<char *> argv;
  argv.reserve(cmd.args.size() + 2);
  argv.push_back(const_cast<char *>(cmd.program.c_str()));
  for (const auto &arg : cmd.args)
    argv.push_back(const_cast<char *>(arg.c_str()));
  argv.push_back(nullptr);

  int in_fd = open_or_throw("/dev/null", O_RDONLY, "open");
  int out_fd = -1;
  try {
    out_fd = cmd.log_path.empty()
                 ? open_or_throw("/dev/null", O_WRONLY, "open")
                 : open_or_throw(cmd.log_path.c_str(),
                                 O_WRONLY | O_CREAT | O_APPEND, "open log");
  } catch (const std::system_error &) {
    ::close(in_fd);
    throw;
  }

  int err_pipe[2];
  if (::pipe2(err_pipe, O_CLOEXEC) == -1) {
    int e = errno;
    ::close(in_fd);
    ::close(out_fd);
    throw std::system_error(e, std::generic_category(), "pipe2");
  }

  pid_t pid = ::fork();
  if (pid == -1) {
    int e = errno;
    ::close(in_fd);
    ::close(out_fd);
    ::close(err_pipe[0]);
    ::close(err_pipe[1]);
    throw std::system_error(e, std::generic_category(), "fork");
  }

  if (pid == 0) {
    /// Child: async-signal-safe calls only
    sigset_t none;
    sigemptyset(&none);
    sigprocmask(SIG_SETMASK, &none, nullptr);
    ::dup2(in_fd, STDIN_FILENO);
    ::dup2(out_fd, STDOUT_FILENO);
    ::dup2(out_fd, STDERR_FILENO);
    ::execvp(argv[0], argv.data());
    int e = errno;
    ssize_t ignored = ::write(err_pipe[1], &e, sizeof(e));
    (void)ignored;
    ::_exit(127);
  }

  ::close(in_fd);
  ::close(out_fd);
  ::close(err_pipe[1]);

  int child_errno = 0;
  ssize_t n;
  do {
    n = ::read(err_pipe[0], &child_errno, sizeof(child_errno));
  } while (n == -1 && errno == EINTR);
  ::close(err_pipe[0]);

  if (n == static_cast<ssize_t>(sizeof(child_errno))) {
    int raw = 0;
    while (::waitpid(pid, &raw, 0) == -1 && errno == EINTR) {
    }
    throw std::system_error(child_errno, std::generic_category(),
                            fmt::format("exec '{}'", cmd.program));
  }

  return std::make_unique<PosixProcess>(pid, std::move(on_exit));
}

} // namespace live_chunker
