// syn_dsl/exec/child_process.hpp - fork/exec wrapper with piped stdout and stderr
#pragma once

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <vector>

#include <sys/types.h>

namespace syn_dsl::exec
{

/// How a child process ended.
struct ExitStatus
{
  bool exited = false;  ///< true: normal exit with `code`; false: killed by `signal`
  int code = 0;
  int signal = 0;

  [[nodiscard]] bool success() const noexcept { return exited && code == 0; }
  [[nodiscard]] bool terminated_by(int sig) const noexcept { return !exited && signal == sig; }

  /// "exited with status 1", "terminated by signal 9 (Killed)"
  [[nodiscard]] std::string describe() const;
};

/**
 * One spawned child process.
 *
 * The child's stdout and stderr are pipes owned by this object; stdin is
 * inherited. Waiting never reaps the child except in wait(), so
 * has_exited()/wait_for() can be called from other threads while wait()
 * blocks. The destructor kills and reaps a child that is still running.
 */
class ChildProcess
{
public:
  ChildProcess() = default;
  ~ChildProcess();

  ChildProcess(const ChildProcess &) = delete;
  ChildProcess & operator=(const ChildProcess &) = delete;
  ChildProcess(ChildProcess &&) = delete;
  ChildProcess & operator=(ChildProcess &&) = delete;

  /**
   * Spawn `argv[0]` (looked up in PATH) with `env` as its complete environment.
   *
   * The child starts with an empty signal mask. Throws ExecutionError when
   * the pipes or the fork cannot be created; a program that cannot be
   * executed makes the child exit with status 127.
   */
  void start(const std::vector<std::string> & argv, const std::vector<std::string> & env);

  [[nodiscard]] bool running() const noexcept { return pid_ > 0; }

  /// Read ends of the child's output pipes; -1 before start().
  [[nodiscard]] int stdout_fd() const noexcept { return stdout_fd_; }
  [[nodiscard]] int stderr_fd() const noexcept { return stderr_fd_; }

  /// Non-blocking, non-reaping check.
  [[nodiscard]] bool has_exited() const;

  /**
   * Poll has_exited() every `poll_interval` until it is true, `timeout`
   * elapses, or `*cancel` becomes true.
   *
   * @return true when the child exited in time
   */
  [[nodiscard]] bool wait_for(
    std::chrono::milliseconds timeout, std::chrono::milliseconds poll_interval,
    const std::atomic<bool> * cancel = nullptr) const;

  /// Block until the child ends, reap it and return how it ended.
  ExitStatus wait();

  /// SIGKILL the child unless it has already been reaped.
  void kill();

private:
  void close_pipes() noexcept;

  pid_t pid_ = -1;
  int stdout_fd_ = -1;
  int stderr_fd_ = -1;

  mutable std::mutex mutex_;
  bool reaped_ = false;
  ExitStatus status_;
};

}  // namespace syn_dsl::exec
