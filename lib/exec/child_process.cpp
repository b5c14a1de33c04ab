// syn_dsl/exec/child_process.cpp - fork/exec wrapper
#include "syn_dsl/exec/child_process.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <thread>

#include <sys/wait.h>
#include <unistd.h>

#include "syn_dsl/basic/error.hpp"

namespace syn_dsl::exec
{

std::string ExitStatus::describe() const
{
  if (exited) {
    return fmt::format("exited with status {}", code);
  }
  const char * name = ::strsignal(signal);
  return fmt::format("terminated by signal {} ({})", signal, name != nullptr ? name : "unknown");
}

namespace
{

ExitStatus decode_wait_status(int status)
{
  ExitStatus out;
  if (WIFEXITED(status)) {
    out.exited = true;
    out.code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    out.exited = false;
    out.signal = WTERMSIG(status);
  }
  return out;
}

std::vector<char *> to_c_array(const std::vector<std::string> & items)
{
  std::vector<char *> out;
  out.reserve(items.size() + 1);
  for (const auto & s : items) {
    out.push_back(const_cast<char *>(s.c_str()));
  }
  out.push_back(nullptr);
  return out;
}

void close_fd(int & fd) noexcept
{
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

}  // namespace

ChildProcess::~ChildProcess()
{
  if (pid_ > 0 && !reaped_) {
    ::kill(pid_, SIGKILL);
    int status = 0;
    while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
    }
  }
  close_pipes();
}

void ChildProcess::close_pipes() noexcept
{
  close_fd(stdout_fd_);
  close_fd(stderr_fd_);
}

void ChildProcess::start(const std::vector<std::string> & argv, const std::vector<std::string> & env)
{
  if (pid_ > 0) {
    throw ExecutionError("child process already started");
  }
  if (argv.empty()) {
    throw ExecutionError("no program to execute");
  }

  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  if (::pipe(out_pipe) != 0) {
    throw ExecutionError(fmt::format("cannot create stdout pipe: {}", std::strerror(errno)));
  }
  if (::pipe(err_pipe) != 0) {
    const int saved = errno;
    ::close(out_pipe[0]);
    ::close(out_pipe[1]);
    throw ExecutionError(fmt::format("cannot create stderr pipe: {}", std::strerror(saved)));
  }

  // Build the C arrays before fork(): only async-signal-safe calls are allowed in the child.
  std::vector<char *> c_argv = to_c_array(argv);
  std::vector<char *> c_env = to_c_array(env);

  const pid_t pid = ::fork();
  if (pid < 0) {
    const int saved = errno;
    ::close(out_pipe[0]);
    ::close(out_pipe[1]);
    ::close(err_pipe[0]);
    ::close(err_pipe[1]);
    throw ExecutionError(fmt::format("cannot fork: {}", std::strerror(saved)));
  }

  if (pid == 0) {
    sigset_t none;
    sigemptyset(&none);
    ::pthread_sigmask(SIG_SETMASK, &none, nullptr);

    ::dup2(out_pipe[1], STDOUT_FILENO);
    ::dup2(err_pipe[1], STDERR_FILENO);
    ::close(out_pipe[0]);
    ::close(out_pipe[1]);
    ::close(err_pipe[0]);
    ::close(err_pipe[1]);

    ::execvpe(c_argv[0], c_argv.data(), c_env.data());
    std::perror("execvpe");
    ::_exit(127);
  }

  ::close(out_pipe[1]);
  ::close(err_pipe[1]);

  const std::lock_guard<std::mutex> lock(mutex_);
  pid_ = pid;
  stdout_fd_ = out_pipe[0];
  stderr_fd_ = err_pipe[0];
  reaped_ = false;
  status_ = ExitStatus{};
}

bool ChildProcess::has_exited() const
{
  const std::lock_guard<std::mutex> lock(mutex_);
  if (pid_ <= 0 || reaped_) {
    return reaped_;
  }

  siginfo_t info;
  std::memset(&info, 0, sizeof(info));
  if (::waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOHANG | WNOWAIT) != 0) {
    return errno == ECHILD;
  }
  return info.si_pid != 0;
}

bool ChildProcess::wait_for(
  std::chrono::milliseconds timeout, std::chrono::milliseconds poll_interval,
  const std::atomic<bool> * cancel) const
{
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    if (has_exited()) {
      return true;
    }
    if (cancel != nullptr && cancel->load()) {
      return false;
    }
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      return false;
    }
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    std::this_thread::sleep_for(std::min(poll_interval, remaining));
  }
}

ExitStatus ChildProcess::wait()
{
  {
    const std::lock_guard<std::mutex> lock(mutex_);
    if (pid_ <= 0) {
      throw ExecutionError("child process was not started");
    }
    if (reaped_) {
      return status_;
    }
  }

  // Block without reaping so that kill() stays safe until the pid is released below.
  siginfo_t info;
  while (true) {
    std::memset(&info, 0, sizeof(info));
    if (::waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOWAIT) == 0) {
      break;
    }
    if (errno != EINTR) {
      throw ExecutionError(fmt::format("waiting for child failed: {}", std::strerror(errno)));
    }
  }

  const std::lock_guard<std::mutex> lock(mutex_);
  int status = 0;
  pid_t r = 0;
  do {
    r = ::waitpid(pid_, &status, 0);
  } while (r < 0 && errno == EINTR);
  if (r < 0) {
    throw ExecutionError(fmt::format("reaping child failed: {}", std::strerror(errno)));
  }
  reaped_ = true;
  status_ = decode_wait_status(status);
  return status_;
}

void ChildProcess::kill()
{
  const std::lock_guard<std::mutex> lock(mutex_);
  if (pid_ > 0 && !reaped_) {
    ::kill(pid_, SIGKILL);
  }
}

}  // namespace syn_dsl::exec
