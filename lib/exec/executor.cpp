// syn_dsl/exec/executor.cpp - Supervised execution of generated programs
#include "syn_dsl/exec/executor.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <fstream>
#include <functional>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include <poll.h>
#include <pthread.h>
#include <unistd.h>

#include "syn_dsl/basic/error.hpp"

extern char ** environ;

namespace syn_dsl::exec
{

namespace fs = std::filesystem;

namespace
{

constexpr std::string_view k_debug_env = "SYN_DEBUG=";

sigset_t interrupt_signals()
{
  sigset_t set;
  sigemptyset(&set);
  sigaddset(&set, SIGINT);
  sigaddset(&set, SIGTERM);
  return set;
}

/// Blocks SIGINT/SIGTERM in the calling thread (and every thread it starts) for its lifetime.
class SignalBlock
{
public:
  SignalBlock()
  {
    const sigset_t set = interrupt_signals();
    ::pthread_sigmask(SIG_BLOCK, &set, &previous_);
  }
  ~SignalBlock() { ::pthread_sigmask(SIG_SETMASK, &previous_, nullptr); }

  SignalBlock(const SignalBlock &) = delete;
  SignalBlock & operator=(const SignalBlock &) = delete;

private:
  sigset_t previous_{};
};

/// Last `limit` bytes written to a stream.
class OutputTail
{
public:
  explicit OutputTail(size_t limit) : limit_(limit) {}

  void append(std::string_view chunk)
  {
    const std::lock_guard<std::mutex> lock(mutex_);
    text_.append(chunk.data(), chunk.size());
    if (text_.size() > limit_) {
      text_.erase(0, text_.size() - limit_);
    }
  }

  [[nodiscard]] std::string str() const
  {
    const std::lock_guard<std::mutex> lock(mutex_);
    return text_;
  }

private:
  size_t limit_;
  mutable std::mutex mutex_;
  std::string text_;
};

void echo_line(std::ostream & os, std::mutex & io_mutex, std::string_view line)
{
  const std::lock_guard<std::mutex> lock(io_mutex);
  os.write(line.data(), static_cast<std::streamsize>(line.size()));
  os.flush();
}

struct WatchState
{
  std::atomic<bool> stop{false};
  std::atomic<bool> interrupted{false};
};

/**
 * Copy `fd` to `os` line by line until EOF, keeping a tail.
 *
 * Once `stop` is set, output still in flight gets `grace` to arrive. A
 * descendant that inherited the pipe does not hold the run open past that.
 */
void drain(
  int fd, std::ostream & os, std::mutex & io_mutex, OutputTail & tail, const WatchState & state,
  std::chrono::milliseconds grace)
{
  using Clock = std::chrono::steady_clock;
  constexpr std::chrono::milliseconds k_tick{100};

  std::string pending;
  char buf[4096];
  std::optional<Clock::time_point> deadline;
  while (true) {
    if (!deadline && state.stop.load()) {
      deadline = Clock::now() + grace;
    }

    std::chrono::milliseconds wait = k_tick;
    if (deadline) {
      const auto now = Clock::now();
      if (now >= *deadline) {
        break;
      }
      const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - now);
      wait = std::min(wait, left);
    }

    pollfd pfd{fd, POLLIN, 0};
    const int ready = ::poll(&pfd, 1, static_cast<int>(wait.count()));
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      break;
    }
    if (ready == 0) {
      continue;
    }

    const ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      break;
    }
    if (n == 0) {
      break;
    }

    const std::string_view chunk(buf, static_cast<size_t>(n));
    tail.append(chunk);
    pending.append(chunk.data(), chunk.size());

    size_t nl = 0;
    while ((nl = pending.find('\n')) != std::string::npos) {
      echo_line(os, io_mutex, std::string_view(pending).substr(0, nl + 1));
      pending.erase(0, nl + 1);
    }
  }

  if (!pending.empty()) {
    pending.push_back('\n');
    echo_line(os, io_mutex, pending);
  }
}

void watch_signals(
  const ExecutorOptions & options, ChildProcess & child, WatchState & state, std::mutex & io_mutex)
{
  const sigset_t set = interrupt_signals();
  const timespec tick{0, 100L * 1000L * 1000L};

  int sig = -1;
  while (!state.stop.load()) {
    sig = ::sigtimedwait(&set, nullptr, &tick);
    if (sig > 0) {
      break;
    }
  }
  if (sig <= 0) {
    return;
  }

  state.interrupted = true;

  // Stop listening: a second signal gets its default action.
  ::pthread_sigmask(SIG_UNBLOCK, &set, nullptr);

  {
    const std::lock_guard<std::mutex> lock(io_mutex);
    fmt::print(
      stderr, "\nReceived {}. The pipeline handles the interrupt itself; waiting up to {} ms.\n",
      ::strsignal(sig), options.shutdown_timeout.count());
    std::fflush(stderr);
  }

  if (!child.wait_for(options.shutdown_timeout, options.poll_interval, &state.stop) &&
      !state.stop.load()) {
    {
      const std::lock_guard<std::mutex> lock(io_mutex);
      fmt::print(stderr, "Pipeline did not stop in time, killing it.\n");
      std::fflush(stderr);
    }
    child.kill();
  }
}

/// Joins the helper threads on every exit path; kills the child first and tells the drains to wind down.
class RunThreads
{
public:
  RunThreads(ChildProcess & child, WatchState & state) : child_(child), state_(state) {}
  ~RunThreads() { join(); }

  RunThreads(const RunThreads &) = delete;
  RunThreads & operator=(const RunThreads &) = delete;

  void add(std::thread t) { threads_.push_back(std::move(t)); }

  void join()
  {
    state_.stop = true;
    child_.kill();
    for (auto & t : threads_) {
      if (t.joinable()) {
        t.join();
      }
    }
  }

private:
  ChildProcess & child_;
  WatchState & state_;
  std::vector<std::thread> threads_;
};

void write_program(const fs::path & path, std::string_view text)
{
  std::error_code ec;
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
      throw ExecutionError(fmt::format(
        "cannot create directory {}: {}", path.parent_path().string(), ec.message()));
    }
  }

  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw ExecutionError(fmt::format("cannot open {} for writing", path.string()));
  }
  out.write(text.data(), static_cast<std::streamsize>(text.size()));
  out.close();
  if (!out) {
    throw ExecutionError(fmt::format("cannot write program to {}", path.string()));
  }
}

std::vector<std::string> child_environment(bool debug)
{
  std::vector<std::string> env;
  for (char ** e = environ; e != nullptr && *e != nullptr; ++e) {
    const std::string_view entry(*e);
    if (entry.substr(0, k_debug_env.size()) == k_debug_env) {
      continue;
    }
    env.emplace_back(entry);
  }
  env.push_back(std::string(k_debug_env) + (debug ? "1" : "0"));
  return env;
}

}  // namespace

ExecutionReport Executor::run(
  std::string_view program_text, bool keep_file, const fs::path & destination)
{
  ExecutionReport report;
  report.script_path = destination.empty() ? options_.script_dir / "syn_script.py" : destination;

  write_program(report.script_path, program_text);

  if (options_.verbose) {
    fmt::print(stderr, "Running {} {}\n", options_.interpreter, report.script_path.string());
  }

  const std::vector<std::string> argv{options_.interpreter, report.script_path.string()};
  const std::vector<std::string> env = child_environment(options_.debug);

  const SignalBlock signal_block;
  std::mutex io_mutex;
  OutputTail out_tail(k_tail_limit);
  OutputTail err_tail(k_tail_limit);
  WatchState state;

  ChildProcess child;
  child.start(argv, env);

  {
    RunThreads threads(child, state);
    threads.add(std::thread(
      drain, child.stdout_fd(), std::ref(std::cout), std::ref(io_mutex), std::ref(out_tail),
      std::cref(state), options_.poll_interval));
    threads.add(std::thread(
      drain, child.stderr_fd(), std::ref(std::cerr), std::ref(io_mutex), std::ref(err_tail),
      std::cref(state), options_.poll_interval));
    threads.add(std::thread(
      watch_signals, std::cref(options_), std::ref(child), std::ref(state), std::ref(io_mutex)));

    report.status = child.wait();
    threads.join();
  }

  report.interrupted = state.interrupted.load();
  report.stdout_tail = out_tail.str();
  report.stderr_tail = err_tail.str();

  if (report.status.terminated_by(SIGINT) || report.status.terminated_by(SIGTERM)) {
    report.interrupted = true;
    if (options_.verbose) {
      fmt::print(stderr, "Pipeline interrupted by user.\n");
    }
  } else if (!report.status.success()) {
    throw ExecutionError(
      fmt::format("pipeline program {} ({})", report.status.describe(), report.script_path.string()),
      report.stderr_tail, report.stdout_tail);
  }

  if (!keep_file) {
    std::error_code ec;
    fs::remove(report.script_path, ec);
    if (ec) {
      throw ExecutionError(
        fmt::format("cannot remove {}: {}", report.script_path.string(), ec.message()));
    }
  }

  return report;
}

}  // namespace syn_dsl::exec
