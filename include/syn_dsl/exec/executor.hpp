// syn_dsl/exec/executor.hpp - Run a generated pipeline program under supervision
#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

#include "syn_dsl/exec/child_process.hpp"

namespace syn_dsl::exec
{

struct ExecutorOptions
{
  std::string interpreter = "python3";
  std::filesystem::path script_dir = "output";  ///< default location of the program file
  bool debug = false;                           ///< exported to the program as SYN_DEBUG
  std::chrono::milliseconds shutdown_timeout{30000};
  std::chrono::milliseconds poll_interval{500};  ///< also the output grace period after exit
  bool verbose = false;
};

struct ExecutionReport
{
  ExitStatus status;
  bool interrupted = false;  ///< SIGINT/SIGTERM reached this process during the run
  std::filesystem::path script_path;
  std::string stdout_tail;
  std::string stderr_tail;
};

/**
 * Writes program text to disk and runs it with the configured interpreter.
 *
 * The child's output is echoed line by line to std::cout / std::cerr. While
 * the child runs, SIGINT and SIGTERM sent to this process are caught by a
 * watcher thread: the first one is not forwarded (the child, being in the
 * same process group, handles its own), the watcher then gives the child
 * `shutdown_timeout` to finish and kills it afterwards. A second signal
 * terminates this process. Once the child is reaped its pipes are read for
 * at most `poll_interval` more, so descendants that inherited them do not
 * keep the run open.
 */
class Executor
{
public:
  /// Bytes of each output stream kept for error reports.
  static constexpr size_t k_tail_limit = size_t{64} * size_t{1024};

  explicit Executor(ExecutorOptions options = {}) : options_(std::move(options)) {}

  [[nodiscard]] const ExecutorOptions & options() const noexcept { return options_; }

  /**
   * Run `program_text`.
   *
   * @param keep_file keep the program file after a successful run
   * @param destination where to write the program; empty means
   *        `<script_dir>/syn_script.py`
   * @throws ExecutionError when the file cannot be written or removed, the
   *         interpreter cannot be launched, or the program fails for any
   *         reason other than SIGINT/SIGTERM
   */
  ExecutionReport run(
    std::string_view program_text, bool keep_file, const std::filesystem::path & destination = {});

private:
  ExecutorOptions options_;
};

}  // namespace syn_dsl::exec
