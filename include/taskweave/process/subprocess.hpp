#pragma once

#include "taskweave/core/error.hpp"

#include <sys/types.h>

#include <chrono>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace taskweave {

inline constexpr std::size_t MAX_OUTPUT_SIZE = 10 * 1024 * 1024;

struct ProcessOptions {
  std::string working_dir;
  // Added to (or overriding) the parent environment.
  std::vector<std::pair<std::string, std::string>> env;
  std::string stdin_data;
  // Zero means no timeout.
  std::chrono::milliseconds timeout{0};
  // Per-stream capture limit in bytes. Zero captures everything.
  std::size_t max_output{MAX_OUTPUT_SIZE};
  // Called with the child pid (also its process group id) right after spawn.
  std::function<void(pid_t)> on_spawn;
};

struct ProcessResult {
  int exit_code{-1};
  std::string stdout_output;
  std::string stderr_output;
  bool timed_out{false};
  // Set when either stream went past ProcessOptions::max_output.
  bool truncated{false};
};

// Runs argv[0] (PATH lookup) with argv as its argument vector, never through a
// shell. Blocks until the child exits. Exit code is 128+signal for a signalled
// child. The timeout covers reading output and reaping the child, and kills
// the whole process group. Returns Error::SpawnFailed when the program cannot
// be started at all.
[[nodiscard]] auto run_process(const std::vector<std::string>& argv,
                               const ProcessOptions& options = {})
    -> Result<ProcessResult>;

[[nodiscard]] auto exit_code_from_status(int status) noexcept -> int;

}  // namespace taskweave
