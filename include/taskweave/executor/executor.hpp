#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace taskweave {

enum class ExecutorType : std::uint8_t {
  Process,
  Noop,
};

[[nodiscard]] constexpr auto to_string_view(ExecutorType type) noexcept
    -> std::string_view {
  switch (type) {
    case ExecutorType::Process:
      return "process";
    case ExecutorType::Noop:
      return "noop";
  }
  return "unknown";
}

// Unknown names map to Process.
[[nodiscard]] constexpr auto parse_executor_type(std::string_view name) noexcept
    -> ExecutorType {
  return name == "noop" ? ExecutorType::Noop : ExecutorType::Process;
}

struct ProcessExecutorConfig {
  std::vector<std::string> argv;
  std::string working_dir;
  std::vector<std::pair<std::string, std::string>> env;
  std::string stdin_data;
  // Zero means no timeout.
  std::chrono::seconds timeout{std::chrono::seconds(0)};
};

struct NoopExecutorConfig {};

using ExecutorConfig = std::variant<ProcessExecutorConfig, NoopExecutorConfig>;

struct ExecutorResult {
  int exit_code{0};
  std::string stdout_output;
  std::string stderr_output;
  std::string error;
  bool timed_out{false};
  bool cancelled{false};

  [[nodiscard]] auto succeeded() const noexcept -> bool {
    return exit_code == 0 && error.empty() && !timed_out && !cancelled;
  }
};

using ExecutorCallback = std::move_only_function<void(
    const std::string& instance_id, ExecutorResult result)>;

// Runs one unit of work per instance id and reports exactly once through the
// callback, possibly from another thread.
class IExecutor {
public:
  virtual ~IExecutor() = default;

  virtual auto execute(const std::string& instance_id,
                       const ExecutorConfig& config, ExecutorCallback callback)
      -> void = 0;

  // Unknown or finished ids are ignored.
  virtual auto cancel(std::string_view instance_id) -> void = 0;
};

inline constexpr std::chrono::milliseconds DEFAULT_KILL_GRACE{2000};

[[nodiscard]] auto create_process_executor(
    std::chrono::milliseconds kill_grace = DEFAULT_KILL_GRACE)
    -> std::unique_ptr<IExecutor>;

[[nodiscard]] auto create_noop_executor() -> std::unique_ptr<IExecutor>;

}  // namespace taskweave
