#pragma once

#include "taskweave/util/id.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace taskweave {

using TimePoint = std::chrono::system_clock::time_point;

enum class TaskState : std::uint8_t {
  Queued,
  Running,
  Completed,
  Failed,
  Cancelled,
};

[[nodiscard]] constexpr auto to_string_view(TaskState state) noexcept
    -> std::string_view {
  switch (state) {
    case TaskState::Queued:
      return "queued";
    case TaskState::Running:
      return "running";
    case TaskState::Completed:
      return "completed";
    case TaskState::Failed:
      return "failed";
    case TaskState::Cancelled:
      return "cancelled";
  }
  return "unknown";
}

[[nodiscard]] constexpr auto is_terminal(TaskState state) noexcept -> bool {
  return state == TaskState::Completed || state == TaskState::Failed ||
         state == TaskState::Cancelled;
}

struct TaskConfig {
  // Additional attempts after the first. Unset: engine default.
  std::optional<int> max_retries;
  // Unset: engine default. Zero: no timeout.
  std::optional<std::chrono::seconds> timeout;
  std::vector<std::pair<std::string, std::string>> env;
  // Overrides the engine's agent command when non-empty.
  std::vector<std::string> command;
};

struct Task {
  TaskId id;
  std::string type;
  std::string prompt;
  std::string work_dir;
  // Carried for callers; dispatch order is FIFO only.
  int priority{0};
  std::vector<TaskId> dependencies;
  TaskConfig config;
  TimePoint created_at{std::chrono::system_clock::now()};
};

struct TaskResult {
  TaskId task_id;
  bool success{false};
  std::string output;
  TimePoint completed_at{};
  std::optional<std::string> error;
  int exit_code{0};
  int attempts{0};
  TimePoint started_at{};
  std::chrono::milliseconds duration{0};
};

// Why a waiter was rejected.
struct TaskError {
  TaskId task_id;
  std::error_code code;
  std::string message;
  int exit_code{0};
  int attempts{0};
};

using TaskOutcome = std::expected<TaskResult, TaskError>;

struct TaskStatus {
  TaskState state{TaskState::Queued};
  // Set only while queued: 0-based index in dispatch order.
  std::optional<std::size_t> position;
  int attempts{0};
  std::optional<TaskResult> result;
};

struct EngineMetrics {
  std::size_t max_concurrent{0};
  std::size_t currently_running{0};
  std::size_t available_slots{0};
  std::size_t queued_tasks{0};
  std::size_t completed_tasks{0};
  std::size_t failed_tasks{0};
  std::size_t cancelled_tasks{0};
  std::size_t retried_attempts{0};
  // Mean wall time of finished attempts.
  std::chrono::milliseconds average_duration{0};
  // completed / (completed + failed), 1.0 until something finishes.
  double success_rate{1.0};
  // Finished tasks per minute since the engine started.
  double throughput{0.0};
  std::size_t total_processes_spawned{0};
  std::size_t active_processes{0};
};

}  // namespace taskweave
