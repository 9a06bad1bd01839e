#pragma once

#include "taskweave/config/config.hpp"
#include "taskweave/core/error.hpp"
#include "taskweave/executor/executor.hpp"
#include "taskweave/scheduler/task.hpp"
#include "taskweave/util/id.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <variant>
#include <vector>

namespace taskweave {

// Bounded-concurrency task scheduler. Tasks are dispatched in submission
// order once their dependencies have completed; each attempt is handed to an
// IExecutor. All bookkeeping happens under one mutex inside a dispatch or
// completion step; executor launches and observer notifications run after the
// mutex is released, so both may call back into the engine.
//
// The executor must outlive the engine and must report every launched attempt
// (including cancelled ones); the destructor waits for those reports. A
// cancelled attempt keeps its slot until reported. cancel() may reach the
// executor twice for one attempt.
class Engine {
public:
  using OutcomeCallback = std::move_only_function<void(const TaskOutcome&)>;
  using CompleteHandler = std::function<void(const TaskResult&)>;
  using FailedHandler = std::function<void(const TaskError&)>;
  using BatchOutcome = std::expected<std::vector<TaskResult>, TaskError>;

  Engine(IExecutor& executor, EngineConfig config);
  ~Engine();

  Engine(const Engine&) = delete;
  auto operator=(const Engine&) -> Engine& = delete;

  // Error::AlreadyExists for a duplicate id, Error::InvalidArgument for an
  // empty one, Error::ShuttingDown after shutdown().
  [[nodiscard]] auto submit_task(Task task) -> Result<TaskId>;
  // All or nothing; ids come back in input order.
  [[nodiscard]] auto submit_tasks(std::vector<Task> tasks)
      -> Result<std::vector<TaskId>>;

  // Resolves once the task reaches a terminal state. May be called before the
  // task is submitted. After the terminal state the callback form runs
  // synchronously on the calling thread.
  [[nodiscard]] auto wait_for_task(const TaskId& id)
      -> std::future<TaskOutcome>;
  auto wait_for_task(const TaskId& id, OutcomeCallback callback) -> void;

  // Results in input order. Rejects with the first failure observed without
  // waiting for the remaining tasks.
  [[nodiscard]] auto wait_for_tasks(const std::vector<TaskId>& ids)
      -> std::future<BatchOutcome>;

  // Cancellation wins over a completion that has not been handled yet.
  [[nodiscard]] auto cancel_task(const TaskId& id) -> Result<void>;

  [[nodiscard]] auto get_task_status(const TaskId& id) const
      -> std::optional<TaskStatus>;
  [[nodiscard]] auto get_metrics() const -> EngineMetrics;

  auto on_task_complete(CompleteHandler handler) -> void;
  auto on_task_failed(FailedHandler handler) -> void;

  // Cancels everything queued or running, rejects pending waiters and waits
  // for outstanding executor reports. Idempotent.
  auto shutdown() -> void;

private:
  struct TaskEntry {
    Task task;
    TaskState state{TaskState::Queued};
    std::uint64_t arrival{0};
    std::uint64_t attempt_seq{0};
    int attempts{0};
    int max_retries{0};
    TimePoint started_at{};
    std::chrono::steady_clock::time_point attempt_start{};
    std::optional<TaskOutcome> outcome;
    std::vector<OutcomeCallback> observers;
  };

  struct LaunchAttempt {
    TaskId task_id;
    std::uint64_t seq;
    std::string instance_id;
    ExecutorConfig config;
  };

  struct KillAttempt {
    std::string instance_id;
  };

  struct DeliverOutcome {
    std::vector<OutcomeCallback> observers;
    TaskOutcome outcome;
    bool run_hooks{true};
  };

  using Effect = std::variant<LaunchAttempt, KillAttempt, DeliverOutcome>;
  using Effects = std::vector<Effect>;

  auto dispatch_locked(Effects& effects) -> void;
  auto fail_blocked_dependents_locked(Effects& effects) -> void;
  [[nodiscard]] auto dependencies_met_locked(const TaskEntry& entry) const
      -> bool;
  [[nodiscard]] auto failed_dependency_locked(const TaskEntry& entry) const
      -> const TaskId*;
  [[nodiscard]] auto queue_position_locked(const TaskEntry& entry) const
      -> std::size_t;
  auto start_attempt_locked(TaskEntry& entry, Effects& effects) -> void;
  auto finish_locked(TaskEntry& entry, TaskState state, TaskOutcome outcome,
                     Effects& effects, bool run_hooks = true) -> void;
  auto cancel_locked(TaskEntry& entry, Error reason, Effects& effects) -> void;
  auto enqueue_locked(Task task) -> void;

  [[nodiscard]] auto attempt_current_locked(const TaskId& id,
                                            std::uint64_t seq) const -> bool;
  auto on_attempt_finished(const TaskId& id, std::uint64_t seq,
                           ExecutorResult result) -> void;

  auto run_effects(Effects effects) -> void;
  auto handle_effect(LaunchAttempt& e) -> void;
  auto handle_effect(KillAttempt& e) -> void;
  auto handle_effect(DeliverOutcome& e) -> void;

  IExecutor& executor_;
  EngineConfig config_;

  mutable std::mutex mutex_;
  std::condition_variable idle_;
  std::unordered_map<TaskId, TaskEntry> tasks_;
  // arrival sequence -> task, in dispatch order
  std::map<std::uint64_t, TaskId> queue_;
  std::unordered_map<TaskId, std::vector<OutcomeCallback>> early_waiters_;
  std::uint64_t next_arrival_{0};
  std::uint64_t next_attempt_seq_{0};
  std::size_t running_{0};
  // Launched attempts not yet reported, cancelled ones included. Gates
  // dispatch so a killed process still occupies its slot until it exits.
  std::size_t slots_held_{0};
  std::size_t in_flight_{0};
  bool shutting_down_{false};

  std::size_t completed_{0};
  std::size_t failed_{0};
  std::size_t cancelled_{0};
  std::size_t retried_{0};
  std::size_t spawned_{0};
  std::size_t finished_attempts_{0};
  std::chrono::milliseconds total_attempt_time_{0};
  std::chrono::steady_clock::time_point started_{
      std::chrono::steady_clock::now()};

  mutable std::mutex hooks_mutex_;
  std::vector<CompleteHandler> complete_handlers_;
  std::vector<FailedHandler> failed_handlers_;
};

}  // namespace taskweave
