#include "taskweave/scheduler/engine.hpp"

#include "taskweave/executor/config_builder.hpp"
#include "taskweave/util/log.hpp"

#include <algorithm>
#include <exception>
#include <iterator>
#include <unordered_set>
#include <utility>

namespace taskweave {

namespace {

inline constexpr std::size_t MAX_ERROR_DETAIL = 512;

auto attempt_instance_id(const TaskId& id, std::uint64_t seq) -> std::string {
  return std::format("{}#{}", id, seq);
}

auto describe_failure(const ExecutorResult& result) -> std::string {
  std::string message = result.error.empty()
                            ? std::format("exit code {}", result.exit_code)
                            : result.error;
  if (!result.stderr_output.empty()) {
    std::string_view detail{result.stderr_output};
    if (detail.size() > MAX_ERROR_DETAIL) {
      detail = detail.substr(detail.size() - MAX_ERROR_DETAIL);
    }
    message += ": ";
    message += detail;
  }
  return message;
}

auto since(TimePoint start, TimePoint end) -> std::chrono::milliseconds {
  return std::chrono::duration_cast<std::chrono::milliseconds>(end - start);
}

}  // namespace

Engine::Engine(IExecutor& executor, EngineConfig config)
    : executor_{executor}, config_{std::move(config)} {
  log::info("Engine started (max_concurrent={})", config_.max_concurrent);
}

Engine::~Engine() {
  shutdown();
}

auto Engine::submit_task(Task task) -> Result<TaskId> {
  Effects effects;
  TaskId id = task.id;
  {
    std::lock_guard lock(mutex_);
    if (shutting_down_) {
      return fail(Error::ShuttingDown);
    }
    if (id.empty()) {
      return fail(Error::InvalidArgument);
    }
    if (tasks_.contains(id)) {
      log::warn("Rejecting duplicate task id {}", id);
      return fail(Error::AlreadyExists);
    }
    enqueue_locked(std::move(task));
    dispatch_locked(effects);
  }
  run_effects(std::move(effects));
  return ok(std::move(id));
}

auto Engine::submit_tasks(std::vector<Task> tasks)
    -> Result<std::vector<TaskId>> {
  Effects effects;
  std::vector<TaskId> ids;
  ids.reserve(tasks.size());
  {
    std::lock_guard lock(mutex_);
    if (shutting_down_) {
      return fail(Error::ShuttingDown);
    }
    std::unordered_set<TaskId> seen;
    for (const auto& task : tasks) {
      if (task.id.empty()) {
        return fail(Error::InvalidArgument);
      }
      if (tasks_.contains(task.id) || !seen.insert(task.id).second) {
        log::warn("Rejecting batch with duplicate task id {}", task.id);
        return fail(Error::AlreadyExists);
      }
    }
    for (auto& task : tasks) {
      ids.push_back(task.id);
      enqueue_locked(std::move(task));
    }
    dispatch_locked(effects);
  }
  run_effects(std::move(effects));
  return ok(std::move(ids));
}

auto Engine::wait_for_task(const TaskId& id) -> std::future<TaskOutcome> {
  std::promise<TaskOutcome> promise;
  auto future = promise.get_future();
  wait_for_task(id, [p = std::move(promise)](const TaskOutcome& outcome) mutable {
    p.set_value(outcome);
  });
  return future;
}

auto Engine::wait_for_task(const TaskId& id, OutcomeCallback callback) -> void {
  std::optional<TaskOutcome> ready;
  {
    std::lock_guard lock(mutex_);
    if (auto it = tasks_.find(id); it != tasks_.end()) {
      if (it->second.outcome) {
        ready = *it->second.outcome;
      } else {
        it->second.observers.push_back(std::move(callback));
      }
    } else if (shutting_down_) {
      ready = std::unexpected(TaskError{id, make_error_code(Error::ShuttingDown),
                                        "engine is shutting down", 0, 0});
    } else {
      early_waiters_[id].push_back(std::move(callback));
    }
  }
  if (ready) {
    callback(*ready);
  }
}

auto Engine::wait_for_tasks(const std::vector<TaskId>& ids)
    -> std::future<BatchOutcome> {
  struct Batch {
    std::mutex mutex;
    std::promise<BatchOutcome> promise;
    std::vector<std::optional<TaskResult>> results;
    std::size_t remaining{0};
    bool done{false};
  };

  auto batch = std::make_shared<Batch>();
  auto future = batch->promise.get_future();
  if (ids.empty()) {
    batch->promise.set_value(std::vector<TaskResult>{});
    return future;
  }
  batch->results.resize(ids.size());
  batch->remaining = ids.size();

  for (std::size_t i = 0; i < ids.size(); ++i) {
    wait_for_task(ids[i], [batch, i](const TaskOutcome& outcome) {
      std::lock_guard lock(batch->mutex);
      if (batch->done) {
        return;
      }
      if (!outcome) {
        batch->done = true;
        batch->promise.set_value(std::unexpected(outcome.error()));
        return;
      }
      batch->results[i] = *outcome;
      if (--batch->remaining == 0) {
        batch->done = true;
        std::vector<TaskResult> results;
        results.reserve(batch->results.size());
        for (auto& r : batch->results) {
          results.push_back(std::move(*r));
        }
        batch->promise.set_value(std::move(results));
      }
    });
  }
  return future;
}

auto Engine::cancel_task(const TaskId& id) -> Result<void> {
  Effects effects;
  {
    std::lock_guard lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) {
      return fail(Error::NotFound);
    }
    if (is_terminal(it->second.state)) {
      return fail(Error::InvalidState);
    }
    cancel_locked(it->second, Error::Cancelled, effects);
    dispatch_locked(effects);
  }
  run_effects(std::move(effects));
  return ok();
}

auto Engine::get_task_status(const TaskId& id) const
    -> std::optional<TaskStatus> {
  std::lock_guard lock(mutex_);
  auto it = tasks_.find(id);
  if (it == tasks_.end()) {
    return std::nullopt;
  }
  const auto& entry = it->second;
  TaskStatus status;
  status.state = entry.state;
  status.attempts = entry.attempts;
  if (entry.state == TaskState::Queued) {
    status.position = queue_position_locked(entry);
  }
  if (entry.outcome && entry.outcome->has_value()) {
    status.result = entry.outcome->value();
  }
  return status;
}

auto Engine::get_metrics() const -> EngineMetrics {
  std::lock_guard lock(mutex_);
  EngineMetrics m;
  m.max_concurrent = config_.max_concurrent;
  m.currently_running = running_;
  m.available_slots = config_.max_concurrent > slots_held_
                          ? config_.max_concurrent - slots_held_
                          : 0;
  m.queued_tasks = queue_.size();
  m.completed_tasks = completed_;
  m.failed_tasks = failed_;
  m.cancelled_tasks = cancelled_;
  m.retried_attempts = retried_;
  m.total_processes_spawned = spawned_;
  m.active_processes = in_flight_;
  if (finished_attempts_ > 0) {
    m.average_duration = total_attempt_time_ /
                         static_cast<std::int64_t>(finished_attempts_);
  }
  auto finished = completed_ + failed_;
  if (finished > 0) {
    m.success_rate =
        static_cast<double>(completed_) / static_cast<double>(finished);
  }
  std::chrono::duration<double, std::ratio<60>> elapsed =
      std::chrono::steady_clock::now() - started_;
  if (elapsed.count() > 0) {
    m.throughput = static_cast<double>(finished) / elapsed.count();
  }
  return m;
}

auto Engine::on_task_complete(CompleteHandler handler) -> void {
  std::lock_guard lock(hooks_mutex_);
  complete_handlers_.push_back(std::move(handler));
}

auto Engine::on_task_failed(FailedHandler handler) -> void {
  std::lock_guard lock(hooks_mutex_);
  failed_handlers_.push_back(std::move(handler));
}

auto Engine::shutdown() -> void {
  Effects effects;
  {
    std::lock_guard lock(mutex_);
    if (!shutting_down_) {
      shutting_down_ = true;
      log::info("Engine shutting down");
      for (auto& [id, entry] : tasks_) {
        if (!is_terminal(entry.state)) {
          cancel_locked(entry, Error::ShuttingDown, effects);
        }
      }
      for (auto& [id, observers] : early_waiters_) {
        effects.emplace_back(DeliverOutcome{
            std::move(observers),
            std::unexpected(TaskError{id, make_error_code(Error::ShuttingDown),
                                      "engine is shutting down", 0, 0}),
            false});
      }
      early_waiters_.clear();
    }
  }
  run_effects(std::move(effects));

  std::unique_lock lock(mutex_);
  idle_.wait(lock, [this] { return in_flight_ == 0; });
}

auto Engine::enqueue_locked(Task task) -> void {
  TaskEntry entry;
  entry.arrival = next_arrival_++;
  entry.max_retries =
      std::max(0, task.config.max_retries.value_or(config_.default_max_retries));
  TaskId id = task.id;
  entry.task = std::move(task);
  if (auto it = early_waiters_.find(id); it != early_waiters_.end()) {
    entry.observers = std::move(it->second);
    early_waiters_.erase(it);
  }
  queue_.emplace(entry.arrival, id);
  log::info("Task {} queued at position {}", id, queue_.size() - 1);
  tasks_.emplace(std::move(id), std::move(entry));
}

auto Engine::dispatch_locked(Effects& effects) -> void {
  fail_blocked_dependents_locked(effects);

  while (slots_held_ < config_.max_concurrent) {
    TaskEntry* next = nullptr;
    for (const auto& [arrival, id] : queue_) {
      auto& entry = tasks_.at(id);
      if (dependencies_met_locked(entry)) {
        next = &entry;
        break;
      }
    }
    if (next == nullptr) {
      break;
    }
    start_attempt_locked(*next, effects);
  }
}

auto Engine::fail_blocked_dependents_locked(Effects& effects) -> void {
  bool changed = true;
  while (changed) {
    changed = false;
    for (auto it = queue_.begin(); it != queue_.end();) {
      auto& entry = tasks_.at(it->second);
      const TaskId* dep = failed_dependency_locked(entry);
      if (dep == nullptr) {
        ++it;
        continue;
      }
      TaskError err{entry.task.id, make_error_code(Error::DependencyFailed),
                    std::format("dependency {} did not complete", *dep), 0,
                    entry.attempts};
      log::warn("Task {} failed: {}", entry.task.id, err.message);
      it = queue_.erase(it);
      finish_locked(entry, TaskState::Failed, std::unexpected(std::move(err)),
                    effects);
      changed = true;
    }
  }
}

auto Engine::dependencies_met_locked(const TaskEntry& entry) const -> bool {
  return std::ranges::all_of(entry.task.dependencies, [this](const TaskId& dep) {
    auto it = tasks_.find(dep);
    return it != tasks_.end() && it->second.state == TaskState::Completed;
  });
}

auto Engine::failed_dependency_locked(const TaskEntry& entry) const
    -> const TaskId* {
  for (const auto& dep : entry.task.dependencies) {
    auto it = tasks_.find(dep);
    if (it != tasks_.end() && (it->second.state == TaskState::Failed ||
                               it->second.state == TaskState::Cancelled)) {
      return &it->first;
    }
  }
  return nullptr;
}

auto Engine::queue_position_locked(const TaskEntry& entry) const
    -> std::size_t {
  return static_cast<std::size_t>(
      std::distance(queue_.begin(), queue_.find(entry.arrival)));
}

auto Engine::start_attempt_locked(TaskEntry& entry, Effects& effects) -> void {
  queue_.erase(entry.arrival);
  entry.state = TaskState::Running;
  ++entry.attempts;
  entry.attempt_seq = ++next_attempt_seq_;
  if (entry.attempts == 1) {
    entry.started_at = std::chrono::system_clock::now();
  }
  entry.attempt_start = std::chrono::steady_clock::now();
  ++running_;
  ++slots_held_;
  ++in_flight_;
  ++spawned_;

  log::info("Starting task {} (attempt {}/{})", entry.task.id, entry.attempts,
            entry.max_retries + 1);
  effects.emplace_back(LaunchAttempt{
      entry.task.id, entry.attempt_seq,
      attempt_instance_id(entry.task.id, entry.attempt_seq),
      build_executor_config(entry.task, config_)});
}

auto Engine::finish_locked(TaskEntry& entry, TaskState state,
                           TaskOutcome outcome, Effects& effects,
                           bool run_hooks) -> void {
  entry.state = state;
  entry.outcome = outcome;
  switch (state) {
    case TaskState::Completed:
      ++completed_;
      break;
    case TaskState::Failed:
      ++failed_;
      break;
    case TaskState::Cancelled:
      ++cancelled_;
      break;
    default:
      break;
  }
  effects.emplace_back(DeliverOutcome{std::exchange(entry.observers, {}),
                                      std::move(outcome), run_hooks});
}

auto Engine::cancel_locked(TaskEntry& entry, Error reason, Effects& effects)
    -> void {
  if (entry.state == TaskState::Queued) {
    queue_.erase(entry.arrival);
  } else if (entry.state == TaskState::Running) {
    // The slot stays held until the executor reports the killed attempt.
    --running_;
    effects.emplace_back(
        KillAttempt{attempt_instance_id(entry.task.id, entry.attempt_seq)});
    // A report for the old attempt no longer matches and is dropped.
    entry.attempt_seq = ++next_attempt_seq_;
  }
  log::info("Task {} cancelled", entry.task.id);
  TaskError err{entry.task.id, make_error_code(reason),
                reason == Error::ShuttingDown ? "engine is shutting down"
                                              : "task cancelled",
                0, entry.attempts};
  finish_locked(entry, TaskState::Cancelled, std::unexpected(std::move(err)),
                effects, false);
}

auto Engine::on_attempt_finished(const TaskId& id, std::uint64_t seq,
                                 ExecutorResult result) -> void {
  Effects effects;
  {
    std::lock_guard lock(mutex_);
    --slots_held_;
    if (!attempt_current_locked(id, seq)) {
      log::debug("Discarding stale report for task {} (attempt seq {})", id,
                 seq);
      dispatch_locked(effects);
    } else {
      auto& entry = tasks_.find(id)->second;
      --running_;
      ++finished_attempts_;
      total_attempt_time_ += std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - entry.attempt_start);

      auto now = std::chrono::system_clock::now();
      if (result.succeeded()) {
        TaskResult r;
        r.task_id = id;
        r.success = true;
        r.output = std::move(result.stdout_output);
        r.completed_at = now;
        r.exit_code = result.exit_code;
        r.attempts = entry.attempts;
        r.started_at = entry.started_at;
        r.duration = since(entry.started_at, now);
        log::info("Task {} completed in {}ms", id, r.duration.count());
        finish_locked(entry, TaskState::Completed, std::move(r), effects);
      } else if (entry.attempts <= entry.max_retries) {
        ++retried_;
        log::warn("Task {} attempt {} failed ({}), retrying", id,
                  entry.attempts, describe_failure(result));
        entry.state = TaskState::Queued;
        queue_.emplace(entry.arrival, id);
      } else {
        TaskError err{id,
                      make_error_code(result.timed_out ? Error::Timeout
                                                       : Error::TaskFailed),
                      describe_failure(result), result.exit_code,
                      entry.attempts};
        log::error("Task {} failed after {} attempt(s): {}", id, entry.attempts,
                   err.message);
        finish_locked(entry, TaskState::Failed, std::unexpected(std::move(err)),
                      effects);
      }
      dispatch_locked(effects);
    }
  }
  run_effects(std::move(effects));

  std::lock_guard lock(mutex_);
  --in_flight_;
  idle_.notify_all();
}

auto Engine::attempt_current_locked(const TaskId& id, std::uint64_t seq) const
    -> bool {
  auto it = tasks_.find(id);
  return it != tasks_.end() && it->second.attempt_seq == seq &&
         it->second.state == TaskState::Running;
}

auto Engine::run_effects(Effects effects) -> void {
  for (auto& effect : effects) {
    std::visit([this](auto& e) { handle_effect(e); }, effect);
  }
}

auto Engine::handle_effect(LaunchAttempt& e) -> void {
  bool cancelled_before_launch = false;
  {
    std::lock_guard lock(mutex_);
    cancelled_before_launch = !attempt_current_locked(e.task_id, e.seq);
  }
  if (cancelled_before_launch) {
    log::debug("Attempt {} cancelled before launch", e.instance_id);
    ExecutorResult result;
    result.exit_code = -1;
    result.cancelled = true;
    on_attempt_finished(e.task_id, e.seq, std::move(result));
    return;
  }

  try {
    executor_.execute(e.instance_id, e.config,
                      [this, id = e.task_id, seq = e.seq](
                          const std::string&, ExecutorResult result) {
                        on_attempt_finished(id, seq, std::move(result));
                      });
  } catch (const std::exception& ex) {
    log::error("Executor rejected {}: {}", e.instance_id, ex.what());
    ExecutorResult result;
    result.exit_code = -1;
    result.error = ex.what();
    on_attempt_finished(e.task_id, e.seq, std::move(result));
    return;
  }

  // A cancel that raced with execute() may have reached the executor before
  // the attempt was registered there; repeat it now that it is.
  bool cancelled_during_launch = false;
  {
    std::lock_guard lock(mutex_);
    if (auto it = tasks_.find(e.task_id); it != tasks_.end()) {
      cancelled_during_launch = it->second.state == TaskState::Cancelled &&
                                it->second.attempt_seq != e.seq;
    }
  }
  if (cancelled_during_launch) {
    executor_.cancel(e.instance_id);
  }
}

auto Engine::handle_effect(KillAttempt& e) -> void {
  executor_.cancel(e.instance_id);
}

auto Engine::handle_effect(DeliverOutcome& e) -> void {
  for (auto& observer : e.observers) {
    try {
      observer(e.outcome);
    } catch (const std::exception& ex) {
      log::error("Task observer threw: {}", ex.what());
    }
  }
  if (!e.run_hooks) {
    return;
  }

  std::vector<CompleteHandler> on_complete;
  std::vector<FailedHandler> on_failed;
  {
    std::lock_guard lock(hooks_mutex_);
    if (e.outcome) {
      on_complete = complete_handlers_;
    } else {
      on_failed = failed_handlers_;
    }
  }
  try {
    for (auto& handler : on_complete) {
      handler(*e.outcome);
    }
    for (auto& handler : on_failed) {
      handler(e.outcome.error());
    }
  } catch (const std::exception& ex) {
    log::error("Task lifecycle hook threw: {}", ex.what());
  }
}

}  // namespace taskweave
