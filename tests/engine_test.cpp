#include "taskweave/scheduler/engine.hpp"

#include "test_utils.hpp"

#include <algorithm>
#include <chrono>
#include <format>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include "gtest/gtest.h"

using namespace taskweave;
using namespace taskweave::test;
using namespace std::chrono_literals;

namespace {

// Holds every launched attempt until the test completes it.
class FakeExecutor : public IExecutor {
public:
  auto execute(const std::string& instance_id, const ExecutorConfig& config,
               ExecutorCallback callback) -> void override {
    std::function<void(const std::string&)> hook;
    {
      std::lock_guard lock(mutex_);
      hook = on_execute_;
    }
    if (hook) {
      hook(instance_id);
    }
    std::lock_guard lock(mutex_);
    launched_.push_back(instance_id);
    configs_.push_back(config);
    pending_.emplace(instance_id, std::move(callback));
  }

  auto cancel(std::string_view instance_id) -> void override {
    ExecutorCallback callback;
    {
      std::lock_guard lock(mutex_);
      cancelled_.emplace_back(instance_id);
      if (!report_on_cancel_) {
        return;
      }
      auto it = pending_.find(std::string(instance_id));
      if (it == pending_.end()) {
        return;
      }
      callback = std::move(it->second);
      pending_.erase(it);
    }
    ExecutorResult result;
    result.exit_code = -1;
    result.cancelled = true;
    callback(std::string(instance_id), std::move(result));
  }

  // Reports the running attempt of `task`. False when none is pending.
  auto finish(std::string_view task, ExecutorResult result) -> bool {
    ExecutorCallback callback;
    std::string instance;
    {
      std::lock_guard lock(mutex_);
      auto prefix = std::string(task) + "#";
      auto it = std::ranges::find_if(pending_, [&](const auto& entry) {
        return entry.first.starts_with(prefix);
      });
      if (it == pending_.end()) {
        return false;
      }
      instance = it->first;
      callback = std::move(it->second);
      pending_.erase(it);
    }
    callback(instance, std::move(result));
    return true;
  }

  auto succeed(std::string_view task, std::string output = {}) -> bool {
    ExecutorResult result;
    result.stdout_output = std::move(output);
    return finish(task, std::move(result));
  }

  auto fail_with(std::string_view task, int exit_code,
                 std::string stderr_output = {}) -> bool {
    ExecutorResult result;
    result.exit_code = exit_code;
    result.stderr_output = std::move(stderr_output);
    return finish(task, std::move(result));
  }

  // Task ids of launched attempts, in launch order.
  auto launched_tasks() const -> std::vector<std::string> {
    std::lock_guard lock(mutex_);
    std::vector<std::string> out;
    for (const auto& instance : launched_) {
      out.push_back(instance.substr(0, instance.find('#')));
    }
    return out;
  }

  auto launch_count() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return launched_.size();
  }

  auto pending_count() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return pending_.size();
  }

  auto cancelled() const -> std::vector<std::string> {
    std::lock_guard lock(mutex_);
    return cancelled_;
  }

  auto config_at(std::size_t i) const -> ExecutorConfig {
    std::lock_guard lock(mutex_);
    return configs_.at(i);
  }

  auto set_report_on_cancel(bool value) -> void {
    std::lock_guard lock(mutex_);
    report_on_cancel_ = value;
  }

  // Runs at the start of execute(), before the attempt is registered.
  auto set_on_execute(std::function<void(const std::string&)> hook) -> void {
    std::lock_guard lock(mutex_);
    on_execute_ = std::move(hook);
  }

private:
  mutable std::mutex mutex_;
  std::vector<std::string> launched_;
  std::vector<ExecutorConfig> configs_;
  std::map<std::string, ExecutorCallback> pending_;
  std::vector<std::string> cancelled_;
  bool report_on_cancel_{true};
  std::function<void(const std::string&)> on_execute_;
};

auto make_task(const char* id, std::vector<TaskId> deps = {}) -> Task {
  Task t;
  t.id = task_id(id);
  t.prompt = std::string("prompt for ") + id;
  t.dependencies = std::move(deps);
  return t;
}

auto make_task_with_retries(const char* id, int retries) -> Task {
  auto t = make_task(id);
  t.config.max_retries = retries;
  return t;
}

auto error_of(const TaskOutcome& outcome) -> Error {
  return static_cast<Error>(outcome.error().code.value());
}

}  // namespace

class EngineTest : public ::testing::Test {
protected:
  void SetUp() override {
    config_.max_concurrent = 2;
    config_.default_max_retries = 0;
  }

  void TearDown() override {
    engine_.reset();
  }

  auto engine() -> Engine& {
    if (!engine_) {
      engine_ = std::make_unique<Engine>(executor_, config_);
    }
    return *engine_;
  }

  auto submit(Task task) -> void {
    auto r = engine().submit_task(std::move(task));
    ASSERT_TRUE(r.has_value()) << r.error().message();
  }

  auto state_of(const char* id) -> std::optional<TaskState> {
    auto status = engine().get_task_status(task_id(id));
    if (!status) {
      return std::nullopt;
    }
    return status->state;
  }

  FakeExecutor executor_;
  EngineConfig config_;
  std::unique_ptr<Engine> engine_;
};

TEST_F(EngineTest, SubmitTask_StartsWhenSlotIsFree) {
  submit(make_task("a"));

  EXPECT_EQ(executor_.launch_count(), 1u);
  EXPECT_EQ(state_of("a"), TaskState::Running);
}

TEST_F(EngineTest, SubmitTask_DuplicateIdRejected) {
  submit(make_task("a"));

  auto r = engine().submit_task(make_task("a"));
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::AlreadyExists));
}

TEST_F(EngineTest, SubmitTask_EmptyIdRejected) {
  auto r = engine().submit_task(Task{});
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::InvalidArgument));
}

TEST_F(EngineTest, SubmitTasks_DuplicateInBatchRejectsWholeBatch) {
  std::vector<Task> batch{make_task("a"), make_task("b"), make_task("a")};

  auto r = engine().submit_tasks(std::move(batch));
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::AlreadyExists));
  EXPECT_FALSE(engine().get_task_status(task_id("a")).has_value());
  EXPECT_FALSE(engine().get_task_status(task_id("b")).has_value());
  EXPECT_EQ(executor_.launch_count(), 0u);
}

TEST_F(EngineTest, SubmitTasks_ReturnsIdsInInputOrder) {
  std::vector<Task> batch{make_task("x"), make_task("y"), make_task("z")};

  auto r = engine().submit_tasks(std::move(batch));
  ASSERT_TRUE(r.has_value());
  ASSERT_EQ(r->size(), 3u);
  EXPECT_EQ((*r)[0], task_id("x"));
  EXPECT_EQ((*r)[2], task_id("z"));
}

TEST_F(EngineTest, Concurrency_NeverExceedsMaxConcurrent) {
  for (const char* id : {"a", "b", "c", "d", "e"}) {
    submit(make_task(id));
  }

  EXPECT_EQ(executor_.launch_count(), 2u);
  auto m = engine().get_metrics();
  EXPECT_EQ(m.currently_running, 2u);
  EXPECT_EQ(m.available_slots, 0u);
  EXPECT_EQ(m.queued_tasks, 3u);

  ASSERT_TRUE(executor_.succeed("a"));
  EXPECT_EQ(executor_.launch_count(), 3u);
  EXPECT_EQ(engine().get_metrics().currently_running, 2u);
}

TEST_F(EngineTest, Dispatch_FollowsSubmissionOrder) {
  config_.max_concurrent = 1;
  for (const char* id : {"a", "b", "c"}) {
    submit(make_task(id));
  }
  ASSERT_TRUE(executor_.succeed("a"));
  ASSERT_TRUE(executor_.succeed("b"));
  ASSERT_TRUE(executor_.succeed("c"));

  EXPECT_EQ(executor_.launched_tasks(),
            (std::vector<std::string>{"a", "b", "c"}));
}

TEST_F(EngineTest, Status_ReportsQueuePosition) {
  config_.max_concurrent = 1;
  for (const char* id : {"a", "b", "c"}) {
    submit(make_task(id));
  }

  auto b = engine().get_task_status(task_id("b"));
  auto c = engine().get_task_status(task_id("c"));
  ASSERT_TRUE(b && c);
  EXPECT_EQ(b->state, TaskState::Queued);
  EXPECT_EQ(b->position, 0u);
  EXPECT_EQ(c->position, 1u);
  EXPECT_FALSE(engine().get_task_status(task_id("a"))->position.has_value());
}

TEST_F(EngineTest, Status_ZeroConcurrencyKeepsEverythingQueued) {
  config_.max_concurrent = 0;
  submit(make_task("a"));
  submit(make_task("b"));
  submit(make_task("c"));

  EXPECT_EQ(executor_.launch_count(), 0u);
  const char* ids[] = {"a", "b", "c"};
  for (std::size_t i = 0; i < 3; ++i) {
    auto status = engine().get_task_status(task_id(ids[i]));
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->state, TaskState::Queued);
    EXPECT_EQ(status->position, i) << ids[i];
  }
  EXPECT_EQ(engine().get_metrics().available_slots, 0u);
}

TEST_F(EngineTest, Status_UnknownTaskIsEmpty) {
  EXPECT_FALSE(engine().get_task_status(task_id("nope")).has_value());
}

TEST_F(EngineTest, Completion_DeliversResult) {
  submit(make_task("a"));
  auto future = engine().wait_for_task(task_id("a"));

  ASSERT_TRUE(executor_.succeed("a", "done\n"));

  auto outcome = future.get();
  ASSERT_TRUE(outcome.has_value());
  EXPECT_TRUE(outcome->success);
  EXPECT_EQ(outcome->task_id, task_id("a"));
  EXPECT_EQ(outcome->output, "done\n");
  EXPECT_EQ(outcome->attempts, 1);
  EXPECT_GE(outcome->completed_at, outcome->started_at);

  auto status = engine().get_task_status(task_id("a"));
  ASSERT_TRUE(status && status->result);
  EXPECT_EQ(status->state, TaskState::Completed);
}

TEST_F(EngineTest, Dependencies_WaitForPrerequisites) {
  submit(make_task("a"));
  submit(make_task("b", {task_id("a")}));

  EXPECT_EQ(executor_.launched_tasks(), (std::vector<std::string>{"a"}));
  EXPECT_EQ(state_of("b"), TaskState::Queued);

  ASSERT_TRUE(executor_.succeed("a"));
  EXPECT_EQ(executor_.launched_tasks(), (std::vector<std::string>{"a", "b"}));
}

TEST_F(EngineTest, Dependencies_BlockedTaskDoesNotHoldUpLaterTasks) {
  config_.max_concurrent = 2;
  submit(make_task("a"));
  submit(make_task("b", {task_id("a")}));
  submit(make_task("c"));

  EXPECT_EQ(executor_.launched_tasks(), (std::vector<std::string>{"a", "c"}));
}

TEST_F(EngineTest, Dependencies_SubmittedLaterDependencyIsAwaited) {
  submit(make_task("b", {task_id("a")}));
  EXPECT_EQ(executor_.launch_count(), 0u);

  submit(make_task("a"));
  ASSERT_TRUE(executor_.succeed("a"));
  EXPECT_EQ(executor_.launched_tasks(), (std::vector<std::string>{"a", "b"}));
}

TEST_F(EngineTest, Dependencies_FailurePropagatesTransitively) {
  submit(make_task("a"));
  submit(make_task("b", {task_id("a")}));
  submit(make_task("c", {task_id("b")}));
  auto fb = engine().wait_for_task(task_id("b"));
  auto fc = engine().wait_for_task(task_id("c"));

  ASSERT_TRUE(executor_.fail_with("a", 1));

  auto b = fb.get();
  auto c = fc.get();
  ASSERT_FALSE(b.has_value());
  ASSERT_FALSE(c.has_value());
  EXPECT_EQ(error_of(b), Error::DependencyFailed);
  EXPECT_EQ(error_of(c), Error::DependencyFailed);
  EXPECT_EQ(executor_.launched_tasks(), (std::vector<std::string>{"a"}));
  EXPECT_EQ(engine().get_metrics().failed_tasks, 3u);
}

TEST_F(EngineTest, Dependencies_CancelledPrerequisiteFailsDependent) {
  submit(make_task("a"));
  submit(make_task("b", {task_id("a")}));
  auto fb = engine().wait_for_task(task_id("b"));

  ASSERT_TRUE(engine().cancel_task(task_id("a")).has_value());

  auto b = fb.get();
  ASSERT_FALSE(b.has_value());
  EXPECT_EQ(error_of(b), Error::DependencyFailed);
}

TEST_F(EngineTest, Retry_RerunsFailedAttempt) {
  submit(make_task_with_retries("a", 1));
  auto future = engine().wait_for_task(task_id("a"));

  ASSERT_TRUE(executor_.fail_with("a", 1));
  EXPECT_EQ(executor_.launch_count(), 2u);
  ASSERT_TRUE(executor_.succeed("a"));

  auto outcome = future.get();
  ASSERT_TRUE(outcome.has_value());
  EXPECT_EQ(outcome->attempts, 2);
  EXPECT_EQ(engine().get_metrics().retried_attempts, 1u);
}

TEST_F(EngineTest, Retry_ExhaustedReportsLastFailure) {
  submit(make_task_with_retries("a", 1));
  auto future = engine().wait_for_task(task_id("a"));

  ASSERT_TRUE(executor_.fail_with("a", 3));
  ASSERT_TRUE(executor_.fail_with("a", 4, "boom"));

  auto outcome = future.get();
  ASSERT_FALSE(outcome.has_value());
  EXPECT_EQ(error_of(outcome), Error::TaskFailed);
  EXPECT_EQ(outcome.error().exit_code, 4);
  EXPECT_EQ(outcome.error().attempts, 2);
  EXPECT_EQ(outcome.error().message, "exit code 4: boom");
}

TEST_F(EngineTest, Retry_DefaultComesFromConfig) {
  config_.default_max_retries = 2;
  submit(make_task("a"));

  ASSERT_TRUE(executor_.fail_with("a", 1));
  ASSERT_TRUE(executor_.fail_with("a", 1));
  EXPECT_EQ(executor_.launch_count(), 3u);
  EXPECT_EQ(state_of("a"), TaskState::Running);
}

TEST_F(EngineTest, Retry_PermanentFailureStopsAfterMaxRetriesPlusOne) {
  submit(make_task_with_retries("a", 2));
  auto future = engine().wait_for_task(task_id("a"));

  ASSERT_TRUE(executor_.fail_with("a", 1));
  ASSERT_TRUE(executor_.fail_with("a", 1));
  ASSERT_TRUE(executor_.fail_with("a", 1));
  EXPECT_FALSE(executor_.fail_with("a", 1));

  auto outcome = future.get();
  ASSERT_FALSE(outcome.has_value());
  EXPECT_EQ(error_of(outcome), Error::TaskFailed);
  EXPECT_EQ(outcome.error().attempts, 3);
  EXPECT_EQ(executor_.launch_count(), 3u);
  EXPECT_EQ(state_of("a"), TaskState::Failed);
  EXPECT_EQ(engine().get_metrics().retried_attempts, 2u);
}

TEST_F(EngineTest, Retry_KeepsOriginalQueuePosition) {
  config_.max_concurrent = 1;
  submit(make_task_with_retries("a", 1));
  submit(make_task("b"));

  ASSERT_TRUE(executor_.fail_with("a", 1));

  EXPECT_EQ(executor_.launched_tasks(), (std::vector<std::string>{"a", "a"}));
  EXPECT_EQ(state_of("b"), TaskState::Queued);
}

TEST_F(EngineTest, Timeout_ReportedAsTimeoutError) {
  submit(make_task("a"));
  auto future = engine().wait_for_task(task_id("a"));

  ExecutorResult result;
  result.exit_code = 137;
  result.timed_out = true;
  result.error = "timed out";
  ASSERT_TRUE(executor_.finish("a", std::move(result)));

  auto outcome = future.get();
  ASSERT_FALSE(outcome.has_value());
  EXPECT_EQ(error_of(outcome), Error::Timeout);
}

TEST_F(EngineTest, Cancel_QueuedTaskNeverStarts) {
  config_.max_concurrent = 1;
  submit(make_task("a"));
  submit(make_task("b"));
  auto future = engine().wait_for_task(task_id("b"));

  ASSERT_TRUE(engine().cancel_task(task_id("b")).has_value());
  ASSERT_TRUE(executor_.succeed("a"));

  auto outcome = future.get();
  ASSERT_FALSE(outcome.has_value());
  EXPECT_EQ(error_of(outcome), Error::Cancelled);
  EXPECT_EQ(executor_.launched_tasks(), (std::vector<std::string>{"a"}));
  EXPECT_EQ(state_of("b"), TaskState::Cancelled);
}

TEST_F(EngineTest, Cancel_RunningTaskKillsAttemptAndFreesSlot) {
  config_.max_concurrent = 1;
  submit(make_task("a"));
  submit(make_task("b"));
  auto future = engine().wait_for_task(task_id("a"));

  ASSERT_TRUE(engine().cancel_task(task_id("a")).has_value());

  auto outcome = future.get();
  ASSERT_FALSE(outcome.has_value());
  EXPECT_EQ(error_of(outcome), Error::Cancelled);
  ASSERT_EQ(executor_.cancelled().size(), 1u);
  EXPECT_TRUE(executor_.cancelled()[0].starts_with("a#"));
  EXPECT_EQ(state_of("b"), TaskState::Running);
}

TEST_F(EngineTest, Cancel_LateCompletionIsDiscarded) {
  executor_.set_report_on_cancel(false);
  submit(make_task("a"));
  auto future = engine().wait_for_task(task_id("a"));

  ASSERT_TRUE(engine().cancel_task(task_id("a")).has_value());
  ASSERT_TRUE(executor_.succeed("a", "too late"));

  auto outcome = future.get();
  ASSERT_FALSE(outcome.has_value());
  EXPECT_EQ(error_of(outcome), Error::Cancelled);
  EXPECT_EQ(state_of("a"), TaskState::Cancelled);
  auto m = engine().get_metrics();
  EXPECT_EQ(m.completed_tasks, 0u);
  EXPECT_EQ(m.cancelled_tasks, 1u);
}

TEST_F(EngineTest, Cancel_UnreportedAttemptKeepsItsSlot) {
  config_.max_concurrent = 1;
  executor_.set_report_on_cancel(false);
  submit(make_task("a"));
  submit(make_task("b"));

  ASSERT_TRUE(engine().cancel_task(task_id("a")).has_value());
  EXPECT_EQ(state_of("a"), TaskState::Cancelled);
  EXPECT_EQ(state_of("b"), TaskState::Queued);
  EXPECT_EQ(engine().get_metrics().available_slots, 0u);

  ExecutorResult killed;
  killed.exit_code = -1;
  killed.cancelled = true;
  ASSERT_TRUE(executor_.finish("a", std::move(killed)));
  EXPECT_EQ(state_of("b"), TaskState::Running);
  EXPECT_EQ(executor_.launched_tasks(), (std::vector<std::string>{"a", "b"}));
  ASSERT_TRUE(executor_.succeed("b"));
}

TEST_F(EngineTest, Cancel_BeforeLaunchNeverReachesExecutor) {
  executor_.set_on_execute([this](const std::string& instance) {
    if (instance.starts_with("a#")) {
      ASSERT_TRUE(engine().cancel_task(task_id("b")).has_value());
    }
  });
  auto ids = engine().submit_tasks({make_task("a"), make_task("b")});
  ASSERT_TRUE(ids.has_value());

  EXPECT_EQ(executor_.launched_tasks(), (std::vector<std::string>{"a"}));
  EXPECT_EQ(state_of("b"), TaskState::Cancelled);
  auto m = engine().get_metrics();
  EXPECT_EQ(m.active_processes, 1u);
  EXPECT_EQ(m.available_slots, 1u);
}

TEST_F(EngineTest, Cancel_DuringLaunchIsRepeatedOnceRegistered) {
  config_.max_concurrent = 1;
  executor_.set_on_execute([this](const std::string& instance) {
    if (instance.starts_with("a#")) {
      ASSERT_TRUE(engine().cancel_task(task_id("a")).has_value());
    }
  });
  submit(make_task("a"));
  submit(make_task("b"));

  auto cancels = executor_.cancelled();
  ASSERT_EQ(cancels.size(), 2u);
  EXPECT_TRUE(cancels[0].starts_with("a#"));
  EXPECT_EQ(cancels[1], cancels[0]);
  EXPECT_EQ(state_of("a"), TaskState::Cancelled);
  EXPECT_EQ(state_of("b"), TaskState::Running);
  EXPECT_EQ(engine().get_metrics().active_processes, 1u);
}

TEST_F(EngineTest, Cancel_FinishedOrUnknownTaskRejected) {
  submit(make_task("a"));
  ASSERT_TRUE(executor_.succeed("a"));

  auto finished = engine().cancel_task(task_id("a"));
  ASSERT_FALSE(finished.has_value());
  EXPECT_EQ(finished.error(), make_error_code(Error::InvalidState));

  auto unknown = engine().cancel_task(task_id("ghost"));
  ASSERT_FALSE(unknown.has_value());
  EXPECT_EQ(unknown.error(), make_error_code(Error::NotFound));
}

TEST_F(EngineTest, Wait_BeforeSubmitResolvesLater) {
  auto future = engine().wait_for_task(task_id("later"));
  submit(make_task("later"));
  ASSERT_TRUE(executor_.succeed("later"));

  auto outcome = future.get();
  ASSERT_TRUE(outcome.has_value());
  EXPECT_EQ(outcome->task_id, task_id("later"));
}

TEST_F(EngineTest, Wait_AfterCompletionResolvesImmediately) {
  submit(make_task("a"));
  ASSERT_TRUE(executor_.succeed("a"));

  auto future = engine().wait_for_task(task_id("a"));
  ASSERT_EQ(future.wait_for(0ms), std::future_status::ready);
  EXPECT_TRUE(future.get().has_value());
}

TEST_F(EngineTest, Wait_CallbackFormRunsOncePerWaiter) {
  submit(make_task("a"));
  int calls = 0;
  engine().wait_for_task(task_id("a"), [&](const TaskOutcome&) { ++calls; });
  engine().wait_for_task(task_id("a"), [&](const TaskOutcome&) { ++calls; });

  ASSERT_TRUE(executor_.succeed("a"));
  EXPECT_EQ(calls, 2);
}

TEST_F(EngineTest, Wait_EveryWaiterSeesTheFailure) {
  submit(make_task("a"));
  std::vector<std::future<TaskOutcome>> futures;
  for (int i = 0; i < 4; ++i) {
    futures.push_back(engine().wait_for_task(task_id("a")));
  }
  int callbacks = 0;
  engine().wait_for_task(task_id("a"), [&](const TaskOutcome& outcome) {
    EXPECT_FALSE(outcome.has_value());
    ++callbacks;
  });

  ASSERT_TRUE(executor_.fail_with("a", 9, "bad"));

  for (auto& future : futures) {
    ASSERT_EQ(future.wait_for(0ms), std::future_status::ready);
    auto outcome = future.get();
    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(error_of(outcome), Error::TaskFailed);
    EXPECT_EQ(outcome.error().exit_code, 9);
  }
  EXPECT_EQ(callbacks, 1);
}

TEST_F(EngineTest, WaitForTasks_ResultsInInputOrder) {
  submit(make_task("a"));
  submit(make_task("b"));
  auto future = engine().wait_for_tasks({task_id("b"), task_id("a")});

  ASSERT_TRUE(executor_.succeed("a", "A"));
  ASSERT_TRUE(executor_.succeed("b", "B"));

  auto batch = future.get();
  ASSERT_TRUE(batch.has_value());
  ASSERT_EQ(batch->size(), 2u);
  EXPECT_EQ((*batch)[0].output, "B");
  EXPECT_EQ((*batch)[1].output, "A");
}

TEST_F(EngineTest, WaitForTasks_RejectsOnFirstFailure) {
  submit(make_task("a"));
  submit(make_task("b"));
  auto future = engine().wait_for_tasks({task_id("a"), task_id("b")});

  ASSERT_TRUE(executor_.fail_with("b", 2));

  ASSERT_EQ(future.wait_for(0ms), std::future_status::ready);
  auto batch = future.get();
  ASSERT_FALSE(batch.has_value());
  EXPECT_EQ(batch.error().task_id, task_id("b"));
}

TEST_F(EngineTest, WaitForTasks_EmptyListResolvesImmediately) {
  auto future = engine().wait_for_tasks({});
  ASSERT_EQ(future.wait_for(0ms), std::future_status::ready);
  auto batch = future.get();
  ASSERT_TRUE(batch.has_value());
  EXPECT_TRUE(batch->empty());
}

TEST_F(EngineTest, Hooks_FireForCompletionAndFailureButNotCancel) {
  std::vector<std::string> completed;
  std::vector<std::string> failed;
  engine().on_task_complete(
      [&](const TaskResult& r) { completed.push_back(r.task_id.str()); });
  engine().on_task_failed(
      [&](const TaskError& e) { failed.push_back(e.task_id.str()); });

  submit(make_task("ok"));
  submit(make_task("bad"));
  ASSERT_TRUE(executor_.succeed("ok"));
  ASSERT_TRUE(executor_.fail_with("bad", 1));
  submit(make_task("gone"));
  ASSERT_TRUE(engine().cancel_task(task_id("gone")).has_value());

  EXPECT_EQ(completed, (std::vector<std::string>{"ok"}));
  EXPECT_EQ(failed, (std::vector<std::string>{"bad"}));
}

TEST_F(EngineTest, Hooks_ThrowingHookDoesNotBreakEngine) {
  engine().on_task_complete(
      [](const TaskResult&) { throw std::runtime_error("hook failure"); });
  submit(make_task("a"));
  submit(make_task("b"));

  ASSERT_TRUE(executor_.succeed("a"));
  ASSERT_TRUE(executor_.succeed("b"));
  EXPECT_EQ(engine().get_metrics().completed_tasks, 2u);
}

TEST_F(EngineTest, Hooks_MaySubmitFollowUpTasks) {
  engine().on_task_complete([this](const TaskResult& r) {
    if (r.task_id == task_id("first")) {
      auto next = engine().submit_task(make_task("second"));
      EXPECT_TRUE(next.has_value());
    }
  });
  submit(make_task("first"));
  ASSERT_TRUE(executor_.succeed("first"));

  EXPECT_EQ(state_of("second"), TaskState::Running);
}

TEST_F(EngineTest, Metrics_SuccessRateAndCounts) {
  EXPECT_DOUBLE_EQ(engine().get_metrics().success_rate, 1.0);

  submit(make_task("a"));
  submit(make_task("b"));
  ASSERT_TRUE(executor_.succeed("a"));
  ASSERT_TRUE(executor_.fail_with("b", 1));

  auto m = engine().get_metrics();
  EXPECT_EQ(m.completed_tasks, 1u);
  EXPECT_EQ(m.failed_tasks, 1u);
  EXPECT_DOUBLE_EQ(m.success_rate, 0.5);
  EXPECT_EQ(m.total_processes_spawned, 2u);
  EXPECT_EQ(m.active_processes, 0u);
  EXPECT_EQ(m.max_concurrent, 2u);
}

TEST_F(EngineTest, ExecutorConfig_CarriesPromptCommandAndEnv) {
  config_.agent_command = {"agent", "--print"};
  auto t = make_task("a");
  t.type = "issue";
  t.work_dir = "/tmp/work";
  t.config.env = {{"FOO", "bar"}};
  t.config.timeout = 42s;
  submit(std::move(t));

  auto cfg = executor_.config_at(0);
  ASSERT_TRUE(std::holds_alternative<ProcessExecutorConfig>(cfg));
  const auto& p = std::get<ProcessExecutorConfig>(cfg);
  EXPECT_EQ(p.argv, (std::vector<std::string>{"agent", "--print"}));
  EXPECT_EQ(p.stdin_data, "prompt for a");
  EXPECT_EQ(p.working_dir, "/tmp/work");
  EXPECT_EQ(p.timeout, 42s);
  EXPECT_NE(std::ranges::find(p.env, std::pair<std::string, std::string>{
                                         "TASKWEAVE_TASK_ID", "a"}),
            p.env.end());
  EXPECT_NE(std::ranges::find(p.env,
                              std::pair<std::string, std::string>{"FOO", "bar"}),
            p.env.end());
}

TEST_F(EngineTest, ExecutorConfig_TaskCommandOverridesAgent) {
  auto t = make_task("a");
  t.config.command = {"sh", "-c", "true"};
  submit(std::move(t));

  const auto& p = std::get<ProcessExecutorConfig>(executor_.config_at(0));
  EXPECT_EQ(p.argv, (std::vector<std::string>{"sh", "-c", "true"}));
  EXPECT_EQ(p.timeout, config_.default_timeout);
}

TEST_F(EngineTest, Shutdown_CancelsEverythingAndRejectsNewWork) {
  config_.max_concurrent = 1;
  submit(make_task("a"));
  submit(make_task("b"));
  auto fa = engine().wait_for_task(task_id("a"));
  auto fb = engine().wait_for_task(task_id("b"));
  auto early = engine().wait_for_task(task_id("never"));

  engine().shutdown();

  EXPECT_EQ(error_of(fa.get()), Error::ShuttingDown);
  EXPECT_EQ(error_of(fb.get()), Error::ShuttingDown);
  EXPECT_EQ(error_of(early.get()), Error::ShuttingDown);
  EXPECT_EQ(executor_.pending_count(), 0u);

  auto r = engine().submit_task(make_task("c"));
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::ShuttingDown));
}

TEST_F(EngineTest, Shutdown_IsIdempotent) {
  submit(make_task("a"));
  engine().shutdown();
  engine().shutdown();
  EXPECT_EQ(executor_.cancelled().size(), 1u);
}

TEST(NoopExecutorEngineTest, BatchCompletesWithoutProcesses) {
  auto executor = create_noop_executor();
  EngineConfig config;
  config.executor = ExecutorType::Noop;
  config.max_concurrent = 4;
  Engine engine(*executor, config);

  std::vector<Task> tasks;
  std::vector<TaskId> ids;
  for (int i = 0; i < 20; ++i) {
    Task t;
    t.id = task_id(std::format("t{}", i));
    if (i > 0) {
      t.dependencies.push_back(task_id(std::format("t{}", i - 1)));
    }
    ids.push_back(t.id);
    tasks.push_back(std::move(t));
  }
  ASSERT_TRUE(engine.submit_tasks(std::move(tasks)).has_value());

  auto future = engine.wait_for_tasks(ids);
  ASSERT_EQ(future.wait_for(10s), std::future_status::ready);
  auto batch = future.get();
  ASSERT_TRUE(batch.has_value());
  EXPECT_EQ(batch->size(), 20u);
  EXPECT_EQ(engine.get_metrics().completed_tasks, 20u);
}
