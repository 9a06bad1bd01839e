#include "taskweave/core/error.hpp"
#include "taskweave/executor/executor.hpp"
#include "taskweave/process/subprocess.hpp"
#include "taskweave/util/log.hpp"

#include <condition_variable>
#include <mutex>
#include <thread>
#include <unordered_map>

#include <signal.h>

namespace taskweave {

namespace {

struct ActiveProcess {
  pid_t pid{0};
  bool cancelled{false};
};

// Outlives the executor while reaper or killer threads still hold it.
struct SharedState {
  std::mutex mutex;
  std::condition_variable idle;
  std::unordered_map<std::string, ActiveProcess, StringHash, StringEqual>
      active;
  std::size_t reapers{0};
  bool closing{false};
};

auto run_and_report(std::shared_ptr<SharedState> state, std::string instance_id,
                    ProcessExecutorConfig config, ExecutorCallback callback)
    -> void {
  ProcessOptions options;
  options.working_dir = config.working_dir;
  options.env = config.env;
  options.stdin_data = std::move(config.stdin_data);
  options.timeout = config.timeout;
  options.on_spawn = [&state, &instance_id](pid_t pid) {
    bool kill_now = false;
    {
      std::lock_guard lock(state->mutex);
      auto& entry = state->active[instance_id];
      entry.pid = pid;
      kill_now = entry.cancelled || state->closing;
    }
    if (kill_now) {
      kill(-pid, SIGKILL);
    }
  };

  auto run = run_process(config.argv, options);

  ExecutorResult result;
  bool cancelled = false;
  {
    std::lock_guard lock(state->mutex);
    if (auto it = state->active.find(instance_id); it != state->active.end()) {
      cancelled = it->second.cancelled;
      state->active.erase(it);
    }
  }

  if (!run) {
    result.exit_code = -1;
    result.error = std::format("failed to start '{}': {}", config.argv.empty()
                                   ? std::string{}
                                   : config.argv.front(),
                               run.error().message());
  } else {
    result.exit_code = run->exit_code;
    result.stdout_output = std::move(run->stdout_output);
    result.stderr_output = std::move(run->stderr_output);
    result.timed_out = run->timed_out;
    if (run->timed_out) {
      result.error = std::format("timed out after {}s", config.timeout.count());
    }
  }
  result.cancelled = cancelled;

  log::debug("Process for {} finished: exit_code={} timed_out={} cancelled={}",
             instance_id, result.exit_code, result.timed_out, cancelled);

  callback(instance_id, std::move(result));

  std::lock_guard lock(state->mutex);
  --state->reapers;
  state->idle.notify_all();
}

class ProcessExecutor : public IExecutor {
public:
  explicit ProcessExecutor(std::chrono::milliseconds kill_grace)
      : state_{std::make_shared<SharedState>()}, kill_grace_{kill_grace} {}

  ~ProcessExecutor() override {
    std::unique_lock lock(state_->mutex);
    state_->closing = true;
    for (auto& [id, proc] : state_->active) {
      if (proc.pid > 0) {
        kill(-proc.pid, SIGKILL);
      }
    }
    state_->idle.wait(lock, [this] { return state_->reapers == 0; });
  }

  auto execute(const std::string& instance_id, const ExecutorConfig& config,
               ExecutorCallback callback) -> void override {
    if (std::holds_alternative<NoopExecutorConfig>(config)) {
      callback(instance_id, ExecutorResult{});
      return;
    }

    const auto& process = std::get<ProcessExecutorConfig>(config);
    if (process.argv.empty()) {
      ExecutorResult result;
      result.exit_code = -1;
      result.error = "empty command";
      callback(instance_id, std::move(result));
      return;
    }

    {
      std::lock_guard lock(state_->mutex);
      state_->active[instance_id] = ActiveProcess{};
      ++state_->reapers;
    }

    log::info("Starting process for {}: {}", instance_id, process.argv.front());
    std::thread(run_and_report, state_, instance_id, process,
                std::move(callback))
        .detach();
  }

  auto cancel(std::string_view instance_id) -> void override {
    pid_t pid = 0;
    {
      std::lock_guard lock(state_->mutex);
      auto it = state_->active.find(instance_id);
      if (it == state_->active.end()) {
        return;
      }
      it->second.cancelled = true;
      pid = it->second.pid;
    }

    // Not spawned yet: on_spawn sees the flag and kills immediately.
    if (pid <= 0) {
      return;
    }

    log::info("Cancelling process group {} for {}", pid, instance_id);
    kill(-pid, SIGTERM);

    std::thread([state = state_, id = std::string(instance_id), pid,
                 grace = kill_grace_] {
      std::this_thread::sleep_for(grace);
      std::lock_guard lock(state->mutex);
      auto it = state->active.find(id);
      if (it != state->active.end() && it->second.pid == pid) {
        kill(-pid, SIGKILL);
      }
    }).detach();
  }

private:
  std::shared_ptr<SharedState> state_;
  std::chrono::milliseconds kill_grace_;
};

}  // namespace

auto create_process_executor(std::chrono::milliseconds kill_grace)
    -> std::unique_ptr<IExecutor> {
  return std::make_unique<ProcessExecutor>(kill_grace);
}

}  // namespace taskweave
