#include "taskweave/executor/config_builder.hpp"

namespace taskweave {

auto build_executor_config(const Task& task, const EngineConfig& config)
    -> ExecutorConfig {
  if (config.executor == ExecutorType::Noop) {
    return NoopExecutorConfig{};
  }

  ProcessExecutorConfig exec;
  exec.argv =
      task.config.command.empty() ? config.agent_command : task.config.command;
  exec.working_dir = task.work_dir;
  exec.env = task.config.env;
  exec.env.emplace_back("TASKWEAVE_TASK_ID", task.id.str());
  if (!task.type.empty()) {
    exec.env.emplace_back("TASKWEAVE_TASK_TYPE", task.type);
  }
  exec.stdin_data = task.prompt;
  exec.timeout = task.config.timeout.value_or(config.default_timeout);
  return exec;
}

}  // namespace taskweave
