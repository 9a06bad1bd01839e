#pragma once

#include "taskweave/config/config.hpp"
#include "taskweave/executor/executor.hpp"
#include "taskweave/scheduler/task.hpp"

namespace taskweave {

// Maps a task onto what the configured executor needs to run it: the task's
// own command (or the agent command) as argv, the prompt on stdin, work_dir
// as the working directory.
[[nodiscard]] auto build_executor_config(const Task& task,
                                         const EngineConfig& config)
    -> ExecutorConfig;

}  // namespace taskweave
