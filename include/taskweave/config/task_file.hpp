#pragma once

#include "taskweave/core/error.hpp"
#include "taskweave/scheduler/task.hpp"

#include <string_view>
#include <vector>

namespace taskweave {

// Task batches described in YAML:
//
//   tasks:
//     - id: fix-login
//       prompt: "..."
//       work_dir: .taskweave/worktrees/fix-login
//       depends_on: [setup]
//       max_retries: 1
//       timeout: 600
//       command: [sh, -c, "make test"]
//       env: {CI: "1"}
class TaskFileLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<std::vector<Task>>;
  [[nodiscard]] static auto load_from_string(std::string_view yaml_str)
      -> Result<std::vector<Task>>;
};

}  // namespace taskweave
