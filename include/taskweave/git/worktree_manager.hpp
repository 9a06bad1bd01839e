#pragma once

#include "taskweave/config/config.hpp"
#include "taskweave/core/error.hpp"
#include "taskweave/git/git_cli.hpp"
#include "taskweave/util/id.hpp"

#include <string>

namespace taskweave {

struct WorktreeInfo {
  std::string path;
  std::string branch;
};

// Creates and removes the isolated worktree + branch an execution runs in.
class WorktreeManager {
public:
  WorktreeManager(GitCli git, SyncConfig config);

  // `git worktree add -b <branch_prefix><id> <worktree_root>/<id> <base>`.
  // A relative worktree_root is taken relative to the repository.
  [[nodiscard]] auto create(const ExecutionId& execution_id,
                            std::string_view base_branch) const
      -> Result<WorktreeInfo>;

  [[nodiscard]] auto remove(const WorktreeInfo& info, bool delete_branch) const
      -> Result<void>;

  [[nodiscard]] auto path_for(const ExecutionId& execution_id) const
      -> std::string;
  [[nodiscard]] auto branch_for(const ExecutionId& execution_id) const
      -> std::string;

private:
  GitCli git_;
  SyncConfig config_;
};

}  // namespace taskweave
