#include "taskweave/git/worktree_manager.hpp"

#include "taskweave/util/log.hpp"

#include <filesystem>
#include <string_view>
#include <system_error>

namespace taskweave {

namespace fs = std::filesystem;

namespace {

// The id becomes one directory under the worktree root and the tail of a
// branch name, so it must be a single plain path component.
auto valid_execution_id(std::string_view id) -> bool {
  return !id.empty() && id != "." && id != ".." && !id.starts_with('-') &&
         id.find_first_of(std::string_view("/\\\0", 3)) ==
             std::string_view::npos;
}

}  // namespace

WorktreeManager::WorktreeManager(GitCli git, SyncConfig config)
    : git_(std::move(git)), config_(std::move(config)) {}

auto WorktreeManager::path_for(const ExecutionId& execution_id) const
    -> std::string {
  fs::path root{config_.worktree_root};
  if (root.is_relative()) {
    root = fs::path{git_.repo_path()} / root;
  }
  return (root / execution_id.str()).lexically_normal().string();
}

auto WorktreeManager::branch_for(const ExecutionId& execution_id) const
    -> std::string {
  return config_.branch_prefix + execution_id.str();
}

auto WorktreeManager::create(const ExecutionId& execution_id,
                             std::string_view base_branch) const
    -> Result<WorktreeInfo> {
  if (!valid_execution_id(execution_id.str())) {
    log::warn("Rejecting execution id '{}' as a worktree name",
              execution_id.str());
    return fail(Error::InvalidArgument);
  }

  WorktreeInfo info{path_for(execution_id), branch_for(execution_id)};
  if (fs::exists(info.path)) {
    log::warn("Worktree path {} already exists", info.path);
    return fail(Error::AlreadyExists);
  }
  if (git_.branch_exists(info.branch)) {
    log::warn("Branch {} already exists", info.branch);
    return fail(Error::AlreadyExists);
  }

  std::error_code ec;
  fs::create_directories(fs::path{info.path}.parent_path(), ec);
  if (ec) {
    log::error("Cannot create {}: {}", fs::path{info.path}.parent_path().string(),
               ec.message());
    return fail(Error::FileOpenFailed);
  }

  if (auto r = git_.worktree_add(info.path, info.branch, base_branch); !r) {
    return fail(r.error());
  }
  log::info("Created worktree {} on branch {} from {}", info.path, info.branch,
            base_branch);
  return info;
}

auto WorktreeManager::remove(const WorktreeInfo& info, bool delete_branch) const
    -> Result<void> {
  if (fs::exists(info.path)) {
    if (auto r = git_.worktree_remove(info.path); !r) {
      return fail(r.error());
    }
  }
  if (delete_branch && git_.branch_exists(info.branch)) {
    if (auto r = git_.delete_branch(info.branch); !r) {
      return fail(r.error());
    }
  }
  log::info("Removed worktree {}", info.path);
  return ok();
}

}  // namespace taskweave
