#pragma once

#include "taskweave/config/config.hpp"
#include "taskweave/core/error.hpp"
#include "taskweave/git/git_cli.hpp"
#include "taskweave/storage/execution_store.hpp"
#include "taskweave/sync/conflict_detector.hpp"
#include "taskweave/util/id.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace taskweave {

struct SyncPreview {
  bool can_sync{false};
  std::vector<std::string> warnings;
  ConflictReport conflicts;
  // Oldest first.
  std::vector<GitCommit> commits;
  std::string merge_base;
  DiffStat diff;
  ExecutionStatus execution_status{ExecutionStatus::Pending};
  // The branch moved past its starting commit and the target already
  // contains all of it.
  bool already_merged{false};
};

enum class SyncMode {
  // One new commit on the target with the combined changes.
  Squash,
  // The combined changes left staged on the target, not committed.
  Stage,
  // A merge commit that keeps the branch's commits.
  Preserve,
};

struct SyncOptions {
  SyncMode mode{SyncMode::Squash};
  // Commit message for Squash and Preserve; empty generates one.
  std::string message;
  // Stage only: also copy the worktree's uncommitted and untracked files.
  bool include_uncommitted{false};
};

struct SyncResult {
  bool success{false};
  // Only set on success. A tag created before a failed attempt stays in the
  // repository.
  std::optional<std::string> backup_tag;
  std::vector<std::string> warnings;
  std::string final_commit;
  std::size_t files_changed{0};
  // Structured logs whose conflicts were resolved automatically.
  std::vector<std::string> resolved_logs;
  // Files copied from the worktree's uncommitted state (stage mode).
  std::size_t uncommitted_files{0};
  bool has_conflicts{false};
  std::string error;
};

// Brings an execution's worktree branch into its target branch on the main
// checkout, as a squash commit, staged changes or a history-preserving merge.
// Every mode tags the target first and resets to that tag when it fails.
// One sync runs at a time per synchronizer; give each checkout a single
// synchronizer.
class WorktreeSynchronizer {
public:
  WorktreeSynchronizer(IExecutionStore& store, SyncConfig config);

  WorktreeSynchronizer(const WorktreeSynchronizer&) = delete;
  auto operator=(const WorktreeSynchronizer&) -> WorktreeSynchronizer& = delete;

  // Read-only. Error::NotFound for an unknown execution; git failures other
  // than a missing precondition come back as errors.
  [[nodiscard]] auto preview_sync(const ExecutionId& id) const
      -> Result<SyncPreview>;

  // Conflicts and blocked preconditions are reported in the SyncResult, not
  // as errors. An empty message generates one.
  [[nodiscard]] auto squash_sync(const ExecutionId& id,
                                 std::string_view message = {})
      -> Result<SyncResult>;
  // Leaves the target checked out with the changes staged. Local changes in
  // the checkout are allowed; when present, a failure is not rolled back.
  [[nodiscard]] auto stage_sync(const ExecutionId& id,
                                bool include_uncommitted = false)
      -> Result<SyncResult>;
  [[nodiscard]] auto preserve_sync(const ExecutionId& id,
                                   std::string_view message = {})
      -> Result<SyncResult>;
  [[nodiscard]] auto sync(const ExecutionId& id, const SyncOptions& options)
      -> Result<SyncResult>;

  [[nodiscard]] auto git() const noexcept -> const GitCli& { return git_; }

private:
  [[nodiscard]] auto preview(const ExecutionRecord& record,
                             SyncMode mode = SyncMode::Squash,
                             bool include_uncommitted = false) const
      -> Result<SyncPreview>;
  // Returns the new target commit; empty in stage mode.
  [[nodiscard]] auto apply_squash(const ExecutionRecord& record,
                                  const SyncPreview& preview,
                                  const SyncOptions& options,
                                  SyncResult& result) const
      -> Result<std::string>;
  [[nodiscard]] auto apply_preserve(const ExecutionRecord& record,
                                    const SyncPreview& preview,
                                    const SyncOptions& options,
                                    std::string_view old_target,
                                    SyncResult& result) const
      -> Result<std::string>;
  // Resolves structured logs among the unmerged paths; fails while any other
  // path still conflicts.
  [[nodiscard]] auto resolve_unmerged(const ExecutionRecord& record,
                                      const SyncPreview& preview,
                                      SyncResult& result) const
      -> Result<void>;
  [[nodiscard]] auto copy_uncommitted(const ExecutionRecord& record,
                                      SyncResult& result) const
      -> Result<void>;
  [[nodiscard]] auto resolve_structured_log(const ExecutionRecord& record,
                                            const std::string& merge_base,
                                            const std::string& path) const
      -> Result<void>;
  auto rollback(std::string_view target_branch, std::string_view tag,
                std::string_view previous_branch, SyncResult& result) const
      -> void;
  [[nodiscard]] auto backup_tag_name(const ExecutionId& id) const
      -> std::string;

  IExecutionStore& store_;
  SyncConfig config_;
  GitCli git_;
  ConflictDetector detector_;
  std::mutex mutex_;
};

// "Squash merge from <branch> (N commits)" plus issue and execution lines.
[[nodiscard]] auto default_squash_message(const ExecutionRecord& record,
                                          std::size_t commit_count)
    -> std::string;
// "Merge <branch> into <target> (N commits)" plus issue and execution lines.
[[nodiscard]] auto default_merge_message(const ExecutionRecord& record,
                                         std::size_t commit_count)
    -> std::string;

}  // namespace taskweave
