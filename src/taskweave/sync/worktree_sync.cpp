#include "taskweave/sync/worktree_sync.hpp"

#include "taskweave/sync/jsonl_resolver.hpp"
#include "taskweave/sync/line_merge.hpp"
#include "taskweave/util/log.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>

namespace taskweave {

namespace fs = std::filesystem;

namespace {

auto blocked(SyncPreview& preview, std::string warning) -> void {
  preview.can_sync = false;
  preview.warnings.push_back(std::move(warning));
}

auto write_file(const fs::path& path, std::string_view content) -> bool {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    return false;
  }
  out.write(content.data(), static_cast<std::streamsize>(content.size()));
  return static_cast<bool>(out);
}

}  // namespace

auto default_squash_message(const ExecutionRecord& record,
                            std::size_t commit_count) -> std::string {
  return std::format(
      "Squash merge from {} ({} commit{})\n\nIssue: {}\nExecution: {}\n",
      record.branch_name, commit_count, commit_count == 1 ? "" : "s",
      record.issue_id.empty() ? "unknown" : record.issue_id, record.id);
}

auto default_merge_message(const ExecutionRecord& record,
                           std::size_t commit_count) -> std::string {
  return std::format(
      "Merge {} into {} ({} commit{})\n\nIssue: {}\nExecution: {}\n",
      record.branch_name, record.target_branch, commit_count,
      commit_count == 1 ? "" : "s",
      record.issue_id.empty() ? "unknown" : record.issue_id, record.id);
}

WorktreeSynchronizer::WorktreeSynchronizer(IExecutionStore& store,
                                           SyncConfig config)
    : store_(store),
      config_(std::move(config)),
      git_(config_.repo_path),
      detector_(git_, StructuredLogMatcher{config_.structured_logs}) {}

auto WorktreeSynchronizer::preview_sync(const ExecutionId& id) const
    -> Result<SyncPreview> {
  auto record = store_.get(id);
  if (!record) {
    return fail(record.error());
  }
  return preview(*record);
}

auto WorktreeSynchronizer::preview(const ExecutionRecord& record,
                                   SyncMode mode,
                                   bool include_uncommitted) const
    -> Result<SyncPreview> {
  SyncPreview preview;
  preview.execution_status = record.status;

  // Without these nothing else can be computed; report the first one alone.
  if (record.worktree_path.empty()) {
    blocked(preview, std::format("Execution {} has no worktree", record.id));
    return preview;
  }
  std::error_code ec;
  if (!fs::exists(record.worktree_path, ec)) {
    blocked(preview,
            std::format("Worktree not found at {}", record.worktree_path));
    return preview;
  }
  if (!git_.branch_exists(record.branch_name)) {
    blocked(preview, std::format("Branch {} not found", record.branch_name));
    return preview;
  }
  if (!git_.branch_exists(record.target_branch)) {
    blocked(preview,
            std::format("Target branch {} not found", record.target_branch));
    return preview;
  }
  auto base = git_.merge_base(record.branch_name, record.target_branch);
  if (!base) {
    if (base.error() == make_error_code(Error::NoCommonBase)) {
      blocked(preview, std::format("Branches {} and {} have no common history",
                                   record.branch_name, record.target_branch));
      return preview;
    }
    return fail(base.error());
  }
  preview.merge_base = std::move(*base);

  auto commits = git_.commit_list(preview.merge_base, record.branch_name);
  if (!commits) {
    return fail(commits.error());
  }
  preview.commits = std::move(*commits);

  auto diff = git_.diff_stat(preview.merge_base, record.branch_name);
  if (!diff) {
    return fail(diff.error());
  }
  preview.diff = std::move(*diff);

  auto conflicts =
      detector_.detect_conflicts(record.branch_name, record.target_branch);
  if (!conflicts) {
    return fail(conflicts.error());
  }
  preview.conflicts = std::move(*conflicts);

  auto clean = git_.is_clean();
  if (!clean) {
    return fail(clean.error());
  }

  // With nothing left to merge, tell a branch that was merged before apart
  // from one that never moved.
  if (preview.commits.empty() && !record.before_commit.empty()) {
    auto tip = git_.rev_parse(record.branch_name);
    if (!tip) {
      return fail(tip.error());
    }
    if (*tip != record.before_commit) {
      auto merged = git_.is_ancestor(record.branch_name, record.target_branch);
      if (!merged) {
        return fail(merged.error());
      }
      preview.already_merged = *merged;
    }
  }

  preview.can_sync = true;
  if (!*clean) {
    if (mode == SyncMode::Stage) {
      preview.warnings.emplace_back(
          "Local working tree has uncommitted changes. They will not be "
          "rolled back if the sync fails.");
    } else {
      blocked(preview,
              "Local working tree has uncommitted changes. Stash or commit "
              "them first.");
    }
  }
  if (is_active(record.status)) {
    preview.warnings.emplace_back(
        "Execution is currently active. Synced state may not reflect the "
        "final execution result.");
  }
  if (auto n = preview.conflicts.code_conflicts.size(); n > 0) {
    blocked(preview,
            std::format("{} code conflict(s) detected. Resolve them in the "
                        "worktree before syncing.",
                        n));
  }
  if (preview.already_merged) {
    blocked(preview,
            std::format("Target branch {} is already up to date with {}",
                        record.target_branch, record.branch_name));
  } else if (preview.commits.empty() &&
             !(mode == SyncMode::Stage && include_uncommitted)) {
    blocked(preview, std::format("No commits to merge from {}",
                                 record.branch_name));
  }
  return preview;
}

auto WorktreeSynchronizer::squash_sync(const ExecutionId& id,
                                       std::string_view message)
    -> Result<SyncResult> {
  SyncOptions options;
  options.message = std::string(message);
  return sync(id, options);
}

auto WorktreeSynchronizer::stage_sync(const ExecutionId& id,
                                      bool include_uncommitted)
    -> Result<SyncResult> {
  SyncOptions options;
  options.mode = SyncMode::Stage;
  options.include_uncommitted = include_uncommitted;
  return sync(id, options);
}

auto WorktreeSynchronizer::preserve_sync(const ExecutionId& id,
                                         std::string_view message)
    -> Result<SyncResult> {
  SyncOptions options;
  options.mode = SyncMode::Preserve;
  options.message = std::string(message);
  return sync(id, options);
}

auto WorktreeSynchronizer::sync(const ExecutionId& id,
                                const SyncOptions& options)
    -> Result<SyncResult> {
  auto record = store_.get(id);
  if (!record) {
    return fail(record.error());
  }

  std::lock_guard lock(mutex_);

  auto pre = preview(*record, options.mode, options.include_uncommitted);
  if (!pre) {
    return fail(pre.error());
  }

  SyncResult result;
  result.warnings = pre->warnings;
  if (!pre->can_sync) {
    result.error = "Sync blocked by preconditions";
    log::warn("Sync of {} blocked: {} warning(s)", id, result.warnings.size());
    return result;
  }

  auto previous_branch = git_.current_branch();
  if (!previous_branch) {
    return fail(previous_branch.error());
  }
  auto target_sha = git_.rev_parse(record->target_branch);
  if (!target_sha) {
    return fail(target_sha.error());
  }
  auto clean = git_.is_clean();
  if (!clean) {
    return fail(clean.error());
  }

  auto tag = backup_tag_name(id);
  if (auto r = git_.create_tag(
          tag, *target_sha,
          std::format("Backup of {} before syncing execution {}",
                      record->target_branch, id));
      !r) {
    result.error = std::format("Failed to create backup tag {}", tag);
    return result;
  }
  log::info("Created backup tag {} at {}", tag, *target_sha);

  auto commit = options.mode == SyncMode::Preserve
                    ? apply_preserve(*record, *pre, options, *target_sha, result)
                    : apply_squash(*record, *pre, options, result);
  if (!commit) {
    if (result.error.empty()) {
      result.error = commit.error().message();
    }
    if (*clean) {
      rollback(record->target_branch, tag, *previous_branch, result);
    } else {
      log::warn("Sync of {} failed ({}); local changes present, not rolling "
                "back",
                id, result.error);
      result.warnings.push_back(std::format(
          "Local changes kept; restore {} from tag {} if needed",
          record->target_branch, tag));
    }
    return result;
  }

  result.success = true;
  result.backup_tag = tag;
  result.final_commit = std::move(*commit);

  if (options.mode == SyncMode::Stage) {
    log::info("Staged {} on {} ({} file(s), {} uncommitted, {} log(s) "
              "resolved)",
              id, record->target_branch, result.files_changed,
              result.uncommitted_files, result.resolved_logs.size());
    return result;
  }

  if (auto r = store_.update_after_commit(id, result.final_commit); !r) {
    log::warn("Synced {} but could not record commit {}: {}", id,
              result.final_commit, r.error().message());
    result.warnings.push_back(std::format(
        "Commit {} was not recorded for execution {}", result.final_commit, id));
  }

  log::info("Synced {} into {} as {} ({} file(s), {} log(s) resolved)", id,
            record->target_branch, result.final_commit, result.files_changed,
            result.resolved_logs.size());
  return result;
}

auto WorktreeSynchronizer::apply_squash(const ExecutionRecord& record,
                                        const SyncPreview& preview,
                                        const SyncOptions& options,
                                        SyncResult& result) const
    -> Result<std::string> {
  if (auto r = git_.checkout(record.target_branch); !r) {
    result.error = std::format("git checkout {} failed", record.target_branch);
    return fail(r.error());
  }
  if (!preview.commits.empty()) {
    if (auto r = git_.merge_squash(record.branch_name); !r) {
      result.error = std::format("git merge --squash {} failed",
                                 record.branch_name);
      return fail(r.error());
    }
    if (auto r = resolve_unmerged(record, preview, result); !r) {
      return fail(r.error());
    }
  }
  if (options.mode == SyncMode::Stage && options.include_uncommitted) {
    if (auto r = copy_uncommitted(record, result); !r) {
      return fail(r.error());
    }
  }

  auto staged = git_.staged_files();
  if (!staged) {
    result.error = "Cannot list staged files";
    return fail(staged.error());
  }
  if (staged->empty()) {
    result.error = std::format("{} brings no changes to {}", record.branch_name,
                               record.target_branch);
    result.warnings.push_back(result.error);
    return fail(Error::InvalidState);
  }
  result.files_changed = staged->size();

  if (options.mode == SyncMode::Stage) {
    return std::string{};
  }

  auto text = options.message.empty()
                  ? default_squash_message(record, preview.commits.size())
                  : options.message;
  auto sha = git_.commit(text);
  if (!sha) {
    result.error = "git commit failed";
    return fail(sha.error());
  }
  return sha;
}

auto WorktreeSynchronizer::apply_preserve(const ExecutionRecord& record,
                                          const SyncPreview& preview,
                                          const SyncOptions& options,
                                          std::string_view old_target,
                                          SyncResult& result) const
    -> Result<std::string> {
  if (auto r = git_.checkout(record.target_branch); !r) {
    result.error = std::format("git checkout {} failed", record.target_branch);
    return fail(r.error());
  }

  auto text = options.message.empty()
                  ? default_merge_message(record, preview.commits.size())
                  : options.message;
  if (auto r = git_.merge_no_ff(record.branch_name, text); !r) {
    result.error = std::format("git merge {} failed", record.branch_name);
    return fail(r.error());
  }
  if (auto r = resolve_unmerged(record, preview, result); !r) {
    return fail(r.error());
  }
  // A merge that stopped on structured logs is concluded here.
  if (!result.resolved_logs.empty()) {
    if (auto r = git_.commit(text); !r) {
      result.error = "git commit failed";
      return fail(r.error());
    }
  }

  auto changed = git_.changed_files(old_target, "HEAD");
  if (!changed) {
    result.error = "Cannot list merged files";
    return fail(changed.error());
  }
  result.files_changed = changed->size();
  return git_.rev_parse("HEAD");
}

auto WorktreeSynchronizer::resolve_unmerged(const ExecutionRecord& record,
                                            const SyncPreview& preview,
                                            SyncResult& result) const
    -> Result<void> {
  auto unmerged = git_.unmerged_files();
  if (!unmerged) {
    result.error = "Cannot list unmerged files";
    return fail(unmerged.error());
  }

  std::vector<std::string> unresolved;
  for (const auto& path : *unmerged) {
    if (!detector_.matcher().is_structured_log(path)) {
      unresolved.push_back(path);
      continue;
    }
    if (auto r = resolve_structured_log(record, preview.merge_base, path); !r) {
      result.error = std::format("Could not resolve {}", path);
      result.warnings.push_back(result.error);
      return fail(r.error());
    }
    result.resolved_logs.push_back(path);
  }
  if (!unresolved.empty()) {
    result.has_conflicts = true;
    for (const auto& path : unresolved) {
      result.warnings.push_back(std::format("Unresolved conflict in {}", path));
    }
    result.error = std::format("{} file(s) still conflict after the merge",
                               unresolved.size());
    return fail(Error::InvalidState);
  }
  return ok();
}

auto WorktreeSynchronizer::copy_uncommitted(const ExecutionRecord& record,
                                            SyncResult& result) const
    -> Result<void> {
  GitCli worktree(record.worktree_path);
  auto modified = worktree.modified_files();
  auto untracked = worktree.untracked_files();
  if (!modified || !untracked) {
    result.error = std::format("Cannot list uncommitted files in {}",
                               record.worktree_path);
    return fail(!modified ? modified.error() : untracked.error());
  }
  auto paths = std::move(*modified);
  paths.insert(paths.end(), untracked->begin(), untracked->end());
  std::ranges::sort(paths);
  auto dup = std::ranges::unique(paths);
  paths.erase(dup.begin(), dup.end());

  for (const auto& path : paths) {
    auto src = fs::path(record.worktree_path) / path;
    std::error_code ec;
    // Deleted in the worktree; nothing to copy.
    if (!fs::is_regular_file(src, ec)) {
      continue;
    }
    auto dest = fs::path(git_.repo_path()) / path;
    fs::create_directories(dest.parent_path(), ec);
    if (!ec) {
      fs::copy_file(src, dest, fs::copy_options::overwrite_existing, ec);
    }
    if (ec) {
      log::error("Cannot copy {} to {}: {}", src.string(), dest.string(),
                 ec.message());
      result.error = std::format("Could not copy {}", path);
      return fail(Error::FileOpenFailed);
    }
    if (auto r = git_.add(path); !r) {
      result.error = std::format("git add {} failed", path);
      return fail(r.error());
    }
    ++result.uncommitted_files;
  }
  log::info("Copied {} uncommitted file(s) from {}", result.uncommitted_files,
            record.worktree_path);
  return ok();
}

auto WorktreeSynchronizer::resolve_structured_log(
    const ExecutionRecord& record, const std::string& merge_base,
    const std::string& path) const -> Result<void> {
  auto base = git_.show_file(merge_base, path);
  auto ours = git_.show_file(record.target_branch, path);
  auto theirs = git_.show_file(record.branch_name, path);
  if (!base || !ours || !theirs) {
    return fail(Error::GitCommandFailed);
  }

  auto merged = merge_three_way(
      base->value_or(std::string{}), ours->value_or(std::string{}),
      theirs->value_or(std::string{}),
      MergeLabels{record.target_branch, "base", record.branch_name});
  if (!merged) {
    return fail(merged.error());
  }

  std::string content = std::move(merged->content);
  if (merged->has_conflicts) {
    auto resolved = resolve_jsonl(content);
    if (!resolved) {
      log::error("Structured log {} could not be resolved: {}", path,
                 resolved.error().message());
      return fail(resolved.error());
    }
    content = std::move(*resolved);
  }

  auto full_path = fs::path(git_.repo_path()) / path;
  if (!write_file(full_path, content)) {
    log::error("Cannot write resolved log {}", full_path.string());
    return fail(Error::FileOpenFailed);
  }
  if (auto r = git_.add(path); !r) {
    return fail(r.error());
  }
  log::info("Auto-resolved structured log {} ({} conflicting hunk(s))", path,
            merged->conflict_count);
  return ok();
}

auto WorktreeSynchronizer::rollback(std::string_view target_branch,
                                    std::string_view tag,
                                    std::string_view previous_branch,
                                    SyncResult& result) const -> void {
  log::warn("Sync failed ({}), rolling back to {}", result.error, tag);
  // A failed checkout leaves HEAD elsewhere; resetting would move that branch.
  auto current = git_.current_branch();
  if (!current || *current != target_branch) {
    result.warnings.push_back(
        std::format("{} was not checked out; nothing to roll back",
                    target_branch));
    return;
  }
  auto reset = git_.reset_hard(tag);
  if (!reset) {
    result.warnings.push_back(std::format(
        "Rollback failed; restore the target branch from tag {}", tag));
    return;
  }
  result.warnings.push_back(std::format("Target branch restored from {}", tag));

  if (previous_branch == target_branch) {
    return;
  }
  if (auto r = git_.checkout(previous_branch); !r) {
    result.warnings.push_back(
        std::format("Could not switch back to {}", previous_branch));
  }
}

auto WorktreeSynchronizer::backup_tag_name(const ExecutionId& id) const
    -> std::string {
  auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
  gmtime_r(&now, &tm);
  std::array<char, 32> stamp{};
  std::strftime(stamp.data(), stamp.size(), "%Y%m%dT%H%M%S", &tm);
  return std::format("{}{}-{}-{}", config_.tag_prefix, id, stamp.data(),
                     generate_short_uuid());
}

}  // namespace taskweave
