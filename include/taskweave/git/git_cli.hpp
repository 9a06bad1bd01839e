#pragma once

#include "taskweave/core/error.hpp"
#include "taskweave/process/subprocess.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace taskweave {

struct GitCommit {
  std::string sha;
  std::string author;
  std::string email;
  std::int64_t timestamp{0};
  std::string message;
};

struct DiffStat {
  std::vector<std::string> files;
  std::size_t additions{0};
  std::size_t deletions{0};
};

// Typed wrappers over the git command line, run in one repository or
// worktree. Every call is an argument vector; failures are logged with the
// command, exit status and stderr and come back as Error::GitCommandFailed.
class GitCli {
public:
  explicit GitCli(std::string repo_path);

  [[nodiscard]] auto repo_path() const noexcept -> const std::string& {
    return repo_path_;
  }

  // stdout of `git <args>`; non-zero exit is an error.
  [[nodiscard]] auto run(std::vector<std::string> args) const
      -> Result<std::string>;
  // Whatever git returned; only a failure to start git is an error.
  [[nodiscard]] auto run_raw(std::vector<std::string> args) const
      -> Result<ProcessResult>;

  // Error::NoCommonBase when the histories are unrelated.
  [[nodiscard]] auto merge_base(std::string_view a, std::string_view b) const
      -> Result<std::string>;
  [[nodiscard]] auto changed_files(std::string_view from,
                                   std::string_view to) const
      -> Result<std::vector<std::string>>;
  [[nodiscard]] auto diff_stat(std::string_view from, std::string_view to) const
      -> Result<DiffStat>;
  // nullopt when `path` does not exist at `rev`.
  [[nodiscard]] auto show_file(std::string_view rev, std::string_view path) const
      -> Result<std::optional<std::string>>;
  [[nodiscard]] auto rev_parse(std::string_view ref) const
      -> Result<std::string>;
  [[nodiscard]] auto ref_exists(std::string_view ref) const -> bool;
  [[nodiscard]] auto branch_exists(std::string_view branch) const -> bool;
  [[nodiscard]] auto tag_exists(std::string_view tag) const -> bool;
  // Branch name, or the commit sha when HEAD is detached.
  [[nodiscard]] auto current_branch() const -> Result<std::string>;
  // Oldest first.
  [[nodiscard]] auto commit_list(std::string_view base,
                                 std::string_view head) const
      -> Result<std::vector<GitCommit>>;
  [[nodiscard]] auto is_clean() const -> Result<bool>;
  // True when every commit of `ancestor` is already in `descendant`.
  [[nodiscard]] auto is_ancestor(std::string_view ancestor,
                                 std::string_view descendant) const
      -> Result<bool>;
  // Tracked files with unstaged changes, and untracked files outside
  // .gitignore.
  [[nodiscard]] auto modified_files() const -> Result<std::vector<std::string>>;
  [[nodiscard]] auto untracked_files() const
      -> Result<std::vector<std::string>>;

  [[nodiscard]] auto create_tag(std::string_view name, std::string_view ref,
                                std::string_view message) const -> Result<void>;
  [[nodiscard]] auto checkout(std::string_view ref) const -> Result<void>;
  // Ok when the squash applied, with or without unmerged paths.
  [[nodiscard]] auto merge_squash(std::string_view branch) const
      -> Result<void>;
  // Always records a merge commit. Ok when it committed or stopped on
  // conflicts.
  [[nodiscard]] auto merge_no_ff(std::string_view branch,
                                 std::string_view message) const
      -> Result<void>;
  [[nodiscard]] auto unmerged_files() const -> Result<std::vector<std::string>>;
  [[nodiscard]] auto staged_files() const -> Result<std::vector<std::string>>;
  [[nodiscard]] auto add(std::string_view path) const -> Result<void>;
  // Returns the new HEAD sha.
  [[nodiscard]] auto commit(std::string_view message) const
      -> Result<std::string>;
  [[nodiscard]] auto reset_hard(std::string_view ref) const -> Result<void>;

  [[nodiscard]] auto worktree_add(std::string_view path,
                                  std::string_view new_branch,
                                  std::string_view base) const -> Result<void>;
  [[nodiscard]] auto worktree_remove(std::string_view path) const
      -> Result<void>;
  [[nodiscard]] auto delete_branch(std::string_view branch) const
      -> Result<void>;

private:
  [[nodiscard]] auto lines(std::vector<std::string> args) const
      -> Result<std::vector<std::string>>;

  std::string repo_path_;
};

[[nodiscard]] auto split_lines(std::string_view text)
    -> std::vector<std::string>;

}  // namespace taskweave
