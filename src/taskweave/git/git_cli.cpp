#include "taskweave/git/git_cli.hpp"

#include "taskweave/util/log.hpp"

#include <charconv>

namespace taskweave {

namespace {

inline constexpr char FIELD_SEP = '\x1f';

auto trim(std::string_view s) -> std::string_view {
  auto first = s.find_first_not_of(" \t\r\n");
  if (first == std::string_view::npos) {
    return {};
  }
  auto last = s.find_last_not_of(" \t\r\n");
  return s.substr(first, last - first + 1);
}

auto join_args(const std::vector<std::string>& args) -> std::string {
  std::string out = "git";
  for (const auto& a : args) {
    out += ' ';
    out += a;
  }
  return out;
}

auto split(std::string_view s, char sep) -> std::vector<std::string_view> {
  std::vector<std::string_view> parts;
  std::size_t start = 0;
  for (;;) {
    auto pos = s.find(sep, start);
    if (pos == std::string_view::npos) {
      parts.push_back(s.substr(start));
      return parts;
    }
    parts.push_back(s.substr(start, pos - start));
    start = pos + 1;
  }
}

template <typename T>
auto parse_number(std::string_view s, T fallback) -> T {
  T value{};
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
  return ec == std::errc{} ? value : fallback;
}

}  // namespace

auto split_lines(std::string_view text) -> std::vector<std::string> {
  std::vector<std::string> out;
  for (auto line : split(text, '\n')) {
    auto t = trim(line);
    if (!t.empty()) {
      out.emplace_back(t);
    }
  }
  return out;
}

GitCli::GitCli(std::string repo_path) : repo_path_(std::move(repo_path)) {}

auto GitCli::run_raw(std::vector<std::string> args) const
    -> Result<ProcessResult> {
  std::vector<std::string> argv{"git", "-c", "core.quotePath=false"};
  argv.insert(argv.end(), std::make_move_iterator(args.begin()),
              std::make_move_iterator(args.end()));

  ProcessOptions options;
  options.working_dir = repo_path_;
  // Keep git from waiting on an editor or a credential prompt.
  options.env = {{"GIT_TERMINAL_PROMPT", "0"}, {"GIT_EDITOR", "true"}};
  // Blob contents are written back to disk, so never cut them short.
  options.max_output = 0;
  return run_process(argv, options);
}

auto GitCli::run(std::vector<std::string> args) const -> Result<std::string> {
  auto command = join_args(args);
  auto result = run_raw(std::move(args));
  if (!result) {
    log::error("{} could not be started in {}", command, repo_path_);
    return fail(result.error());
  }
  if (result->exit_code != 0) {
    log::error("{} failed in {} (exit {}): {}", command, repo_path_,
               result->exit_code, trim(result->stderr_output));
    return fail(Error::GitCommandFailed);
  }
  log::trace("{} ok", command);
  return ok(std::move(result->stdout_output));
}

auto GitCli::lines(std::vector<std::string> args) const
    -> Result<std::vector<std::string>> {
  auto out = run(std::move(args));
  if (!out) {
    return fail(out.error());
  }
  return split_lines(*out);
}

auto GitCli::merge_base(std::string_view a, std::string_view b) const
    -> Result<std::string> {
  auto result = run_raw({"merge-base", std::string(a), std::string(b)});
  if (!result) {
    return fail(result.error());
  }
  // Exit 1 with no output: the histories share no commit.
  if (result->exit_code == 1 && trim(result->stdout_output).empty()) {
    log::warn("{} and {} have no common history", a, b);
    return fail(Error::NoCommonBase);
  }
  if (result->exit_code != 0) {
    log::error("git merge-base {} {} failed (exit {}): {}", a, b,
               result->exit_code, trim(result->stderr_output));
    return fail(Error::GitCommandFailed);
  }
  return std::string(trim(result->stdout_output));
}

auto GitCli::changed_files(std::string_view from, std::string_view to) const
    -> Result<std::vector<std::string>> {
  return lines({"diff", "--name-only", "--no-renames", std::string(from),
                std::string(to)});
}

auto GitCli::diff_stat(std::string_view from, std::string_view to) const
    -> Result<DiffStat> {
  auto out = lines(
      {"diff", "--numstat", "--no-renames", std::string(from), std::string(to)});
  if (!out) {
    return fail(out.error());
  }
  DiffStat stat;
  for (const auto& line : *out) {
    auto parts = split(line, '\t');
    if (parts.size() < 3) {
      continue;
    }
    // Binary files report "-" for both counts.
    stat.additions += parse_number<std::size_t>(parts[0], 0);
    stat.deletions += parse_number<std::size_t>(parts[1], 0);
    stat.files.emplace_back(parts[2]);
  }
  return stat;
}

auto GitCli::show_file(std::string_view rev, std::string_view path) const
    -> Result<std::optional<std::string>> {
  auto object = std::format("{}:{}", rev, path);
  auto exists = run_raw({"cat-file", "-e", object});
  if (!exists) {
    return fail(exists.error());
  }
  if (exists->exit_code != 0) {
    return std::optional<std::string>{};
  }
  auto content = run({"show", object});
  if (!content) {
    return fail(content.error());
  }
  return std::optional<std::string>{std::move(*content)};
}

auto GitCli::rev_parse(std::string_view ref) const -> Result<std::string> {
  auto out = run({"rev-parse", "--verify", std::format("{}^{{commit}}", ref)});
  if (!out) {
    return fail(out.error());
  }
  return std::string(trim(*out));
}

auto GitCli::ref_exists(std::string_view ref) const -> bool {
  auto result = run_raw(
      {"rev-parse", "--verify", "--quiet", std::format("{}^{{commit}}", ref)});
  return result && result->exit_code == 0;
}

auto GitCli::branch_exists(std::string_view branch) const -> bool {
  auto result = run_raw({"show-ref", "--verify", "--quiet",
                         std::format("refs/heads/{}", branch)});
  return result && result->exit_code == 0;
}

auto GitCli::tag_exists(std::string_view tag) const -> bool {
  auto result = run_raw(
      {"show-ref", "--verify", "--quiet", std::format("refs/tags/{}", tag)});
  return result && result->exit_code == 0;
}

auto GitCli::current_branch() const -> Result<std::string> {
  auto out = run({"rev-parse", "--abbrev-ref", "HEAD"});
  if (!out) {
    return fail(out.error());
  }
  auto name = std::string(trim(*out));
  if (name == "HEAD") {
    return rev_parse("HEAD");
  }
  return name;
}

auto GitCli::commit_list(std::string_view base, std::string_view head) const
    -> Result<std::vector<GitCommit>> {
  auto out = lines({"log", "--reverse", "--format=%H%x1f%an%x1f%ae%x1f%at%x1f%s",
                    std::format("{}..{}", base, head)});
  if (!out) {
    return fail(out.error());
  }
  std::vector<GitCommit> commits;
  for (const auto& line : *out) {
    auto parts = split(line, FIELD_SEP);
    if (parts.size() < 5) {
      continue;
    }
    GitCommit c;
    c.sha = parts[0];
    c.author = parts[1];
    c.email = parts[2];
    c.timestamp = parse_number<std::int64_t>(parts[3], 0);
    c.message = parts[4];
    commits.push_back(std::move(c));
  }
  return commits;
}

auto GitCli::is_clean() const -> Result<bool> {
  // Untracked files are ignored; worktrees often live under the checkout.
  auto out = run({"status", "--porcelain", "--untracked-files=no"});
  if (!out) {
    return fail(out.error());
  }
  return trim(*out).empty();
}

auto GitCli::is_ancestor(std::string_view ancestor,
                         std::string_view descendant) const -> Result<bool> {
  auto result = run_raw({"merge-base", "--is-ancestor", std::string(ancestor),
                         std::string(descendant)});
  if (!result) {
    return fail(result.error());
  }
  if (result->exit_code == 0 || result->exit_code == 1) {
    return result->exit_code == 0;
  }
  log::error("git merge-base --is-ancestor {} {} failed (exit {}): {}",
             ancestor, descendant, result->exit_code,
             trim(result->stderr_output));
  return fail(Error::GitCommandFailed);
}

auto GitCli::modified_files() const -> Result<std::vector<std::string>> {
  return lines({"diff", "--name-only"});
}

auto GitCli::untracked_files() const -> Result<std::vector<std::string>> {
  return lines({"ls-files", "--others", "--exclude-standard"});
}

auto GitCli::create_tag(std::string_view name, std::string_view ref,
                        std::string_view message) const -> Result<void> {
  auto out = run({"tag", "-a", std::string(name), std::string(ref), "-m",
                  std::string(message)});
  if (!out) {
    return fail(out.error());
  }
  return ok();
}

auto GitCli::checkout(std::string_view ref) const -> Result<void> {
  auto out = run({"checkout", "--quiet", std::string(ref)});
  if (!out) {
    return fail(out.error());
  }
  return ok();
}

auto GitCli::merge_squash(std::string_view branch) const -> Result<void> {
  auto result = run_raw({"merge", "--squash", std::string(branch)});
  if (!result) {
    return fail(result.error());
  }
  if (result->exit_code == 0) {
    return ok();
  }
  // Exit 1 with unmerged paths is a conflicted squash, which the caller
  // resolves; anything else did not apply.
  auto unmerged = unmerged_files();
  if (unmerged && !unmerged->empty()) {
    log::info("Squash of {} left {} unmerged path(s)", branch,
              unmerged->size());
    return ok();
  }
  log::error("git merge --squash {} failed (exit {}): {}", branch,
             result->exit_code, trim(result->stderr_output));
  return fail(Error::GitCommandFailed);
}

auto GitCli::merge_no_ff(std::string_view branch,
                         std::string_view message) const -> Result<void> {
  auto result = run_raw({"merge", "--no-ff", "--no-edit", "-m",
                         std::string(message), std::string(branch)});
  if (!result) {
    return fail(result.error());
  }
  if (result->exit_code == 0) {
    return ok();
  }
  auto unmerged = unmerged_files();
  if (unmerged && !unmerged->empty()) {
    log::info("Merge of {} stopped on {} unmerged path(s)", branch,
              unmerged->size());
    return ok();
  }
  log::error("git merge --no-ff {} failed (exit {}): {}", branch,
             result->exit_code, trim(result->stderr_output));
  return fail(Error::GitCommandFailed);
}

auto GitCli::unmerged_files() const -> Result<std::vector<std::string>> {
  return lines({"diff", "--name-only", "--diff-filter=U"});
}

auto GitCli::staged_files() const -> Result<std::vector<std::string>> {
  return lines({"diff", "--cached", "--name-only"});
}

auto GitCli::add(std::string_view path) const -> Result<void> {
  auto out = run({"add", "--", std::string(path)});
  if (!out) {
    return fail(out.error());
  }
  return ok();
}

auto GitCli::commit(std::string_view message) const -> Result<std::string> {
  auto out = run({"commit", "--quiet", "-m", std::string(message)});
  if (!out) {
    return fail(out.error());
  }
  return rev_parse("HEAD");
}

auto GitCli::reset_hard(std::string_view ref) const -> Result<void> {
  auto out = run({"reset", "--hard", "--quiet", std::string(ref)});
  if (!out) {
    return fail(out.error());
  }
  return ok();
}

auto GitCli::worktree_add(std::string_view path, std::string_view new_branch,
                          std::string_view base) const -> Result<void> {
  auto out = run({"worktree", "add", "--quiet", "-b", std::string(new_branch),
                  std::string(path), std::string(base)});
  if (!out) {
    return fail(out.error());
  }
  return ok();
}

auto GitCli::worktree_remove(std::string_view path) const -> Result<void> {
  auto out = run({"worktree", "remove", "--force", std::string(path)});
  if (!out) {
    return fail(out.error());
  }
  return ok();
}

auto GitCli::delete_branch(std::string_view branch) const -> Result<void> {
  auto out = run({"branch", "-D", std::string(branch)});
  if (!out) {
    return fail(out.error());
  }
  return ok();
}

}  // namespace taskweave
