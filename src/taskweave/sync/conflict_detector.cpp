#include "taskweave/sync/conflict_detector.hpp"

#include "taskweave/sync/line_merge.hpp"
#include "taskweave/util/log.hpp"

#include <unordered_set>

namespace taskweave {

namespace {

auto basename_of(std::string_view path) -> std::string_view {
  auto slash = path.find_last_of('/');
  return slash == std::string_view::npos ? path : path.substr(slash + 1);
}

auto plural(std::size_t n) -> std::string_view {
  return n == 1 ? "" : "s";
}

auto make_code_conflict(std::string path, CodeConflictType type)
    -> CodeConflict {
  CodeConflict c;
  c.file_path = std::move(path);
  c.conflict_type = type;
  if (type == CodeConflictType::ModifyDelete) {
    c.description = "File modified on one branch and deleted on the other";
    c.resolution_strategy =
        "Decide whether to keep the modified file or accept the deletion, "
        "then stage the result";
  } else {
    c.description = "File modified on both branches";
    c.resolution_strategy =
        "Review both versions and merge by hand, or keep one side with "
        "git checkout --ours/--theirs";
  }
  return c;
}

}  // namespace

StructuredLogMatcher::StructuredLogMatcher()
    : rules_(SyncConfig{}.structured_logs) {}

StructuredLogMatcher::StructuredLogMatcher(std::vector<StructuredLogRule> rules)
    : rules_(std::move(rules)) {}

auto StructuredLogMatcher::match(std::string_view path) const
    -> std::optional<std::string> {
  auto name = basename_of(path);
  for (const auto& rule : rules_) {
    if (name == rule.name) {
      return rule.entity;
    }
  }
  return std::nullopt;
}

auto finalize_report(ConflictReport& report) -> void {
  auto jsonl = report.jsonl_conflicts.size();
  auto code = report.code_conflicts.size();
  report.total_files = jsonl + code;
  report.has_conflicts = report.total_files > 0;

  if (!report.has_conflicts) {
    report.summary = "No conflicts detected";
    return;
  }
  std::string summary;
  if (jsonl > 0) {
    summary = std::format("{} JSONL conflict{} (auto-resolvable)", jsonl,
                          plural(jsonl));
  }
  if (code > 0) {
    if (!summary.empty()) {
      summary += ", ";
    }
    summary += std::format("{} code conflict{} (requires manual resolution)",
                           code, plural(code));
  }
  report.summary = std::move(summary);
}

ConflictDetector::ConflictDetector(GitCli git, StructuredLogMatcher matcher)
    : git_(std::move(git)), matcher_(std::move(matcher)) {}

auto ConflictDetector::detect_conflicts(std::string_view branch_a,
                                        std::string_view branch_b) const
    -> Result<ConflictReport> {
  auto base = git_.merge_base(branch_a, branch_b);
  if (!base) {
    return fail(base.error());
  }

  auto changed_a = git_.changed_files(*base, branch_a);
  if (!changed_a) {
    return fail(changed_a.error());
  }
  auto changed_b = git_.changed_files(*base, branch_b);
  if (!changed_b) {
    return fail(changed_b.error());
  }

  std::unordered_set<std::string> in_b(changed_b->begin(), changed_b->end());

  ConflictReport report;
  for (const auto& path : *changed_a) {
    if (!in_b.contains(path)) {
      continue;
    }

    auto base_blob = git_.show_file(*base, path);
    auto a_blob = git_.show_file(branch_a, path);
    auto b_blob = git_.show_file(branch_b, path);
    if (!base_blob || !a_blob || !b_blob) {
      return fail(Error::GitCommandFailed);
    }

    std::optional<CodeConflictType> kind;
    if (!a_blob->has_value() && !b_blob->has_value()) {
      // Deleted on both sides.
      continue;
    }
    if (!a_blob->has_value() || !b_blob->has_value()) {
      kind = CodeConflictType::ModifyDelete;
    } else if (**a_blob == **b_blob) {
      continue;
    } else {
      auto merged = merge_three_way(base_blob->value_or(std::string{}),
                                    **a_blob, **b_blob);
      if (!merged) {
        return fail(merged.error());
      }
      if (!merged->has_conflicts) {
        continue;
      }
      kind = CodeConflictType::Content;
    }

    if (auto entity = matcher_.match(path)) {
      report.jsonl_conflicts.push_back(JsonlConflict{path, *entity, true});
    } else {
      report.code_conflicts.push_back(make_code_conflict(path, *kind));
    }
  }

  finalize_report(report);
  log::info("Conflict check {} vs {}: {}", branch_a, branch_b, report.summary);
  return report;
}

}  // namespace taskweave
