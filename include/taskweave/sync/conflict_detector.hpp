#pragma once

#include "taskweave/config/config.hpp"
#include "taskweave/core/error.hpp"
#include "taskweave/git/git_cli.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace taskweave {

struct JsonlConflict {
  std::string file_path;
  std::string entity_type;
  bool can_auto_resolve{true};
};

enum class CodeConflictType : std::uint8_t {
  Content,
  ModifyDelete,
};

[[nodiscard]] constexpr auto to_string_view(CodeConflictType type) noexcept
    -> std::string_view {
  switch (type) {
    case CodeConflictType::Content:
      return "content";
    case CodeConflictType::ModifyDelete:
      return "modify/delete";
  }
  return "unknown";
}

struct CodeConflict {
  std::string file_path;
  CodeConflictType conflict_type{CodeConflictType::Content};
  std::string description;
  std::string resolution_strategy;
  bool can_auto_resolve{false};
};

struct ConflictReport {
  bool has_conflicts{false};
  std::vector<JsonlConflict> jsonl_conflicts;
  std::vector<CodeConflict> code_conflicts;
  std::size_t total_files{0};
  std::string summary{"No conflicts detected"};
};

// Recognises append-only structured logs by basename, at any depth.
class StructuredLogMatcher {
public:
  StructuredLogMatcher();
  explicit StructuredLogMatcher(std::vector<StructuredLogRule> rules);

  // Entity type for a structured log path, nullopt for anything else.
  [[nodiscard]] auto match(std::string_view path) const
      -> std::optional<std::string>;

  [[nodiscard]] auto is_structured_log(std::string_view path) const -> bool {
    return match(path).has_value();
  }

private:
  std::vector<StructuredLogRule> rules_;
};

// Read-only: predicts what merging two branches would conflict on by
// trial-merging each file both sides changed since their merge base.
class ConflictDetector {
public:
  explicit ConflictDetector(GitCli git, StructuredLogMatcher matcher = {});

  [[nodiscard]] auto detect_conflicts(std::string_view branch_a,
                                      std::string_view branch_b) const
      -> Result<ConflictReport>;

  [[nodiscard]] auto matcher() const noexcept -> const StructuredLogMatcher& {
    return matcher_;
  }

private:
  GitCli git_;
  StructuredLogMatcher matcher_;
};

// Fills has_conflicts, total_files and summary from the two lists.
auto finalize_report(ConflictReport& report) -> void;

}  // namespace taskweave
