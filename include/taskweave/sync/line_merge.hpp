#pragma once

#include "taskweave/core/error.hpp"

#include <string>
#include <string_view>

namespace taskweave {

struct MergeLabels {
  std::string ours{"ours"};
  std::string base{"base"};
  std::string theirs{"theirs"};
};

struct MergeResult {
  // True only for a clean merge.
  bool success{false};
  // Merged text; carries conflict markers when has_conflicts is set.
  std::string content;
  bool has_conflicts{false};
  // Conflicting hunks as reported by the merge tool.
  int conflict_count{0};
};

// Line-based diff3 merge of three blobs through `git merge-file`, run on
// private scratch copies that are removed on every exit path. Disjoint edits
// merge, same-line edits conflict, identical edits merge cleanly.
// A tool failure is Error::MergeToolFailed, never a conflict.
[[nodiscard]] auto merge_three_way(std::string_view base, std::string_view ours,
                                   std::string_view theirs,
                                   const MergeLabels& labels = {})
    -> Result<MergeResult>;

// True when start, separator and end markers all appear at line starts.
[[nodiscard]] auto has_conflict_markers(std::string_view text) -> bool;

}  // namespace taskweave
