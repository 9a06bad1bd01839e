#include "taskweave/sync/line_merge.hpp"

#include "test_utils.hpp"

#include <filesystem>
#include <string>

#include "gtest/gtest.h"

using namespace taskweave;

namespace {

auto count_scratch_dirs() -> std::size_t {
  std::size_t n = 0;
  for (const auto& entry :
       std::filesystem::directory_iterator(std::filesystem::temp_directory_path())) {
    if (entry.path().filename().string().starts_with("taskweave-merge-")) {
      ++n;
    }
  }
  return n;
}

}  // namespace

TEST(LineMergeTest, DisjointEdits_MergeCleanly) {
  std::string base = "one\ntwo\nthree\nfour\nfive\n";
  std::string ours = "ONE\ntwo\nthree\nfour\nfive\n";
  std::string theirs = "one\ntwo\nthree\nfour\nFIVE\n";

  auto r = merge_three_way(base, ours, theirs);
  ASSERT_TRUE(r.has_value());
  EXPECT_TRUE(r->success);
  EXPECT_FALSE(r->has_conflicts);
  EXPECT_EQ(r->conflict_count, 0);
  EXPECT_EQ(r->content, "ONE\ntwo\nthree\nfour\nFIVE\n");
}

TEST(LineMergeTest, IdenticalSides_MergeCleanly) {
  auto r = merge_three_way("a\n", "b\n", "b\n");
  ASSERT_TRUE(r.has_value());
  EXPECT_FALSE(r->has_conflicts);
  EXPECT_EQ(r->content, "b\n");
}

TEST(LineMergeTest, OverlappingEdits_ProduceMarkers) {
  auto r = merge_three_way("value\n", "ours\n", "theirs\n",
                           MergeLabels{"main", "base", "feature"});
  ASSERT_TRUE(r.has_value());
  EXPECT_FALSE(r->success);
  EXPECT_TRUE(r->has_conflicts);
  EXPECT_EQ(r->conflict_count, 1);
  EXPECT_NE(r->content.find("<<<<<<< main"), std::string::npos);
  EXPECT_NE(r->content.find(">>>>>>> feature"), std::string::npos);
  EXPECT_NE(r->content.find("ours\n"), std::string::npos);
  EXPECT_NE(r->content.find("theirs\n"), std::string::npos);
  EXPECT_TRUE(has_conflict_markers(r->content));
}

TEST(LineMergeTest, EmptyBase_BothAdded) {
  auto r = merge_three_way("", "added by us\n", "added by them\n");
  ASSERT_TRUE(r.has_value());
  EXPECT_TRUE(r->has_conflicts);
}

TEST(LineMergeTest, ContentWithoutTrailingNewline_IsPreserved) {
  auto r = merge_three_way("x", "x", "y");
  ASSERT_TRUE(r.has_value());
  EXPECT_FALSE(r->has_conflicts);
  EXPECT_EQ(r->content, "y");
}

TEST(LineMergeTest, ScratchFilesAreRemoved) {
  auto before = count_scratch_dirs();
  for (int i = 0; i < 3; ++i) {
    auto r = merge_three_way("a\n", "b\n", "c\n");
    ASSERT_TRUE(r.has_value());
  }
  EXPECT_EQ(count_scratch_dirs(), before);
}

TEST(LineMergeTest, BinaryInput_ReportsMergeToolFailure) {
  auto before = count_scratch_dirs();
  std::string base("one\0two\n", 8);
  std::string ours("ONE\0two\n", 8);
  std::string theirs("one\0TWO\n", 8);

  auto r = merge_three_way(base, ours, theirs);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::MergeToolFailed));
  EXPECT_EQ(count_scratch_dirs(), before);
}

TEST(ConflictMarkersTest, RequiresAllThreeMarkersAtLineStart) {
  EXPECT_TRUE(has_conflict_markers("<<<<<<< a\nx\n=======\ny\n>>>>>>> b\n"));
  EXPECT_FALSE(has_conflict_markers("plain text\n"));
  EXPECT_FALSE(has_conflict_markers("<<<<<<< a\nx\n=======\n"));
  EXPECT_FALSE(has_conflict_markers("text <<<<<<< a ======= >>>>>>> b\n"));
}
