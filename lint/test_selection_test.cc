#include "lint/test_selection.h"

#include <string>

#include "common/int_set.h"
#include "gtest/gtest.h"
#include "lint/errors.h"
#include "lint/tag_catalog.h"

using common::IntSet;

namespace lint {

class TestSelectionTest : public ::testing::Test {
 protected:
  TestSelectionTest() : selection_(&DefaultTagCatalog()) {}

  TestSelection selection_;
};

TEST_F(TestSelectionTest, EnableSubtree) {
  ASSERT_TRUE(selection_.Empty());
  ASSERT_TRUE(selection_.Enable("cmap/tables").ok());

  TagSet expected{"cmap/tables", "cmap/tables/missing",
                  "cmap/tables/unexpected", "cmap/tables/format_12_has_bmp",
                  "cmap/tables/format_4_subset_of_12"};
  ASSERT_EQ(selection_.TouchedTags(), expected);
  ASSERT_EQ(selection_.EnabledTags(), expected);
  ASSERT_TRUE(selection_.Filters().empty());
}

TEST_F(TestSelectionTest, DisableSubtree) {
  ASSERT_TRUE(selection_.Enable("cmap").ok());
  ASSERT_TRUE(selection_.Disable("cmap/tables").ok());

  ASSERT_EQ(selection_.TouchedTags().size(), 11);
  ASSERT_EQ(selection_.EnabledTags().size(), 6);
  ASSERT_TRUE(selection_.EnabledTags().contains("cmap/required"));
  ASSERT_FALSE(selection_.EnabledTags().contains("cmap/tables/missing"));
  ASSERT_TRUE(selection_.TouchedTags().contains("cmap/tables/missing"));
}

TEST_F(TestSelectionTest, DisableTwice) {
  ASSERT_TRUE(selection_.Disable("reachable").ok());
  ASSERT_TRUE(selection_.Disable("reachable").ok());

  ASSERT_EQ(selection_.TouchedTags(), (TagSet{"reachable"}));
  ASSERT_TRUE(selection_.EnabledTags().empty());
}

TEST_F(TestSelectionTest, EnableWithFilter) {
  ASSERT_TRUE(
      selection_.Enable("cmap/script_required", "except", "cp", "41-5A").ok());

  ASSERT_EQ(selection_.EnabledTags(), (TagSet{"cmap/script_required"}));
  auto it = selection_.Filters().find("cmap/script_required");
  ASSERT_NE(it, selection_.Filters().end());
  ASSERT_FALSE(it->second.AcceptIfIn());
  ASSERT_FALSE(it->second.Accept(0x41));
  ASSERT_FALSE(it->second.Accept(0x5A));
  ASSERT_TRUE(it->second.Accept(0x40));
  ASSERT_TRUE(it->second.Accept(0x61));
}

TEST_F(TestSelectionTest, EnableClause) {
  ASSERT_TRUE(
      selection_.EnableClause("bounds/glyph/ymax only gid 1-3 7").ok());
  auto it = selection_.Filters().find("bounds/glyph/ymax");
  ASSERT_NE(it, selection_.Filters().end());
  ASSERT_TRUE(it->second.AcceptIfIn());
  ASSERT_EQ(it->second.Values(), (IntSet{1, 2, 3, 7}));

  ASSERT_TRUE(
      selection_.EnableClause("  script_required only cp 900-97f ").ok());
  it = selection_.Filters().find("cmap/script_required");
  ASSERT_NE(it, selection_.Filters().end());
  ASSERT_EQ(it->second.Values().size(), 0x80);

  ASSERT_TRUE(selection_.EnableClause("paths").ok());
  ASSERT_TRUE(selection_.EnabledTags().contains("paths/extrema"));
}

TEST_F(TestSelectionTest, EnableClauseMalformed) {
  for (const char* clause :
       {"", "cmap/script_required except", "cmap/script_required except cp",
        "cmap/script_required never cp 41", "Name", "cmap table"}) {
    auto status = selection_.EnableClause(clause);
    ASSERT_EQ(ErrorKindOf(status), ErrorKind::kGrammar)
        << "'" << clause << "': " << status;
  }
}

TEST_F(TestSelectionTest, FilterOnTagWithoutOptions) {
  auto status = selection_.Enable("paths/extrema", "except", "cp", "41");
  ASSERT_TRUE(absl::IsInvalidArgument(status)) << status;
  ASSERT_EQ(ErrorKindOf(status), ErrorKind::kUnsupportedRelation);
  ASSERT_TRUE(selection_.Empty());
}

TEST_F(TestSelectionTest, FilterWithDisallowedRelation) {
  auto status = selection_.Enable("cmap/script_required", "never", "cp", "41");
  ASSERT_EQ(ErrorKindOf(status), ErrorKind::kUnsupportedRelation);
}

TEST_F(TestSelectionTest, FilterWithDisallowedArgType) {
  auto status = selection_.Enable("cmap/script_required", "only", "gid", "41");
  ASSERT_EQ(ErrorKindOf(status), ErrorKind::kArgTypeMismatch);
}

TEST_F(TestSelectionTest, FilterWithUnsupportedArgType) {
  auto catalog = TagCatalog::Create("tag only|except name|cp\n");
  ASSERT_TRUE(catalog.ok()) << catalog.status();
  TestSelection selection(&*catalog);

  auto status = selection.Enable("tag", "only", "name", "foo");
  ASSERT_EQ(ErrorKindOf(status), ErrorKind::kArgTypeMismatch);
  ASSERT_TRUE(selection.Enable("tag", "only", "cp", "41").ok());
}

TEST_F(TestSelectionTest, FilterOnMultipleTags) {
  auto status = selection_.Enable("bounds/glyph", "except", "cp", "41");
  ASSERT_EQ(ErrorKindOf(status), ErrorKind::kMultiTagFilter);
  ASSERT_TRUE(selection_.Empty());
}

TEST_F(TestSelectionTest, FilterWithBadValues) {
  auto status =
      selection_.Enable("cmap/script_required", "except", "cp", "41 41");
  ASSERT_EQ(ErrorKindOf(status), ErrorKind::kIntegerSet);
  status = selection_.EnableClause("bounds/glyph/ymin except gid 5-2");
  ASSERT_EQ(ErrorKindOf(status), ErrorKind::kIntegerSet);
}

TEST_F(TestSelectionTest, UnknownAndAmbiguousTags) {
  ASSERT_EQ(ErrorKindOf(selection_.Enable("nosuchtest")),
            ErrorKind::kUnknownTag);
  ASSERT_EQ(ErrorKindOf(selection_.Disable("nosuchtest")),
            ErrorKind::kUnknownTag);
  ASSERT_EQ(ErrorKindOf(selection_.Disable("linegap")),
            ErrorKind::kAmbiguousTag);
  ASSERT_TRUE(selection_.Empty());
}

TEST_F(TestSelectionTest, ApplyTo) {
  TagSet enabled{"cmap/required", "name", "name/version", "reachable"};
  TagFilters filters;
  filters.insert_or_assign("bounds/glyph/ymax",
                           IntSetFilter(true, "gid", IntSet{1}));
  filters.insert_or_assign("cmap/script_required",
                           IntSetFilter(true, "cp", IntSet{0x41}));

  ASSERT_TRUE(selection_.Disable("name").ok());
  ASSERT_TRUE(selection_.Enable("paths/extrema").ok());
  ASSERT_TRUE(selection_.Enable("cmap/script_required", "except", "cp",
                                "61-7a")
                  .ok());
  ASSERT_TRUE(selection_.Disable("bounds/glyph/ymax").ok());
  selection_.ApplyTo(enabled, filters);

  ASSERT_EQ(enabled, (TagSet{"cmap/required", "cmap/script_required",
                             "paths/extrema", "reachable"}));
  ASSERT_EQ(filters.size(), 1);
  IntSet lower;
  lower.insert_range(0x61, 0x7a);
  ASSERT_EQ(filters.at("cmap/script_required"),
            IntSetFilter(false, "cp", lower));
  ASSERT_EQ(filters.at("cmap/script_required").ToString(),
            "except cp 0061-007a");
}

}  // namespace lint
