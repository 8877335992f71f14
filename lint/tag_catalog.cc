#include "lint/tag_catalog.h"

#include <optional>
#include <regex>
#include <string>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"
#include "common/try.h"
#include "lint/errors.h"

using absl::StatusOr;
using absl::StrCat;
using absl::string_view;

namespace lint {

static constexpr char kDefaultTagDescription[] = R"(
  name -- name table tests
    copyright
    family
    subfamily
    full
    version
      hinted_suffix
      match_head
      out_of_range
      expected_pattern
    postscript
    trademark
    manufacturer
    designer
    description
    vendor_url
    designer_url
    license
    license_url
  cmap -- cmap table tests
    tables
      missing
      unexpected
      format_12_has_bmp
      format_4_subset_of_12
    required
    script_required except|only cp
    private_use
    non_characters
    disallowed_ascii
  head -- head table tests
    hhea
      ascent
      descent
      linegap
    vhea
      linegap
    os2
      fstype
      ascender
      descender
      linegap
      winascent
      windescent
      achvendid
      weight_class
      fsselection
      unicoderange
  bounds -- glyf limits etc
    glyph
      ui_ymax except|only cp|gid
      ui_ymin except|only cp|gid
      ymax except|only cp|gid
      ymin except|only cp|gid
    font
      ui_ymax
      ui_ymin
      ymax
      ymin
  paths -- outline tests
    extrema -- missing on-curve extrema
    intersection -- self-intersecting paths
  gdef -- gdef tests
    classdef
      not_present -- table is missing but there are mark glyphs
      unlisted -- mark glyph is present and expected to be listed
      combining_mismatch -- mark glyph is combining but not listed as combining
      not_combining_mismatch -- mark glyph is not combining but listed as combining
    attachlist
      duplicates
      out_of_order
    ligcaretlist
      not_present -- table is missing but there are ligatures
      not_ligature -- listed but not a ligature
      unlisted -- is a ligature but no caret
  complex -- gpos and gsub tests
    gpos
      missing
    gsub
      missing
  bidi -- tests bidi pairs, properties
    rtlm_non_mirrored -- rtlm GSUB feature applied to private-use or non-mirrored character
    ompl_rtlm -- rtlm GSUB feature applied to ompl char
    ompl_missing_pair -- ompl sibling not in cmap
    rtlm_unlisted -- non-ompl bidi char does not have rtlm GSUB feature
  hints
    unexpected_tables -- unhinted fonts shouldn't have hint tables
    missing_bytecode -- hinted tt fonts should have bytecodes
    unexpected_bytecode -- unhinted tt fonts should not have bytecodes
  advances
    digits -- checks that ASCII digits have same advance as digit zero
    comma_period -- checks that comma and period have same advance
    whitespace -- checks for expected advance relationships in whitespace
  stem -- stem widths
    left_joiner -- non-zero lsb
    right_joiner -- rsb not -70
  reachable
)";

// Groups:
// 1: indentation
// 2: tag name
// 3: optional relation regex, must be followed by
// 4: arg type regex
// 5: optional comment following '--'
static const std::regex& TagLineRegex() {
  static const std::regex* re = new std::regex(
      R"(^(\s*)([a-z0-9_]+)(?:\s+(?!--)(\S+)\s+(\S+))?\s*(?:--\s*(.+?))?\s*$)");
  return *re;
}

static std::optional<std::string> OptionalGroup(const std::smatch& match,
                                                int group) {
  if (!match[group].matched) {
    return std::nullopt;
  }
  return match[group].str();
}

struct IndentFrame {
  size_t indent;
  std::string tag;
};

StatusOr<TagCatalog> TagCatalog::Create(string_view description) {
  TagCatalog catalog;
  std::vector<IndentFrame> ancestors;

  for (string_view line_view : absl::StrSplit(description, '\n')) {
    if (absl::StripAsciiWhitespace(line_view).empty()) {
      continue;
    }

    std::string line(absl::StripTrailingAsciiWhitespace(line_view));
    std::smatch match;
    if (!std::regex_match(line, match, TagLineRegex())) {
      return LintError(ErrorKind::kGrammar,
                       StrCat("failed to match tag line: '", line, "'"));
    }

    size_t indent = match[1].length();
    while (!ancestors.empty() && indent <= ancestors.back().indent) {
      ancestors.pop_back();
    }

    std::string tag = match[2].str();
    if (!ancestors.empty()) {
      tag = StrCat(ancestors.back().tag, "/", tag);
    }

    TagInfo info;
    info.relation = OptionalGroup(match, 3);
    info.arg_type = OptionalGroup(match, 4);
    info.comment = OptionalGroup(match, 5);

    catalog.tag_data_.insert_or_assign(tag, std::move(info));
    catalog.tags_.insert(tag);
    ancestors.push_back(IndentFrame{indent, std::move(tag)});
  }

  return catalog;
}

const TagInfo* TagCatalog::Find(string_view tag) const {
  auto it = tag_data_.find(tag);
  if (it == tag_data_.end()) {
    return nullptr;
  }
  return &it->second;
}

static bool IsSegmentDelimiter(char c) { return c == '/' || c == '_'; }

// True if the first occurrence of segment in tag is bounded on both sides by
// a delimiter or the end of tag.
static bool ContainsSegment(string_view tag, string_view segment) {
  size_t start = tag.find(segment);
  if (start == string_view::npos) {
    return false;
  }
  if (start > 0 && !IsSegmentDelimiter(tag[start - 1])) {
    return false;
  }
  size_t end = start + segment.size();
  return end >= tag.size() || IsSegmentDelimiter(tag[end]);
}

StatusOr<std::string> TagCatalog::FindUniquePartialMatch(
    string_view tag) const {
  const std::string* unique_tag = nullptr;
  if (!tag.empty()) {
    for (const std::string& candidate : tags_) {
      if (!ContainsSegment(candidate, tag)) {
        continue;
      }
      if (unique_tag) {
        return LintError(
            ErrorKind::kAmbiguousTag,
            StrCat("multiple matches for partial tag '", tag, "': ",
                   *unique_tag, ", ", candidate));
      }
      unique_tag = &candidate;
    }
  }

  if (!unique_tag) {
    return LintError(ErrorKind::kUnknownTag,
                     StrCat("unknown tag: '", tag, "'"));
  }
  return *unique_tag;
}

StatusOr<TagSet> TagCatalog::ResolveTagSet(string_view tag) const {
  std::string root;
  if (Contains(tag)) {
    root = std::string(tag);
  } else {
    root = TRY(FindUniquePartialMatch(tag));
  }

  TagSet result;
  result.insert(root);
  std::string prefix = StrCat(root, "/");
  for (auto it = tags_.lower_bound(prefix);
       it != tags_.end() && absl::StartsWith(*it, prefix); ++it) {
    result.insert(*it);
  }
  return result;
}

std::vector<std::string> TagCatalog::ListTags(
    const ListTagsOptions& options) const {
  std::vector<std::string> lines;
  for (const auto& [tag, info] : tag_data_) {
    bool show_comment = options.comments && info.comment.has_value();
    bool show_filter = options.filters &&
                       (info.relation.has_value() || info.arg_type.has_value());
    if (!options.tags && !show_comment && !show_filter) {
      continue;
    }

    lines.push_back(tag);
    if (show_filter) {
      lines.push_back(StrCat("  ", info.relation.value_or(""), " ",
                             info.arg_type.value_or("")));
    }
    if (show_comment) {
      lines.push_back(StrCat("  -- ", *info.comment));
    }
  }
  return lines;
}

string_view DefaultTagDescription() { return kDefaultTagDescription; }

const TagCatalog& DefaultTagCatalog() {
  static const TagCatalog* catalog = [] {
    auto catalog = TagCatalog::Create(kDefaultTagDescription);
    if (!catalog.ok()) {
      LOG(FATAL) << "Built in tag catalog is malformed: " << catalog.status();
    }
    VLOG(1) << "Loaded " << catalog->Tags().size() << " lint test tags.";
    return new TagCatalog(std::move(*catalog));
  }();
  return *catalog;
}

}  // namespace lint
