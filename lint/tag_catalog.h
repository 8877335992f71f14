#ifndef LINT_TAG_CATALOG_H_
#define LINT_TAG_CATALOG_H_

#include <optional>
#include <string>
#include <vector>

#include "absl/container/btree_map.h"
#include "absl/container/btree_set.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

namespace lint {

typedef absl::btree_set<std::string> TagSet;

/*
 * What a catalog entry declares about the options a lint test accepts.
 */
struct TagInfo {
  // Regex of the relation words allowed on this tag, eg. "except|only".
  std::optional<std::string> relation;
  // Regex of the argument types allowed on this tag, eg. "cp|gid".
  std::optional<std::string> arg_type;
  std::optional<std::string> comment;

  bool AllowsOptions() const {
    return relation.has_value() && arg_type.has_value();
  }
};

// Selects what TagCatalog::ListTags() reports.
struct ListTagsOptions {
  // List every tag.
  bool tags = false;
  // List tags that have a comment, along with the comment.
  bool comments = false;
  // List tags that declare relation and argument types, along with them.
  bool filters = false;
};

/*
 * The hierarchy of lint test tags.
 *
 * The hierarchy is described by indented text, one tag per line:
 *
 *   <indent><name>[ <relation regex> <arg type regex>][ -- <comment>]
 *
 * Names are lower case alphanumerics plus underscore. A line nested (more
 * deeply indented) below another line is a child of it, and its full tag is
 * the parent's full tag + "/" + name, eg. "cmap/tables/missing". Indentation
 * is compared by length only, so tabs and spaces must not be mixed
 * inconsistently within one subtree.
 *
 * A catalog is immutable once created.
 */
class TagCatalog {
 public:
  static absl::StatusOr<TagCatalog> Create(absl::string_view description);

  // All full tag paths, sorted.
  const TagSet& Tags() const { return tags_; }

  bool Contains(absl::string_view tag) const {
    return tag_data_.find(tag) != tag_data_.end();
  }

  // Returns the entry for tag, or nullptr if tag is not in the catalog.
  const TagInfo* Find(absl::string_view tag) const;

  /*
   * Resolves a possibly partial tag to the set of tags it names.
   *
   * A tag in the catalog names itself and every tag below it. Otherwise the
   * catalog is searched for tags which contain tag as a segment delimited by
   * '/', '_' or the ends of the tag. If exactly one tag matches, it is used as
   * above. No match is a NotFound (kUnknownTag) error, more than one is a
   * kAmbiguousTag error.
   */
  absl::StatusOr<TagSet> ResolveTagSet(absl::string_view tag) const;

  // Returns human readable listing lines for the tags selected by options,
  // in sorted tag order.
  std::vector<std::string> ListTags(const ListTagsOptions& options) const;

 private:
  TagCatalog() = default;

  absl::StatusOr<std::string> FindUniquePartialMatch(
      absl::string_view tag) const;

  absl::btree_map<std::string, TagInfo> tag_data_;
  TagSet tags_;
};

// The description of the tests known to the font linter.
absl::string_view DefaultTagDescription();

// Returns the catalog built from DefaultTagDescription(). It is built once on
// first use and lives for the remainder of the process.
const TagCatalog& DefaultTagCatalog();

}  // namespace lint

#endif  // LINT_TAG_CATALOG_H_
