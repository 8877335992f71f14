#ifndef LINT_ERRORS_H_
#define LINT_ERRORS_H_

#include <optional>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"

namespace lint {

/*
 * The kinds of failure that can occur while loading a tag catalog or a lint
 * spec. Every kind is fatal to the load; a successfully built spec never
 * fails to resolve.
 */
enum class ErrorKind {
  // A line or segment does not match any recognized shape.
  kGrammar,
  // The tag is not in the catalog and no unique partial match exists.
  kUnknownTag,
  // A partial tag matches more than one catalog entry.
  kAmbiguousTag,
  // Relation word is not supported by a condition field or not allowed by a
  // tag's relation pattern.
  kUnsupportedRelation,
  // Argument type is not allowed by the tag or is not cp/gid.
  kArgTypeMismatch,
  // Malformed range, inverted range or duplicate value in an integer list.
  kIntegerSet,
  // A relation clause was applied to a scope of more than one tag.
  kMultiTagFilter,
};

absl::string_view ErrorKindName(ErrorKind kind);

// Builds a status of the given kind. kUnknownTag maps to a NotFound status,
// all other kinds to InvalidArgument. The kind is attached as a payload.
absl::Status LintError(ErrorKind kind, absl::string_view message);

// Returns the kind attached to status by LintError(), if any.
std::optional<ErrorKind> ErrorKindOf(const absl::Status& status);

}  // namespace lint

#endif  // LINT_ERRORS_H_
