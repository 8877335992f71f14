#ifndef LINT_SPEC_PARSER_H_
#define LINT_SPEC_PARSER_H_

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "lint/lint_spec.h"
#include "lint/tag_catalog.h"

namespace lint {

/*
 * Parses lint spec text into blocks of conditions and test selections and
 * appends them to lint_spec.
 *
 * Spec text is a list of statements separated by newlines or ';'. '#' starts
 * a comment which runs to the end of the line. Statements are:
 *
 *   condition
 *       Ends the current block and starts a new, unconstrained, condition.
 *   enable <tag> [(except|only) (cp|gid) <values>], ...
 *       Enables tests, optionally filtered to (or excluding) a list of code
 *       points or glyph ids.
 *   disable <tag>, ...
 *       Disables tests.
 *   <attribute> <relation> <operand> | <attribute> <literal> | <attribute> *
 *       Adds (or with '*' removes) a test on a font attribute to the current
 *       condition. When this follows an enable or disable, the current block
 *       ends first and the new block's condition starts from the current
 *       one.
 *
 * For example:
 *
 *   disable reachable
 *   condition
 *   vendor is Adobe; enable name/version
 *   script in Deva,Beng
 *   enable cmap/script_required except cp 0900-097f
 *
 * Any error leaves lint_spec partially populated and should be treated as
 * fatal.
 */
absl::Status ParseSpec(absl::string_view spec, LintSpec& lint_spec);

// Parses spec into a new LintSpec whose tags come from catalog.
absl::StatusOr<LintSpec> ParseSpec(
    absl::string_view spec, const TagCatalog& catalog = DefaultTagCatalog());

// Loads the file at path and parses its contents as a spec.
absl::StatusOr<LintSpec> ParseSpecFile(
    const char* path, const TagCatalog& catalog = DefaultTagCatalog());

}  // namespace lint

#endif  // LINT_SPEC_PARSER_H_
