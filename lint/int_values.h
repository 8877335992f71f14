#ifndef LINT_INT_VALUES_H_
#define LINT_INT_VALUES_H_

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "common/int_set.h"

namespace lint {

/*
 * Parses a list of values and ranges separated by whitespace into a set,
 * eg. "41 61-7A" or "3 5-7 9". A range is two values joined by a hyphen with
 * no intervening spaces and must have lo < hi. When is_hex is true values are
 * base 16 (with an optional 0x prefix), otherwise base 10.
 *
 * Every value in the list must be distinct: overlapping ranges or repeated
 * values are an error rather than being merged.
 */
absl::StatusOr<common::IntSet> ParseIntValues(absl::string_view int_list,
                                              bool is_hex);

}  // namespace lint

#endif  // LINT_INT_VALUES_H_
