#include "lint/int_values.h"

#include <algorithm>
#include <cstdint>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"
#include "common/int_set.h"
#include "common/try.h"
#include "lint/errors.h"

using absl::StatusOr;
using absl::StrCat;
using absl::string_view;
using common::IntSet;

namespace lint {

static StatusOr<uint32_t> ParseValue(string_view value, bool is_hex) {
  if (is_hex &&
      (absl::StartsWith(value, "0x") || absl::StartsWith(value, "0X"))) {
    value.remove_prefix(2);
  }

  // Only digits, the atoi functions would also take a sign or base prefix.
  bool ok = !value.empty() &&
            std::all_of(value.begin(), value.end(), [is_hex](char c) {
              return is_hex ? absl::ascii_isxdigit(c) : absl::ascii_isdigit(c);
            });
  uint32_t out = 0;
  if (ok) {
    ok = is_hex ? absl::SimpleHexAtoi(value, &out)
                : absl::SimpleAtoi(value, &out);
  }

  if (!ok) {
    return LintError(ErrorKind::kIntegerSet,
                     StrCat("could not parse ", is_hex ? "hex" : "decimal",
                            " value '", value, "'"));
  }
  if (out == HB_SET_VALUE_INVALID) {
    return LintError(ErrorKind::kIntegerSet,
                     StrCat("value '", value, "' is out of range"));
  }
  return out;
}

StatusOr<IntSet> ParseIntValues(string_view int_list, bool is_hex) {
  std::vector<string_view> values =
      absl::StrSplit(int_list, absl::ByAnyChar(" \t"), absl::SkipEmpty());
  if (values.empty()) {
    return LintError(ErrorKind::kIntegerSet, "no values were supplied");
  }

  IntSet result;
  uint64_t count = 0;
  for (string_view value : values) {
    if (!absl::StrContains(value, '-')) {
      result.insert(TRY(ParseValue(value, is_hex)));
      count++;
      continue;
    }

    std::vector<string_view> bounds = absl::StrSplit(value, '-');
    if (bounds.size() != 2) {
      return LintError(ErrorKind::kIntegerSet,
                       StrCat("could not parse range from '", value, "'"));
    }
    uint32_t lo = TRY(ParseValue(bounds[0], is_hex));
    uint32_t hi = TRY(ParseValue(bounds[1], is_hex));
    if (lo >= hi) {
      return LintError(
          ErrorKind::kIntegerSet,
          StrCat("range '", value, "' must have high > low"));
    }
    result.insert_range(lo, hi);
    count += static_cast<uint64_t>(hi) - lo + 1;
  }

  if (result.size() != count) {
    return LintError(ErrorKind::kIntegerSet,
                     StrCat("duplicate values in '", int_list,
                            "', expected count is ", count, " but found ",
                            result.size(), " distinct values"));
  }
  return result;
}

}  // namespace lint
