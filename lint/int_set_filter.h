#ifndef LINT_INT_SET_FILTER_H_
#define LINT_INT_SET_FILTER_H_

#include <cstdint>
#include <string>
#include <utility>

#include "absl/strings/string_view.h"
#include "common/int_set.h"

namespace lint {

/*
 * Tests whether an integer (a code point or a glyph id) is accepted by a lint
 * test. Accepts members of the set ("only") or non members ("except").
 *
 * arg_type is the kind of value in the set, "cp" or "gid". Code points are
 * written in hex.
 */
class IntSetFilter {
 public:
  IntSetFilter(bool accept_if_in, std::string arg_type, common::IntSet values)
      : accept_if_in_(accept_if_in),
        arg_type_(std::move(arg_type)),
        values_(std::move(values)) {}

  static bool IsHexArgType(absl::string_view arg_type) {
    return arg_type == "cp";
  }

  bool Accept(uint32_t value) const {
    return accept_if_in_ == values_.contains(value);
  }

  bool AcceptIfIn() const { return accept_if_in_; }
  const std::string& ArgType() const { return arg_type_; }
  const common::IntSet& Values() const { return values_; }

  // eg. "except cp 0041-005a", in the syntax of an enable clause.
  std::string ToString() const;

  bool operator==(const IntSetFilter& other) const {
    return accept_if_in_ == other.accept_if_in_ &&
           arg_type_ == other.arg_type_ && values_ == other.values_;
  }

  bool operator!=(const IntSetFilter& other) const {
    return !(*this == other);
  }

 private:
  bool accept_if_in_;
  std::string arg_type_;
  common::IntSet values_;
};

}  // namespace lint

#endif  // LINT_INT_SET_FILTER_H_
