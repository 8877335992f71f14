#include "lint/int_set_filter.h"

#include <string>

#include "absl/strings/str_cat.h"

namespace lint {

std::string IntSetFilter::ToString() const {
  return absl::StrCat(accept_if_in_ ? "only " : "except ", arg_type_, " ",
                      values_.ToString(IsHexArgType(arg_type_)));
}

}  // namespace lint
