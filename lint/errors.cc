#include "lint/errors.h"

#include <optional>
#include <string>

#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/types/optional.h"

using absl::Status;
using absl::string_view;

namespace lint {

static constexpr string_view kErrorKindPayloadUrl = "lint.ErrorKind";

static constexpr ErrorKind kAllKinds[] = {
    ErrorKind::kGrammar,          ErrorKind::kUnknownTag,
    ErrorKind::kAmbiguousTag,     ErrorKind::kUnsupportedRelation,
    ErrorKind::kArgTypeMismatch,  ErrorKind::kIntegerSet,
    ErrorKind::kMultiTagFilter,
};

string_view ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kGrammar:
      return "GrammarError";
    case ErrorKind::kUnknownTag:
      return "UnknownTagError";
    case ErrorKind::kAmbiguousTag:
      return "AmbiguousTagError";
    case ErrorKind::kUnsupportedRelation:
      return "UnsupportedRelationError";
    case ErrorKind::kArgTypeMismatch:
      return "ArgTypeMismatchError";
    case ErrorKind::kIntegerSet:
      return "IntegerSetError";
    case ErrorKind::kMultiTagFilter:
      return "MultiTagFilterError";
  }
  return "UnknownError";
}

Status LintError(ErrorKind kind, string_view message) {
  std::string full_message = absl::StrCat(ErrorKindName(kind), ": ", message);
  Status status = kind == ErrorKind::kUnknownTag
                      ? absl::NotFoundError(full_message)
                      : absl::InvalidArgumentError(full_message);
  status.SetPayload(kErrorKindPayloadUrl, absl::Cord(ErrorKindName(kind)));
  return status;
}

std::optional<ErrorKind> ErrorKindOf(const Status& status) {
  absl::optional<absl::Cord> payload = status.GetPayload(kErrorKindPayloadUrl);
  if (!payload.has_value()) {
    return std::nullopt;
  }
  for (ErrorKind kind : kAllKinds) {
    if (*payload == ErrorKindName(kind)) {
      return kind;
    }
  }
  return std::nullopt;
}

}  // namespace lint
