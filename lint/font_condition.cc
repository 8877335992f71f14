#include "lint/font_condition.h"

#include <array>
#include <optional>
#include <regex>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"
#include "absl/strings/strip.h"
#include "common/try.h"
#include "lint/errors.h"

using absl::Status;
using absl::StatusOr;
using absl::StrCat;
using absl::string_view;

namespace lint {

static string_view Unquote(string_view value) {
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    value.remove_prefix(1);
    value.remove_suffix(1);
  }
  return value;
}

AttributeTest AttributeTest::Literal(string_view value) {
  return AttributeTest(LITERAL, std::string(Unquote(value)));
}

std::optional<AttributeTest::Relation> AttributeTest::RelationFromName(
    string_view name) {
  if (name == "<") return LESS;
  if (name == "<=") return LESS_EQUAL;
  if (name == "==") return EQUAL;
  if (name == "!=") return NOT_EQUAL;
  if (name == ">=") return GREATER_EQUAL;
  if (name == ">") return GREATER;
  if (name == "is") return IS;
  if (name == "in") return IN;
  if (name == "like") return LIKE;
  return std::nullopt;
}

string_view AttributeTest::RelationName(Relation relation) {
  switch (relation) {
    case LITERAL:
      return "";
    case LESS:
      return "<";
    case LESS_EQUAL:
      return "<=";
    case EQUAL:
      return "==";
    case NOT_EQUAL:
      return "!=";
    case GREATER_EQUAL:
      return ">=";
    case GREATER:
      return ">";
    case IS:
      return "is";
    case IN:
      return "in";
    case LIKE:
      return "like";
  }
  return "?";
}

StatusOr<AttributeTest> AttributeTest::Create(string_view relation_name,
                                              string_view operand) {
  std::optional<Relation> relation = RelationFromName(relation_name);
  if (!relation.has_value()) {
    return LintError(ErrorKind::kUnsupportedRelation,
                     StrCat("unrecognized relation '", relation_name, "'"));
  }

  AttributeTest test(*relation, std::string(Unquote(operand)));
  if (*relation == IN) {
    for (string_view alternative : absl::StrSplit(test.operand_, ',')) {
      test.alternatives_.insert(
          std::string(absl::StripAsciiWhitespace(alternative)));
    }
  } else if (*relation == LIKE) {
    try {
      test.pattern_.emplace(test.operand_, std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
      return LintError(ErrorKind::kGrammar,
                       StrCat("invalid pattern '", test.operand_,
                              "': ", e.what()));
    }
  }
  return test;
}

bool AttributeTest::CompareNumeric(const std::string& value) const {
  double lhs, rhs;
  if (!absl::SimpleAtod(value, &lhs) || !absl::SimpleAtod(operand_, &rhs)) {
    // Non numeric attributes can still be tested for (in)equality, but
    // don't have an ordering.
    switch (relation_) {
      case EQUAL:
        return value == operand_;
      case NOT_EQUAL:
        return value != operand_;
      default:
        return false;
    }
  }

  switch (relation_) {
    case LESS:
      return lhs < rhs;
    case LESS_EQUAL:
      return lhs <= rhs;
    case EQUAL:
      return lhs == rhs;
    case NOT_EQUAL:
      return lhs != rhs;
    case GREATER_EQUAL:
      return lhs >= rhs;
    case GREATER:
      return lhs > rhs;
    default:
      return false;
  }
}

bool AttributeTest::Accepts(const std::optional<std::string>& value) const {
  if (!value.has_value()) {
    return false;
  }

  switch (relation_) {
    case LITERAL:
    case IS:
      return *value == operand_;
    case LESS:
    case LESS_EQUAL:
    case EQUAL:
    case NOT_EQUAL:
    case GREATER_EQUAL:
    case GREATER:
      return CompareNumeric(*value);
    case IN:
      return alternatives_.contains(*value);
    case LIKE:
      return std::regex_search(*value, *pattern_);
  }
  return false;
}

std::string AttributeTest::ToString() const {
  if (relation_ == LITERAL) {
    return operand_;
  }
  return StrCat(RelationName(relation_), " ", operand_);
}

const std::array<string_view, FontCondition::kNumFields>&
FontCondition::FieldNames() {
  static constexpr std::array<string_view, kNumFields> kFieldNames = {
      "filename", "name",   "style",  "script",  "variant",
      "weight",   "hinted", "vendor", "version",
  };
  return kFieldNames;
}

std::optional<size_t> FontCondition::FieldIndex(string_view field) {
  const auto& names = FieldNames();
  for (size_t i = 0; i < names.size(); i++) {
    if (names[i] == field) {
      return i;
    }
  }
  return std::nullopt;
}

Status FontCondition::Modify(string_view field, string_view relation,
                             std::optional<string_view> operand) {
  std::optional<size_t> index = FieldIndex(field);
  if (!index.has_value()) {
    return LintError(ErrorKind::kGrammar,
                     StrCat("condition does not recognize '", field, "'"));
  }

  if (relation == "*") {
    tests_[*index] = std::nullopt;
    return absl::OkStatus();
  }

  if (!operand.has_value() || operand->empty()) {
    tests_[*index] = AttributeTest::Literal(relation);
    return absl::OkStatus();
  }

  tests_[*index] = TRY(AttributeTest::Create(relation, *operand));
  return absl::OkStatus();
}

Status FontCondition::ModifyLine(string_view line) {
  line = absl::StripAsciiWhitespace(line);
  std::vector<string_view> parts = absl::StrSplit(
      line, absl::MaxSplits(absl::ByAnyChar(" \t"), 1), absl::SkipEmpty());
  if (parts.size() != 2) {
    return LintError(ErrorKind::kGrammar,
                     StrCat("could not parse condition '", line, "'"));
  }
  string_view field = parts[0];

  std::vector<string_view> rest =
      absl::StrSplit(absl::StripLeadingAsciiWhitespace(parts[1]),
                     absl::MaxSplits(absl::ByAnyChar(" \t"), 1));
  string_view relation = rest[0];
  std::optional<string_view> operand;
  if (rest.size() > 1) {
    string_view value = absl::StripAsciiWhitespace(rest[1]);
    if (!value.empty()) {
      operand = value;
    }
  }
  return Modify(field, relation, operand);
}

const AttributeTest* FontCondition::TestFor(string_view field) const {
  std::optional<size_t> index = FieldIndex(field);
  if (!index.has_value() || !tests_[*index].has_value()) {
    return nullptr;
  }
  return &*tests_[*index];
}

bool FontCondition::IsUnconstrained() const {
  for (const auto& test : tests_) {
    if (test.has_value()) {
      return false;
    }
  }
  return true;
}

bool FontCondition::Accepts(const FontInfo& font) const {
  const auto& names = FieldNames();
  for (size_t i = 0; i < kNumFields; i++) {
    if (!tests_[i].has_value()) {
      continue;
    }
    if (!tests_[i]->Accepts(font.Attribute(names[i]))) {
      return false;
    }
  }
  return true;
}

std::string FontCondition::ToString() const {
  std::vector<std::string> parts;
  const auto& names = FieldNames();
  for (size_t i = 0; i < kNumFields; i++) {
    if (tests_[i].has_value()) {
      parts.push_back(StrCat(names[i], ": ", tests_[i]->ToString()));
    }
  }
  return StrCat("FontCondition(", absl::StrJoin(parts, ", "), ")");
}

}  // namespace lint
