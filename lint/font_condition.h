#ifndef LINT_FONT_CONDITION_H_
#define LINT_FONT_CONDITION_H_

#include <array>
#include <optional>
#include <regex>
#include <string>
#include <utility>

#include "absl/container/btree_set.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "lint/font_info.h"

namespace lint {

/*
 * A test applied to a single font attribute: either an exact match against a
 * literal value or a relation with an operand.
 */
class AttributeTest {
 public:
  enum Relation {
    LITERAL,
    // Numeric relations, both sides are compared as floating point numbers.
    LESS,
    LESS_EQUAL,
    EQUAL,
    NOT_EQUAL,
    GREATER_EQUAL,
    GREATER,
    // Exact string equality.
    IS,
    // Membership in a comma separated list of alternatives.
    IN,
    // Regular expression search.
    LIKE,
  };

  static AttributeTest Literal(absl::string_view value);

  // relation_name is one of "<", "<=", "==", "!=", ">=", ">", "is", "in" or
  // "like".
  static absl::StatusOr<AttributeTest> Create(absl::string_view relation_name,
                                              absl::string_view operand);

  static std::optional<Relation> RelationFromName(absl::string_view name);
  static absl::string_view RelationName(Relation relation);

  Relation relation() const { return relation_; }
  const std::string& operand() const { return operand_; }

  // Returns true if the attribute value satisfies this test. A missing value
  // never does.
  bool Accepts(const std::optional<std::string>& value) const;

  std::string ToString() const;

 private:
  AttributeTest(Relation relation, std::string operand)
      : relation_(relation), operand_(std::move(operand)) {}

  bool CompareNumeric(const std::string& value) const;

  Relation relation_;
  std::string operand_;
  absl::btree_set<std::string> alternatives_;
  std::optional<std::regex> pattern_;
};

/*
 * A conjunction of tests over the attributes of a font. Attributes without a
 * test are unconstrained, so the empty condition accepts every font.
 *
 * The attributes which can be tested are: filename, name, style, script,
 * variant, weight, hinted, vendor and version.
 */
class FontCondition {
 public:
  static constexpr size_t kNumFields = 9;
  static const std::array<absl::string_view, kNumFields>& FieldNames();

  FontCondition() = default;

  /*
   * Changes the test on field.
   *
   * - relation "*" removes any test on the field.
   * - with no operand, relation is taken as a literal value the attribute
   *   must equal.
   * - otherwise relation names the relation to apply against operand.
   *
   * An operand (or literal) wrapped in double quotes has the quotes removed.
   */
  absl::Status Modify(absl::string_view field, absl::string_view relation,
                      std::optional<absl::string_view> operand);

  // Parses a line of the form "<field> <relation or literal> [operand]" and
  // applies it with Modify().
  absl::Status ModifyLine(absl::string_view line);

  // Returns the test set on field, or nullptr if field is unconstrained.
  const AttributeTest* TestFor(absl::string_view field) const;

  bool IsUnconstrained() const;

  bool Accepts(const FontInfo& font) const;

  std::string ToString() const;

 private:
  static std::optional<size_t> FieldIndex(absl::string_view field);

  std::array<std::optional<AttributeTest>, kNumFields> tests_;
};

}  // namespace lint

#endif  // LINT_FONT_CONDITION_H_
