#include "lint/spec_parser.h"

#include <fstream>
#include <sstream>
#include <string>
#include <utility>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"
#include "absl/strings/strip.h"
#include "common/try.h"
#include "lint/font_condition.h"
#include "lint/test_selection.h"

using absl::Status;
using absl::StatusOr;
using absl::StrCat;
using absl::string_view;

namespace lint {

namespace {

constexpr string_view kEnablePrefix = "enable ";
constexpr string_view kDisablePrefix = "disable ";

class SpecParser {
 public:
  explicit SpecParser(LintSpec& lint_spec)
      : lint_spec_(lint_spec),
        current_selection_(&lint_spec.Catalog()) {}

  Status ParseLine(string_view line) {
    size_t comment_start = line.find('#');
    if (comment_start != string_view::npos) {
      line = line.substr(0, comment_start);
    }
    line = absl::StripAsciiWhitespace(line);
    if (line.empty()) {
      return absl::OkStatus();
    }

    for (string_view segment : absl::StrSplit(line, ';')) {
      segment = absl::StripAsciiWhitespace(segment);
      if (segment.empty()) {
        continue;
      }
      TRYV(ParseSegment(segment));
    }
    return absl::OkStatus();
  }

  // Adds any pending block to the spec.
  void Finish() { FlushBlock(); }

 private:
  Status ParseSegment(string_view segment) {
    if (segment == "condition") {
      FlushBlock();
      current_condition_ = FontCondition();
      return absl::OkStatus();
    }

    if (absl::ConsumePrefix(&segment, kEnablePrefix)) {
      for (string_view clause : absl::StrSplit(segment, ',')) {
        TRYV(current_selection_.EnableClause(
            absl::StripAsciiWhitespace(clause)));
      }
      have_test_ = true;
      return absl::OkStatus();
    }

    if (absl::ConsumePrefix(&segment, kDisablePrefix)) {
      for (string_view tag : absl::StrSplit(segment, ',')) {
        TRYV(current_selection_.Disable(absl::StripAsciiWhitespace(tag)));
      }
      have_test_ = true;
      return absl::OkStatus();
    }

    // Attribute constraints following tests start a new block, which keeps
    // the constraints accumulated so far.
    FlushBlock();
    return current_condition_.ModifyLine(segment);
  }

  void FlushBlock() {
    if (!have_test_) {
      return;
    }
    VLOG(1) << "lint spec block " << lint_spec_.Blocks().size() << ": "
            << current_condition_.ToString();
    lint_spec_.AddBlock(current_condition_, std::move(current_selection_));
    current_selection_ = TestSelection(&lint_spec_.Catalog());
    have_test_ = false;
  }

  LintSpec& lint_spec_;
  FontCondition current_condition_;
  TestSelection current_selection_;
  // True once the current block has enabled or disabled a test.
  bool have_test_ = false;
};

}  // namespace

Status ParseSpec(string_view spec, LintSpec& lint_spec) {
  SpecParser parser(lint_spec);
  for (string_view line : absl::StrSplit(spec, '\n')) {
    TRYV(parser.ParseLine(line));
  }
  parser.Finish();
  return absl::OkStatus();
}

StatusOr<LintSpec> ParseSpec(string_view spec, const TagCatalog& catalog) {
  LintSpec lint_spec(&catalog);
  TRYV(ParseSpec(spec, lint_spec));
  return lint_spec;
}

StatusOr<LintSpec> ParseSpecFile(const char* path, const TagCatalog& catalog) {
  std::ifstream in(path);
  if (!in.is_open()) {
    return absl::NotFoundError(
        StrCat("Lint spec file ", path, " was not found."));
  }

  std::stringstream contents;
  contents << in.rdbuf();
  in.close();
  return ParseSpec(contents.str(), catalog);
}

}  // namespace lint
