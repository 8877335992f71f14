#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/log/globals.h"
#include "absl/log/initialize.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_split.h"
#include "common/try.h"
#include "lint/font_info.h"
#include "lint/lint_spec.h"
#include "lint/lint_tests.h"
#include "lint/spec_parser.h"

using absl::Status;
using absl::StatusOr;
using lint::FontInfo;
using lint::LintSpec;
using lint::LintTests;

/*
 * Loads a lint config file and prints the tests it selects for a font
 * described by the flags below.
 *
 * If --check is given each listed tag is looked up as a lint run would, and
 * the tags that would run or be skipped are printed instead.
 */

ABSL_FLAG(std::string, filename, "", "Font file name.");
ABSL_FLAG(std::string, name, "", "Font family name.");
ABSL_FLAG(std::string, style, "", "Font style, for example Sans or Serif.");
ABSL_FLAG(std::string, script, "", "Script code, for example Latn or Deva.");
ABSL_FLAG(std::string, variant, "", "Font variant, for example UI.");
ABSL_FLAG(std::string, weight, "", "Font weight, for example 400.");
ABSL_FLAG(std::string, vendor, "", "Font vendor.");
ABSL_FLAG(std::string, version, "", "Font version, for example 1.02.");
ABSL_FLAG(bool, monospace, false, "Font is monospaced.");
ABSL_FLAG(bool, hinted, false, "Font is hinted.");

ABSL_FLAG(std::vector<std::string>, check, {},
          "Comma separated list of tags to check against the resolved tests.");

// Unset flags leave the attribute unset so conditions on it don't match.
static std::optional<std::string> Attribute(
    const absl::Flag<std::string>& flag) {
  std::string value = absl::GetFlag(flag);
  if (value.empty()) {
    return std::nullopt;
  }
  return value;
}

static FontInfo FontInfoFromFlags() {
  FontInfo font;
  font.filename = Attribute(FLAGS_filename);
  font.name = Attribute(FLAGS_name);
  font.style = Attribute(FLAGS_style);
  font.script = Attribute(FLAGS_script);
  font.variant = Attribute(FLAGS_variant);
  font.weight = Attribute(FLAGS_weight);
  font.vendor = Attribute(FLAGS_vendor);
  font.version = Attribute(FLAGS_version);
  font.monospace = absl::GetFlag(FLAGS_monospace);
  font.hinted = absl::GetFlag(FLAGS_hinted);
  return font;
}

static Status Main(const char* spec_path) {
  LintSpec spec = TRY(lint::ParseSpecFile(spec_path));
  FontInfo font = FontInfoFromFlags();
  LintTests tests = spec.GetTests(font);

  for (const std::string& tag : absl::GetFlag(FLAGS_check)) {
    TRYV(tests.Check(tag).status());
  }

  std::cout << font.ToString() << std::endl;
  std::cout << tests.ToString() << std::endl;
  return absl::OkStatus();
}

int main(int argc, char** argv) {
  absl::SetStderrThreshold(absl::LogSeverityAtLeast::kInfo);
  auto args = absl::ParseCommandLine(argc, argv);
  absl::InitializeLog();

  if (args.size() != 2) {
    std::cerr << "Usage:" << std::endl
              << "resolve_lint_config [--script=<script>] ... <spec_file>"
              << std::endl;
    return -1;
  }

  auto sc = Main(args[1]);
  if (!sc.ok()) {
    std::cerr << "Error: " << sc << std::endl;
    return -1;
  }
  return 0;
}
