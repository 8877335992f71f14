#include <iostream>
#include <string>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/log/globals.h"
#include "absl/log/initialize.h"
#include "lint/tag_catalog.h"

using lint::DefaultTagCatalog;
using lint::ListTagsOptions;

/*
 * Prints the lint test tags that lint config files can enable or disable.
 */

ABSL_FLAG(bool, tags, false, "List all tags.");

ABSL_FLAG(bool, comments, false, "List tags that have comments, with them.");

ABSL_FLAG(bool, filters, false,
          "List tags that accept filters, with the allowed relations and "
          "argument types.");

int main(int argc, char** argv) {
  absl::SetStderrThreshold(absl::LogSeverityAtLeast::kInfo);
  auto args = absl::ParseCommandLine(argc, argv);
  absl::InitializeLog();

  if (args.size() != 1) {
    std::cerr << "Usage:" << std::endl
              << "lint_config_tags [--tags] [--comments] [--filters]"
              << std::endl;
    return -1;
  }

  ListTagsOptions options;
  options.tags = absl::GetFlag(FLAGS_tags);
  options.comments = absl::GetFlag(FLAGS_comments);
  options.filters = absl::GetFlag(FLAGS_filters);
  if (!options.tags && !options.comments && !options.filters) {
    std::cout << "nothing to do." << std::endl;
    return 0;
  }

  for (const std::string& line : DefaultTagCatalog().ListTags(options)) {
    std::cout << line << std::endl;
  }
  return 0;
}
