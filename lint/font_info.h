#ifndef LINT_FONT_INFO_H_
#define LINT_FONT_INFO_H_

#include <optional>
#include <string>

#include "absl/strings/string_view.h"

namespace lint {

/*
 * Descriptive metadata of one font instance, used to decide which lint
 * conditions apply to it. Populated by whatever loads the font.
 */
struct FontInfo {
  std::optional<std::string> filename;
  std::optional<std::string> name;
  std::optional<std::string> style;
  std::optional<std::string> script;
  std::optional<std::string> variant;
  std::optional<std::string> weight;
  bool monospace = false;
  bool hinted = false;
  std::optional<std::string> vendor;
  std::optional<std::string> version;

  // Returns the value conditions compare against for the named attribute.
  // The boolean attributes are presented as "true" or "false". Returns
  // nullopt for unknown names and unset attributes.
  std::optional<std::string> Attribute(absl::string_view attribute) const;

  std::string ToString() const;
};

}  // namespace lint

#endif  // LINT_FONT_INFO_H_
