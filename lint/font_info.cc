#include "lint/font_info.h"

#include <optional>
#include <string>
#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/string_view.h"

using absl::StrCat;
using absl::string_view;

namespace lint {

static std::string BoolValue(bool value) { return value ? "true" : "false"; }

std::optional<std::string> FontInfo::Attribute(string_view attribute) const {
  if (attribute == "filename") return filename;
  if (attribute == "name") return name;
  if (attribute == "style") return style;
  if (attribute == "script") return script;
  if (attribute == "variant") return variant;
  if (attribute == "weight") return weight;
  if (attribute == "monospace") return BoolValue(monospace);
  if (attribute == "hinted") return BoolValue(hinted);
  if (attribute == "vendor") return vendor;
  if (attribute == "version") return version;
  return std::nullopt;
}

std::string FontInfo::ToString() const {
  std::vector<std::string> parts;
  auto add = [&](string_view key, const std::optional<std::string>& value) {
    if (value.has_value()) {
      parts.push_back(StrCat(key, ": ", *value));
    }
  };
  add("filename", filename);
  add("name", name);
  add("style", style);
  add("script", script);
  add("variant", variant);
  add("weight", weight);
  parts.push_back(StrCat("monospace: ", BoolValue(monospace)));
  parts.push_back(StrCat("hinted: ", BoolValue(hinted)));
  add("vendor", vendor);
  add("version", version);
  return StrCat("FontInfo(", absl::StrJoin(parts, ", "), ")");
}

}  // namespace lint
