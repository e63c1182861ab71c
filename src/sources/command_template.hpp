#pragma once

#include <map>
#include <string>
#include <string_view>

namespace symptomops::sources {

using TemplateVars = std::map<std::string, std::string>;

// Replaces `{name}` placeholders with values from `vars`. Unknown
// placeholders are left untouched so a typo stays visible in the logged
// command line.
inline std::string ExpandTemplate(std::string_view text, const TemplateVars& vars) {
  std::string out;
  out.reserve(text.size());
  std::size_t pos = 0;
  while (pos < text.size()) {
    const std::size_t open = text.find('{', pos);
    if (open == std::string_view::npos) {
      out.append(text.substr(pos));
      break;
    }
    const std::size_t close = text.find('}', open + 1);
    if (close == std::string_view::npos) {
      out.append(text.substr(pos));
      break;
    }
    out.append(text.substr(pos, open - pos));
    const std::string key(text.substr(open + 1, close - open - 1));
    const auto it = vars.find(key);
    if (it == vars.end()) {
      out.append(text.substr(open, close - open + 1));
    } else {
      out.append(it->second);
    }
    pos = close + 1;
  }
  return out;
}

} // namespace symptomops::sources
