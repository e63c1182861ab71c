#include "watch/keyword_matcher.hpp"

#include <algorithm>
#include <utility>

namespace symptomops::watch {

KeywordMatcher::KeywordMatcher(std::vector<std::string> keywords) : keywords_(std::move(keywords)) {
  // An empty keyword would match every line.
  keywords_.erase(std::remove(keywords_.begin(), keywords_.end(), std::string{}), keywords_.end());
}

bool KeywordMatcher::Matches(std::string_view line) const {
  return FirstMatch(line).has_value();
}

std::optional<std::string> KeywordMatcher::FirstMatch(std::string_view line) const {
  for (const auto& keyword : keywords_) {
    if (line.find(keyword) != std::string_view::npos) {
      return keyword;
    }
  }
  return std::nullopt;
}

} // namespace symptomops::watch
