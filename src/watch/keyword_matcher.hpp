#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace symptomops::watch {

// Case-sensitive, exact-substring keyword matcher. A line matches when any
// keyword occurs anywhere inside it; `error` does not match `Error`.
class KeywordMatcher {
public:
  explicit KeywordMatcher(std::vector<std::string> keywords);

  bool Matches(std::string_view line) const;

  // First keyword (in configuration order) found in `line`.
  std::optional<std::string> FirstMatch(std::string_view line) const;

  const std::vector<std::string>& Keywords() const {
    return keywords_;
  }

private:
  std::vector<std::string> keywords_;
};

} // namespace symptomops::watch
