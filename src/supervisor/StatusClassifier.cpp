#include "toolhost/supervisor/StatusClassifier.hpp"
#include <algorithm>
#include <cctype>
#include <string>

namespace toolhost {

template <size_t N>
static bool contains_any(const std::string &haystack,
                         const std::array<std::string_view, N> &phrases) {
  return std::any_of(phrases.begin(), phrases.end(),
                     [&](std::string_view phrase) {
                       return haystack.find(phrase) != std::string::npos;
                     });
}

std::optional<ToolStatus> StatusClassifier::classify(std::string_view line) {
  std::string lowered(line);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  if (contains_any(lowered, kRunningPhrases))
    return ToolStatus::Running;
  if (contains_any(lowered, kErrorPhrases))
    return ToolStatus::Error;
  return std::nullopt;
}

} // namespace toolhost
