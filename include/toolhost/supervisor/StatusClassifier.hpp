#pragma once

#include "toolhost/types.hpp"
#include <array>
#include <optional>
#include <string_view>

namespace toolhost {

/// Maps a raw output line to a status transition. Matching is a
/// case-insensitive substring test; running phrases are checked first and
/// win over error phrases on the same line.
class StatusClassifier {
public:
  static constexpr std::array<std::string_view, 4> kRunningPhrases = {
      "running on", "server started", "listening on", "model loaded"};

  static constexpr std::array<std::string_view, 4> kErrorPhrases = {
      "error", "failed", "exception", "traceback"};

  /// nullopt means the line leaves the status unchanged
  static std::optional<ToolStatus> classify(std::string_view line);
};

} // namespace toolhost
