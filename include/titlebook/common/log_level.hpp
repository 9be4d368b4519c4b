#pragma once

#include <optional>
#include <string_view>

#include <spdlog/common.h>

namespace titlebook::common {

/// spdlog level named by `name`, or std::nullopt when no level has that name.
///
/// Accepts the spdlog level names plus the `warn` and `err` short forms.
inline std::optional<spdlog::level::level_enum> parse_log_level(
    const std::string_view name) {
  for (auto i = 0; i < spdlog::level::n_levels; ++i) {
    const auto level = static_cast<spdlog::level::level_enum>(i);
    const auto known = spdlog::level::to_string_view(level);
    if (name == std::string_view{known.data(), known.size()}) {
      return level;
    }
  }
  if (name == "warn") {
    return spdlog::level::warn;
  }
  if (name == "err") {
    return spdlog::level::err;
  }
  return std::nullopt;
}

}  // namespace titlebook::common
