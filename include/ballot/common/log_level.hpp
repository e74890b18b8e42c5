#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace ballot::common {

/// spdlog maps unknown names to off; only the literal "off" may do so here.
inline std::optional<spdlog::level::level_enum> parse_log_level(
    const std::string_view name) {
  auto level = spdlog::level::from_str(std::string{name});
  if (level == spdlog::level::off && name != "off") {
    return std::nullopt;
  }
  return level;
}

}  // namespace ballot::common
