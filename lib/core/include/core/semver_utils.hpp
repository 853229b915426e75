#pragma once

#include <optional>
#include <semver/semver.hpp>
#include <string>

namespace locus::core {

/// Parses a semantic version, std::nullopt when it is not one
[[nodiscard]] inline auto parse_version(const std::string &text) -> std::optional<semver::version>
{
  if (text.empty()) { return std::nullopt; }
  try {
    return semver::version::parse(text);
  } catch (const semver::semver_exception &) {
    return std::nullopt;
  }
}

/**
 * @brief Whether an envelope's version meets a protocol floor.
 *
 * Prerelease tags order below their release ("1.0.0-beta.2" < "1.0.0").
 *
 * @return false when either string does not parse
 */
[[nodiscard]] inline auto is_version_compatible(const std::string &version, const std::string &floor) -> bool
{
  const auto parsed = parse_version(version);
  const auto minimum = parse_version(floor);
  return parsed.has_value() and minimum.has_value() and *parsed >= *minimum;
}

}// namespace locus::core
