#pragma once

#include <presence/types.hpp>

#include <algorithm>
#include <array>
#include <cstdint>

namespace locus::presence {

/// Every tier in disclosure order, least to most trusted
inline constexpr std::array<trust_tier, 5> all_tiers{
  trust_tier::public_,
  trust_tier::network,
  trust_tier::friends,
  trust_tier::close,
  trust_tier::intimate,
};

inline constexpr std::uint8_t min_precision = 1;
inline constexpr std::uint8_t max_precision = 12;

/**
 * @brief Geohash characters a viewer at `tier` may read.
 *
 * public 2 (~630 km), network 4 (~20 km), friends 5 (~2.4 km),
 * close 7 (~76 m), intimate 9 (~2.4 m).
 */
[[nodiscard]] constexpr auto precision_for(trust_tier tier) -> std::uint8_t
{
  switch (tier) {
  case trust_tier::intimate:
    return 9;// NOLINT(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
  case trust_tier::close:
    return 7;// NOLINT(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
  case trust_tier::friends:
    return 5;// NOLINT(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
  case trust_tier::network:
    return 4;// NOLINT(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
  case trust_tier::public_:
    break;
  }
  return 2;
}

/**
 * @brief Approximate cell radius in meters for a geohash length.
 *
 * Clamped to [1, 12]. A function of precision only, never of a device's
 * reported accuracy.
 */
[[nodiscard]] constexpr auto radius_for_precision(int precision) -> double
{
  constexpr std::array<double, max_precision> radius_meters{
    2500000.0, 630000.0, 78000.0, 20000.0, 2400.0, 610.0, 76.0, 19.0, 2.4, 0.6, 0.074, 0.019
  };
  const auto clamped = std::clamp(precision, static_cast<int>(min_precision), static_cast<int>(max_precision));
  return radius_meters.at(static_cast<std::size_t>(clamped - 1));
}

}// namespace locus::presence
