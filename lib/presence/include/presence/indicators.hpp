#pragma once

#include <presence/types.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace locus::presence {

/**
 * @brief Render-ready record for one located peer.
 *
 * Screen agnostic: positions are geographic, radii in meters.
 */
struct presence_indicator
{
  std::string id;
  std::string display_name;
  std::string color;
  geo::lat_lng position;///< Cell center, never a raw coordinate
  double uncertainty_radius{};///< Meters
  bool is_moving{};
  std::optional<double> heading;
  presence_status status{ presence_status::online };
  trust_tier tier{ trust_tier::public_ };
  bool is_verified{};
  std::uint64_t last_seen_ms{};
};

struct indicator_style
{
  double meters_per_pixel{};
  double radius_pixels{};///< Uncertainty circle, clamped to [20, 200]
  double opacity{};///< online 1.0, away 0.7, otherwise 0.4
  bool show_heading{};
};

/// Views without a location are skipped
[[nodiscard]] auto views_to_indicators(std::span<const presence_view> views) -> std::vector<presence_indicator>;

/**
 * @brief Web-mercator style hints for drawing an indicator at `zoom`.
 */
[[nodiscard]] auto style_for(const presence_indicator &indicator, double zoom) -> indicator_style;

}// namespace locus::presence
