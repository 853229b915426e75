#include <presence/indicators.hpp>

#include <algorithm>
#include <cmath>
#include <numbers>

namespace locus::presence {

auto views_to_indicators(std::span<const presence_view> views) -> std::vector<presence_indicator>
{
  std::vector<presence_indicator> indicators;
  for (const auto &view : views) {
    if (not view.location.has_value()) { continue; }

    indicators.push_back({ .id = view.identity,
      .display_name = view.display_name,
      .color = view.color,
      .position = view.location->center,
      .uncertainty_radius = view.location->uncertainty_radius_meters,
      .is_moving = view.location->is_moving,
      .heading = view.location->heading,
      .status = view.status,
      .tier = view.tier,
      .is_verified = view.is_verified,
      .last_seen_ms = view.last_seen_ms });
  }
  return indicators;
}

auto style_for(const presence_indicator &indicator, double zoom) -> indicator_style
{
  constexpr double equator_meters_per_pixel = 156543.03392;
  constexpr double min_radius_pixels = 20.0;
  constexpr double max_radius_pixels = 200.0;
  constexpr double away_opacity = 0.7;
  constexpr double inactive_opacity = 0.4;
  constexpr double half_circle_degrees = 180.0;

  const auto latitude_radians = indicator.position.latitude * std::numbers::pi / half_circle_degrees;
  const auto meters_per_pixel = equator_meters_per_pixel * std::cos(latitude_radians) / std::pow(2.0, zoom);

  double opacity = inactive_opacity;
  if (indicator.status == presence_status::online) {
    opacity = 1.0;
  } else if (indicator.status == presence_status::away) {
    opacity = away_opacity;
  }

  const auto raw_radius = meters_per_pixel > 0.0 ? indicator.uncertainty_radius / meters_per_pixel : max_radius_pixels;

  return { .meters_per_pixel = meters_per_pixel,
    .radius_pixels = std::clamp(raw_radius, min_radius_pixels, max_radius_pixels),
    .opacity = opacity,
    .show_heading = indicator.is_moving and indicator.heading.has_value() };
}

}// namespace locus::presence
