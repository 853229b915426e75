#include <geo/distance.hpp>
#include <presence/proximity.hpp>

namespace locus::presence {

auto categorize(double meters) -> proximity_category
{
  constexpr double here_limit = 50.0;
  constexpr double nearby_limit = 500.0;
  constexpr double same_area_limit = 5000.0;
  constexpr double same_city_limit = 50000.0;

  if (meters < here_limit) { return proximity_category::here; }
  if (meters < nearby_limit) { return proximity_category::nearby; }
  if (meters < same_area_limit) { return proximity_category::same_area; }
  if (meters < same_city_limit) { return proximity_category::same_city; }
  return proximity_category::far;
}

auto compute_proximity(const std::optional<location_fix> &self, const viewable_location &peer) -> proximity_info
{
  if (not self.has_value()) {
    return { .category = proximity_category::far,
      .verified = false,
      .approximate_meters = std::nullopt,
      .mutually_visible = false };
  }

  const auto distance = geo::haversine_meters(
    { .latitude = self->coords.latitude, .longitude = self->coords.longitude }, peer.center);

  return { .category = categorize(distance),
    .verified = false,
    .approximate_meters = distance,
    .mutually_visible = distance < 2.0 * peer.uncertainty_radius_meters };
}

}// namespace locus::presence
