#include <geo/distance.hpp>

#include <cmath>
#include <numbers>

namespace locus::geo {

namespace {
  constexpr double half_circle_degrees = 180.0;

  auto to_radians(double degrees) -> double { return degrees * std::numbers::pi / half_circle_degrees; }
}// namespace

auto haversine_meters(const lat_lng &from, const lat_lng &to) -> double
{
  const auto d_lat = to_radians(to.latitude - from.latitude);
  const auto d_lng = to_radians(to.longitude - from.longitude);

  const auto sin_lat = std::sin(d_lat / 2.0);
  const auto sin_lng = std::sin(d_lng / 2.0);
  const auto a = sin_lat * sin_lat
                 + std::cos(to_radians(from.latitude)) * std::cos(to_radians(to.latitude)) * sin_lng * sin_lng;

  return earth_radius_meters * 2.0 * std::atan2(std::sqrt(a), std::sqrt(1.0 - a));
}

}// namespace locus::geo
