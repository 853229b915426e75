#pragma once

#include <geo/geohash.hpp>

namespace locus::geo {

/// Mean Earth radius used for great-circle distances
inline constexpr double earth_radius_meters = 6371000.0;

/**
 * @brief Great-circle distance between two points (haversine).
 *
 * @return Distance in meters
 */
[[nodiscard]] auto haversine_meters(const lat_lng &from, const lat_lng &to) -> double;

}// namespace locus::geo
