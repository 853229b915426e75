#pragma once

#include <presence/types.hpp>

#include <optional>

namespace locus::presence {

/**
 * @brief Buckets a great-circle distance.
 *
 * here < 50 m, nearby < 500 m, same_area < 5 km, same_city < 50 km, else far.
 */
[[nodiscard]] auto categorize(double meters) -> proximity_category;

/**
 * @brief Proximity between the local fix and a peer's cell center.
 *
 * Without a local fix the result is `far`, unverified and not mutually visible.
 * Visibility holds when the distance is under twice the peer's uncertainty radius.
 *
 * @param self Local fix, if any
 * @param peer The peer's location as the local user may see it
 */
[[nodiscard]] auto compute_proximity(const std::optional<location_fix> &self, const viewable_location &peer)
  -> proximity_info;

}// namespace locus::presence
