#pragma once

#include <core/location_types.hpp>

#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

namespace locus::geolocation {

/**
 * @brief Seeded pedestrian-ish random walk for simulated peers.
 *
 * Each step turns by a bounded random angle and moves at a random walking
 * speed, so identical seeds give identical tracks.
 */
class random_walk
{
public:
  random_walk(double start_latitude, double start_longitude, std::uint32_t seed);

  /// Advances by `step_seconds`; the fix is left unstamped (timestamp 0)
  auto next(double step_seconds = 1.0) -> core::position_sample;

  /// The next `count` fixes, `step_seconds` apart, stamped from `start_ms` unless it is 0
  auto track(std::size_t count, double step_seconds, std::uint64_t start_ms) -> std::vector<core::position_sample>;

private:
  double latitude_;
  double longitude_;
  double heading_;
  std::mt19937 engine_;
};

}// namespace locus::geolocation
