#include <geo/distance.hpp>
#include <geolocation/random_walk.hpp>

#include <algorithm>
#include <cmath>
#include <numbers>

namespace locus::geolocation {

namespace {
  constexpr double half_circle_degrees = 180.0;
  constexpr double full_circle_degrees = 360.0;
  constexpr double max_turn_degrees = 30.0;
  constexpr double min_speed = 0.3;
  constexpr double max_speed = 1.8;
  constexpr double millis_per_second = 1000.0;
  constexpr double max_latitude = 89.0;

  auto to_radians(double degrees) -> double { return degrees * std::numbers::pi / half_circle_degrees; }
  auto to_degrees(double radians) -> double { return radians * half_circle_degrees / std::numbers::pi; }
}// namespace

random_walk::random_walk(double start_latitude, double start_longitude, std::uint32_t seed)
  : latitude_(start_latitude), longitude_(start_longitude), engine_(seed)
{
  std::uniform_real_distribution<double> initial_heading(0.0, full_circle_degrees);
  heading_ = initial_heading(engine_);
}

auto random_walk::next(double step_seconds) -> core::position_sample
{
  std::uniform_real_distribution<double> turn(-max_turn_degrees, max_turn_degrees);
  std::uniform_real_distribution<double> speed_dist(min_speed, max_speed);

  heading_ = std::fmod(heading_ + turn(engine_) + full_circle_degrees, full_circle_degrees);
  const auto speed = speed_dist(engine_);
  const auto distance = speed * step_seconds;

  const auto d_lat = distance * std::cos(to_radians(heading_)) / geo::earth_radius_meters;
  const auto d_lng =
    distance * std::sin(to_radians(heading_)) / (geo::earth_radius_meters * std::cos(to_radians(latitude_)));

  latitude_ = std::clamp(latitude_ + to_degrees(d_lat), -max_latitude, max_latitude);
  longitude_ += to_degrees(d_lng);
  if (longitude_ > half_circle_degrees) { longitude_ -= full_circle_degrees; }
  if (longitude_ < -half_circle_degrees) { longitude_ += full_circle_degrees; }

  return { .coords = { .latitude = latitude_,
             .longitude = longitude_,
             .altitude = std::nullopt,
             .accuracy = std::nullopt,
             .heading = heading_,
             .speed = speed },
    .timestamp_ms = 0 };
}

auto random_walk::track(std::size_t count, double step_seconds, std::uint64_t start_ms)
  -> std::vector<core::position_sample>
{
  std::vector<core::position_sample> samples;
  samples.reserve(count);
  const auto step_ms = static_cast<std::uint64_t>(step_seconds * millis_per_second);
  for (std::size_t i = 0; i < count; ++i) {
    auto sample = next(step_seconds);
    if (start_ms > 0) { sample.timestamp_ms = start_ms + i * step_ms; }
    samples.push_back(sample);
  }
  return samples;
}

}// namespace locus::geolocation
