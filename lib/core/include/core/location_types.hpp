#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace locus::core {

/**
 * @brief Raw device coordinates.
 *
 * Only ever held for the local user. Peers are known through geohash cells.
 */
struct coordinates
{
  double latitude{};///< Degrees, [-90, 90]
  double longitude{};///< Degrees, [-180, 180]
  std::optional<double> altitude;///< Meters above the ellipsoid
  std::optional<double> accuracy;///< Reported horizontal accuracy in meters
  std::optional<double> heading;///< Degrees clockwise from true north
  std::optional<double> speed;///< Meters per second
};

/// One sample delivered by a geolocation source
struct position_sample
{
  coordinates coords;
  std::uint64_t timestamp_ms{};///< Unix time the fix was taken
};

/// Failure classes reported by a geolocation source
enum class geolocation_error_code : std::uint8_t {
  permission_denied,///< User or platform refused access
  position_unavailable,///< Hardware could not produce a fix
  timeout,///< No fix within the platform deadline
};

struct geolocation_error
{
  geolocation_error_code code{};
  std::string message;
};

using fix_callback_t = std::function<void(const position_sample &)>;
using geolocation_error_callback_t = std::function<void(const geolocation_error &)>;

}// namespace locus::core
