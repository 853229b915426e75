#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace locus::geo {

/// Maximum geohash length handled by the codec (sub-decimeter cells)
inline constexpr std::size_t max_precision = 12;

struct lat_lng
{
  double latitude{};
  double longitude{};
};

/**
 * @brief Bounding box of a geohash cell in degrees.
 */
struct cell_bounds
{
  double min_lat{};
  double max_lat{};
  double min_lng{};
  double max_lng{};

  [[nodiscard]] auto center() const -> lat_lng
  {
    return { .latitude = (min_lat + max_lat) / 2.0, .longitude = (min_lng + max_lng) / 2.0 };
  }

  [[nodiscard]] auto contains(const lat_lng &point) const -> bool
  {
    return point.latitude >= min_lat and point.latitude <= max_lat and point.longitude >= min_lng
           and point.longitude <= max_lng;
  }
};

namespace geohash {

  /**
   * @brief Encodes a coordinate as a base-32 geohash.
   *
   * @param latitude Degrees in [-90, 90]
   * @param longitude Degrees in [-180, 180]
   * @param precision Number of characters, [1, 12]
   * @return Geohash string of exactly `precision` characters
   * @throws std::invalid_argument if any argument is out of range
   */
  [[nodiscard]] auto encode(double latitude, double longitude, std::size_t precision) -> std::string;

  /**
   * @brief Decodes a geohash into its cell bounds.
   *
   * Case-insensitive. An empty hash yields the whole globe.
   *
   * @throws std::invalid_argument on characters outside the geohash alphabet
   */
  [[nodiscard]] auto bounds(std::string_view hash) -> cell_bounds;

  /**
   * @brief Decodes a geohash to the midpoint of its cell.
   *
   * @throws std::invalid_argument on characters outside the geohash alphabet
   */
  [[nodiscard]] auto decode(std::string_view hash) -> lat_lng;

  /**
   * @brief Truncates a geohash to at most `precision` characters.
   */
  [[nodiscard]] auto truncate(std::string_view hash, std::size_t precision) -> std::string;

  /**
   * @brief True when the hash is 1-12 characters of the geohash alphabet.
   */
  [[nodiscard]] auto is_valid(std::string_view hash) -> bool;

  /**
   * @brief The 8 cells surrounding `hash` at the same precision, N then clockwise.
   *
   * Longitude wraps at the antimeridian; latitude clamps at the poles.
   */
  [[nodiscard]] auto neighbors(std::string_view hash) -> std::array<std::string, 8>;

}// namespace geohash

}// namespace locus::geo
