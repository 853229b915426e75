#include <geo/geohash.hpp>

#include <algorithm>
#include <cctype>
#include <fmt/format.h>
#include <optional>
#include <stdexcept>

namespace locus::geo::geohash {

namespace {

  constexpr std::string_view alphabet = "0123456789bcdefghjkmnpqrstuvwxyz";
  constexpr int bits_per_char = 5;
  constexpr double max_latitude = 90.0;
  constexpr double max_longitude = 180.0;

  auto char_value(char character) -> std::optional<int>
  {
    const auto lowered = static_cast<char>(std::tolower(static_cast<unsigned char>(character)));
    const auto pos = alphabet.find(lowered);
    if (pos == std::string_view::npos) { return std::nullopt; }
    return static_cast<int>(pos);
  }

}// namespace

auto encode(double latitude, double longitude, std::size_t precision) -> std::string
{
  if (precision < 1 or precision > max_precision) {
    throw std::invalid_argument(fmt::format("Geohash precision must be between 1 and {}", max_precision));
  }
  if (latitude < -max_latitude or latitude > max_latitude) {
    throw std::invalid_argument("Latitude must be between -90 and 90");
  }
  if (longitude < -max_longitude or longitude > max_longitude) {
    throw std::invalid_argument("Longitude must be between -180 and 180");
  }

  cell_bounds cell{
    .min_lat = -max_latitude, .max_lat = max_latitude, .min_lng = -max_longitude, .max_lng = max_longitude
  };

  std::string hash;
  hash.reserve(precision);
  int bit = 0;
  int value = 0;
  bool even_bit = true;

  while (hash.size() < precision) {
    value <<= 1;
    if (even_bit) {
      const auto mid = (cell.min_lng + cell.max_lng) / 2.0;
      if (longitude >= mid) {
        value |= 1;
        cell.min_lng = mid;
      } else {
        cell.max_lng = mid;
      }
    } else {
      const auto mid = (cell.min_lat + cell.max_lat) / 2.0;
      if (latitude >= mid) {
        value |= 1;
        cell.min_lat = mid;
      } else {
        cell.max_lat = mid;
      }
    }
    even_bit = not even_bit;

    if (++bit == bits_per_char) {
      hash.push_back(alphabet[static_cast<std::size_t>(value)]);
      bit = 0;
      value = 0;
    }
  }

  return hash;
}

auto bounds(std::string_view hash) -> cell_bounds
{
  cell_bounds cell{
    .min_lat = -max_latitude, .max_lat = max_latitude, .min_lng = -max_longitude, .max_lng = max_longitude
  };
  bool even_bit = true;

  for (const auto character : hash) {
    const auto value = char_value(character);
    if (not value.has_value()) {
      throw std::invalid_argument(fmt::format("Invalid geohash character: '{}'", character));
    }

    for (int shift = bits_per_char - 1; shift >= 0; --shift) {
      const bool set = ((*value >> shift) & 1) != 0;
      if (even_bit) {
        const auto mid = (cell.min_lng + cell.max_lng) / 2.0;
        (set ? cell.min_lng : cell.max_lng) = mid;
      } else {
        const auto mid = (cell.min_lat + cell.max_lat) / 2.0;
        (set ? cell.min_lat : cell.max_lat) = mid;
      }
      even_bit = not even_bit;
    }
  }

  return cell;
}

auto decode(std::string_view hash) -> lat_lng { return bounds(hash).center(); }

auto truncate(std::string_view hash, std::size_t precision) -> std::string
{
  return std::string{ hash.substr(0, std::min(precision, hash.size())) };
}

auto is_valid(std::string_view hash) -> bool
{
  if (hash.empty() or hash.size() > max_precision) { return false; }
  return std::ranges::all_of(hash, [](char character) { return char_value(character).has_value(); });
}

auto neighbors(std::string_view hash) -> std::array<std::string, 8>
{
  const auto cell = bounds(hash);
  const auto center = cell.center();
  const auto lat_delta = cell.max_lat - cell.min_lat;
  const auto lng_delta = cell.max_lng - cell.min_lng;

  struct offset
  {
    double d_lat;
    double d_lng;
  };

  const std::array<offset, 8> directions{ {
    { lat_delta, 0.0 },
    { lat_delta, lng_delta },
    { 0.0, lng_delta },
    { -lat_delta, lng_delta },
    { -lat_delta, 0.0 },
    { -lat_delta, -lng_delta },
    { 0.0, -lng_delta },
    { lat_delta, -lng_delta },
  } };

  std::array<std::string, 8> result;
  std::ranges::transform(directions, result.begin(), [&](const offset &dir) {
    auto lat = std::clamp(center.latitude + dir.d_lat, -max_latitude, max_latitude);
    auto lng = center.longitude + dir.d_lng;
    if (lng > max_longitude) { lng -= 2 * max_longitude; }
    if (lng < -max_longitude) { lng += 2 * max_longitude; }
    return encode(lat, lng, hash.size());
  });
  return result;
}

}// namespace locus::geo::geohash
