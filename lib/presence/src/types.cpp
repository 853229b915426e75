#include <presence/types.hpp>

#include <array>
#include <cstdint>
#include <fmt/format.h>
#include <utility>

namespace locus::presence {

namespace {

  template<typename Enum, std::size_t N>
  auto lookup_name(const std::array<std::pair<Enum, std::string_view>, N> &table, Enum value) -> std::string_view
  {
    for (const auto &[key, name] : table) {
      if (key == value) { return name; }
    }
    return "unknown";
  }

  template<typename Enum, std::size_t N>
  auto lookup_value(const std::array<std::pair<Enum, std::string_view>, N> &table, std::string_view name)
    -> std::optional<Enum>
  {
    for (const auto &[key, entry] : table) {
      if (entry == name) { return key; }
    }
    return std::nullopt;
  }

  constexpr std::array<std::pair<trust_tier, std::string_view>, 5> trust_tier_names{ {
    { trust_tier::public_, "public" },
    { trust_tier::network, "network" },
    { trust_tier::friends, "friends" },
    { trust_tier::close, "close" },
    { trust_tier::intimate, "intimate" },
  } };

  constexpr std::array<std::pair<presence_status, std::string_view>, 5> status_names{ {
    { presence_status::online, "online" },
    { presence_status::away, "away" },
    { presence_status::busy, "busy" },
    { presence_status::invisible, "invisible" },
    { presence_status::offline, "offline" },
  } };

  constexpr std::array<std::pair<device_type, std::string_view>, 4> device_names{ {
    { device_type::mobile, "mobile" },
    { device_type::desktop, "desktop" },
    { device_type::tablet, "tablet" },
    { device_type::unknown, "unknown" },
  } };

  constexpr std::array<std::pair<location_source, std::string_view>, 7> source_names{ {
    { location_source::gps, "gps" },
    { location_source::network, "network" },
    { location_source::manual, "manual" },
    { location_source::beacon, "beacon" },
    { location_source::nfc, "nfc" },
    { location_source::ip, "ip" },
    { location_source::cached, "cached" },
  } };

  constexpr std::array<std::pair<speed_category, std::string_view>, 5> speed_names{ {
    { speed_category::stationary, "stationary" },
    { speed_category::walking, "walking" },
    { speed_category::cycling, "cycling" },
    { speed_category::driving, "driving" },
    { speed_category::flying, "flying" },
  } };

  constexpr std::array<std::pair<proximity_category, std::string_view>, 5> proximity_names{ {
    { proximity_category::here, "here" },
    { proximity_category::nearby, "nearby" },
    { proximity_category::same_area, "same-area" },
    { proximity_category::same_city, "same-city" },
    { proximity_category::far, "far" },
  } };

  constexpr std::array<std::pair<connection_state, std::string_view>, 4> connection_names{ {
    { connection_state::connecting, "connecting" },
    { connection_state::connected, "connected" },
    { connection_state::reconnecting, "reconnecting" },
    { connection_state::disconnected, "disconnected" },
  } };

}// namespace

auto to_string(trust_tier tier) -> std::string_view { return lookup_name(trust_tier_names, tier); }
auto to_string(presence_status status) -> std::string_view { return lookup_name(status_names, status); }
auto to_string(device_type device) -> std::string_view { return lookup_name(device_names, device); }
auto to_string(location_source source) -> std::string_view { return lookup_name(source_names, source); }
auto to_string(speed_category speed) -> std::string_view { return lookup_name(speed_names, speed); }
auto to_string(proximity_category category) -> std::string_view { return lookup_name(proximity_names, category); }
auto to_string(connection_state state) -> std::string_view { return lookup_name(connection_names, state); }

auto trust_tier_from_string(std::string_view name) -> std::optional<trust_tier>
{
  return lookup_value(trust_tier_names, name);
}

auto presence_status_from_string(std::string_view name) -> std::optional<presence_status>
{
  return lookup_value(status_names, name);
}

auto device_type_from_string(std::string_view name) -> std::optional<device_type>
{
  return lookup_value(device_names, name);
}

auto location_source_from_string(std::string_view name) -> std::optional<location_source>
{
  return lookup_value(source_names, name);
}

auto speed_category_from_string(std::string_view name) -> std::optional<speed_category>
{
  return lookup_value(speed_names, name);
}

auto proximity_category_from_string(std::string_view name) -> std::optional<proximity_category>
{
  return lookup_value(proximity_names, name);
}

auto speed_category_for(double meters_per_second) -> speed_category
{
  constexpr double walking_limit = 2.0;
  constexpr double cycling_limit = 8.0;
  constexpr double driving_limit = 50.0;

  if (meters_per_second < moving_speed_threshold) { return speed_category::stationary; }
  if (meters_per_second < walking_limit) { return speed_category::walking; }
  if (meters_per_second < cycling_limit) { return speed_category::cycling; }
  if (meters_per_second < driving_limit) { return speed_category::driving; }
  return speed_category::flying;
}

auto default_display_name(std::string_view identity) -> std::string
{
  constexpr std::size_t visible_chars = 8;
  return fmt::format("{}...", identity.substr(0, visible_chars));
}

auto default_color(std::string_view identity) -> std::string
{
  constexpr int hue_range = 360;
  constexpr int hash_shift = 5;

  std::int32_t hash = 0;
  for (const auto character : identity) {
    // wraps like a 32-bit integer hash
    const auto shifted = static_cast<std::uint32_t>(hash) << hash_shift;
    hash = static_cast<std::int32_t>(
      static_cast<std::uint32_t>(static_cast<unsigned char>(character)) + shifted - static_cast<std::uint32_t>(hash));
  }

  auto hue = hash % hue_range;
  if (hue < 0) { hue += hue_range; }
  return fmt::format("hsl({}, 70%, 50%)", hue);
}

}// namespace locus::presence
