#pragma once

#include <core/location_types.hpp>
#include <crypto/commitment.hpp>
#include <geo/geohash.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace locus::presence {

/**
 * @brief Relationship strength, in disclosure order.
 *
 * Comparisons follow disclosure: `public_ < network < friends < close < intimate`.
 */
enum class trust_tier : std::uint8_t {
  public_ = 0,///< Anyone on the channel
  network,///< Friends of friends
  friends,///< Regular contacts
  close,///< Close friends
  intimate,///< Partner / family
};

enum class presence_status : std::uint8_t { online, away, busy, invisible, offline };

enum class device_type : std::uint8_t { mobile, desktop, tablet, unknown };

enum class location_source : std::uint8_t { gps, network, manual, beacon, nfc, ip, cached };

enum class speed_category : std::uint8_t { stationary, walking, cycling, driving, flying };

/// Ordered nearest first
enum class proximity_category : std::uint8_t { here, nearby, same_area, same_city, far };

/// Presence manager lifecycle; `disconnected` is terminal
enum class connection_state : std::uint8_t { connecting, connected, reconnecting, disconnected };

[[nodiscard]] auto to_string(trust_tier tier) -> std::string_view;
[[nodiscard]] auto to_string(presence_status status) -> std::string_view;
[[nodiscard]] auto to_string(device_type device) -> std::string_view;
[[nodiscard]] auto to_string(location_source source) -> std::string_view;
[[nodiscard]] auto to_string(speed_category speed) -> std::string_view;
[[nodiscard]] auto to_string(proximity_category category) -> std::string_view;
[[nodiscard]] auto to_string(connection_state state) -> std::string_view;

[[nodiscard]] auto trust_tier_from_string(std::string_view name) -> std::optional<trust_tier>;
[[nodiscard]] auto presence_status_from_string(std::string_view name) -> std::optional<presence_status>;
[[nodiscard]] auto device_type_from_string(std::string_view name) -> std::optional<device_type>;
[[nodiscard]] auto location_source_from_string(std::string_view name) -> std::optional<location_source>;
[[nodiscard]] auto speed_category_from_string(std::string_view name) -> std::optional<speed_category>;
[[nodiscard]] auto proximity_category_from_string(std::string_view name) -> std::optional<proximity_category>;

/// Moving threshold in meters per second
inline constexpr double moving_speed_threshold = 0.5;

/**
 * @brief Buckets a speed in m/s.
 *
 * Below 0.5 stationary, below 2 walking, below 8 cycling, below 50 driving.
 */
[[nodiscard]] auto speed_category_for(double meters_per_second) -> speed_category;

/**
 * @brief The local user's own fix. Never serialized in full.
 */
struct location_fix
{
  core::coordinates coords;
  location_source source{ location_source::manual };
  std::uint64_t timestamp_ms{};
  bool is_live{};///< True only for continuously updated GPS fixes
  crypto::commitment commitment;
};

/// One candidate precision of a broadcast, keyed by the tier it is meant for
struct precision_level
{
  trust_tier tier{ trust_tier::public_ };
  std::string geohash;///< Full geohash truncated to `precision` characters
  std::uint8_t precision{};
};

/**
 * @brief Last location a peer broadcast, as received.
 *
 * Holds only geohash strings; a peer's coordinates are never stored.
 */
struct received_location
{
  std::vector<precision_level> levels;
  std::string digest;///< Peer's commitment digest
  std::uint64_t timestamp_ms{};///< Commitment timestamp
  bool verified{};///< Commitment signature checked against the sender
  bool is_moving{};
  std::optional<double> heading;
  std::optional<speed_category> speed;
};

struct user_presence
{
  std::string identity;
  std::string display_name;
  std::string color;
  std::optional<location_fix> location;///< Self only
  std::optional<received_location> shared_location;///< Peers only
  presence_status status{ presence_status::online };
  std::optional<std::string> status_message;
  std::uint64_t last_seen_ms{};
  bool is_moving{};
  device_type device{ device_type::unknown };
};

/**
 * @brief Location as a specific viewer is entitled to see it.
 *
 * `uncertainty_radius_meters` depends only on `precision`.
 */
struct viewable_location
{
  std::string geohash;
  std::uint8_t precision{};
  geo::lat_lng center;
  geo::cell_bounds bounds;
  double uncertainty_radius_meters{};
  std::uint64_t age_seconds{};
  bool is_moving{};
  std::optional<double> heading;
  std::optional<speed_category> speed;
};

struct proximity_info
{
  proximity_category category{ proximity_category::far };
  bool verified{};///< Backed by a signed proximity broadcast from the peer
  std::optional<double> approximate_meters;
  bool mutually_visible{};
};

/// Per-peer projection of a user_presence through the local trust tier
struct presence_view
{
  std::string identity;
  std::string display_name;
  std::string color;
  std::optional<viewable_location> location;
  presence_status status{ presence_status::online };
  std::uint64_t last_seen_ms{};
  trust_tier tier{ trust_tier::public_ };
  bool is_verified{};
  std::optional<proximity_info> proximity;
};

/// "abcdef12..." style placeholder for peers that never announced a name
[[nodiscard]] auto default_display_name(std::string_view identity) -> std::string;

/// Stable `hsl(h, 70%, 50%)` color derived from the identity
[[nodiscard]] auto default_color(std::string_view identity) -> std::string;

}// namespace locus::presence
