#pragma once

#include <presence/types.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace locus::presence::protocol {

/// Envelopes stamped with an older version are dropped on receipt
inline constexpr auto minimum_protocol_version = "0.1.0";

enum class broadcast_type : std::uint8_t { location, status, proximity, leave };

[[nodiscard]] auto to_string(broadcast_type type) -> std::string_view;

/// The publishable part of a location commitment (the geohash stays local)
struct wire_commitment
{
  std::string digest;
  std::string signature;
  std::uint64_t timestamp_ms{};
};

/// Location update fanned out to one precision level per trust tier
struct location_payload
{
  wire_commitment commitment;
  std::vector<precision_level> precision_levels;
  bool is_moving{};
  std::optional<double> heading;
  std::optional<speed_category> speed;
};

struct status_payload
{
  presence_status status{ presence_status::online };
  std::optional<std::string> message;
  std::optional<device_type> device;
  bool sharing_location{};///< False tells receivers to drop any stored location
  std::optional<std::string> display_name;
  std::optional<std::string> color;
};

/// Signed claim of the sender's distance category to `target`
struct proximity_payload
{
  std::string target;
  std::string proof;
  proximity_category category{ proximity_category::far };
};

struct leave_payload
{
};

using payload_t = std::variant<location_payload, status_payload, proximity_payload, leave_payload>;

/**
 * @brief Signed presence envelope exchanged between peers.
 *
 * Immutable once built. The signature covers every field except itself; see
 * signing_bytes().
 */
struct presence_broadcast
{
  std::string version;///< Sender's protocol version (semver)
  std::string sender;///< Sender identity (hex public key)
  payload_t payload;
  std::string signature;///< Hex signature over signing_bytes()
  std::uint64_t timestamp_ms{};
  std::uint64_t sequence{};///< Per-sender, strictly increasing
  std::uint32_t ttl_seconds{};

  [[nodiscard]] auto type() const -> broadcast_type;

  /**
   * @brief Canonical bytes the sender signs and the receiver verifies.
   *
   * @return Compact JSON of the envelope without its signature, keys sorted
   */
  [[nodiscard]] auto signing_bytes() const -> std::string;

  /**
   * @brief Serializes the envelope to JSON bytes.
   */
  [[nodiscard]] auto serialize() const -> std::vector<std::byte>;

  /**
   * @brief Deserializes an envelope from raw bytes.
   *
   * @param bytes Raw bytes containing a JSON envelope
   * @return Parsed envelope or std::nullopt on malformed input
   */
  static auto deserialize(std::span<const std::byte> bytes) -> std::optional<presence_broadcast>;

  /**
   * @brief Deserializes an envelope from a JSON string.
   *
   * Rejects unknown types, wrongly typed fields and precision levels whose
   * geohash is invalid or disagrees with its declared precision.
   */
  static auto deserialize(const std::string &json) -> std::optional<presence_broadcast>;
};

[[nodiscard]] auto to_bytes(std::string_view text) -> std::vector<std::byte>;

}// namespace locus::presence::protocol
