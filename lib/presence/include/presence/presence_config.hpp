#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace locus::presence {

/**
 * @brief Presence manager options.
 *
 * JSON keys mirror the field names; durations carry an `_ms` suffix.
 */
struct presence_config
{
  std::string channel_id{ "default" };
  std::string display_name;
  std::string color;
  std::chrono::milliseconds update_interval{ 5000 };///< Periodic self-broadcast cadence
  std::chrono::milliseconds location_throttle{ 1000 };///< Minimum gap between location broadcasts
  std::uint32_t presence_ttl_seconds{ 60 };
  bool share_location_by_default{ false };
  std::uint8_t default_public_precision{ 4 };///< Can only lower the public level, clamped to [1, 12]
  std::uint32_t away_after_seconds{ 30 };

  /**
   * @brief Reads a config object; absent keys keep their defaults.
   *
   * @return std::nullopt if any recognized key has the wrong type
   */
  [[nodiscard]] static auto from_json(const nlohmann::json &json_obj) -> std::optional<presence_config>;

  [[nodiscard]] auto to_json() const -> nlohmann::json;
};

/**
 * @brief Loads a JSON config file.
 *
 * @return std::nullopt if the file is missing, unparseable or mistyped
 */
[[nodiscard]] auto load_config_file(const std::filesystem::path &path) -> std::optional<presence_config>;

}// namespace locus::presence
