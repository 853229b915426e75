#include <presence/precision_policy.hpp>
#include <presence/presence_config.hpp>

#include <algorithm>
#include <fstream>
#include <limits>
#include <spdlog/spdlog.h>

namespace locus::presence {

namespace {

  template<typename T>
  auto read_unsigned(const nlohmann::json &json_obj, const char *key, T &out) -> bool
  {
    if (not json_obj.contains(key)) { return true; }
    if (not json_obj[key].is_number_unsigned()) { return false; }
    const auto value = json_obj[key].get<std::uint64_t>();
    if (value > static_cast<std::uint64_t>(std::numeric_limits<T>::max())) { return false; }
    out = static_cast<T>(value);
    return true;
  }

  auto read_string(const nlohmann::json &json_obj, const char *key, std::string &out) -> bool
  {
    if (not json_obj.contains(key)) { return true; }
    if (not json_obj[key].is_string()) { return false; }
    out = json_obj[key].get<std::string>();
    return true;
  }

  auto read_millis(const nlohmann::json &json_obj, const char *key, std::chrono::milliseconds &out) -> bool
  {
    std::uint64_t value = static_cast<std::uint64_t>(out.count());
    if (not read_unsigned(json_obj, key, value)) { return false; }
    if (value > static_cast<std::uint64_t>(std::chrono::milliseconds::max().count())) { return false; }
    out = std::chrono::milliseconds{ static_cast<std::chrono::milliseconds::rep>(value) };
    return true;
  }

}// namespace

auto presence_config::from_json(const nlohmann::json &json_obj) -> std::optional<presence_config>
{
  if (not json_obj.is_object()) { return std::nullopt; }

  presence_config config;
  std::uint32_t public_precision = config.default_public_precision;

  const bool ok = read_string(json_obj, "channel_id", config.channel_id)
                  and read_string(json_obj, "display_name", config.display_name)
                  and read_string(json_obj, "color", config.color)
                  and read_millis(json_obj, "update_interval_ms", config.update_interval)
                  and read_millis(json_obj, "location_throttle_ms", config.location_throttle)
                  and read_unsigned(json_obj, "presence_ttl_seconds", config.presence_ttl_seconds)
                  and read_unsigned(json_obj, "default_public_precision", public_precision)
                  and read_unsigned(json_obj, "away_after_seconds", config.away_after_seconds);
  if (not ok) { return std::nullopt; }

  if (json_obj.contains("share_location_by_default")) {
    if (not json_obj["share_location_by_default"].is_boolean()) { return std::nullopt; }
    config.share_location_by_default = json_obj["share_location_by_default"].get<bool>();
  }

  config.default_public_precision =
    static_cast<std::uint8_t>(std::clamp<std::uint32_t>(public_precision, min_precision, max_precision));
  return config;
}

auto presence_config::to_json() const -> nlohmann::json
{
  return { { "channel_id", channel_id },
    { "display_name", display_name },
    { "color", color },
    { "update_interval_ms", update_interval.count() },
    { "location_throttle_ms", location_throttle.count() },
    { "presence_ttl_seconds", presence_ttl_seconds },
    { "share_location_by_default", share_location_by_default },
    { "default_public_precision", default_public_precision },
    { "away_after_seconds", away_after_seconds } };
}

auto load_config_file(const std::filesystem::path &path) -> std::optional<presence_config>
{
  std::ifstream file(path);
  if (not file) {
    spdlog::warn("[presence_config] cannot open {}", path.string());
    return std::nullopt;
  }

  const auto document = nlohmann::json::parse(file, nullptr, false);
  if (document.is_discarded()) {
    spdlog::warn("[presence_config] {} is not valid JSON", path.string());
    return std::nullopt;
  }

  auto config = presence_config::from_json(document);
  if (not config) { spdlog::warn("[presence_config] {} has a mistyped option", path.string()); }
  return config;
}

}// namespace locus::presence
