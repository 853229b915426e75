#include <core/overload.hpp>
#include <presence/protocol.hpp>

#include <algorithm>
#include <bit>
#include <limits>
#include <nlohmann/json.hpp>

namespace locus::presence::protocol {

namespace {

  auto commitment_to_json(const wire_commitment &value) -> nlohmann::json
  {
    return { { "digest", value.digest }, { "sig", value.signature }, { "ts", value.timestamp_ms } };
  }

  auto payload_to_json(const payload_t &payload) -> nlohmann::json
  {
    return std::visit(core::overload{
                        [](const location_payload &loc) {
                          nlohmann::json levels = nlohmann::json::array();
                          for (const auto &level : loc.precision_levels) {
                            levels.push_back({ { "tier", std::string{ to_string(level.tier) } },
                              { "geohash", level.geohash },
                              { "precision", level.precision } });
                          }
                          nlohmann::json json_obj{ { "commitment", commitment_to_json(loc.commitment) },
                            { "levels", levels },
                            { "moving", loc.is_moving } };
                          if (loc.heading) { json_obj["heading"] = *loc.heading; }
                          if (loc.speed) { json_obj["speed"] = std::string{ to_string(*loc.speed) }; }
                          return json_obj;
                        },
                        [](const status_payload &status) {
                          nlohmann::json json_obj{ { "status", std::string{ to_string(status.status) } },
                            { "sharing", status.sharing_location } };
                          if (status.message) { json_obj["message"] = *status.message; }
                          if (status.device) { json_obj["device"] = std::string{ to_string(*status.device) }; }
                          if (status.display_name) { json_obj["name"] = *status.display_name; }
                          if (status.color) { json_obj["color"] = *status.color; }
                          return json_obj;
                        },
                        [](const proximity_payload &prox) {
                          return nlohmann::json{ { "target", prox.target },
                            { "proof", prox.proof },
                            { "category", std::string{ to_string(prox.category) } } };
                        },
                        [](const leave_payload &) { return nlohmann::json::object(); },
                      },
      payload);
  }

  auto envelope_to_json(const presence_broadcast &broadcast) -> nlohmann::json
  {
    return { { "v", broadcast.version },
      { "sender", broadcast.sender },
      { "type", std::string{ to_string(broadcast.type()) } },
      { "payload", payload_to_json(broadcast.payload) },
      { "ts", broadcast.timestamp_ms },
      { "seq", broadcast.sequence },
      { "ttl", broadcast.ttl_seconds } };
  }

  auto has_string(const nlohmann::json &json_obj, const char *key) -> bool
  {
    return json_obj.contains(key) and json_obj[key].is_string();
  }

  auto has_unsigned(const nlohmann::json &json_obj, const char *key) -> bool
  {
    return json_obj.contains(key) and json_obj[key].is_number_unsigned();
  }

  auto has_uint32(const nlohmann::json &json_obj, const char *key) -> bool
  {
    return has_unsigned(json_obj, key)
           and json_obj[key].get<std::uint64_t>() <= std::numeric_limits<std::uint32_t>::max();
  }

  auto optional_string(const nlohmann::json &json_obj, const char *key, std::optional<std::string> &out) -> bool
  {
    if (not json_obj.contains(key)) { return true; }
    if (not json_obj[key].is_string()) { return false; }
    out = json_obj[key].get<std::string>();
    return true;
  }

  auto parse_level(const nlohmann::json &json_obj) -> std::optional<precision_level>
  {
    if (not json_obj.is_object() or not has_string(json_obj, "tier") or not has_string(json_obj, "geohash")
        or not has_unsigned(json_obj, "precision")) {
      return std::nullopt;
    }

    const auto tier = trust_tier_from_string(json_obj["tier"].get<std::string>());
    auto geohash = json_obj["geohash"].get<std::string>();
    const auto precision = json_obj["precision"].get<std::uint64_t>();
    if (not tier or not geo::geohash::is_valid(geohash) or precision != geohash.size()) { return std::nullopt; }

    return precision_level{
      .tier = *tier, .geohash = std::move(geohash), .precision = static_cast<std::uint8_t>(precision)
    };
  }

  auto parse_location(const nlohmann::json &json_obj) -> std::optional<location_payload>
  {
    if (not json_obj.contains("commitment") or not json_obj["commitment"].is_object()) { return std::nullopt; }
    const auto &commit = json_obj["commitment"];
    if (not has_string(commit, "digest") or not has_string(commit, "sig") or not has_unsigned(commit, "ts")) {
      return std::nullopt;
    }
    if (not json_obj.contains("levels") or not json_obj["levels"].is_array()) { return std::nullopt; }
    if (not json_obj.contains("moving") or not json_obj["moving"].is_boolean()) { return std::nullopt; }

    location_payload payload{ .commitment = { .digest = commit["digest"].get<std::string>(),
                                .signature = commit["sig"].get<std::string>(),
                                .timestamp_ms = commit["ts"].get<std::uint64_t>() },
      .precision_levels = {},
      .is_moving = json_obj["moving"].get<bool>(),
      .heading = std::nullopt,
      .speed = std::nullopt };

    for (const auto &level_json : json_obj["levels"]) {
      auto level = parse_level(level_json);
      if (not level) { return std::nullopt; }
      payload.precision_levels.push_back(std::move(*level));
    }

    if (json_obj.contains("heading")) {
      if (not json_obj["heading"].is_number()) { return std::nullopt; }
      payload.heading = json_obj["heading"].get<double>();
    }
    if (json_obj.contains("speed")) {
      if (not json_obj["speed"].is_string()) { return std::nullopt; }
      payload.speed = speed_category_from_string(json_obj["speed"].get<std::string>());
      if (not payload.speed) { return std::nullopt; }
    }

    return payload;
  }

  auto parse_status(const nlohmann::json &json_obj) -> std::optional<status_payload>
  {
    if (not has_string(json_obj, "status")) { return std::nullopt; }
    const auto status = presence_status_from_string(json_obj["status"].get<std::string>());
    if (not status) { return std::nullopt; }

    status_payload payload{ .status = *status };

    if (json_obj.contains("sharing")) {
      if (not json_obj["sharing"].is_boolean()) { return std::nullopt; }
      payload.sharing_location = json_obj["sharing"].get<bool>();
    }
    if (not optional_string(json_obj, "message", payload.message)
        or not optional_string(json_obj, "name", payload.display_name)
        or not optional_string(json_obj, "color", payload.color)) {
      return std::nullopt;
    }

    std::optional<std::string> device_name;
    if (not optional_string(json_obj, "device", device_name)) { return std::nullopt; }
    if (device_name) {
      payload.device = device_type_from_string(*device_name);
      if (not payload.device) { return std::nullopt; }
    }

    return payload;
  }

  auto parse_proximity(const nlohmann::json &json_obj) -> std::optional<proximity_payload>
  {
    if (not has_string(json_obj, "target") or not has_string(json_obj, "proof")
        or not has_string(json_obj, "category")) {
      return std::nullopt;
    }
    const auto category = proximity_category_from_string(json_obj["category"].get<std::string>());
    if (not category) { return std::nullopt; }

    return proximity_payload{ .target = json_obj["target"].get<std::string>(),
      .proof = json_obj["proof"].get<std::string>(),
      .category = *category };
  }

  auto parse_payload(std::string_view type, const nlohmann::json &json_obj) -> std::optional<payload_t>
  {
    if (not json_obj.is_object()) { return std::nullopt; }

    if (type == "location") {
      if (auto payload = parse_location(json_obj)) { return payload_t{ std::move(*payload) }; }
    } else if (type == "status") {
      if (auto payload = parse_status(json_obj)) { return payload_t{ std::move(*payload) }; }
    } else if (type == "proximity") {
      if (auto payload = parse_proximity(json_obj)) { return payload_t{ std::move(*payload) }; }
    } else if (type == "leave") {
      return payload_t{ leave_payload{} };
    }
    return std::nullopt;
  }

}// namespace

auto to_string(broadcast_type type) -> std::string_view
{
  switch (type) {
  case broadcast_type::location:
    return "location";
  case broadcast_type::status:
    return "status";
  case broadcast_type::proximity:
    return "proximity";
  case broadcast_type::leave:
    break;
  }
  return "leave";
}

auto presence_broadcast::type() const -> broadcast_type
{
  return std::visit(core::overload{
                      [](const location_payload &) { return broadcast_type::location; },
                      [](const status_payload &) { return broadcast_type::status; },
                      [](const proximity_payload &) { return broadcast_type::proximity; },
                      [](const leave_payload &) { return broadcast_type::leave; },
                    },
    payload);
}

auto presence_broadcast::signing_bytes() const -> std::string { return envelope_to_json(*this).dump(); }

auto presence_broadcast::serialize() const -> std::vector<std::byte>
{
  auto json_obj = envelope_to_json(*this);
  json_obj["sig"] = signature;
  return to_bytes(json_obj.dump());
}

auto presence_broadcast::deserialize(std::span<const std::byte> bytes) -> std::optional<presence_broadcast>
{
  std::string json_str;
  json_str.resize(bytes.size());
  std::ranges::transform(bytes, json_str.begin(), [](std::byte byte_val) { return std::bit_cast<char>(byte_val); });
  return deserialize(json_str);
}

auto presence_broadcast::deserialize(const std::string &json) -> std::optional<presence_broadcast>
{
  try {
    const auto json_obj = nlohmann::json::parse(json);
    if (not json_obj.is_object()) { return std::nullopt; }

    if (not has_string(json_obj, "v") or not has_string(json_obj, "sender") or not has_string(json_obj, "type")
        or not has_string(json_obj, "sig") or not has_unsigned(json_obj, "ts") or not has_unsigned(json_obj, "seq")
        or not has_uint32(json_obj, "ttl") or not json_obj.contains("payload")) {
      return std::nullopt;
    }

    auto payload = parse_payload(json_obj["type"].get<std::string>(), json_obj["payload"]);
    if (not payload) { return std::nullopt; }

    return presence_broadcast{ .version = json_obj["v"].get<std::string>(),
      .sender = json_obj["sender"].get<std::string>(),
      .payload = std::move(*payload),
      .signature = json_obj["sig"].get<std::string>(),
      .timestamp_ms = json_obj["ts"].get<std::uint64_t>(),
      .sequence = json_obj["seq"].get<std::uint64_t>(),
      .ttl_seconds = json_obj["ttl"].get<std::uint32_t>() };
  } catch (const nlohmann::json::exception &) {
    return std::nullopt;
  }
}

auto to_bytes(std::string_view text) -> std::vector<std::byte>
{
  std::vector<std::byte> bytes;
  bytes.resize(text.size());
  std::ranges::transform(text, bytes.begin(), [](char character) { return std::bit_cast<std::byte>(character); });
  return bytes;
}

}// namespace locus::presence::protocol
