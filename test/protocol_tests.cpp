#include <presence/protocol.hpp>

#include <catch2/catch_test_macros.hpp>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <variant>

namespace locus::presence::protocol::test {

namespace {
  auto sample_location_broadcast() -> presence_broadcast
  {
    return { .version = "0.1.0",
      .sender = "alice",
      .payload = location_payload{ .commitment = { .digest = "d1", .signature = "s1", .timestamp_ms = 900 },
        .precision_levels = { { .tier = trust_tier::public_, .geohash = "9q", .precision = 2 },
          { .tier = trust_tier::friends, .geohash = "9q8yy", .precision = 5 } },
        .is_moving = true,
        .heading = 45.0,
        .speed = speed_category::walking },
      .signature = "sig",
      .timestamp_ms = 1000,
      .sequence = 3,
      .ttl_seconds = 60 };
  }

  auto with_payload(nlohmann::json payload, const std::string &type) -> std::string
  {
    return nlohmann::json{ { "v", "0.1.0" },
      { "sender", "alice" },
      { "type", type },
      { "payload", std::move(payload) },
      { "sig", "sig" },
      { "ts", 1000 },
      { "seq", 1 },
      { "ttl", 60 } }
      .dump();
  }

  /// Location payload JSON with a single friends level
  auto location_with_level(const std::string &geohash, int precision) -> nlohmann::json
  {
    const nlohmann::json level{ { "tier", "friends" }, { "geohash", geohash }, { "precision", precision } };
    return { { "commitment", { { "digest", "d" }, { "sig", "s" }, { "ts", 1 } } },
      { "levels", nlohmann::json::array({ level }) },
      { "moving", false } };
  }
}// namespace

SCENARIO("Presence broadcasts survive serialization", "[presence][protocol]")
{
  GIVEN("A location broadcast")
  {
    const auto original = sample_location_broadcast();

    WHEN("it is serialized and parsed back")
    {
      const auto parsed = presence_broadcast::deserialize(original.serialize());

      THEN("every field is preserved")
      {
        REQUIRE(parsed.has_value());
        REQUIRE(parsed->type() == broadcast_type::location);
        REQUIRE(parsed->sender == "alice");
        REQUIRE(parsed->sequence == 3);
        REQUIRE(parsed->signature == "sig");

        const auto &payload = std::get<location_payload>(parsed->payload);
        REQUIRE(payload.commitment.digest == "d1");
        REQUIRE(payload.precision_levels.size() == 2);
        REQUIRE(payload.precision_levels[1].geohash == "9q8yy");
        REQUIRE(payload.speed == speed_category::walking);
      }

      THEN("the signing bytes are identical on both sides")
      {
        REQUIRE(parsed->signing_bytes() == original.signing_bytes());
      }
    }
  }

  GIVEN("A status broadcast with presentation fields")
  {
    const presence_broadcast original{ .version = "0.1.0",
      .sender = "bob",
      .payload = status_payload{ .status = presence_status::busy,
        .message = "in a meeting",
        .device = device_type::mobile,
        .sharing_location = false,
        .display_name = "Bob",
        .color = "hsl(3, 70%, 50%)" },
      .signature = "sig",
      .timestamp_ms = 1000,
      .sequence = 1,
      .ttl_seconds = 60 };

    THEN("the optional fields come back")
    {
      const auto parsed = presence_broadcast::deserialize(original.serialize());
      const auto &payload = std::get<status_payload>(parsed.value().payload);
      REQUIRE(payload.status == presence_status::busy);
      REQUIRE(payload.message == "in a meeting");
      REQUIRE(payload.device == device_type::mobile);
      REQUIRE(payload.display_name == "Bob");
      REQUIRE_FALSE(payload.sharing_location);
    }
  }
}

TEST_CASE("signing bytes exclude only the signature", "[presence][protocol]")
{
  auto broadcast = sample_location_broadcast();
  const auto before = broadcast.signing_bytes();

  broadcast.signature = "different";
  REQUIRE(broadcast.signing_bytes() == before);
  REQUIRE(before.find("\"sig\":\"sig\"") == std::string::npos);

  broadcast.sequence = 4;
  REQUIRE(broadcast.signing_bytes() != before);
}

TEST_CASE("malformed envelopes are rejected", "[presence][protocol]")
{
  SECTION("not JSON or not an object")
  {
    REQUIRE_FALSE(presence_broadcast::deserialize(std::string{ "{ nope" }).has_value());
    REQUIRE_FALSE(presence_broadcast::deserialize(std::string{ "[1,2,3]" }).has_value());
  }

  SECTION("missing or mistyped envelope fields")
  {
    REQUIRE_FALSE(
      presence_broadcast::deserialize(std::string{ R"({"v":"0.1.0","sender":"a","type":"leave"})" }).has_value());
    auto json_obj = nlohmann::json::parse(with_payload(nlohmann::json::object(), "leave"));
    json_obj["seq"] = "one";
    REQUIRE_FALSE(presence_broadcast::deserialize(json_obj.dump()).has_value());
  }

  SECTION("ttl beyond 32 bits")
  {
    auto json_obj = nlohmann::json::parse(with_payload(nlohmann::json::object(), "leave"));
    json_obj["ttl"] = std::uint64_t{ 4294967296 };
    REQUIRE_FALSE(presence_broadcast::deserialize(json_obj.dump()).has_value());

    json_obj["ttl"] = std::uint64_t{ 4294967295 };
    const auto widest = presence_broadcast::deserialize(json_obj.dump());
    REQUIRE(widest.has_value());
    REQUIRE(widest->ttl_seconds == 4294967295U);
  }

  SECTION("unknown type")
  {
    REQUIRE_FALSE(presence_broadcast::deserialize(with_payload(nlohmann::json::object(), "teleport")).has_value());
  }

  SECTION("precision disagreeing with the geohash length")
  {
    const auto payload = location_with_level("9q8y", 5);
    REQUIRE_FALSE(presence_broadcast::deserialize(with_payload(payload, "location")).has_value());
  }

  SECTION("geohash with characters outside the alphabet")
  {
    const auto payload = location_with_level("9q8ai", 5);
    REQUIRE_FALSE(presence_broadcast::deserialize(with_payload(payload, "location")).has_value());
  }

  SECTION("unknown enum names")
  {
    REQUIRE_FALSE(presence_broadcast::deserialize(with_payload({ { "status", "sleeping" } }, "status")).has_value());
    REQUIRE_FALSE(
      presence_broadcast::deserialize(with_payload({ { "target", "t" }, { "proof", "p" }, { "category", "adjacent" } },
                                        "proximity"))
        .has_value());
  }

  SECTION("a well formed leave parses")
  {
    const auto parsed = presence_broadcast::deserialize(with_payload(nlohmann::json::object(), "leave"));
    REQUIRE(parsed.has_value());
    REQUIRE(parsed->type() == broadcast_type::leave);
  }
}

}// namespace locus::presence::protocol::test
