#include <presence/trust_circle_store.hpp>

#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

namespace locus::presence::test {

SCENARIO("Trust circle store keeps one tier per contact", "[presence][trust]")
{
  GIVEN("An empty store")
  {
    trust_circle_store store;

    THEN("unknown identities have no tier")
    {
      REQUIRE_FALSE(store.get_trust_level("alice").has_value());
      REQUIRE(store.size() == 0);
    }

    WHEN("contacts are assigned tiers")
    {
      store.set_trust_level("carol", trust_tier::close);
      store.set_trust_level("alice", trust_tier::friends);
      store.set_trust_level("bob", trust_tier::network);
      store.set_trust_level("alice", trust_tier::intimate);

      THEN("the latest assignment wins")
      {
        REQUIRE(store.get_trust_level("alice") == trust_tier::intimate);
        REQUIRE(store.size() == 3);
      }

      THEN("contacts can be filtered by minimum tier in identity order")
      {
        const auto inner = store.contacts_at_or_above(trust_tier::close);
        REQUIRE(inner == std::vector<std::string>{ "alice", "carol" });
      }

      AND_WHEN("a contact is removed")
      {
        REQUIRE(store.remove_trust_level("bob"));
        REQUIRE_FALSE(store.remove_trust_level("bob"));

        THEN("it is unknown again") { REQUIRE_FALSE(store.get_trust_level("bob").has_value()); }
      }
    }
  }
}

TEST_CASE("Trust circle store JSON export", "[presence][trust]")
{
  trust_circle_store store;
  store.set_trust_level("alice", trust_tier::intimate);
  store.set_trust_level("bob", trust_tier::public_);

  SECTION("export uses tier names")
  {
    const auto document = store.to_json();
    REQUIRE(document["contacts"]["alice"] == "intimate");
    REQUIRE(document["contacts"]["bob"] == "public");
  }

  SECTION("import restores the circle")
  {
    const auto restored = trust_circle_store::from_json(store.to_json());
    REQUIRE(restored.has_value());
    REQUIRE(restored->get_trust_level("alice") == trust_tier::intimate);
    REQUIRE(restored->size() == 2);
  }

  SECTION("import rejects unknown tiers and bad shapes")
  {
    REQUIRE_FALSE(trust_circle_store::from_json(nlohmann::json::parse(R"({"contacts":{"x":"bestie"}})")).has_value());
    REQUIRE_FALSE(trust_circle_store::from_json(nlohmann::json::parse(R"({"contacts":["x"]})")).has_value());
    REQUIRE_FALSE(trust_circle_store::from_json(nlohmann::json::array()).has_value());
  }

  SECTION("every tier has a description")
  {
    REQUIRE(describe(trust_tier::close).starts_with("Block level"));
    REQUIRE(describe(trust_tier::public_).starts_with("Large region"));
  }
}

}// namespace locus::presence::test
