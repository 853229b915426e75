#include <catch2/catch_test_macros.hpp>
#include <core/semver_utils.hpp>
#include <presence/protocol.hpp>

TEST_CASE("semver_utils checks version compatibility", "[semver][utils]")
{
  SECTION("versions equal to minimum are compatible")
  {
    REQUIRE(locus::core::is_version_compatible("0.1.0", "0.1.0"));
    REQUIRE(locus::core::is_version_compatible("1.0.0", "1.0.0"));
  }

  SECTION("versions greater than minimum are compatible")
  {
    REQUIRE(locus::core::is_version_compatible("0.2.0", "0.1.0"));
    REQUIRE(locus::core::is_version_compatible("0.1.1", "0.1.0"));
    REQUIRE(locus::core::is_version_compatible("1.0.0-beta.2", "1.0.0-beta.1"));
  }

  SECTION("versions less than minimum are not compatible")
  {
    REQUIRE_FALSE(locus::core::is_version_compatible("0.0.9", "0.1.0"));
    REQUIRE_FALSE(locus::core::is_version_compatible("0.1.0", "1.0.0"));
  }

  SECTION("invalid version strings return false")
  {
    REQUIRE_FALSE(locus::core::is_version_compatible("invalid", "0.1.0"));
    REQUIRE_FALSE(locus::core::is_version_compatible("0.1.0", "invalid"));
    REQUIRE_FALSE(locus::core::is_version_compatible("", "0.1.0"));
  }
}

TEST_CASE("the protocol floor accepts the current release line", "[semver][protocol]")
{
  REQUIRE(locus::core::is_version_compatible("0.1.0", locus::presence::protocol::minimum_protocol_version));
  REQUIRE_FALSE(locus::core::is_version_compatible("0.0.1", locus::presence::protocol::minimum_protocol_version));
}

TEST_CASE("parse_version rejects what semver rejects", "[semver][utils]")
{
  REQUIRE(locus::core::parse_version("0.1.0").has_value());
  REQUIRE(locus::core::parse_version("2.3.4-rc.1").has_value());
  REQUIRE_FALSE(locus::core::parse_version("").has_value());
  REQUIRE_FALSE(locus::core::parse_version("one.two").has_value());
}
