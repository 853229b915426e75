#include <geo/distance.hpp>
#include <geo/geohash.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <stdexcept>
#include <string>

namespace locus::geo::test {

TEST_CASE("geohash encodes known coordinates", "[geo][geohash]")
{
  SECTION("reference points")
  {
    REQUIRE(geohash::encode(57.64911, 10.40744, 11) == "u4pruydqqvj");
    REQUIRE(geohash::encode(42.6, -5.6, 5) == "ezs42");
  }

  SECTION("output length equals requested precision")
  {
    for (std::size_t precision = 1; precision <= max_precision; ++precision) {
      REQUIRE(geohash::encode(37.7749, -122.4194, precision).size() == precision);
    }
  }

  SECTION("a shorter hash is a prefix of a longer one")
  {
    const auto full = geohash::encode(37.7749, -122.4194, 12);
    for (std::size_t precision = 1; precision < max_precision; ++precision) {
      REQUIRE(full.starts_with(geohash::encode(37.7749, -122.4194, precision)));
    }
  }

  SECTION("range boundaries are accepted")
  {
    REQUIRE_NOTHROW(geohash::encode(90.0, 180.0, 6));
    REQUIRE_NOTHROW(geohash::encode(-90.0, -180.0, 6));
  }
}

TEST_CASE("geohash rejects out of range input", "[geo][geohash]")
{
  REQUIRE_THROWS_AS(geohash::encode(90.5, 0.0, 5), std::invalid_argument);
  REQUIRE_THROWS_AS(geohash::encode(0.0, -180.1, 5), std::invalid_argument);
  REQUIRE_THROWS_AS(geohash::encode(0.0, 0.0, 0), std::invalid_argument);
  REQUIRE_THROWS_AS(geohash::encode(0.0, 0.0, 13), std::invalid_argument);
  REQUIRE_THROWS_AS(geohash::bounds("9q8a"), std::invalid_argument);
}

TEST_CASE("geohash decodes to the containing cell", "[geo][geohash]")
{
  SECTION("decoded center lies inside the cell of the original point")
  {
    const auto hash = geohash::encode(37.7749, -122.4194, 9);
    const auto cell = geohash::bounds(hash);

    REQUIRE(cell.contains({ .latitude = 37.7749, .longitude = -122.4194 }));
    REQUIRE(geohash::encode(cell.center().latitude, cell.center().longitude, 9) == hash);
  }

  SECTION("decoding is case insensitive")
  {
    const auto lower = geohash::decode("ezs42");
    const auto upper = geohash::decode("EZS42");

    REQUIRE(lower.latitude == upper.latitude);
    REQUIRE(lower.longitude == upper.longitude);
    REQUIRE(lower.latitude == Catch::Approx(42.605).margin(0.03));
    REQUIRE(lower.longitude == Catch::Approx(-5.603).margin(0.03));
  }

  SECTION("an empty hash is the whole globe")
  {
    const auto cell = geohash::bounds("");
    REQUIRE(cell.min_lat == -90.0);
    REQUIRE(cell.max_lng == 180.0);
  }
}

TEST_CASE("geohash truncation and validation", "[geo][geohash]")
{
  REQUIRE(geohash::truncate("9q8yyk8y", 5) == "9q8yy");
  REQUIRE(geohash::truncate("9q8", 5) == "9q8");

  REQUIRE(geohash::is_valid("9q8yyk8y"));
  REQUIRE_FALSE(geohash::is_valid(""));
  REQUIRE_FALSE(geohash::is_valid("9q8yyk8yyk8yy"));
  REQUIRE_FALSE(geohash::is_valid("9qai"));
}

TEST_CASE("geohash neighbors surround the cell", "[geo][geohash]")
{
  SECTION("interior cell")
  {
    const auto around = geohash::neighbors("ezs42");

    REQUIRE(around[0] == "ezs48");
    REQUIRE(around[2] == "ezs43");
    REQUIRE(around[4] == "ezs40");
    REQUIRE(around[6] == "ezefr");
    for (const auto &cell : around) {
      REQUIRE(cell.size() == 5);
      REQUIRE(cell != "ezs42");
    }
  }

  SECTION("longitude wraps at the antimeridian")
  {
    const auto hash = geohash::encode(0.0, 179.99, 3);
    const auto east = geohash::neighbors(hash)[2];

    REQUIRE(geohash::decode(east).longitude < 0.0);
  }
}

TEST_CASE("haversine distance", "[geo][distance]")
{
  SECTION("identical points are zero apart")
  {
    REQUIRE(haversine_meters({ 37.7749, -122.4194 }, { 37.7749, -122.4194 }) == Catch::Approx(0.0).margin(1e-6));
  }

  SECTION("one degree of latitude is about 111 km")
  {
    REQUIRE(haversine_meters({ 0.0, 0.0 }, { 1.0, 0.0 }) == Catch::Approx(111195.0).epsilon(0.001));
  }

  SECTION("distance is symmetric")
  {
    const lat_lng paris{ 48.8566, 2.3522 };
    const lat_lng london{ 51.5074, -0.1278 };

    REQUIRE(haversine_meters(paris, london) == Catch::Approx(haversine_meters(london, paris)));
    REQUIRE(haversine_meters(paris, london) == Catch::Approx(343500.0).epsilon(0.01));
  }
}

}// namespace locus::geo::test
