#include <presence/indicators.hpp>
#include <presence/precision_policy.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <geo/geohash.hpp>
#include <vector>

namespace locus::presence::test {

namespace {
  auto located_view(const std::string &identity, const std::string &geohash, presence_status status) -> presence_view
  {
    const auto cell = geo::geohash::bounds(geohash);
    const auto precision = static_cast<std::uint8_t>(geohash.size());
    return { .identity = identity,
      .display_name = identity,
      .color = "hsl(1, 70%, 50%)",
      .location = viewable_location{ .geohash = geohash,
        .precision = precision,
        .center = cell.center(),
        .bounds = cell,
        .uncertainty_radius_meters = radius_for_precision(precision),
        .age_seconds = 0,
        .is_moving = true,
        .heading = 90.0,
        .speed = speed_category::walking },
      .status = status,
      .last_seen_ms = 1000,
      .tier = trust_tier::close,
      .is_verified = true,
      .proximity = std::nullopt };
  }
}// namespace

TEST_CASE("views become indicators", "[presence][indicators]")
{
  std::vector<presence_view> views{ located_view("alice", "9q8yyk8", presence_status::online),
    presence_view{ .identity = "bob" },
    located_view("carol", "9q8yy", presence_status::away) };

  const auto indicators = views_to_indicators(views);

  REQUIRE(indicators.size() == 2);
  REQUIRE(indicators[0].id == "alice");
  REQUIRE(indicators[0].uncertainty_radius == radius_for_precision(7));
  REQUIRE(indicators[0].position.latitude == views[0].location->center.latitude);
  REQUIRE(indicators[0].tier == trust_tier::close);
  REQUIRE(indicators[1].id == "carol");
}

TEST_CASE("indicator style follows zoom and status", "[presence][indicators]")
{
  const auto views = std::vector<presence_view>{ located_view("alice", "9q8yyk8", presence_status::online),
    located_view("carol", "9q8yy", presence_status::away),
    located_view("dave", "9q8yyk8", presence_status::busy) };
  const auto indicators = views_to_indicators(views);

  SECTION("meters per pixel halves with each zoom level")
  {
    const auto near = style_for(indicators[0], 15.0);
    const auto far = style_for(indicators[0], 14.0);
    REQUIRE(far.meters_per_pixel == Catch::Approx(near.meters_per_pixel * 2.0));
  }

  SECTION("radius is clamped to a visible range")
  {
    REQUIRE(style_for(indicators[0], 1.0).radius_pixels == 20.0);
    REQUIRE(style_for(indicators[1], 18.0).radius_pixels == 200.0);
  }

  SECTION("opacity reflects status")
  {
    REQUIRE(style_for(indicators[0], 14.0).opacity == 1.0);
    REQUIRE(style_for(indicators[1], 14.0).opacity == 0.7);
    REQUIRE(style_for(indicators[2], 14.0).opacity == 0.4);
  }

  SECTION("heading is shown for moving peers with a heading")
  {
    REQUIRE(style_for(indicators[0], 14.0).show_heading);
  }
}

}// namespace locus::presence::test
