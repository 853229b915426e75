#include <catch2/catch_test_macros.hpp>
#include <platform/env_utils.hpp>
#include <platform/time_utils.hpp>
#include <regex>

TEST_CASE("timestamps format as HH:MM:SS", "[platform][time]")
{
  const std::regex hms_pattern(R"(\d{2}:\d{2}:\d{2})");

  REQUIRE(std::regex_match(locus::platform::format_current_time_hms(), hms_pattern));
  REQUIRE(std::regex_match(locus::platform::format_timestamp_hms(1'700'000'000'000), hms_pattern));
}

TEST_CASE("now_ms tracks the wall clock", "[platform][time]")
{
  constexpr std::uint64_t year_2023_ms = 1'672'531'200'000;

  const auto first = locus::platform::now_ms();
  const auto second = locus::platform::system_clock{}.now_ms();

  CHECK(first > year_2023_ms);
  CHECK(second >= first);
}

TEST_CASE("format_age describes how long ago a peer was seen", "[platform][time]")
{
  constexpr std::uint64_t now = 1'700'000'000'000;

  REQUIRE(locus::platform::format_age(now, now) == "just now");
  REQUIRE(locus::platform::format_age(now + 5'000, now) == "just now");
  REQUIRE(locus::platform::format_age(now - 999, now) == "just now");
  REQUIRE(locus::platform::format_age(now - 12'000, now) == "12s ago");
  REQUIRE(locus::platform::format_age(now - 150'000, now) == "2m ago");
  REQUIRE(locus::platform::format_age(now - 7'300'000, now) == "2h ago");
}

TEST_CASE("expand_tilde_path expands only a leading tilde", "[platform][env]")
{
  const auto home = locus::platform::get_home_directory();

  SECTION("paths without a tilde are unchanged")
  {
    REQUIRE(locus::platform::expand_tilde_path("/etc/locus.json") == "/etc/locus.json");
    REQUIRE(locus::platform::expand_tilde_path("relative/~/path") == "relative/~/path");
  }

  SECTION("leading tilde becomes the home directory")
  {
    if (not home.empty()) {
      REQUIRE(locus::platform::expand_tilde_path("~/.locus/identity.key") == home + "/.locus/identity.key");
    }
  }
}

TEST_CASE("per-user files live under the locus data directory", "[platform][env]")
{
  const auto directory = locus::platform::data_directory();

  REQUIRE(directory.filename() == ".locus");
  REQUIRE(locus::platform::default_key_path() == directory / "identity.key");
  REQUIRE(locus::platform::default_config_path() == directory / "presence.json");
}
