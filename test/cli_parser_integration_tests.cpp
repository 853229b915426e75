#include <catch2/catch_test_macros.hpp>
#include <string>
#include <vector>

#include <cli_utils/cli_parser.hpp>

auto create_argv(std::vector<std::string> &args) -> std::vector<char *>
{
  std::vector<char *> argv;
  argv.reserve(args.size());
  for (auto &arg : args) { argv.push_back(arg.data()); }
  return argv;
}

TEST_CASE("CLI parsing basic flags", "[cli_utils][cli_parser][integration]")
{
  SECTION("version flag sets show_version")
  {
    std::vector<std::string> args = { "locus", "--version" };
    auto argv = create_argv(args);

    auto parsed = locus::cli_utils::parse_cli_args(static_cast<int>(args.size()), argv.data());

    REQUIRE(parsed.show_version == true);
  }

  SECTION("short verbose flag works")
  {
    std::vector<std::string> args = { "locus", "-v" };
    auto argv = create_argv(args);

    auto parsed = locus::cli_utils::parse_cli_args(static_cast<int>(args.size()), argv.data());

    REQUIRE(parsed.verbose == true);
  }
}

TEST_CASE("CLI parsing options", "[cli_utils][cli_parser][integration]")
{
  SECTION("identity and presentation options")
  {
    std::vector<std::string> args = {
      "locus", "-k", "/custom/path.key", "-n", "alice", "--color", "hsl(10, 70%, 50%)"
    };
    auto argv = create_argv(args);

    auto parsed = locus::cli_utils::parse_cli_args(static_cast<int>(args.size()), argv.data());

    REQUIRE(parsed.key_path == "/custom/path.key");
    REQUIRE(parsed.display_name == "alice");
    REQUIRE(parsed.color == "hsl(10, 70%, 50%)");
  }

  SECTION("simulation options")
  {
    std::vector<std::string> args = { "locus", "--peers", "5", "-d", "2.5", "--lat", "51.5", "--lng", "-0.12" };
    auto argv = create_argv(args);

    auto parsed = locus::cli_utils::parse_cli_args(static_cast<int>(args.size()), argv.data());

    REQUIRE(parsed.peers == 5);
    REQUIRE(parsed.duration_seconds == 2.5);
    REQUIRE(parsed.latitude == 51.5);
    REQUIRE(parsed.longitude == -0.12);
  }

  SECTION("relay option")
  {
    std::vector<std::string> args = { "locus", "--relay", "wss://relay.example.org/presence" };
    auto argv = create_argv(args);

    auto parsed = locus::cli_utils::parse_cli_args(static_cast<int>(args.size()), argv.data());

    REQUIRE(parsed.relay_url == "wss://relay.example.org/presence");
    REQUIRE(locus::cli_utils::validate_cli_args(parsed));
  }
}

TEST_CASE("CLI validation", "[cli_utils][cli_parser][integration]")
{
  SECTION("plaintext relay is refused")
  {
    locus::cli_utils::cli_args args;
    args.relay_url = "ws://relay.example.org";

    REQUIRE_FALSE(locus::cli_utils::validate_cli_args(args));
  }

  SECTION("empty key path is refused")
  {
    locus::cli_utils::cli_args args;
    args.key_path.clear();

    REQUIRE_FALSE(locus::cli_utils::validate_cli_args(args));
  }
}

TEST_CASE("CLI parsing defaults", "[cli_utils][cli_parser][integration]")
{
  SECTION("no arguments uses defaults")
  {
    std::vector<std::string> args = { "locus" };
    auto argv = create_argv(args);

    auto parsed = locus::cli_utils::parse_cli_args(static_cast<int>(args.size()), argv.data());

    REQUIRE(parsed.key_path.ends_with("/.locus/identity.key"));
    REQUIRE(parsed.peers == 3);
    REQUIRE(parsed.relay_url.empty());
    REQUIRE(parsed.verbose == false);
    REQUIRE(parsed.show_version == false);
  }
}
