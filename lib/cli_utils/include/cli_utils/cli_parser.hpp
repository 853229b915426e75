#pragma once

#include <CLI/CLI.hpp>
#include <cstddef>
#include <cstdlib>
#include <filesystem>
#include <platform/env_utils.hpp>
#include <spdlog/spdlog.h>
#include <string>

namespace locus::cli_utils {

struct cli_args
{
  std::string config_path;
  std::string display_name;
  std::string color;
  std::string key_path = platform::default_key_path().string();
  std::string track_path;
  std::string relay_url;
  std::size_t peers = 3;
  double duration_seconds = 30.0;
  double latitude = 37.7749;
  double longitude = -122.4194;
  bool verbose = false;
  bool show_version = false;
};

inline auto setup_cli_app(CLI::App &app, cli_args &args) -> void
{
  app.add_option("-c,--config", args.config_path, "Path to a JSON presence config (default ~/.locus/presence.json)");
  app.add_option("-n,--name", args.display_name, "Display name announced to peers");
  app.add_option("--color", args.color, "Display color, e.g. \"hsl(200, 70%, 50%)\"");
  app.add_option("-k,--key", args.key_path, "Path to hex Ed25519 private key (created if missing)");
  app.add_option("-t,--track", args.track_path, "JSON track of fixes to replay as the local location");
  app.add_option("-r,--relay", args.relay_url, "wss:// relay to join instead of the local simulation");
  app.add_option("-p,--peers", args.peers, "Number of simulated peers")->check(CLI::Range(0, 64));
  app.add_option("-d,--duration", args.duration_seconds, "Seconds to run before leaving")->check(CLI::PositiveNumber);
  app.add_option("--lat", args.latitude, "Start latitude when no track is given")->check(CLI::Range(-90.0, 90.0));
  app.add_option("--lng", args.longitude, "Start longitude when no track is given")->check(CLI::Range(-180.0, 180.0));
  app.add_flag("-v,--verbose", args.verbose, "Enable verbose logging");
  app.add_flag("--version", args.show_version, "Show version information");
}

inline auto parse_cli_args(int argc, char **argv) -> cli_args
{
  cli_args args;
  CLI::App app{ "Locus - trust-tiered location presence", "locus" };

  setup_cli_app(app, args);

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    app.exit(e);
    std::exit(e.get_exit_code());// NOLINT(concurrency-mt-unsafe)
  }

  args.key_path = platform::expand_tilde_path(args.key_path);
  if (not args.config_path.empty()) {
    args.config_path = platform::expand_tilde_path(args.config_path);
  } else if (std::filesystem::exists(platform::default_config_path())) {
    args.config_path = platform::default_config_path().string();
  }
  if (not args.track_path.empty()) { args.track_path = platform::expand_tilde_path(args.track_path); }

  return args;
}

inline auto validate_cli_args(const cli_args &args) -> bool
{
  if (not args.relay_url.empty() and args.relay_url.starts_with("ws://")) {
    spdlog::error("Insecure relay URL: {} (use wss://)", args.relay_url);
    return false;
  }

  if (args.key_path.empty()) {
    spdlog::error("Key path must not be empty");
    return false;
  }

  return true;
}

}// namespace locus::cli_utils
