#include <cli_utils/app_init.hpp>
#include <cli_utils/cli_parser.hpp>
#include <core/overload.hpp>
#include <crypto/ed25519_signer.hpp>
#include <geolocation/random_walk.hpp>
#include <geolocation/replay_source.hpp>
#include <platform/time_utils.hpp>
#include <presence/channel_adapter.hpp>
#include <presence/indicators.hpp>
#include <presence/presence_config.hpp>
#include <presence/presence_manager.hpp>
#include <presence/trust_circle_store.hpp>
#include <transport/loopback_hub.hpp>
#include <transport/relay_endpoint.hpp>
#include <transport/websocket_stream.hpp>

#include <array>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <cstdlib>
#include <fmt/core.h>
#include <memory>
#include <stdexcept>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace {

using manager_t = locus::presence::presence_manager<locus::geolocation::replay_source,
  locus::crypto::ed25519_signer,
  locus::presence::trust_circle_store,
  locus::platform::system_clock>;
using loopback_adapter_t = locus::presence::channel_adapter<manager_t, locus::transport::loopback_endpoint>;
using relay_t = locus::transport::relay_endpoint<locus::transport::websocket_stream>;
using relay_adapter_t = locus::presence::channel_adapter<manager_t, relay_t>;

constexpr std::size_t simulated_track_length = 600;
constexpr double peer_spread_degrees = 0.02;
constexpr double indicator_zoom = 14.0;

constexpr std::array<locus::presence::trust_tier, 5> simulated_tiers{
  locus::presence::trust_tier::friends,
  locus::presence::trust_tier::close,
  locus::presence::trust_tier::network,
  locus::presence::trust_tier::intimate,
  locus::presence::trust_tier::public_,
};

auto make_manager(const std::shared_ptr<boost::asio::io_context> &io_context,
  const std::shared_ptr<locus::geolocation::replay_source> &geolocation,
  const std::shared_ptr<locus::crypto::ed25519_signer> &signer,
  locus::presence::presence_config config) -> std::shared_ptr<manager_t>
{
  return std::make_shared<manager_t>(io_context,
    geolocation,
    signer,
    std::make_shared<locus::presence::trust_circle_store>(),
    std::make_shared<locus::platform::system_clock>(),
    std::move(config),
    locus::presence::device_type::desktop);
}

auto log_event(const locus::presence::events::presence_event_t &event) -> void
{
  using namespace locus::presence;

  std::visit(locus::core::overload{
               [](const events::user_joined &evt) { spdlog::info("[locus] {} joined", evt.user.display_name); },
               [](const events::user_left &evt) { spdlog::info("[locus] {} left", evt.identity.substr(0, 8)); },
               [](const events::user_updated &evt) {
                 spdlog::debug("[locus] {} updated ({} fields)", evt.user.display_name, evt.changes.size());
               },
               [](const events::location_updated &evt) {
                 spdlog::info("[locus] {} at {} ({} m, {})",
                   evt.view.display_name,
                   evt.view.location->geohash,
                   evt.view.location->uncertainty_radius_meters,
                   to_string(evt.view.tier));
               },
               [](const events::proximity_detected &evt) {
                 spdlog::info("[locus] {} reports {}", evt.identity.substr(0, 8), to_string(evt.proximity.category));
               },
               [](const events::status_changed &evt) {
                 spdlog::info("[locus] {} is {}", evt.identity.substr(0, 8), to_string(evt.status));
               },
               [](const events::connection_changed &evt) { spdlog::info("[locus] {}", to_string(evt.state)); },
               [](const events::error &evt) {
                 spdlog::warn("[locus] {}: {}", events::to_string(evt.kind), evt.message);
               },
             },
    event);
}

auto print_summary(const std::vector<locus::presence::presence_view> &views) -> void
{
  using namespace locus::presence;

  const auto now = locus::platform::now_ms();
  fmt::print("\npresence at {}\n", locus::platform::format_timestamp_hms(now));
  fmt::print("{:<16} {:<9} {:<10} {:>4} {:>10} {:<10} {:<8} {:<10}\n",
    "peer",
    "tier",
    "geohash",
    "prec",
    "radius(m)",
    "proximity",
    "status",
    "seen");
  for (const auto &view : views) {
    fmt::print("{:<16} {:<9} {:<10} {:>4} {:>10} {:<10} {:<8} {:<10}\n",
      view.display_name,
      to_string(view.tier),
      view.location ? view.location->geohash : "-",
      view.location ? view.location->precision : 0,
      view.location ? view.location->uncertainty_radius_meters : 0.0,
      view.proximity ? to_string(view.proximity->category) : "-",
      to_string(view.status),
      locus::platform::format_age(view.last_seen_ms, now));
  }

  const auto indicators = views_to_indicators(views);
  fmt::print("\nindicators at zoom {}:\n", indicator_zoom);
  for (const auto &indicator : indicators) {
    const auto style = style_for(indicator, indicator_zoom);
    fmt::print("  {} ({:.5f}, {:.5f}) r={:.0f}px opacity={:.1f}\n",
      indicator.display_name,
      indicator.position.latitude,
      indicator.position.longitude,
      style.radius_pixels,
      style.opacity);
  }
}

auto self_track(const locus::cli_utils::cli_args &args) -> std::vector<locus::core::position_sample>
{
  if (not args.track_path.empty()) {
    if (auto track = locus::geolocation::replay_source::load_track(args.track_path)) { return *track; }
    spdlog::warn("[locus] falling back to a simulated walk");
  }
  locus::geolocation::random_walk walk(args.latitude, args.longitude, 1);
  return walk.track(simulated_track_length, 1.0, 0);
}

}// namespace

// NOLINTNEXTLINE(bugprone-exception-escape)
auto main(int argc, char **argv) -> int
{
  auto args = locus::cli_utils::parse_cli_args(argc, argv);

  if (args.show_version) {
    fmt::print("{} v{}\n", locus::cmake::project_name, locus::cmake::project_version);
    return 0;
  }

  if (not locus::cli_utils::validate_cli_args(args)) { return 1; }

  locus::cli_utils::configure_logging(args);

  locus::presence::presence_config config;
  if (not args.config_path.empty()) {
    auto loaded = locus::presence::load_config_file(args.config_path);
    if (not loaded) { return 1; }
    config = std::move(*loaded);
  }
  if (not args.display_name.empty()) { config.display_name = args.display_name; }
  if (not args.color.empty()) { config.color = args.color; }

  std::shared_ptr<locus::crypto::ed25519_signer> signer;
  try {
    signer = std::make_shared<locus::crypto::ed25519_signer>(locus::cli_utils::load_or_create_signer(args.key_path));
  } catch (const std::runtime_error &e) {
    spdlog::error("Cannot load identity: {}", e.what());
    return 1;
  }
  auto io_context = std::make_shared<boost::asio::io_context>();

  const locus::geolocation::replay_options replay{ .interval = std::chrono::seconds(1),
    .loop = true,
    .available = true,
    .fail_with = std::nullopt };
  auto self_geolocation =
    std::make_shared<locus::geolocation::replay_source>(io_context, self_track(args), replay);
  auto self_manager = make_manager(io_context, self_geolocation, signer, config);
  auto unsubscribe = self_manager->on(log_event);

  locus::cli_utils::print_app_banner({ .identity = signer->identity(),
    .display_name = self_manager->get_self().display_name,
    .key_path = args.key_path,
    .transport = args.relay_url.empty() ? fmt::format("loopback ({} simulated peers)", args.peers) : args.relay_url });

  boost::asio::steady_timer deadline(*io_context);
  deadline.expires_after(std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::duration<double>(args.duration_seconds)));

  if (not args.relay_url.empty()) {
    const auto address = locus::transport::parse_relay_url(args.relay_url);
    if (not address) {
      spdlog::error("Invalid relay URL: {}", args.relay_url);
      return 1;
    }

    auto endpoint = std::make_shared<relay_t>(
      io_context,
      [io_context]() { return std::make_shared<locus::transport::websocket_stream>(io_context); },
      *address);
    auto adapter = std::make_shared<relay_adapter_t>(io_context, self_manager, endpoint);
    adapter->connect();
    adapter->start_sharing();
    endpoint->connect();

    deadline.async_wait([adapter, endpoint](const boost::system::error_code & /*error*/) {
      print_summary(adapter->views());
      adapter->disconnect();
      endpoint->close();
    });

    io_context->run();
    unsubscribe();
    return 0;
  }

  auto hub = std::make_shared<locus::transport::loopback_hub>(io_context);
  auto self_adapter = std::make_shared<loopback_adapter_t>(io_context, self_manager, hub->attach());

  std::vector<std::shared_ptr<loopback_adapter_t>> peer_adapters;
  for (std::size_t i = 0; i < args.peers; ++i) {
    const auto offset = peer_spread_degrees * static_cast<double>(i + 1) / static_cast<double>(args.peers);
    locus::geolocation::random_walk walk(
      args.latitude + offset, args.longitude - offset, static_cast<std::uint32_t>(i + 2));

    auto peer_signer = std::make_shared<locus::crypto::ed25519_signer>(locus::crypto::ed25519_signer::generate());
    auto peer_geolocation = std::make_shared<locus::geolocation::replay_source>(
      io_context, walk.track(simulated_track_length, 1.0, 0), replay);

    locus::presence::presence_config peer_config = config;
    peer_config.display_name = fmt::format("peer-{}", i + 1);
    peer_config.color.clear();

    auto peer_manager = make_manager(io_context, peer_geolocation, peer_signer, peer_config);
    self_manager->set_trust_level(peer_signer->identity(), simulated_tiers.at(i % simulated_tiers.size()));
    peer_adapters.push_back(std::make_shared<loopback_adapter_t>(io_context, peer_manager, hub->attach()));
  }

  self_adapter->connect();
  self_adapter->start_sharing();
  for (const auto &peer : peer_adapters) {
    peer->connect();
    peer->start_sharing();
  }

  deadline.async_wait([self_adapter, &peer_adapters](const boost::system::error_code & /*error*/) {
    print_summary(self_adapter->views());
    for (const auto &peer : peer_adapters) { peer->disconnect(); }
    self_adapter->disconnect();
  });

  io_context->run();
  unsubscribe();

  const auto stats = self_manager->get_state().stats;
  spdlog::info("[locus] accepted {} broadcasts, dropped {} stale, {} expired, {} malformed",
    stats.accepted,
    stats.stale,
    stats.expired,
    stats.malformed);
  return EXIT_SUCCESS;
}
