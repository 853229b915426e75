#pragma once

#include "internal_use_only/config.hpp"
#include <concepts/clock.hpp>
#include <concepts/geolocation_source.hpp>
#include <concepts/signer.hpp>
#include <concepts/trust_store.hpp>
#include <core/overload.hpp>
#include <core/semver_utils.hpp>
#include <crypto/commitment.hpp>
#include <presence/event_bus.hpp>
#include <presence/events.hpp>
#include <presence/precision_policy.hpp>
#include <presence/presence_config.hpp>
#include <presence/protocol.hpp>
#include <presence/proximity.hpp>
#include <presence/types.hpp>

#include <algorithm>
#include <boost/asio/error.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <cstddef>
#include <cstdint>
#include <fmt/format.h>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace locus::presence {

using send_fn_t = std::function<void(std::vector<std::byte>)>;

/// Why inbound envelopes were dropped, plus how many were applied
struct ingest_stats
{
  std::uint64_t accepted{};
  std::uint64_t malformed{};
  std::uint64_t incompatible_version{};
  std::uint64_t expired{};
  std::uint64_t bad_signature{};
  std::uint64_t stale{};
  std::uint64_t self_loop{};
  std::uint64_t untargeted_proximity{};
  std::uint64_t orphan_proximity{};
};

/// Point-in-time summary of a manager
struct manager_state
{
  connection_state state{ connection_state::connecting };
  std::uint64_t last_sequence{};
  std::size_t peer_count{};
  std::size_t view_count{};
  bool sharing{};
  ingest_stats stats;
};

/**
 * @brief The presence protocol engine.
 *
 * Owns the local presence, turns fixes into signed multi-precision broadcasts,
 * ingests peer broadcasts and projects each peer through the locally held
 * trust tier. All methods must be called from the io_context thread; timer and
 * geolocation callbacks are expected on the same thread.
 *
 * Must be owned by a std::shared_ptr: timer and watch callbacks hold only a
 * weak reference and become no-ops once the manager is gone.
 *
 * @tparam Geolocation Type satisfying the geolocation_source concept
 * @tparam Signer Type satisfying both the signer and verifier concepts
 * @tparam TrustStore Type satisfying the trust_store concept
 * @tparam Clock Type satisfying the clock concept
 */
template<concepts::geolocation_source Geolocation,
  concepts::signer Signer,
  concepts::trust_store TrustStore,
  concepts::clock Clock>
  requires concepts::verifier<Signer>
class presence_manager
  : public std::enable_shared_from_this<presence_manager<Geolocation, Signer, TrustStore, Clock>>
{
public:
  presence_manager(const std::shared_ptr<boost::asio::io_context> &io_context,
    const std::shared_ptr<Geolocation> &geolocation,
    const std::shared_ptr<Signer> &signer,
    const std::shared_ptr<TrustStore> &trust_store,
    const std::shared_ptr<Clock> &clock,
    presence_config config,
    device_type device = device_type::unknown)
    : io_context_(io_context), geolocation_(geolocation), signer_(signer), trust_store_(trust_store), clock_(clock),
      config_(std::move(config)), tick_timer_(*io_context_)
  {
    self_.identity = signer_->identity();
    self_.display_name =
      config_.display_name.empty() ? default_display_name(self_.identity) : config_.display_name;
    self_.color = config_.color.empty() ? default_color(self_.identity) : config_.color;
    self_.status = presence_status::online;
    self_.last_seen_ms = clock_->now_ms();
    self_.device = device;
  }

  presence_manager(const presence_manager &) = delete;
  auto operator=(const presence_manager &) -> presence_manager & = delete;
  presence_manager(presence_manager &&) = delete;
  auto operator=(presence_manager &&) -> presence_manager & = delete;
  ~presence_manager() = default;

  /**
   * @brief Connects the manager to an outbound send function.
   *
   * Transitions connecting → connected, emits an initial presence broadcast and
   * schedules the periodic one. Ignored in any other state.
   */
  auto start(send_fn_t send) -> void
  {
    if (state_ != connection_state::connecting) {
      spdlog::warn("[presence_manager] start ignored in state {}", to_string(state_));
      return;
    }

    send_ = std::move(send);
    set_state(connection_state::connected);
    spdlog::info("[presence_manager] started as {} on channel {}", self_.display_name, config_.channel_id);

    broadcast_presence();
    schedule_tick();

    if (config_.share_location_by_default) { start_sharing(); }
  }

  /**
   * @brief Halts the timer and location watch, sends `leave`, and disconnects.
   *
   * Safe from any state; `disconnected` is terminal.
   */
  auto stop() -> void
  {
    if (state_ == connection_state::disconnected) { return; }

    tick_timer_.cancel();
    sharing_ = false;
    stop_watch();

    if (state_ == connection_state::connected) { send_envelope(protocol::leave_payload{}); }

    send_ = nullptr;
    set_state(connection_state::disconnected);
    spdlog::info("[presence_manager] stopped");
  }

  /**
   * @brief Subscribes to the device location stream.
   *
   * A platform without location capability is reported as an error event and
   * leaves sharing off.
   */
  auto start_sharing() -> void
  {
    if (state_ == connection_state::disconnected or sharing_) { return; }

    sharing_ = true;
    const auto generation = ++watch_generation_;
    auto weak_self = this->weak_from_this();

    auto handle = geolocation_->watch(
      [weak_self, generation](const core::position_sample &sample) {
        if (auto self = weak_self.lock()) { self->on_watch_fix(generation, sample); }
      },
      [weak_self, generation](const core::geolocation_error &error) {
        if (auto self = weak_self.lock()) { self->on_watch_error(generation, error); }
      });

    if (not handle.has_value()) {
      sharing_ = false;
      spdlog::warn("[presence_manager] geolocation is not available");
      emit(events::error{ .kind = events::error_kind::location_unavailable,
        .message = "Geolocation is not available on this platform" });
      return;
    }

    // The watch may already have failed synchronously
    if (sharing_ and generation == watch_generation_) {
      watch_handle_ = handle;
    } else {
      geolocation_->clear_watch(*handle);
    }
  }

  /**
   * @brief Cancels the watch and drops the self fix.
   *
   * Peers are told with a status broadcast that no location is shared.
   */
  auto stop_sharing() -> void
  {
    sharing_ = false;
    stop_watch();
    if (self_.location.has_value()) { clear_location(); }
  }

  [[nodiscard]] auto is_sharing() const -> bool { return sharing_; }

  /**
   * @brief Asks the source for one fix now instead of waiting for the watch.
   *
   * Ignored unless sharing. The fix goes through the same pipeline and throttle
   * as watch fixes.
   */
  auto request_current_location() -> void
  {
    if (not sharing_) { return; }

    const auto generation = watch_generation_;
    auto weak_self = this->weak_from_this();
    geolocation_->get_current_fix(
      [weak_self, generation](const core::position_sample &sample) {
        if (auto self = weak_self.lock()) { self->on_watch_fix(generation, sample); }
      },
      [weak_self, generation](const core::geolocation_error &error) {
        if (auto self = weak_self.lock()) { self->on_watch_error(generation, error); }
      });
  }

  /**
   * @brief Accepts a one-shot fix.
   *
   * @return false, with an error event, if the coordinates are out of range
   */
  auto set_location(double latitude, double longitude, location_source source = location_source::manual) -> bool
  {
    return update_self_location(
      core::coordinates{ .latitude = latitude, .longitude = longitude }, source, clock_->now_ms());
  }

  /// Drops the self fix and broadcasts "no location shared"
  auto clear_location() -> void
  {
    self_.location.reset();
    self_.is_moving = false;
    refresh_proximities();
    broadcast_status();
  }

  auto set_status(presence_status status, std::optional<std::string> message = std::nullopt) -> void
  {
    self_.status = status;
    self_.status_message = std::move(message);
    broadcast_status();
  }

  [[nodiscard]] auto get_status() const -> presence_status { return self_.status; }

  /**
   * @brief Writes through to the trust store and re-projects the peer's view.
   *
   * Takes effect immediately from the peer's last broadcast.
   */
  auto set_trust_level(const std::string &identity, trust_tier tier) -> void
  {
    trust_store_->set_trust_level(identity, tier);
    reproject(identity);
  }

  /// Forgets the peer's tier; the view falls back to public precision
  auto remove_trust_level(const std::string &identity) -> void
  {
    if (trust_store_->remove_trust_level(identity)) { reproject(identity); }
  }

  [[nodiscard]] auto get_trust_level(const std::string &identity) const -> trust_tier
  {
    return trust_store_->get_trust_level(identity).value_or(trust_tier::public_);
  }

  /**
   * @brief Tells `target` which distance category they are in.
   *
   * @return false if there is no self fix or no located view of the target
   */
  auto broadcast_proximity(const std::string &target) -> bool
  {
    const auto view = views_.find(target);
    if (not self_.location.has_value() or view == views_.end() or not view->second.location.has_value()) {
      return false;
    }

    const auto category = compute_proximity(self_.location, *view->second.location).category;
    const auto now = clock_->now_ms();
    auto proof = signer_->sign(proximity_proof_bytes(target, category, now));
    return send_envelope(
      protocol::proximity_payload{ .target = target, .proof = std::move(proof), .category = category }, now);
  }

  /**
   * @brief Ingests raw bytes from the transport.
   *
   * Malformed input is counted and dropped.
   */
  auto handle_bytes(std::span<const std::byte> bytes) -> void
  {
    auto broadcast = protocol::presence_broadcast::deserialize(bytes);
    if (not broadcast.has_value()) {
      ++stats_.malformed;
      spdlog::debug("[presence_manager] dropped malformed envelope ({} bytes)", bytes.size());
      return;
    }
    handle_broadcast(*broadcast);
  }

  /**
   * @brief Applies a peer broadcast.
   *
   * Self-loops, incompatible versions, expired, unsigned, malformed and stale
   * envelopes are dropped before any state is touched.
   */
  auto handle_broadcast(const protocol::presence_broadcast &broadcast) -> void
  {
    if (state_ == connection_state::disconnected) { return; }

    if (broadcast.sender == self_.identity) {
      ++stats_.self_loop;
      return;
    }

    if (not core::is_version_compatible(broadcast.version, protocol::minimum_protocol_version)) {
      ++stats_.incompatible_version;
      spdlog::debug("[presence_manager] dropped v{} envelope from {}", broadcast.version, short_id(broadcast.sender));
      return;
    }

    const auto now = clock_->now_ms();
    if (now > broadcast.timestamp_ms
        and now - broadcast.timestamp_ms > static_cast<std::uint64_t>(broadcast.ttl_seconds) * millis_per_second) {
      ++stats_.expired;
      spdlog::debug("[presence_manager] dropped expired {} from {}",
        protocol::to_string(broadcast.type()),
        short_id(broadcast.sender));
      return;
    }

    if (not signer_->verify(broadcast.sender, broadcast.signing_bytes(), broadcast.signature)) {
      ++stats_.bad_signature;
      spdlog::debug("[presence_manager] dropped unsigned envelope from {}", short_id(broadcast.sender));
      return;
    }

    if (not is_well_formed(broadcast)) {
      ++stats_.malformed;
      spdlog::debug("[presence_manager] dropped malformed {} from {}",
        protocol::to_string(broadcast.type()),
        short_id(broadcast.sender));
      return;
    }

    if (is_stale(broadcast)) {
      ++stats_.stale;
      spdlog::debug(
        "[presence_manager] dropped stale seq {} from {}", broadcast.sequence, short_id(broadcast.sender));
      return;
    }

    high_water_.insert_or_assign(broadcast.sender,
      sequence_mark{
        .sequence = broadcast.sequence, .timestamp_ms = broadcast.timestamp_ms, .ttl_seconds = broadcast.ttl_seconds });
    ++stats_.accepted;

    std::visit(core::overload{
                 [&](const protocol::location_payload &payload) { on_location(broadcast, payload, now); },
                 [&](const protocol::status_payload &payload) { on_status(broadcast, payload, now); },
                 [&](const protocol::proximity_payload &payload) { on_proximity(broadcast, payload); },
                 [&](const protocol::leave_payload &) { on_leave(broadcast.sender); },
               },
      broadcast.payload);
  }

  /// Transport reported the link down: connected → reconnecting
  auto transport_lost() -> void
  {
    if (state_ != connection_state::connected) { return; }
    set_state(connection_state::reconnecting);
  }

  /**
   * @brief Transport link is (back) up.
   *
   * reconnecting → connected. Presence is rebroadcast in either case, so a
   * link that comes up after start() still announces the local user.
   */
  auto transport_restored() -> void
  {
    if (state_ == connection_state::reconnecting) { set_state(connection_state::connected); }
    if (state_ == connection_state::connected) { broadcast_presence(); }
  }

  /**
   * @brief Subscribes to presence events.
   *
   * @return Callable that unsubscribes the listener
   */
  auto on(std::function<void(const events::presence_event_t &)> listener) -> std::function<void()>
  {
    return bus_.subscribe(std::move(listener));
  }

  [[nodiscard]] auto get_views() const -> std::vector<presence_view>
  {
    std::vector<presence_view> result;
    result.reserve(views_.size());
    for (const auto &[identity, view] : views_) { result.push_back(view); }
    return result;
  }

  [[nodiscard]] auto get_view(const std::string &identity) const -> std::optional<presence_view>
  {
    if (const auto entry = views_.find(identity); entry != views_.end()) { return entry->second; }
    return std::nullopt;
  }

  [[nodiscard]] auto get_self() const -> user_presence { return self_; }

  [[nodiscard]] auto get_peer(const std::string &identity) const -> std::optional<user_presence>
  {
    if (const auto entry = peers_.find(identity); entry != peers_.end()) { return entry->second.presence; }
    return std::nullopt;
  }

  /// Peers whose status is online or away
  [[nodiscard]] auto get_online_users() const -> std::vector<user_presence>
  {
    std::vector<user_presence> result;
    for (const auto &[identity, peer] : peers_) {
      if (peer.presence.status == presence_status::online or peer.presence.status == presence_status::away) {
        result.push_back(peer.presence);
      }
    }
    return result;
  }

  /// Views whose proximity is `max_category` or closer
  [[nodiscard]] auto get_users_nearby(proximity_category max_category = proximity_category::same_area) const
    -> std::vector<presence_view>
  {
    std::vector<presence_view> result;
    for (const auto &[identity, view] : views_) {
      if (view.proximity.has_value() and view.proximity->category <= max_category) { result.push_back(view); }
    }
    return result;
  }

  [[nodiscard]] auto get_state() const -> manager_state
  {
    return { .state = state_,
      .last_sequence = sequence_,
      .peer_count = peers_.size(),
      .view_count = views_.size(),
      .sharing = sharing_,
      .stats = stats_ };
  }

  [[nodiscard]] auto connection() const -> connection_state { return state_; }
  [[nodiscard]] auto stats() const -> const ingest_stats & { return stats_; }
  [[nodiscard]] auto config() const -> const presence_config & { return config_; }

  /**
   * @brief Marks silent peers away and removes expired ones.
   *
   * Runs on every periodic tick; exposed for hosts that drive time themselves.
   */
  auto sweep() -> void
  {
    const auto now = clock_->now_ms();
    std::vector<std::string> expired;

    for (auto &[identity, peer] : peers_) {
      const auto silence = now > peer.presence.last_seen_ms ? now - peer.presence.last_seen_ms : 0;
      if (silence > static_cast<std::uint64_t>(peer.ttl_seconds) * millis_per_second) {
        expired.push_back(identity);
      } else if (silence > static_cast<std::uint64_t>(config_.away_after_seconds) * millis_per_second
                 and peer.presence.status == presence_status::online) {
        peer.presence.status = presence_status::away;
        rebuild_view(identity, peer);
        emit(events::status_changed{ .identity = identity, .status = presence_status::away });
      }
    }

    for (const auto &identity : expired) {
      spdlog::debug("[presence_manager] {} expired", short_id(identity));
      on_leave(identity);
    }

    std::erase_if(high_water_, [&](const auto &entry) {
      const auto &[identity, mark] = entry;
      return not peers_.contains(identity) and now > mark.timestamp_ms
             and now - mark.timestamp_ms > static_cast<std::uint64_t>(mark.ttl_seconds) * millis_per_second;
    });
  }

private:
  static constexpr std::uint64_t millis_per_second = 1000;

  struct peer_record
  {
    user_presence presence;
    std::optional<proximity_info> reported_proximity;///< Verified claim from the peer, until its next fix
    std::uint32_t ttl_seconds{};
  };

  /// Highest (sequence, timestamp) applied per sender; kept after `leave`
  struct sequence_mark
  {
    std::uint64_t sequence{};
    std::uint64_t timestamp_ms{};
    std::uint32_t ttl_seconds{};
  };

  static auto short_id(const std::string &identity) -> std::string { return identity.substr(0, 8); }

  static auto proximity_proof_bytes(const std::string &target, proximity_category category, std::uint64_t timestamp_ms)
    -> std::string
  {
    return fmt::format("proximity|{}|{}|{}", target, to_string(category), timestamp_ms);
  }

  static auto is_valid_coordinate(double latitude, double longitude) -> bool
  {
    constexpr double max_latitude = 90.0;
    constexpr double max_longitude = 180.0;
    return latitude >= -max_latitude and latitude <= max_latitude and longitude >= -max_longitude
           and longitude <= max_longitude;
  }

  static auto is_well_formed(const protocol::presence_broadcast &broadcast) -> bool
  {
    const auto *location = std::get_if<protocol::location_payload>(&broadcast.payload);
    if (location == nullptr) { return true; }
    if (location->precision_levels.empty()) { return false; }
    return std::ranges::all_of(location->precision_levels, [](const precision_level &level) {
      return geo::geohash::is_valid(level.geohash) and level.precision == level.geohash.size();
    });
  }

  auto is_stale(const protocol::presence_broadcast &broadcast) const -> bool
  {
    const auto mark = high_water_.find(broadcast.sender);
    if (mark == high_water_.end()) { return false; }
    return broadcast.sequence <= mark->second.sequence and broadcast.timestamp_ms <= mark->second.timestamp_ms;
  }

  auto emit(events::presence_event_t event) const -> void { bus_.emit(event); }

  auto set_state(connection_state state) -> void
  {
    state_ = state;
    emit(events::connection_changed{ .state = state });
  }

  auto schedule_tick() -> void
  {
    tick_timer_.expires_after(config_.update_interval);
    tick_timer_.async_wait([weak_self = this->weak_from_this()](const boost::system::error_code &error) {
      if (error == boost::asio::error::operation_aborted) { return; }
      if (auto self = weak_self.lock()) { self->tick(); }
    });
  }

  auto tick() -> void
  {
    if (state_ == connection_state::disconnected) { return; }
    if (state_ == connection_state::connected) { broadcast_presence(); }
    sweep();
    schedule_tick();
  }

  auto stop_watch() -> void
  {
    ++watch_generation_;
    if (watch_handle_.has_value()) {
      geolocation_->clear_watch(*watch_handle_);
      watch_handle_.reset();
    }
  }

  auto on_watch_fix(std::uint64_t generation, const core::position_sample &sample) -> void
  {
    if (generation != watch_generation_ or not sharing_) {
      spdlog::trace("[presence_manager] ignoring fix from cancelled watch");
      return;
    }
    update_self_location(sample.coords, location_source::gps, sample.timestamp_ms);
  }

  auto on_watch_error(std::uint64_t generation, const core::geolocation_error &error) -> void
  {
    if (generation != watch_generation_) { return; }

    spdlog::warn("[presence_manager] location error: {}", error.message);
    switch (error.code) {
    case core::geolocation_error_code::permission_denied:
      sharing_ = false;
      stop_watch();
      emit(events::error{ .kind = events::error_kind::permission_denied, .message = error.message });
      break;
    case core::geolocation_error_code::position_unavailable:
      emit(events::error{ .kind = events::error_kind::location_unavailable, .message = error.message });
      break;
    case core::geolocation_error_code::timeout:
      emit(events::error{ .kind = events::error_kind::timeout, .message = error.message });
      break;
    }
  }

  auto update_self_location(const core::coordinates &coords, location_source source, std::uint64_t timestamp_ms)
    -> bool
  {
    if (not is_valid_coordinate(coords.latitude, coords.longitude)) {
      spdlog::warn("[presence_manager] rejected fix {}, {}", coords.latitude, coords.longitude);
      emit(events::error{ .kind = events::error_kind::invalid_location,
        .message = fmt::format("Coordinates out of range: {}, {}", coords.latitude, coords.longitude) });
      return false;
    }

    auto commitment =
      crypto::create_commitment(coords.latitude, coords.longitude, max_precision, *signer_, timestamp_ms);

    const auto now = clock_->now_ms();
    self_.location = location_fix{ .coords = coords,
      .source = source,
      .timestamp_ms = timestamp_ms,
      .is_live = source == location_source::gps,
      .commitment = std::move(commitment) };
    self_.is_moving = coords.speed.value_or(0.0) >= moving_speed_threshold;
    self_.last_seen_ms = now;
    refresh_proximities();

    if (last_location_broadcast_ms_.has_value() and now >= *last_location_broadcast_ms_
        and now - *last_location_broadcast_ms_ < static_cast<std::uint64_t>(config_.location_throttle.count())) {
      spdlog::trace("[presence_manager] location broadcast throttled");
      return true;
    }

    if (broadcast_location()) { last_location_broadcast_ms_ = now; }
    return true;
  }

  auto broadcast_presence() -> void
  {
    broadcast_status();
    if (self_.location.has_value() and self_.status != presence_status::invisible) { broadcast_location(); }
  }

  auto broadcast_location() -> bool
  {
    if (not self_.location.has_value() or self_.status == presence_status::invisible) {
      return broadcast_status();
    }

    const auto &fix = *self_.location;
    protocol::location_payload payload{ .commitment = { .digest = fix.commitment.digest,
                                          .signature = fix.commitment.signature,
                                          .timestamp_ms = fix.commitment.timestamp_ms },
      .precision_levels = {},
      .is_moving = self_.is_moving,
      .heading = self_.is_moving ? fix.coords.heading : std::nullopt,
      .speed = std::nullopt };

    if (fix.coords.speed.has_value()) { payload.speed = speed_category_for(*fix.coords.speed); }

    for (const auto tier : all_tiers) {
      auto precision = precision_for(tier);
      if (tier == trust_tier::public_) { precision = std::min(precision, config_.default_public_precision); }
      payload.precision_levels.push_back(precision_level{
        .tier = tier, .geohash = geo::geohash::truncate(fix.commitment.geohash, precision), .precision = precision });
    }

    return send_envelope(std::move(payload));
  }

  auto broadcast_status() -> bool
  {
    return send_envelope(protocol::status_payload{ .status = self_.status,
      .message = self_.status_message,
      .device = self_.device,
      .sharing_location = self_.location.has_value() and self_.status != presence_status::invisible,
      .display_name = self_.display_name,
      .color = self_.color });
  }

  auto send_envelope(protocol::payload_t payload, std::optional<std::uint64_t> timestamp_ms = std::nullopt) -> bool
  {
    if (state_ != connection_state::connected or not send_) { return false; }

    protocol::presence_broadcast broadcast{ .version = std::string{ cmake::project_version },
      .sender = self_.identity,
      .payload = std::move(payload),
      .signature = {},
      .timestamp_ms = timestamp_ms.value_or(clock_->now_ms()),
      .sequence = ++sequence_,
      .ttl_seconds = config_.presence_ttl_seconds };
    broadcast.signature = signer_->sign(broadcast.signing_bytes());

    auto bytes = broadcast.serialize();
    spdlog::trace("[presence_manager] sending {} seq {} ({} bytes)",
      protocol::to_string(broadcast.type()),
      broadcast.sequence,
      bytes.size());
    send_(std::move(bytes));
    return true;
  }

  auto upsert_peer(const std::string &identity, std::uint32_t ttl_seconds) -> std::pair<peer_record &, bool>
  {
    auto [entry, inserted] = peers_.try_emplace(identity);
    auto &peer = entry->second;
    if (inserted) {
      peer.presence.identity = identity;
      peer.presence.display_name = default_display_name(identity);
      peer.presence.color = default_color(identity);
    }
    peer.ttl_seconds = ttl_seconds;
    return { peer, inserted };
  }

  auto on_location(const protocol::presence_broadcast &broadcast,
    const protocol::location_payload &payload,
    std::uint64_t now) -> void
  {
    auto [peer, is_new] = upsert_peer(broadcast.sender, broadcast.ttl_seconds);

    std::vector<std::string> changes{ "location" };
    if (peer.presence.is_moving != payload.is_moving) { changes.emplace_back("moving"); }
    if (peer.presence.status != presence_status::online) { changes.emplace_back("status"); }

    peer.presence.shared_location = received_location{ .levels = payload.precision_levels,
      .digest = payload.commitment.digest,
      .timestamp_ms = payload.commitment.timestamp_ms,
      .verified = crypto::verify_commitment(*signer_,
        broadcast.sender,
        crypto::commitment{ .geohash = {},
          .digest = payload.commitment.digest,
          .signature = payload.commitment.signature,
          .timestamp_ms = payload.commitment.timestamp_ms }),
      .is_moving = payload.is_moving,
      .heading = payload.heading,
      .speed = payload.speed };
    peer.presence.is_moving = payload.is_moving;
    peer.presence.status = presence_status::online;
    peer.presence.last_seen_ms = now;
    peer.reported_proximity.reset();

    if (is_new) {
      emit(events::user_joined{ .user = peer.presence });
    } else {
      emit(events::user_updated{ .user = peer.presence, .changes = std::move(changes) });
    }
    reproject(broadcast.sender);
  }

  auto on_status(const protocol::presence_broadcast &broadcast,
    const protocol::status_payload &payload,
    std::uint64_t now) -> void
  {
    auto [peer, is_new] = upsert_peer(broadcast.sender, broadcast.ttl_seconds);
    auto &presence = peer.presence;

    const bool status_changed = presence.status != payload.status or presence.status_message != payload.message;
    std::vector<std::string> changes;

    presence.status = payload.status;
    presence.status_message = payload.message;
    presence.last_seen_ms = now;
    if (payload.device.has_value()) { presence.device = *payload.device; }
    if (payload.display_name.has_value() and presence.display_name != *payload.display_name) {
      presence.display_name = *payload.display_name;
      changes.emplace_back("display_name");
    }
    if (payload.color.has_value() and presence.color != *payload.color) {
      presence.color = *payload.color;
      changes.emplace_back("color");
    }
    if (not payload.sharing_location and presence.shared_location.has_value()) {
      presence.shared_location.reset();
      presence.is_moving = false;
      peer.reported_proximity.reset();
      changes.emplace_back("location");
    }

    rebuild_view(broadcast.sender, peer);

    if (is_new) {
      emit(events::user_joined{ .user = presence });
      return;
    }
    if (status_changed) { emit(events::status_changed{ .identity = broadcast.sender, .status = payload.status }); }
    if (not changes.empty()) { emit(events::user_updated{ .user = presence, .changes = std::move(changes) }); }
  }

  auto on_proximity(const protocol::presence_broadcast &broadcast, const protocol::proximity_payload &payload) -> void
  {
    if (payload.target != self_.identity) {
      ++stats_.untargeted_proximity;
      return;
    }

    auto peer = peers_.find(broadcast.sender);
    if (peer == peers_.end() or not views_.contains(broadcast.sender)) {
      ++stats_.orphan_proximity;
      spdlog::debug("[presence_manager] proximity from unknown peer {}", short_id(broadcast.sender));
      return;
    }

    const auto proof_bytes = proximity_proof_bytes(payload.target, payload.category, broadcast.timestamp_ms);
    if (not signer_->verify(broadcast.sender, proof_bytes, payload.proof)) {
      ++stats_.bad_signature;
      spdlog::debug("[presence_manager] proximity proof from {} does not verify", short_id(broadcast.sender));
      return;
    }

    peer->second.reported_proximity = proximity_info{
      .category = payload.category, .verified = true, .approximate_meters = std::nullopt, .mutually_visible = true
    };
    rebuild_view(broadcast.sender, peer->second);
    emit(events::proximity_detected{ .identity = broadcast.sender, .proximity = *peer->second.reported_proximity });
  }

  auto on_leave(const std::string &identity) -> void
  {
    views_.erase(identity);
    if (peers_.erase(identity) > 0) { emit(events::user_left{ .identity = identity }); }
  }

  /**
   * @brief Recomputes a peer's view from stored state and emits location_updated.
   */
  auto reproject(const std::string &identity) -> void
  {
    auto peer = peers_.find(identity);
    if (peer == peers_.end()) { return; }

    const auto &view = rebuild_view(identity, peer->second);
    if (view.location.has_value()) { emit(events::location_updated{ .identity = identity, .view = view }); }
  }

  auto rebuild_view(const std::string &identity, const peer_record &peer) -> const presence_view &
  {
    auto view = derive_view(peer);
    return views_.insert_or_assign(identity, std::move(view)).first->second;
  }

  /**
   * @brief Pure projection of (stored presence, local tier) to a view.
   *
   * The consumed level is the one addressed to the local tier, or the longest
   * received one, truncated to the tier's policy precision.
   */
  auto derive_view(const peer_record &peer) const -> presence_view
  {
    const auto &presence = peer.presence;
    const auto tier = get_trust_level(presence.identity);

    presence_view view{ .identity = presence.identity,
      .display_name = presence.display_name,
      .color = presence.color,
      .location = std::nullopt,
      .status = presence.status,
      .last_seen_ms = presence.last_seen_ms,
      .tier = tier,
      .is_verified = false,
      .proximity = std::nullopt };

    if (not presence.shared_location.has_value() or presence.shared_location->levels.empty()) { return view; }
    const auto &shared = *presence.shared_location;

    const auto &levels = shared.levels;
    auto level = std::ranges::find_if(levels, [tier](const precision_level &entry) { return entry.tier == tier; });
    if (level == levels.end()) {
      level = std::ranges::max_element(
        levels, [](const precision_level &lhs, const precision_level &rhs) { return lhs.precision < rhs.precision; });
    }

    const auto precision = std::min(level->precision, precision_for(tier));
    auto geohash = geo::geohash::truncate(level->geohash, precision);
    const auto bounds = geo::geohash::bounds(geohash);
    const auto now = clock_->now_ms();

    view.location = viewable_location{ .geohash = std::move(geohash),
      .precision = precision,
      .center = bounds.center(),
      .bounds = bounds,
      .uncertainty_radius_meters = radius_for_precision(precision),
      .age_seconds = now > shared.timestamp_ms ? (now - shared.timestamp_ms) / millis_per_second : 0,
      .is_moving = shared.is_moving,
      .heading = shared.heading,
      .speed = shared.speed };
    view.is_verified = shared.verified;
    view.proximity = peer.reported_proximity.has_value() ? *peer.reported_proximity
                                                         : compute_proximity(self_.location, *view.location);
    return view;
  }

  /// The self fix moved: recompute computed (not reported) proximities
  auto refresh_proximities() -> void
  {
    for (auto &[identity, view] : views_) {
      const auto peer = peers_.find(identity);
      if (not view.location.has_value() or peer == peers_.end() or peer->second.reported_proximity.has_value()) {
        continue;
      }
      view.proximity = compute_proximity(self_.location, *view.location);
    }
  }

  std::shared_ptr<boost::asio::io_context> io_context_;
  std::shared_ptr<Geolocation> geolocation_;
  std::shared_ptr<Signer> signer_;
  std::shared_ptr<TrustStore> trust_store_;
  std::shared_ptr<Clock> clock_;
  presence_config config_;
  boost::asio::steady_timer tick_timer_;

  connection_state state_{ connection_state::connecting };
  send_fn_t send_;
  user_presence self_;
  bool sharing_{};
  std::optional<std::uint64_t> watch_handle_;
  std::uint64_t watch_generation_{};
  std::uint64_t sequence_{};
  std::optional<std::uint64_t> last_location_broadcast_ms_;

  std::map<std::string, peer_record> peers_;
  std::map<std::string, presence_view> views_;
  std::map<std::string, sequence_mark> high_water_;
  ingest_stats stats_;
  event_bus<events::presence_event_t> bus_;
};

}// namespace locus::presence
