#pragma once

#include <core/location_types.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <vector>

namespace locus::geolocation {

struct replay_options
{
  std::chrono::milliseconds interval{ 1000 };///< Gap between delivered fixes
  bool loop{ false };///< Restart from the first fix after the last
  bool available{ true };///< False behaves like a platform without location support
  std::optional<core::geolocation_error> fail_with;///< Report this instead of any fix
};

/**
 * @brief Geolocation source that replays a recorded track on a steady timer.
 *
 * Samples with a zero timestamp are stamped with the wall clock on delivery.
 * Must be owned by a std::shared_ptr.
 */
class replay_source : public std::enable_shared_from_this<replay_source>
{
public:
  replay_source(const std::shared_ptr<boost::asio::io_context> &io_context,
    std::vector<core::position_sample> track,
    replay_options options = {});

  /**
   * @brief Starts delivering the track to a new watcher.
   *
   * @return Watch handle, or std::nullopt when the source is unavailable
   */
  auto watch(core::fix_callback_t on_fix, core::geolocation_error_callback_t on_error) -> std::optional<std::uint64_t>;

  /// No callbacks are delivered for `handle` after this returns
  auto clear_watch(std::uint64_t handle) -> void;

  auto get_current_fix(core::fix_callback_t on_fix, core::geolocation_error_callback_t on_error) -> void;

  [[nodiscard]] auto active_watches() const -> std::size_t { return watches_.size(); }

  /**
   * @brief Reads a track file: a JSON array of
   *        `{"lat", "lng", "speed"?, "heading"?, "accuracy"?, "altitude"?, "ts"?}`.
   *
   * @return std::nullopt if the file is missing or malformed
   */
  [[nodiscard]] static auto load_track(const std::filesystem::path &path)
    -> std::optional<std::vector<core::position_sample>>;

private:
  struct watch_state
  {
    std::uint64_t id{};
    core::fix_callback_t on_fix;
    core::geolocation_error_callback_t on_error;
    std::size_t next_index{};
    boost::asio::steady_timer timer;
  };

  auto schedule(const std::shared_ptr<watch_state> &state, std::chrono::milliseconds delay) -> void;
  auto deliver(const std::shared_ptr<watch_state> &state) -> void;
  [[nodiscard]] auto stamped(core::position_sample sample) const -> core::position_sample;

  std::shared_ptr<boost::asio::io_context> io_context_;
  std::vector<core::position_sample> track_;
  replay_options options_;
  std::map<std::uint64_t, std::shared_ptr<watch_state>> watches_;
  std::uint64_t next_handle_{ 1 };
};

}// namespace locus::geolocation
