#include <geolocation/replay_source.hpp>
#include <platform/time_utils.hpp>

#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>
#include <fstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace locus::geolocation {

namespace {

  auto optional_number(const nlohmann::json &json_obj, const char *key) -> std::optional<double>
  {
    if (json_obj.contains(key) and json_obj[key].is_number()) { return json_obj[key].get<double>(); }
    return std::nullopt;
  }

}// namespace

replay_source::replay_source(const std::shared_ptr<boost::asio::io_context> &io_context,
  std::vector<core::position_sample> track,
  replay_options options)
  : io_context_(io_context), track_(std::move(track)), options_(std::move(options))
{}

auto replay_source::watch(core::fix_callback_t on_fix, core::geolocation_error_callback_t on_error)
  -> std::optional<std::uint64_t>
{
  if (not options_.available) { return std::nullopt; }

  const auto handle = next_handle_++;
  auto state = std::make_shared<watch_state>(watch_state{ .id = handle,
    .on_fix = std::move(on_fix),
    .on_error = std::move(on_error),
    .next_index = 0,
    .timer = boost::asio::steady_timer(*io_context_) });
  watches_.emplace(handle, state);

  spdlog::debug("[replay_source] watch {} started ({} fixes)", handle, track_.size());
  schedule(state, std::chrono::milliseconds::zero());
  return handle;
}

auto replay_source::clear_watch(std::uint64_t handle) -> void
{
  const auto entry = watches_.find(handle);
  if (entry == watches_.end()) { return; }

  entry->second->timer.cancel();
  watches_.erase(entry);
  spdlog::debug("[replay_source] watch {} cleared", handle);
}

auto replay_source::get_current_fix(core::fix_callback_t on_fix, core::geolocation_error_callback_t on_error) -> void
{
  boost::asio::post(*io_context_,
    [weak_self = weak_from_this(), on_fix = std::move(on_fix), on_error = std::move(on_error)]() {
      auto self = weak_self.lock();
      if (not self) { return; }

      if (not self->options_.available) {
        on_error({ .code = core::geolocation_error_code::position_unavailable,
          .message = "Location services unavailable" });
      } else if (self->options_.fail_with.has_value()) {
        on_error(*self->options_.fail_with);
      } else if (self->track_.empty()) {
        on_error({ .code = core::geolocation_error_code::position_unavailable, .message = "Track is empty" });
      } else {
        on_fix(self->stamped(self->track_.front()));
      }
    });
}

auto replay_source::schedule(const std::shared_ptr<watch_state> &state, std::chrono::milliseconds delay) -> void
{
  state->timer.expires_after(delay);
  state->timer.async_wait(
    [weak_self = weak_from_this(), weak_state = std::weak_ptr<watch_state>(state)](
      const boost::system::error_code &error) {
      if (error == boost::asio::error::operation_aborted) { return; }
      auto self = weak_self.lock();
      auto locked_state = weak_state.lock();
      if (not self or not locked_state or not self->watches_.contains(locked_state->id)) { return; }
      self->deliver(locked_state);
    });
}

auto replay_source::deliver(const std::shared_ptr<watch_state> &state) -> void
{
  if (options_.fail_with.has_value()) {
    spdlog::debug("[replay_source] watch {} failing: {}", state->id, options_.fail_with->message);
    state->on_error(*options_.fail_with);
    return;
  }

  if (state->next_index >= track_.size()) {
    if (not options_.loop or track_.empty()) { return; }
    state->next_index = 0;
  }

  const auto sample = stamped(track_[state->next_index++]);
  state->on_fix(sample);

  // the callback may have cleared this watch
  if (watches_.contains(state->id)) { schedule(state, options_.interval); }
}

auto replay_source::stamped(core::position_sample sample) const -> core::position_sample
{
  if (sample.timestamp_ms == 0) { sample.timestamp_ms = platform::now_ms(); }
  return sample;
}

auto replay_source::load_track(const std::filesystem::path &path) -> std::optional<std::vector<core::position_sample>>
{
  std::ifstream file(path);
  if (not file) {
    spdlog::error("[replay_source] cannot open track {}", path.string());
    return std::nullopt;
  }

  const auto document = nlohmann::json::parse(file, nullptr, false);
  if (document.is_discarded() or not document.is_array()) {
    spdlog::error("[replay_source] track {} is not a JSON array", path.string());
    return std::nullopt;
  }

  std::vector<core::position_sample> track;
  for (const auto &entry : document) {
    if (not entry.is_object() or not optional_number(entry, "lat") or not optional_number(entry, "lng")) {
      spdlog::error("[replay_source] track entry without lat/lng in {}", path.string());
      return std::nullopt;
    }

    track.push_back({ .coords = { .latitude = entry["lat"].get<double>(),
                        .longitude = entry["lng"].get<double>(),
                        .altitude = optional_number(entry, "altitude"),
                        .accuracy = optional_number(entry, "accuracy"),
                        .heading = optional_number(entry, "heading"),
                        .speed = optional_number(entry, "speed") },
      .timestamp_ms =
        entry.contains("ts") and entry["ts"].is_number_unsigned() ? entry["ts"].get<std::uint64_t>() : 0 });
  }
  return track;
}

}// namespace locus::geolocation
