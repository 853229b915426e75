#pragma once

#include <concepts>
#include <core/location_types.hpp>
#include <cstdint>
#include <optional>

namespace locus::concepts {

/**
 * @brief Concept for a platform location provider.
 *
 * `watch` subscribes to a continuous stream of fixes and returns a handle, or
 * std::nullopt when the platform has no location capability at all. Permission
 * denial may be reported later through the error callback. `clear_watch` must
 * guarantee that no further callbacks are delivered for that handle.
 */
template<typename T>
concept geolocation_source = requires(T &source,
  core::fix_callback_t on_fix,
  core::geolocation_error_callback_t on_error,
  std::uint64_t handle) {
  { source.watch(on_fix, on_error) } -> std::convertible_to<std::optional<std::uint64_t>>;
  { source.clear_watch(handle) } -> std::same_as<void>;
  { source.get_current_fix(on_fix, on_error) } -> std::same_as<void>;
};

}// namespace locus::concepts
