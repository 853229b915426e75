#pragma once

#include <cstdint>
#include <string>

namespace locus::platform {

/**
 * @brief Current wall-clock time in Unix milliseconds.
 */
[[nodiscard]] auto now_ms() -> std::uint64_t;

/**
 * @brief Formats a Unix millisecond timestamp as local HH:MM:SS.
 */
[[nodiscard]] auto format_timestamp_hms(std::uint64_t unix_ms) -> std::string;

/// format_timestamp_hms(now_ms())
[[nodiscard]] auto format_current_time_hms() -> std::string;

/**
 * @brief Human "seen 12s ago" style age of `then_ms` relative to `now_ms`.
 *
 * Timestamps in the future read as "just now".
 */
[[nodiscard]] auto format_age(std::uint64_t then_ms, std::uint64_t now_ms) -> std::string;

/**
 * @brief Wall clock satisfying concepts::clock.
 */
struct system_clock
{
  [[nodiscard]] auto now_ms() const -> std::uint64_t { return platform::now_ms(); }
};

}// namespace locus::platform
