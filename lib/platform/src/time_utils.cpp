#include <platform/time_utils.hpp>

#include <chrono>
#include <ctime>
#include <fmt/chrono.h>
#include <fmt/format.h>

namespace locus::platform {

auto now_ms() -> std::uint64_t
{
  const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch).count());
}

auto format_timestamp_hms(std::uint64_t unix_ms) -> std::string
{
  constexpr std::uint64_t ms_per_second = 1000;
  const auto seconds = static_cast<std::time_t>(unix_ms / ms_per_second);
  return fmt::format("{:%H:%M:%S}", fmt::localtime(seconds));
}

auto format_current_time_hms() -> std::string { return format_timestamp_hms(now_ms()); }

auto format_age(std::uint64_t then_ms, std::uint64_t now_ms) -> std::string
{
  constexpr std::uint64_t ms_per_second = 1000;
  constexpr std::uint64_t seconds_per_minute = 60;
  constexpr std::uint64_t seconds_per_hour = 3600;

  if (then_ms >= now_ms) { return "just now"; }

  const auto seconds = (now_ms - then_ms) / ms_per_second;
  if (seconds < 1) { return "just now"; }
  if (seconds < seconds_per_minute) { return fmt::format("{}s ago", seconds); }
  if (seconds < seconds_per_hour) { return fmt::format("{}m ago", seconds / seconds_per_minute); }
  return fmt::format("{}h ago", seconds / seconds_per_hour);
}

}// namespace locus::platform
