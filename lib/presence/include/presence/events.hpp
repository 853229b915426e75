#pragma once

#include <presence/types.hpp>

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace locus::presence::events {

/// First broadcast seen from a peer
struct user_joined
{
  user_presence user;
};

/// Peer sent `leave` or went silent past its TTL
struct user_left
{
  std::string identity;
};

/// Known peer's presence changed; `changes` names the fields touched
struct user_updated
{
  user_presence user;
  std::vector<std::string> changes;
};

/// Peer's view was (re)derived with a location
struct location_updated
{
  std::string identity;
  presence_view view;
};

struct proximity_detected
{
  std::string identity;
  proximity_info proximity;
};

struct status_changed
{
  std::string identity;
  presence_status status{};
};

/// Lifecycle transition of the local manager
struct connection_changed
{
  connection_state state{};
};

enum class error_kind : std::uint8_t {
  permission_denied,///< Geolocation refused; retry after user action
  location_unavailable,///< Transient hardware/network failure
  timeout,///< Transient, no fix in time
  invalid_location,///< Manual fix outside valid coordinate ranges
};

[[nodiscard]] constexpr auto to_string(error_kind kind) -> const char *
{
  switch (kind) {
  case error_kind::permission_denied:
    return "permission_denied";
  case error_kind::location_unavailable:
    return "location_unavailable";
  case error_kind::timeout:
    return "timeout";
  case error_kind::invalid_location:
    break;
  }
  return "invalid_location";
}

/// Non-fatal failure surfaced to the host
struct error
{
  error_kind kind{};
  std::string message;
};

using presence_event_t = std::variant<user_joined,
  user_left,
  user_updated,
  location_updated,
  proximity_detected,
  status_changed,
  connection_changed,
  error>;

}// namespace locus::presence::events
