#pragma once

#include <concepts>
#include <cstddef>
#include <functional>
#include <vector>

namespace locus::concepts {

/**
 * @brief Concept for whatever pub/sub channel carries presence envelopes.
 *
 * The engine imposes nothing below the envelope: `send` is fire-and-forget,
 * received envelopes arrive through the receive handler, and link changes
 * (up/down) through the link handler.
 */
template<typename T>
concept transport_endpoint = requires(T &endpoint,
  std::vector<std::byte> bytes,
  std::function<void(std::vector<std::byte>)> on_receive,
  std::function<void(bool)> on_link) {
  { endpoint.send(bytes) } -> std::same_as<void>;
  { endpoint.set_receive_handler(on_receive) } -> std::same_as<void>;
  { endpoint.set_link_handler(on_link) } -> std::same_as<void>;
};

}// namespace locus::concepts
