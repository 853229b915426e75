#pragma once

#include <boost/asio/buffer.hpp>
#include <boost/system/error_code.hpp>
#include <concepts>
#include <cstddef>
#include <functional>
#include <span>

namespace locus::concepts {

/// Completion signature shared by every transport_stream operation
using stream_completion_t = std::function<void(const boost::system::error_code &, std::size_t)>;

/**
 * @brief An async stream that frames presence envelopes as whole messages.
 *
 * One `async_write` sends one envelope and one completed `async_read` yields
 * one envelope. `connection_params_t` names what `async_connect` needs.
 */
template<typename T>
concept transport_stream = requires(T &stream,
  typename T::connection_params_t params,
  const std::span<const std::byte> envelope,
  const boost::asio::mutable_buffer &into,
  stream_completion_t done) {
  typename T::connection_params_t;
  { stream.async_connect(params, done) } -> std::same_as<void>;
  { stream.async_write(envelope, done) } -> std::same_as<void>;
  { stream.async_read(into, done) } -> std::same_as<void>;
  { stream.async_close(done) } -> std::same_as<void>;
};

}// namespace locus::concepts
