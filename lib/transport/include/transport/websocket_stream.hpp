#pragma once

#include <concepts/transport_stream.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <cstddef>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace locus::transport {

/// Where a presence relay listens
struct websocket_connection_params
{
  std::string_view host;
  std::string_view port;///< "443" unless the relay URL names one
  std::string_view path;///< Channel path, e.g. "/presence/default"
};

/// Sub-protocol announced during the WebSocket handshake
inline constexpr std::string_view presence_subprotocol = "locus-presence.v0";

/**
 * @brief TLS WebSocket stream to a presence relay.
 *
 * One text message carries one envelope. Inbound messages larger than the
 * caller's read buffer are skipped rather than truncated; a truncated
 * envelope could never verify.
 */
class websocket_stream
{
public:
  using connection_params_t = websocket_connection_params;

  explicit websocket_stream(const std::shared_ptr<boost::asio::io_context> &io_context);

  /// Resolves, connects, then performs the TLS and WebSocket handshakes
  auto async_connect(websocket_connection_params params, concepts::stream_completion_t handler) -> void;

  auto async_write(std::span<const std::byte> envelope, concepts::stream_completion_t handler) -> void;

  auto async_read(const boost::asio::mutable_buffer &into, concepts::stream_completion_t handler) -> void;

  auto async_close(concepts::stream_completion_t handler) -> void;

  [[nodiscard]] auto skipped_oversized() const -> std::size_t { return skipped_oversized_; }

private:
  using tls_stream_t = boost::beast::ssl_stream<boost::beast::tcp_stream>;

  static constexpr int handshake_timeout_seconds = 30;

  struct pending_connect
  {
    std::string host;
    std::string path;
    concepts::stream_completion_t handler;
  };

  auto on_resolved(std::shared_ptr<pending_connect> pending,
    const boost::asio::ip::tcp::resolver::results_type &endpoints) -> void;
  auto on_tcp_connected(std::shared_ptr<pending_connect> pending) -> void;
  auto on_tls_established(std::shared_ptr<pending_connect> pending) -> void;

  boost::asio::ssl::context tls_context_;
  boost::asio::ip::tcp::resolver resolver_;
  boost::beast::websocket::stream<tls_stream_t> ws_;
  boost::beast::flat_buffer inbound_;
  std::size_t skipped_oversized_{};
};

static_assert(concepts::transport_stream<websocket_stream>);

}// namespace locus::transport
