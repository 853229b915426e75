#include "internal_use_only/config.hpp"
#include <transport/websocket_stream.hpp>

#include <boost/asio/strand.hpp>
#include <chrono>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <utility>

namespace locus::transport {

namespace beast = boost::beast;

websocket_stream::websocket_stream(const std::shared_ptr<boost::asio::io_context> &io_context)
  : tls_context_(boost::asio::ssl::context::tlsv12_client), resolver_(*io_context),
    ws_(boost::asio::make_strand(*io_context), tls_context_)
{
  tls_context_.set_default_verify_paths();
  tls_context_.set_verify_mode(boost::asio::ssl::verify_peer);
}

auto websocket_stream::async_connect(websocket_connection_params params, concepts::stream_completion_t handler) -> void
{
  auto pending = std::make_shared<pending_connect>(pending_connect{
    .host = std::string(params.host), .path = std::string(params.path), .handler = std::move(handler) });

  resolver_.async_resolve(pending->host,
    std::string(params.port),
    [this, pending](
      const boost::system::error_code &error, const boost::asio::ip::tcp::resolver::results_type &endpoints) {
      if (error) {
        pending->handler(error, 0);
        return;
      }
      on_resolved(pending, endpoints);
    });
}

auto websocket_stream::on_resolved(std::shared_ptr<pending_connect> pending,
  const boost::asio::ip::tcp::resolver::results_type &endpoints) -> void
{
  beast::get_lowest_layer(ws_).expires_after(std::chrono::seconds(handshake_timeout_seconds));
  beast::get_lowest_layer(ws_).async_connect(endpoints,
    [this, pending = std::move(pending)](
      const boost::system::error_code &error, const boost::asio::ip::tcp::endpoint & /*endpoint*/) {
      if (error) {
        pending->handler(error, 0);
        return;
      }
      on_tcp_connected(pending);
    });
}

auto websocket_stream::on_tcp_connected(std::shared_ptr<pending_connect> pending) -> void
{
  // SNI, required by relays behind shared TLS front ends
#ifdef __GNUC__
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-cstyle-cast,hicpp-no-array-decay)
  const bool sni_set = SSL_set_tlsext_host_name(ws_.next_layer().native_handle(), pending->host.c_str()) != 0;
#ifdef __GNUC__
#pragma GCC diagnostic pop
#endif
  if (not sni_set) {
    pending->handler(boost::asio::error::operation_not_supported, 0);
    return;
  }

  ws_.next_layer().async_handshake(boost::asio::ssl::stream_base::client,
    [this, pending = std::move(pending)](const boost::system::error_code &error) {
      if (error) {
        pending->handler(error, 0);
        return;
      }
      on_tls_established(pending);
    });
}

auto websocket_stream::on_tls_established(std::shared_ptr<pending_connect> pending) -> void
{
  beast::get_lowest_layer(ws_).expires_never();

  ws_.set_option(beast::websocket::stream_base::timeout::suggested(beast::role_type::client));
  ws_.set_option(beast::websocket::stream_base::decorator([](beast::websocket::request_type &request) {
    request.set(beast::http::field::user_agent, fmt::format("{}/{}", cmake::project_name, cmake::project_version));
    request.set(beast::http::field::sec_websocket_protocol,
      beast::string_view{presence_subprotocol.data(), presence_subprotocol.size()});
  }));
  ws_.text(true);

  ws_.async_handshake(pending->host, pending->path, [pending](const boost::system::error_code &error) {
    pending->handler(error, 0);
  });
}

auto websocket_stream::async_write(std::span<const std::byte> envelope, concepts::stream_completion_t handler) -> void
{
  ws_.async_write(boost::asio::buffer(envelope.data(), envelope.size()), std::move(handler));
}

auto websocket_stream::async_read(const boost::asio::mutable_buffer &into, concepts::stream_completion_t handler)
  -> void
{
  inbound_.clear();
  ws_.async_read(inbound_,
    [this, into, handler = std::move(handler)](
      const boost::system::error_code &error, std::size_t message_size) mutable {
      if (error) {
        handler(error, 0);
        return;
      }

      if (message_size > into.size()) {
        ++skipped_oversized_;
        spdlog::debug("[websocket_stream] skipping {} byte message (limit {})", message_size, into.size());
        async_read(into, std::move(handler));
        return;
      }

      handler(error, boost::asio::buffer_copy(into, inbound_.data()));
    });
}

auto websocket_stream::async_close(concepts::stream_completion_t handler) -> void
{
  ws_.async_close(beast::websocket::close_code::normal,
    [handler = std::move(handler)](const boost::system::error_code &error) { handler(error, 0); });
}

}// namespace locus::transport
