#pragma once

#include <concepts/transport_stream.hpp>
#include <transport/websocket_stream.hpp>

#include <array>
#include <boost/asio.hpp>
#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <vector>

namespace locus::transport {

/// Host, port and path split out of a relay URL
struct relay_address
{
  std::string host;
  std::string port{ "443" };
  std::string path{ "/" };
};

/**
 * @brief Parses `wss://host[:port][/path]` (scheme optional).
 *
 * @return std::nullopt for `ws://` (plaintext is refused) or an empty host
 */
[[nodiscard]] inline auto parse_relay_url(std::string_view url) -> std::optional<relay_address>
{
  constexpr std::string_view secure_scheme = "wss://";
  if (url.starts_with("ws://")) { return std::nullopt; }
  if (url.starts_with(secure_scheme)) { url.remove_prefix(secure_scheme.size()); }

  relay_address address;
  const auto slash = url.find('/');
  if (slash != std::string_view::npos) {
    address.path = std::string{ url.substr(slash) };
    url = url.substr(0, slash);
  }

  const auto colon = url.find(':');
  if (colon != std::string_view::npos) {
    address.port = std::string{ url.substr(colon + 1) };
    url = url.substr(0, colon);
  }

  address.host = std::string{ url };
  if (address.host.empty() or address.port.empty()) { return std::nullopt; }
  return address;
}

/**
 * @brief Presence transport over a relay that fans each message out to the channel.
 *
 * Satisfies transport_endpoint. Writes are serialized through a queue; a read
 * or write failure reports the link down and retries the connection after
 * `reconnect_delay`. Sends while the link is down are dropped.
 *
 * Every connection attempt runs on a fresh stream from `stream_factory`; a
 * stream that failed is never reused. Completions from a replaced stream are
 * ignored.
 *
 * @tparam Stream Type satisfying the transport_stream concept
 */
template<concepts::transport_stream Stream>
class relay_endpoint : public std::enable_shared_from_this<relay_endpoint<Stream>>
{
public:
  using stream_factory_t = std::function<std::shared_ptr<Stream>()>;

  relay_endpoint(const std::shared_ptr<boost::asio::io_context> &io_context,
    stream_factory_t stream_factory,
    relay_address address,
    std::chrono::milliseconds reconnect_delay = std::chrono::seconds(5))
    : io_context_(io_context), stream_factory_(std::move(stream_factory)), address_(std::move(address)),
      reconnect_delay_(reconnect_delay), reconnect_timer_(*io_context_)
  {}

  relay_endpoint(const relay_endpoint &) = delete;
  auto operator=(const relay_endpoint &) -> relay_endpoint & = delete;
  relay_endpoint(relay_endpoint &&) = delete;
  auto operator=(relay_endpoint &&) -> relay_endpoint & = delete;
  ~relay_endpoint() = default;

  auto set_receive_handler(std::function<void(std::vector<std::byte>)> handler) -> void
  {
    on_receive_ = std::move(handler);
  }

  auto set_link_handler(std::function<void(bool)> handler) -> void { on_link_ = std::move(handler); }

  auto connect() -> void
  {
    closing_ = false;
    connected_ = false;
    outbox_.clear();
    stream_ = stream_factory_();
    ++streams_opened_;
    spdlog::info("[relay_endpoint] connecting to {}:{}{}", address_.host, address_.port, address_.path);

    stream_->async_connect({ .host = address_.host, .port = address_.port, .path = address_.path },
      [weak_self = this->weak_from_this(), stream = stream_](
        const boost::system::error_code &error, std::size_t /*bytes*/) {
        auto self = weak_self.lock();
        if (not self or self->stream_ != stream) { return; }
        self->on_connected(error);
      });
  }

  auto close() -> void
  {
    closing_ = true;
    reconnect_timer_.cancel();
    outbox_.clear();
    if (not connected_) { return; }

    connected_ = false;
    stream_->async_close([stream = stream_](const boost::system::error_code &error, std::size_t /*bytes*/) {
      if (error) { spdlog::debug("[relay_endpoint] close: {}", error.message()); }
    });
  }

  auto send(std::vector<std::byte> bytes) -> void
  {
    if (not connected_) {
      spdlog::trace("[relay_endpoint] link down, dropping {} bytes", bytes.size());
      return;
    }
    outbox_.push_back(std::move(bytes));
    if (outbox_.size() == 1) { write_next(); }
  }

  [[nodiscard]] auto is_connected() const -> bool { return connected_; }

  /// Number of streams created by connection attempts so far
  [[nodiscard]] auto streams_opened() const -> std::size_t { return streams_opened_; }

private:
  static constexpr std::size_t read_buffer_size = 16384;

  auto on_connected(const boost::system::error_code &error) -> void
  {
    if (closing_) { return; }
    if (error) {
      spdlog::warn("[relay_endpoint] connect failed: {}", error.message());
      schedule_reconnect();
      return;
    }

    connected_ = true;
    spdlog::info("[relay_endpoint] connected");
    if (on_link_) { on_link_(true); }
    start_read();
  }

  auto start_read() -> void
  {
    stream_->async_read(boost::asio::buffer(read_buffer_),
      [weak_self = this->weak_from_this(), stream = stream_](
        const boost::system::error_code &error, std::size_t bytes_transferred) {
        auto self = weak_self.lock();
        if (not self or self->stream_ != stream) { return; }
        self->on_read(error, bytes_transferred);
      });
  }

  auto on_read(const boost::system::error_code &error, std::size_t bytes_transferred) -> void
  {
    if (error) {
      if (not closing_) { spdlog::warn("[relay_endpoint] read failed: {}", error.message()); }
      link_lost();
      return;
    }

    if (bytes_transferred > 0 and on_receive_) {
      on_receive_(std::vector<std::byte>(
        read_buffer_.begin(), read_buffer_.begin() + static_cast<std::ptrdiff_t>(bytes_transferred)));
    }
    start_read();
  }

  auto write_next() -> void
  {
    if (outbox_.empty()) { return; }

    stream_->async_write(std::span<const std::byte>(outbox_.front()),
      [weak_self = this->weak_from_this(), stream = stream_](
        const boost::system::error_code &error, std::size_t bytes_transferred) {
        auto self = weak_self.lock();
        if (not self or self->stream_ != stream) { return; }
        if (error) {
          spdlog::error("[relay_endpoint] write failed: {}", error.message());
          self->link_lost();
          return;
        }
        spdlog::trace("[relay_endpoint] wrote {} bytes", bytes_transferred);
        if (not self->outbox_.empty()) { self->outbox_.pop_front(); }
        self->write_next();
      });
  }

  auto link_lost() -> void
  {
    outbox_.clear();
    if (connected_) {
      connected_ = false;
      if (on_link_) { on_link_(false); }
    }
    if (not closing_) { schedule_reconnect(); }
  }

  auto schedule_reconnect() -> void
  {
    if (closing_) { return; }
    reconnect_timer_.expires_after(reconnect_delay_);
    reconnect_timer_.async_wait([weak_self = this->weak_from_this()](const boost::system::error_code &error) {
      if (error == boost::asio::error::operation_aborted) { return; }
      if (auto self = weak_self.lock()) { self->connect(); }
    });
  }

  std::shared_ptr<boost::asio::io_context> io_context_;
  stream_factory_t stream_factory_;
  std::shared_ptr<Stream> stream_;
  std::size_t streams_opened_{};
  relay_address address_;
  std::chrono::milliseconds reconnect_delay_;
  boost::asio::steady_timer reconnect_timer_;

  std::function<void(std::vector<std::byte>)> on_receive_;
  std::function<void(bool)> on_link_;
  std::array<std::byte, read_buffer_size> read_buffer_{};
  std::deque<std::vector<std::byte>> outbox_;
  bool connected_{};
  bool closing_{};
};

}// namespace locus::transport
