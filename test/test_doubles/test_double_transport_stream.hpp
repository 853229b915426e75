#pragma once

#include <concepts/transport_stream.hpp>
#include <transport/websocket_stream.hpp>

#include <algorithm>
#include <boost/asio.hpp>
#include <boost/system/error_code.hpp>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace locus::test {

/**
 * @brief Message stream double: queued inbound messages, recorded writes.
 *
 * Completions are posted to the io_context like a real stream's.
 */
class test_double_transport_stream
{
public:
  using connection_params_t = transport::websocket_connection_params;
  using handler_t = std::function<void(const boost::system::error_code &, std::size_t)>;

  struct connection_record
  {
    std::string host;
    std::string port;
    std::string path;
  };

  explicit test_double_transport_stream(const std::shared_ptr<boost::asio::io_context> &io_context)
    : io_context_(io_context)
  {}

  auto set_connect_failure(bool fail) -> void { should_fail_connect_ = fail; }
  auto set_write_failure(bool fail) -> void { should_fail_write_ = fail; }

  /// Queues one inbound message, completing a pending read if there is one
  auto push_message(std::vector<std::byte> message) -> void
  {
    inbound_.push_back(std::move(message));
    if (pending_read_handler_) { complete_pending_read(); }
  }

  /// Fails the pending read as if the relay dropped the connection
  auto drop_connection() -> void
  {
    connected_ = false;
    if (not pending_read_handler_) { return; }
    auto handler = std::move(pending_read_handler_);
    pending_read_handler_ = nullptr;
    boost::asio::post(
      *io_context_, [handler = std::move(handler)]() { handler(boost::asio::error::connection_reset, 0); });
  }

  [[nodiscard]] auto get_connections() const -> const std::vector<connection_record> & { return connections_; }
  [[nodiscard]] auto get_writes() const -> const std::vector<std::vector<std::byte>> & { return writes_; }
  [[nodiscard]] auto is_connected() const -> bool { return connected_; }

  auto async_connect(connection_params_t params, handler_t handler) -> void
  {
    connections_.push_back({ std::string(params.host), std::string(params.port), std::string(params.path) });

    boost::asio::post(*io_context_, [this, handler = std::move(handler)]() {
      if (should_fail_connect_) {
        handler(boost::asio::error::connection_refused, 0);
      } else {
        connected_ = true;
        handler(boost::system::error_code{}, 0);
      }
    });
  }

  auto async_write(std::span<const std::byte> data, handler_t handler) -> void
  {
    writes_.emplace_back(data.begin(), data.end());

    const auto bytes = data.size();
    boost::asio::post(*io_context_, [this, bytes, handler = std::move(handler)]() {
      if (should_fail_write_) {
        handler(boost::asio::error::broken_pipe, 0);
      } else {
        handler(boost::system::error_code{}, bytes);
      }
    });
  }

  auto async_read(const boost::asio::mutable_buffer &buffer, handler_t handler) -> void
  {
    if (not connected_) {
      boost::asio::post(
        *io_context_, [handler = std::move(handler)]() { handler(boost::asio::error::not_connected, 0); });
      return;
    }

    pending_read_handler_ = std::move(handler);
    pending_read_buffer_ = buffer;

    if (not inbound_.empty()) { complete_pending_read(); }
  }

  auto async_close(handler_t handler) -> void
  {
    connected_ = false;
    if (pending_read_handler_) {
      auto pending = std::move(pending_read_handler_);
      pending_read_handler_ = nullptr;
      boost::asio::post(
        *io_context_, [pending = std::move(pending)]() { pending(boost::asio::error::operation_aborted, 0); });
    }
    boost::asio::post(*io_context_, [handler = std::move(handler)]() { handler(boost::system::error_code{}, 0); });
  }

private:
  auto complete_pending_read() -> void
  {
    auto message = std::move(inbound_.front());
    inbound_.pop_front();

    const auto to_read = std::min(pending_read_buffer_.size(), message.size());
    std::copy_n(message.begin(), to_read, static_cast<std::byte *>(pending_read_buffer_.data()));

    auto handler = std::move(pending_read_handler_);
    pending_read_handler_ = nullptr;

    boost::asio::post(
      *io_context_, [handler = std::move(handler), to_read]() { handler(boost::system::error_code{}, to_read); });
  }

  std::shared_ptr<boost::asio::io_context> io_context_;

  bool should_fail_connect_{ false };
  bool should_fail_write_{ false };
  bool connected_{ false };

  std::vector<connection_record> connections_;
  std::vector<std::vector<std::byte>> writes_;
  std::deque<std::vector<std::byte>> inbound_;

  handler_t pending_read_handler_;
  boost::asio::mutable_buffer pending_read_buffer_;
};

static_assert(locus::concepts::transport_stream<test_double_transport_stream>);

}// namespace locus::test
