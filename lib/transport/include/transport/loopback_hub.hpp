#pragma once

#include <boost/asio/io_context.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

namespace locus::transport {

class loopback_hub;

/**
 * @brief One participant's attachment to a loopback_hub.
 *
 * Satisfies transport_endpoint. Everything it sends reaches every other
 * attached endpoint whose link is up, asynchronously on the hub's io_context.
 */
class loopback_endpoint
{
public:
  loopback_endpoint(std::weak_ptr<loopback_hub> hub, std::uint64_t id);

  auto send(std::vector<std::byte> bytes) -> void;
  auto set_receive_handler(std::function<void(std::vector<std::byte>)> handler) -> void;
  auto set_link_handler(std::function<void(bool)> handler) -> void;

  /// Simulates this endpoint's link going down or coming back
  auto set_link(bool up) -> void;

  [[nodiscard]] auto id() const -> std::uint64_t { return id_; }
  [[nodiscard]] auto link_up() const -> bool { return link_up_; }
  [[nodiscard]] auto sent_count() const -> std::uint64_t { return sent_; }
  [[nodiscard]] auto received_count() const -> std::uint64_t { return received_; }

private:
  friend class loopback_hub;

  auto deliver(const std::vector<std::byte> &bytes) -> void;

  std::weak_ptr<loopback_hub> hub_;
  std::uint64_t id_;
  bool link_up_{ true };
  std::uint64_t sent_{};
  std::uint64_t received_{};
  std::function<void(std::vector<std::byte>)> on_receive_;
  std::function<void(bool)> on_link_;
};

/**
 * @brief In-process broadcast channel for simulations and tests.
 */
class loopback_hub : public std::enable_shared_from_this<loopback_hub>
{
public:
  explicit loopback_hub(const std::shared_ptr<boost::asio::io_context> &io_context);

  /// Attaches a new endpoint; the hub keeps only a weak reference
  auto attach() -> std::shared_ptr<loopback_endpoint>;

  [[nodiscard]] auto endpoint_count() const -> std::size_t;
  [[nodiscard]] auto published_count() const -> std::uint64_t { return published_; }

private:
  friend class loopback_endpoint;

  auto publish(std::uint64_t from, std::vector<std::byte> bytes) -> void;

  std::shared_ptr<boost::asio::io_context> io_context_;
  std::vector<std::weak_ptr<loopback_endpoint>> endpoints_;
  std::uint64_t next_id_{ 1 };
  std::uint64_t published_{};
};

}// namespace locus::transport
