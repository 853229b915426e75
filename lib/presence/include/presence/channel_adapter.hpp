#pragma once

#include <concepts/transport_endpoint.hpp>
#include <presence/event_bus.hpp>
#include <presence/events.hpp>
#include <presence/types.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <utility>
#include <vector>

namespace locus::presence {

/**
 * @brief Binds a presence manager to a transport endpoint for a UI layer.
 *
 * Inbound bytes and link changes are posted onto the io_context so ingestion
 * always runs on the loop thread. Any manager event schedules one coalesced
 * "views changed" notification per loop turn.
 *
 * @tparam Manager A presence_manager instantiation
 * @tparam Endpoint Type satisfying the transport_endpoint concept
 */
template<typename Manager, concepts::transport_endpoint Endpoint>
class channel_adapter : public std::enable_shared_from_this<channel_adapter<Manager, Endpoint>>
{
public:
  using change_listener_t = std::function<void(const std::vector<presence_view> &)>;

  channel_adapter(const std::shared_ptr<boost::asio::io_context> &io_context,
    const std::shared_ptr<Manager> &manager,
    const std::shared_ptr<Endpoint> &endpoint)
    : io_context_(io_context), manager_(manager), endpoint_(endpoint)
  {}

  channel_adapter(const channel_adapter &) = delete;
  auto operator=(const channel_adapter &) -> channel_adapter & = delete;
  channel_adapter(channel_adapter &&) = delete;
  auto operator=(channel_adapter &&) -> channel_adapter & = delete;

  ~channel_adapter()
  {
    if (unsubscribe_) { unsubscribe_(); }
  }

  /// Wires the endpoint to the manager and starts it
  auto connect() -> void
  {
    auto weak_self = this->weak_from_this();

    endpoint_->set_receive_handler([weak_self](std::vector<std::byte> bytes) {
      auto self = weak_self.lock();
      if (not self) { return; }
      boost::asio::post(*self->io_context_, [weak_self, bytes = std::move(bytes)]() {
        if (auto locked = weak_self.lock()) { locked->manager_->handle_bytes(bytes); }
      });
    });

    endpoint_->set_link_handler([weak_self](bool link_up) {
      auto self = weak_self.lock();
      if (not self) { return; }
      boost::asio::post(*self->io_context_, [weak_self, link_up]() {
        auto locked = weak_self.lock();
        if (not locked) { return; }
        if (link_up) {
          locked->manager_->transport_restored();
        } else {
          locked->manager_->transport_lost();
        }
      });
    });

    unsubscribe_ = manager_->on([weak_self](const events::presence_event_t &) {
      if (auto self = weak_self.lock()) { self->schedule_change_notification(); }
    });

    manager_->start([endpoint = endpoint_](std::vector<std::byte> bytes) { endpoint->send(std::move(bytes)); });
    spdlog::debug("[channel_adapter] connected");
  }

  /// Stops the manager; it sends `leave` if still connected
  auto disconnect() -> void
  {
    manager_->stop();
    if (unsubscribe_) {
      unsubscribe_();
      unsubscribe_ = nullptr;
    }
  }

  [[nodiscard]] auto connection_state() const -> presence::connection_state { return manager_->connection(); }
  [[nodiscard]] auto self() const -> user_presence { return manager_->get_self(); }
  [[nodiscard]] auto views() const -> std::vector<presence_view> { return manager_->get_views(); }
  [[nodiscard]] auto online_count() const -> std::size_t { return manager_->get_online_users().size(); }
  [[nodiscard]] auto is_sharing() const -> bool { return manager_->is_sharing(); }

  auto start_sharing() -> void { manager_->start_sharing(); }
  auto stop_sharing() -> void { manager_->stop_sharing(); }
  auto refresh_location() -> void { manager_->request_current_location(); }

  auto set_location(double latitude, double longitude, location_source source = location_source::manual) -> bool
  {
    return manager_->set_location(latitude, longitude, source);
  }

  auto clear_location() -> void { manager_->clear_location(); }

  auto set_status(presence_status status, std::optional<std::string> message = std::nullopt) -> void
  {
    manager_->set_status(status, std::move(message));
  }

  auto set_trust_level(const std::string &identity, trust_tier tier) -> void
  {
    manager_->set_trust_level(identity, tier);
  }

  [[nodiscard]] auto get_trust_level(const std::string &identity) const -> trust_tier
  {
    return manager_->get_trust_level(identity);
  }

  [[nodiscard]] auto nearby(proximity_category max_category = proximity_category::same_area) const
    -> std::vector<presence_view>
  {
    return manager_->get_users_nearby(max_category);
  }

  /**
   * @brief Subscribes to coalesced view snapshots.
   *
   * @return Callable that unsubscribes the listener
   */
  auto on_change(change_listener_t listener) -> std::function<void()>
  {
    return change_bus_.subscribe(std::move(listener));
  }

  [[nodiscard]] auto manager() const -> const std::shared_ptr<Manager> & { return manager_; }

private:
  auto schedule_change_notification() -> void
  {
    if (change_pending_) { return; }
    change_pending_ = true;

    boost::asio::post(*io_context_, [weak_self = this->weak_from_this()]() {
      auto self = weak_self.lock();
      if (not self) { return; }
      self->change_pending_ = false;
      self->change_bus_.emit(self->manager_->get_views());
    });
  }

  std::shared_ptr<boost::asio::io_context> io_context_;
  std::shared_ptr<Manager> manager_;
  std::shared_ptr<Endpoint> endpoint_;
  std::function<void()> unsubscribe_;
  event_bus<std::vector<presence_view>> change_bus_;
  bool change_pending_{};
};

}// namespace locus::presence
