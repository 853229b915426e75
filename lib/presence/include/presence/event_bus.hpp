#pragma once

#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <spdlog/spdlog.h>
#include <utility>
#include <vector>

namespace locus::presence {

/**
 * @brief Subscriber list with unsubscribe tokens.
 *
 * Each listener is invoked in its own try block, so a throwing subscriber is
 * logged and skipped without affecting the others or the emitting flow.
 * Listeners may subscribe or unsubscribe while an emission is in progress.
 *
 * @tparam Event Type delivered to listeners
 */
template<typename Event> class event_bus
{
public:
  using listener_t = std::function<void(const Event &)>;

  /**
   * @brief Registers a listener.
   *
   * @return Callable that removes the listener; safe to call more than once
   *         and after the bus is destroyed
   */
  auto subscribe(listener_t listener) -> std::function<void()>
  {
    const auto token = next_token_++;
    state_->listeners.emplace_back(token, std::make_shared<listener_t>(std::move(listener)));

    return [weak_state = std::weak_ptr<state>(state_), token]() {
      auto locked = weak_state.lock();
      if (not locked) { return; }
      std::erase_if(locked->listeners, [token](const auto &entry) { return entry.first == token; });
    };
  }

  auto emit(const Event &event) const -> void
  {
    const auto snapshot = state_->listeners;
    for (const auto &[token, listener] : snapshot) {
      try {
        (*listener)(event);
      } catch (const std::exception &e) {
        spdlog::error("[event_bus] listener {} threw: {}", token, e.what());
      } catch (...) {
        spdlog::error("[event_bus] listener {} threw a non-standard exception", token);
      }
    }
  }

  [[nodiscard]] auto size() const -> std::size_t { return state_->listeners.size(); }

private:
  struct state
  {
    std::vector<std::pair<std::uint64_t, std::shared_ptr<listener_t>>> listeners;
  };

  std::shared_ptr<state> state_ = std::make_shared<state>();
  std::uint64_t next_token_{ 1 };
};

}// namespace locus::presence
