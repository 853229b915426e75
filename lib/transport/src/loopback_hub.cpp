#include <transport/loopback_hub.hpp>

#include <algorithm>
#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

namespace locus::transport {

loopback_endpoint::loopback_endpoint(std::weak_ptr<loopback_hub> hub, std::uint64_t id) : hub_(std::move(hub)), id_(id)
{}

auto loopback_endpoint::send(std::vector<std::byte> bytes) -> void
{
  if (not link_up_) {
    spdlog::trace("[loopback_hub] endpoint {} link down, dropping {} bytes", id_, bytes.size());
    return;
  }
  if (auto hub = hub_.lock()) {
    ++sent_;
    hub->publish(id_, std::move(bytes));
  }
}

auto loopback_endpoint::set_receive_handler(std::function<void(std::vector<std::byte>)> handler) -> void
{
  on_receive_ = std::move(handler);
}

auto loopback_endpoint::set_link_handler(std::function<void(bool)> handler) -> void { on_link_ = std::move(handler); }

auto loopback_endpoint::set_link(bool up) -> void
{
  if (link_up_ == up) { return; }
  link_up_ = up;
  spdlog::debug("[loopback_hub] endpoint {} link {}", id_, up ? "up" : "down");
  if (on_link_) { on_link_(up); }
}

auto loopback_endpoint::deliver(const std::vector<std::byte> &bytes) -> void
{
  if (not link_up_ or not on_receive_) { return; }
  ++received_;
  on_receive_(bytes);
}

loopback_hub::loopback_hub(const std::shared_ptr<boost::asio::io_context> &io_context) : io_context_(io_context) {}

auto loopback_hub::attach() -> std::shared_ptr<loopback_endpoint>
{
  auto endpoint = std::make_shared<loopback_endpoint>(weak_from_this(), next_id_++);
  std::erase_if(endpoints_, [](const auto &weak) { return weak.expired(); });
  endpoints_.push_back(endpoint);
  return endpoint;
}

auto loopback_hub::endpoint_count() const -> std::size_t
{
  return static_cast<std::size_t>(
    std::count_if(endpoints_.begin(), endpoints_.end(), [](const auto &weak) { return not weak.expired(); }));
}

auto loopback_hub::publish(std::uint64_t from, std::vector<std::byte> bytes) -> void
{
  ++published_;
  auto shared_bytes = std::make_shared<const std::vector<std::byte>>(std::move(bytes));

  for (const auto &weak : endpoints_) {
    auto endpoint = weak.lock();
    if (not endpoint or endpoint->id() == from) { continue; }

    boost::asio::post(*io_context_, [weak_endpoint = std::weak_ptr<loopback_endpoint>(endpoint), shared_bytes]() {
      if (auto target = weak_endpoint.lock()) { target->deliver(*shared_bytes); }
    });
  }
}

}// namespace locus::transport
