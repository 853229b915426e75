#include "test_doubles/test_double_clock.hpp"
#include "test_doubles/test_double_geolocation_source.hpp"
#include "test_doubles/test_double_signer.hpp"
#include "test_doubles/test_double_transport_endpoint.hpp"
#include <presence/channel_adapter.hpp>
#include <presence/presence_manager.hpp>
#include <presence/trust_circle_store.hpp>
#include <transport/loopback_hub.hpp>

#include <boost/asio/io_context.hpp>
#include <catch2/catch_test_macros.hpp>
#include <memory>
#include <string>
#include <vector>

namespace locus::presence::test {

namespace {

  using locus::test::test_double_clock;
  using locus::test::test_double_geolocation_source;
  using locus::test::test_double_signer;
  using locus::test::test_double_transport_endpoint;

  using manager_t =
    presence_manager<test_double_geolocation_source, test_double_signer, trust_circle_store, test_double_clock>;

  constexpr double san_francisco_lat = 37.7749;
  constexpr double san_francisco_lng = -122.4194;

  auto make_manager(const std::shared_ptr<boost::asio::io_context> &io_context,
    const std::shared_ptr<test_double_geolocation_source> &geolocation,
    const std::string &identity) -> std::shared_ptr<manager_t>
  {
    presence_config config;
    config.display_name = identity;
    return std::make_shared<manager_t>(io_context,
      geolocation,
      std::make_shared<test_double_signer>(identity),
      std::make_shared<trust_circle_store>(),
      std::make_shared<test_double_clock>(),
      config,
      device_type::mobile);
  }

  auto signed_status(const std::string &identity, std::uint64_t sequence, presence_status status)
    -> std::vector<std::byte>
  {
    const test_double_signer key(identity);
    protocol::presence_broadcast broadcast{ .version = "0.1.0",
      .sender = identity,
      .payload = protocol::status_payload{ .status = status,
        .message = std::nullopt,
        .device = device_type::desktop,
        .sharing_location = false,
        .display_name = identity,
        .color = std::nullopt },
      .signature = {},
      .timestamp_ms = test_double_clock{}.now_ms(),
      .sequence = sequence,
      .ttl_seconds = 60 };
    broadcast.signature = key.sign(broadcast.signing_bytes());
    return broadcast.serialize();
  }

  auto find_view(const std::vector<presence_view> &views, const std::string &identity) -> const presence_view *
  {
    for (const auto &view : views) {
      if (view.identity == identity) { return &view; }
    }
    return nullptr;
  }

}// namespace

SCENARIO("Two adapters exchange presence over a loopback hub", "[presence][adapter][integration]")
{
  GIVEN("alice and bob attached to the same hub")
  {
    auto io_context = std::make_shared<boost::asio::io_context>();
    auto hub = std::make_shared<transport::loopback_hub>(io_context);

    auto alice_geolocation = std::make_shared<test_double_geolocation_source>();
    auto bob_geolocation = std::make_shared<test_double_geolocation_source>();
    auto alice_endpoint = hub->attach();

    using adapter_t = channel_adapter<manager_t, transport::loopback_endpoint>;
    auto alice =
      std::make_shared<adapter_t>(io_context, make_manager(io_context, alice_geolocation, "alice"), alice_endpoint);
    auto bob = std::make_shared<adapter_t>(io_context, make_manager(io_context, bob_geolocation, "bob"), hub->attach());

    alice->connect();
    bob->connect();
    io_context->poll();

    THEN("each sees the other by name")
    {
      REQUIRE(alice->connection_state() == connection_state::connected);
      REQUIRE(alice->online_count() == 1);
      REQUIRE(bob->online_count() == 1);
      REQUIRE(find_view(alice->views(), "bob")->display_name == "bob");
      REQUIRE_FALSE(find_view(alice->views(), "bob")->location.has_value());
    }

    WHEN("bob shares a fix and alice trusts bob as a friend")
    {
      alice->set_trust_level("bob", trust_tier::friends);
      bob->start_sharing();
      bob_geolocation->fire_fix(san_francisco_lat, san_francisco_lng, test_double_clock{}.now_ms());
      io_context->poll();

      THEN("alice sees bob at friends precision")
      {
        REQUIRE(bob->is_sharing());
        const auto *view = find_view(alice->views(), "bob");
        REQUIRE(view != nullptr);
        REQUIRE(view->tier == trust_tier::friends);
        REQUIRE(view->location.has_value());
        REQUIRE(view->location->geohash == "9q8yy");
        REQUIRE(view->location->precision == 5);
      }
    }

    WHEN("alice's link drops and returns")
    {
      alice_endpoint->set_link(false);
      io_context->poll();
      const auto while_down = alice->connection_state();

      alice_endpoint->set_link(true);
      io_context->poll();

      THEN("alice passes through reconnecting back to connected")
      {
        REQUIRE(while_down == connection_state::reconnecting);
        REQUIRE(alice->connection_state() == connection_state::connected);
      }
    }

    WHEN("bob disconnects")
    {
      bob->disconnect();
      io_context->poll();

      THEN("alice drops bob")
      {
        REQUIRE(bob->connection_state() == connection_state::disconnected);
        REQUIRE(find_view(alice->views(), "bob") == nullptr);
        REQUIRE(alice->online_count() == 0);
      }
    }

    alice->disconnect();
    bob->disconnect();
  }
}

SCENARIO("Channel adapter coalesces view notifications", "[presence][adapter]")
{
  GIVEN("an adapter over an endpoint double")
  {
    auto io_context = std::make_shared<boost::asio::io_context>();
    auto endpoint = std::make_shared<test_double_transport_endpoint>();
    auto geolocation = std::make_shared<test_double_geolocation_source>();
    auto adapter = std::make_shared<channel_adapter<manager_t, test_double_transport_endpoint>>(
      io_context, make_manager(io_context, geolocation, "self"), endpoint);

    std::vector<std::size_t> snapshots;
    auto unsubscribe =
      adapter->on_change([&snapshots](const std::vector<presence_view> &views) { snapshots.push_back(views.size()); });

    adapter->connect();
    io_context->poll();
    snapshots.clear();

    THEN("connecting announced the local status") { REQUIRE(endpoint->sent().size() == 1); }

    WHEN("two peers arrive in the same loop turn")
    {
      endpoint->inject(signed_status("carol", 1, presence_status::online));
      endpoint->inject(signed_status("dave", 1, presence_status::busy));

      THEN("ingestion waits for the loop")
      {
        REQUIRE(adapter->views().empty());
        io_context->poll();
        REQUIRE(adapter->views().size() == 2);
        REQUIRE(snapshots == std::vector<std::size_t>{ 2 });
      }
    }

    WHEN("the listener unsubscribes")
    {
      unsubscribe();
      endpoint->inject(signed_status("carol", 1, presence_status::online));
      io_context->poll();

      THEN("it hears nothing more") { REQUIRE(snapshots.empty()); }
    }

    WHEN("the link goes down and comes back")
    {
      endpoint->clear();
      endpoint->set_link(false);
      io_context->poll();
      endpoint->set_link(true);
      io_context->poll();

      THEN("presence is rebroadcast once the link is back")
      {
        REQUIRE(adapter->connection_state() == connection_state::connected);
        REQUIRE_FALSE(endpoint->sent().empty());
      }
    }

    WHEN("it disconnects")
    {
      endpoint->clear();
      adapter->disconnect();

      THEN("a leave goes out")
      {
        REQUIRE(endpoint->sent().size() == 1);
        const auto leave = protocol::presence_broadcast::deserialize(endpoint->sent().front());
        REQUIRE(leave.has_value());
        REQUIRE(leave->type() == protocol::broadcast_type::leave);
      }
    }

    adapter->disconnect();
  }
}

}// namespace locus::presence::test
