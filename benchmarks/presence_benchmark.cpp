#include <crypto/ed25519_signer.hpp>
#include <geo/geohash.hpp>
#include <presence/protocol.hpp>

#include <catch2/benchmark/catch_benchmark.hpp>
#include <catch2/catch_test_macros.hpp>
#include <string>

namespace locus::presence::test {

TEST_CASE("Presence hot path benchmarks", "[benchmark][presence]")
{
  SECTION("Geohash")
  {
    BENCHMARK("Encode at full precision") { return geo::geohash::encode(37.7749, -122.4194, 12); };

    BENCHMARK("Decode a full-precision hash") { return geo::geohash::decode("9q8yyk8ytpxr"); };

    BENCHMARK("Neighbors of a city cell") { return geo::geohash::neighbors("9q8yy"); };
  }

  SECTION("Envelopes")
  {
    const auto signer = crypto::ed25519_signer::generate();
    protocol::presence_broadcast broadcast{ .version = "0.1.0",
      .sender = signer.identity(),
      .payload = protocol::status_payload{ .status = presence_status::online,
        .message = std::nullopt,
        .device = device_type::desktop,
        .sharing_location = true,
        .display_name = "bench",
        .color = std::nullopt },
      .signature = {},
      .timestamp_ms = 1'700'000'000'000,
      .sequence = 1,
      .ttl_seconds = 60 };
    broadcast.signature = signer.sign(broadcast.signing_bytes());
    const auto wire = broadcast.serialize();

    BENCHMARK("Serialize a status envelope") { return broadcast.serialize(); };

    BENCHMARK("Parse a status envelope") { return protocol::presence_broadcast::deserialize(wire); };

    BENCHMARK("Sign an envelope") { return signer.sign(broadcast.signing_bytes()); };

    BENCHMARK("Verify an envelope signature")
    {
      return signer.verify(signer.identity(), broadcast.signing_bytes(), broadcast.signature);
    };
  }
}

}// namespace locus::presence::test
