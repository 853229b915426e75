#pragma once

#include <concepts/signer.hpp>
#include <crypto/sha256.hpp>
#include <geo/geohash.hpp>

#include <cstdint>
#include <fmt/format.h>
#include <string>

namespace locus::crypto {

/**
 * @brief Signed, non-reversible binding of an identity to a full-precision geohash.
 *
 * `geohash` stays on the device. Only `digest`, `signature` and `timestamp_ms`
 * are ever serialized.
 */
struct commitment
{
  std::string geohash;///< Full precision cell; local only
  std::string digest;///< sha256(geohash | blind), hex
  std::string signature;///< Signer's signature over "digest|timestamp"
  std::uint64_t timestamp_ms{};
};

namespace detail {
  template<concepts::signer Signer>
  [[nodiscard]] auto blinding_factor(const Signer &signer, const std::string &geohash, std::uint64_t timestamp_ms)
    -> std::string
  {
    return sha256_hex(signer.sign(fmt::format("blind|{}|{}", geohash, timestamp_ms)));
  }

  [[nodiscard]] inline auto commitment_digest(const std::string &geohash, const std::string &blind) -> std::string
  {
    return sha256_hex(fmt::format("{}|{}", geohash, blind));
  }

  [[nodiscard]] inline auto signed_bytes(const std::string &digest, std::uint64_t timestamp_ms) -> std::string
  {
    return fmt::format("{}|{}", digest, timestamp_ms);
  }
}// namespace detail

/**
 * @brief Commits to a location at the given geohash precision.
 *
 * Deterministic for identical inputs apart from the timestamp.
 *
 * @throws std::invalid_argument if the coordinates or precision are out of range
 */
template<concepts::signer Signer>
[[nodiscard]] auto create_commitment(double latitude,
  double longitude,
  std::size_t precision,
  const Signer &signer,
  std::uint64_t timestamp_ms) -> commitment
{
  auto geohash = geo::geohash::encode(latitude, longitude, precision);
  auto blind = detail::blinding_factor(signer, geohash, timestamp_ms);
  auto digest = detail::commitment_digest(geohash, blind);
  auto signature = signer.sign(detail::signed_bytes(digest, timestamp_ms));

  return { .geohash = std::move(geohash),
    .digest = std::move(digest),
    .signature = std::move(signature),
    .timestamp_ms = timestamp_ms };
}

/**
 * @brief Checks that the commitment's signature belongs to `identity`.
 */
template<concepts::verifier Verifier>
[[nodiscard]] auto verify_commitment(const Verifier &verifier, const std::string &identity, const commitment &value)
  -> bool
{
  return verifier.verify(identity, detail::signed_bytes(value.digest, value.timestamp_ms), value.signature);
}

/**
 * @brief Opens a commitment: only the committing signer can recompute the blind.
 *
 * @return true when `claimed_geohash` is the geohash the commitment binds
 */
template<concepts::signer Signer>
[[nodiscard]] auto verify_opening(const Signer &signer, const commitment &value, const std::string &claimed_geohash)
  -> bool
{
  const auto blind = detail::blinding_factor(signer, claimed_geohash, value.timestamp_ms);
  return detail::commitment_digest(claimed_geohash, blind) == value.digest;
}

}// namespace locus::crypto
