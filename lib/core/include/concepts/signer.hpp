#pragma once

#include <concepts>
#include <string>
#include <string_view>

namespace locus::concepts {

/**
 * @brief Concept for the local identity's signing key.
 *
 * `identity()` is the public key peers know this node by. Signatures are
 * returned hex-encoded.
 */
template<typename T>
concept signer = requires(const T &key, std::string_view message) {
  { key.identity() } -> std::convertible_to<std::string>;
  { key.sign(message) } -> std::convertible_to<std::string>;
};

/**
 * @brief Concept for checking a peer's signature against its identity.
 *
 * Must return false, never throw, on malformed keys or signatures.
 */
template<typename T>
concept verifier = requires(const T &key, const std::string &identity, std::string_view message, std::string_view sig) {
  { key.verify(identity, message, sig) } -> std::same_as<bool>;
};

}// namespace locus::concepts
