#pragma once

#include <memory>
#include <openssl/evp.h>
#include <string>
#include <string_view>

namespace locus::crypto {

/**
 * @brief Ed25519 identity key backed by OpenSSL.
 *
 * The hex-encoded raw public key is the node's identity on the wire. Signatures
 * are deterministic, so the same message always yields the same signature.
 */
class ed25519_signer
{
public:
  /**
   * @brief Loads a key from a hex-encoded 32-byte raw private key.
   *
   * @throws std::runtime_error on malformed key material
   */
  explicit ed25519_signer(std::string_view private_key_hex);

  ed25519_signer(const ed25519_signer &) = delete;
  auto operator=(const ed25519_signer &) -> ed25519_signer & = delete;
  ed25519_signer(ed25519_signer &&) noexcept = default;
  auto operator=(ed25519_signer &&) noexcept -> ed25519_signer & = default;
  ~ed25519_signer() = default;

  /// Fresh random key
  [[nodiscard]] static auto generate() -> ed25519_signer;

  [[nodiscard]] auto identity() const -> std::string;
  [[nodiscard]] auto private_key_hex() const -> std::string;
  [[nodiscard]] auto sign(std::string_view message) const -> std::string;

  /**
   * @brief Checks a hex signature against a hex identity.
   *
   * @return false on any malformed input or mismatch
   */
  [[nodiscard]] auto verify(const std::string &identity, std::string_view message, std::string_view signature) const
    -> bool;

private:
  struct pkey_deleter
  {
    auto operator()(EVP_PKEY *key) const -> void;
  };
  using pkey_ptr = std::unique_ptr<EVP_PKEY, pkey_deleter>;

  explicit ed25519_signer(pkey_ptr key);

  pkey_ptr key_;
  std::string identity_;
};

}// namespace locus::crypto
