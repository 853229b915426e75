#include <crypto/ed25519_signer.hpp>
#include <crypto/hex.hpp>

#include <array>
#include <openssl/evp.h>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <vector>

namespace locus::crypto {

namespace {
  constexpr std::size_t key_length = 32;
  constexpr std::size_t signature_length = 64;

  using md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

  auto new_md_ctx() -> md_ctx_ptr { return { EVP_MD_CTX_new(), &EVP_MD_CTX_free }; }

  auto raw_public_key(EVP_PKEY *key) -> std::string
  {
    std::array<std::uint8_t, key_length> raw{};
    std::size_t len = raw.size();
    if (EVP_PKEY_get_raw_public_key(key, raw.data(), &len) != 1) {
      throw std::runtime_error("Failed to extract Ed25519 public key");
    }
    return to_hex(std::span<const std::uint8_t>(raw.data(), len));
  }
}// namespace

auto ed25519_signer::pkey_deleter::operator()(EVP_PKEY *key) const -> void { EVP_PKEY_free(key); }

ed25519_signer::ed25519_signer(pkey_ptr key) : key_(std::move(key)), identity_(raw_public_key(key_.get())) {}

ed25519_signer::ed25519_signer(std::string_view private_key_hex)
{
  const auto raw = from_hex(private_key_hex);
  if (not raw or raw->size() != key_length) {
    throw std::runtime_error("Ed25519 private key must be 64 hex characters");
  }

  key_.reset(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, raw->data(), raw->size()));
  if (not key_) { throw std::runtime_error("Failed to load Ed25519 private key"); }
  identity_ = raw_public_key(key_.get());
}

auto ed25519_signer::generate() -> ed25519_signer
{
  const std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)> ctx(
    EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr), &EVP_PKEY_CTX_free);
  if (not ctx or EVP_PKEY_keygen_init(ctx.get()) != 1) {
    throw std::runtime_error("Failed to initialise Ed25519 key generation");
  }

  EVP_PKEY *raw_key = nullptr;
  if (EVP_PKEY_keygen(ctx.get(), &raw_key) != 1) { throw std::runtime_error("Ed25519 key generation failed"); }

  return ed25519_signer{ pkey_ptr{ raw_key } };
}

auto ed25519_signer::identity() const -> std::string { return identity_; }

auto ed25519_signer::private_key_hex() const -> std::string
{
  std::array<std::uint8_t, key_length> raw{};
  std::size_t len = raw.size();
  if (EVP_PKEY_get_raw_private_key(key_.get(), raw.data(), &len) != 1) {
    throw std::runtime_error("Failed to extract Ed25519 private key");
  }
  return to_hex(std::span<const std::uint8_t>(raw.data(), len));
}

auto ed25519_signer::sign(std::string_view message) const -> std::string
{
  auto ctx = new_md_ctx();
  if (not ctx or EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key_.get()) != 1) {
    throw std::runtime_error("Failed to initialise Ed25519 signing");
  }

  std::array<std::uint8_t, signature_length> sig{};
  std::size_t sig_len = sig.size();
  if (EVP_DigestSign(ctx.get(),
        sig.data(),
        &sig_len,
        reinterpret_cast<const unsigned char *>(message.data()),// NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
        message.size())
      != 1) {
    throw std::runtime_error("Ed25519 signing failed");
  }

  return to_hex(std::span<const std::uint8_t>(sig.data(), sig_len));
}

auto ed25519_signer::verify(const std::string &identity, std::string_view message, std::string_view signature) const
  -> bool
{
  const auto public_raw = from_hex(identity);
  const auto sig_raw = from_hex(signature);
  if (not public_raw or public_raw->size() != key_length or not sig_raw or sig_raw->size() != signature_length) {
    spdlog::trace("[ed25519_signer] malformed identity or signature");
    return false;
  }

  const pkey_ptr peer_key{ EVP_PKEY_new_raw_public_key(
    EVP_PKEY_ED25519, nullptr, public_raw->data(), public_raw->size()) };
  if (not peer_key) { return false; }

  auto ctx = new_md_ctx();
  if (not ctx or EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, peer_key.get()) != 1) { return false; }

  return EVP_DigestVerify(ctx.get(),
           sig_raw->data(),
           sig_raw->size(),
           // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
           reinterpret_cast<const unsigned char *>(message.data()),
           message.size())
         == 1;
}

}// namespace locus::crypto
