#include <crypto/hex.hpp>
#include <crypto/sha256.hpp>

#include <array>
#include <memory>
#include <openssl/evp.h>
#include <stdexcept>

namespace locus::crypto {

auto sha256_hex(std::string_view data) -> std::string
{
  const std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (not ctx) { throw std::runtime_error("Failed to allocate digest context"); }

  std::array<std::uint8_t, EVP_MAX_MD_SIZE> digest{};
  unsigned int digest_len = 0;

  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1
      or EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1
      or EVP_DigestFinal_ex(ctx.get(), digest.data(), &digest_len) != 1) {
    throw std::runtime_error("SHA-256 digest failed");
  }

  return to_hex(std::span<const std::uint8_t>(digest.data(), digest_len));
}

}// namespace locus::crypto
