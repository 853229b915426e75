#include <crypto/hex.hpp>

#include <fmt/format.h>

namespace locus::crypto {

namespace {
  auto nibble(char digit) -> std::optional<std::uint8_t>
  {
    constexpr std::uint8_t decimal_offset = 10;
    if (digit >= '0' and digit <= '9') { return static_cast<std::uint8_t>(digit - '0'); }
    if (digit >= 'a' and digit <= 'f') { return static_cast<std::uint8_t>(digit - 'a' + decimal_offset); }
    if (digit >= 'A' and digit <= 'F') { return static_cast<std::uint8_t>(digit - 'A' + decimal_offset); }
    return std::nullopt;
  }
}// namespace

auto to_hex(std::span<const std::uint8_t> bytes) -> std::string
{
  std::string out;
  out.reserve(bytes.size() * 2);
  for (const auto byte : bytes) { fmt::format_to(std::back_inserter(out), "{:02x}", byte); }
  return out;
}

auto from_hex(std::string_view hex) -> std::optional<std::vector<std::uint8_t>>
{
  if (hex.size() % 2 != 0) { return std::nullopt; }

  std::vector<std::uint8_t> bytes;
  bytes.reserve(hex.size() / 2);
  for (std::size_t i = 0; i < hex.size(); i += 2) {
    const auto high = nibble(hex[i]);
    const auto low = nibble(hex[i + 1]);
    if (not high or not low) { return std::nullopt; }
    constexpr int nibble_bits = 4;
    bytes.push_back(static_cast<std::uint8_t>((*high << nibble_bits) | *low));
  }
  return bytes;
}

}// namespace locus::crypto
