#include <presence/protocol.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <tuple>

// Fuzzer that feeds arbitrary bytes to the envelope parser
// cppcheck-suppress unusedFunction symbolName=LLVMFuzzerTestOneInput
// NOLINTNEXTLINE(readability-identifier-naming)
extern "C" auto LLVMFuzzerTestOneInput(const uint8_t *Data, size_t Size) -> int
{
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  const std::span<const std::byte> input(reinterpret_cast<const std::byte *>(Data), Size);

  auto parsed = locus::presence::protocol::presence_broadcast::deserialize(input);
  if (parsed) {
    std::ignore = parsed->signing_bytes();
    std::ignore = parsed->serialize();
  }

  return 0;
}
