#include <crypto/ed25519_signer.hpp>
#include <geolocation/replay_source.hpp>
#include <platform/time_utils.hpp>
#include <presence/presence_manager.hpp>
#include <presence/trust_circle_store.hpp>

#include <boost/asio/io_context.hpp>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

namespace {

using manager_t = locus::presence::presence_manager<locus::geolocation::replay_source,
  locus::crypto::ed25519_signer,
  locus::presence::trust_circle_store,
  locus::platform::system_clock>;

}// namespace

// Fuzzer that pushes arbitrary inbound bytes through the presence manager
// cppcheck-suppress unusedFunction symbolName=LLVMFuzzerTestOneInput
// NOLINTNEXTLINE(readability-identifier-naming)
extern "C" auto LLVMFuzzerTestOneInput(const uint8_t *Data, size_t Size) -> int
{
  static const auto signer = std::make_shared<locus::crypto::ed25519_signer>(locus::crypto::ed25519_signer::generate());

  auto io_context = std::make_shared<boost::asio::io_context>();
  auto manager = std::make_shared<manager_t>(io_context,
    std::make_shared<locus::geolocation::replay_source>(io_context, std::vector<locus::core::position_sample>{}),
    signer,
    std::make_shared<locus::presence::trust_circle_store>(),
    std::make_shared<locus::platform::system_clock>(),
    locus::presence::presence_config{},
    locus::presence::device_type::unknown);

  manager->start([](std::vector<std::byte> /*bytes*/) {});

  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  manager->handle_bytes(std::span<const std::byte>(reinterpret_cast<const std::byte *>(Data), Size));

  manager->stop();
  return 0;
}
