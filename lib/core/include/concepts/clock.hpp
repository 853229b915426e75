#pragma once

#include <concepts>
#include <cstdint>

namespace locus::concepts {

/// Wall clock in Unix milliseconds; injectable so TTL and throttle logic can be tested
template<typename T>
concept clock = requires(const T &source) {
  { source.now_ms() } -> std::convertible_to<std::uint64_t>;
};

}// namespace locus::concepts
