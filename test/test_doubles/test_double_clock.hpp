#pragma once

#include <concepts/clock.hpp>

#include <cstdint>

namespace locus::test {

class test_double_clock
{
public:
  explicit test_double_clock(std::uint64_t start_ms = 1'700'000'000'000) : now_(start_ms) {}

  [[nodiscard]] auto now_ms() const -> std::uint64_t { return now_; }

  auto set(std::uint64_t now_ms) -> void { now_ = now_ms; }
  auto advance(std::uint64_t delta_ms) -> void { now_ += delta_ms; }

private:
  std::uint64_t now_;
};

static_assert(locus::concepts::clock<test_double_clock>);

}// namespace locus::test
