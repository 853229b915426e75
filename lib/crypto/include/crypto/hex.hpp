#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace locus::crypto {

[[nodiscard]] auto to_hex(std::span<const std::uint8_t> bytes) -> std::string;

/// Parses lowercase or uppercase hex; std::nullopt on odd length or bad digits
[[nodiscard]] auto from_hex(std::string_view hex) -> std::optional<std::vector<std::uint8_t>>;

}// namespace locus::crypto
