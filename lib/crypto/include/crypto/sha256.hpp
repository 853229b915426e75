#pragma once

#include <string>
#include <string_view>

namespace locus::crypto {

/**
 * @brief SHA-256 of `data`, lowercase hex encoded (64 characters).
 *
 * @throws std::runtime_error if the OpenSSL digest context cannot be created
 */
[[nodiscard]] auto sha256_hex(std::string_view data) -> std::string;

}// namespace locus::crypto
