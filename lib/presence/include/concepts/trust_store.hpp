#pragma once

#include <presence/types.hpp>

#include <concepts>
#include <optional>
#include <string>

namespace locus::concepts {

/**
 * @brief Concept for the local identity → trust tier mapping.
 *
 * Local only and synchronous. An identity with no entry is unknown and must be
 * treated as `public` by callers.
 */
template<typename T>
concept trust_store = requires(T &store, const T &const_store, const std::string &identity, presence::trust_tier tier) {
  { const_store.get_trust_level(identity) } -> std::convertible_to<std::optional<presence::trust_tier>>;
  { store.set_trust_level(identity, tier) } -> std::same_as<void>;
  { store.remove_trust_level(identity) } -> std::same_as<bool>;
};

}// namespace locus::concepts
