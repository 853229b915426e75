#pragma once

#include <presence/types.hpp>

#include <cstddef>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace locus::presence {

/**
 * @brief In-memory trust circle: which tier each known contact sits in.
 */
class trust_circle_store
{
public:
  [[nodiscard]] auto get_trust_level(const std::string &identity) const -> std::optional<trust_tier>;
  auto set_trust_level(const std::string &identity, trust_tier tier) -> void;

  /**
   * @brief Forgets a contact.
   *
   * @return true if an entry was removed
   */
  auto remove_trust_level(const std::string &identity) -> bool;

  /// Contacts whose tier is `minimum` or more trusted, in identity order
  [[nodiscard]] auto contacts_at_or_above(trust_tier minimum) const -> std::vector<std::string>;

  [[nodiscard]] auto size() const -> std::size_t { return contacts_.size(); }

  /**
   * @brief Exports the circle as `{"contacts": {"<identity>": "<tier>", ...}}`.
   */
  [[nodiscard]] auto to_json() const -> nlohmann::json;

  /**
   * @brief Imports an exported circle.
   *
   * @return std::nullopt if the document is not shaped like to_json() output
   *         or names an unknown tier
   */
  [[nodiscard]] static auto from_json(const nlohmann::json &document) -> std::optional<trust_circle_store>;

private:
  std::map<std::string, trust_tier> contacts_;
};

/// Human-readable summary of what a tier discloses
[[nodiscard]] auto describe(trust_tier tier) -> std::string_view;

}// namespace locus::presence
