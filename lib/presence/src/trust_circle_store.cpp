#include <presence/trust_circle_store.hpp>

#include <spdlog/spdlog.h>

namespace locus::presence {

auto trust_circle_store::get_trust_level(const std::string &identity) const -> std::optional<trust_tier>
{
  if (const auto entry = contacts_.find(identity); entry != contacts_.end()) { return entry->second; }
  return std::nullopt;
}

auto trust_circle_store::set_trust_level(const std::string &identity, trust_tier tier) -> void
{
  contacts_.insert_or_assign(identity, tier);
  spdlog::debug("[trust_circle_store] {} -> {}", identity, to_string(tier));
}

auto trust_circle_store::remove_trust_level(const std::string &identity) -> bool
{
  return contacts_.erase(identity) > 0;
}

auto trust_circle_store::contacts_at_or_above(trust_tier minimum) const -> std::vector<std::string>
{
  std::vector<std::string> result;
  for (const auto &[identity, tier] : contacts_) {
    if (tier >= minimum) { result.push_back(identity); }
  }
  return result;
}

auto trust_circle_store::to_json() const -> nlohmann::json
{
  nlohmann::json contacts = nlohmann::json::object();
  for (const auto &[identity, tier] : contacts_) { contacts[identity] = std::string{ to_string(tier) }; }
  return { { "contacts", contacts } };
}

auto trust_circle_store::from_json(const nlohmann::json &document) -> std::optional<trust_circle_store>
{
  if (not document.is_object() or not document.contains("contacts") or not document["contacts"].is_object()) {
    return std::nullopt;
  }

  trust_circle_store store;
  for (const auto &[identity, value] : document["contacts"].items()) {
    if (not value.is_string()) { return std::nullopt; }
    const auto tier = trust_tier_from_string(value.get<std::string>());
    if (not tier) {
      spdlog::warn("[trust_circle_store] unknown tier for {}", identity);
      return std::nullopt;
    }
    store.contacts_.emplace(identity, *tier);
  }
  return store;
}

auto describe(trust_tier tier) -> std::string_view
{
  switch (tier) {
  case trust_tier::intimate:
    return "Exact location (~2.4 m) - partners, family";
  case trust_tier::close:
    return "Block level (~76 m) - close friends";
  case trust_tier::friends:
    return "Neighborhood (~2.4 km) - regular friends";
  case trust_tier::network:
    return "Metro area (~20 km) - acquaintances";
  case trust_tier::public_:
    break;
  }
  return "Large region (~630 km) - public visibility";
}

}// namespace locus::presence
