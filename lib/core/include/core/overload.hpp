#pragma once

namespace locus::core {

/**
 * @brief Helper for std::visit with overload pattern.
 *
 * Lets a broadcast payload variant be matched exhaustively, one lambda per alternative:
 * @code
 * std::visit(overload{
 *   [](const location_payload &payload) { ... },
 *   [](const leave_payload &) { ... }
 * }, broadcast.payload);
 * @endcode
 */
template<class... Ts> struct overload : Ts...
{
  using Ts::operator()...;
};

template<class... Ts> overload(Ts...) -> overload<Ts...>;

}// namespace locus::core
