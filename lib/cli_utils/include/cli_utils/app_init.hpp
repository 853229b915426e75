#pragma once

#include "internal_use_only/config.hpp"
#include <cli_utils/cli_parser.hpp>
#include <crypto/ed25519_signer.hpp>

#include <filesystem>
#include <fmt/core.h>
#include <fstream>
#include <stdexcept>
#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>
#include <string>

namespace locus::cli_utils {

struct app_state
{
  std::string identity;
  std::string display_name;
  std::string key_path;
  std::string transport;
};

inline auto configure_logging(const cli_args &args) -> void
{
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
  spdlog::cfg::load_env_levels();
  if (args.verbose) { spdlog::set_level(spdlog::level::debug); }
}

inline auto print_app_banner(const app_state &state) -> void
{
  fmt::print("Locus v{} - presence simulation\n", cmake::project_version);
  fmt::print("Identity: {} ({})\n", state.identity, state.key_path);
  fmt::print("Name: {}\n", state.display_name);
  fmt::print("transport: {}\n\n", state.transport);
}

/**
 * @brief Loads the identity key, creating and persisting a fresh one if absent.
 *
 * @throws std::runtime_error if the file exists but holds no valid key, or a
 *         new key cannot be written
 */
inline auto load_or_create_signer(const std::string &key_path) -> crypto::ed25519_signer
{
  const std::filesystem::path path{ key_path };

  if (std::filesystem::exists(path)) {
    std::ifstream file(path);
    std::string hex;
    file >> hex;
    spdlog::debug("[app_init] loaded identity key from {}", key_path);
    return crypto::ed25519_signer{ hex };
  }

  auto signer = crypto::ed25519_signer::generate();
  if (path.has_parent_path()) { std::filesystem::create_directories(path.parent_path()); }

  std::ofstream file(path);
  if (not file) { throw std::runtime_error(fmt::format("Cannot write identity key to {}", key_path)); }
  file << signer.private_key_hex() << '\n';
  std::filesystem::permissions(path, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write);

  spdlog::info("[app_init] created new identity key at {}", key_path);
  return signer;
}

}// namespace locus::cli_utils
