#pragma once

#include <filesystem>
#include <string>

namespace locus::platform {

/**
 * @brief The user's home directory from the environment.
 *
 * @return Home directory path, empty if HOME is unset
 */
[[nodiscard]] auto get_home_directory() -> std::string;

/**
 * @brief Expands a leading `~/` to the home directory.
 *
 * @param path Path possibly starting with ~/
 * @return Expanded path, or the input unchanged when there is no home directory
 */
[[nodiscard]] auto expand_tilde_path(const std::string &path) -> std::string;

/// Per-user locus directory holding the identity key and presence config (`~/.locus`)
[[nodiscard]] auto data_directory() -> std::filesystem::path;

/// `~/.locus/identity.key`
[[nodiscard]] auto default_key_path() -> std::filesystem::path;

/// `~/.locus/presence.json`
[[nodiscard]] auto default_config_path() -> std::filesystem::path;

}// namespace locus::platform
