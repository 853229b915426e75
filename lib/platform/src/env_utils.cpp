#include <platform/env_utils.hpp>

#include <cstdlib>
#include <mutex>

namespace locus::platform {

namespace {

  constexpr auto data_directory_name = ".locus";
  constexpr auto key_file_name = "identity.key";
  constexpr auto config_file_name = "presence.json";

}// namespace

auto get_home_directory() -> std::string
{
  // getenv is not safe against a concurrent setenv
  static std::mutex env_mutex;
  const std::scoped_lock lock(env_mutex);

  const char *home = std::getenv("HOME");// NOLINT(concurrency-mt-unsafe)
  if (home == nullptr) { return {}; }
  return home;
}

auto expand_tilde_path(const std::string &path) -> std::string
{
  if (not path.starts_with("~/")) { return path; }

  const auto home = get_home_directory();
  return home.empty() ? path : home + path.substr(1);
}

auto data_directory() -> std::filesystem::path
{
  const auto home = get_home_directory();
  if (home.empty()) { return std::filesystem::path{ data_directory_name }; }
  return std::filesystem::path{ home } / data_directory_name;
}

auto default_key_path() -> std::filesystem::path { return data_directory() / key_file_name; }

auto default_config_path() -> std::filesystem::path { return data_directory() / config_file_name; }

}// namespace locus::platform
