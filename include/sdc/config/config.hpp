#pragma once

#include <sdc/schema/primitives.hpp>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace sdc::config {

inline constexpr auto kEnvironmentProfileName = std::string_view{"env"};

struct profile_t final {
  std::string name;
  std::string user;
  std::string key_id;
  /// std::nullopt selects every configured datacenter.
  std::optional<sdc::schema::datacenter_list_t> dcs;
};

struct config_t final {
  sdc::schema::datacenter_directory_t datacenters;
  std::vector<profile_t> profiles;
  std::string default_profile;
};

/// Process environment consulted by the CLI.
struct environment_t final {
  std::optional<std::string> home;
  std::optional<std::string> sdc_config;
  std::optional<std::string> smrt_profile;
  std::optional<std::string> sdc_account;
  std::optional<std::string> sdc_key_id;
};

environment_t read_environment();

/// `SDC_CONFIG` when set, `$HOME/.sdc/config.json` otherwise.
std::filesystem::path default_config_path(const environment_t& environment);

/// Parse and validate a JSON config document.
///
/// On failure, `error` contains a human-readable reason.
std::optional<config_t> parse_config(std::string_view text,
                                     std::string& error);

/// Read and parse the config file at `path`.
std::optional<config_t> load_config(const std::filesystem::path& path,
                                    std::string& error);

/// Add the implicit `env` profile built from SDC_ACCOUNT / SDC_KEY_ID.
///
/// Nothing is added when SDC_ACCOUNT is unset or an `env` profile exists.
void add_environment_profile(config_t& config,
                             const environment_t& environment);

/// Resolve the active profile: `requested`, then the config default, then
/// the first profile.
std::optional<profile_t> select_profile(
    const config_t& config,
    const std::optional<std::string>& requested,
    std::string& error);

/// Datacenters a run with `profile` fans out to.
std::set<sdc::schema::datacenter_id_t> profile_datacenters(
    const config_t& config,
    const profile_t& profile);

}  // namespace sdc::config
