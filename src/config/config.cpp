#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <sdc/config/config.hpp>

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <set>

namespace {

std::optional<std::string> read_variable(const char* name) {
  const auto* value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return std::nullopt;
  }
  return std::string{value};
}

std::optional<sdc::config::profile_t> parse_profile(const nlohmann::json& j,
                                                    std::string& error) {
  if (!j.is_object()) {
    error = "profile entries must be objects";
    return std::nullopt;
  }
  auto profile = sdc::config::profile_t{};
  auto name = j.find("name");
  if (name == std::end(j) || !name->is_string() ||
      name->get<std::string>().empty()) {
    error = "profile entries need a non-empty 'name'";
    return std::nullopt;
  }
  profile.name = name->get<std::string>();

  for (const auto& [key, target] :
       {std::pair<const char*, std::string*>{"user", &profile.user},
        std::pair<const char*, std::string*>{"keyId", &profile.key_id}}) {
    auto it = j.find(key);
    if (it == std::end(j) || it->is_null()) {
      continue;
    }
    if (!it->is_string()) {
      error = "profile '" + profile.name + "': '" + key + "' must be a string";
      return std::nullopt;
    }
    *target = it->get<std::string>();
  }

  auto dcs = j.find("dcs");
  if (dcs != std::end(j) && !dcs->is_null()) {
    if (!dcs->is_array()) {
      error = "profile '" + profile.name + "': 'dcs' must be an array";
      return std::nullopt;
    }
    auto list = sdc::schema::datacenter_list_t{};
    for (const auto& dc : *dcs) {
      if (!dc.is_string()) {
        error = "profile '" + profile.name + "': 'dcs' must hold strings";
        return std::nullopt;
      }
      list.push_back(dc.get<std::string>());
    }
    profile.dcs = std::move(list);
  }
  return profile;
}

}  // namespace

namespace sdc::config {

environment_t read_environment() {
  return environment_t{.home = read_variable("HOME"),
                       .sdc_config = read_variable("SDC_CONFIG"),
                       .smrt_profile = read_variable("SMRT_PROFILE"),
                       .sdc_account = read_variable("SDC_ACCOUNT"),
                       .sdc_key_id = read_variable("SDC_KEY_ID")};
}

std::filesystem::path default_config_path(const environment_t& environment) {
  if (environment.sdc_config) {
    return *environment.sdc_config;
  }
  auto home = std::filesystem::path{environment.home.value_or(".")};
  return home / ".sdc" / "config.json";
}

std::optional<config_t> parse_config(const std::string_view text,
                                     std::string& error) {
  auto document = nlohmann::json::parse(text, nullptr, false);
  if (document.is_discarded()) {
    error = "config is not valid JSON";
    return std::nullopt;
  }
  if (!document.is_object()) {
    error = "config must be a JSON object";
    return std::nullopt;
  }

  auto config = config_t{};
  auto dcs = document.find("dcs");
  if (dcs != std::end(document)) {
    if (!dcs->is_object()) {
      error = "'dcs' must map datacenter names to URLs";
      return std::nullopt;
    }
    for (const auto& [name, url] : dcs->items()) {
      if (!url.is_string() || url.get<std::string>().empty()) {
        error = "datacenter '" + name + "' needs a URL string";
        return std::nullopt;
      }
      config.datacenters.emplace(name, url.get<std::string>());
    }
  }

  auto profiles = document.find("profiles");
  if (profiles != std::end(document)) {
    if (!profiles->is_array()) {
      error = "'profiles' must be an array";
      return std::nullopt;
    }
    auto names = std::set<std::string>{};
    for (const auto& entry : *profiles) {
      auto profile = parse_profile(entry, error);
      if (!profile) {
        return std::nullopt;
      }
      if (!names.insert(profile->name).second) {
        error = "duplicate profile '" + profile->name + "'";
        return std::nullopt;
      }
      for (const auto& dc : profile->dcs.value_or(schema::datacenter_list_t{})) {
        if (!config.datacenters.contains(dc)) {
          error = "profile '" + profile->name +
                  "' references unknown datacenter '" + dc + "'";
          return std::nullopt;
        }
      }
      config.profiles.push_back(std::move(*profile));
    }
  }

  auto default_profile = document.find("profile");
  if (default_profile != std::end(document) && !default_profile->is_null()) {
    if (!default_profile->is_string()) {
      error = "'profile' must be a string";
      return std::nullopt;
    }
    config.default_profile = default_profile->get<std::string>();
  }
  return config;
}

std::optional<config_t> load_config(const std::filesystem::path& path,
                                    std::string& error) {
  auto input = std::ifstream{path};
  if (!input.good()) {
    error = "cannot read config file '" + path.string() + "'";
    return std::nullopt;
  }
  auto text = std::string{std::istreambuf_iterator<char>{input},
                          std::istreambuf_iterator<char>{}};
  auto config = parse_config(text, error);
  if (!config) {
    error = path.string() + ": " + error;
    return std::nullopt;
  }
  spdlog::debug("loaded {} datacenter(s) and {} profile(s) from {}",
                config->datacenters.size(), config->profiles.size(),
                path.string());
  return config;
}

void add_environment_profile(config_t& config,
                             const environment_t& environment) {
  if (!environment.sdc_account) {
    return;
  }
  auto exists = std::ranges::any_of(config.profiles, [](const auto& profile) {
    return profile.name == kEnvironmentProfileName;
  });
  if (exists) {
    return;
  }
  config.profiles.push_back(
      profile_t{.name = std::string{kEnvironmentProfileName},
                .user = *environment.sdc_account,
                .key_id = environment.sdc_key_id.value_or(""),
                .dcs = std::nullopt});
}

std::optional<profile_t> select_profile(
    const config_t& config,
    const std::optional<std::string>& requested,
    std::string& error) {
  auto find = [&](const std::string& name) -> std::optional<profile_t> {
    auto it = std::ranges::find(config.profiles, name, &profile_t::name);
    if (it == std::end(config.profiles)) {
      return std::nullopt;
    }
    return *it;
  };

  if (requested) {
    auto profile = find(*requested);
    if (!profile) {
      error = "unknown profile '" + *requested + "'";
    }
    return profile;
  }
  if (!config.default_profile.empty()) {
    auto profile = find(config.default_profile);
    if (!profile) {
      error = "default profile '" + config.default_profile +
              "' is not configured";
    }
    return profile;
  }
  if (config.profiles.empty()) {
    error = "no profiles configured";
    return std::nullopt;
  }
  return config.profiles.front();
}

std::set<schema::datacenter_id_t> profile_datacenters(
    const config_t& config,
    const profile_t& profile) {
  auto dcs = std::set<schema::datacenter_id_t>{};
  if (profile.dcs) {
    dcs.insert(std::begin(*profile.dcs), std::end(*profile.dcs));
    return dcs;
  }
  for (const auto& [name, url] : config.datacenters) {
    dcs.insert(name);
  }
  return dcs;
}

}  // namespace sdc::config
