#pragma once

#include <sdc/client/datacenter_client.hpp>
#include <sdc/config/config.hpp>
#include <sdc/fanout/aggregator.hpp>
#include <chrono>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace sdc::cli {

inline constexpr auto kVersion = std::string_view{"0.1.0"};

inline constexpr auto kExitSuccess = 0;
inline constexpr auto kExitFailure = 1;
inline constexpr auto kExitUsage = 2;

/// Options shared by every subcommand.
struct global_options final {
  bool verbose{false};
  std::optional<std::string> profile;
  std::optional<std::filesystem::path> config_path;
  std::chrono::milliseconds timeout{30000};
  std::optional<std::chrono::milliseconds> deadline;
  std::optional<std::filesystem::path> log_file;
};

/// Resolved configuration a subcommand runs against.
struct command_context final {
  sdc::config::config_t config;
  sdc::config::profile_t profile;
  std::ostream& out;
  std::ostream& err;
};

struct machines_options final {
  std::vector<std::string> filters;
  bool json{false};
  std::string columns{"dc,id,name,state,created"};
  std::string sort{"created"};
};

/// `sdc profile`: list configured profiles, marking the active one.
int run_profile(const command_context& context, bool json);

/// `sdc dcs`: list the datacenter directory.
int run_dcs(const command_context& context, bool json);

/// `sdc machines`: list machines of every datacenter of the active profile.
///
/// Machines from succeeding datacenters are always printed; failures are
/// reported on `context.err` afterwards and decide the exit code.
int run_machines(const command_context& context,
                 const machines_options& options,
                 const sdc::client::datacenter_call_t& call,
                 const sdc::fanout::run_options& run_options);

/// Parse the command line, configure logging and run one subcommand.
///
/// Exit codes:
///   0 => success
///   1 => command failed (including datacenter failures)
///   2 => usage error
int dispatch(int argc, const char** argv, std::ostream& out, std::ostream& err);

}  // namespace sdc::cli
