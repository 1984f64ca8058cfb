#include <boost/program_options.hpp>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <sdc/cli/commands.hpp>
#include <sdc/cli/logging.hpp>
#include <sdc/cli/table.hpp>
#include <sdc/client/cloudapi_client.hpp>
#include <sdc/fanout/collector.hpp>
#include <sdc/schema/encoding/json/encoder.hpp>
#include <sdc/schema/machine_query.hpp>

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <set>
#include <string>
#include <utility>

namespace po = boost::program_options;
using namespace sdc::schema;

namespace {

using encoder_t =
    sdc::schema::encoding::encoder<sdc::schema::encoding::json_encoder_tag>;

const auto kMachineFields = std::set<std::string>{
    "dc",     "id",      "name",    "type",    "state",
    "image",  "package", "memory",  "disk",    "created",
    "updated", "compute_node", "primaryIp"};

std::string join(const datacenter_list_t& values) {
  auto out = std::string{};
  for (const auto& value : values) {
    if (!out.empty()) {
      out += ',';
    }
    out += value;
  }
  return out;
}

sdc::cli::row_t make_machine_row(const machine_record_t& record) {
  const auto& machine = record.machine;
  return sdc::cli::row_t{{"dc", record.dc},
                         {"id", machine.id},
                         {"name", machine.name},
                         {"type", machine.type},
                         {"state", machine.state},
                         {"image", machine.image},
                         {"package", machine.package},
                         {"memory", std::to_string(machine.memory)},
                         {"disk", std::to_string(machine.disk)},
                         {"created", machine.created},
                         {"updated", machine.updated},
                         {"compute_node", machine.compute_node},
                         {"primaryIp", machine.primary_ip}};
}

void print_usage(std::ostream& out, const po::options_description& options) {
  out << "Usage:\n"
      << "  sdc [options] profile [--json]\n"
      << "  sdc [options] dcs [--json]\n"
      << "  sdc [options] machines [<key>=<value>...] [--json] "
         "[-o COLUMNS] [-s SORT]\n\n";
  out << options << '\n';
}

po::options_description make_listing_options() {
  auto options = po::options_description{"listing options"};
  options.add_options()("json,j", "JSON output");
  return options;
}

po::options_description make_machines_options(
    sdc::cli::machines_options& values) {
  auto options = po::options_description{"machines options"};
  options.add_options()("json,j", "JSON output")(
      "output,o", po::value<std::string>(&values.columns)
                      ->default_value(values.columns),
      "comma separated columns to print")(
      "sort,s", po::value<std::string>(&values.sort)->default_value(values.sort),
      "comma separated sort fields")(
      "filter", po::value<std::vector<std::string>>(&values.filters),
      "key=value machine filters");
  return options;
}

}  // namespace

namespace sdc::cli {

int run_profile(const command_context& context, const bool json) {
  if (json) {
    auto document = nlohmann::json::array();
    for (const auto& profile : context.config.profiles) {
      document.push_back(nlohmann::json{
          {"curr", profile.name == context.profile.name ? "*" : " "},
          {"name", profile.name},
          {"dcs", profile.dcs ? join(*profile.dcs) : std::string{"all"}},
          {"user", profile.user},
          {"keyId", profile.key_id}});
    }
    context.out << document.dump(4) << '\n';
    return kExitSuccess;
  }

  auto rows = std::vector<row_t>{};
  for (const auto& profile : context.config.profiles) {
    rows.push_back(
        row_t{{"curr", profile.name == context.profile.name ? "*" : " "},
              {"name", profile.name},
              {"dcs", profile.dcs ? join(*profile.dcs) : std::string{"all"}},
              {"user", profile.user},
              {"keyId", profile.key_id}});
  }
  render_table(context.out, std::move(rows),
               {"curr", "name", "dcs", "user", "keyId"}, {"name", "user"});
  return kExitSuccess;
}

int run_dcs(const command_context& context, const bool json) {
  if (json) {
    auto document = nlohmann::json::array();
    for (const auto& [name, url] : context.config.datacenters) {
      document.push_back(nlohmann::json{{"name", name}, {"url", url}});
    }
    context.out << document.dump(4) << '\n';
    return kExitSuccess;
  }

  auto rows = std::vector<row_t>{};
  for (const auto& [name, url] : context.config.datacenters) {
    rows.push_back(row_t{{"name", name}, {"url", url}});
  }
  render_table(context.out, std::move(rows), {"name", "url"}, {"name"});
  return kExitSuccess;
}

int run_machines(const command_context& context,
                 const machines_options& options,
                 const sdc::client::datacenter_call_t& call,
                 const sdc::fanout::run_options& run_options) {
  auto columns = split_fields(options.columns);
  auto sort = split_fields(options.sort);
  for (const auto* fields : {&columns, &sort}) {
    if (auto reason = check_fields(*fields, kMachineFields)) {
      context.err << "sdc machines: " << *reason << '\n';
      return kExitUsage;
    }
  }

  auto query = list_machines_query_t{};
  try {
    query = parse_filters(options.filters);
  } catch (const precondition_error& ex) {
    context.err << "sdc machines: " << ex.what() << '\n';
    return kExitUsage;
  }

  auto dcs = sdc::config::profile_datacenters(context.config, context.profile);
  if (dcs.empty()) {
    auto error = precondition_error(
        query_error_code::empty_dc_set,
        "profile '" + context.profile.name + "' has no datacenters");
    context.err << "sdc machines: " << error.what() << '\n';
    return kExitFailure;
  }

  auto aggregator = sdc::fanout::aggregator{call};
  auto run = aggregator.start(dcs, query, run_options);
  auto result = sdc::fanout::collect(*run);
  spdlog::info("{} machine(s) from {} datacenter(s), {} failure(s)",
               result.records.size(), result.succeeded.size(),
               result.errors.size());

  if (options.json) {
    context.out << encoder_t{}.encode(result.records) << '\n';
  } else {
    auto rows = std::vector<row_t>{};
    rows.reserve(result.records.size());
    for (const auto& record : result.records) {
      rows.push_back(make_machine_row(record));
    }
    render_table(context.out, std::move(rows), columns, sort);
  }

  auto error = sdc::fanout::finalize(result, dcs.size());
  if (error) {
    context.err << "sdc machines: " << sdc::fanout::describe(*error) << '\n';
    return kExitFailure;
  }
  return kExitSuccess;
}

int dispatch(const int argc,
             const char** argv,
             std::ostream& out,
             std::ostream& err) {
  auto global = global_options{};
  auto command = std::string{};
  auto timeout_ms = uint64_t{};
  auto options = po::options_description{"sdc options"};
  options.add_options()("help,h", "Print help and exit.")(
      "version", "Print version and exit.")("verbose,v",
                                            "Verbose/debug output.")(
      "profile,p", po::value<std::string>(),
      "Profile to use (env SMRT_PROFILE).")(
      "config", po::value<std::string>(),
      "Config file (env SDC_CONFIG, default ~/.sdc/config.json).")(
      "timeout", po::value<uint64_t>(&timeout_ms)->default_value(30000),
      "Per-datacenter request timeout in ms.")(
      "deadline", po::value<uint64_t>(),
      "Deadline in ms for the whole fan-out.")(
      "log-file", po::value<std::string>(), "Also write logs to this file.");

  auto hidden = po::options_description{};
  hidden.add_options()("command", po::value<std::string>(&command),
                       "subcommand")(
      "subargs", po::value<std::vector<std::string>>(), "subcommand arguments");
  auto all = po::options_description{};
  all.add(options).add(hidden);

  auto positional = po::positional_options_description{};
  positional.add("command", 1).add("subargs", -1);

  auto vm = po::variables_map{};
  auto subargs = std::vector<std::string>{};
  try {
    auto parsed = po::command_line_parser(argc, argv)
                      .options(all)
                      .positional(positional)
                      .allow_unregistered()
                      .run();
    po::store(parsed, vm);
    po::notify(vm);
    subargs = po::collect_unrecognized(parsed.options, po::include_positional);
    auto it = std::find(std::begin(subargs), std::end(subargs), command);
    if (it != std::end(subargs)) {
      subargs.erase(it);
    }
  } catch (const po::error& ex) {
    err << "sdc: " << ex.what() << '\n';
    return kExitUsage;
  }

  if (vm.contains("version")) {
    out << "sdc " << kVersion << '\n';
    return kExitSuccess;
  }
  if (command.empty()) {
    print_usage(out, options);
    return kExitSuccess;
  }

  global.verbose = vm.contains("verbose");
  global.timeout = std::chrono::milliseconds{timeout_ms};
  if (vm.contains("profile")) {
    global.profile = vm["profile"].as<std::string>();
  }
  if (vm.contains("config")) {
    global.config_path = vm["config"].as<std::string>();
  }
  if (vm.contains("deadline")) {
    global.deadline = std::chrono::milliseconds{vm["deadline"].as<uint64_t>()};
  }
  if (vm.contains("log-file")) {
    global.log_file = vm["log-file"].as<std::string>();
  }

  auto machines = machines_options{};
  auto sub_options = command == "machines" ? make_machines_options(machines)
                                           : make_listing_options();
  if (command != "machines" && command != "profile" && command != "dcs") {
    err << "sdc: unknown command '" << command << "'\n";
    print_usage(err, options);
    return kExitUsage;
  }
  if (vm.contains("help")) {
    print_usage(out, options);
    out << sub_options << '\n';
    return kExitSuccess;
  }

  auto sub_vm = po::variables_map{};
  try {
    auto sub_positional = po::positional_options_description{};
    if (command == "machines") {
      sub_positional.add("filter", -1);
    }
    po::store(po::command_line_parser(subargs)
                  .options(sub_options)
                  .positional(sub_positional)
                  .run(),
              sub_vm);
    po::notify(sub_vm);
  } catch (const po::error& ex) {
    err << "sdc " << command << ": " << ex.what() << '\n';
    return kExitUsage;
  }
  auto json = sub_vm.contains("json");
  machines.json = json;

  try {
    configure_logging(global.verbose, global.log_file);
  } catch (const std::exception& ex) {
    err << "sdc: cannot set up logging: " << ex.what() << '\n';
    return kExitFailure;
  }

  auto environment = sdc::config::read_environment();
  auto path = global.config_path.value_or(
      sdc::config::default_config_path(environment));
  auto error = std::string{};
  auto config = sdc::config::load_config(path, error);
  if (!config) {
    err << "sdc: " << error << '\n';
    return kExitFailure;
  }
  sdc::config::add_environment_profile(*config, environment);

  auto requested = global.profile ? global.profile : environment.smrt_profile;
  auto profile = sdc::config::select_profile(*config, requested, error);
  if (!profile) {
    err << "sdc: " << error << '\n';
    return kExitFailure;
  }
  spdlog::debug("using profile '{}' (user '{}')", profile->name,
                profile->user);

  auto context = command_context{.config = std::move(*config),
                                 .profile = std::move(*profile),
                                 .out = out,
                                 .err = err};
  if (command == "profile") {
    return run_profile(context, json);
  }
  if (command == "dcs") {
    return run_dcs(context, json);
  }

  auto client = sdc::client::cloudapi_client{
      context.config.datacenters,
      sdc::client::cloudapi_options{.account = context.profile.user,
                                    .timeout = global.timeout}};
  return run_machines(context, machines, client.as_call(),
                      sdc::fanout::run_options{.deadline = global.deadline});
}

}  // namespace sdc::cli
