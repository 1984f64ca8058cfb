#pragma once

#include <sdc/fanout/aggregator.hpp>
#include <sdc/schema/aggregate_result.hpp>
#include <sdc/schema/dc_error.hpp>
#include <sdc/schema/event.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace sdc::fanout {

/// Composite of two or more datacenter failures; every constituent keeps its
/// datacenter tag and cause.
struct aggregate_multi_error_t final {
  std::vector<sdc::schema::dc_error_t> errors;
};

using report_error_t =
    std::variant<sdc::schema::dc_error_t, aggregate_multi_error_t>;

struct collection_policy final {
  /// Surface a lone failure even when other datacenters succeeded.
  bool single_failure_is_fatal{true};
};

/// Fold one event into `result`. Returns true for done_t.
bool accumulate(sdc::schema::aggregate_result_t& result,
                sdc::schema::event_t event);

/// Consume `run` until done_t and return everything it produced.
sdc::schema::aggregate_result_t collect(run_handle& run);

/// Decide which error, if any, the run reports as a whole.
///
/// Records of succeeding datacenters are never affected by this decision.
std::optional<report_error_t> finalize(
    const sdc::schema::aggregate_result_t& result,
    std::size_t dcs_queried,
    const collection_policy& policy = {});

std::string describe(const sdc::schema::dc_error_t& error);
std::string describe(const aggregate_multi_error_t& error);
std::string describe(const report_error_t& error);

}  // namespace sdc::fanout
