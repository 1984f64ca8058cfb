#include <spdlog/spdlog.h>
#include <sdc/common/critical.hpp>
#include <sdc/fanout/collector.hpp>
#include <iterator>
#include <utility>

using namespace sdc::schema;

namespace sdc::fanout {

bool accumulate(aggregate_result_t& result, event_t event) {
  return std::visit(
      overloaded{[&](record_batch_t& batch) {
                   result.succeeded.push_back(batch.dc);
                   result.records.insert(
                       std::end(result.records),
                       std::make_move_iterator(std::begin(batch.records)),
                       std::make_move_iterator(std::end(batch.records)));
                   return false;
                 },
                 [&](failure_t& failure) {
                   result.errors.push_back(std::move(failure.error));
                   return false;
                 },
                 [](done_t&) { return true; }},
      event);
}

aggregate_result_t collect(run_handle& run) {
  auto result = aggregate_result_t{};
  while (!accumulate(result, run.next())) {
  }
  if (result.outcomes() != run.size()) {
    spdlog::error("fan-out produced {} outcome(s) for {} datacenter(s)",
                  result.outcomes(), run.size());
    sdc::common::critical("fan-out outcome count mismatch");
  }
  return result;
}

std::optional<report_error_t> finalize(const aggregate_result_t& result,
                                       const std::size_t dcs_queried,
                                       const collection_policy& policy) {
  if (result.errors.empty()) {
    return std::nullopt;
  }
  if (result.errors.size() == 1) {
    if (dcs_queried == 1 || policy.single_failure_is_fatal) {
      return report_error_t{result.errors.front()};
    }
    return std::nullopt;
  }
  return report_error_t{aggregate_multi_error_t{.errors = result.errors}};
}

std::string describe(const dc_error_t& error) {
  auto out = error.dc;
  out += ": ";
  out += to_string(error.kind);
  if (!error.message.empty()) {
    out += ": ";
    out += error.message;
  }
  return out;
}

std::string describe(const aggregate_multi_error_t& error) {
  auto out = "multiple errors from " + std::to_string(error.errors.size()) +
             " datacenters:";
  for (const auto& constituent : error.errors) {
    out += "\n    ";
    out += describe(constituent);
  }
  return out;
}

std::string describe(const report_error_t& error) {
  return std::visit([](const auto& value) { return describe(value); }, error);
}

}  // namespace sdc::fanout
