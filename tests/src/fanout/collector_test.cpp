#include <gtest/gtest.h>
#include <sdc/fanout/collector.hpp>

#include <string>

using namespace sdc::schema;
using sdc::fanout::aggregate_multi_error_t;
using sdc::fanout::collection_policy;
using sdc::fanout::describe;
using sdc::fanout::finalize;

namespace {

dc_error_t make_error(const std::string& dc, const dc_error_kind kind) {
  return dc_error_t{.dc = dc, .kind = kind, .message = "reason"};
}

}  // namespace

TEST(collector, accumulate_folds_events) {
  auto result = aggregate_result_t{};
  EXPECT_FALSE(sdc::fanout::accumulate(
      result, record_batch_t{
                  .dc = "a",
                  .records = {machine_record_t{.dc = "a",
                                               .machine = {.id = "m1"}}}}));
  EXPECT_FALSE(sdc::fanout::accumulate(
      result, failure_t{.error = make_error("b", dc_error_kind::timeout)}));
  EXPECT_TRUE(sdc::fanout::accumulate(result, done_t{}));
  EXPECT_EQ(result.records.size(), 1u);
  EXPECT_EQ(result.succeeded, (datacenter_list_t{"a"}));
  EXPECT_EQ(result.errors.size(), 1u);
  EXPECT_EQ(result.outcomes(), 2u);
}

TEST(collector, no_errors_reports_nothing) {
  auto result = aggregate_result_t{};
  result.succeeded = {"a", "b"};
  EXPECT_FALSE(finalize(result, 2).has_value());
}

TEST(collector, lone_failure_of_single_datacenter_is_reported) {
  auto result = aggregate_result_t{};
  result.errors = {make_error("a", dc_error_kind::unreachable)};
  auto lenient = collection_policy{.single_failure_is_fatal = false};
  auto error = finalize(result, 1, lenient);
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(std::get<dc_error_t>(*error).dc, "a");
}

TEST(collector, lone_failure_among_successes_follows_policy) {
  auto result = aggregate_result_t{};
  result.succeeded = {"a", "b"};
  result.errors = {make_error("c", dc_error_kind::server_error)};
  EXPECT_TRUE(finalize(result, 3).has_value());
  EXPECT_FALSE(
      finalize(result, 3, collection_policy{.single_failure_is_fatal = false})
          .has_value());
}

TEST(collector, several_failures_are_always_combined) {
  auto result = aggregate_result_t{};
  result.errors = {make_error("a", dc_error_kind::timeout),
                   make_error("b", dc_error_kind::auth_failure)};
  auto error =
      finalize(result, 5, collection_policy{.single_failure_is_fatal = false});
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(std::get<aggregate_multi_error_t>(*error).errors, result.errors);
}

TEST(collector, describe_names_datacenter_and_kind) {
  EXPECT_EQ(describe(make_error("us-east-1", dc_error_kind::timeout)),
            "us-east-1: timeout: reason");
  EXPECT_EQ(describe(dc_error_t{.dc = "x",
                                .kind = dc_error_kind::internal_fault,
                                .message = ""}),
            "x: internal_fault");

  auto multi = aggregate_multi_error_t{
      .errors = {make_error("a", dc_error_kind::timeout),
                 make_error("b", dc_error_kind::unreachable)}};
  EXPECT_EQ(describe(sdc::fanout::report_error_t{multi}),
            "multiple errors from 2 datacenters:\n"
            "    a: timeout: reason\n"
            "    b: unreachable: reason");
}
