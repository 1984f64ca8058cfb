#include <gtest/gtest.h>
#include <sdc/schema/machine_query.hpp>

#include <string>
#include <vector>

using namespace sdc::schema;

TEST(machine_query, parse_filters_builds_query) {
  auto query = parse_filters({"name=web", "state=running", "tag.role=db"});
  EXPECT_EQ(query.version, 1u);
  ASSERT_EQ(query.filters.size(), 3u);
  EXPECT_EQ(query.filters.at("name"), "web");
  EXPECT_EQ(query.filters.at("state"), "running");
  EXPECT_EQ(query.filters.at("tag.role"), "db");
}

TEST(machine_query, parse_filters_keeps_equals_in_value) {
  auto query = parse_filters({"tag.expr=a=b"});
  EXPECT_EQ(query.filters.at("tag.expr"), "a=b");
}

TEST(machine_query, empty_filter_list_is_valid) {
  auto query = parse_filters({});
  EXPECT_TRUE(query.filters.empty());
  EXPECT_FALSE(validate_query(query).has_value());
}

TEST(machine_query, parse_filters_rejects_malformed_arguments) {
  for (const auto& arg : std::vector<std::string>{"name", "=web", "bogus=1",
                                                  "memory=lots", "name=",
                                                  "credentials=yes", "tag.=x"}) {
    try {
      parse_filters({arg});
      ADD_FAILURE() << "expected rejection of " << arg;
    } catch (const precondition_error& ex) {
      EXPECT_EQ(ex.code(), query_error_code::invalid_query) << arg;
    }
  }
}

TEST(machine_query, parse_filters_rejects_duplicate_keys) {
  EXPECT_THROW(parse_filters({"name=a", "name=b"}), precondition_error);
}

TEST(machine_query, validate_query_rejects_unknown_version) {
  auto query = list_machines_query_t{.version = 2, .filters = {}};
  auto reason = validate_query(query);
  ASSERT_TRUE(reason.has_value());
  EXPECT_NE(reason->find("version"), std::string::npos);
}

TEST(machine_query, known_filters) {
  EXPECT_TRUE(is_known_filter("memory"));
  EXPECT_TRUE(is_known_filter("tag.owner"));
  EXPECT_FALSE(is_known_filter("tag."));
  EXPECT_FALSE(is_known_filter("owner"));
}
