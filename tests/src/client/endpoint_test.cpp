#include <gtest/gtest.h>
#include <sdc/client/endpoint.hpp>

using sdc::client::make_list_machines_url;
using sdc::client::url_encode;
using sdc::schema::list_machines_query_t;

TEST(endpoint, url_encode_leaves_unreserved_characters) {
  EXPECT_EQ(url_encode("abc-XYZ_0.9~"), "abc-XYZ_0.9~");
  EXPECT_EQ(url_encode("a b/c&d=e"), "a%20b%2Fc%26d%3De");
  EXPECT_EQ(url_encode("\xC3\xA9"), "%C3%A9");
}

TEST(endpoint, list_machines_url_without_filters) {
  EXPECT_EQ(make_list_machines_url("https://us-east-1.api.example.com/", "ops",
                                   list_machines_query_t{}),
            "https://us-east-1.api.example.com/ops/machines");
}

TEST(endpoint, empty_account_maps_to_my) {
  EXPECT_EQ(make_list_machines_url("http://127.0.0.1:8080", "",
                                   list_machines_query_t{}),
            "http://127.0.0.1:8080/my/machines");
}

TEST(endpoint, filters_become_sorted_query_parameters) {
  auto query = list_machines_query_t{
      .version = 1,
      .filters = {{"state", "running"}, {"name", "web 1"}, {"tag.role", "db"}}};
  EXPECT_EQ(make_list_machines_url("https://dc", "ops", query),
            "https://dc/ops/machines?name=web%201&state=running&tag.role=db");
}
