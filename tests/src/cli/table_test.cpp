#include <gtest/gtest.h>
#include <sdc/cli/table.hpp>

#include <algorithm>
#include <set>
#include <sstream>
#include <string>
#include <vector>

using namespace sdc::cli;

TEST(table, split_fields_drops_empty_entries) {
  EXPECT_EQ(split_fields("dc,,id,"), (std::vector<std::string>{"dc", "id"}));
  EXPECT_TRUE(split_fields("").empty());
}

TEST(table, check_fields_names_the_bad_field) {
  auto valid = std::set<std::string>{"dc", "id"};
  EXPECT_FALSE(check_fields({"id", "dc"}, valid).has_value());
  auto reason = check_fields({"id", "colour"}, valid);
  ASSERT_TRUE(reason.has_value());
  EXPECT_EQ(*reason, "invalid field 'colour' (valid fields: dc, id)");
}

TEST(table, renders_aligned_columns) {
  auto out = std::ostringstream{};
  render_table(out,
               {row_t{{"name", "web"}, {"memory", "1024"}},
                row_t{{"name", "database"}, {"memory", "512"}}},
               {"name", "memory"}, {"memory"});
  EXPECT_EQ(out.str(),
            "NAME      MEMORY\n"
            "database  512\n"
            "web       1024\n");
}

TEST(table, sort_is_stable_and_missing_cells_render_empty) {
  auto out = std::ostringstream{};
  render_table(out,
               {row_t{{"dc", "b"}, {"id", "1"}},
                row_t{{"dc", "a"}},
                row_t{{"dc", "b"}, {"id", "0"}}},
               {"dc", "id"}, {"dc"});
  EXPECT_EQ(out.str(),
            "DC  ID\n"
            "a   \n"
            "b   1\n"
            "b   0\n");
}

TEST(table, numbers_sort_before_text_whatever_the_input_order) {
  auto names = std::vector<std::string>{"10", "1a", "1b", "2", "20", "3", "9z"};
  std::ranges::sort(names);
  auto outputs = std::set<std::string>{};
  do {
    auto rows = std::vector<row_t>{};
    for (const auto& name : names) {
      rows.push_back(row_t{{"name", name}});
    }
    auto out = std::ostringstream{};
    render_table(out, std::move(rows), {"name"}, {"name"});
    outputs.insert(out.str());
  } while (std::ranges::next_permutation(names).found);

  ASSERT_EQ(outputs.size(), 1u);
  EXPECT_EQ(*std::begin(outputs), "NAME\n2\n3\n10\n20\n1a\n1b\n9z\n");
}

TEST(table, equal_numbers_fall_back_to_text_order) {
  auto out = std::ostringstream{};
  render_table(out, {row_t{{"n", "1"}}, row_t{{"n", "01"}}}, {"n"}, {"n"});
  EXPECT_EQ(out.str(), "N\n01\n1\n");
}
