#pragma once

#include <map>
#include <optional>
#include <ostream>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace sdc::cli {

using row_t = std::map<std::string, std::string>;

/// Split a comma separated field list, dropping empty entries.
std::vector<std::string> split_fields(std::string_view fields);

/// Return a reason when a field is not in `valid`.
std::optional<std::string> check_fields(const std::vector<std::string>& fields,
                                        const std::set<std::string>& valid);

/// Print `rows` as aligned columns under an upper-case header.
///
/// Rows are stably sorted by `sort` keys in order. Values made only of
/// digits sort before other values and compare numerically. Missing cells
/// render empty.
void render_table(std::ostream& out,
                  std::vector<row_t> rows,
                  const std::vector<std::string>& columns,
                  const std::vector<std::string>& sort);

}  // namespace sdc::cli
