#include <sdc/cli/table.hpp>

#include <algorithm>
#include <cctype>
#include <iomanip>

namespace {

bool is_number(const std::string& value) {
  return !value.empty() && value.size() < 19 &&
         std::ranges::all_of(value, [](const char c) {
           return std::isdigit(static_cast<unsigned char>(c)) != 0;
         });
}

const std::string& cell(const sdc::cli::row_t& row, const std::string& column) {
  static const auto kEmpty = std::string{};
  auto it = row.find(column);
  return it == std::end(row) ? kEmpty : it->second;
}

// -1, 0, 1 like strcmp. Numbers order before text; numbers compare by value,
// equal values and text compare bytewise.
int compare_cells(const std::string& lhs, const std::string& rhs) {
  auto lhs_number = is_number(lhs);
  auto rhs_number = is_number(rhs);
  if (lhs_number != rhs_number) {
    return lhs_number ? -1 : 1;
  }
  if (lhs_number) {
    auto left = std::stoull(lhs);
    auto right = std::stoull(rhs);
    if (left != right) {
      return left < right ? -1 : 1;
    }
  }
  auto order = lhs.compare(rhs);
  return order < 0 ? -1 : (order > 0 ? 1 : 0);
}

}  // namespace

namespace sdc::cli {

std::vector<std::string> split_fields(std::string_view fields) {
  auto out = std::vector<std::string>{};
  while (!fields.empty()) {
    auto comma = fields.find(',');
    auto field = fields.substr(0, comma);
    if (!field.empty()) {
      out.emplace_back(field);
    }
    if (comma == std::string_view::npos) {
      break;
    }
    fields.remove_prefix(comma + 1);
  }
  return out;
}

std::optional<std::string> check_fields(const std::vector<std::string>& fields,
                                        const std::set<std::string>& valid) {
  for (const auto& field : fields) {
    if (!valid.contains(field)) {
      auto names = std::string{};
      for (const auto& name : valid) {
        names += names.empty() ? name : ", " + name;
      }
      return "invalid field '" + field + "' (valid fields: " + names + ")";
    }
  }
  return std::nullopt;
}

void render_table(std::ostream& out,
                  std::vector<row_t> rows,
                  const std::vector<std::string>& columns,
                  const std::vector<std::string>& sort) {
  std::ranges::stable_sort(rows, [&](const row_t& lhs, const row_t& rhs) {
    for (const auto& key : sort) {
      auto order = compare_cells(cell(lhs, key), cell(rhs, key));
      if (order != 0) {
        return order < 0;
      }
    }
    return false;
  });

  auto headers = std::vector<std::string>{};
  auto widths = std::vector<std::size_t>{};
  for (const auto& column : columns) {
    auto header = column;
    std::ranges::transform(header, std::begin(header), [](const char c) {
      return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    });
    widths.push_back(header.size());
    headers.push_back(std::move(header));
  }
  for (const auto& row : rows) {
    for (std::size_t i = 0; i < columns.size(); ++i) {
      widths[i] = std::max(widths[i], cell(row, columns[i]).size());
    }
  }

  auto print_line = [&](auto&& value_at) {
    for (std::size_t i = 0; i < columns.size(); ++i) {
      const auto& value = value_at(i);
      if (i + 1 == columns.size()) {
        out << value;
      } else {
        out << std::left << std::setw(static_cast<int>(widths[i] + 2))
            << value;
      }
    }
    out << '\n';
  };
  print_line([&](std::size_t i) -> const std::string& { return headers[i]; });
  for (const auto& row : rows) {
    print_line([&](std::size_t i) -> const std::string& {
      return cell(row, columns[i]);
    });
  }
}

}  // namespace sdc::cli
