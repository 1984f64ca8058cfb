#include <sdc/schema/machine_query.hpp>

#include <algorithm>
#include <array>
#include <cctype>

namespace {

constexpr auto kKnownFilters = std::array<std::string_view, 9>{
    "name",   "type",    "brand",     "state",      "image",
    "package", "memory", "tombstone", "credentials"};

constexpr auto kNumericFilters = std::array<std::string_view, 2>{"memory",
                                                                 "tombstone"};

bool is_decimal(const std::string_view value) {
  return !value.empty() &&
         std::ranges::all_of(value, [](const char c) {
           return std::isdigit(static_cast<unsigned char>(c)) != 0;
         });
}

}  // namespace

namespace sdc::schema {

bool is_known_filter(const std::string_view key) {
  if (key.starts_with(kTagFilterPrefix)) {
    return key.size() > kTagFilterPrefix.size();
  }
  return std::ranges::find(kKnownFilters, key) != std::end(kKnownFilters);
}

std::optional<std::string> validate_query(const list_machines_query_t& query) {
  if (query.version != 1) {
    return "unsupported query version " + std::to_string(query.version);
  }
  for (const auto& [key, value] : query.filters) {
    if (!is_known_filter(key)) {
      return "unknown filter '" + key + "'";
    }
    if (value.empty()) {
      return "filter '" + key + "' has an empty value";
    }
    if (std::ranges::find(kNumericFilters, key) != std::end(kNumericFilters) &&
        !is_decimal(value)) {
      return "filter '" + key + "' must be a non-negative integer, got '" +
             value + "'";
    }
    if (key == "credentials" && value != "true" && value != "false") {
      return "filter 'credentials' must be true or false, got '" + value +
             "'";
    }
  }
  return std::nullopt;
}

list_machines_query_t parse_filters(const std::vector<std::string>& args) {
  auto query = list_machines_query_t{};
  for (const auto& arg : args) {
    auto separator = arg.find('=');
    if (separator == std::string::npos || separator == 0) {
      throw precondition_error(query_error_code::invalid_query,
                               "invalid filter '" + arg +
                                   "' (expected key=value)");
    }
    auto key = arg.substr(0, separator);
    auto value = arg.substr(separator + 1);
    if (!query.filters.emplace(key, value).second) {
      throw precondition_error(query_error_code::invalid_query,
                               "duplicate filter '" + key + "'");
    }
  }
  if (auto reason = validate_query(query)) {
    throw precondition_error(query_error_code::invalid_query, *reason);
  }
  return query;
}

}  // namespace sdc::schema
