#pragma once

#include <sdc/schema/query_error_code.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Schema type: list machines query.
// The logical request sent unchanged to every datacenter of a run.
namespace sdc::schema {

template <uint16_t Version>
struct list_machines_query;

template <>
struct list_machines_query<1> final {
  uint16_t version{1};
  std::map<std::string, std::string> filters;

  bool operator==(const list_machines_query&) const = default;
};

using list_machines_query_t = list_machines_query<1>;

inline constexpr auto kTagFilterPrefix = std::string_view{"tag."};

/// True for filter keys the machines listing understands, including
/// `tag.<name>`.
bool is_known_filter(std::string_view key);

/// Return a human-readable reason when the query is malformed.
std::optional<std::string> validate_query(const list_machines_query_t& query);

/// Build a query from `key=value` command-line arguments.
///
/// Throws precondition_error(invalid_query) on malformed, unknown or
/// duplicated filters.
list_machines_query_t parse_filters(const std::vector<std::string>& args);

}  // namespace sdc::schema
