#pragma once

#include <sdc/schema/enum_string.hpp>
#include <sdc/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// Schema type: datacenter error.
// Per-datacenter failure outcomes. The client reports an untagged
// client_error_t; the aggregator attaches the datacenter before the error is
// exposed to consumers.
namespace sdc::schema {

enum class dc_error_kind : uint8_t {
  unreachable = 0,
  timeout = 1,
  auth_failure = 2,
  malformed_response = 3,
  server_error = 4,
  internal_fault = 5
};

inline constexpr auto kDcErrorKindMappings =
    std::array{std::pair<std::string_view, dc_error_kind>{
                   "unreachable", dc_error_kind::unreachable},
               std::pair<std::string_view, dc_error_kind>{
                   "timeout", dc_error_kind::timeout},
               std::pair<std::string_view, dc_error_kind>{
                   "auth_failure", dc_error_kind::auth_failure},
               std::pair<std::string_view, dc_error_kind>{
                   "malformed_response", dc_error_kind::malformed_response},
               std::pair<std::string_view, dc_error_kind>{
                   "server_error", dc_error_kind::server_error},
               std::pair<std::string_view, dc_error_kind>{
                   "internal_fault", dc_error_kind::internal_fault}};

template <>
inline std::optional<dc_error_kind> try_from_string<dc_error_kind>(
    const std::string_view value) {
  return from_string(value, kDcErrorKindMappings);
}

inline constexpr std::string_view to_string(const dc_error_kind value) {
  return to_string(value, kDcErrorKindMappings).value_or("unknown");
}

struct client_error_t final {
  dc_error_kind kind{dc_error_kind::unreachable};
  std::string message;

  bool operator==(const client_error_t&) const = default;
};

struct dc_error_t final {
  datacenter_id_t dc;
  dc_error_kind kind{dc_error_kind::unreachable};
  std::string message;

  bool operator==(const dc_error_t&) const = default;
};

inline dc_error_t tag_error(const datacenter_id_t& dc,
                            const client_error_t& error) {
  return dc_error_t{.dc = dc, .kind = error.kind, .message = error.message};
}

}  // namespace sdc::schema
