#pragma once

#include <sdc/schema/machine_query.hpp>
#include <string>
#include <string_view>

namespace sdc::client {

/// Percent-encode everything outside the RFC 3986 unreserved set.
std::string url_encode(std::string_view value);

/// Build `{endpoint}/{account}/machines[?k=v&...]`.
///
/// Trailing slashes on the endpoint are dropped; an empty account maps to
/// `my`, the CloudAPI alias for the authenticated account.
std::string make_list_machines_url(
    std::string_view endpoint,
    std::string_view account,
    const sdc::schema::list_machines_query_t& query);

}  // namespace sdc::client
