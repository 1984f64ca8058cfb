#pragma once

#include <sdc/schema/dc_error.hpp>
#include <sdc/schema/machine.hpp>
#include <sdc/schema/machine_query.hpp>
#include <sdc/schema/primitives.hpp>
#include <functional>
#include <variant>
#include <vector>

namespace sdc::client {

using list_machines_result_t =
    std::variant<std::vector<sdc::schema::machine_t>,
                 sdc::schema::client_error_t>;

/// One complete listing call against one datacenter.
///
/// Implementations own connection handling, request timeouts and any
/// single-request retry policy. They must return (not hang) once their own
/// timeout elapses.
using datacenter_call_t = std::function<list_machines_result_t(
    const sdc::schema::datacenter_id_t& dc,
    const sdc::schema::list_machines_query_t& query)>;

}  // namespace sdc::client
