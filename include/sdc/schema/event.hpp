#pragma once

#include <sdc/schema/dc_error.hpp>
#include <sdc/schema/machine.hpp>
#include <sdc/schema/primitives.hpp>
#include <variant>
#include <vector>

namespace sdc::schema {

/// Successful outcome of one datacenter. An empty `records` is a success.
struct record_batch_t final {
  datacenter_id_t dc;
  std::vector<machine_record_t> records;
};

/// Failed outcome of one datacenter; the datacenter is `error.dc`.
struct failure_t final {
  dc_error_t error;
};

/// Emitted once, after every datacenter has produced its outcome.
struct done_t final {};

using event_t = std::variant<record_batch_t, failure_t, done_t>;

inline bool is_done(const event_t& event) {
  return std::holds_alternative<done_t>(event);
}

}  // namespace sdc::schema
