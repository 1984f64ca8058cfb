#pragma once

#include <sdc/schema/dc_error.hpp>
#include <sdc/schema/machine.hpp>
#include <sdc/schema/primitives.hpp>
#include <cstddef>
#include <cstdint>
#include <vector>

// Schema type: aggregate result.
// Everything one fan-out run produced, in arrival order. Each queried
// datacenter appears exactly once, either in `succeeded` or in `errors`.
namespace sdc::schema {

template <uint16_t Version>
struct aggregate_result;

template <>
struct aggregate_result<1> final {
  uint16_t version{1};
  std::vector<machine_record_t> records;
  std::vector<dc_error_t> errors;
  datacenter_list_t succeeded;

  std::size_t outcomes() const { return errors.size() + succeeded.size(); }
};

using aggregate_result_t = aggregate_result<1>;

}  // namespace sdc::schema
